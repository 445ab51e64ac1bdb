#pragma once

#include "validator/review_queue.hpp"

#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace docgate::testing {

/**
 * @brief Keeps flagged items in memory
 */
class MockReviewQueue : public IReviewQueue {
public:
    explicit MockReviewQueue(bool should_succeed = true) : should_succeed_(should_succeed) {}

    [[nodiscard]] bool flag(const ReviewItem& item, const std::string& reason) override {
        std::lock_guard<std::mutex> lock(mutex_);
        items_.emplace_back(item, reason);
        return should_succeed_;
    }

    [[nodiscard]] std::vector<std::pair<ReviewItem, std::string>> items() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_;
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

private:
    bool should_succeed_;
    mutable std::mutex mutex_;
    std::vector<std::pair<ReviewItem, std::string>> items_;
};

} // namespace docgate::testing
