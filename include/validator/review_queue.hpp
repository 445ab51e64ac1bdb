#pragma once

#include "core/types.hpp"

#include <fstream>
#include <mutex>
#include <string>

namespace docgate {

/// One item held back from distribution pending a human decision.
struct ReviewItem {
    DistributionMetadata metadata;
    size_t content_length = 0;
    bool has_secrets = false;
    std::vector<std::string> secret_types;
};

/**
 * @brief Destination for content that needs manual security review
 */
class IReviewQueue {
public:
    virtual ~IReviewQueue() = default;

    /// Returns false if the item could not be recorded.
    [[nodiscard]] virtual bool flag(const ReviewItem& item, const std::string& reason) = 0;
};

/**
 * @brief Appends review requests as JSON lines to a file
 *
 * Safe to share between threads.
 */
class FileReviewQueue : public IReviewQueue {
public:
    explicit FileReviewQueue(std::string path);

    [[nodiscard]] bool flag(const ReviewItem& item, const std::string& reason) override;

    [[nodiscard]] const std::string& path() const { return path_; }
    [[nodiscard]] size_t flagged_count() const;

private:
    std::string path_;
    std::ofstream out_;
    mutable std::mutex mutex_;
    size_t flagged_ = 0;
};

} // namespace docgate
