#pragma once

#include "document/document_resolver.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace docgate::testing {

/**
 * @brief In-memory document store keyed by requested path
 */
class MockDocumentResolver : public IDocumentResolver {
public:
    void add(const std::string& path, std::string content) {
        std::lock_guard<std::mutex> lock(mutex_);
        documents_[path] = std::move(content);
    }

    /// resolve() succeeds for @p path but read() fails.
    void add_unreadable(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        unreadable_.insert(path);
    }

    [[nodiscard]] ResolvedDocument resolve(const std::string& path) const override {
        resolve_count_.fetch_add(1, std::memory_order_relaxed);
        std::lock_guard<std::mutex> lock(mutex_);
        ResolvedDocument out;
        out.requested_path = path;
        if (documents_.contains(path) || unreadable_.contains(path)) {
            out.exists = true;
            out.resolved_location = "mem://" + path;
        } else {
            out.error = "File not found in allowed directories";
        }
        return out;
    }

    /// read() of @p path sleeps for @p delay before returning.
    void set_delay(const std::string& path, std::chrono::milliseconds delay) {
        std::lock_guard<std::mutex> lock(mutex_);
        delays_[path] = delay;
    }

    [[nodiscard]] Result<std::string> read(const ResolvedDocument& resolved) const override {
        std::chrono::milliseconds delay{0};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const auto it = delays_.find(resolved.requested_path);
            if (it != delays_.end()) delay = it->second;
        }
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }

        std::lock_guard<std::mutex> lock(mutex_);
        read_order_.push_back(resolved.requested_path);
        if (unreadable_.contains(resolved.requested_path)) {
            return Result<std::string>::error(ErrorCategory::IO_ERROR, "Mock read failure");
        }
        const auto it = documents_.find(resolved.requested_path);
        if (it == documents_.end()) {
            return Result<std::string>::error(ErrorCategory::NOT_FOUND, "Mock document missing");
        }
        return Result<std::string>::ok(it->second);
    }

    [[nodiscard]] uint64_t resolve_count() const {
        return resolve_count_.load(std::memory_order_relaxed);
    }

    /// Paths in the order their reads completed.
    [[nodiscard]] std::vector<std::string> read_order() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return read_order_;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> documents_;
    std::set<std::string> unreadable_;
    std::map<std::string, std::chrono::milliseconds> delays_;
    mutable std::vector<std::string> read_order_;
    mutable std::atomic<uint64_t> resolve_count_{0};
};

} // namespace docgate::testing
