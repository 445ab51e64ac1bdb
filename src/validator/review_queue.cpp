#include "validator/review_queue.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <format>
#include <system_error>

namespace docgate {

FileReviewQueue::FileReviewQueue(std::string path)
    : path_(std::move(path)) {
    const auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw DocgateError(std::format("Cannot create review queue directory {}: {}",
                parent.string(), ec.message()));
        }
    }
    out_.open(path_, std::ios::app | std::ios::binary);
    if (!out_.is_open()) {
        throw DocgateError("Failed to open review queue: " + path_);
    }
}

bool FileReviewQueue::flag(const ReviewItem& item, const std::string& reason) {
    const nlohmann::json record = {
        {"review_id", utils::generate_uuid()},
        {"flagged_at", utils::format_timestamp(utils::now())},
        {"reason", reason},
        {"document_id", item.metadata.document_id},
        {"document_name", item.metadata.document_name},
        {"author", item.metadata.author},
        {"channel", item.metadata.channel},
        {"requested_by", item.metadata.requested_by},
        {"content_length", item.content_length},
        {"has_secrets", item.has_secrets},
        {"secret_types", item.secret_types},
        {"status", "PENDING"},
    };

    std::lock_guard<std::mutex> lock(mutex_);
    out_ << record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
    out_.flush();
    if (!out_.good()) {
        utils::log::error(std::format("Failed to append to review queue {}", path_));
        return false;
    }
    ++flagged_;

    utils::log::warn(std::format("Flagged for manual security review: {} ({})",
        item.metadata.document_id.empty() ? "<unnamed>" : item.metadata.document_id, reason));
    return true;
}

size_t FileReviewQueue::flagged_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return flagged_;
}

} // namespace docgate
