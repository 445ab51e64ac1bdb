#include "audit/file_sink.hpp"
#include "core/error.hpp"

#include <filesystem>
#include <format>
#include <system_error>

namespace docgate {

namespace fs = std::filesystem;

FileSink::FileSink(const Config& config)
    : config_(config) {
    const fs::path parent = fs::path(config_.output_file).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            throw DocgateError(std::format("Cannot create event log directory {}: {}",
                parent.string(), ec.message()));
        }
    }

    open_stream();
    if (!out_.is_open()) {
        throw DocgateError("Failed to open event log: " + config_.output_file);
    }
}

FileSink::~FileSink() {
    shutdown();
}

void FileSink::open_stream() {
    out_.open(config_.output_file, std::ios::app | std::ios::binary);
    opened_at_ = std::chrono::system_clock::now();

    std::error_code ec;
    const auto size = fs::file_size(config_.output_file, ec);
    current_file_size_ = ec ? 0 : static_cast<size_t>(size);
}

bool FileSink::write(const SecurityEvent& /*event*/, std::string_view json_line) {
    if (!out_.is_open()) return false;

    if (rotation_due()) {
        rotate();
        if (!out_.is_open()) return false;
    }

    out_.write(json_line.data(), static_cast<std::streamsize>(json_line.size()));
    // Security events are rare and must survive a crash
    out_.flush();
    current_file_size_ += json_line.size();
    return out_.good();
}

void FileSink::flush() {
    if (out_.is_open()) out_.flush();
}

void FileSink::shutdown() {
    if (out_.is_open()) {
        out_.flush();
        out_.close();
    }
}

std::string FileSink::name() const {
    return "file:" + config_.output_file;
}

bool FileSink::rotation_due() const {
    if (config_.size_based_rotation && current_file_size_ > 0 &&
        current_file_size_ >= config_.max_file_size_bytes) {
        return true;
    }
    if (config_.time_based_rotation && current_file_size_ > 0 &&
        std::chrono::system_clock::now() - opened_at_ >= config_.rotation_interval) {
        return true;
    }
    return false;
}

void FileSink::rotate() {
    out_.flush();
    out_.close();

    // Missing generations are expected, so rename/remove errors are not fatal
    std::error_code ec;
    fs::remove(std::format("{}.{}", config_.output_file, config_.max_files), ec);
    for (int i = config_.max_files - 1; i >= 1; --i) {
        fs::rename(std::format("{}.{}", config_.output_file, i),
                   std::format("{}.{}", config_.output_file, i + 1), ec);
    }
    fs::rename(config_.output_file, config_.output_file + ".1", ec);

    open_stream();
    ++rotation_count_;
}

} // namespace docgate
