#pragma once

#include "audit/event_sink.hpp"

#include <chrono>
#include <cstddef>
#include <fstream>
#include <string>

namespace docgate {

/**
 * @brief JSONL security event file with size and time based rotation
 *
 * Rotated files get numeric suffixes (events.jsonl.1, .2, ...); anything
 * beyond max_files is deleted. The parent directory is created on open.
 */
class FileSink : public IEventSink {
public:
    struct Config {
        std::string output_file = "docgate-events.jsonl";
        size_t max_file_size_bytes = 50ULL * 1024 * 1024;
        int max_files = 10;
        std::chrono::hours rotation_interval{24};
        bool time_based_rotation = true;
        bool size_based_rotation = true;
    };

    explicit FileSink(const Config& config);
    ~FileSink() override;

    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    [[nodiscard]] bool write(const SecurityEvent& event, std::string_view json_line) override;
    void flush() override;
    void shutdown() override;
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] size_t rotation_count() const { return rotation_count_; }
    [[nodiscard]] size_t current_file_size() const { return current_file_size_; }

private:
    [[nodiscard]] bool rotation_due() const;
    void rotate();
    void open_stream();

    Config config_;
    std::ofstream out_;
    size_t current_file_size_ = 0;
    size_t rotation_count_ = 0;
    std::chrono::system_clock::time_point opened_at_;
};

} // namespace docgate
