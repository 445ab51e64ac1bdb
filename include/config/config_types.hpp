#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace docgate {

// ============================================================================
// Ambient configuration (sections not owned by a pipeline stage)
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

struct AuditConfig {
    // Empty output_file disables the JSONL file sink
    std::string output_file = "logs/security-events.jsonl";

    size_t rotation_max_file_size_mb = 50;
    int rotation_max_files = 10;
    int rotation_interval_hours = 24;
    bool rotation_time_based = true;
    bool rotation_size_based = true;

    bool syslog_enabled = false;
    std::string syslog_ident = "docgate";

    bool log_sink_enabled = true;
    bool integrity_enabled = true;
};

struct ReviewConfig {
    std::string queue_file = "logs/review-queue.jsonl";
};

} // namespace docgate
