#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace docgate {

enum class SecurityEventType : uint8_t {
    CONTEXT_ACCESS_DENIED,
    CONTEXT_ASSEMBLED,
    SECRET_DETECTION_BLOCKED,
    DISTRIBUTION_BLOCKED,
    MANUAL_REVIEW_REQUIRED
};

enum class EventSeverity : uint8_t {
    INFO,
    WARNING,
    CRITICAL
};

inline const char* event_type_to_string(SecurityEventType type) {
    switch (type) {
        case SecurityEventType::CONTEXT_ACCESS_DENIED: return "CONTEXT_ACCESS_DENIED";
        case SecurityEventType::CONTEXT_ASSEMBLED: return "CONTEXT_ASSEMBLED";
        case SecurityEventType::SECRET_DETECTION_BLOCKED: return "SECRET_DETECTION_BLOCKED";
        case SecurityEventType::DISTRIBUTION_BLOCKED: return "DISTRIBUTION_BLOCKED";
        case SecurityEventType::MANUAL_REVIEW_REQUIRED: return "MANUAL_REVIEW_REQUIRED";
        default: return "UNKNOWN";
    }
}

inline const char* event_severity_to_string(EventSeverity severity) {
    switch (severity) {
        case EventSeverity::INFO: return "INFO";
        case EventSeverity::WARNING: return "WARNING";
        case EventSeverity::CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

/**
 * @brief One security-relevant outcome, serialized as a single JSON line.
 *
 * event_id, sequence_num, timestamp and the hash pair are filled in by the
 * SecurityEventEmitter; producers set the rest.
 */
struct SecurityEvent {
    std::string event_id;
    uint64_t sequence_num = 0;
    SecurityEventType event_type = SecurityEventType::CONTEXT_ASSEMBLED;
    EventSeverity severity = EventSeverity::INFO;
    std::vector<std::string> detected_types;    // secret types or keywords; never values
    std::string requesting_identity = "unknown";
    std::string resource;                       // document path or distribution id
    std::string details;
    std::chrono::system_clock::time_point timestamp;

    std::string previous_hash;
    std::string record_hash;
};

} // namespace docgate
