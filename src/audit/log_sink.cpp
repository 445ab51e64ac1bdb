#include "audit/log_sink.hpp"
#include "core/utils.hpp"

#include <format>

namespace docgate {

bool LogSink::write(const SecurityEvent& event, std::string_view /*json_line*/) {
    std::string line = std::format("[security] #{} {} resource={} by={}",
        event.sequence_num, event_type_to_string(event.event_type),
        event.resource, event.requesting_identity);
    if (!event.detected_types.empty()) {
        line += " types=" + utils::join(event.detected_types, ",");
    }
    if (!event.details.empty()) {
        line += " : " + event.details;
    }

    switch (event.severity) {
        case EventSeverity::CRITICAL: utils::log::error(line); break;
        case EventSeverity::WARNING: utils::log::warn(line); break;
        case EventSeverity::INFO: utils::log::info(line); break;
    }
    return true;
}

} // namespace docgate
