#include "audit/syslog_sink.hpp"

#include <syslog.h>

namespace docgate {

namespace {

int priority_for(EventSeverity severity) {
    switch (severity) {
        case EventSeverity::CRITICAL: return LOG_CRIT;
        case EventSeverity::WARNING: return LOG_WARNING;
        case EventSeverity::INFO: return LOG_INFO;
        default: return LOG_NOTICE;
    }
}

} // anonymous namespace

SyslogSink::SyslogSink(const Config& config)
    : config_(config) {
    // openlog keeps the pointer; config_.ident outlives the connection
    openlog(config_.ident.c_str(), LOG_NDELAY | LOG_PID, config_.facility);
    open_ = true;
}

SyslogSink::~SyslogSink() {
    shutdown();
}

bool SyslogSink::write(const SecurityEvent& event, std::string_view json_line) {
    if (!open_) return false;

    std::string msg(json_line);
    if (!msg.empty() && msg.back() == '\n') {
        msg.pop_back();
    }

    syslog(priority_for(event.severity), "%s", msg.c_str());
    ++records_written_;
    return true;
}

void SyslogSink::shutdown() {
    if (open_) {
        closelog();
        open_ = false;
    }
}

std::string SyslogSink::name() const {
    return "syslog:" + config_.ident;
}

} // namespace docgate
