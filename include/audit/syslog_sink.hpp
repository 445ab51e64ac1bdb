#pragma once

#include "audit/event_sink.hpp"

#include <cstdint>
#include <string>

namespace docgate {

/**
 * @brief POSIX syslog(3) event sink
 *
 * Priority follows the event severity: CRITICAL -> LOG_CRIT,
 * WARNING -> LOG_WARNING, INFO -> LOG_INFO.
 */
class SyslogSink : public IEventSink {
public:
    struct Config {
        std::string ident = "docgate";
        int facility = 10 << 3;     // LOG_AUTHPRIV
    };

    explicit SyslogSink(const Config& config);
    ~SyslogSink() override;

    SyslogSink(const SyslogSink&) = delete;
    SyslogSink& operator=(const SyslogSink&) = delete;

    [[nodiscard]] bool write(const SecurityEvent& event, std::string_view json_line) override;
    void flush() override {}
    void shutdown() override;
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] uint64_t records_written() const { return records_written_; }

private:
    Config config_;
    uint64_t records_written_ = 0;
    bool open_ = false;
};

} // namespace docgate
