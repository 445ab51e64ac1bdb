#pragma once

#include "audit/event_sink.hpp"

namespace docgate {

/// Mirrors each event to the process log as a one-line summary.
class LogSink : public IEventSink {
public:
    [[nodiscard]] bool write(const SecurityEvent& event, std::string_view json_line) override;
    void flush() override {}
    void shutdown() override {}
    [[nodiscard]] std::string name() const override { return "log"; }
};

} // namespace docgate
