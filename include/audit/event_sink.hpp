#pragma once

#include "audit/security_event.hpp"

#include <string>
#include <string_view>

namespace docgate {

/**
 * @brief Abstract destination for security events
 *
 * Sinks are called synchronously from SecurityEventEmitter::emit() while
 * the emitter holds its lock, so implementations need no locking of
 * their own.
 */
class IEventSink {
public:
    virtual ~IEventSink() = default;

    /// Write one event. @p json_line is the serialized record, newline-terminated.
    [[nodiscard]] virtual bool write(const SecurityEvent& event, std::string_view json_line) = 0;

    virtual void flush() = 0;

    virtual void shutdown() = 0;

    /// Sink name for logging (e.g. "file:/var/log/docgate/events.jsonl")
    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace docgate
