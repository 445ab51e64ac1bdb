#pragma once

#include "audit/event_sink.hpp"
#include "audit/security_event.hpp"
#include "config/config_types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace docgate {

/**
 * @brief Synchronous, hash-chained security event emitter
 *
 * emit() stamps the event (id, sequence number, timestamp), links it to
 * the previous record with a SHA-256 hash, serializes it to one JSON line
 * and writes it to every sink before returning. A single mutex serializes
 * the chain and the sinks; events are rare, so no writer thread is used.
 *
 * Sink failures are counted and logged, never thrown to the caller.
 */
class SecurityEventEmitter {
public:
    struct Config {
        bool integrity_enabled = true;
    };

    SecurityEventEmitter() : SecurityEventEmitter(Config{}) {}
    explicit SecurityEventEmitter(const Config& config);

    /// File, syslog and log sinks as enabled in @p config.
    [[nodiscard]] static std::shared_ptr<SecurityEventEmitter> from_config(const AuditConfig& config);

    ~SecurityEventEmitter();

    SecurityEventEmitter(const SecurityEventEmitter&) = delete;
    SecurityEventEmitter& operator=(const SecurityEventEmitter&) = delete;

    void add_sink(std::unique_ptr<IEventSink> sink);

    /// Stamp, chain and write. Returns the event as written.
    SecurityEvent emit(SecurityEvent event);

    void flush();
    void shutdown();

    struct Stats {
        uint64_t total_emitted;
        uint64_t sink_write_failures;
        size_t active_sinks;
    };

    [[nodiscard]] Stats get_stats() const;
    [[nodiscard]] std::string last_hash() const;

    [[nodiscard]] static nlohmann::json to_json(const SecurityEvent& event);
    [[nodiscard]] static std::string compute_record_hash(const SecurityEvent& event,
                                                         const std::string& prev_hash);

    /**
     * @brief Check a sequence of emitted events for tampering.
     * @return false if any record hash does not match its content or the
     *         previous_hash link is broken.
     */
    [[nodiscard]] static bool verify_chain(const std::vector<SecurityEvent>& events);

private:
    Config config_;
    std::vector<std::unique_ptr<IEventSink>> sinks_;

    mutable std::mutex mutex_;
    uint64_t sequence_counter_ = 0;
    uint64_t total_emitted_ = 0;
    uint64_t sink_write_failures_ = 0;
    std::string previous_hash_;
    bool shut_down_ = false;
};

} // namespace docgate
