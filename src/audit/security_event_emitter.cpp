#include "audit/security_event_emitter.hpp"
#include "audit/file_sink.hpp"
#include "audit/log_sink.hpp"
#include "audit/syslog_sink.hpp"
#include "core/unicode.hpp"
#include "core/utils.hpp"

#include <openssl/evp.h>

#include <format>
#include <utility>

namespace docgate {

SecurityEventEmitter::SecurityEventEmitter(const Config& config)
    : config_(config) {}

std::shared_ptr<SecurityEventEmitter> SecurityEventEmitter::from_config(const AuditConfig& config) {
    auto emitter = std::make_shared<SecurityEventEmitter>(
        Config{.integrity_enabled = config.integrity_enabled});

    if (!config.output_file.empty()) {
        FileSink::Config file_cfg;
        file_cfg.output_file = config.output_file;
        file_cfg.max_file_size_bytes = config.rotation_max_file_size_mb * 1024ULL * 1024;
        file_cfg.max_files = config.rotation_max_files;
        file_cfg.rotation_interval = std::chrono::hours(config.rotation_interval_hours);
        file_cfg.time_based_rotation = config.rotation_time_based;
        file_cfg.size_based_rotation = config.rotation_size_based;
        emitter->add_sink(std::make_unique<FileSink>(file_cfg));
    }

    if (config.syslog_enabled) {
        SyslogSink::Config sl_cfg;
        sl_cfg.ident = config.syslog_ident;
        emitter->add_sink(std::make_unique<SyslogSink>(sl_cfg));
    }

    if (config.log_sink_enabled) {
        emitter->add_sink(std::make_unique<LogSink>());
    }

    return emitter;
}

SecurityEventEmitter::~SecurityEventEmitter() {
    shutdown();
}

void SecurityEventEmitter::add_sink(std::unique_ptr<IEventSink> sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lock(mutex_);
    utils::log::debug(std::format("Security event sink registered: {}", sink->name()));
    sinks_.push_back(std::move(sink));
}

// ============================================================================
// Emission
// ============================================================================

SecurityEvent SecurityEventEmitter::emit(SecurityEvent event) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (event.event_id.empty()) {
        event.event_id = utils::generate_uuid();
    }
    event.timestamp = utils::now();
    event.sequence_num = sequence_counter_ + 1;

    // Fields may carry document text; hash and persist the same valid UTF-8
    event.requesting_identity = unicode::scrub_utf8(event.requesting_identity);
    event.resource = unicode::scrub_utf8(event.resource);
    event.details = unicode::scrub_utf8(event.details);
    for (auto& type : event.detected_types) {
        type = unicode::scrub_utf8(type);
    }

    if (config_.integrity_enabled) {
        event.previous_hash = previous_hash_;
        event.record_hash = compute_record_hash(event, previous_hash_);
    }

    // Serialize before advancing the chain head so a failure leaves it intact
    std::string line = to_json(event).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    line += '\n';

    sequence_counter_ = event.sequence_num;
    if (config_.integrity_enabled) {
        previous_hash_ = event.record_hash;
    }

    ++total_emitted_;
    if (shut_down_) {
        utils::log::warn(std::format("Security event #{} emitted after shutdown, not persisted",
            event.sequence_num));
        return event;
    }

    for (auto& sink : sinks_) {
        if (!sink->write(event, line)) {
            ++sink_write_failures_;
            utils::log::error(std::format("Security event #{} write failed on {}",
                event.sequence_num, sink->name()));
        }
    }
    return event;
}

void SecurityEventEmitter::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

void SecurityEventEmitter::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shut_down_) return;
    for (auto& sink : sinks_) {
        sink->flush();
        sink->shutdown();
    }
    shut_down_ = true;
}

SecurityEventEmitter::Stats SecurityEventEmitter::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Stats{
        .total_emitted = total_emitted_,
        .sink_write_failures = sink_write_failures_,
        .active_sinks = sinks_.size(),
    };
}

std::string SecurityEventEmitter::last_hash() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return previous_hash_;
}

// ============================================================================
// Serialization / integrity
// ============================================================================

nlohmann::json SecurityEventEmitter::to_json(const SecurityEvent& event) {
    nlohmann::json j = {
        {"event_id", event.event_id},
        {"sequence_num", event.sequence_num},
        {"event_type", event_type_to_string(event.event_type)},
        {"severity", event_severity_to_string(event.severity)},
        {"detected_types", event.detected_types},
        {"requesting_identity", event.requesting_identity},
        {"resource", event.resource},
        {"details", event.details},
        {"timestamp", utils::format_timestamp(event.timestamp)},
    };
    if (!event.record_hash.empty()) {
        j["previous_hash"] = event.previous_hash;
        j["record_hash"] = event.record_hash;
    }
    return j;
}

std::string SecurityEventEmitter::compute_record_hash(const SecurityEvent& event,
                                                      const std::string& prev_hash) {
    // seq|timestamp|type|severity|identity|resource|types|details|prev
    std::string input;
    input.reserve(256 + event.details.size());
    input += std::format("{}", event.sequence_num);
    input += '|';
    input += utils::format_timestamp(event.timestamp);
    input += '|';
    input += event_type_to_string(event.event_type);
    input += '|';
    input += event_severity_to_string(event.severity);
    input += '|';
    input += event.requesting_identity;
    input += '|';
    input += event.resource;
    input += '|';
    input += utils::join(event.detected_types, ",");
    input += '|';
    input += event.details;
    input += '|';
    input += prev_hash;

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) return "";

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    const bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1 &&
                    EVP_DigestUpdate(ctx, input.data(), input.size()) == 1 &&
                    EVP_DigestFinal_ex(ctx, hash, &hash_len) == 1;
    EVP_MD_CTX_free(ctx);
    if (!ok) return "";

    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(hash_len * 2);
    for (unsigned int i = 0; i < hash_len; ++i) {
        hex += hex_chars[(hash[i] >> 4) & 0x0F];
        hex += hex_chars[hash[i] & 0x0F];
    }
    return hex;
}

bool SecurityEventEmitter::verify_chain(const std::vector<SecurityEvent>& events) {
    std::string prev;
    for (const auto& e : events) {
        if (e.previous_hash != prev) return false;
        if (e.record_hash.empty() || compute_record_hash(e, prev) != e.record_hash) return false;
        prev = e.record_hash;
    }
    return true;
}

} // namespace docgate
