#pragma once

#include "scanner/secret_scanner.hpp"

#include <memory>

namespace docgate {

// Forward declarations
class InputSanitizer;
class ContextAssembler;
class PreDistributionValidator;
class SecurityEventEmitter;
class ContentPipeline;
struct DocgateConfig;

/**
 * @brief All components that ContentPipeline needs, grouped in a single struct.
 */
struct PipelineComponents {
    // Required
    std::shared_ptr<const InputSanitizer> sanitizer;
    std::shared_ptr<const SecretScanner> scanner;
    std::shared_ptr<const ContextAssembler> assembler;
    std::shared_ptr<const PreDistributionValidator> validator;

    // Optional (nullptr = no security events)
    std::shared_ptr<SecurityEventEmitter> events;

    // Options for prepare_for_storage
    SecretScanner::ScanOptions storage_scan;
};

/**
 * @brief Builder pattern for ContentPipeline construction.
 *
 * Usage:
 *   auto pipeline = PipelineBuilder()
 *       .with_sanitizer(sanitizer)
 *       .with_scanner(scanner)
 *       .with_assembler(assembler)
 *       .with_validator(validator)
 *       .with_events(emitter)    // optional
 *       .build();
 *
 * Or wire every stage from a loaded config with from_config().
 */
class PipelineBuilder {
public:
    PipelineBuilder& with_sanitizer(std::shared_ptr<const InputSanitizer> p)            { c_.sanitizer = std::move(p); return *this; }
    PipelineBuilder& with_scanner(std::shared_ptr<const SecretScanner> p)               { c_.scanner = std::move(p); return *this; }
    PipelineBuilder& with_assembler(std::shared_ptr<const ContextAssembler> p)          { c_.assembler = std::move(p); return *this; }
    PipelineBuilder& with_validator(std::shared_ptr<const PreDistributionValidator> p)  { c_.validator = std::move(p); return *this; }
    PipelineBuilder& with_events(std::shared_ptr<SecurityEventEmitter> p)               { c_.events = std::move(p); return *this; }
    PipelineBuilder& with_storage_scan(SecretScanner::ScanOptions o)                    { c_.storage_scan = o; return *this; }

    /**
     * @brief Build the pipeline from accumulated components.
     * @throws DocgateError if required components are missing.
     */
    [[nodiscard]] std::shared_ptr<ContentPipeline> build();

    /**
     * @brief Construct every stage from configuration.
     *
     * Custom scanner patterns are appended to the built-in registry. The
     * event emitter and review queue are created from the [audit] and
     * [review] sections.
     * @throws DocgateError if a custom pattern fails to compile
     */
    [[nodiscard]] static std::shared_ptr<ContentPipeline> from_config(const DocgateConfig& config);

private:
    PipelineComponents c_;
};

} // namespace docgate
