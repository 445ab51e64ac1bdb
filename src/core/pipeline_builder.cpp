#include "core/pipeline_builder.hpp"
#include "audit/security_event_emitter.hpp"
#include "config/config_loader.hpp"
#include "core/error.hpp"
#include "core/pipeline.hpp"
#include "document/filesystem_resolver.hpp"
#include "validator/review_queue.hpp"

#include <format>

namespace docgate {

std::shared_ptr<ContentPipeline> PipelineBuilder::build() {
    if (!c_.sanitizer) throw DocgateError("PipelineBuilder: sanitizer is required");
    if (!c_.scanner) throw DocgateError("PipelineBuilder: scanner is required");
    if (!c_.assembler) throw DocgateError("PipelineBuilder: assembler is required");
    if (!c_.validator) throw DocgateError("PipelineBuilder: validator is required");

    return std::make_shared<ContentPipeline>(std::move(c_));
}

std::shared_ptr<ContentPipeline> PipelineBuilder::from_config(const DocgateConfig& config) {
    auto registry = SecretPatternRegistry::with_custom(config.scanner.custom_patterns);
    if (registry.is_error()) {
        throw DocgateError(std::format("Scanner pattern registry: {}", registry.error_message()));
    }

    auto events = SecurityEventEmitter::from_config(config.audit);

    std::shared_ptr<IReviewQueue> review_queue;
    if (!config.review.queue_file.empty()) {
        review_queue = std::make_shared<FileReviewQueue>(config.review.queue_file);
    }

    SecretScanner scanner(config.scanner.engine, registry.value());
    auto resolver = std::make_shared<FilesystemResolver>(config.resolver);

    return PipelineBuilder()
        .with_sanitizer(std::make_shared<InputSanitizer>(config.sanitizer))
        .with_scanner(std::make_shared<SecretScanner>(scanner))
        .with_assembler(std::make_shared<ContextAssembler>(resolver, events))
        .with_validator(std::make_shared<PreDistributionValidator>(
            scanner, KeywordPolicy::defaults(), review_queue, events))
        .with_events(events)
        .with_storage_scan(config.scanner.scan)
        .build();
}

} // namespace docgate
