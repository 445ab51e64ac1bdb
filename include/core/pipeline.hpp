#pragma once

#include "context/context_assembler.hpp"
#include "core/pipeline_builder.hpp"
#include "core/types.hpp"
#include "validator/pre_distribution_validator.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace docgate {

/**
 * @brief Primary document plus admitted context, each run through the sanitizer
 *
 * sanitized_context is parallel to assembly.admitted_context_documents.
 */
struct IngestResult {
    ContextAssemblyResult assembly;
    SanitizationResult sanitized_primary;
    std::vector<SanitizationResult> sanitized_context;
    std::vector<std::string> warnings;

    [[nodiscard]] bool any_flagged() const {
        if (sanitized_primary.flagged) return true;
        for (const auto& s : sanitized_context) {
            if (s.flagged) return true;
        }
        return false;
    }
};

/**
 * @brief Composes the four stages around content flow
 *
 *   ingest:   Context Assembler -> Input Sanitizer (primary + each admitted doc)
 *   storage:  Secret Scanner (redacted text out)
 *   egress:   Pre-Distribution Validator
 *
 * Stages are independent; the pipeline only routes data between them.
 * Safe for concurrent use: every stage is const after construction.
 */
class ContentPipeline {
public:
    explicit ContentPipeline(PipelineComponents components);

    /**
     * @brief Assemble context for @p primary_path then sanitize every admitted body.
     * @throws DocumentNotFound / MetadataValidationError from assembly
     */
    [[nodiscard]] IngestResult ingest(const std::string& primary_path,
                                      const AssemblyOptions& options = {}) const;

    /// Scan and return the redacted text plus findings.
    [[nodiscard]] ScanResult prepare_for_storage(std::string_view text) const;

    /**
     * @brief Final gate before content leaves the system.
     * @throws SecurityException when distribution is blocked
     */
    ValidationResult gate_for_distribution(std::string_view content,
                                           const DistributionMetadata& metadata,
                                           const PreDistributionValidator::Options& options = {}) const;

    std::shared_ptr<const InputSanitizer> get_sanitizer() const { return c_.sanitizer; }
    std::shared_ptr<const SecretScanner> get_scanner() const { return c_.scanner; }
    std::shared_ptr<const ContextAssembler> get_assembler() const { return c_.assembler; }
    std::shared_ptr<const PreDistributionValidator> get_validator() const { return c_.validator; }
    std::shared_ptr<SecurityEventEmitter> get_events() const { return c_.events; }

    struct Stats {
        uint64_t documents_ingested;
        uint64_t inputs_flagged;
        uint64_t secrets_redacted;
        uint64_t distributions_blocked;
    };

    [[nodiscard]] Stats get_stats() const {
        return {
            .documents_ingested = documents_ingested_.load(std::memory_order_relaxed),
            .inputs_flagged = inputs_flagged_.load(std::memory_order_relaxed),
            .secrets_redacted = secrets_redacted_.load(std::memory_order_relaxed),
            .distributions_blocked = distributions_blocked_.load(std::memory_order_relaxed),
        };
    }

private:
    [[nodiscard]] SanitizationResult sanitize_body(const Document& doc,
                                                   std::vector<std::string>& warnings) const;

    PipelineComponents c_;

    mutable std::atomic<uint64_t> documents_ingested_{0};
    mutable std::atomic<uint64_t> inputs_flagged_{0};
    mutable std::atomic<uint64_t> secrets_redacted_{0};
    mutable std::atomic<uint64_t> distributions_blocked_{0};
};

} // namespace docgate
