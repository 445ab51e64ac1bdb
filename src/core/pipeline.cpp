#include "core/pipeline.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "sanitizer/input_sanitizer.hpp"
#include "scanner/secret_scanner.hpp"

#include <format>

namespace docgate {

ContentPipeline::ContentPipeline(PipelineComponents components)
    : c_(std::move(components)) {
    if (!c_.sanitizer || !c_.scanner || !c_.assembler || !c_.validator) {
        throw DocgateError("ContentPipeline requires sanitizer, scanner, assembler and validator");
    }
}

// ============================================================================
// Ingest
// ============================================================================

SanitizationResult ContentPipeline::sanitize_body(const Document& doc,
                                                  std::vector<std::string>& warnings) const {
    SanitizationResult result = c_.sanitizer->sanitize(doc.body);

    if (result.flagged) {
        inputs_flagged_.fetch_add(1, std::memory_order_relaxed);
        warnings.push_back(std::format("Input flagged in {}: {}", doc.path, result.reason));
    }
    if (!c_.sanitizer->validate(doc.body, result.sanitized_text)) {
        warnings.push_back(std::format("Sanitization check failed for {}", doc.path));
        utils::log::warn(std::format("Sanitized output for {} did not pass validation", doc.path));
    }
    return result;
}

IngestResult ContentPipeline::ingest(const std::string& primary_path,
                                     const AssemblyOptions& options) const {
    IngestResult out;
    out.assembly = c_.assembler->assemble(primary_path, options);

    out.sanitized_primary = sanitize_body(out.assembly.primary_document, out.warnings);
    out.sanitized_context.reserve(out.assembly.admitted_context_documents.size());
    for (const auto& doc : out.assembly.admitted_context_documents) {
        out.sanitized_context.push_back(sanitize_body(doc, out.warnings));
    }

    documents_ingested_.fetch_add(1 + out.assembly.admitted_context_documents.size(),
                                  std::memory_order_relaxed);

    utils::log::info(std::format("Ingested {}: {} context document(s), flagged={}",
        primary_path, out.sanitized_context.size(), utils::booltostr(out.any_flagged())));
    return out;
}

// ============================================================================
// Storage / distribution
// ============================================================================

ScanResult ContentPipeline::prepare_for_storage(std::string_view text) const {
    ScanResult result = c_.scanner->scan(text, c_.storage_scan);
    if (result.has_secrets) {
        secrets_redacted_.fetch_add(result.total_count, std::memory_order_relaxed);
        utils::log::warn(std::format("Redacted {} secret(s) before storage ({} critical)",
            result.total_count, result.critical_count));
    }
    return result;
}

ValidationResult ContentPipeline::gate_for_distribution(
    std::string_view content,
    const DistributionMetadata& metadata,
    const PreDistributionValidator::Options& options) const {
    try {
        ValidationResult result = c_.validator->validate(content, metadata, options);
        if (!result.valid) {
            distributions_blocked_.fetch_add(1, std::memory_order_relaxed);
        }
        return result;
    } catch (const SecurityException&) {
        distributions_blocked_.fetch_add(1, std::memory_order_relaxed);
        throw;
    }
}

} // namespace docgate
