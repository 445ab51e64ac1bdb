#include "context/context_assembler.hpp"
#include "audit/security_event_emitter.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "document/frontmatter.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <future>
#include <unordered_set>
#include <utility>

namespace docgate {

namespace {

std::string visit_key(const std::string& path) {
    return std::filesystem::path(path).lexically_normal().generic_string();
}

// Unknown or (under strict mode) missing levels fail closed: a primary is
// treated as public, a context document as restricted.
SensitivityLevel effective_level(const Document& doc, bool is_primary, bool strict) {
    const auto& m = doc.metadata;
    const bool unusable = !m.sensitivity_valid || (strict && !m.sensitivity_declared);
    if (!unusable) return m.sensitivity;
    return is_primary ? SensitivityLevel::PUBLIC : SensitivityLevel::RESTRICTED;
}

} // anonymous namespace

ContextAssembler::ContextAssembler(std::shared_ptr<const IDocumentResolver> resolver,
                                   std::shared_ptr<SecurityEventEmitter> events)
    : resolver_(std::move(resolver)), events_(std::move(events)) {
    if (!resolver_) {
        throw DocgateError("ContextAssembler requires a document resolver");
    }
}

std::vector<std::string> ContextAssembler::validate_metadata(const Document& doc,
                                                             bool strict_sensitivity) {
    std::vector<std::string> errors = doc.metadata_errors;
    if (strict_sensitivity && !doc.metadata.sensitivity_declared) {
        errors.insert(errors.begin(), "Missing required field: sensitivity");
    }
    return errors;
}

ContextAssembler::Fetched ContextAssembler::fetch(const std::string& path) const {
    Fetched out;
    try {
        const ResolvedDocument resolved = resolver_->resolve(path);
        if (!resolved.exists) {
            out.error = resolved.error.value_or("not found");
            return out;
        }
        auto text = resolver_->read(resolved);
        if (text.is_error()) {
            out.error = text.error_message();
            return out;
        }
        out.document = frontmatter::parse_document(path, std::move(text.value()));
    } catch (const std::exception& e) {
        // Resolver implementations outside this library may throw
        out.error = e.what();
    }
    return out;
}

// ============================================================================
// Assembly
// ============================================================================

ContextAssemblyResult ContextAssembler::assemble(const std::string& primary_path,
                                                 const AssemblyOptions& options) const {
    utils::log::info(std::format("Assembling context for {} (requested by {})",
        primary_path, options.requested_by));

    ContextAssemblyResult result;

    // Primary document
    Fetched primary = fetch(primary_path);
    if (!primary.document) {
        utils::log::error(std::format("Primary document not found or invalid: {} ({})",
            primary_path, primary.error));
        throw DocumentNotFound(primary_path);
    }
    result.primary_document = std::move(*primary.document);
    const Document& primary_doc = result.primary_document;

    const auto primary_errors = validate_metadata(primary_doc, options.strict_sensitivity);
    if (!primary_errors.empty()) {
        const std::string message = std::format("Primary document has invalid frontmatter: {}",
            utils::join(primary_errors, ", "));
        utils::log::error(std::format("{} [{}]", message, primary_path));
        if (options.fail_on_validation_error) {
            throw MetadataValidationError(message);
        }
        result.warnings.push_back(message);
    }

    const auto& declared = primary_doc.metadata.context_documents;
    if (declared.empty()) {
        utils::log::info(std::format("No context documents declared by {}", primary_path));
        emit_assembled(primary_path, result, 0, options);
        return result;
    }

    // Truncate to the cap
    const size_t count = std::min(declared.size(), options.max_context_documents);
    if (declared.size() > options.max_context_documents) {
        const std::string warning = std::format("Context documents limited to {} ({} specified)",
            options.max_context_documents, declared.size());
        utils::log::warn(std::format("{} [{}]", warning, primary_path));
        result.warnings.push_back(warning);
    }

    // Circular references are decided up front in declaration order so the
    // fetches below can run concurrently
    std::vector<bool> circular(count, false);
    {
        std::unordered_set<std::string> visited{visit_key(primary_path)};
        for (size_t i = 0; i < count; ++i) {
            const bool seen = !visited.insert(visit_key(declared[i])).second;
            circular[i] = seen && !options.allow_circular_references;
        }
    }

    std::vector<std::future<Fetched>> pending(count);
    for (size_t i = 0; i < count; ++i) {
        if (circular[i]) continue;
        pending[i] = std::async(std::launch::async,
            [this, path = declared[i]] { return fetch(path); });
    }

    const SensitivityLevel primary_level =
        effective_level(primary_doc, true, options.strict_sensitivity);

    for (size_t i = 0; i < count; ++i) {
        const std::string& path = declared[i];

        if (circular[i]) {
            const std::string warning = std::format("Circular reference detected: {}", path);
            utils::log::warn(std::format("{} [{}]", warning, primary_path));
            result.warnings.push_back(warning);
            result.rejected_contexts.push_back({path, "Circular reference"});
            continue;
        }

        Fetched fetched = pending[i].get();
        if (!fetched.document) {
            const std::string warning = std::format("Context document not found: {}", path);
            utils::log::warn(std::format("{} [{}] ({})", warning, primary_path, fetched.error));
            result.warnings.push_back(warning);
            result.rejected_contexts.push_back({path, "Document not found or invalid"});
            continue;
        }
        Document& ctx = *fetched.document;

        const auto ctx_errors = validate_metadata(ctx, options.strict_sensitivity);
        if (!ctx_errors.empty()) {
            const std::string joined = utils::join(ctx_errors, ", ");
            const std::string warning = std::format(
                "Context document has invalid frontmatter: {} - {}", path, joined);
            utils::log::warn(std::format("{} [{}]", warning, primary_path));
            result.warnings.push_back(warning);
            if (options.fail_on_validation_error) {
                result.rejected_contexts.push_back({path, "Invalid frontmatter: " + joined});
                continue;
            }
        }

        const SensitivityLevel ctx_level = effective_level(ctx, false, options.strict_sensitivity);
        if (!can_access(primary_level, ctx_level)) {
            const std::string reason = std::format(
                "Sensitivity violation: {} primary document cannot access {} context document",
                sensitivity_to_string(primary_level), sensitivity_to_string(ctx_level));
            utils::log::error(std::format("Context access denied: {} -> {} ({} > {}), requested by {}",
                primary_path, path, sensitivity_to_string(ctx_level),
                sensitivity_to_string(primary_level), options.requested_by));

            result.warnings.push_back(std::format("SECURITY: {} for {}", reason, path));
            result.rejected_contexts.push_back({path, reason});
            emit_access_denied(primary_path, path, reason, options);
            continue;
        }

        utils::log::debug(std::format("Context document admitted: {} ({})",
            path, sensitivity_to_string(ctx_level)));
        result.admitted_context_documents.push_back(std::move(ctx));
    }

    emit_assembled(primary_path, result, declared.size(), options);

    utils::log::info(std::format("Context assembly complete for {}: {} admitted, {} rejected, {} warning(s)",
        primary_path, result.admitted_context_documents.size(),
        result.rejected_contexts.size(), result.warnings.size()));
    return result;
}

// ============================================================================
// Events
// ============================================================================

void ContextAssembler::emit_access_denied(const std::string& primary_path,
                                          const std::string& context_path,
                                          const std::string& reason,
                                          const AssemblyOptions& options) const {
    if (!events_) return;

    SecurityEvent event;
    event.event_type = SecurityEventType::CONTEXT_ACCESS_DENIED;
    event.severity = EventSeverity::WARNING;
    event.requesting_identity = options.requested_by;
    event.resource = context_path;
    event.details = std::format("{} (primary: {})", reason, primary_path);
    events_->emit(std::move(event));
}

void ContextAssembler::emit_assembled(const std::string& primary_path,
                                      const ContextAssemblyResult& result,
                                      size_t declared,
                                      const AssemblyOptions& options) const {
    if (!events_) return;

    SecurityEvent event;
    event.event_type = SecurityEventType::CONTEXT_ASSEMBLED;
    event.severity = EventSeverity::INFO;
    event.requesting_identity = options.requested_by;
    event.resource = primary_path;
    event.details = std::format("sensitivity={} declared={} admitted={} rejected={}",
        sensitivity_to_string(result.primary_document.metadata.sensitivity), declared,
        result.admitted_context_documents.size(), result.rejected_contexts.size());
    events_->emit(std::move(event));
}

} // namespace docgate
