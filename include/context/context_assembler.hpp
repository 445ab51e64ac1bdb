#pragma once

#include "core/types.hpp"
#include "document/document_resolver.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace docgate {

class SecurityEventEmitter;

struct AssemblyOptions {
    size_t max_context_documents = 10;
    bool fail_on_validation_error = false;
    bool allow_circular_references = false;
    bool strict_sensitivity = false;        // missing sensitivity is a validation failure
    std::string requested_by = "unknown";
};

/**
 * @brief Builds a primary document plus the context documents it declares,
 *        admitting only context at or below the primary's sensitivity.
 *
 * A rejected context document is reported, never thrown. Only an
 * unresolvable primary (DocumentNotFound) or invalid primary metadata with
 * fail_on_validation_error (MetadataValidationError) throw.
 *
 * Fetches for context documents fan out via std::async; results are
 * evaluated and reported in declaration order.
 */
class ContextAssembler {
public:
    explicit ContextAssembler(std::shared_ptr<const IDocumentResolver> resolver,
                              std::shared_ptr<SecurityEventEmitter> events = nullptr);

    [[nodiscard]] ContextAssemblyResult assemble(const std::string& primary_path,
                                                 const AssemblyOptions& options = {}) const;

    /// True iff a @p primary document may include @p context.
    [[nodiscard]] static bool can_access(SensitivityLevel primary, SensitivityLevel context) noexcept {
        return sensitivity_rank(context) <= sensitivity_rank(primary);
    }

    [[nodiscard]] static int sensitivity_level(SensitivityLevel level) noexcept {
        return sensitivity_rank(level);
    }

    [[nodiscard]] static bool is_higher_sensitivity(SensitivityLevel a, SensitivityLevel b) noexcept {
        return sensitivity_rank(a) > sensitivity_rank(b);
    }

    /**
     * @brief Schema problems for a parsed document.
     *
     * Parse-time errors plus, under strict_sensitivity, a missing
     * sensitivity field.
     */
    [[nodiscard]] static std::vector<std::string> validate_metadata(const Document& doc,
                                                                    bool strict_sensitivity);

private:
    struct Fetched {
        std::optional<Document> document;
        std::string error;
    };

    [[nodiscard]] Fetched fetch(const std::string& path) const;

    void emit_access_denied(const std::string& primary_path, const std::string& context_path,
                            const std::string& reason, const AssemblyOptions& options) const;
    void emit_assembled(const std::string& primary_path, const ContextAssemblyResult& result,
                        size_t declared, const AssemblyOptions& options) const;

    std::shared_ptr<const IDocumentResolver> resolver_;
    std::shared_ptr<SecurityEventEmitter> events_;
};

} // namespace docgate
