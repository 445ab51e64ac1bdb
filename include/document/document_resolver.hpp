#pragma once

#include "core/error.hpp"

#include <optional>
#include <string>

namespace docgate {

struct ResolvedDocument {
    std::string requested_path;
    std::string resolved_location;
    bool exists = false;
    std::optional<std::string> error;
};

/**
 * @brief Abstract document storage lookup
 *
 * The context assembler only talks to storage through this interface.
 * Implementations must be callable from several threads at once: context
 * fetches fan out one task per declared path.
 */
class IDocumentResolver {
public:
    virtual ~IDocumentResolver() = default;

    /// Map a requested relative path to a concrete location. Never throws.
    [[nodiscard]] virtual ResolvedDocument resolve(const std::string& path) const = 0;

    /// Fetch the raw text of a resolved document.
    [[nodiscard]] virtual Result<std::string> read(const ResolvedDocument& resolved) const = 0;
};

} // namespace docgate
