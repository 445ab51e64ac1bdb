#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace docgate {

// ============================================================================
// Sensitivity
// ============================================================================

/**
 * @brief Ordered document classification.
 *
 * The numeric value is the rank. Access decisions compare ranks only.
 */
enum class SensitivityLevel : uint8_t {
    PUBLIC = 0,
    INTERNAL = 1,
    CONFIDENTIAL = 2,
    RESTRICTED = 3
};

inline constexpr SensitivityLevel kDefaultSensitivity = SensitivityLevel::INTERNAL;

[[nodiscard]] inline constexpr int sensitivity_rank(SensitivityLevel level) noexcept {
    return static_cast<int>(std::to_underlying(level));
}

inline const char* sensitivity_to_string(SensitivityLevel level) {
    switch (level) {
        case SensitivityLevel::PUBLIC: return "public";
        case SensitivityLevel::INTERNAL: return "internal";
        case SensitivityLevel::CONFIDENTIAL: return "confidential";
        case SensitivityLevel::RESTRICTED: return "restricted";
        default: return "unknown";
    }
}

/// Case-sensitive: "Public" is not a valid level.
[[nodiscard]] inline std::optional<SensitivityLevel> parse_sensitivity(std::string_view value) {
    if (value == "public") return SensitivityLevel::PUBLIC;
    if (value == "internal") return SensitivityLevel::INTERNAL;
    if (value == "confidential") return SensitivityLevel::CONFIDENTIAL;
    if (value == "restricted") return SensitivityLevel::RESTRICTED;
    return std::nullopt;
}

// ============================================================================
// Severity
// ============================================================================

enum class SeverityClass : uint8_t {
    MEDIUM,
    HIGH,
    CRITICAL
};

inline const char* severity_to_string(SeverityClass severity) {
    switch (severity) {
        case SeverityClass::MEDIUM: return "MEDIUM";
        case SeverityClass::HIGH: return "HIGH";
        case SeverityClass::CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

/// Accepts "critical" / "CRITICAL" etc.
[[nodiscard]] inline std::optional<SeverityClass> parse_severity(std::string_view value) {
    std::string upper(value);
    for (char& c : upper) {
        if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
    }
    if (upper == "MEDIUM") return SeverityClass::MEDIUM;
    if (upper == "HIGH") return SeverityClass::HIGH;
    if (upper == "CRITICAL") return SeverityClass::CRITICAL;
    return std::nullopt;
}

// ============================================================================
// Documents
// ============================================================================

struct DocumentMetadata {
    SensitivityLevel sensitivity = kDefaultSensitivity;
    bool sensitivity_declared = false;      // false => default was applied
    bool sensitivity_valid = true;          // false => declared value was not a known level

    std::vector<std::string> context_documents;   // declaration order
    std::vector<std::string> tags;
    std::vector<std::string> allowed_audiences;
    std::optional<bool> requires_approval;
    std::optional<int64_t> retention_days;
    std::optional<bool> pii_present;

    // Informational fields, carried through untouched
    std::string title;
    std::string description;
    std::string owner;
    std::string department;
    std::string version;
    std::string created;
    std::string updated;
};

struct Document {
    std::string path;                       // as requested, not resolved
    DocumentMetadata metadata;
    std::string body;
    std::string raw_content;
    bool has_metadata_block = false;

    // Problems found while reading the metadata block (bad enum value,
    // wrong field type). Empty for a well-formed or absent block.
    std::vector<std::string> metadata_errors;
};

// ============================================================================
// Secret Scanning
// ============================================================================

struct DetectedSecret {
    std::string type;
    std::string matched_text;
    size_t offset = 0;                      // byte offset in the scanned text
    SeverityClass severity = SeverityClass::MEDIUM;
    std::string surrounding_excerpt;
};

struct ScanResult {
    bool has_secrets = false;
    std::vector<DetectedSecret> secrets;
    std::string redacted_text;
    size_t total_count = 0;
    size_t critical_count = 0;
};

// ============================================================================
// Sanitization
// ============================================================================

struct SanitizationResult {
    std::string sanitized_text;
    bool flagged = false;
    std::vector<std::string> removed_descriptions;
    std::string reason;
};

// ============================================================================
// Context Assembly
// ============================================================================

struct RejectedContext {
    std::string path;
    std::string reason;
};

struct ContextAssemblyResult {
    Document primary_document;
    std::vector<Document> admitted_context_documents;
    std::vector<std::string> warnings;
    std::vector<RejectedContext> rejected_contexts;
};

// ============================================================================
// Pre-Distribution Validation
// ============================================================================

struct ValidationResult {
    bool valid = false;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    std::vector<std::string> blocking_reasons;
    ScanResult scan_result;
};

/// Describes the item about to be distributed (for alerts and review).
struct DistributionMetadata {
    std::string document_id;
    std::string document_name;
    std::string author;
    std::string channel;
    std::string requested_by = "unknown";
};

} // namespace docgate
