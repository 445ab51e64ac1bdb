#pragma once

#include "config/config_types.hpp"
#include "context/context_assembler.hpp"
#include "document/filesystem_resolver.hpp"
#include "sanitizer/input_sanitizer.hpp"
#include "scanner/secret_pattern.hpp"
#include "scanner/secret_scanner.hpp"
#include "validator/pre_distribution_validator.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace docgate {

// ============================================================================
// Scanner Config (engine tuning + default scan options + custom patterns)
// ============================================================================

struct ScannerConfig {
    SecretScanner::Config engine;
    SecretScanner::ScanOptions scan;
    std::vector<SecretPatternDef> custom_patterns;
};

// ============================================================================
// DocgateConfig - Complete parsed configuration
// ============================================================================

struct DocgateConfig {
    LoggingConfig logging;
    InputSanitizer::Config sanitizer;
    ScannerConfig scanner;
    AssemblyOptions context;
    PreDistributionValidator::Options validator;
    FilesystemResolver::Config resolver;
    AuditConfig audit;
    ReviewConfig review;
};

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        DocgateConfig config;

        static LoadResult ok(DocgateConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     *
     * Resolves `include = [...]` relative to the file and expands ${VAR}
     * references in every string value.
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string (no include support)
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Semantic checks on a typed config
     * @return Every problem found; empty when the config is usable
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const DocgateConfig& config);

private:
    static DocgateConfig extract_all_sections(const toml::table& root);
    static LoadResult validate_and_return(DocgateConfig config);

    static LoggingConfig extract_logging(const toml::table& root);
    static InputSanitizer::Config extract_sanitizer(const toml::table& root);
    static ScannerConfig extract_scanner(const toml::table& root);
    static AssemblyOptions extract_context(const toml::table& root);
    static PreDistributionValidator::Options extract_validator(const toml::table& root);
    static FilesystemResolver::Config extract_resolver(const toml::table& root);
    static AuditConfig extract_audit(const toml::table& root);
    static ReviewConfig extract_review(const toml::table& root);
};

} // namespace docgate
