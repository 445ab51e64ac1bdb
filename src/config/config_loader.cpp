#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace docgate {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

constexpr int kMaxIncludeDepth = 10;

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 *
 * Unset variables expand to the empty string.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            if (const char* env_val = std::getenv(var_name.c_str())) {
                result += env_val;
            }
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_node(toml::node& node);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        expand_node(val);
    }
}

void expand_node(toml::node& node) {
    if (auto* s = node.as_string()) {
        auto expanded = expand_env_vars(s->get());
        if (expanded != s->get()) {
            *s = std::move(expanded);
        }
    } else if (auto* t = node.as_table()) {
        expand_env_vars_recursive(*t);
    } else if (auto* arr = node.as_array()) {
        for (auto& elem : *arr) {
            expand_node(elem);
        }
    }
}

/**
 * @brief Deep-merge two tables. Overlay wins for scalars, arrays concatenate.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, val] : overlay) {
        if (val.is_table() && base.contains(key) && base[key].is_table()) {
            merge_tables(*base[key].as_table(), *val.as_table());
        } else if (val.is_array() && base.contains(key) && base[key].is_array()) {
            auto& base_arr = *base[key].as_array();
            for (const auto& elem : *val.as_array()) {
                base_arr.push_back(elem);
            }
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

void resolve_includes(toml::table& root, const std::string& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    if (depth > kMaxIncludeDepth) {
        throw std::runtime_error(std::format(
            "Config include depth exceeds {} (possible circular include)", kMaxIncludeDepth));
    }
    auto inc_node = root["include"];
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (inc_node.is_string()) {
        paths.emplace_back(inc_node.as_string()->get());
    } else if (inc_node.is_array()) {
        for (const auto& item : *inc_node.as_array()) {
            if (const auto* s = item.as_string()) {
                paths.emplace_back(s->get());
            }
        }
    } else {
        throw std::runtime_error("include must be a string or an array of strings");
    }
    root.erase("include");

    namespace fs = std::filesystem;
    for (const auto& rel_path : paths) {
        const std::string abs_path = fs::canonical(fs::path(base_dir) / rel_path).string();

        if (!visited.insert(abs_path).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path));
        }

        auto included = toml::parse_file(abs_path);
        resolve_includes(included, fs::path(abs_path).parent_path().string(), visited, depth + 1);

        // Included file is the base, the including file wins
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    namespace fs = std::filesystem;
    if (!fs::exists(file_path)) {
        throw std::runtime_error(std::format("Config file not found: {}", file_path));
    }

    auto result = toml::parse_file(file_path);

    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, fs::path(file_path).parent_path().string(), visited, 0);

    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

// Negative integers clamp to zero rather than wrapping
size_t toml_size(const toml::table& tbl, const std::string_view key, const size_t fallback) {
    const auto v = tbl[key].value<int64_t>();
    if (!v) return fallback;
    return *v < 0 ? 0 : static_cast<size_t>(*v);
}

} // anonymous namespace

// ============================================================================
// Section extraction
// ============================================================================

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

InputSanitizer::Config ConfigLoader::extract_sanitizer(const toml::table& root) {
    InputSanitizer::Config cfg;
    const auto* sanitizer = root["sanitizer"].as_table();
    if (!sanitizer) return cfg;
    const auto& s = *sanitizer;

    cfg.instruction_density_threshold =
        s["instruction_density_threshold"].value_or(cfg.instruction_density_threshold);
    cfg.min_words_for_density = toml_size(s, "min_words_for_density", cfg.min_words_for_density);
    cfg.max_removal_ratio = s["max_removal_ratio"].value_or(cfg.max_removal_ratio);
    cfg.redaction_token = s["redaction_token"].value_or(cfg.redaction_token);
    return cfg;
}

ScannerConfig ConfigLoader::extract_scanner(const toml::table& root) {
    ScannerConfig cfg;
    const auto* scanner = root["scanner"].as_table();
    if (!scanner) return cfg;
    const auto& s = *scanner;

    cfg.engine.entropy_threshold = s["entropy_threshold"].value_or(cfg.engine.entropy_threshold);
    cfg.engine.url_window = toml_size(s, "url_window", cfg.engine.url_window);
    cfg.engine.placeholder_window = toml_size(s, "placeholder_window", cfg.engine.placeholder_window);
    if (s["placeholder_words"].is_array()) {
        cfg.engine.placeholder_words = toml_string_array(s, "placeholder_words");
    }

    cfg.scan.context_length = toml_size(s, "context_length", cfg.scan.context_length);
    cfg.scan.skip_false_positives = s["skip_false_positives"].value_or(cfg.scan.skip_false_positives);

    if (const auto* arr = s["custom_patterns"].as_array()) {
        size_t idx = 0;
        for (const auto& elem : *arr) {
            const auto* tbl = elem.as_table();
            if (!tbl) {
                throw std::runtime_error(
                    std::format("scanner.custom_patterns[{}] must be a table", idx));
            }
            const auto& p = *tbl;

            SecretPatternDef def;
            def.pattern = p["pattern"].value_or(""s);
            def.type = p["type"].value_or(""s);
            def.description = p["description"].value_or(""s);
            def.case_insensitive = p["case_insensitive"].value_or(false);

            const std::string severity = p["severity"].value_or("HIGH"s);
            const auto parsed = parse_severity(severity);
            if (!parsed) {
                throw std::runtime_error(std::format(
                    "scanner.custom_patterns[{}].severity must be CRITICAL, HIGH or MEDIUM, got '{}'",
                    idx, severity));
            }
            def.severity = *parsed;

            cfg.custom_patterns.push_back(std::move(def));
            ++idx;
        }
    }
    return cfg;
}

AssemblyOptions ConfigLoader::extract_context(const toml::table& root) {
    AssemblyOptions cfg;
    const auto* context = root["context"].as_table();
    if (!context) return cfg;
    const auto& c = *context;

    cfg.max_context_documents = toml_size(c, "max_context_documents", cfg.max_context_documents);
    cfg.fail_on_validation_error = c["fail_on_validation_error"].value_or(cfg.fail_on_validation_error);
    cfg.allow_circular_references =
        c["allow_circular_references"].value_or(cfg.allow_circular_references);
    cfg.strict_sensitivity = c["strict_sensitivity"].value_or(cfg.strict_sensitivity);
    return cfg;
}

PreDistributionValidator::Options ConfigLoader::extract_validator(const toml::table& root) {
    PreDistributionValidator::Options cfg;
    const auto* validator = root["validator"].as_table();
    if (!validator) return cfg;

    cfg.strict_mode = (*validator)["strict_mode"].value_or(false);
    cfg.allow_warnings = (*validator)["allow_warnings"].value_or(false);
    return cfg;
}

FilesystemResolver::Config ConfigLoader::extract_resolver(const toml::table& root) {
    FilesystemResolver::Config cfg;
    const auto* resolver = root["resolver"].as_table();
    if (!resolver) return cfg;
    const auto& r = *resolver;

    cfg.root = r["root"].value_or(cfg.root);
    if (r["allowed_base_dirs"].is_array()) {
        cfg.allowed_base_dirs = toml_string_array(r, "allowed_base_dirs");
    }
    if (const auto mb = r["max_file_size_mb"].value<int64_t>()) {
        cfg.max_file_size_bytes = *mb < 0 ? 0 : static_cast<size_t>(*mb) * 1024 * 1024;
    }
    return cfg;
}

AuditConfig ConfigLoader::extract_audit(const toml::table& root) {
    AuditConfig cfg;
    const auto* audit = root["audit"].as_table();
    if (!audit) return cfg;
    const auto& a = *audit;

    cfg.output_file = a["output_file"].value_or(cfg.output_file);
    cfg.rotation_max_file_size_mb =
        toml_size(a, "rotation_max_file_size_mb", cfg.rotation_max_file_size_mb);
    cfg.rotation_max_files = a["rotation_max_files"].value_or(cfg.rotation_max_files);
    cfg.rotation_interval_hours = a["rotation_interval_hours"].value_or(cfg.rotation_interval_hours);
    cfg.rotation_time_based = a["rotation_time_based"].value_or(cfg.rotation_time_based);
    cfg.rotation_size_based = a["rotation_size_based"].value_or(cfg.rotation_size_based);
    cfg.syslog_enabled = a["syslog_enabled"].value_or(cfg.syslog_enabled);
    cfg.syslog_ident = a["syslog_ident"].value_or(cfg.syslog_ident);
    cfg.log_sink_enabled = a["log_sink_enabled"].value_or(cfg.log_sink_enabled);
    cfg.integrity_enabled = a["integrity_enabled"].value_or(cfg.integrity_enabled);
    return cfg;
}

ReviewConfig ConfigLoader::extract_review(const toml::table& root) {
    ReviewConfig cfg;
    const auto* review = root["review"].as_table();
    if (!review) return cfg;

    cfg.queue_file = (*review)["queue_file"].value_or(cfg.queue_file);
    return cfg;
}

DocgateConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    DocgateConfig config;
    config.logging = extract_logging(tbl);
    config.sanitizer = extract_sanitizer(tbl);
    config.scanner = extract_scanner(tbl);
    config.context = extract_context(tbl);
    config.validator = extract_validator(tbl);
    config.resolver = extract_resolver(tbl);
    config.audit = extract_audit(tbl);
    config.review = extract_review(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(DocgateConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("Failed to load config: {} (line {})",
            e.description(), e.source().begin.line));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("Failed to parse config: {} (line {})",
            e.description(), e.source().begin.line));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const DocgateConfig& config) {
    std::vector<std::string> errors;

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be one of debug, info, warn, error, got '{}'", config.logging.level));
    }

    const auto& san = config.sanitizer;
    if (san.instruction_density_threshold <= 0.0 || san.instruction_density_threshold > 1.0) {
        errors.push_back(std::format("sanitizer.instruction_density_threshold must be in (0, 1], got {}",
            san.instruction_density_threshold));
    }
    if (san.max_removal_ratio <= 0.0 || san.max_removal_ratio > 1.0) {
        errors.push_back(std::format("sanitizer.max_removal_ratio must be in (0, 1], got {}",
            san.max_removal_ratio));
    }

    if (config.scanner.engine.entropy_threshold < 0.0) {
        errors.push_back(std::format("scanner.entropy_threshold must be >= 0, got {}",
            config.scanner.engine.entropy_threshold));
    }
    for (size_t i = 0; i < config.scanner.custom_patterns.size(); ++i) {
        const auto& def = config.scanner.custom_patterns[i];
        if (def.type.empty()) {
            errors.push_back(std::format("scanner.custom_patterns[{}].type must not be empty", i));
        }
        if (def.pattern.empty()) {
            errors.push_back(std::format("scanner.custom_patterns[{}].pattern must not be empty", i));
            continue;
        }
        const auto compiled = SecretPatternRegistry::compile(def);
        if (compiled.is_error()) {
            errors.push_back(std::format("scanner.custom_patterns[{}]: {}", i, compiled.error_message()));
        }
    }

    if (config.context.max_context_documents == 0) {
        errors.push_back("context.max_context_documents must be > 0");
    }

    if (config.resolver.allowed_base_dirs.empty()) {
        errors.push_back("resolver.allowed_base_dirs must list at least one directory");
    }

    if (config.audit.rotation_size_based && config.audit.rotation_max_file_size_mb == 0) {
        errors.push_back("audit.rotation_max_file_size_mb must be > 0 when size rotation is enabled");
    }
    if (config.audit.rotation_max_files <= 0) {
        errors.push_back("audit.rotation_max_files must be > 0");
    }
    if (config.audit.syslog_enabled && config.audit.syslog_ident.empty()) {
        errors.push_back("audit.syslog_ident required when syslog is enabled");
    }

    return errors;
}

} // namespace docgate
