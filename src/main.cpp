#include "audit/security_event_emitter.hpp"
#include "config/config_loader.hpp"
#include "core/error.hpp"
#include "core/pipeline.hpp"
#include "core/utils.hpp"
#include "document/frontmatter.hpp"
#include "sanitizer/input_sanitizer.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace docgate;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitBlocked = 2;
constexpr int kExitReview = 3;

void print_usage() {
    std::cerr <<
        "Usage: docgate [-c config.toml] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  sanitize <file>                               Sanitize untrusted input\n"
        "  scan <file>                                   Detect and redact secrets\n"
        "  assemble <path> [--requested-by USER]         Assemble and sanitize context\n"
        "  validate <file> [--strict] [--allow-warnings] [--requested-by USER] [--channel NAME]\n"
        "                                                Pre-distribution gate\n"
        "  patterns                                      Secret pattern statistics\n"
        "\n"
        "Exit codes: 0 ok, 1 error, 2 blocked, 3 manual review required\n";
}

struct CliArgs {
    std::optional<std::string> config_file;
    std::string command;
    std::vector<std::string> positional;
    std::string requested_by = "unknown";
    std::string channel;
    bool strict = false;
    bool allow_warnings = false;
};

std::optional<CliArgs> parse_args(int argc, char* argv[]) {
    CliArgs args;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next_value = [&](const std::string& flag) -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << std::format("{} requires a value\n", flag);
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "-c" || arg == "--config") {
            auto v = next_value(arg);
            if (!v) return std::nullopt;
            args.config_file = std::move(*v);
        } else if (arg == "--requested-by") {
            auto v = next_value(arg);
            if (!v) return std::nullopt;
            args.requested_by = std::move(*v);
        } else if (arg == "--channel") {
            auto v = next_value(arg);
            if (!v) return std::nullopt;
            args.channel = std::move(*v);
        } else if (arg == "--strict") {
            args.strict = true;
        } else if (arg == "--allow-warnings") {
            args.allow_warnings = true;
        } else if (arg == "-h" || arg == "--help") {
            return std::nullopt;
        } else if (args.command.empty()) {
            args.command = arg;
        } else {
            args.positional.push_back(arg);
        }
    }
    if (args.command.empty()) return std::nullopt;
    return args;
}

std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw DocgateError(std::format("Cannot open {}", path));
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

// Secret values never reach stdout: type, severity and position only
nlohmann::json secrets_to_json(const ScanResult& scan) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& s : scan.secrets) {
        arr.push_back({
            {"type", s.type},
            {"severity", severity_to_string(s.severity)},
            {"offset", s.offset},
            {"length", s.matched_text.size()},
        });
    }
    return arr;
}

nlohmann::json sanitization_to_json(const SanitizationResult& r) {
    return {
        {"flagged", r.flagged},
        {"reason", r.reason},
        {"removed", r.removed_descriptions},
        {"sanitized_text", r.sanitized_text},
    };
}

nlohmann::json validation_to_json(const ValidationResult& r) {
    return {
        {"valid", r.valid},
        {"errors", r.errors},
        {"warnings", r.warnings},
        {"blocking_reasons", r.blocking_reasons},
        {"secrets", secrets_to_json(r.scan_result)},
    };
}

void print_json(const nlohmann::json& j) {
    std::cout << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
}

bool require_positional(const CliArgs& args) {
    if (args.positional.empty()) {
        std::cerr << std::format("{}: missing file argument\n", args.command);
        return false;
    }
    return true;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_sanitize(const ContentPipeline& pipeline, const CliArgs& args) {
    if (!require_positional(args)) return kExitError;
    const std::string text = read_file(args.positional[0]);
    const auto& sanitizer = *pipeline.get_sanitizer();

    const SanitizationResult result = sanitizer.sanitize(text);
    nlohmann::json out = sanitization_to_json(result);
    out["passes_validation"] = sanitizer.validate(text, result.sanitized_text);
    print_json(out);
    return kExitOk;
}

int cmd_scan(const ContentPipeline& pipeline, const CliArgs& args) {
    if (!require_positional(args)) return kExitError;
    const ScanResult result = pipeline.prepare_for_storage(read_file(args.positional[0]));

    print_json({
        {"has_secrets", result.has_secrets},
        {"total_count", result.total_count},
        {"critical_count", result.critical_count},
        {"secrets", secrets_to_json(result)},
        {"redacted_text", result.redacted_text},
    });
    return kExitOk;
}

int cmd_assemble(const ContentPipeline& pipeline, const AssemblyOptions& defaults,
                 const CliArgs& args) {
    if (!require_positional(args)) return kExitError;

    AssemblyOptions options = defaults;
    options.requested_by = args.requested_by;
    const IngestResult result = pipeline.ingest(args.positional[0], options);
    const auto& assembly = result.assembly;

    nlohmann::json admitted = nlohmann::json::array();
    for (size_t i = 0; i < assembly.admitted_context_documents.size(); ++i) {
        const auto& doc = assembly.admitted_context_documents[i];
        admitted.push_back({
            {"path", doc.path},
            {"sensitivity", sensitivity_to_string(doc.metadata.sensitivity)},
            {"sanitization", sanitization_to_json(result.sanitized_context[i])},
        });
    }

    nlohmann::json rejected = nlohmann::json::array();
    for (const auto& r : assembly.rejected_contexts) {
        rejected.push_back({{"path", r.path}, {"reason", r.reason}});
    }

    std::vector<std::string> warnings = assembly.warnings;
    warnings.insert(warnings.end(), result.warnings.begin(), result.warnings.end());

    print_json({
        {"primary", {
            {"path", assembly.primary_document.path},
            {"sensitivity", sensitivity_to_string(assembly.primary_document.metadata.sensitivity)},
            {"sanitization", sanitization_to_json(result.sanitized_primary)},
        }},
        {"admitted", admitted},
        {"rejected", rejected},
        {"warnings", warnings},
    });
    return kExitOk;
}

int cmd_validate(const ContentPipeline& pipeline, const PreDistributionValidator::Options& defaults,
                 const CliArgs& args) {
    if (!require_positional(args)) return kExitError;
    const std::string& path = args.positional[0];
    const std::string raw = read_file(path);

    // Frontmatter only supplies alert metadata; the whole file is validated
    const Document doc = frontmatter::parse_document(path, raw);
    DistributionMetadata metadata;
    metadata.document_id = path;
    metadata.document_name = doc.metadata.title.empty()
        ? std::filesystem::path(path).filename().string() : doc.metadata.title;
    metadata.author = doc.metadata.owner;
    metadata.channel = args.channel;
    metadata.requested_by = args.requested_by;

    PreDistributionValidator::Options options = defaults;
    options.strict_mode = options.strict_mode || args.strict;
    options.allow_warnings = options.allow_warnings || args.allow_warnings;

    try {
        const ValidationResult result = pipeline.gate_for_distribution(raw, metadata, options);
        print_json(validation_to_json(result));
        return result.valid ? kExitOk : kExitReview;
    } catch (const SecurityException& e) {
        nlohmann::json out = validation_to_json(e.result());
        out["blocked"] = e.what();
        print_json(out);
        return kExitBlocked;
    }
}

int cmd_patterns(const ContentPipeline& pipeline) {
    const auto stats = pipeline.get_scanner()->statistics();
    const auto keywords = pipeline.get_validator()->statistics();

    nlohmann::json types = nlohmann::json::array();
    for (const auto& p : pipeline.get_scanner()->registry().patterns()) {
        types.push_back({{"type", p.type}, {"severity", severity_to_string(p.severity)}});
    }

    print_json({
        {"secret_patterns", {
            {"total", stats.total},
            {"critical", stats.critical},
            {"high", stats.high},
            {"medium", stats.medium},
            {"patterns", types},
        }},
        {"keyword_rules", {
            {"total", keywords.total_keyword_rules},
            {"blocking", keywords.blocking_rules},
            {"warning", keywords.warning_rules},
        }},
    });
    return kExitOk;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    const auto args = parse_args(argc, argv);
    if (!args) {
        print_usage();
        return kExitError;
    }

    try {
        DocgateConfig config;
        if (args->config_file) {
            auto loaded = ConfigLoader::load_from_file(*args->config_file);
            if (!loaded.success) {
                utils::log::error(loaded.error_message);
                return kExitError;
            }
            config = std::move(loaded.config);
        }

        if (const auto level = utils::log::parse_level(config.logging.level)) {
            utils::log::set_level(*level);
        }
        if (args->config_file) {
            utils::log::debug(std::format("Configuration loaded from {}", *args->config_file));
        }

        const auto pipeline = PipelineBuilder::from_config(config);

        int rc = kExitError;
        if (args->command == "sanitize") {
            rc = cmd_sanitize(*pipeline, *args);
        } else if (args->command == "scan") {
            rc = cmd_scan(*pipeline, *args);
        } else if (args->command == "assemble") {
            rc = cmd_assemble(*pipeline, config.context, *args);
        } else if (args->command == "validate") {
            rc = cmd_validate(*pipeline, config.validator, *args);
        } else if (args->command == "patterns") {
            rc = cmd_patterns(*pipeline);
        } else {
            std::cerr << std::format("Unknown command: {}\n", args->command);
            print_usage();
        }

        if (auto events = pipeline->get_events()) {
            events->shutdown();
        }
        return rc;

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return kExitError;
    }
}
