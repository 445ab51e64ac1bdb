#include "document/frontmatter.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <charconv>
#include <format>
#include <sstream>
#include <utility>

namespace docgate::frontmatter {

namespace {

using Kind = RawValue::Kind;

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

// Next line (without terminator) starting at pos; pos advances past '\n'
std::string_view next_line(std::string_view text, size_t& pos) {
    const size_t start = pos;
    const size_t nl = text.find('\n', pos);
    if (nl == std::string_view::npos) {
        pos = text.size();
        return text.substr(start);
    }
    pos = nl + 1;
    std::string_view line = text.substr(start, nl - start);
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    return line;
}

bool is_fence(std::string_view line, std::string_view fence) {
    while (!line.empty() && (line.back() == ' ' || line.back() == '\t' || line.back() == '\r')) {
        line.remove_suffix(1);
    }
    return line == fence;
}

std::string strip_quotes(std::string_view value) {
    std::string v = utils::trim(value);
    if (v.size() >= 2 &&
        ((v.front() == '"' && v.back() == '"') || (v.front() == '\'' && v.back() == '\''))) {
        return v.substr(1, v.size() - 2);
    }
    return v;
}

bool is_quoted(std::string_view v) {
    return v.size() >= 2 &&
           ((v.front() == '"' && v.back() == '"') || (v.front() == '\'' && v.back() == '\''));
}

// YAML comments start at '#' preceded by whitespace (or at column 0), outside quotes
std::string strip_hash_comment(std::string_view line) {
    char quote = 0;
    for (size_t i = 0; i < line.size(); ++i) {
        const char ch = line[i];
        if (quote != 0) {
            if (ch == quote && (i == 0 || line[i - 1] != '\\')) quote = 0;
            continue;
        }
        if (ch == '"' || ch == '\'') {
            quote = ch;
        } else if (ch == '#' && (i == 0 || line[i - 1] == ' ' || line[i - 1] == '\t')) {
            return std::string(line.substr(0, i));
        }
    }
    return std::string(line);
}

std::vector<std::string> split_flow_sequence(std::string_view inner) {
    std::vector<std::string> out;
    std::string current;
    char quote = 0;

    for (const char ch : inner) {
        if (quote != 0) {
            if (ch == quote) quote = 0;
            current.push_back(ch);
            continue;
        }
        if (ch == '"' || ch == '\'') {
            quote = ch;
            current.push_back(ch);
            continue;
        }
        if (ch == ',') {
            if (const std::string item = utils::trim(current); !item.empty()) {
                out.push_back(strip_quotes(item));
            }
            current.clear();
            continue;
        }
        current.push_back(ch);
    }
    if (const std::string tail = utils::trim(current); !tail.empty()) {
        out.push_back(strip_quotes(tail));
    }
    return out;
}

RawValue type_scalar(std::string_view raw) {
    RawValue v;
    const std::string text = utils::trim(raw);

    if (is_quoted(text)) {
        v.kind = Kind::STRING;
        v.text = text.substr(1, text.size() - 2);
        return v;
    }
    if (text.empty() || text == "~" || text == "null" || text == "Null" || text == "NULL") {
        v.kind = Kind::NIL;
        return v;
    }
    if (text == "true" || text == "True" || text == "TRUE") {
        v.kind = Kind::BOOLEAN;
        v.boolean = true;
        v.text = "true";
        return v;
    }
    if (text == "false" || text == "False" || text == "FALSE") {
        v.kind = Kind::BOOLEAN;
        v.boolean = false;
        v.text = "false";
        return v;
    }

    int64_t n = 0;
    const char* first = text.data() + (text.front() == '+' ? 1 : 0);
    const char* last = text.data() + text.size();
    if (auto [ptr, ec] = std::from_chars(first, last, n); ec == std::errc{} && ptr == last) {
        v.kind = Kind::INTEGER;
        v.integer = n;
        v.text = text;
        return v;
    }

    double d = 0.0;
    if (auto [ptr, ec] = std::from_chars(first, last, d); ec == std::errc{} && ptr == last) {
        v.kind = Kind::FLOAT;
        v.integer = static_cast<int64_t>(d);
        v.text = text;
        return v;
    }

    v.kind = Kind::STRING;
    v.text = text;
    return v;
}

// ---- toml++ node conversion ------------------------------------------------

std::string toml_scalar_text(const toml::node& node) {
    if (const auto* s = node.as_string()) return s->get();
    if (const auto* b = node.as_boolean()) return b->get() ? "true" : "false";
    if (const auto* i = node.as_integer()) return std::to_string(i->get());

    std::ostringstream os;
    if (const auto* f = node.as_floating_point()) os << *f;
    else if (const auto* dt = node.as_date()) os << *dt;
    else if (const auto* tm = node.as_time()) os << *tm;
    else if (const auto* dtt = node.as_date_time()) os << *dtt;
    return os.str();
}

RawValue from_toml(const toml::node& node) {
    RawValue v;
    if (const auto* s = node.as_string()) {
        v.kind = Kind::STRING;
        v.text = s->get();
    } else if (const auto* b = node.as_boolean()) {
        v.kind = Kind::BOOLEAN;
        v.boolean = b->get();
        v.text = v.boolean ? "true" : "false";
    } else if (const auto* i = node.as_integer()) {
        v.kind = Kind::INTEGER;
        v.integer = i->get();
        v.text = std::to_string(v.integer);
    } else if (const auto* f = node.as_floating_point()) {
        v.kind = Kind::FLOAT;
        v.integer = static_cast<int64_t>(f->get());
        v.text = toml_scalar_text(node);
    } else if (const auto* arr = node.as_array()) {
        v.kind = Kind::LIST;
        for (const auto& elem : *arr) {
            v.items.push_back(toml_scalar_text(elem));
        }
    } else if (node.is_table()) {
        v.kind = Kind::TABLE;
    } else {
        // Dates and times are informational text
        v.kind = Kind::STRING;
        v.text = toml_scalar_text(node);
    }
    return v;
}

// ---- Schema helpers --------------------------------------------------------

void apply_list(const RawValue& v, const char* field, std::vector<std::string>& target,
                std::vector<std::string>& errors) {
    if (v.kind == Kind::NIL) return;
    if (v.kind != Kind::LIST) {
        errors.push_back(std::format("{} must be an array", field));
        return;
    }
    target = v.items;
}

void apply_bool(const RawValue& v, const char* field, std::optional<bool>& target,
                std::vector<std::string>& errors) {
    if (v.kind == Kind::NIL) return;
    if (v.kind != Kind::BOOLEAN) {
        errors.push_back(std::format("{} must be a boolean", field));
        return;
    }
    target = v.boolean;
}

void apply_text(const RawValue& v, std::string& target) {
    if (v.kind == Kind::LIST || v.kind == Kind::TABLE) return;
    target = v.text;
}

} // anonymous namespace

// ============================================================================
// Block detection
// ============================================================================

SplitResult split(std::string_view raw) {
    SplitResult result;
    result.body = raw;

    std::string_view text = raw;
    if (text.starts_with(kUtf8Bom)) {
        text.remove_prefix(kUtf8Bom.size());
    }

    size_t pos = 0;
    const std::string_view first = next_line(text, pos);

    BlockStyle style = BlockStyle::NONE;
    std::string_view fence;
    if (is_fence(first, "---")) {
        style = BlockStyle::YAML;
        fence = "---";
    } else if (is_fence(first, "+++")) {
        style = BlockStyle::TOML;
        fence = "+++";
    } else {
        return result;
    }

    const size_t block_start = pos;
    while (pos < text.size()) {
        const size_t line_start = pos;
        const std::string_view line = next_line(text, pos);
        if (is_fence(line, fence) || (style == BlockStyle::YAML && is_fence(line, "..."))) {
            result.style = style;
            result.block = text.substr(block_start, line_start - block_start);
            result.body = text.substr(pos);
            return result;
        }
    }

    // Unterminated: not a metadata block
    return result;
}

// ============================================================================
// YAML subset
// ============================================================================

bool parse_yaml(std::string_view block, RawFields& out, std::string& error) {
    std::string list_key;           // key awaiting "- item" lines
    std::string scalar_key;         // key collecting a "|" or ">" block scalar
    bool folded = false;
    size_t line_no = 0;
    size_t pos = 0;

    while (pos < block.size()) {
        const std::string_view raw_line = next_line(block, pos);
        ++line_no;

        const bool indented = !raw_line.empty() && (raw_line.front() == ' ' || raw_line.front() == '\t');

        if (!scalar_key.empty()) {
            if (indented || utils::trim(raw_line).empty()) {
                auto& text = out[scalar_key].text;
                const std::string piece = utils::trim(raw_line);
                if (!text.empty()) text += folded ? " " : "\n";
                text += piece;
                continue;
            }
            out[scalar_key].text = utils::trim(out[scalar_key].text);
            scalar_key.clear();
        }

        const std::string line = utils::trim(strip_hash_comment(raw_line));
        if (line.empty()) continue;

        if (line == "-" || line.starts_with("- ")) {
            if (list_key.empty()) {
                error = std::format("line {}: list item without a key", line_no);
                return false;
            }
            auto& v = out[list_key];
            if (v.kind == Kind::NIL) v.kind = Kind::LIST;
            if (v.kind == Kind::LIST) {
                v.items.push_back(strip_quotes(std::string_view(line).substr(1)));
            }
            continue;
        }

        if (indented) {
            // Nested mapping under the pending key; not part of the schema
            if (!list_key.empty()) {
                auto& v = out[list_key];
                if (v.kind == Kind::NIL) v.kind = Kind::TABLE;
            }
            continue;
        }

        size_t colon = std::string::npos;
        for (size_t i = 0; i < line.size(); ++i) {
            if (line[i] == ':' && (i + 1 == line.size() || line[i + 1] == ' ' || line[i + 1] == '\t')) {
                colon = i;
                break;
            }
        }
        if (colon == std::string::npos || colon == 0) {
            error = std::format("line {}: expected 'key: value'", line_no);
            return false;
        }

        const std::string key = strip_quotes(std::string_view(line).substr(0, colon));
        const std::string value = utils::trim(std::string_view(line).substr(colon + 1));
        list_key.clear();

        if (value.empty()) {
            out[key] = RawValue{};
            list_key = key;
            continue;
        }

        if (value == "|" || value == "|-" || value == ">" || value == ">-") {
            RawValue v;
            v.kind = Kind::STRING;
            out[key] = std::move(v);
            scalar_key = key;
            folded = value.front() == '>';
            continue;
        }

        if (value.front() == '[') {
            if (value.back() != ']') {
                error = std::format("line {}: unterminated flow sequence for '{}'", line_no, key);
                return false;
            }
            RawValue v;
            v.kind = Kind::LIST;
            v.items = split_flow_sequence(std::string_view(value).substr(1, value.size() - 2));
            out[key] = std::move(v);
            continue;
        }

        if (value.front() == '{') {
            RawValue v;
            v.kind = Kind::TABLE;
            out[key] = std::move(v);
            continue;
        }

        out[key] = type_scalar(value);
    }

    if (!scalar_key.empty()) {
        out[scalar_key].text = utils::trim(out[scalar_key].text);
    }
    return true;
}

// ============================================================================
// TOML
// ============================================================================

bool parse_toml(std::string_view block, RawFields& out, std::string& error) {
    try {
        const toml::table tbl = toml::parse(block);
        for (const auto& [key, node] : tbl) {
            out[std::string(key.str())] = from_toml(node);
        }
        return true;
    } catch (const toml::parse_error& e) {
        error = std::format("line {}: {}", e.source().begin.line, e.description());
        return false;
    }
}

// ============================================================================
// Schema
// ============================================================================

std::vector<std::string> apply_fields(const RawFields& fields, DocumentMetadata& metadata) {
    std::vector<std::string> errors;

    for (const auto& [key, v] : fields) {
        if (key == "sensitivity") {
            if (v.kind == Kind::NIL) continue;
            metadata.sensitivity_declared = true;
            const auto level = v.kind == Kind::STRING ? parse_sensitivity(v.text) : std::nullopt;
            if (level) {
                metadata.sensitivity = *level;
            } else {
                metadata.sensitivity_valid = false;
                errors.push_back(std::format(
                    "Invalid sensitivity level: {}. Must be one of: public, internal, confidential, restricted",
                    v.kind == Kind::LIST ? "[list]" : v.text));
            }
        } else if (key == "context_documents") {
            apply_list(v, "context_documents", metadata.context_documents, errors);
        } else if (key == "tags") {
            apply_list(v, "tags", metadata.tags, errors);
        } else if (key == "allowed_audiences") {
            apply_list(v, "allowed_audiences", metadata.allowed_audiences, errors);
        } else if (key == "requires_approval") {
            apply_bool(v, "requires_approval", metadata.requires_approval, errors);
        } else if (key == "pii_present") {
            apply_bool(v, "pii_present", metadata.pii_present, errors);
        } else if (key == "retention_days") {
            if (v.kind == Kind::NIL) continue;
            if ((v.kind != Kind::INTEGER && v.kind != Kind::FLOAT) || v.integer < 0 ||
                (v.kind == Kind::FLOAT && v.text.starts_with('-'))) {
                errors.emplace_back("retention_days must be a positive number");
            } else {
                metadata.retention_days = v.integer;
            }
        } else if (key == "title") {
            apply_text(v, metadata.title);
        } else if (key == "description") {
            apply_text(v, metadata.description);
        } else if (key == "owner") {
            apply_text(v, metadata.owner);
        } else if (key == "department") {
            apply_text(v, metadata.department);
        } else if (key == "version") {
            apply_text(v, metadata.version);
        } else if (key == "created") {
            apply_text(v, metadata.created);
        } else if (key == "updated") {
            apply_text(v, metadata.updated);
        }
    }

    return errors;
}

Document parse_document(std::string path, std::string raw_content) {
    Document doc;
    doc.path = std::move(path);
    doc.raw_content = std::move(raw_content);

    const SplitResult parts = split(doc.raw_content);
    if (parts.style == BlockStyle::NONE) {
        doc.body = doc.raw_content;
        return doc;
    }

    doc.has_metadata_block = true;
    doc.body = std::string(parts.body);

    RawFields fields;
    std::string error;
    const bool parsed = parts.style == BlockStyle::YAML
        ? parse_yaml(parts.block, fields, error)
        : parse_toml(parts.block, fields, error);

    if (!parsed) {
        doc.metadata_errors.push_back(std::format("Invalid frontmatter syntax: {}", error));
        utils::log::warn(std::format("Malformed metadata block in {}: {}", doc.path, error));
        return doc;
    }

    doc.metadata_errors = apply_fields(fields, doc.metadata);
    return doc;
}

} // namespace docgate::frontmatter
