#include "sanitizer/input_sanitizer.hpp"
#include "core/unicode.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <map>
#include <utility>

namespace docgate {

namespace {

struct InvisibleCategory {
    int32_t code_point;
    const char* name;
};

// Stripped outright. Order here is the order descriptions are reported in.
constexpr InvisibleCategory kInvisibleCategories[] = {
    {0x200B, "Zero-width space (U+200B)"},
    {0x200C, "Zero-width non-joiner (U+200C)"},
    {0x200D, "Zero-width joiner (U+200D)"},
    {0x2060, "Word joiner (U+2060)"},
    {0xFEFF, "Zero-width no-break space (U+FEFF)"},
    {0x00AD, "Soft hyphen (U+00AD)"},
    {0x202A, "Bidirectional embedding (U+202A)"},
    {0x202B, "Bidirectional embedding (U+202B)"},
    {0x202C, "Bidirectional pop (U+202C)"},
    {0x202D, "Bidirectional override (U+202D)"},
    {0x202E, "Bidirectional override (U+202E)"},
};

const InvisibleCategory* find_invisible(int32_t cp) {
    for (const auto& c : kInvisibleCategories) {
        if (c.code_point == cp) return &c;
    }
    return nullptr;
}

// Replaced by an ASCII space
bool is_odd_space(int32_t cp) {
    return cp == 0x00A0 || (cp >= 0x2000 && cp <= 0x200A) ||
           cp == 0x202F || cp == 0x205F || cp == 0x3000;
}

constexpr auto kIcase = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;

std::regex make_regex(const char* pattern) {
    return std::regex(pattern, kIcase);
}

std::string strip_to_alpha_lower(std::string_view word) {
    std::string out;
    out.reserve(word.size());
    for (const char c : word) {
        if (std::isalpha(static_cast<unsigned char>(c))) {
            out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    return out;
}

} // anonymous namespace

// ============================================================================
// Phrase table
// ============================================================================

std::shared_ptr<const InputSanitizer::PhraseTable> InputSanitizer::default_phrase_table() {
    static const std::shared_ptr<const PhraseTable> table = [] {
        auto t = std::make_shared<PhraseTable>();

        auto add = [&t](const char* technique, const char* pattern) {
            t->injection_patterns.push_back({technique, make_regex(pattern)});
        };

        // System-role delimiters first so "SYSTEM: ignore ..." reports both
        add("system delimiter", R"(\[\s{0,16}system\s{0,16}\])");
        add("system delimiter", R"(<\s{0,16}/?\s{0,16}system\s{0,16}>)");
        add("system delimiter", R"(```\s{0,16}system)");
        add("system delimiter", R"(\bsystem\s{0,16}:)");

        add("instruction override",
            R"(\bignore\s{1,16}(?:all\s{1,16})?(?:the\s{1,16})?(?:(?:previous|prior|above|earlier)\s{1,16})?instructions\b)");
        add("instruction override",
            R"(\bdisregard\s{1,16}(?:all\s{1,16})?(?:of\s{1,16})?(?:the\s{1,16})?(?:above|previous|prior)\b)");
        add("instruction override",
            R"(\bforget\s{1,16}(?:all\s{1,16})?(?:the\s{1,16})?(?:previous|prior|above|earlier)\b)");
        add("instruction override",
            R"(\boverride\s{1,16}(?:all\s{1,16})?(?:the\s{1,16})?(?:previous\s{1,16})?(?:instructions|rules)\b)");
        add("instruction override", R"(\bnew\s{1,16}instructions\s{0,16}:)");

        add("role reassignment", R"(\byou\s{1,16}are\s{1,16}now\b)");
        add("role reassignment", R"(\byour\s{1,16}new\s{1,16}role\b)");
        add("role reassignment",
            R"(\b(?:act|behave)\s{1,16}as\s{1,16}(?:if\s{1,16}you\s{1,16}are\b|an?\s{1,16}(?:admin|administrator|root|system|unrestricted)\b))");
        add("role reassignment", R"(\bpretend\s{1,16}(?:to\s{1,16}be|you\s{1,16}are)\b)");
        add("role reassignment", R"(\bdeveloper\s{1,16}mode\b)");
        add("role reassignment", R"(\byou\s{1,16}must\b)");

        add("command execution", R"(\bexecute\s{1,16}(?:the\s{1,16})?(?:following\s{1,16})?commands?\b)");
        add("command execution", R"(\brun\s{1,16}(?:the\s{1,16})?(?:following\s{1,16})?scripts?\b)");
        add("command execution", R"(\b(?:eval|exec)\s{0,16}\()");

        t->hiding_styles.push_back(make_regex(
            R"(color\s{0,16}:\s{0,16}(?:white\b|#fff(?:fff)?\b|rgba?\(\s{0,16}255\s{0,16},\s{0,16}255\s{0,16},\s{0,16}255))"));
        t->hiding_styles.push_back(make_regex(R"(opacity\s{0,16}:\s{0,16}0(?:\.0{0,16})?(?![\d.]))"));
        t->hiding_styles.push_back(make_regex(R"(display\s{0,16}:\s{0,16}none\b)"));
        t->hiding_styles.push_back(make_regex(R"(visibility\s{0,16}:\s{0,16}hidden\b)"));
        t->hiding_styles.push_back(make_regex(R"(font-size\s{0,16}:\s{0,16}0(?:px|pt|em|rem)?(?![\d.]))"));

        t->instructional_words = {
            "must", "should", "shall", "always", "never", "required",
            "mandatory", "instruction", "instructions", "command", "commands",
            "directive", "directives", "rule", "rules", "ignore", "override",
            "obey", "execute", "comply",
        };

        return std::shared_ptr<const PhraseTable>(std::move(t));
    }();
    return table;
}

InputSanitizer::InputSanitizer(const Config& config, std::shared_ptr<const PhraseTable> table)
    : config_(config), table_(table ? std::move(table) : default_phrase_table()) {}

// ============================================================================
// Entry points
// ============================================================================

SanitizationResult InputSanitizer::sanitize(std::string_view text) const {
    SanitizationResult result;

    std::string working = normalize_unicode(text, result);
    working = strip_invisible(working, result);
    check_hidden_styles(working, result);

    // Phrase patterns allow only short whitespace gaps, so runs are
    // collapsed before matching
    working = collapse_whitespace(working);

    // Density is measured before redaction replaces the vocabulary
    check_instruction_density(working, result);
    result.sanitized_text = redact_injections(std::move(working), result);

    if (result.flagged) {
        utils::log::warn(std::format("Sanitizer flagged input: {} ({} finding(s))",
            result.reason, result.removed_descriptions.size()));
    }
    return result;
}

bool InputSanitizer::validate(std::string_view original, std::string_view sanitized) const {
    const std::string haystack(sanitized);
    for (const auto& p : table_->injection_patterns) {
        if (std::regex_search(haystack, p.pattern)) {
            return false;
        }
    }

    if (!original.empty() && sanitized.size() < original.size()) {
        const double removed = static_cast<double>(original.size() - sanitized.size()) /
                               static_cast<double>(original.size());
        if (removed > config_.max_removal_ratio) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// Stages
// ============================================================================

std::string InputSanitizer::normalize_unicode(std::string_view text,
                                              SanitizationResult& result) const {
    auto normalized = unicode::normalize_nfc(text);
    if (!normalized) {
        result.removed_descriptions.emplace_back(
            "Input is not valid UTF-8; Unicode normalization skipped");
        result.flagged = true;
        add_reason(result, "Malformed UTF-8 input");
        return std::string(text);
    }
    return std::move(*normalized);
}

std::string InputSanitizer::strip_invisible(std::string_view text,
                                            SanitizationResult& result) const {
    std::map<int32_t, size_t> stripped;
    size_t spaces = 0;

    std::string out;
    out.reserve(text.size());

    unicode::for_each_code_point(text, [&](int32_t cp, std::string_view bytes) {
        if (cp >= 0 && find_invisible(cp) != nullptr) {
            ++stripped[cp];
            return;
        }
        if (cp >= 0 && is_odd_space(cp)) {
            ++spaces;
            out.push_back(' ');
            return;
        }
        out.append(bytes);
    });

    if (stripped.empty() && spaces == 0) {
        return out;
    }

    for (const auto& c : kInvisibleCategories) {
        const auto it = stripped.find(c.code_point);
        if (it == stripped.end()) continue;
        result.removed_descriptions.push_back(
            std::format("{} removed: {} occurrence(s)", c.name, it->second));
    }
    if (spaces > 0) {
        result.removed_descriptions.push_back(std::format(
            "Non-breaking or typographic space normalized: {} occurrence(s)", spaces));
    }

    result.flagged = true;
    add_reason(result, "Hidden text detected");
    return out;
}

void InputSanitizer::check_hidden_styles(const std::string& text,
                                         SanitizationResult& result) const {
    bool found = false;
    for (const auto& style : table_->hiding_styles) {
        std::smatch m;
        if (std::regex_search(text, m, style)) {
            result.removed_descriptions.push_back(
                std::format("Potential color-based hiding pattern detected: {}", m.str(0)));
            found = true;
        }
    }
    if (found) {
        result.flagged = true;
        add_reason(result, "Hidden text detected");
    }
}

std::string InputSanitizer::redact_injections(std::string text,
                                              SanitizationResult& result) const {
    bool found = false;

    for (const auto& p : table_->injection_patterns) {
        // Distinct match texts for this pattern, in first-seen order
        std::vector<std::pair<std::string, size_t>> matches;
        for (auto it = std::sregex_iterator(text.begin(), text.end(), p.pattern);
             it != std::sregex_iterator(); ++it) {
            const std::string matched = it->str(0);
            auto existing = std::find_if(matches.begin(), matches.end(),
                [&matched](const auto& entry) { return entry.first == matched; });
            if (existing == matches.end()) {
                matches.emplace_back(matched, 1);
            } else {
                ++existing->second;
            }
        }
        if (matches.empty()) continue;

        for (const auto& [matched, count] : matches) {
            result.removed_descriptions.push_back(count == 1
                ? std::format("Prompt injection pattern removed: {} ({})", matched, p.technique)
                : std::format("Prompt injection pattern removed: {} ({}, {} occurrences)",
                              matched, p.technique, count));
        }
        text = std::regex_replace(text, p.pattern, config_.redaction_token);
        found = true;
    }

    if (found) {
        result.flagged = true;
        add_reason(result, "Prompt injection keywords detected");
    }
    return text;
}

void InputSanitizer::check_instruction_density(const std::string& text,
                                               SanitizationResult& result) const {
    size_t total = 0;
    size_t instructional = 0;

    size_t pos = 0;
    while (pos < text.size()) {
        while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;
        const size_t start = pos;
        while (pos < text.size() && !std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;
        if (pos == start) break;

        ++total;
        const std::string word = strip_to_alpha_lower(
            std::string_view(text).substr(start, pos - start));
        if (!word.empty() && table_->instructional_words.contains(word)) {
            ++instructional;
        }
    }

    if (total < config_.min_words_for_density) {
        return;
    }

    const double ratio = static_cast<double>(instructional) / static_cast<double>(total);
    if (ratio > config_.instruction_density_threshold) {
        result.flagged = true;
        result.removed_descriptions.push_back(std::format(
            "Excessive instructional content: {:.1f}% of {} words", ratio * 100.0, total));
        add_reason(result, "Excessive instructional content");
    }
}

std::string InputSanitizer::collapse_whitespace(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    size_t pending_newlines = 0;
    bool pending_space = false;

    for (const char c : text) {
        if (c == '\r') continue;
        if (c == '\n') {
            ++pending_newlines;
            pending_space = false;      // drop trailing blanks on the line
            continue;
        }
        if (c == ' ' || c == '\t' || c == '\f' || c == '\v') {
            if (pending_newlines == 0) pending_space = true;
            continue;
        }

        if (!out.empty()) {
            if (pending_newlines > 0) {
                out.append(std::min<size_t>(pending_newlines, 2), '\n');
            } else if (pending_space) {
                out.push_back(' ');
            }
        }
        pending_newlines = 0;
        pending_space = false;
        out.push_back(c);
    }
    return out;
}

void InputSanitizer::add_reason(SanitizationResult& result, std::string_view reason) {
    if (result.reason.find(reason) != std::string::npos) {
        return;
    }
    if (!result.reason.empty()) {
        result.reason += "; ";
    }
    result.reason += reason;
}

} // namespace docgate
