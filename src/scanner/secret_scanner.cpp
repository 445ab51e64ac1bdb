#include "scanner/secret_scanner.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <format>
#include <regex>
#include <utility>

namespace docgate {

namespace {

using SvIterator = std::regex_iterator<std::string_view::const_iterator>;

constexpr std::string_view kLongAlphanumeric = "LONG_ALPHANUMERIC_STRING";

bool is_hex(std::string_view value) {
    return !value.empty() && std::all_of(value.begin(), value.end(), [](char c) {
        return std::isxdigit(static_cast<unsigned char>(c)) != 0;
    });
}

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool is_utf8_continuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

template<typename Fn>
void for_each_match(const SecretPattern& pattern, std::string_view text, Fn&& fn) {
    if (pattern.strategy == MatchStrategy::ALNUM_RUN) {
        // Same boundaries as \b[a-zA-Z0-9]{n,}\b: the enclosing word run
        // must be all alphanumeric, so an underscore anywhere disqualifies it
        size_t pos = 0;
        while (pos < text.size()) {
            if (!is_word_char(text[pos])) {
                ++pos;
                continue;
            }
            const size_t start = pos;
            bool underscore = false;
            while (pos < text.size() && is_word_char(text[pos])) {
                underscore = underscore || text[pos] == '_';
                ++pos;
            }
            if (!underscore && pos - start >= pattern.min_length) {
                fn(start, pos - start);
            }
        }
        return;
    }

    for (SvIterator it(text.begin(), text.end(), pattern.regex), end; it != end; ++it) {
        const auto& m = *it;
        if (m.length(0) == 0) continue;
        fn(static_cast<size_t>(m.position(0)), static_cast<size_t>(m.length(0)));
    }
}

} // anonymous namespace

SecretScanner::SecretScanner(const Config& config,
                             std::shared_ptr<const SecretPatternRegistry> registry)
    : config_(config),
      registry_(registry ? std::move(registry) : SecretPatternRegistry::defaults()) {}

std::string SecretScanner::redaction_marker(std::string_view type) {
    return std::format("[REDACTED: {}]", type);
}

// ============================================================================
// Scan
// ============================================================================

ScanResult SecretScanner::scan(std::string_view text, const ScanOptions& options) const {
    const auto& patterns = registry_->patterns();

    std::vector<Candidate> candidates;
    for (size_t i = 0; i < patterns.size(); ++i) {
        const auto& pattern = patterns[i];
        for_each_match(pattern, text, [&](size_t offset, size_t length) {
            if (options.skip_false_positives &&
                is_false_positive(pattern, text.substr(offset, length), text, offset)) {
                utils::log::debug(std::format("Suppressed likely false positive: {} at {}",
                    pattern.type, offset));
                return;
            }
            candidates.push_back({offset, length, i});
        });
    }

    const auto kept = resolve_overlaps(std::move(candidates), patterns);

    ScanResult result;
    result.secrets.reserve(kept.size());
    for (const auto& c : kept) {
        const auto& pattern = patterns[c.pattern_index];
        result.secrets.push_back(DetectedSecret{
            .type = pattern.type,
            .matched_text = std::string(text.substr(c.offset, c.length)),
            .offset = c.offset,
            .severity = pattern.severity,
            .surrounding_excerpt = excerpt(text, c.offset, c.length, options.context_length),
        });
        if (pattern.severity == SeverityClass::CRITICAL) {
            ++result.critical_count;
        }
        utils::log::warn(std::format("Secret detected: {} ({}) at offset {}",
            pattern.type, severity_to_string(pattern.severity), c.offset));
    }

    // Merged spans are disjoint and sorted ascending; splice back-to-front
    std::string redacted(text);
    for (auto it = kept.rbegin(); it != kept.rend(); ++it) {
        redacted.replace(it->offset, it->length,
                         redaction_marker(patterns[it->pattern_index].type));
    }

    result.redacted_text = std::move(redacted);
    result.total_count = result.secrets.size();
    result.has_secrets = !result.secrets.empty();

    if (result.has_secrets) {
        utils::log::info(std::format("Scan complete: {} secret(s) found ({} critical)",
            result.total_count, result.critical_count));
    }
    return result;
}

std::vector<SecretScanner::Candidate> SecretScanner::resolve_overlaps(
    std::vector<Candidate> candidates, const std::vector<SecretPattern>& patterns) {

    std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
        if (a.offset != b.offset) return a.offset < b.offset;
        if (a.length != b.length) return a.length > b.length;
        return a.pattern_index < b.pattern_index;
    });

    // Overlapping or touching candidates collapse into their union. The span
    // reports the most severe member; among equals, the first in sorted order.
    std::vector<Candidate> merged;
    size_t merged_end = 0;
    for (const auto& c : candidates) {
        if (merged.empty() || c.offset > merged_end) {
            merged.push_back(c);
            merged_end = c.offset + c.length;
            continue;
        }
        auto& span = merged.back();
        merged_end = std::max(merged_end, c.offset + c.length);
        span.length = merged_end - span.offset;
        if (patterns[c.pattern_index].severity > patterns[span.pattern_index].severity) {
            span.pattern_index = c.pattern_index;
        }
    }
    return merged;
}

// ============================================================================
// False-positive heuristics
// ============================================================================

bool SecretScanner::is_false_positive(const SecretPattern& pattern, std::string_view value,
                                      std::string_view text, size_t offset) const {
    if (pattern.type == kLongAlphanumeric) {
        // Commit hashes and content digests
        if (is_hex(value)) return true;
        if (is_in_url(text, offset)) return true;
        if (shannon_entropy(value) < config_.entropy_threshold) return true;
    }

    if (pattern.type.find("GENERIC") != std::string::npos) {
        if (near_placeholder(text, offset, value.size())) return true;
    }

    return false;
}

bool SecretScanner::is_in_url(std::string_view text, size_t offset) const {
    const size_t start = offset > config_.url_window ? offset - config_.url_window : 0;
    const std::string_view before = text.substr(start, offset - start);
    return before.find("http://") != std::string_view::npos ||
           before.find("https://") != std::string_view::npos;
}

bool SecretScanner::near_placeholder(std::string_view text, size_t offset, size_t length) const {
    const size_t start = offset > config_.placeholder_window ? offset - config_.placeholder_window : 0;
    const size_t end = std::min(text.size(), offset + length + config_.placeholder_window);
    const std::string window = utils::to_lower(text.substr(start, end - start));

    return std::any_of(config_.placeholder_words.begin(), config_.placeholder_words.end(),
        [&window](const std::string& word) { return window.find(word) != std::string::npos; });
}

double SecretScanner::shannon_entropy(std::string_view value) {
    if (value.empty()) return 0.0;

    std::array<size_t, 256> counts{};
    for (const char c : value) {
        ++counts[static_cast<unsigned char>(c)];
    }

    const auto n = static_cast<double>(value.size());
    double entropy = 0.0;
    for (const size_t count : counts) {
        if (count == 0) continue;
        const double p = static_cast<double>(count) / n;
        entropy -= p * std::log2(p);
    }
    return entropy;
}

std::string SecretScanner::excerpt(std::string_view text, size_t offset, size_t length,
                                   size_t radius) {
    size_t start = offset > radius ? offset - radius : 0;
    size_t end = std::min(text.size(), offset + length + radius);

    // Keep the excerpt on code point boundaries
    while (start > 0 && start < text.size() && is_utf8_continuation(text[start])) --start;
    while (end < text.size() && is_utf8_continuation(text[end])) ++end;

    std::string out;
    if (start > 0) out += "...";
    out.append(text.substr(start, end - start));
    if (end < text.size()) out += "...";
    return out;
}

} // namespace docgate
