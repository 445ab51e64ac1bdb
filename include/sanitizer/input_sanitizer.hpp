#pragma once

#include "core/types.hpp"

#include <memory>
#include <regex>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace docgate {

/**
 * @brief First-contact defense for externally sourced text.
 *
 * Stages, in order:
 * 1. Unicode NFC normalization
 * 2. Invisible / zero-width code point removal, odd spaces collapsed
 * 3. Style-based hiding markup (flag only)
 * 4. Whitespace collapse
 * 5. Instructional vocabulary density
 * 6. Instruction-override phrase redaction
 *
 * Stateless: the phrase table is immutable and shared, so one instance
 * may be used from any number of threads.
 */
class InputSanitizer {
public:
    struct InjectionPattern {
        std::string technique;      // e.g. "role reassignment"
        std::regex pattern;
    };

    struct PhraseTable {
        std::vector<InjectionPattern> injection_patterns;
        std::vector<std::regex> hiding_styles;
        std::unordered_set<std::string> instructional_words;
    };

    struct Config {
        double instruction_density_threshold = 0.10;
        size_t min_words_for_density = 20;
        double max_removal_ratio = 0.90;
        std::string redaction_token = "[REDACTED]";
    };

    InputSanitizer() : InputSanitizer(Config{}) {}
    explicit InputSanitizer(const Config& config,
                            std::shared_ptr<const PhraseTable> table = default_phrase_table());

    /// Never throws; malformed UTF-8 is passed through unnormalized and flagged.
    [[nodiscard]] SanitizationResult sanitize(std::string_view text) const;

    /**
     * @brief Check a sanitization outcome.
     * @return false if a known-bad phrase survives in @p sanitized, or more
     *         than max_removal_ratio of @p original was removed.
     */
    [[nodiscard]] bool validate(std::string_view original, std::string_view sanitized) const;

    [[nodiscard]] static std::shared_ptr<const PhraseTable> default_phrase_table();

    [[nodiscard]] const Config& config() const { return config_; }

private:
    std::string normalize_unicode(std::string_view text, SanitizationResult& result) const;
    std::string strip_invisible(std::string_view text, SanitizationResult& result) const;
    void check_hidden_styles(const std::string& text, SanitizationResult& result) const;
    std::string redact_injections(std::string text, SanitizationResult& result) const;
    void check_instruction_density(const std::string& text, SanitizationResult& result) const;

    static std::string collapse_whitespace(std::string_view text);
    static void add_reason(SanitizationResult& result, std::string_view reason);

    Config config_;
    std::shared_ptr<const PhraseTable> table_;
};

} // namespace docgate
