#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <memory>
#include <regex>
#include <string>
#include <vector>

namespace docgate {

/**
 * @brief How a pattern finds candidate spans.
 *
 * std::regex recurses once per repeated character, so a pattern of
 * unbounded length over a large token exhausts the stack. ALNUM_RUN
 * patterns are matched by a linear scan instead; the regex is kept for
 * listing only.
 */
enum class MatchStrategy : uint8_t {
    REGEX,
    ALNUM_RUN       // whole [A-Za-z0-9] words of at least min_length bytes
};

/**
 * @brief Uncompiled pattern definition (built-in table or [[scanner.custom_patterns]])
 */
struct SecretPatternDef {
    std::string pattern;
    std::string type;
    SeverityClass severity = SeverityClass::HIGH;
    std::string description;
    bool case_insensitive = false;
    MatchStrategy strategy = MatchStrategy::REGEX;
    size_t min_length = 0;
};

struct SecretPattern {
    std::string type;
    std::string source;
    std::regex regex;
    SeverityClass severity = SeverityClass::HIGH;
    std::string description;
    MatchStrategy strategy = MatchStrategy::REGEX;
    size_t min_length = 0;
};

/**
 * @brief Ordered, immutable set of compiled secret patterns.
 *
 * Built once and shared between scanners as shared_ptr<const>. Order is
 * significant: it breaks ties when two equal-length matches start at the
 * same offset.
 */
class SecretPatternRegistry {
public:
    struct Statistics {
        size_t total = 0;
        size_t critical = 0;
        size_t high = 0;
        size_t medium = 0;
    };

    explicit SecretPatternRegistry(std::vector<SecretPattern> patterns);

    /// Built-in provider, key block, connection string and generic patterns.
    [[nodiscard]] static std::shared_ptr<const SecretPatternRegistry> defaults();

    /**
     * @brief Built-in table followed by custom definitions.
     * @return error (VALIDATION_ERROR) naming the first definition whose
     *         regex does not compile
     */
    [[nodiscard]] static Result<std::shared_ptr<const SecretPatternRegistry>> with_custom(
        const std::vector<SecretPatternDef>& custom);

    [[nodiscard]] static Result<SecretPattern> compile(const SecretPatternDef& def);

    [[nodiscard]] static const std::vector<SecretPatternDef>& builtin_definitions();

    [[nodiscard]] const std::vector<SecretPattern>& patterns() const { return patterns_; }
    [[nodiscard]] size_t size() const { return patterns_.size(); }
    [[nodiscard]] Statistics statistics() const;

private:
    std::vector<SecretPattern> patterns_;
};

} // namespace docgate
