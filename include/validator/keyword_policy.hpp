#pragma once

#include <cstdint>
#include <memory>
#include <regex>
#include <string>
#include <vector>

namespace docgate {

enum class KeywordAction : uint8_t {
    WARN,
    BLOCK
};

inline const char* keyword_action_to_string(KeywordAction action) {
    switch (action) {
        case KeywordAction::WARN: return "WARN";
        case KeywordAction::BLOCK: return "BLOCK";
        default: return "UNKNOWN";
    }
}

struct KeywordRule {
    std::string keyword;        // display name, e.g. "api_key"
    std::regex pattern;         // case-insensitive
    KeywordAction action = KeywordAction::WARN;
    std::string description;
};

struct KeywordMatch {
    const KeywordRule* rule = nullptr;
    std::string message;        // Sensitive keyword detected: "<kw>" - <description>
};

/**
 * @brief Immutable blocking / warning keyword table for distribution gating
 */
class KeywordPolicy {
public:
    struct Statistics {
        size_t total = 0;
        size_t blocking = 0;
        size_t warning = 0;
    };

    explicit KeywordPolicy(std::vector<KeywordRule> rules);

    [[nodiscard]] static std::shared_ptr<const KeywordPolicy> defaults();

    /// Every rule that matches @p content at least once, in table order.
    [[nodiscard]] std::vector<KeywordMatch> evaluate(const std::string& content) const;

    [[nodiscard]] const std::vector<KeywordRule>& rules() const { return rules_; }
    [[nodiscard]] Statistics statistics() const;

private:
    std::vector<KeywordRule> rules_;
};

} // namespace docgate
