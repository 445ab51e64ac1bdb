#include "validator/keyword_policy.hpp"

#include <format>
#include <utility>

namespace docgate {

namespace {

KeywordRule rule(const char* keyword, const char* pattern, KeywordAction action,
                 const char* description) {
    return KeywordRule{
        .keyword = keyword,
        .pattern = std::regex(pattern, std::regex::ECMAScript | std::regex::icase),
        .action = action,
        .description = description,
    };
}

} // anonymous namespace

KeywordPolicy::KeywordPolicy(std::vector<KeywordRule> rules)
    : rules_(std::move(rules)) {}

std::shared_ptr<const KeywordPolicy> KeywordPolicy::defaults() {
    static const std::shared_ptr<const KeywordPolicy> policy = [] {
        using enum KeywordAction;
        std::vector<KeywordRule> rules;
        rules.push_back(rule("password", R"(password\s{0,16}[:=])", BLOCK, "Password assignment detected"));
        rules.push_back(rule("private key", R"(private\s{1,16}key)", BLOCK, "Private key reference"));
        rules.push_back(rule("secret", R"(secret\s{0,16}[:=])", BLOCK, "Secret assignment detected"));
        rules.push_back(rule("api_key", R"(api[_\-]?key\s{0,16}[:=])", BLOCK, "API key assignment detected"));
        rules.push_back(rule("token", R"(token\s{0,16}[:=])", BLOCK, "Token assignment detected"));
        rules.push_back(rule("credential", R"(credential)", BLOCK, "Credential reference"));

        rules.push_back(rule("confidential", R"(confidential)", WARN,
                             "Confidential information reference"));
        rules.push_back(rule("internal only", R"(internal\s{1,16}only)", WARN, "Internal only designation"));
        rules.push_back(rule("do not share", R"(do\s{1,16}not\s{1,16}share)", WARN, "Explicit no-share instruction"));
        rules.push_back(rule("proprietary", R"(proprietary)", WARN, "Proprietary information reference"));
        return std::make_shared<const KeywordPolicy>(std::move(rules));
    }();
    return policy;
}

std::vector<KeywordMatch> KeywordPolicy::evaluate(const std::string& content) const {
    std::vector<KeywordMatch> matches;
    for (const auto& r : rules_) {
        if (std::regex_search(content, r.pattern)) {
            matches.push_back(KeywordMatch{
                .rule = &r,
                .message = std::format("Sensitive keyword detected: \"{}\" - {}", r.keyword, r.description),
            });
        }
    }
    return matches;
}

KeywordPolicy::Statistics KeywordPolicy::statistics() const {
    Statistics stats;
    stats.total = rules_.size();
    for (const auto& r : rules_) {
        if (r.action == KeywordAction::BLOCK) {
            ++stats.blocking;
        } else {
            ++stats.warning;
        }
    }
    return stats;
}

} // namespace docgate
