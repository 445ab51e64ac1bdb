#pragma once

#include "core/types.hpp"
#include "scanner/secret_pattern.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace docgate {

/**
 * @brief Registry-driven secret detector and redactor.
 *
 * Every registry pattern is run over the full text. Surviving matches are
 * resolved for overlap, then replaced back-to-front with
 * "[REDACTED: <TYPE>]" so earlier offsets stay valid.
 *
 * Overlapping or touching matches are merged into one span covering
 * their union, so no part of any surviving match is left in clear. The
 * span takes the type and severity of its most severe member (ties:
 * earliest start, then the longer match, then registry order). The
 * number of reported secrets always equals the number of markers in the
 * output.
 */
class SecretScanner {
public:
    struct Config {
        double entropy_threshold = 3.0;     // bits/char, below => suppressed
        size_t url_window = 100;            // bytes before a match searched for a URL scheme
        size_t placeholder_window = 100;    // radius searched for placeholder words
        std::vector<std::string> placeholder_words = {
            "example", "placeholder", "test", "dummy", "fake"};
    };

    struct ScanOptions {
        bool skip_false_positives = true;
        size_t context_length = 50;         // excerpt radius in bytes
    };

    SecretScanner() : SecretScanner(Config{}) {}
    explicit SecretScanner(const Config& config,
                           std::shared_ptr<const SecretPatternRegistry> registry =
                               SecretPatternRegistry::defaults());

    [[nodiscard]] ScanResult scan(std::string_view text) const { return scan(text, ScanOptions{}); }
    [[nodiscard]] ScanResult scan(std::string_view text, const ScanOptions& options) const;

    /// Shannon entropy in bits per byte. 0.0 for empty input.
    [[nodiscard]] static double shannon_entropy(std::string_view value);

    [[nodiscard]] static std::string redaction_marker(std::string_view type);

    [[nodiscard]] SecretPatternRegistry::Statistics statistics() const {
        return registry_->statistics();
    }

    [[nodiscard]] const SecretPatternRegistry& registry() const { return *registry_; }
    [[nodiscard]] const Config& config() const { return config_; }

private:
    struct Candidate {
        size_t offset;
        size_t length;
        size_t pattern_index;
    };

    [[nodiscard]] bool is_false_positive(const SecretPattern& pattern, std::string_view value,
                                         std::string_view text, size_t offset) const;
    [[nodiscard]] bool is_in_url(std::string_view text, size_t offset) const;
    [[nodiscard]] bool near_placeholder(std::string_view text, size_t offset, size_t length) const;

    static std::vector<Candidate> resolve_overlaps(std::vector<Candidate> candidates,
                                                   const std::vector<SecretPattern>& patterns);
    static std::string excerpt(std::string_view text, size_t offset, size_t length, size_t radius);

    Config config_;
    std::shared_ptr<const SecretPatternRegistry> registry_;
};

} // namespace docgate
