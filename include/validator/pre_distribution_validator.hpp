#pragma once

#include "core/types.hpp"
#include "scanner/secret_scanner.hpp"
#include "validator/keyword_policy.hpp"
#include "validator/review_queue.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace docgate {

class SecurityEventEmitter;

/**
 * @brief Terminal gate before content leaves the system
 *
 * Always re-scans for secrets, whatever earlier stages reported, then
 * applies the keyword policy. Any secret or blocking keyword is a hard
 * stop: validate() throws SecurityException carrying the full result.
 * Warnings alone only matter in strict mode, where they send the item to
 * manual review and return valid == false.
 *
 * Invariant: valid == false implies !blocking_reasons.empty().
 */
class PreDistributionValidator {
public:
    struct Options {
        bool strict_mode = false;
        bool allow_warnings = false;
    };

    struct Statistics {
        size_t total_keyword_rules = 0;
        size_t blocking_rules = 0;
        size_t warning_rules = 0;
    };

    static constexpr size_t kScanContextLength = 100;

    explicit PreDistributionValidator(SecretScanner scanner,
                                      std::shared_ptr<const KeywordPolicy> policy = KeywordPolicy::defaults(),
                                      std::shared_ptr<IReviewQueue> review_queue = nullptr,
                                      std::shared_ptr<SecurityEventEmitter> events = nullptr);

    /**
     * @brief Full gate: alerts, review flags and security events.
     * @throws SecurityException on any secret or blocking keyword
     */
    ValidationResult validate(std::string_view content,
                              const DistributionMetadata& metadata,
                              const Options& options) const;

    ValidationResult validate(std::string_view content, const DistributionMetadata& metadata) const {
        return validate(content, metadata, Options{});
    }

    /// Same decision as validate(), with no side effects and no throw.
    [[nodiscard]] ValidationResult evaluate(std::string_view content, const Options& options) const;

    [[nodiscard]] ValidationResult evaluate(std::string_view content) const {
        return evaluate(content, Options{});
    }

    [[nodiscard]] Statistics statistics() const;

    /// Human-readable alert for the security team. Contains types and offsets, never values.
    [[nodiscard]] static std::string format_secret_alert(const DistributionMetadata& metadata,
                                                         size_t content_length,
                                                         const ScanResult& scan);

private:
    enum class Outcome { PASS, REVIEW, BLOCK };

    struct Decision {
        ValidationResult result;
        Outcome outcome = Outcome::PASS;
    };

    [[nodiscard]] Decision decide(std::string_view content, const Options& options) const;

    void raise_secret_alert(const DistributionMetadata& metadata, size_t content_length,
                            const ScanResult& scan) const;
    void flag_for_review(const DistributionMetadata& metadata, size_t content_length,
                         const ScanResult& scan, const std::string& reason) const;

    SecretScanner scanner_;
    std::shared_ptr<const KeywordPolicy> policy_;
    std::shared_ptr<IReviewQueue> review_queue_;
    std::shared_ptr<SecurityEventEmitter> events_;
};

} // namespace docgate
