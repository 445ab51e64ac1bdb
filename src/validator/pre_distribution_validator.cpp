#include "validator/pre_distribution_validator.hpp"
#include "audit/security_event_emitter.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <utility>

namespace docgate {

namespace {

std::vector<std::string> distinct_types(const ScanResult& scan) {
    std::vector<std::string> types;
    for (const auto& s : scan.secrets) {
        if (std::find(types.begin(), types.end(), s.type) == types.end()) {
            types.push_back(s.type);
        }
    }
    return types;
}

std::string or_na(const std::string& value) {
    return value.empty() ? "N/A" : value;
}

} // anonymous namespace

PreDistributionValidator::PreDistributionValidator(SecretScanner scanner,
                                                   std::shared_ptr<const KeywordPolicy> policy,
                                                   std::shared_ptr<IReviewQueue> review_queue,
                                                   std::shared_ptr<SecurityEventEmitter> events)
    : scanner_(std::move(scanner)),
      policy_(policy ? std::move(policy) : KeywordPolicy::defaults()),
      review_queue_(std::move(review_queue)),
      events_(std::move(events)) {}

// ============================================================================
// Decision
// ============================================================================

PreDistributionValidator::Decision PreDistributionValidator::decide(
    std::string_view content, const Options& options) const {

    Decision d;
    ValidationResult& r = d.result;

    // Secrets first; never downgraded by options
    r.scan_result = scanner_.scan(content, SecretScanner::ScanOptions{
        .skip_false_positives = true,
        .context_length = kScanContextLength,
    });
    if (r.scan_result.has_secrets) {
        r.errors.push_back(std::format("Secrets detected in content: {}",
            utils::join(distinct_types(r.scan_result), ", ")));
        r.blocking_reasons.push_back(std::format("Found {} secrets ({} critical)",
            r.scan_result.total_count, r.scan_result.critical_count));
    }

    for (const auto& match : policy_->evaluate(std::string(content))) {
        if (match.rule->action == KeywordAction::BLOCK) {
            r.errors.push_back(match.message);
            r.blocking_reasons.push_back(match.message);
        } else {
            r.warnings.push_back(match.message);
        }
    }

    if (!r.blocking_reasons.empty()) {
        r.valid = false;
        d.outcome = Outcome::BLOCK;
    } else if (!r.warnings.empty() && options.strict_mode && !options.allow_warnings) {
        r.valid = false;
        r.errors = {"Strict mode: Manual review required due to warnings"};
        r.blocking_reasons = {"Manual review required"};
        d.outcome = Outcome::REVIEW;
    } else {
        r.valid = true;
        d.outcome = Outcome::PASS;
    }
    return d;
}

ValidationResult PreDistributionValidator::evaluate(std::string_view content,
                                                    const Options& options) const {
    return decide(content, options).result;
}

ValidationResult PreDistributionValidator::validate(std::string_view content,
                                                    const DistributionMetadata& metadata,
                                                    const Options& options) const {
    utils::log::info(std::format("Pre-distribution validation: {} ({} bytes, strict={})",
        or_na(metadata.document_id), content.size(), utils::booltostr(options.strict_mode)));

    Decision d = decide(content, options);
    ValidationResult& r = d.result;

    if (r.scan_result.has_secrets) {
        raise_secret_alert(metadata, content.size(), r.scan_result);
    }

    switch (d.outcome) {
        case Outcome::BLOCK: {
            const std::string joined = utils::join(r.blocking_reasons, "; ");
            utils::log::error(std::format("Pre-distribution validation FAILED for {}: {}",
                or_na(metadata.document_id), joined));

            flag_for_review(metadata, content.size(), r.scan_result, utils::join(r.errors, "; "));

            if (events_) {
                SecurityEvent event;
                event.event_type = SecurityEventType::DISTRIBUTION_BLOCKED;
                event.severity = EventSeverity::CRITICAL;
                event.requesting_identity = metadata.requested_by;
                event.resource = metadata.document_id;
                event.detected_types = distinct_types(r.scan_result);
                for (const auto& reason : r.blocking_reasons) {
                    if (reason.starts_with("Sensitive keyword detected")) {
                        event.detected_types.push_back(reason);
                    }
                }
                event.details = joined;
                events_->emit(std::move(event));
            }

            throw SecurityException(
                std::format("Pre-distribution validation failed: {}", joined), std::move(r));
        }

        case Outcome::REVIEW: {
            utils::log::warn(std::format("Strict mode: {} held for manual review ({} warning(s))",
                or_na(metadata.document_id), r.warnings.size()));

            flag_for_review(metadata, content.size(), r.scan_result, utils::join(r.warnings, "; "));

            if (events_) {
                SecurityEvent event;
                event.event_type = SecurityEventType::MANUAL_REVIEW_REQUIRED;
                event.severity = EventSeverity::WARNING;
                event.requesting_identity = metadata.requested_by;
                event.resource = metadata.document_id;
                event.details = utils::join(r.warnings, "; ");
                events_->emit(std::move(event));
            }
            return r;
        }

        case Outcome::PASS:
            break;
    }

    if (!r.warnings.empty()) {
        utils::log::warn(std::format("Pre-distribution validation passed with {} warning(s): {}",
            r.warnings.size(), or_na(metadata.document_id)));
    } else {
        utils::log::info(std::format("Pre-distribution validation passed: {}",
            or_na(metadata.document_id)));
    }
    return r;
}

PreDistributionValidator::Statistics PreDistributionValidator::statistics() const {
    const auto stats = policy_->statistics();
    return Statistics{
        .total_keyword_rules = stats.total,
        .blocking_rules = stats.blocking,
        .warning_rules = stats.warning,
    };
}

// ============================================================================
// Alerting / review
// ============================================================================

std::string PreDistributionValidator::format_secret_alert(const DistributionMetadata& metadata,
                                                          size_t content_length,
                                                          const ScanResult& scan) {
    const std::string rule(72, '=');

    std::string body;
    body += "CRITICAL SECURITY ALERT\n\n";
    body += "Secrets detected in content scheduled for distribution.\n";
    body += "Distribution has been BLOCKED automatically.\n\n";

    body += rule + "\nDOCUMENT INFORMATION\n" + rule + "\n";
    body += std::format("  Document ID:    {}\n", or_na(metadata.document_id));
    body += std::format("  Document Name:  {}\n", or_na(metadata.document_name));
    body += std::format("  Author:         {}\n", or_na(metadata.author));
    body += std::format("  Target Channel: {}\n", or_na(metadata.channel));
    body += std::format("  Requested By:   {}\n", or_na(metadata.requested_by));
    body += std::format("  Content Length: {} bytes\n\n", content_length);

    body += rule + "\nSECRETS DETECTED\n" + rule + "\n";
    body += std::format("  Total Secrets:    {}\n", scan.total_count);
    body += std::format("  Critical Secrets: {}\n\n", scan.critical_count);
    for (const auto& s : scan.secrets) {
        body += std::format("  - {} ({}) at byte offset {}\n", s.type, severity_to_string(s.severity),
                            s.offset);
    }
    body += "\n";

    body += rule + "\nIMMEDIATE ACTIONS REQUIRED\n" + rule + "\n";
    body += "  1. Review the source document immediately\n";
    body += "  2. Identify why secrets were included in the document\n";
    body += "  3. Rotate any exposed credentials\n";
    body += "  4. Review other recent documents from the same author\n\n";

    body += "Distribution Status: BLOCKED\n";
    body += std::format("Timestamp: {}\n", utils::format_timestamp(utils::now()));
    return body;
}

void PreDistributionValidator::raise_secret_alert(const DistributionMetadata& metadata,
                                                  size_t content_length,
                                                  const ScanResult& scan) const {
    const std::string body = format_secret_alert(metadata, content_length, scan);
    utils::log::error(std::format("SECURITY ALERT: secrets detected in distribution content\n{}", body));

    if (!events_) return;

    SecurityEvent event;
    event.event_type = SecurityEventType::SECRET_DETECTION_BLOCKED;
    event.severity = EventSeverity::CRITICAL;
    event.requesting_identity = metadata.requested_by;
    event.resource = metadata.document_id;
    event.detected_types = distinct_types(scan);
    event.details = body;
    events_->emit(std::move(event));
}

void PreDistributionValidator::flag_for_review(const DistributionMetadata& metadata,
                                               size_t content_length,
                                               const ScanResult& scan,
                                               const std::string& reason) const {
    if (!review_queue_) {
        utils::log::warn(std::format("Manual review required for {} but no review queue is configured: {}",
            or_na(metadata.document_id), reason));
        return;
    }

    ReviewItem item;
    item.metadata = metadata;
    item.content_length = content_length;
    item.has_secrets = scan.has_secrets;
    item.secret_types = distinct_types(scan);

    if (!review_queue_->flag(item, reason)) {
        utils::log::error(std::format("Could not record review request for {}",
            or_na(metadata.document_id)));
    }
}

} // namespace docgate
