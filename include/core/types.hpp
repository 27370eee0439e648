#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace aegis {

// ============================================================================
// Well-known threat labels
// ============================================================================

inline constexpr std::string_view kSecurityServiceError = "security_service_error";
inline constexpr std::string_view kInputTooLong = "input_too_long";
inline constexpr std::string_view kClassifierFlagged = "classifier_flagged";   // Unsafe verdict without labels

// ============================================================================
// Source Type
// ============================================================================

enum class SourceType : uint8_t {
    UNKNOWN,
    CHAT,
    EMAIL,
    CRM,
    FILE,
    API,
    TEST
};

[[nodiscard]] inline const char* source_type_to_string(SourceType st) {
    switch (st) {
        case SourceType::CHAT:  return "chat";
        case SourceType::EMAIL: return "email";
        case SourceType::CRM:   return "crm";
        case SourceType::FILE:  return "file";
        case SourceType::API:   return "api";
        case SourceType::TEST:  return "test";
        default:                return "unknown";
    }
}

/**
 * @brief Parse a caller-supplied source type (case-insensitive).
 * Unrecognized values map to UNKNOWN rather than failing the request.
 */
[[nodiscard]] SourceType parse_source_type(std::string_view str);

// ============================================================================
// Severity (ordered: a higher value is more severe)
// ============================================================================

enum class Severity : uint8_t {
    LOW = 1,
    MEDIUM = 2,
    HIGH = 3,
    CRITICAL = 4
};

[[nodiscard]] inline const char* severity_to_string(Severity s) {
    switch (s) {
        case Severity::LOW:      return "low";
        case Severity::MEDIUM:   return "medium";
        case Severity::HIGH:     return "high";
        case Severity::CRITICAL: return "critical";
        default:                 return "unknown";
    }
}

/// "low" | "medium" | "high" | "critical" (case-insensitive)
[[nodiscard]] std::optional<Severity> parse_severity(std::string_view str);

// Default rule weight for a severity when the rule does not set one
[[nodiscard]] inline constexpr double default_severity_weight(Severity s) {
    switch (s) {
        case Severity::LOW:      return 0.5;
        case Severity::MEDIUM:   return 0.7;
        case Severity::HIGH:     return 0.9;
        case Severity::CRITICAL: return 0.95;
    }
    return 0.9;
}

// ============================================================================
// Request / Match / Verdict / Result
// ============================================================================

/**
 * @brief One content-inspection request. Immutable once created.
 */
class AnalysisRequest {
public:
    AnalysisRequest(std::string content, SourceType source_type)
        : content_(std::move(content)), source_type_(source_type) {}

    [[nodiscard]] const std::string& content() const { return content_; }
    [[nodiscard]] SourceType source_type() const { return source_type_; }

private:
    std::string content_;
    SourceType source_type_;
};

/**
 * @brief Byte range inside the analyzed content.
 */
struct Span {
    size_t offset = 0;
    size_t length = 0;

    [[nodiscard]] size_t end() const { return offset + length; }
    bool operator==(const Span&) const = default;
};

/**
 * @brief A rule that fired on a specific span of the input.
 */
struct RuleMatch {
    std::string rule_name;
    Span matched_span;
    Severity severity = Severity::HIGH;
    double weight = 0.9;
};

/**
 * @brief Output of the secondary classifier (only when it was invoked).
 */
struct ClassifierVerdict {
    bool is_safe = true;
    std::vector<std::string> threat_labels;   // Normalized, de-duplicated
    double raw_confidence = 0.0;              // [0,1], confidence in is_safe
};

/**
 * @brief Which terminal path produced a verdict.
 */
enum class DecisionPath : uint8_t {
    INPUT_REJECTED,     // Content exceeded max_input_length
    RULE_BLOCK,         // strict_mode and at least one rule matched
    RULES_ONLY,         // Classifier disabled; verdict from rules alone
    CLASSIFIER,         // Rules + classifier combined
    CLASSIFIER_ERROR,   // Classifier failed, fail-closed applied
    CLASSIFIER_DEGRADED // Classifier failed, fail-open applied (rules only)
};

[[nodiscard]] inline const char* decision_path_to_string(DecisionPath p) {
    switch (p) {
        case DecisionPath::INPUT_REJECTED:      return "input_rejected";
        case DecisionPath::RULE_BLOCK:          return "rule_block";
        case DecisionPath::RULES_ONLY:          return "rules_only";
        case DecisionPath::CLASSIFIER:          return "classifier";
        case DecisionPath::CLASSIFIER_ERROR:    return "classifier_error";
        case DecisionPath::CLASSIFIER_DEGRADED: return "classifier_degraded";
        default:                                return "unknown";
    }
}

/**
 * @brief Final verdict returned to the caller.
 *
 * If is_safe is false, sanitized_content is empty or a subset of the
 * original with every flagged span removed.
 */
struct AnalysisResult {
    bool is_safe = false;
    std::string sanitized_content;
    double confidence_score = 0.0;
    std::vector<std::string> detected_threats;
    double processing_time = 0.0;   // seconds

    DecisionPath path = DecisionPath::RULES_ONLY;
    bool classifier_invoked = false;
};

/**
 * @brief Verdict used when the security service itself failed.
 */
[[nodiscard]] inline AnalysisResult make_service_error_result() {
    AnalysisResult r;
    r.is_safe = false;
    r.confidence_score = 0.0;
    r.detected_threats.emplace_back(kSecurityServiceError);
    r.processing_time = 0.0;
    r.path = DecisionPath::CLASSIFIER_ERROR;
    return r;
}

} // namespace aegis
