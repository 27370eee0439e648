#pragma once

#include "core/types.hpp"
#include "detection/sanitizer.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace aegis {

class CancellationToken;
class ISecondaryClassifier;
class MetricsRecorder;
class RuleEngine;

enum class CombinationMode : uint8_t {
    MIN,        // min(rule confidence, classifier confidence)
    WEIGHTED    // weighted mean with rule_weight / classifier_weight
};

[[nodiscard]] inline const char* combination_mode_to_string(CombinationMode m) {
    switch (m) {
        case CombinationMode::MIN:      return "min";
        case CombinationMode::WEIGHTED: return "weighted";
        default:                        return "unknown";
    }
}

[[nodiscard]] std::optional<CombinationMode> parse_combination_mode(std::string_view name);

/**
 * @brief Components the aggregator orchestrates. The classifier may be null
 * (disabled); every other member is required.
 */
struct AggregatorComponents {
    std::shared_ptr<const RuleEngine> rule_engine;
    std::shared_ptr<ISecondaryClassifier> classifier;
    std::shared_ptr<const Sanitizer> sanitizer;
    std::shared_ptr<MetricsRecorder> metrics;
};

/**
 * @brief Per-request decision state machine.
 *
 *   INIT ─ length check ─► (too long) UNSAFE
 *     └─► RULES_EVALUATED
 *           ├─ strict_mode && matches ───────────► UNSAFE  (classifier skipped)
 *           ├─ no matches && (no classifier or empty) ─► SAFE
 *           ├─ matches && no classifier ────────► UNSAFE  (rules only)
 *           └─► CLASSIFYING
 *                 ├─ ok ──► SAFE iff no matches && verdict safe
 *                 └─ failed ─► fail_closed ? UNSAFE (security_service_error, 0.0)
 *                                          : rules-only verdict
 *
 * Each request reaches exactly one terminal state; processing_time is
 * measured and the result is recorded in metrics on every path.
 */
class DecisionAggregator {
public:
    struct Config {
        bool strict_mode = true;
        bool fail_closed = true;
        CombinationMode combination = CombinationMode::MIN;
        double rule_weight = 0.5;
        double classifier_weight = 0.5;
        double clean_rule_confidence = 0.9;
        size_t max_input_length = 10000;
    };

    /// std::regex matching recurses per character; longer inputs risk the stack
    static constexpr size_t kMaxInputLengthLimit = 16384;

    /**
     * @throws ConfigError if a required component is missing, a weight or
     *         confidence is outside [0,1], or both weights are zero
     */
    DecisionAggregator(AggregatorComponents components, Config config);

    [[nodiscard]] AnalysisResult analyze(const AnalysisRequest& request,
                                         const CancellationToken* cancel = nullptr);

    /**
     * @brief Combine the two confidences in the final verdict.
     * @return value in [0,1]
     */
    [[nodiscard]] static double combine_confidence(const Config& config,
                                                   double rule_confidence,
                                                   double classifier_confidence);

    [[nodiscard]] const Config& config() const { return config_; }
    [[nodiscard]] bool classifier_enabled() const { return c_.classifier != nullptr; }

private:
    enum class State : uint8_t { INIT, RULES_EVALUATED, CLASSIFYING, SAFE, UNSAFE };

    struct Context {
        const AnalysisRequest& request;
        const CancellationToken* cancel = nullptr;
        State state = State::INIT;
        std::vector<RuleMatch> matches;
        std::vector<std::string> rule_labels;   // Unique rule names, in match order
        double max_rule_weight = 0.0;
        bool whole_input_flagged = false;       // Classifier said unsafe
        AnalysisResult result;
    };

    void evaluate_rules(Context& ctx) const;
    void decide_without_classifier(Context& ctx, DecisionPath path) const;
    void decide_with_classifier(Context& ctx);
    void finish(Context& ctx, bool is_safe) const;

    AggregatorComponents c_;
    Config config_;
};

} // namespace aegis
