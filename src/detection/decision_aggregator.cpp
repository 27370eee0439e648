#include "detection/decision_aggregator.hpp"
#include "classifier/secondary_classifier.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "metrics/metrics_recorder.hpp"
#include "rules/rule_engine.hpp"

#include <algorithm>
#include <format>
#include <utility>

namespace aegis {

namespace {

void append_unique(std::vector<std::string>& labels, std::string_view label) {
    if (std::find(labels.begin(), labels.end(), label) == labels.end()) {
        labels.emplace_back(label);
    }
}

bool in_unit_range(double v) { return v >= 0.0 && v <= 1.0; }

} // anonymous namespace

std::optional<CombinationMode> parse_combination_mode(std::string_view name) {
    const std::string lower = utils::to_lower(name);
    if (lower == "min") return CombinationMode::MIN;
    if (lower == "weighted") return CombinationMode::WEIGHTED;
    return std::nullopt;
}

// ============================================================================
// Construction
// ============================================================================

DecisionAggregator::DecisionAggregator(AggregatorComponents components, Config config)
    : c_(std::move(components)), config_(config) {
    if (!c_.rule_engine) {
        throw ConfigError("Decision aggregator requires a rule engine");
    }
    if (!c_.sanitizer) {
        throw ConfigError("Decision aggregator requires a sanitizer");
    }
    if (!c_.metrics) {
        throw ConfigError("Decision aggregator requires a metrics recorder");
    }
    if (!in_unit_range(config_.rule_weight) || !in_unit_range(config_.classifier_weight)) {
        throw ConfigError("Aggregator weights must be in [0,1]");
    }
    if (config_.rule_weight + config_.classifier_weight <= 0.0) {
        throw ConfigError("Aggregator weights must not both be zero");
    }
    if (!in_unit_range(config_.clean_rule_confidence)) {
        throw ConfigError("clean_rule_confidence must be in [0,1]");
    }
    if (config_.max_input_length == 0 || config_.max_input_length > kMaxInputLengthLimit) {
        throw ConfigError(std::format("max_input_length must be in [1, {}], got {}",
                                      kMaxInputLengthLimit, config_.max_input_length));
    }
}

double DecisionAggregator::combine_confidence(const Config& config,
                                              double rule_confidence,
                                              double classifier_confidence) {
    if (config.combination == CombinationMode::MIN) {
        return utils::clamp_unit(std::min(rule_confidence, classifier_confidence));
    }
    const double total = config.rule_weight + config.classifier_weight;
    if (total <= 0.0) {
        return utils::clamp_unit(std::min(rule_confidence, classifier_confidence));
    }
    return utils::clamp_unit(
        (config.rule_weight * rule_confidence +
         config.classifier_weight * classifier_confidence) / total);
}

// ============================================================================
// Entry Point
// ============================================================================

AnalysisResult DecisionAggregator::analyze(const AnalysisRequest& request,
                                           const CancellationToken* cancel) {
    const utils::Timer timer;
    Context ctx{request, cancel};
    bool service_error = false;

    try {
        const auto& content = request.content();

        if (content.size() > config_.max_input_length) {
            utils::log::warn(std::format("Input rejected: {} bytes exceeds limit of {}",
                content.size(), config_.max_input_length));
            ctx.result.path = DecisionPath::INPUT_REJECTED;
            ctx.result.confidence_score = 1.0;
            ctx.result.detected_threats.emplace_back(kInputTooLong);
            finish(ctx, false);
        } else {
            evaluate_rules(ctx);

            if (config_.strict_mode && !ctx.matches.empty()) {
                utils::log::warn(std::format("Rule block ({} bytes, source={}): {}",
                    content.size(), source_type_to_string(request.source_type()),
                    ctx.rule_labels.front()));
                decide_without_classifier(ctx, DecisionPath::RULE_BLOCK);
            } else if (!c_.classifier || content.empty()) {
                decide_without_classifier(ctx, DecisionPath::RULES_ONLY);
            } else {
                decide_with_classifier(ctx);
            }
        }
    } catch (const std::exception& e) {
        utils::log::error(std::format("Analysis failed: {}", e.what()));
        ctx.result = make_service_error_result();
        ctx.state = State::UNSAFE;
        service_error = true;
    }

    // The service-error shape reports zero processing time
    if (!service_error) {
        ctx.result.processing_time = timer.elapsed_seconds();
    }
    c_.metrics->record(ctx.result);

    utils::log::debug(std::format("Verdict: safe={} path={} confidence={:.3f} threats={} ({:.6f}s)",
        utils::booltostr(ctx.result.is_safe), decision_path_to_string(ctx.result.path),
        ctx.result.confidence_score, ctx.result.detected_threats.size(),
        ctx.result.processing_time));

    return std::move(ctx.result);
}

// ============================================================================
// States
// ============================================================================

void DecisionAggregator::evaluate_rules(Context& ctx) const {
    ctx.matches = c_.rule_engine->evaluate(ctx.request.content());
    for (const auto& m : ctx.matches) {
        append_unique(ctx.rule_labels, m.rule_name);
        ctx.max_rule_weight = std::max(ctx.max_rule_weight, m.weight);
    }
    ctx.state = State::RULES_EVALUATED;
}

void DecisionAggregator::decide_without_classifier(Context& ctx, DecisionPath path) const {
    ctx.result.path = path;
    ctx.result.detected_threats = ctx.rule_labels;

    const bool is_safe = ctx.matches.empty();
    ctx.result.confidence_score = is_safe ? config_.clean_rule_confidence
                                          : ctx.max_rule_weight;
    finish(ctx, is_safe);
}

void DecisionAggregator::decide_with_classifier(Context& ctx) {
    ctx.state = State::CLASSIFYING;
    ctx.result.classifier_invoked = true;

    const ClassificationContext hint{ctx.request.source_type(), ctx.rule_labels};
    auto verdict = c_.classifier->classify(ctx.request.content(), hint, ctx.cancel);

    if (verdict.is_error()) {
        utils::log::warn(std::format("Classifier '{}' unavailable ({}): {}",
            c_.classifier->name(), error_category_to_string(verdict.error_category()),
            verdict.error_message()));

        if (config_.fail_closed) {
            ctx.result.path = DecisionPath::CLASSIFIER_ERROR;
            ctx.result.confidence_score = 0.0;
            ctx.result.detected_threats.emplace_back(kSecurityServiceError);
            for (const auto& label : ctx.rule_labels) {
                append_unique(ctx.result.detected_threats, label);
            }
            finish(ctx, false);
            return;
        }

        decide_without_classifier(ctx, DecisionPath::CLASSIFIER_DEGRADED);
        return;
    }

    const auto& v = verdict.value();
    const bool is_safe = ctx.matches.empty() && v.is_safe;

    // Both confidences are re-expressed as certainty in the final verdict
    const bool rules_say_safe = ctx.matches.empty();
    const double rule_raw = rules_say_safe ? config_.clean_rule_confidence
                                           : ctx.max_rule_weight;
    const double rule_confidence = (rules_say_safe == is_safe) ? rule_raw : 1.0 - rule_raw;
    const double classifier_confidence = (v.is_safe == is_safe) ? v.raw_confidence
                                                                : 1.0 - v.raw_confidence;

    ctx.result.path = DecisionPath::CLASSIFIER;
    ctx.result.confidence_score =
        combine_confidence(config_, rule_confidence, classifier_confidence);

    ctx.result.detected_threats = ctx.rule_labels;
    if (!v.is_safe) {
        ctx.whole_input_flagged = true;
        for (const auto& label : v.threat_labels) {
            append_unique(ctx.result.detected_threats, label);
        }
        if (v.threat_labels.empty()) {
            append_unique(ctx.result.detected_threats, kClassifierFlagged);
        }
    }

    finish(ctx, is_safe);
}

void DecisionAggregator::finish(Context& ctx, bool is_safe) const {
    ctx.result.is_safe = is_safe;
    ctx.result.confidence_score = utils::clamp_unit(ctx.result.confidence_score);

    // A classifier verdict carries no spans, so it condemns the whole input
    if (ctx.result.path == DecisionPath::INPUT_REJECTED ||
        ctx.result.path == DecisionPath::CLASSIFIER_ERROR ||
        ctx.whole_input_flagged) {
        ctx.result.sanitized_content.clear();
    } else {
        ctx.result.sanitized_content =
            c_.sanitizer->sanitize(ctx.request.content(), ctx.matches, is_safe);
    }

    ctx.state = is_safe ? State::SAFE : State::UNSAFE;
}

} // namespace aegis
