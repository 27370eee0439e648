#include "classifier/quarantined_classifier.hpp"
#include "core/cancellation.hpp"
#include "core/json.hpp"
#include "core/llm_client.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <utility>

namespace aegis {

namespace {

// Model output may be wrapped in ```json ... ``` or plain ``` ... ``` fences
std::string strip_code_fences(std::string_view output) {
    constexpr std::string_view kJsonFence = "```json";
    constexpr std::string_view kFence = "```";

    std::string_view body = output;
    if (const auto start = output.find(kJsonFence); start != std::string_view::npos) {
        body = output.substr(start + kJsonFence.size());
        if (const auto end = body.find(kFence); end != std::string_view::npos) {
            body = body.substr(0, end);
        }
    } else if (const auto open = output.find(kFence); open != std::string_view::npos) {
        body = output.substr(open + kFence.size());
        if (const auto end = body.find(kFence); end != std::string_view::npos) {
            body = body.substr(0, end);
        }
    }
    return utils::trim(std::string(body));
}

Result<ClassifierVerdict> malformed(std::string reason) {
    return Result<ClassifierVerdict>::error(
        ErrorCategory::CLASSIFIER_UNAVAILABLE,
        std::format("Malformed classifier output: {}", reason));
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

QuarantinedClassifier::QuarantinedClassifier(std::shared_ptr<LlmClient> client, Config config)
    : client_(std::move(client)),
      config_(std::move(config)),
      breaker_("quarantined_llm", config_.circuit_breaker) {
    if (config_.system_prompt.empty()) {
        config_.system_prompt = std::string(kDefaultSystemPrompt);
    }
}

ClassifierHealth QuarantinedClassifier::health() const {
    if (!client_ || !client_->is_enabled()) {
        return ClassifierHealth::DISABLED;
    }
    if (config_.circuit_breaker_enabled && breaker_.get_state() != CircuitState::CLOSED) {
        return ClassifierHealth::DEGRADED;
    }
    return ClassifierHealth::OPERATIONAL;
}

// ============================================================================
// Structured request
// ============================================================================

std::string QuarantinedClassifier::build_user_message(std::string_view content,
                                                      const ClassificationContext& context) {
    std::string labels;
    for (const auto& label : context.rule_labels) {
        if (!labels.empty()) labels += ',';
        labels += std::format(R"("{}")", utils::escape_json(label));
    }
    return std::format(R"({{"source_type":"{}","rule_labels":[{}],"content":"{}"}})",
        source_type_to_string(context.source_type), labels, utils::escape_json(content));
}

// ============================================================================
// Verdict parsing
// ============================================================================

std::string QuarantinedClassifier::normalize_label(std::string_view label) {
    std::string out;
    out.reserve(std::min(label.size(), kMaxLabelLength));
    for (const char c : label) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc)) {
            out += static_cast<char>(std::tolower(uc));
        } else if (c == '_' || c == ' ' || c == '-' || c == '.' || c == ':' || c == '/') {
            if (!out.empty() && out.back() != '_') out += '_';
        }
        if (out.size() >= kMaxLabelLength) break;
    }
    while (!out.empty() && out.back() == '_') {
        out.pop_back();
    }
    return out;
}

Result<ClassifierVerdict> QuarantinedClassifier::parse_verdict(std::string_view output) {
    const std::string body = strip_code_fences(output);
    if (body.empty()) {
        return malformed("empty response");
    }

    JsonValue doc;
    try {
        doc = JsonValue::parse(body);
    } catch (const JsonValue::parse_error&) {
        return malformed("not valid JSON");
    }

    if (!doc.is_object()) {
        return malformed("not a JSON object");
    }

    const auto is_safe = doc["is_safe"];
    if (!is_safe.is_boolean()) {
        return malformed("missing boolean 'is_safe'");
    }

    auto confidence = doc["confidence"];
    if (confidence.is_null()) {
        confidence = doc["confidence_score"];
    }
    if (!confidence.is_number()) {
        return malformed("missing numeric 'confidence'");
    }
    const double raw = confidence.get<double>();
    if (!(raw >= 0.0 && raw <= 1.0)) {
        return malformed(std::format("confidence {} outside [0,1]", raw));
    }

    ClassifierVerdict verdict;
    verdict.is_safe = is_safe.get<bool>();
    verdict.raw_confidence = raw;

    auto labels = doc["threat_labels"];
    if (labels.is_null()) {
        labels = doc["threats_detected"];
    }
    labels.for_each_element([&verdict](const JsonValue& item) {
        if (!item.is_string() || verdict.threat_labels.size() >= kMaxLabels) return;
        auto label = normalize_label(item.get<std::string>());
        if (label.empty()) return;
        if (std::find(verdict.threat_labels.begin(), verdict.threat_labels.end(), label) ==
            verdict.threat_labels.end()) {
            verdict.threat_labels.push_back(std::move(label));
        }
    });

    return Result<ClassifierVerdict>::ok(std::move(verdict));
}

// ============================================================================
// Classification
// ============================================================================

Result<ClassifierVerdict> QuarantinedClassifier::classify(
    std::string_view content,
    const ClassificationContext& context,
    const CancellationToken* cancel) {

    invocations_.fetch_add(1, std::memory_order_relaxed);

    if (!client_ || !client_->is_enabled()) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        return Result<ClassifierVerdict>::error(
            ErrorCategory::CLASSIFIER_UNAVAILABLE, "Classifier transport is disabled");
    }

    if (config_.circuit_breaker_enabled && !breaker_.allow_request()) {
        circuit_rejections_.fetch_add(1, std::memory_order_relaxed);
        failures_.fetch_add(1, std::memory_order_relaxed);
        return Result<ClassifierVerdict>::error(
            ErrorCategory::CLASSIFIER_UNAVAILABLE, "Classifier circuit is open");
    }

    LlmRequest request;
    request.system_prompt = config_.system_prompt;
    request.user_message = build_user_message(content, context);
    request.model = config_.model;
    request.temperature = config_.temperature;
    request.max_tokens = config_.max_tokens;

    const auto response = client_->complete(request, cancel);

    if (!response.success) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        if (config_.circuit_breaker_enabled) breaker_.record_failure();
        utils::log::warn(std::format("Classifier call failed ({} ms): {}",
            response.latency.count(), response.error));
        return Result<ClassifierVerdict>::error(
            ErrorCategory::CLASSIFIER_UNAVAILABLE, response.error);
    }

    auto verdict = parse_verdict(response.content);
    if (verdict.is_error()) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        malformed_outputs_.fetch_add(1, std::memory_order_relaxed);
        if (config_.circuit_breaker_enabled) breaker_.record_failure();
        utils::log::warn(verdict.error_message());
        return verdict;
    }

    if (config_.circuit_breaker_enabled) breaker_.record_success();
    return verdict;
}

QuarantinedClassifier::Stats QuarantinedClassifier::get_stats() const {
    return {
        invocations_.load(std::memory_order_relaxed),
        failures_.load(std::memory_order_relaxed),
        malformed_outputs_.load(std::memory_order_relaxed),
        circuit_rejections_.load(std::memory_order_relaxed)
    };
}

} // namespace aegis
