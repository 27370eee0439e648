#include "server/http_server.hpp"
#include "server/http_constants.hpp"
#include "server/shutdown_coordinator.hpp"
#include "classifier/secondary_classifier.hpp"
#include "core/cancellation.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"
#include "detection/decision_aggregator.hpp"
#include "rules/rule_engine.hpp"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <format>
#include <stdexcept>

namespace aegis {

namespace {

// Prometheus label values escape backslash, double quote and newline
std::string escape_label(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (const char c : s) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n"; break;
            default:   out += c; break;
        }
    }
    return out;
}

void append_metric(std::string& out, std::string_view name, std::string_view type,
                   std::string_view help) {
    out += std::format("# HELP {} {}\n# TYPE {} {}\n", name, help, name, type);
}

} // anonymous namespace

// ============================================================================
// Constructor
// ============================================================================

HttpServer::HttpServer(std::shared_ptr<DecisionAggregator> aggregator,
                       std::shared_ptr<MetricsRecorder> metrics,
                       std::shared_ptr<ISecondaryClassifier> classifier,
                       std::shared_ptr<const RuleEngine> rule_engine,
                       Config config)
    : aggregator_(std::move(aggregator)),
      metrics_(std::move(metrics)),
      classifier_(std::move(classifier)),
      rule_engine_(std::move(rule_engine)),
      config_(std::move(config)),
      svr_(std::make_unique<httplib::Server>()) {
    if (!aggregator_ || !metrics_ || !rule_engine_) {
        throw std::invalid_argument("HttpServer requires aggregator, metrics and rule engine");
    }
}

HttpServer::~HttpServer() {
    stopping_.store(true, std::memory_order_release);
    watcher_cv_.notify_all();
    if (watcher_.joinable()) watcher_.join();
}

// ============================================================================
// start() / stop()
// ============================================================================

void HttpServer::start() {
    auto& svr = *svr_;

    const size_t pool_size = config_.threads;
    svr.new_task_queue = [pool_size] {
        return new httplib::ThreadPool(pool_size);
    };

    register_core_routes(svr);

    if (!watcher_.joinable()) {
        watcher_ = std::thread([this] { watch_disconnects(); });
    }

    utils::log::info(std::format("Starting {} on {}:{} ({} threads)",
        http::kServiceName, config_.host, config_.port, config_.threads));

    if (!svr.listen(config_.host, config_.port)) {
        if (stopping_.load(std::memory_order_acquire)) return;
        throw std::runtime_error(std::format("Failed to listen on {}:{}",
                                             config_.host, config_.port));
    }
}

void HttpServer::stop() {
    stopping_.store(true, std::memory_order_release);
    watcher_cv_.notify_all();
    (void)cancel_in_flight();
    svr_->stop();
    utils::log::info("Server stopped");
}

size_t HttpServer::cancel_in_flight() {
    std::lock_guard lock(tokens_mutex_);
    cancel_all_.store(true, std::memory_order_release);
    for (const auto& [id, tracked] : tokens_) {
        tracked.token->cancel();
    }
    if (!tokens_.empty()) {
        utils::log::info(std::format("Cancelled {} in-flight analyses", tokens_.size()));
    }
    return tokens_.size();
}

uint64_t HttpServer::track(CancellationToken* token, DisconnectCheck disconnected) {
    std::lock_guard lock(tokens_mutex_);
    const uint64_t id = next_token_id_++;
    tokens_.emplace(id, Tracked{token, std::move(disconnected)});
    // stop() or cancel_in_flight() may have run before this request registered
    if (cancel_all_.load(std::memory_order_acquire)) token->cancel();
    return id;
}

void HttpServer::untrack(uint64_t id) {
    std::lock_guard lock(tokens_mutex_);
    tokens_.erase(id);
}

size_t HttpServer::cancel_disconnected() {
    std::lock_guard lock(tokens_mutex_);
    size_t cancelled = 0;
    for (const auto& [id, tracked] : tokens_) {
        if (!tracked.disconnected || tracked.token->is_cancelled()) continue;
        if (tracked.disconnected()) {
            tracked.token->cancel();
            ++cancelled;
        }
    }
    if (cancelled > 0) {
        utils::log::info(std::format("Cancelled {} analyses after client disconnect", cancelled));
    }
    return cancelled;
}

void HttpServer::watch_disconnects() {
    std::unique_lock lock(watcher_mutex_);
    while (!stopping_.load(std::memory_order_acquire)) {
        watcher_cv_.wait_for(lock, kDisconnectPollInterval, [this] {
            return stopping_.load(std::memory_order_acquire);
        });
        if (stopping_.load(std::memory_order_acquire)) break;
        lock.unlock();
        (void)cancel_disconnected();
        lock.lock();
    }
}

size_t HttpServer::in_flight_analyses() const {
    std::lock_guard lock(tokens_mutex_);
    return tokens_.size();
}

// ============================================================================
// Route registration
// ============================================================================

void HttpServer::register_core_routes(httplib::Server& svr) {
    svr.Post("/v1/analyze", [this](const httplib::Request& req, httplib::Response& res) {
        handle_analyze(req, res);
    });
    svr.Get("/v1/health", [this](const httplib::Request& req, httplib::Response& res) {
        handle_health(req, res);
    });
    svr.Get("/v1/metrics", [this](const httplib::Request& req, httplib::Response& res) {
        handle_metrics_json(req, res);
    });
    svr.Get("/metrics", [this](const httplib::Request& req, httplib::Response& res) {
        handle_prometheus(req, res);
    });
    svr.Get("/", [this](const httplib::Request& req, httplib::Response& res) {
        handle_index(req, res);
    });
}

// ============================================================================
// POST /v1/analyze
// ============================================================================

HttpServer::AnalyzeReply HttpServer::analyze_body(const std::string& body,
                                                  DisconnectCheck disconnected) {
    JsonValue doc;
    try {
        doc = JsonValue::parse(body);
    } catch (const JsonValue::parse_error& e) {
        return {httplib::StatusCode::BadRequest_400,
                error_json(std::format("Invalid JSON: {}", e.what()))};
    }

    if (!doc.is_object()) {
        return {httplib::StatusCode::BadRequest_400, error_json("Request body must be a JSON object")};
    }
    const auto content = doc["content"];
    if (!content.is_string()) {
        return {httplib::StatusCode::BadRequest_400, error_json("Missing required field: content")};
    }

    AnalysisRequest request(content.get<std::string>(),
                            parse_source_type(doc.string_or("source_type", "unknown")));

    CancellationToken cancel;
    const uint64_t token_id = track(&cancel, std::move(disconnected));

    AnalysisResult result;
    try {
        result = aggregator_->analyze(request, &cancel);
    } catch (const std::exception& e) {
        utils::log::error(std::format("Analysis failed: {}", e.what()));
        result = make_service_error_result();
    }
    untrack(token_id);

    return {httplib::StatusCode::OK_200, analysis_result_to_json(result)};
}

void HttpServer::handle_analyze(const httplib::Request& req, httplib::Response& res) {
    ShutdownCoordinator* sc = shutdown_coordinator_.get();
    if (sc && !sc->try_enter_request()) {
        res.status = httplib::StatusCode::ServiceUnavailable_503;
        res.set_content(error_json("Server shutting down"), http::kJsonContentType);
        return;
    }
    const ShutdownGuard guard{sc};

    res.set_header(http::kRequestIdHeader, utils::generate_uuid());

    DisconnectCheck disconnected;
    if (req.is_connection_closed) {
        disconnected = req.is_connection_closed;
    }
    const auto reply = analyze_body(req.body, std::move(disconnected));
    res.status = reply.status;
    res.set_content(reply.body, http::kJsonContentType);
}

// ============================================================================
// GET /v1/health, GET /
// ============================================================================

std::string HttpServer::system_health() const {
    if (!classifier_) return "optimal";
    return classifier_->health() == ClassifierHealth::OPERATIONAL ? "optimal" : "degraded";
}

std::string HttpServer::build_health_output() const {
    const char* rules_status = rule_engine_->is_enabled() ? "enabled" : "disabled";
    const char* classifier_status = classifier_
        ? classifier_health_to_string(classifier_->health())
        : "disabled";
    return std::format(
        R"({{"status":"healthy","service":"{}","version":"{}","components":{{"rule_engine":"{}","rule_count":{},"classifier":"{}","metrics":"enabled"}}}})",
        http::kServiceName, http::kServiceVersion, rules_status,
        rule_engine_->rule_count(), classifier_status);
}

void HttpServer::handle_health(const httplib::Request& /*req*/, httplib::Response& res) {
    res.set_content(build_health_output(), http::kJsonContentType);
}

void HttpServer::handle_index(const httplib::Request& /*req*/, httplib::Response& res) {
    res.set_content(std::format(
        R"({{"service":"{}","version":"{}","endpoints":{{"analyze":"/v1/analyze","health":"/v1/health","metrics":"/v1/metrics","prometheus":"/metrics"}}}})",
        http::kServiceName, http::kServiceVersion), http::kJsonContentType);
}

// ============================================================================
// GET /v1/metrics, GET /metrics
// ============================================================================

void HttpServer::handle_metrics_json(const httplib::Request& /*req*/, httplib::Response& res) {
    res.set_content(metrics_to_json(metrics_->snapshot(), config_.top_threats, system_health()),
                    http::kJsonContentType);
}

void HttpServer::handle_prometheus(const httplib::Request& /*req*/, httplib::Response& res) {
    auto output = build_prometheus_output(metrics_->snapshot());

    append_metric(output, "aegis_system_health", "gauge",
                  "1 when the secondary classifier is operational or not configured");
    output += std::format("aegis_system_health {}\n", system_health() == "optimal" ? 1 : 0);

    if (shutdown_coordinator_) {
        append_metric(output, "aegis_shutdown_rejected_total", "counter",
                      "Requests rejected during shutdown");
        output += std::format("aegis_shutdown_rejected_total {}\n",
                              shutdown_coordinator_->rejected_count());
    }

    res.set_content(output, http::kPrometheusContentType);
}

// ============================================================================
// Projections
// ============================================================================

std::string HttpServer::analysis_result_to_json(const AnalysisResult& result) {
    std::string threats = "[";
    for (size_t i = 0; i < result.detected_threats.size(); ++i) {
        if (i > 0) threats += ',';
        threats += std::format("\"{}\"", utils::escape_json(result.detected_threats[i]));
    }
    threats += ']';

    return std::format(
        R"({{"is_safe":{},"sanitized_content":"{}","confidence_score":{},"detected_threats":{},"processing_time":{}}})",
        utils::booltostr(result.is_safe),
        utils::escape_json(result.sanitized_content),
        result.confidence_score,
        threats,
        result.processing_time);
}

std::string HttpServer::metrics_to_json(const MetricsSnapshot& snapshot, size_t top_n,
                                        std::string_view system_health) {
    std::string top = "[";
    bool first = true;
    for (const auto& [name, count] : snapshot.top_threats(top_n)) {
        if (!first) top += ',';
        first = false;
        top += std::format("\"{}\"", utils::escape_json(name));
    }
    top += ']';

    return std::format(
        R"({{"total_requests":{},"blocked_requests":{},"block_rate":"{}","top_threats":{},"avg_processing_time":{},"system_health":"{}"}})",
        snapshot.total_requests, snapshot.blocked_requests, snapshot.block_rate_string(),
        top, snapshot.avg_processing_time, system_health);
}

std::string HttpServer::build_prometheus_output(const MetricsSnapshot& snapshot) {
    std::string output;

    append_metric(output, "aegis_requests_total", "counter", "Total analysis requests");
    output += std::format("aegis_requests_total {}\n", snapshot.total_requests);

    append_metric(output, "aegis_requests_blocked_total", "counter", "Requests judged unsafe");
    output += std::format("aegis_requests_blocked_total {}\n", snapshot.blocked_requests);

    append_metric(output, "aegis_inputs_rejected_total", "counter",
                  "Requests rejected for exceeding max_input_length");
    output += std::format("aegis_inputs_rejected_total {}\n", snapshot.inputs_rejected);

    append_metric(output, "aegis_classifier_invocations_total", "counter",
                  "Secondary classifier calls");
    output += std::format("aegis_classifier_invocations_total {}\n",
                          snapshot.classifier_invocations);

    append_metric(output, "aegis_classifier_failures_total", "counter",
                  "Secondary classifier calls that failed");
    output += std::format("aegis_classifier_failures_total {}\n", snapshot.classifier_failures);

    append_metric(output, "aegis_processing_time_seconds_avg", "gauge",
                  "Mean processing time over the rolling window");
    output += std::format("aegis_processing_time_seconds_avg {:.6f}\n",
                          snapshot.avg_processing_time);

    append_metric(output, "aegis_threats_detected_total", "counter",
                  "Detections per threat label");
    for (const auto& [label, count] : snapshot.threat_histogram) {
        output += std::format("aegis_threats_detected_total{{label=\"{}\"}} {}\n",
                              escape_label(label), count);
    }

    return output;
}

std::string HttpServer::error_json(std::string_view message) {
    return std::format(R"({{"success":false,"error":"{}"}})", utils::escape_json(message));
}

} // namespace aegis
