#include "classifier/local_heuristic_classifier.hpp"
#include "classifier/quarantined_classifier.hpp"
#include "config/config_loader.hpp"
#include "core/llm_client.hpp"
#include "core/utils.hpp"
#include "detection/decision_aggregator.hpp"
#include "detection/sanitizer.hpp"
#include "metrics/metrics_recorder.hpp"
#include "rules/rule_engine.hpp"
#include "server/http_server.hpp"
#include "server/shutdown_coordinator.hpp"

#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <chrono>
#include <memory>

using namespace aegis;

// Global state for signal handling
static std::shared_ptr<HttpServer> g_server;
static std::shared_ptr<ShutdownCoordinator> g_shutdown;

namespace {

void signal_handler(int signal) {
    utils::log::info(std::format("Received signal {}, shutting down...", signal));

    // Stop accepting new analyses
    if (g_shutdown) {
        g_shutdown->initiate_shutdown();
    }

    // Release analyses blocked on the judge; they answer fail-closed
    if (g_server) {
        (void)g_server->cancel_in_flight();
    }

    // Wait for in-flight analyses to drain
    if (g_shutdown) {
        const bool drained = g_shutdown->wait_for_drain();
        if (drained) {
            utils::log::info("All in-flight requests drained");
        } else {
            utils::log::warn(std::format("Shutdown timeout: {} requests still in flight",
                g_shutdown->in_flight_count()));
        }
    }

    if (g_server) {
        g_server->stop();
    }

    std::exit(0);
}

AegisConfig load_config(const std::string& config_file) {
    if (!std::filesystem::exists(config_file)) {
        utils::log::warn(std::format("Config file {} not found, using built-in defaults",
                                     config_file));
        auto defaults = ConfigLoader::load_defaults();
        if (!defaults.success) {
            throw ConfigError(defaults.error_message);
        }
        return std::move(defaults.config);
    }

    auto result = ConfigLoader::load_from_file(config_file);
    if (!result.success) {
        throw ConfigError(result.error_message);
    }
    return std::move(result.config);
}

std::shared_ptr<ISecondaryClassifier> build_classifier(const ClassifierConfig& cfg) {
    if (!cfg.enabled) {
        utils::log::info("Secondary classifier: disabled (rules only)");
        return nullptr;
    }

    if (cfg.backend == "local") {
        utils::log::info("Secondary classifier: local heuristic");
        return std::make_shared<LocalHeuristicClassifier>();
    }

    LlmClient::Config llm_cfg;
    llm_cfg.enabled = true;
    llm_cfg.provider = cfg.provider;
    llm_cfg.endpoint = cfg.endpoint;
    llm_cfg.api_key = cfg.api_key;
    llm_cfg.default_model = cfg.model;
    llm_cfg.timeout_ms = static_cast<uint32_t>(cfg.timeout_ms);
    llm_cfg.max_retries = static_cast<uint32_t>(cfg.max_retries);
    llm_cfg.max_requests_per_minute = static_cast<uint32_t>(cfg.max_requests_per_minute);
    llm_cfg.cache_enabled = cfg.cache_enabled;
    llm_cfg.cache_max_entries = cfg.cache_max_entries;
    llm_cfg.cache_ttl_seconds = static_cast<uint32_t>(cfg.cache_ttl_seconds);

    if (llm_cfg.api_key.empty()) {
        utils::log::warn("Secondary classifier: no API key configured, every call will fail");
    }

    QuarantinedClassifier::Config qc_cfg;
    qc_cfg.model = cfg.model;
    qc_cfg.temperature = cfg.temperature;
    qc_cfg.max_tokens = cfg.max_tokens;
    if (!cfg.system_prompt.empty()) {
        qc_cfg.system_prompt = cfg.system_prompt;
    }
    qc_cfg.circuit_breaker_enabled = cfg.circuit_breaker.enabled;
    qc_cfg.circuit_breaker.failure_threshold =
        static_cast<uint32_t>(cfg.circuit_breaker.failure_threshold);
    qc_cfg.circuit_breaker.success_threshold =
        static_cast<uint32_t>(cfg.circuit_breaker.success_threshold);
    qc_cfg.circuit_breaker.open_timeout =
        std::chrono::milliseconds(cfg.circuit_breaker.timeout_ms);
    qc_cfg.circuit_breaker.half_open_max_calls =
        static_cast<uint32_t>(cfg.circuit_breaker.half_open_max_calls);

    utils::log::info(std::format("Secondary classifier: {} via {} (model={}, timeout={}ms)",
        cfg.backend, cfg.provider, cfg.model, cfg.timeout_ms));
    return std::make_shared<QuarantinedClassifier>(
        std::make_shared<LlmClient>(std::move(llm_cfg)), std::move(qc_cfg));
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        utils::log::info("Aegis Proxy starting...");

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        std::string config_file = "config/aegis.toml";
        if (argc > 1) {
            config_file = argv[1];
        }

        // ── [1/5] Configuration ─────────────────────────────────────────
        utils::log::info(std::format("[1/5] Loading configuration from {}", config_file));
        const AegisConfig config = load_config(config_file);

        if (const auto level = utils::log::parse_level(config.logging.level)) {
            utils::log::set_level(*level);
        }

        // ── [2/5] Rule engine ───────────────────────────────────────────
        const auto rules = ConfigLoader::effective_rules(config);
        RuleEngine::Config rule_cfg;
        rule_cfg.enabled = config.rule_engine.enabled;
        rule_cfg.short_circuit = config.rule_engine.short_circuit;
        auto rule_engine = std::make_shared<const RuleEngine>(rules, rule_cfg);
        utils::log::info(std::format("[2/5] Rule engine: {} rules ({}, strict_mode={})",
            rule_engine->rule_count(),
            rule_engine->is_enabled() ? "enabled" : "disabled",
            utils::booltostr(config.rule_engine.strict_mode)));

        // ── [3/5] Secondary classifier ──────────────────────────────────
        utils::log::info("[3/5] Initializing secondary classifier...");
        auto classifier = build_classifier(config.classifier);

        // ── [4/5] Sanitizer, metrics, aggregator ────────────────────────
        Sanitizer::Config san_cfg;
        if (const auto mode = parse_sanitize_mode(config.sanitizer.mode)) {
            san_cfg.mode = *mode;
        }
        san_cfg.max_passes = static_cast<uint32_t>(config.sanitizer.max_passes);
        auto sanitizer = std::make_shared<const Sanitizer>(rule_engine, san_cfg);

        auto metrics = std::make_shared<MetricsRecorder>(
            MetricsRecorder::Config{config.metrics.latency_window});

        DecisionAggregator::Config agg_cfg;
        agg_cfg.strict_mode = config.rule_engine.strict_mode;
        agg_cfg.fail_closed = config.aggregator.fail_closed;
        if (const auto mode = parse_combination_mode(config.aggregator.combination)) {
            agg_cfg.combination = *mode;
        }
        agg_cfg.rule_weight = config.aggregator.rule_weight;
        agg_cfg.classifier_weight = config.aggregator.classifier_weight;
        agg_cfg.clean_rule_confidence = config.aggregator.clean_rule_confidence;
        agg_cfg.max_input_length = config.server.max_input_length;

        auto aggregator = std::make_shared<DecisionAggregator>(
            AggregatorComponents{rule_engine, classifier, sanitizer, metrics}, agg_cfg);
        utils::log::info(std::format("[4/5] Aggregator: fail_closed={}, combination={}, sanitizer={}",
            utils::booltostr(agg_cfg.fail_closed),
            combination_mode_to_string(agg_cfg.combination),
            sanitize_mode_to_string(san_cfg.mode)));

        // ── [5/5] HTTP server ───────────────────────────────────────────
        g_shutdown = std::make_shared<ShutdownCoordinator>(ShutdownCoordinator::Config{
            std::chrono::milliseconds(config.server.shutdown_timeout_ms)});

        HttpServer::Config server_cfg;
        server_cfg.host = config.server.host;
        server_cfg.port = config.server.port;
        server_cfg.threads = config.server.threads;
        server_cfg.top_threats = config.metrics.top_threats;

        g_server = std::make_shared<HttpServer>(aggregator, metrics, classifier,
                                                rule_engine, server_cfg);
        g_server->set_shutdown_coordinator(g_shutdown);
        utils::log::info(std::format("[5/5] Server ready on http://{}:{}",
                                     server_cfg.host, server_cfg.port));

        // Blocking
        g_server->start();

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}
