#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace aegis {

// ============================================================================
// Configuration Types (mirror the TOML sections)
// ============================================================================

struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 8080;
    size_t threads = 8;
    size_t max_input_length = 10000;        // Bytes of content per request
    uint32_t shutdown_timeout_ms = 10000;   // Drain budget on SIGINT/SIGTERM
};

struct LoggingConfig {
    std::string level = "info";
};

/**
 * @brief [[rule_engine.rules]] entry as written. Severity stays a string
 * until validation so a typo is reported instead of silently defaulted.
 */
struct RuleConfigEntry {
    std::string name;
    std::string severity = "high";
    std::optional<double> weight;
    std::vector<std::string> patterns;
    std::vector<std::string> regex;
};

struct RuleEngineConfig {
    bool enabled = true;
    bool strict_mode = true;
    bool short_circuit = true;
    bool use_default_rules = true;          // Defaults to true only when no rules are given
    std::vector<RuleConfigEntry> rules;
};

struct ClassifierCircuitBreakerConfig {
    bool enabled = true;
    int failure_threshold = 5;
    int success_threshold = 2;
    int timeout_ms = 10000;
    int half_open_max_calls = 1;
};

struct ClassifierConfig {
    bool enabled = false;
    std::string backend = "llm";            // "llm" | "local"
    std::string provider = "openai";        // "openai" | "anthropic"
    std::string endpoint = "https://api.openai.com";
    std::string api_key;                    // Falls back to OPENAI_API_KEY
    std::string model = "gpt-3.5-turbo";    // Falls back to OPENAI_MODEL
    double temperature = 0.0;
    int max_tokens = 1000;
    int timeout_ms = 5000;
    int max_retries = 1;
    int max_requests_per_minute = 600;
    bool cache_enabled = true;
    size_t cache_max_entries = 1000;
    int cache_ttl_seconds = 300;
    std::string system_prompt;              // Empty = built-in judge prompt
    ClassifierCircuitBreakerConfig circuit_breaker;
};

struct AggregatorConfig {
    bool fail_closed = true;
    std::string combination = "min";       // "min" | "weighted"
    double rule_weight = 0.5;
    double classifier_weight = 0.5;
    double clean_rule_confidence = 0.9;
};

struct SanitizerConfig {
    std::string mode = "block";            // "block" | "strip"
    int max_passes = 8;
};

struct MetricsConfig {
    size_t latency_window = 1000;
    size_t top_threats = 5;
};

// ============================================================================
// AegisConfig - Complete parsed configuration
// ============================================================================

struct AegisConfig {
    ServerConfig server;
    LoggingConfig logging;
    RuleEngineConfig rule_engine;
    ClassifierConfig classifier;
    AggregatorConfig aggregator;
    SanitizerConfig sanitizer;
    MetricsConfig metrics;
};

} // namespace aegis
