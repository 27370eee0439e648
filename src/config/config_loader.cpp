#include "config/config_loader.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "detection/decision_aggregator.hpp"
#include "detection/sanitizer.hpp"
#include "rules/rule_library.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <regex>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace aegis {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            s = expand_env_vars(s.get());
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            s = expand_env_vars(s.get());
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

/**
 * @brief Deep-merge two toml::tables. Overlay wins for scalars, arrays append.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, val] : overlay) {
        if (val.is_table() && base.contains(key) && base[key].is_table()) {
            merge_tables(*base[key].as_table(), *val.as_table());
        } else if (val.is_array() && base.contains(key) && base[key].is_array()) {
            auto& base_arr = *base[key].as_array();
            for (const auto& elem : *val.as_array()) {
                base_arr.push_back(elem);
            }
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

void resolve_includes(toml::table& root, const std::string& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    if (depth > 10) {
        throw std::runtime_error("Config include depth exceeds 10");
    }
    auto inc_node = root["include"];
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (inc_node.is_string()) {
        paths.emplace_back(inc_node.as_string()->get());
    } else if (inc_node.is_array()) {
        for (const auto& item : *inc_node.as_array()) {
            if (item.is_string()) {
                paths.emplace_back(item.as_string()->get());
            }
        }
    }
    root.erase("include");

    for (const auto& rel_path : paths) {
        namespace fs = std::filesystem;
        const std::string abs_path = fs::canonical(fs::path(base_dir) / rel_path).string();

        if (!visited.insert(abs_path).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path));
        }

        auto included = toml::parse_file(abs_path);
        const std::string inc_dir = fs::path(abs_path).parent_path().string();
        resolve_includes(included, inc_dir, visited, depth + 1);

        // Included file is the base, the including file wins
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);

    namespace fs = std::filesystem;
    const std::string base_dir = fs::path(file_path).parent_path().string();
    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, base_dir, visited, 0);

    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

// Negative values clamp to 0 so validation reports them as "must be > 0"
size_t toml_size(const toml::table& tbl, const std::string_view key, size_t fallback) {
    const auto v = tbl[key].value<int64_t>();
    if (!v) return fallback;
    return static_cast<size_t>(std::max<int64_t>(0, *v));
}

std::string env_or(const char* name, std::string fallback) {
    const char* value = std::getenv(name);
    return (value && *value) ? std::string(value) : std::move(fallback);
}

template <typename T>
T env_number_or(const char* name, T fallback) {
    const char* value = std::getenv(name);
    if (!value || !*value) return fallback;

    const std::string_view text(value);
    T parsed{};
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        throw std::runtime_error(std::format("Environment variable {}='{}' is not a number",
                                             name, text));
    }
    return parsed;
}

bool in_unit_range(double v) { return v >= 0.0 && v <= 1.0; }

} // anonymous namespace

// ============================================================================
// Section Extraction
// ============================================================================

ServerConfig ConfigLoader::extract_server(const toml::table& root) {
    ServerConfig cfg;
    const auto* server = root["server"].as_table();
    if (!server) return cfg;
    const auto& s = *server;

    cfg.host = s["host"].value_or(cfg.host);
    const auto port = s["port"].value_or(int64_t{8080});
    cfg.port = (port >= 1 && port <= 65535) ? static_cast<uint16_t>(port) : 0;   // 0 fails validation
    cfg.threads = toml_size(s, "threads", cfg.threads);
    cfg.max_input_length = toml_size(s, "max_input_length", cfg.max_input_length);
    cfg.shutdown_timeout_ms = static_cast<uint32_t>(
        toml_size(s, "shutdown_timeout_ms", cfg.shutdown_timeout_ms));
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    cfg.level = env_or("LOG_LEVEL", cfg.level);
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or(cfg.level);
    return cfg;
}

RuleEngineConfig ConfigLoader::extract_rule_engine(const toml::table& root) {
    RuleEngineConfig cfg;
    const auto* sec = root["rule_engine"].as_table();
    if (!sec) return cfg;
    const auto& r = *sec;

    cfg.enabled = r["enabled"].value_or(cfg.enabled);
    cfg.strict_mode = r["strict_mode"].value_or(cfg.strict_mode);
    cfg.short_circuit = r["short_circuit"].value_or(cfg.short_circuit);

    if (const auto* arr = r["rules"].as_array()) {
        cfg.rules.reserve(arr->size());
        for (const auto& elem : *arr) {
            const auto* rule = elem.as_table();
            if (!rule) continue;

            RuleConfigEntry entry;
            entry.name = (*rule)["name"].value_or(""s);
            entry.severity = (*rule)["severity"].value_or(entry.severity);
            entry.weight = (*rule)["weight"].value<double>();
            entry.patterns = toml_string_array(*rule, "patterns");
            entry.regex = toml_string_array(*rule, "regex");
            cfg.rules.push_back(std::move(entry));
        }
    }

    cfg.use_default_rules = r["use_default_rules"].value_or(cfg.rules.empty());
    return cfg;
}

ClassifierConfig ConfigLoader::extract_classifier(const toml::table& root) {
    ClassifierConfig cfg;
    cfg.api_key = env_or("OPENAI_API_KEY", "");
    cfg.model = env_or("OPENAI_MODEL", cfg.model);
    cfg.temperature = env_number_or("LLM_TEMPERATURE", cfg.temperature);
    cfg.max_tokens = env_number_or("LLM_MAX_TOKENS", cfg.max_tokens);

    const auto* sec = root["classifier"].as_table();
    if (!sec) return cfg;
    const auto& c = *sec;

    cfg.enabled = c["enabled"].value_or(cfg.enabled);
    cfg.backend = c["backend"].value_or(cfg.backend);
    cfg.provider = c["provider"].value_or(cfg.provider);
    cfg.endpoint = c["endpoint"].value_or(cfg.endpoint);
    if (const auto key = c["api_key"].value<std::string>(); key && !key->empty()) {
        cfg.api_key = *key;
    }
    cfg.model = c["model"].value_or(cfg.model);
    cfg.temperature = c["temperature"].value_or(cfg.temperature);
    cfg.max_tokens = static_cast<int>(c["max_tokens"].value_or(int64_t{cfg.max_tokens}));
    cfg.timeout_ms = static_cast<int>(c["timeout_ms"].value_or(int64_t{cfg.timeout_ms}));
    cfg.max_retries = static_cast<int>(c["max_retries"].value_or(int64_t{cfg.max_retries}));
    cfg.max_requests_per_minute = static_cast<int>(
        c["max_requests_per_minute"].value_or(int64_t{cfg.max_requests_per_minute}));
    cfg.cache_enabled = c["cache_enabled"].value_or(cfg.cache_enabled);
    cfg.cache_max_entries = toml_size(c, "cache_max_entries", cfg.cache_max_entries);
    cfg.cache_ttl_seconds = static_cast<int>(
        c["cache_ttl_seconds"].value_or(int64_t{cfg.cache_ttl_seconds}));
    cfg.system_prompt = c["system_prompt"].value_or(cfg.system_prompt);

    if (const auto* cb = c["circuit_breaker"].as_table()) {
        auto& b = cfg.circuit_breaker;
        b.enabled = (*cb)["enabled"].value_or(b.enabled);
        b.failure_threshold = static_cast<int>((*cb)["failure_threshold"].value_or(int64_t{b.failure_threshold}));
        b.success_threshold = static_cast<int>((*cb)["success_threshold"].value_or(int64_t{b.success_threshold}));
        b.timeout_ms = static_cast<int>((*cb)["timeout_ms"].value_or(int64_t{b.timeout_ms}));
        b.half_open_max_calls = static_cast<int>((*cb)["half_open_max_calls"].value_or(int64_t{b.half_open_max_calls}));
    }
    return cfg;
}

AggregatorConfig ConfigLoader::extract_aggregator(const toml::table& root) {
    AggregatorConfig cfg;
    const auto* sec = root["aggregator"].as_table();
    if (!sec) return cfg;
    const auto& a = *sec;

    cfg.fail_closed = a["fail_closed"].value_or(cfg.fail_closed);
    cfg.combination = a["combination"].value_or(cfg.combination);
    cfg.rule_weight = a["rule_weight"].value_or(cfg.rule_weight);
    cfg.classifier_weight = a["classifier_weight"].value_or(cfg.classifier_weight);
    cfg.clean_rule_confidence = a["clean_rule_confidence"].value_or(cfg.clean_rule_confidence);
    return cfg;
}

SanitizerConfig ConfigLoader::extract_sanitizer(const toml::table& root) {
    SanitizerConfig cfg;
    const auto* sec = root["sanitizer"].as_table();
    if (!sec) return cfg;

    cfg.mode = (*sec)["mode"].value_or(cfg.mode);
    cfg.max_passes = static_cast<int>((*sec)["max_passes"].value_or(int64_t{cfg.max_passes}));
    return cfg;
}

MetricsConfig ConfigLoader::extract_metrics(const toml::table& root) {
    MetricsConfig cfg;
    const auto* sec = root["metrics"].as_table();
    if (!sec) return cfg;

    cfg.latency_window = toml_size(*sec, "latency_window", cfg.latency_window);
    cfg.top_threats = toml_size(*sec, "top_threats", cfg.top_threats);
    return cfg;
}

// ---- Shared extraction + validation ----------------------------------------

AegisConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    AegisConfig config;
    config.server = extract_server(tbl);
    config.logging = extract_logging(tbl);
    config.rule_engine = extract_rule_engine(tbl);
    config.classifier = extract_classifier(tbl);
    config.aggregator = extract_aggregator(tbl);
    config.sanitizer = extract_sanitizer(tbl);
    config.metrics = extract_metrics(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(AegisConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_defaults() {
    return load_from_string("");
}

std::vector<RuleDefinition> ConfigLoader::effective_rules(const AegisConfig& config) {
    std::vector<RuleDefinition> rules;
    rules.reserve(config.rule_engine.rules.size());

    for (const auto& entry : config.rule_engine.rules) {
        const auto severity = parse_severity(entry.severity);
        if (!severity) {
            throw ConfigError(std::format("Rule '{}' has unknown severity '{}'",
                                          entry.name, entry.severity));
        }
        rules.push_back({entry.name, *severity, entry.weight, entry.patterns, entry.regex});
    }

    if (config.rule_engine.use_default_rules) {
        for (auto& rule : default_rules()) {
            rules.push_back(std::move(rule));
        }
    }
    return rules;
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const AegisConfig& config) {
    std::vector<std::string> errors;

    // [server]
    if (!utils::in_range<1, 65535>(config.server.port)) {
        errors.push_back(std::format("server.port must be 1-65535, got {}", config.server.port));
    }
    if (config.server.threads == 0) {
        errors.push_back("server.threads must be > 0");
    }
    if (config.server.max_input_length == 0 ||
        config.server.max_input_length > DecisionAggregator::kMaxInputLengthLimit) {
        errors.push_back(std::format("server.max_input_length must be 1-{}, got {}",
            DecisionAggregator::kMaxInputLengthLimit, config.server.max_input_length));
    }

    // [logging]
    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be debug|info|warn|error, got '{}'", config.logging.level));
    }

    // [rule_engine]
    std::unordered_set<std::string> names;
    const auto& rules = config.rule_engine.rules;
    for (size_t i = 0; i < rules.size(); ++i) {
        const auto& rule = rules[i];
        if (rule.name.empty()) {
            errors.push_back(std::format("rule_engine.rules[{}].name must not be empty", i));
        } else if (!names.insert(rule.name).second) {
            errors.push_back(std::format("rule_engine.rules[{}].name '{}' is duplicated", i, rule.name));
        }
        if (!parse_severity(rule.severity)) {
            errors.push_back(std::format(
                "rule_engine.rules[{}].severity must be low|medium|high|critical, got '{}'",
                i, rule.severity));
        }
        if (rule.weight && !in_unit_range(*rule.weight)) {
            errors.push_back(std::format(
                "rule_engine.rules[{}].weight must be in [0,1], got {}", i, *rule.weight));
        }
        if (rule.patterns.empty() && rule.regex.empty()) {
            errors.push_back(std::format(
                "rule_engine.rules[{}] ('{}') needs at least one pattern or regex", i, rule.name));
        }
        for (const auto& pattern : rule.patterns) {
            if (pattern.empty()) {
                errors.push_back(std::format("rule_engine.rules[{}] has an empty pattern", i));
            }
        }
        for (const auto& expr : rule.regex) {
            try {
                const std::regex compiled(expr, std::regex::ECMAScript | std::regex::icase);
            } catch (const std::regex_error& e) {
                errors.push_back(std::format(
                    "rule_engine.rules[{}].regex '{}' does not compile: {}", i, expr, e.what()));
            }
        }
    }
    if (config.rule_engine.use_default_rules) {
        for (const auto& builtin : default_rules()) {
            if (names.contains(builtin.name)) {
                errors.push_back(std::format(
                    "rule '{}' clashes with a built-in rule (set use_default_rules = false)",
                    builtin.name));
            }
        }
    }

    // [classifier]
    const auto& c = config.classifier;
    if (c.backend != "llm" && c.backend != "local") {
        errors.push_back(std::format("classifier.backend must be llm|local, got '{}'", c.backend));
    }
    if (c.enabled && c.backend == "llm") {
        if (c.provider != "openai" && c.provider != "anthropic") {
            errors.push_back(std::format(
                "classifier.provider must be openai|anthropic, got '{}'", c.provider));
        }
        if (c.endpoint.empty()) {
            errors.push_back("classifier.endpoint required for the llm backend");
        }
        if (c.model.empty()) {
            errors.push_back("classifier.model required for the llm backend");
        }
    }
    if (c.timeout_ms <= 0 || c.timeout_ms > 30000) {
        errors.push_back(std::format("classifier.timeout_ms must be 1-30000, got {}", c.timeout_ms));
    }
    if (!(c.temperature >= 0.0 && c.temperature <= 2.0)) {
        errors.push_back(std::format("classifier.temperature must be in [0,2], got {}", c.temperature));
    }
    if (c.max_tokens <= 0) {
        errors.push_back("classifier.max_tokens must be > 0");
    }
    if (c.max_retries < 0) {
        errors.push_back("classifier.max_retries must be >= 0");
    }
    if (c.max_requests_per_minute <= 0) {
        errors.push_back("classifier.max_requests_per_minute must be > 0");
    }
    if (c.cache_ttl_seconds < 0) {
        errors.push_back("classifier.cache_ttl_seconds must be >= 0");
    }
    if (c.circuit_breaker.enabled) {
        if (c.circuit_breaker.failure_threshold <= 0) {
            errors.push_back("classifier.circuit_breaker.failure_threshold must be > 0");
        }
        if (c.circuit_breaker.success_threshold <= 0) {
            errors.push_back("classifier.circuit_breaker.success_threshold must be > 0");
        }
        if (c.circuit_breaker.timeout_ms <= 0) {
            errors.push_back("classifier.circuit_breaker.timeout_ms must be > 0");
        }
        if (c.circuit_breaker.half_open_max_calls <= 0) {
            errors.push_back("classifier.circuit_breaker.half_open_max_calls must be > 0");
        }
    }

    // [aggregator]
    const auto& a = config.aggregator;
    if (!parse_combination_mode(a.combination)) {
        errors.push_back(std::format(
            "aggregator.combination must be min|weighted, got '{}'", a.combination));
    }
    if (!in_unit_range(a.rule_weight)) {
        errors.push_back(std::format("aggregator.rule_weight must be in [0,1], got {}", a.rule_weight));
    }
    if (!in_unit_range(a.classifier_weight)) {
        errors.push_back(std::format(
            "aggregator.classifier_weight must be in [0,1], got {}", a.classifier_weight));
    }
    if (a.rule_weight + a.classifier_weight <= 0.0) {
        errors.push_back("aggregator.rule_weight and classifier_weight must not both be 0");
    }
    if (!in_unit_range(a.clean_rule_confidence)) {
        errors.push_back(std::format(
            "aggregator.clean_rule_confidence must be in [0,1], got {}", a.clean_rule_confidence));
    }

    // [sanitizer]
    if (!parse_sanitize_mode(config.sanitizer.mode)) {
        errors.push_back(std::format(
            "sanitizer.mode must be block|strip, got '{}'", config.sanitizer.mode));
    }
    if (config.sanitizer.max_passes <= 0) {
        errors.push_back("sanitizer.max_passes must be > 0");
    }

    // [metrics]
    if (config.metrics.latency_window == 0) {
        errors.push_back("metrics.latency_window must be > 0");
    }
    if (config.metrics.top_threats == 0) {
        errors.push_back("metrics.top_threats must be > 0");
    }

    return errors;
}

} // namespace aegis
