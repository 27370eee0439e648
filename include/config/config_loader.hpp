#pragma once

#include "config/config_types.hpp"
#include "rules/rule_engine.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace aegis {

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads aegis.toml.
 *
 * String values support ${VAR} environment expansion. A top-level
 * `include = "file.toml"` (or an array of files) is merged underneath the
 * including file: the includer's scalars win, arrays are appended.
 *
 * Values absent from the file fall back to environment variables where one
 * exists (OPENAI_API_KEY, OPENAI_MODEL, LLM_TEMPERATURE, LLM_MAX_TOKENS,
 * LOG_LEVEL), then to built-in defaults.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        AegisConfig config;

        static LoadResult ok(AegisConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /// Built-in defaults plus environment fallbacks (no file present)
    [[nodiscard]] static LoadResult load_defaults();

    /// Every problem found, empty when the config is usable
    [[nodiscard]] static std::vector<std::string> validate_config(const AegisConfig& config);

    /**
     * @brief Rule set the engine should compile: configured rules, followed
     * by the built-in library when use_default_rules is set.
     * @throws ConfigError on an unknown severity string
     */
    [[nodiscard]] static std::vector<RuleDefinition> effective_rules(const AegisConfig& config);

private:
    static AegisConfig extract_all_sections(const toml::table& root);
    static LoadResult validate_and_return(AegisConfig config);

    static ServerConfig extract_server(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static RuleEngineConfig extract_rule_engine(const toml::table& root);
    static ClassifierConfig extract_classifier(const toml::table& root);
    static AggregatorConfig extract_aggregator(const toml::table& root);
    static SanitizerConfig extract_sanitizer(const toml::table& root);
    static MetricsConfig extract_metrics(const toml::table& root);
};

} // namespace aegis
