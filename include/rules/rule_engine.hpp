#pragma once

#include "core/types.hpp"

#include <cstddef>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace aegis {

/**
 * @brief One named attack signature as it appears in configuration.
 *
 * A rule matches when any of its substring patterns or regexes is found in
 * the content. Both kinds are case-insensitive.
 */
struct RuleDefinition {
    std::string name;
    Severity severity = Severity::HIGH;
    std::optional<double> weight;           // Unset = default_severity_weight(severity)
    std::vector<std::string> patterns;      // Literal substrings
    std::vector<std::string> regex;         // ECMAScript regexes
};

/**
 * @brief Deterministic signature matcher.
 *
 * Rules are compiled once at construction and never change afterwards, so a
 * single instance is shared read-only by all concurrent analyses.
 *
 * evaluate() reports every occurrence of every pattern (capped per pattern),
 * in rule order and then by offset. Identical (rule, span) pairs are
 * collapsed; overlapping spans, from the same or different rules, are all
 * kept. With short_circuit enabled, evaluation stops after the first rule of
 * the highest configured severity that matched.
 */
class RuleEngine {
public:
    struct Config {
        bool enabled = true;
        bool short_circuit = true;
    };

    static constexpr size_t kMaxMatchesPerPattern = 64;

    /**
     * @throws ConfigError on an empty or duplicate rule name, a rule without
     *         patterns, an empty pattern, a weight outside [0,1], or a regex
     *         that does not compile
     */
    RuleEngine(const std::vector<RuleDefinition>& rules, Config config);
    explicit RuleEngine(const std::vector<RuleDefinition>& rules)
        : RuleEngine(rules, Config{}) {}

    [[nodiscard]] std::vector<RuleMatch> evaluate(std::string_view content) const;

    [[nodiscard]] bool is_enabled() const { return config_.enabled; }
    [[nodiscard]] size_t rule_count() const { return rules_.size(); }
    [[nodiscard]] Severity max_severity() const { return max_severity_; }

    /// Names of the rules, in evaluation order
    [[nodiscard]] std::vector<std::string> rule_names() const;

private:
    struct CompiledRule {
        std::string name;
        Severity severity;
        double weight;
        std::vector<std::string> substrings;    // Lower-cased
        std::vector<std::regex> regexes;
    };

    void match_rule(const CompiledRule& rule,
                    std::string_view content,
                    std::string_view lowered,
                    std::vector<RuleMatch>& out) const;

    std::vector<CompiledRule> rules_;
    Severity max_severity_ = Severity::LOW;
    Config config_;
};

} // namespace aegis
