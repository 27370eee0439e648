#include "rules/rule_engine.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <unordered_set>
#include <utility>

namespace aegis {

// ============================================================================
// Construction (compile once)
// ============================================================================

RuleEngine::RuleEngine(const std::vector<RuleDefinition>& rules, Config config)
    : config_(config) {

    std::unordered_set<std::string> seen;
    rules_.reserve(rules.size());

    for (const auto& def : rules) {
        if (def.name.empty()) {
            throw ConfigError("Rule has an empty name");
        }
        if (!seen.insert(def.name).second) {
            throw ConfigError(std::format("Duplicate rule name '{}'", def.name));
        }
        if (def.patterns.empty() && def.regex.empty()) {
            throw ConfigError(std::format("Rule '{}' has no patterns", def.name));
        }

        CompiledRule compiled;
        compiled.name = def.name;
        compiled.severity = def.severity;
        compiled.weight = def.weight.value_or(default_severity_weight(def.severity));
        if (!(compiled.weight >= 0.0 && compiled.weight <= 1.0)) {
            throw ConfigError(std::format(
                "Rule '{}' weight {} is outside [0,1]", def.name, compiled.weight));
        }

        for (const auto& pattern : def.patterns) {
            if (pattern.empty()) {
                throw ConfigError(std::format("Rule '{}' has an empty pattern", def.name));
            }
            compiled.substrings.push_back(utils::to_lower(pattern));
        }

        for (const auto& expr : def.regex) {
            if (expr.empty()) {
                throw ConfigError(std::format("Rule '{}' has an empty regex", def.name));
            }
            try {
                compiled.regexes.emplace_back(
                    expr, std::regex::ECMAScript | std::regex::icase | std::regex::optimize);
            } catch (const std::regex_error& e) {
                throw ConfigError(std::format(
                    "Rule '{}' regex '{}' is invalid: {}", def.name, expr, e.what()));
            }
        }

        if (std::to_underlying(compiled.severity) > std::to_underlying(max_severity_)) {
            max_severity_ = compiled.severity;
        }
        rules_.push_back(std::move(compiled));
    }
}

std::vector<std::string> RuleEngine::rule_names() const {
    std::vector<std::string> names;
    names.reserve(rules_.size());
    for (const auto& rule : rules_) {
        names.push_back(rule.name);
    }
    return names;
}

// ============================================================================
// Evaluation
// ============================================================================

std::vector<RuleMatch> RuleEngine::evaluate(std::string_view content) const {
    if (!config_.enabled || content.empty() || rules_.empty()) {
        return {};
    }

    // ASCII lower-casing keeps byte offsets identical to the original
    const std::string lowered = utils::to_lower(content);

    std::vector<RuleMatch> matches;
    for (const auto& rule : rules_) {
        const size_t before = matches.size();
        match_rule(rule, content, lowered, matches);

        if (config_.short_circuit && matches.size() > before &&
            rule.severity == max_severity_) {
            break;
        }
    }
    return matches;
}

void RuleEngine::match_rule(const CompiledRule& rule,
                            std::string_view content,
                            std::string_view lowered,
                            std::vector<RuleMatch>& out) const {
    std::vector<Span> spans;

    // Substrings: every occurrence, overlapping ones included
    for (const auto& needle : rule.substrings) {
        size_t found = 0;
        size_t pos = lowered.find(needle);
        while (pos != std::string_view::npos && found < kMaxMatchesPerPattern) {
            spans.push_back({pos, needle.size()});
            ++found;
            pos = lowered.find(needle, pos + 1);
        }
    }

    // Regexes: non-empty matches only
    const char* begin = content.data();
    const char* end = content.data() + content.size();
    for (const auto& re : rule.regexes) {
        size_t found = 0;
        for (std::cregex_iterator it(begin, end, re), last; it != last; ++it) {
            if (found >= kMaxMatchesPerPattern) break;
            const auto& m = *it;
            if (m.length(0) <= 0) continue;
            spans.push_back({static_cast<size_t>(m.position(0)),
                             static_cast<size_t>(m.length(0))});
            ++found;
        }
    }

    if (spans.empty()) {
        return;
    }

    std::sort(spans.begin(), spans.end(), [](const Span& a, const Span& b) {
        return a.offset != b.offset ? a.offset < b.offset : a.length < b.length;
    });
    spans.erase(std::unique(spans.begin(), spans.end()), spans.end());

    for (const auto& span : spans) {
        out.push_back({rule.name, span, rule.severity, rule.weight});
    }
}

} // namespace aegis
