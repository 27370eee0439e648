#include "rules/rule_library.hpp"

namespace aegis {

std::vector<RuleDefinition> default_rules() {
    std::vector<RuleDefinition> rules;

    rules.push_back({
        .name = "ignore_previous_patterns",
        .severity = Severity::CRITICAL,
        .weight = std::nullopt,
        .patterns = {"ignore previous", "ignore the above"},
        .regex = {
            R"(ignore\s+(your\s+|all\s+)?(previous|prior|earlier)\s+instructions?)",
            R"(disregard\s+(all\s+)?(previous|prior|earlier))",
            R"(forget\s+(all\s+)?(previous|prior|earlier))",
            R"(overrule\s+(all\s+)?(previous|prior|earlier))",
        },
    });

    rules.push_back({
        .name = "exfiltration",
        .severity = Severity::CRITICAL,
        .weight = std::nullopt,
        .patterns = {"api key", "secret key"},
        .regex = {
            R"((output|print|show|reveal|display|repeat)\s+(your|the)\s+(system\s+)?prompt)",
            R"(what\s+(are|were)\s+your\s+(initial|original|system)\s+instructions?)",
            R"(tell\s+me\s+your\s+(secret|internal|confidential))",
        },
    });

    rules.push_back({
        .name = "direct_injection",
        .severity = Severity::CRITICAL,
        .weight = std::nullopt,
        .patterns = {},
        .regex = {
            R"(ignore\s+all\s+prior)",
            R"(disregard\s+all\s+previous)",
        },
    });

    rules.push_back({
        .name = "role_playing",
        .severity = Severity::HIGH,
        .weight = 0.8,
        .patterns = {"developer mode", "admin mode", "debug mode"},
        .regex = {
            R"(you\s+are\s+now\s+(a|an|in|operating)\b)",
            R"(pretend\s+you\s+are)",
        },
    });

    rules.push_back({
        .name = "encoding_attempts",
        .severity = Severity::MEDIUM,
        .weight = std::nullopt,
        .patterns = {"base64"},
        .regex = {
            R"([0-9a-f]{20})",
            R"(decode\s+(this|the))",
        },
    });

    rules.push_back({
        .name = "manipulation_attempts",
        .severity = Severity::MEDIUM,
        .weight = 0.6,
        .patterns = {"new rule:", "new instruction:"},
        .regex = {
            R"(from\s+now\s+on)",
            R"(your\s+new\s+(purpose|task|role))",
        },
    });

    rules.push_back({
        .name = "probing_question",
        .severity = Severity::LOW,
        .weight = std::nullopt,
        .patterns = {"tell me about your"},
        .regex = {},
    });

    return rules;
}

} // namespace aegis
