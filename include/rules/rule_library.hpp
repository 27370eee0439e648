#pragma once

#include "rules/rule_engine.hpp"

#include <vector>

namespace aegis {

/**
 * @brief Built-in signature set used when configuration defines no rules.
 *
 * Covers instruction override, role-play jailbreaks, system prompt
 * exfiltration, encoded payloads, manipulation and probing questions.
 */
[[nodiscard]] std::vector<RuleDefinition> default_rules();

} // namespace aegis
