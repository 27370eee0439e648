#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace aegis {

class RuleEngine;

enum class SanitizeMode : uint8_t {
    BLOCK,      // Unsafe content is replaced by an empty string
    STRIP       // Flagged spans are removed, the remainder is returned
};

[[nodiscard]] inline const char* sanitize_mode_to_string(SanitizeMode m) {
    switch (m) {
        case SanitizeMode::BLOCK: return "block";
        case SanitizeMode::STRIP: return "strip";
        default:                  return "unknown";
    }
}

[[nodiscard]] std::optional<SanitizeMode> parse_sanitize_mode(std::string_view name);

/**
 * @brief Produces the payload the caller may forward.
 *
 * Safe verdicts pass content through untouched. Unsafe verdicts are blocked
 * (empty string) or, in STRIP mode, have every flagged span removed. STRIP
 * re-scans its own output with the rule engine and keeps removing until
 * nothing matches; if that does not converge within max_passes, or the
 * verdict came without spans to remove, the content is blocked instead.
 *
 * Spans outside the content are ignored. Never throws on span input.
 */
class Sanitizer {
public:
    struct Config {
        SanitizeMode mode = SanitizeMode::BLOCK;
        uint32_t max_passes = 8;
    };

    Sanitizer() = default;
    Sanitizer(std::shared_ptr<const RuleEngine> rules, Config config);

    [[nodiscard]] std::string sanitize(std::string_view content,
                                       const std::vector<RuleMatch>& matches,
                                       bool verdict_is_safe) const;

    [[nodiscard]] SanitizeMode mode() const { return config_.mode; }

    /**
     * @brief Remove the in-range spans (merged when overlapping), collapse
     * whitespace runs to one space and trim the ends.
     */
    [[nodiscard]] static std::string remove_spans(std::string_view content,
                                                  std::vector<Span> spans);

private:
    std::shared_ptr<const RuleEngine> rules_;
    Config config_;
};

} // namespace aegis
