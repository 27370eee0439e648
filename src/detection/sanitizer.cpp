#include "detection/sanitizer.hpp"
#include "rules/rule_engine.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <utility>

namespace aegis {

std::optional<SanitizeMode> parse_sanitize_mode(std::string_view name) {
    const std::string lower = utils::to_lower(name);
    if (lower == "block") return SanitizeMode::BLOCK;
    if (lower == "strip") return SanitizeMode::STRIP;
    return std::nullopt;
}

Sanitizer::Sanitizer(std::shared_ptr<const RuleEngine> rules, Config config)
    : rules_(std::move(rules)), config_(config) {}

std::string Sanitizer::remove_spans(std::string_view content, std::vector<Span> spans) {
    // Drop spans that do not fit the content
    std::erase_if(spans, [&content](const Span& s) {
        return s.length == 0 || s.offset >= content.size() ||
               s.length > content.size() - s.offset;
    });
    std::sort(spans.begin(), spans.end(), [](const Span& a, const Span& b) {
        return a.offset < b.offset;
    });

    std::string kept;
    kept.reserve(content.size());
    size_t cursor = 0;
    for (const auto& span : spans) {
        if (span.end() <= cursor) continue;                 // Fully inside a removed range
        if (span.offset > cursor) {
            kept.append(content.substr(cursor, span.offset - cursor));
            kept += ' ';                                    // Keep words apart
        }
        cursor = span.end();
    }
    if (cursor < content.size()) {
        kept.append(content.substr(cursor));
    }

    // Collapse whitespace
    std::string out;
    out.reserve(kept.size());
    bool in_space = false;
    for (const char c : kept) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            in_space = true;
            continue;
        }
        if (in_space && !out.empty()) out += ' ';
        in_space = false;
        out += c;
    }
    return out;
}

std::string Sanitizer::sanitize(std::string_view content,
                                const std::vector<RuleMatch>& matches,
                                bool verdict_is_safe) const {
    if (verdict_is_safe) {
        return std::string(content);
    }

    if (config_.mode == SanitizeMode::BLOCK || matches.empty()) {
        return "";
    }

    std::vector<Span> spans;
    spans.reserve(matches.size());
    for (const auto& m : matches) {
        spans.push_back(m.matched_span);
    }

    std::string current = remove_spans(content, std::move(spans));
    if (!rules_) {
        return current;
    }

    // Removing text can create new matches ("ign<x>ore previous"), so re-scan
    for (uint32_t pass = 0; pass < config_.max_passes && !current.empty(); ++pass) {
        const auto residual = rules_->evaluate(current);
        if (residual.empty()) {
            return current;
        }
        std::vector<Span> next;
        next.reserve(residual.size());
        for (const auto& m : residual) {
            next.push_back(m.matched_span);
        }
        current = remove_spans(current, std::move(next));
    }

    if (!current.empty() && !rules_->evaluate(current).empty()) {
        utils::log::warn(std::format(
            "Sanitizer did not converge after {} passes, blocking", config_.max_passes));
        return "";
    }
    return current;
}

} // namespace aegis
