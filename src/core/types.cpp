#include "core/types.hpp"
#include "core/utils.hpp"

#include <string>
#include <unordered_map>

namespace aegis {

SourceType parse_source_type(std::string_view str) {
    static const std::unordered_map<std::string, SourceType> lookup = {
        {"chat",  SourceType::CHAT},
        {"email", SourceType::EMAIL},
        {"crm",   SourceType::CRM},
        {"file",  SourceType::FILE},
        {"api",   SourceType::API},
        {"test",  SourceType::TEST},
    };

    const auto it = lookup.find(utils::to_lower(utils::trim(std::string(str))));
    return (it != lookup.end()) ? it->second : SourceType::UNKNOWN;
}

std::optional<Severity> parse_severity(std::string_view str) {
    const std::string lower = utils::to_lower(utils::trim(std::string(str)));
    if (lower == "low") return Severity::LOW;
    if (lower == "medium") return Severity::MEDIUM;
    if (lower == "high") return Severity::HIGH;
    if (lower == "critical") return Severity::CRITICAL;
    return std::nullopt;
}

} // namespace aegis
