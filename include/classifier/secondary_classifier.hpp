#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace aegis {

class CancellationToken;

/**
 * @brief What the classifier may know about a request besides its content.
 * Never contains instructions; only metadata that is delimited as data.
 */
struct ClassificationContext {
    SourceType source_type = SourceType::UNKNOWN;
    std::vector<std::string> rule_labels;   // Rules that already fired
};

enum class ClassifierHealth : uint8_t {
    OPERATIONAL,
    DEGRADED,       // Circuit open or recent failures
    DISABLED
};

[[nodiscard]] inline const char* classifier_health_to_string(ClassifierHealth h) {
    switch (h) {
        case ClassifierHealth::OPERATIONAL: return "operational";
        case ClassifierHealth::DEGRADED:    return "degraded";
        case ClassifierHealth::DISABLED:    return "disabled";
        default:                            return "unknown";
    }
}

/**
 * @brief Secondary judge consulted when rule matches are not decisive.
 *
 * Implementations must never turn a failure into a safe verdict: timeouts,
 * transport errors and unparseable output are returned as
 * ErrorCategory::CLASSIFIER_UNAVAILABLE. Must be safe to call concurrently.
 */
class ISecondaryClassifier {
public:
    virtual ~ISecondaryClassifier() = default;

    [[nodiscard]] virtual Result<ClassifierVerdict> classify(
        std::string_view content,
        const ClassificationContext& context,
        const CancellationToken* cancel) = 0;

    [[nodiscard]] virtual const char* name() const = 0;

    [[nodiscard]] virtual ClassifierHealth health() const = 0;
};

} // namespace aegis
