#pragma once

#include "classifier/secondary_classifier.hpp"

#include <atomic>
#include <cstdint>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace aegis {

/**
 * @brief Offline secondary classifier using weighted heuristics.
 *
 * Scores every occurrence of a weighted threat pattern group, adds 0.3 per
 * semantic cue (authority assertions, probing questions, social engineering
 * phrasing), and calls the content unsafe once the score reaches
 * kUnsafeThreshold. Never fails and never blocks on I/O, so it is used where
 * no judge service is reachable.
 *
 * raw_confidence for a safe verdict is 1 - score/max_score (+0.2 when benign
 * business vocabulary is present); for an unsafe verdict it is the score
 * itself. Both are clamped to [0.1, 1.0].
 */
class LocalHeuristicClassifier : public ISecondaryClassifier {
public:
    static constexpr double kUnsafeThreshold = 0.3;
    static constexpr double kSemanticCueWeight = 0.3;
    static constexpr double kBenignBonus = 0.2;

    LocalHeuristicClassifier();

    [[nodiscard]] Result<ClassifierVerdict> classify(
        std::string_view content,
        const ClassificationContext& context,
        const CancellationToken* cancel) override;

    [[nodiscard]] const char* name() const override { return "local_heuristic"; }

    [[nodiscard]] ClassifierHealth health() const override {
        return ClassifierHealth::OPERATIONAL;
    }

    [[nodiscard]] uint64_t invocations() const {
        return invocations_.load(std::memory_order_relaxed);
    }

private:
    struct PatternGroup {
        std::string name;
        double weight;
        std::vector<std::regex> patterns;
    };

    [[nodiscard]] std::vector<std::string> semantic_cues(std::string_view lowered) const;

    std::vector<PatternGroup> groups_;
    std::vector<std::string> benign_terms_;
    double max_score_ = 0.0;

    std::atomic<uint64_t> invocations_{0};
};

} // namespace aegis
