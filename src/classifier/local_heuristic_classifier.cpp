#include "classifier/local_heuristic_classifier.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <utility>

namespace aegis {

namespace {

constexpr size_t kMaxHitsPerPattern = 16;

struct GroupSpec {
    const char* name;
    double weight;
    std::vector<const char*> patterns;
};

const std::vector<GroupSpec>& group_specs() {
    static const std::vector<GroupSpec> specs = {
        {"ignore_instructions", 0.9, {
            R"(ignore\s+(all\s+)?(previous|prior|earlier)\s+instructions?)",
            R"(disregard\s+(all\s+)?(previous|prior|earlier))",
            R"(forget\s+(all\s+)?(previous|prior|earlier))",
            R"(overrule\s+(all\s+)?(previous|prior|earlier))",
        }},
        {"role_playing", 0.8, {
            R"(you\s+are\s+now\s+(?:\w+\s+)*mode)",
            R"(act\s+as\s+(?:an?\s+)?\w+)",
            R"(pretend\s+you\s+are)",
            R"(developer\s+mode)",
            R"(debug\s+mode)",
            R"(admin\s+mode)",
        }},
        {"exfiltration", 0.95, {
            R"((output|print|show|reveal|display|repeat)\s+(your|the)\s+(system\s+)?prompt)",
            R"(what\s+(are|were)\s+your\s+(initial|original|system)\s+instructions?)",
            R"(tell\s+me\s+your\s+(secret|internal|confidential))",
            R"(leak\s+your\s+)",
            R"(api\s+key)",
            R"(secret\s+key)",
        }},
        {"encoding_attempts", 0.7, {
            R"(decode\s+(this|the)\s+(base64|hex))",
            R"(base64:[\w+/=]{8})",
            R"((?:[0-9a-f]{2}\s*){10})",
            R"(execute\s+(?:this|the)\s+code)",
            R"(run\s+(?:this|the)\s+command)",
        }},
        {"manipulation_attempts", 0.6, {
            R"(from\s+now\s+on)",
            R"(starting\s+now)",
            R"(new\s+rule:)",
            R"(new\s+instruction:)",
            R"(your\s+new\s+(purpose|task|role))",
        }},
        {"social_engineering", 0.7, {
            R"(as\s+a\s+(developer|admin|engineer|technician))",
            R"(for\s+(debugging|testing|research)\s+purposes)",
            R"(i\s+need\s+(to\s+see|access\s+to))",
            R"(can\s+you\s+(show|reveal|display))",
            R"(could\s+you\s+(share|provide|give))",
            R"(would\s+you\s+mind\s+(showing|sharing))",
            R"(in\s+my\s+(role|position|capacity))",
            R"(required\s+for\s+my\s+(work|job|task))",
        }},
    };
    return specs;
}

// (prefix, suffix) pairs; an empty suffix matches on the prefix alone
constexpr std::pair<std::string_view, std::string_view> kSocialEngineeringCues[] = {
    {"as a", "developer"}, {"as an", "admin"}, {"for debugging", ""},
    {"to help", "you"}, {"i need", "access"}, {"can you", "show"},
    {"could you", "reveal"}, {"would you", "mind"}, {"for research", ""},
    {"to test", "system"},
};

constexpr std::string_view kAuthorityCues[] = {
    "i am a", "i am the", "as the", "in my role as", "required for my",
    "necessary for", "need to see", "should have access", "entitled to",
};

constexpr std::string_view kProbingCues[] = {
    "how do you work", "how are you configured", "what is your",
    "tell me about your", "explain your", "describe your",
};

} // anonymous namespace

LocalHeuristicClassifier::LocalHeuristicClassifier()
    : benign_terms_{"weather", "sales", "report", "customer", "business",
                    "question", "help", "information", "data", "analysis"} {
    for (const auto& spec : group_specs()) {
        PatternGroup group{spec.name, spec.weight, {}};
        for (const char* pattern : spec.patterns) {
            group.patterns.emplace_back(pattern, std::regex::ECMAScript | std::regex::icase);
        }
        max_score_ += spec.weight;
        groups_.push_back(std::move(group));
    }
}

std::vector<std::string> LocalHeuristicClassifier::semantic_cues(std::string_view lowered) const {
    std::vector<std::string> cues;

    for (const auto& [prefix, suffix] : kSocialEngineeringCues) {
        if (lowered.contains(prefix) && (suffix.empty() || lowered.contains(suffix))) {
            cues.emplace_back("social_engineering");
        }
    }
    for (const auto phrase : kAuthorityCues) {
        if (lowered.contains(phrase)) cues.emplace_back("authority_assertion");
    }
    for (const auto phrase : kProbingCues) {
        if (lowered.contains(phrase)) cues.emplace_back("probing_question");
    }
    return cues;
}

Result<ClassifierVerdict> LocalHeuristicClassifier::classify(
    std::string_view content,
    const ClassificationContext& /*context*/,
    const CancellationToken* /*cancel*/) {

    invocations_.fetch_add(1, std::memory_order_relaxed);

    ClassifierVerdict verdict;
    double score = 0.0;

    auto add_label = [&verdict](const std::string& label) {
        if (std::find(verdict.threat_labels.begin(), verdict.threat_labels.end(), label) ==
            verdict.threat_labels.end()) {
            verdict.threat_labels.push_back(label);
        }
    };

    const char* begin = content.data();
    const char* end = content.data() + content.size();

    // Phase 1: weighted pattern groups, every occurrence counts
    for (const auto& group : groups_) {
        for (const auto& re : group.patterns) {
            size_t hits = 0;
            for (std::cregex_iterator it(begin, end, re), last;
                 it != last && hits < kMaxHitsPerPattern; ++it) {
                if (it->length(0) <= 0) continue;
                score += group.weight;
                ++hits;
            }
            if (hits > 0) add_label(group.name);
        }
    }

    // Phase 2: semantic cues
    const std::string lowered = utils::to_lower(content);
    for (const auto& cue : semantic_cues(lowered)) {
        score += kSemanticCueWeight;
        add_label(cue);
    }

    // Phase 3: verdict and confidence
    verdict.is_safe = score < kUnsafeThreshold;
    if (verdict.is_safe) {
        double confidence = max_score_ > 0.0 ? 1.0 - (score / max_score_) : 0.5;
        const bool benign = std::any_of(benign_terms_.begin(), benign_terms_.end(),
            [&lowered](const std::string& term) { return lowered.contains(term); });
        if (benign) confidence += kBenignBonus;
        verdict.raw_confidence = std::clamp(confidence, 0.1, 1.0);
    } else {
        verdict.raw_confidence = std::clamp(score, 0.1, 1.0);
    }

    return Result<ClassifierVerdict>::ok(std::move(verdict));
}

} // namespace aegis
