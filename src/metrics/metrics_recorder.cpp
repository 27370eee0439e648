#include "metrics/metrics_recorder.hpp"

#include <algorithm>
#include <format>

namespace aegis {

// ============================================================================
// MetricsSnapshot
// ============================================================================

double MetricsSnapshot::block_rate() const {
    if (total_requests == 0) return 0.0;
    return static_cast<double>(blocked_requests) * 100.0 /
           static_cast<double>(total_requests);
}

std::string MetricsSnapshot::block_rate_string() const {
    return std::format("{:.2f}%", block_rate());
}

std::vector<std::pair<std::string, uint64_t>> MetricsSnapshot::top_threats(size_t n) const {
    std::vector<std::pair<std::string, uint64_t>> sorted(
        threat_histogram.begin(), threat_histogram.end());
    std::sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) {
        return a.second != b.second ? a.second > b.second : a.first < b.first;
    });
    if (sorted.size() > n) {
        sorted.resize(n);
    }
    return sorted;
}

// ============================================================================
// MetricsRecorder
// ============================================================================

MetricsRecorder::MetricsRecorder(Config config)
    : window_(std::max<size_t>(1, config.latency_window)) {
    latencies_.reserve(window_);
}

void MetricsRecorder::record(const AnalysisResult& result) {
    const double latency = std::max(0.0, result.processing_time);

    std::lock_guard lock(mutex_);

    ++total_requests_;
    if (!result.is_safe) {
        ++blocked_requests_;
    }
    for (const auto& label : result.detected_threats) {
        ++threat_histogram_[label];
    }

    if (result.classifier_invoked) {
        ++classifier_invocations_;
    }
    if (result.path == DecisionPath::CLASSIFIER_ERROR ||
        result.path == DecisionPath::CLASSIFIER_DEGRADED) {
        ++classifier_failures_;
    }
    if (result.path == DecisionPath::INPUT_REJECTED) {
        ++inputs_rejected_;
    }

    if (latencies_.size() < window_) {
        latencies_.push_back(latency);
    } else {
        latency_sum_ -= latencies_[next_slot_];
        latencies_[next_slot_] = latency;
    }
    latency_sum_ += latency;
    next_slot_ = (next_slot_ + 1) % window_;
}

MetricsSnapshot MetricsRecorder::snapshot() const {
    std::lock_guard lock(mutex_);

    MetricsSnapshot snap;
    snap.total_requests = total_requests_;
    snap.blocked_requests = blocked_requests_;
    snap.threat_histogram = threat_histogram_;
    snap.latency_samples = latencies_.size();
    snap.avg_processing_time = latencies_.empty()
        ? 0.0
        : std::max(0.0, latency_sum_ / static_cast<double>(latencies_.size()));
    snap.classifier_invocations = classifier_invocations_;
    snap.classifier_failures = classifier_failures_;
    snap.inputs_rejected = inputs_rejected_;
    return snap;
}

void MetricsRecorder::reset() {
    std::lock_guard lock(mutex_);
    total_requests_ = 0;
    blocked_requests_ = 0;
    classifier_invocations_ = 0;
    classifier_failures_ = 0;
    inputs_rejected_ = 0;
    threat_histogram_.clear();
    latencies_.clear();
    next_slot_ = 0;
    latency_sum_ = 0.0;
}

} // namespace aegis
