#pragma once

#include "core/types.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace aegis {

/**
 * @brief Point-in-time copy of the process-wide counters.
 */
struct MetricsSnapshot {
    uint64_t total_requests = 0;
    uint64_t blocked_requests = 0;
    std::map<std::string, uint64_t> threat_histogram;
    double avg_processing_time = 0.0;       // seconds, over the rolling window
    size_t latency_samples = 0;

    uint64_t classifier_invocations = 0;
    uint64_t classifier_failures = 0;
    uint64_t inputs_rejected = 0;

    /// blocked / total * 100, 0 when nothing was recorded
    [[nodiscard]] double block_rate() const;

    /// "12.50%"
    [[nodiscard]] std::string block_rate_string() const;

    /// Highest counts first, ties by label
    [[nodiscard]] std::vector<std::pair<std::string, uint64_t>> top_threats(size_t n) const;
};

/**
 * @brief The single shared-mutable object of the detection pipeline.
 *
 * Every completed AnalysisResult is recorded once. A short-held mutex keeps
 * the counters, histogram and latency window mutually consistent, so a
 * snapshot never observes a half-applied record().
 */
class MetricsRecorder {
public:
    struct Config {
        size_t latency_window = 1000;
    };

    MetricsRecorder() : MetricsRecorder(Config{}) {}
    explicit MetricsRecorder(Config config);

    void record(const AnalysisResult& result);

    [[nodiscard]] MetricsSnapshot snapshot() const;

    /// Back to zero (restart semantics, used by tests)
    void reset();

private:
    const size_t window_;

    mutable std::mutex mutex_;
    uint64_t total_requests_ = 0;
    uint64_t blocked_requests_ = 0;
    uint64_t classifier_invocations_ = 0;
    uint64_t classifier_failures_ = 0;
    uint64_t inputs_rejected_ = 0;
    std::map<std::string, uint64_t> threat_histogram_;

    // Ring buffer of the last window_ processing times
    std::vector<double> latencies_;
    size_t next_slot_ = 0;
    double latency_sum_ = 0.0;
};

} // namespace aegis
