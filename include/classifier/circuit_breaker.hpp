#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace aegis {

enum class CircuitState : uint8_t {
    CLOSED,         // Judge reachable, calls pass through
    OPEN,           // Judge failing, calls fail fast
    HALF_OPEN       // Probing recovery with a few calls
};

[[nodiscard]] inline const char* circuit_state_to_string(CircuitState s) {
    switch (s) {
        case CircuitState::CLOSED:    return "closed";
        case CircuitState::OPEN:      return "open";
        case CircuitState::HALF_OPEN: return "half_open";
        default:                      return "unknown";
    }
}

struct CircuitBreakerStats {
    CircuitState state = CircuitState::CLOSED;
    uint64_t consecutive_failures = 0;
    uint64_t half_open_successes = 0;
    uint64_t rejected = 0;
    uint64_t times_opened = 0;
};

/**
 * @brief Fail-fast guard around the outbound classifier call.
 *
 * - CLOSED → OPEN:      failure_threshold consecutive failures
 * - OPEN → HALF_OPEN:   open_timeout elapsed
 * - HALF_OPEN → CLOSED: success_threshold successes
 * - HALF_OPEN → OPEN:   any failure
 *
 * While OPEN the classifier reports ClassifierUnavailable immediately instead
 * of waiting for a connect timeout on every request. State is a single
 * atomic; transitions use compare-exchange so concurrent callers race safely.
 */
class CircuitBreaker {
public:
    struct Config {
        uint32_t failure_threshold = 5;
        uint32_t success_threshold = 2;
        std::chrono::milliseconds open_timeout{10000};
        uint32_t half_open_max_calls = 1;
    };

    CircuitBreaker() : CircuitBreaker(std::string("classifier"), Config{}) {}
    CircuitBreaker(std::string name, const Config& config);

    /**
     * @brief Check if a call can proceed. Every true return must be followed
     * by exactly one record_success() or record_failure().
     */
    [[nodiscard]] bool allow_request();

    void record_success();
    void record_failure();

    [[nodiscard]] CircuitState get_state() const {
        return state_.load(std::memory_order_acquire);
    }

    [[nodiscard]] CircuitBreakerStats get_stats() const;

    /// Force back to CLOSED
    void reset();

    [[nodiscard]] const std::string& name() const { return name_; }

private:
    void trip(CircuitState from);
    void attempt_half_open();
    void close_circuit();

    static int64_t now_ticks() {
        return std::chrono::steady_clock::now().time_since_epoch().count();
    }

    std::string name_;
    Config config_;

    std::atomic<CircuitState> state_{CircuitState::CLOSED};
    std::atomic<uint64_t> consecutive_failures_{0};
    std::atomic<uint64_t> half_open_successes_{0};
    std::atomic<uint64_t> half_open_calls_{0};
    std::atomic<int64_t> opened_at_{0};

    std::atomic<uint64_t> rejected_{0};
    std::atomic<uint64_t> times_opened_{0};
};

} // namespace aegis
