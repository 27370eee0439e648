#include "classifier/circuit_breaker.hpp"
#include "core/utils.hpp"

#include <format>

namespace aegis {

CircuitBreaker::CircuitBreaker(std::string name, const Config& config)
    : name_(std::move(name)),
      config_(config) {}

bool CircuitBreaker::allow_request() {
    switch (state_.load(std::memory_order_acquire)) {
        case CircuitState::CLOSED:
            return true;

        case CircuitState::OPEN: {
            const auto opened = std::chrono::steady_clock::time_point(
                std::chrono::steady_clock::duration(opened_at_.load(std::memory_order_acquire)));
            const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - opened);

            if (elapsed < config_.open_timeout) {
                rejected_.fetch_add(1, std::memory_order_relaxed);
                return false;
            }
            attempt_half_open();
            [[fallthrough]];
        }

        case CircuitState::HALF_OPEN: {
            // Reserve a probe slot
            uint64_t calls = half_open_calls_.load(std::memory_order_acquire);
            while (calls < config_.half_open_max_calls) {
                if (half_open_calls_.compare_exchange_weak(calls, calls + 1,
                                                           std::memory_order_acq_rel)) {
                    return true;
                }
            }
            rejected_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
    }

    return false;
}

void CircuitBreaker::record_success() {
    const CircuitState current = state_.load(std::memory_order_acquire);

    if (current == CircuitState::HALF_OPEN) {
        if (half_open_calls_.load(std::memory_order_acquire) > 0) {
            half_open_calls_.fetch_sub(1, std::memory_order_acq_rel);
        }
        const uint64_t successes =
            half_open_successes_.fetch_add(1, std::memory_order_acq_rel) + 1;
        if (successes >= config_.success_threshold) {
            close_circuit();
        }
    } else if (current == CircuitState::CLOSED) {
        consecutive_failures_.store(0, std::memory_order_relaxed);
    }
}

void CircuitBreaker::record_failure() {
    const CircuitState current = state_.load(std::memory_order_acquire);

    if (current == CircuitState::HALF_OPEN) {
        // Any failure while probing reopens the circuit
        trip(CircuitState::HALF_OPEN);
    } else if (current == CircuitState::CLOSED) {
        const uint64_t failures =
            consecutive_failures_.fetch_add(1, std::memory_order_acq_rel) + 1;
        if (failures >= config_.failure_threshold) {
            trip(CircuitState::CLOSED);
        }
    }
}

CircuitBreakerStats CircuitBreaker::get_stats() const {
    CircuitBreakerStats stats;
    stats.state = state_.load(std::memory_order_acquire);
    stats.consecutive_failures = consecutive_failures_.load(std::memory_order_relaxed);
    stats.half_open_successes = half_open_successes_.load(std::memory_order_relaxed);
    stats.rejected = rejected_.load(std::memory_order_relaxed);
    stats.times_opened = times_opened_.load(std::memory_order_relaxed);
    return stats;
}

void CircuitBreaker::reset() {
    state_.store(CircuitState::CLOSED, std::memory_order_release);
    consecutive_failures_.store(0, std::memory_order_relaxed);
    half_open_successes_.store(0, std::memory_order_relaxed);
    half_open_calls_.store(0, std::memory_order_relaxed);
    opened_at_.store(0, std::memory_order_relaxed);
}

void CircuitBreaker::trip(CircuitState from) {
    CircuitState expected = from;
    if (state_.compare_exchange_strong(expected, CircuitState::OPEN,
                                       std::memory_order_acq_rel,
                                       std::memory_order_acquire)) {
        opened_at_.store(now_ticks(), std::memory_order_release);
        half_open_calls_.store(0, std::memory_order_relaxed);
        times_opened_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("Circuit breaker '{}' opened", name_));
    }
}

void CircuitBreaker::attempt_half_open() {
    CircuitState expected = CircuitState::OPEN;
    if (state_.compare_exchange_strong(expected, CircuitState::HALF_OPEN,
                                       std::memory_order_acq_rel,
                                       std::memory_order_acquire)) {
        half_open_successes_.store(0, std::memory_order_relaxed);
        half_open_calls_.store(0, std::memory_order_relaxed);
        utils::log::info(std::format("Circuit breaker '{}' half-open, probing", name_));
    }
}

void CircuitBreaker::close_circuit() {
    CircuitState expected = CircuitState::HALF_OPEN;
    if (state_.compare_exchange_strong(expected, CircuitState::CLOSED,
                                       std::memory_order_acq_rel,
                                       std::memory_order_acquire)) {
        consecutive_failures_.store(0, std::memory_order_relaxed);
        half_open_successes_.store(0, std::memory_order_relaxed);
        half_open_calls_.store(0, std::memory_order_relaxed);
        utils::log::info(std::format("Circuit breaker '{}' closed", name_));
    }
}

} // namespace aegis
