#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace aegis {

/**
 * @brief Tracks in-flight analyses so shutdown can drain them.
 *
 * After initiate_shutdown() no new request is admitted; wait_for_drain()
 * blocks until the in-flight count reaches zero or the timeout expires.
 */
class ShutdownCoordinator {
public:
    struct Config {
        std::chrono::milliseconds shutdown_timeout{10000};
    };

    ShutdownCoordinator();
    explicit ShutdownCoordinator(const Config& config);

    void initiate_shutdown();

    /// Called at the start of each request. Returns false if shutting down.
    [[nodiscard]] bool try_enter_request();

    void leave_request();

    /// Returns true if drained cleanly, false if timed out.
    [[nodiscard]] bool wait_for_drain();

    [[nodiscard]] bool is_shutting_down() const {
        return shutting_down_.load(std::memory_order_acquire);
    }

    [[nodiscard]] uint32_t in_flight_count() const {
        return in_flight_.load(std::memory_order_acquire);
    }

    /// Requests turned away because shutdown had begun
    [[nodiscard]] uint64_t rejected_count() const {
        return rejected_.load(std::memory_order_relaxed);
    }

private:
    Config config_;
    std::atomic<bool> shutting_down_{false};
    std::atomic<uint32_t> in_flight_{0};
    std::atomic<uint64_t> rejected_{0};
    std::mutex drain_mutex_;
    std::condition_variable drain_cv_;
};

/// Leaves the coordinator on scope exit
struct ShutdownGuard {
    ShutdownCoordinator* sc;
    ~ShutdownGuard() { if (sc) sc->leave_request(); }
};

} // namespace aegis
