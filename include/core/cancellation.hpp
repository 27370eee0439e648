#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

namespace aegis {

/**
 * @brief Cooperative cancellation flag shared between a caller and the
 * blocking work it started (the outbound classifier call).
 *
 * cancel() is sticky and idempotent. Callbacks registered with on_cancel()
 * run exactly once, either inside cancel() or immediately when registered
 * on an already-cancelled token. Callbacks run under the token's lock, so a
 * Registration destructor never returns while its callback is executing.
 */
class CancellationToken {
public:
    class Registration {
    public:
        Registration() = default;
        Registration(CancellationToken* token, uint64_t id) : token_(token), id_(id) {}
        ~Registration() { reset(); }

        Registration(const Registration&) = delete;
        Registration& operator=(const Registration&) = delete;

        Registration(Registration&& other) noexcept
            : token_(other.token_), id_(other.id_) {
            other.token_ = nullptr;
        }

        Registration& operator=(Registration&& other) noexcept {
            if (this != &other) {
                reset();
                token_ = other.token_;
                id_ = other.id_;
                other.token_ = nullptr;
            }
            return *this;
        }

        void reset();

    private:
        CancellationToken* token_ = nullptr;
        uint64_t id_ = 0;
    };

    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel();

    [[nodiscard]] bool is_cancelled() const {
        return cancelled_.load(std::memory_order_acquire);
    }

    /// Register a callback; the returned handle unregisters it on destruction.
    [[nodiscard]] Registration on_cancel(std::function<void()> callback);

private:
    void unregister(uint64_t id);

    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::map<uint64_t, std::function<void()>> callbacks_;
    uint64_t next_id_ = 1;
};

} // namespace aegis
