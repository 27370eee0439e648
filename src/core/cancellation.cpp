#include "core/cancellation.hpp"

namespace aegis {

void CancellationToken::Registration::reset() {
    if (token_) {
        token_->unregister(id_);
        token_ = nullptr;
    }
}

void CancellationToken::cancel() {
    std::lock_guard lock(mutex_);
    if (cancelled_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    for (auto& [id, cb] : callbacks_) {
        cb();
    }
    callbacks_.clear();
}

CancellationToken::Registration CancellationToken::on_cancel(std::function<void()> callback) {
    std::lock_guard lock(mutex_);
    if (cancelled_.load(std::memory_order_acquire)) {
        callback();
        return {};
    }
    const uint64_t id = next_id_++;
    callbacks_.emplace(id, std::move(callback));
    return {this, id};
}

void CancellationToken::unregister(uint64_t id) {
    std::lock_guard lock(mutex_);
    callbacks_.erase(id);
}

} // namespace aegis
