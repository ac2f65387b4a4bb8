#include "objxfer/cancellation.hpp"
#include "objxfer/errors.hpp"

namespace objxfer {

bool CancellationToken::cancel() {
    if (cancelled_.exchange(true, std::memory_order_acq_rel)) {
        return false;
    }

    // Wake any interruptible sleeper
    {
        std::lock_guard lock(mutex_);
    }
    cv_.notify_all();

    std::lock_guard cb_lock(callback_mutex_);
    auto callbacks = std::move(callbacks_);
    callbacks_.clear();
    for (auto& [id, fn] : callbacks) {
        if (fn) fn();
    }
    return true;
}

void CancellationToken::throw_if_cancelled(const std::string& operation) const {
    if (is_cancelled()) {
        throw make_cancelled(operation);
    }
}

CancellationToken::CallbackId CancellationToken::on_cancel(std::function<void()> fn) {
    {
        std::lock_guard cb_lock(callback_mutex_);
        if (!is_cancelled()) {
            auto id = next_id_++;
            callbacks_.emplace(id, std::move(fn));
            return id;
        }
    }
    if (fn) fn();
    return 0;
}

void CancellationToken::remove_callback(CallbackId id) {
    std::lock_guard cb_lock(callback_mutex_);
    callbacks_.erase(id);
}

bool CancellationToken::sleep_for(std::chrono::milliseconds duration) {
    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, duration, [this] { return is_cancelled(); });
    return !is_cancelled();
}

void CancellationToken::set_deadline(Clock::time_point deadline) {
    std::lock_guard lock(mutex_);
    deadline_ = deadline;
}

std::optional<CancellationToken::Clock::time_point> CancellationToken::deadline() const {
    std::lock_guard lock(mutex_);
    return deadline_;
}

}  // namespace objxfer
