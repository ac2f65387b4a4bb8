#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace objxfer {

/// Cooperative cancellation token passed down through every layer
/// (WorkerManager -> DirectoryTransfer -> ObjectTransfer -> RetryExecutor).
///
/// is_cancelled() is a lock-free flag read, safe to poll from backend
/// progress callbacks running on backend-internal threads. Callbacks
/// registered with on_cancel() run once, on the thread that calls cancel().
class CancellationToken {
public:
    using CallbackId = uint64_t;
    using Clock = std::chrono::steady_clock;

    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    /// Request cancellation. Returns true if this call flipped the flag.
    bool cancel();

    bool is_cancelled() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }

    /// Throws OperationError(Cancelled) if cancellation was requested.
    void throw_if_cancelled(const std::string& operation) const;

    /// Register a callback run on cancellation. If the token is already
    /// cancelled the callback runs immediately and 0 is returned.
    CallbackId on_cancel(std::function<void()> fn);

    /// Unregister a callback. Once this returns the callback will not start.
    void remove_callback(CallbackId id);

    /// Sleep up to `duration`, waking early on cancellation.
    /// Returns false if the token was cancelled.
    bool sleep_for(std::chrono::milliseconds duration);

    /// Overall deadline for long-running retry loops (optional).
    void set_deadline(Clock::time_point deadline);
    std::optional<Clock::time_point> deadline() const;

private:
    std::atomic<bool> cancelled_{false};

    mutable std::mutex mutex_;          // protects deadline_, sleep cv
    std::condition_variable cv_;
    std::optional<Clock::time_point> deadline_;

    std::mutex callback_mutex_;         // held while callbacks run
    std::map<CallbackId, std::function<void()>> callbacks_;
    CallbackId next_id_ = 1;
};

/// RAII registration of a cancellation callback.
class CancellationRegistration {
public:
    CancellationRegistration(CancellationToken& token, std::function<void()> fn)
        : token_(token), id_(token.on_cancel(std::move(fn))) {}

    ~CancellationRegistration() {
        if (id_ != 0) token_.remove_callback(id_);
    }

    CancellationRegistration(const CancellationRegistration&) = delete;
    CancellationRegistration& operator=(const CancellationRegistration&) = delete;

private:
    CancellationToken& token_;
    CancellationToken::CallbackId id_;
};

}  // namespace objxfer
