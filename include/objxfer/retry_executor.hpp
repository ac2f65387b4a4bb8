#pragma once

#include "objxfer/cancellation.hpp"
#include "objxfer/errors.hpp"
#include "objxfer/logger.hpp"
#include "objxfer/storage_backend.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <type_traits>

namespace objxfer {

/// Retry configuration. Immutable once loaded; shared read-only by every
/// RetryExecutor::execute() call.
struct RetryPolicy {
    int max_retries = 5;
    std::chrono::milliseconds base_delay{1000};
    bool exponential_backoff = true;
    std::set<std::string> retryable_codes = default_retryable_codes();

    /// Delay before the Nth retry (1-based): base * 2^(N-1), or base when
    /// exponential backoff is disabled.
    std::chrono::milliseconds delay_for_retry(int retry) const;

    bool is_retryable(const std::string& code) const {
        return retryable_codes.count(code) > 0;
    }

    int max_attempts() const { return max_retries + 1; }
};

/// Published before each backoff sleep.
struct RetryNotice {
    std::string operation;
    int attempt = 0;          // attempt that just failed (1-based)
    int max_attempts = 0;
    std::chrono::milliseconds delay{0};
    std::string code;
    std::string message;
};

using RetryListener = std::function<void(const RetryNotice&)>;

/// Sleep used between attempts. Returns false if woken by cancellation.
using SleepFunction = std::function<bool(std::chrono::milliseconds, CancellationToken*)>;

/// Runs backend calls, classifying failures as retryable or fatal and
/// backing off between attempts.
///
/// StorageError codes in the policy's retryable set are retried up to
/// max_retries times. Every other StorageError is fatal and surfaces at once.
/// Any other exception is wrapped as a fatal OperationError with code
/// ClientError. Cancellation is never retried.
class RetryExecutor {
public:
    explicit RetryExecutor(RetryPolicy policy,
                           std::shared_ptr<Logger> logger = Logger::null());

    const RetryPolicy& policy() const { return policy_; }

    /// Replace the backoff sleep (tests record delays instead of sleeping).
    void set_sleep_function(SleepFunction fn) { sleep_fn_ = std::move(fn); }

    template <typename Fn>
    std::invoke_result_t<Fn&> execute(const std::string& operation,
                                      Fn&& fn,
                                      CancellationToken* token = nullptr,
                                      const RetryListener& on_retry = {},
                                      const std::map<std::string, std::string>& details = {}) const;

    /// Classify a backend error into the orchestration error shape.
    OperationError classify(const std::string& operation,
                            const StorageError& error,
                            int attempts,
                            const std::map<std::string, std::string>& details) const;

private:
    // Decide whether to retry after `error` on `attempt`. Sleeps for the
    // backoff delay and returns true to retry. Throws Cancelled if the
    // token fires during the sleep.
    bool backoff(const OperationError& error, int attempt,
                 CancellationToken* token, const RetryListener& on_retry,
                 const std::map<std::string, std::string>& details) const;

    RetryPolicy policy_;
    std::shared_ptr<Logger> logger_;
    SleepFunction sleep_fn_;
};

template <typename Fn>
std::invoke_result_t<Fn&> RetryExecutor::execute(
    const std::string& operation,
    Fn&& fn,
    CancellationToken* token,
    const RetryListener& on_retry,
    const std::map<std::string, std::string>& details) const {
    for (int attempt = 1;; ++attempt) {
        if (token && token->is_cancelled()) {
            throw make_cancelled(operation, details);
        }

        std::optional<OperationError> failure;
        try {
            return fn();
        } catch (const OperationError& e) {
            if (e.kind() != ErrorKind::Retryable) throw;
            failure = OperationError(e.kind(), operation, e.code(), e.what(),
                                     attempt, details).with_details(e.details());
        } catch (const StorageError& e) {
            // An abort triggered by our own token is a cancellation
            if (token && token->is_cancelled()) {
                throw make_cancelled(operation, details);
            }
            failure = classify(operation, e, attempt, details);
        } catch (const std::exception& e) {
            if (token && token->is_cancelled()) {
                throw make_cancelled(operation, details);
            }
            throw OperationError(ErrorKind::Fatal, operation, CLIENT_ERROR_CODE,
                                 e.what(), attempt, details);
        }

        if (!backoff(*failure, attempt, token, on_retry, details)) {
            throw *failure;
        }
    }
}

}  // namespace objxfer
