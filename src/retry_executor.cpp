#include "objxfer/retry_executor.hpp"

#include <algorithm>
#include <thread>

namespace objxfer {

std::chrono::milliseconds RetryPolicy::delay_for_retry(int retry) const {
    if (!exponential_backoff || retry <= 1) return base_delay;
    // Cap the shift so large retry counts cannot overflow
    int shift = std::min(retry - 1, 30);
    return base_delay * (int64_t{1} << shift);
}

RetryExecutor::RetryExecutor(RetryPolicy policy, std::shared_ptr<Logger> logger)
    : policy_(std::move(policy))
    , logger_(logger ? std::move(logger) : Logger::null())
    , sleep_fn_([](std::chrono::milliseconds delay, CancellationToken* token) {
          if (token) return token->sleep_for(delay);
          std::this_thread::sleep_for(delay);
          return true;
      }) {}

OperationError RetryExecutor::classify(const std::string& operation,
                                       const StorageError& error,
                                       int attempts,
                                       const std::map<std::string, std::string>& details) const {
    auto code = error.code().empty() ? std::string(CLIENT_ERROR_CODE) : error.code();
    auto kind = policy_.is_retryable(code) ? ErrorKind::Retryable : ErrorKind::Fatal;
    return OperationError(kind, operation, code, error.what(), attempts, details);
}

bool RetryExecutor::backoff(const OperationError& error, int attempt,
                            CancellationToken* token, const RetryListener& on_retry,
                            const std::map<std::string, std::string>& details) const {
    if (error.kind() != ErrorKind::Retryable) return false;

    if (attempt >= policy_.max_attempts()) {
        logger_->warn("%s: giving up after %d attempts: %s: %s",
                      error.operation().c_str(), attempt,
                      error.code().c_str(), error.what());
        return false;
    }

    auto delay = policy_.delay_for_retry(attempt);

    if (token) {
        if (auto deadline = token->deadline()) {
            if (CancellationToken::Clock::now() + delay > *deadline) {
                logger_->warn("%s: retry deadline reached after %d attempts",
                              error.operation().c_str(), attempt);
                return false;
            }
        }
    }

    RetryNotice notice;
    notice.operation = error.operation();
    notice.attempt = attempt;
    notice.max_attempts = policy_.max_attempts();
    notice.delay = delay;
    notice.code = error.code();
    notice.message = error.what();

    logger_->info("%s: %s, retrying in %lldms (attempt %d/%d)",
                  notice.operation.c_str(), notice.code.c_str(),
                  static_cast<long long>(delay.count()),
                  attempt + 1, notice.max_attempts);
    if (on_retry) on_retry(notice);

    if (!sleep_fn_(delay, token)) {
        throw make_cancelled(error.operation(), details);
    }
    return true;
}

}  // namespace objxfer
