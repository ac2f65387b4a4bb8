#pragma once

#include "objxfer/errors.hpp"
#include "objxfer/progress.hpp"
#include "objxfer/retry_executor.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace objxfer {

using OperationId = uint64_t;

enum class OperationKind {
    List,
    Upload,
    Download,
    Delete,
    UploadDir,
    DownloadDir,
    DeleteDir,
    Copy,
    Presign,
    ListBuckets,
    Head
};

enum class OperationState {
    Queued,
    Active,
    Cancelling,
    Completed,
    Failed,
    Cancelled
};

const char* operation_kind_name(OperationKind kind);
const char* operation_state_name(OperationState state);

inline bool is_terminal(OperationState state) {
    return state == OperationState::Completed ||
           state == OperationState::Failed ||
           state == OperationState::Cancelled;
}

/// Failure information attached to a settled operation.
struct ErrorDetail {
    ErrorKind kind = ErrorKind::Fatal;
    std::string operation;
    std::string code;
    std::string message;
    int attempts = 1;
    std::map<std::string, std::string> details;

    static ErrorDetail from(const OperationError& error);
};

struct ProgressEvent {
    OperationId id = 0;
    ProgressUpdate update;
};

struct StateEvent {
    OperationId id = 0;
    OperationState from = OperationState::Queued;
    OperationState to = OperationState::Queued;
};

/// Terminal event, published exactly once per operation.
struct SettledEvent {
    OperationId id = 0;
    OperationKind kind = OperationKind::List;
    OperationState state = OperationState::Completed;
    bool success = false;
    bool cancelled = false;   // callers should not render this as an error
    std::optional<ErrorDetail> error;
};

struct RetryEvent {
    OperationId id = 0;
    RetryNotice notice;
};

/// Receives operation events. Callbacks run on worker threads (or the thread
/// calling cancel()) and never while registry locks are held.
class OperationObserver {
public:
    virtual ~OperationObserver() = default;

    virtual void on_progress(const ProgressEvent& /*event*/) {}
    virtual void on_state_changed(const StateEvent& /*event*/) {}
    virtual void on_retry(const RetryEvent& /*event*/) {}
    virtual void on_settled(const SettledEvent& /*event*/) {}
};

/// Observer set. Publishing copies the set under the lock and calls out
/// without it, so observers may subscribe/unsubscribe from a callback.
class EventChannel {
public:
    using SubscriptionId = uint64_t;

    SubscriptionId subscribe(std::shared_ptr<OperationObserver> observer);
    void unsubscribe(SubscriptionId id);

    void publish_progress(const ProgressEvent& event);
    void publish_state(const StateEvent& event);
    void publish_retry(const RetryEvent& event);
    void publish_settled(const SettledEvent& event);

private:
    std::vector<std::shared_ptr<OperationObserver>> snapshot() const;

    mutable std::mutex mutex_;
    std::map<SubscriptionId, std::shared_ptr<OperationObserver>> observers_;
    SubscriptionId next_id_ = 1;
};

}  // namespace objxfer
