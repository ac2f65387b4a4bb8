#include "objxfer/operation_events.hpp"

namespace objxfer {

const char* operation_kind_name(OperationKind kind) {
    switch (kind) {
        case OperationKind::List: return "list";
        case OperationKind::Upload: return "upload";
        case OperationKind::Download: return "download";
        case OperationKind::Delete: return "delete";
        case OperationKind::UploadDir: return "upload_dir";
        case OperationKind::DownloadDir: return "download_dir";
        case OperationKind::DeleteDir: return "delete_dir";
        case OperationKind::Copy: return "copy";
        case OperationKind::Presign: return "presign";
        case OperationKind::ListBuckets: return "list_buckets";
        case OperationKind::Head: return "head";
    }
    return "unknown";
}

const char* operation_state_name(OperationState state) {
    switch (state) {
        case OperationState::Queued: return "queued";
        case OperationState::Active: return "active";
        case OperationState::Cancelling: return "cancelling";
        case OperationState::Completed: return "completed";
        case OperationState::Failed: return "failed";
        case OperationState::Cancelled: return "cancelled";
    }
    return "unknown";
}

ErrorDetail ErrorDetail::from(const OperationError& error) {
    ErrorDetail detail;
    detail.kind = error.kind();
    detail.operation = error.operation();
    detail.code = error.code();
    detail.message = error.what();
    detail.attempts = error.attempts();
    detail.details = error.details();
    return detail;
}

// --- EventChannel ---

EventChannel::SubscriptionId EventChannel::subscribe(std::shared_ptr<OperationObserver> observer) {
    std::lock_guard lock(mutex_);
    auto id = next_id_++;
    observers_.emplace(id, std::move(observer));
    return id;
}

void EventChannel::unsubscribe(SubscriptionId id) {
    std::lock_guard lock(mutex_);
    observers_.erase(id);
}

std::vector<std::shared_ptr<OperationObserver>> EventChannel::snapshot() const {
    std::lock_guard lock(mutex_);
    std::vector<std::shared_ptr<OperationObserver>> out;
    out.reserve(observers_.size());
    for (const auto& [id, observer] : observers_) {
        out.push_back(observer);
    }
    return out;
}

void EventChannel::publish_progress(const ProgressEvent& event) {
    for (auto& observer : snapshot()) observer->on_progress(event);
}

void EventChannel::publish_state(const StateEvent& event) {
    for (auto& observer : snapshot()) observer->on_state_changed(event);
}

void EventChannel::publish_retry(const RetryEvent& event) {
    for (auto& observer : snapshot()) observer->on_retry(event);
}

void EventChannel::publish_settled(const SettledEvent& event) {
    for (auto& observer : snapshot()) observer->on_settled(event);
}

}  // namespace objxfer
