#include "objxfer/operation_registry.hpp"

#include <algorithm>

namespace objxfer {

bool OperationRegistry::can_transition(OperationState from, OperationState to) {
    using S = OperationState;
    switch (from) {
        case S::Queued:
            return to == S::Active || to == S::Cancelled;
        case S::Active:
            return to == S::Cancelling || to == S::Completed || to == S::Failed ||
                   to == S::Cancelled;
        case S::Cancelling:
            // The work may finish before it observes the cancellation
            return to == S::Cancelled || to == S::Completed || to == S::Failed;
        case S::Completed:
        case S::Failed:
        case S::Cancelled:
            return false;
    }
    return false;
}

OperationId OperationRegistry::create(OperationKind kind, std::string description) {
    std::lock_guard lock(mutex_);
    Operation op;
    op.id = next_id_++;
    op.kind = kind;
    op.state = OperationState::Queued;
    op.description = std::move(description);
    op.submit_time = std::chrono::system_clock::now();
    auto id = op.id;
    operations_.emplace(id, std::move(op));
    return id;
}

bool OperationRegistry::activate(OperationId id) {
    std::lock_guard lock(mutex_);
    auto it = operations_.find(id);
    if (it == operations_.end() || it->second.state != OperationState::Queued) {
        return false;
    }
    it->second.state = OperationState::Active;
    it->second.start_time = std::chrono::system_clock::now();
    return true;
}

OperationRegistry::CancelOutcome OperationRegistry::request_cancel(OperationId id) {
    std::lock_guard lock(mutex_);
    auto it = operations_.find(id);
    if (it == operations_.end()) return CancelOutcome::NotFound;

    auto& op = it->second;
    switch (op.state) {
        case OperationState::Queued:
            op.state = OperationState::Cancelled;
            op.end_time = std::chrono::system_clock::now();
            return CancelOutcome::CancelledWhileQueued;
        case OperationState::Active:
            op.state = OperationState::Cancelling;
            op.status_text = "Cancelling";
            return CancelOutcome::Cancelling;
        case OperationState::Cancelling:
            return CancelOutcome::AlreadyCancelling;
        default:
            return CancelOutcome::AlreadyTerminal;
    }
}

std::optional<ProgressUpdate> OperationRegistry::update_progress(OperationId id,
                                                                 const ProgressUpdate& update) {
    std::lock_guard lock(mutex_);
    auto it = operations_.find(id);
    if (it == operations_.end() || is_terminal(it->second.state)) return std::nullopt;

    auto& op = it->second;
    op.progress = std::clamp(std::max(op.progress, update.percent), 0, 100);
    if (update.bytes_total > 0) op.bytes_total = update.bytes_total;
    op.bytes_transferred = op.bytes_total > 0
        ? std::min(update.bytes_transferred, op.bytes_total)
        : update.bytes_transferred;
    op.throughput_bytes_per_sec = update.throughput_bytes_per_sec;
    if (op.state != OperationState::Cancelling) {
        op.status_text = update.status_text;
    }

    ProgressUpdate applied = update;
    applied.percent = op.progress;
    applied.bytes_total = op.bytes_total;
    applied.bytes_transferred = op.bytes_transferred;
    return applied;
}

std::optional<Operation> OperationRegistry::settle(OperationId id,
                                                   OperationState state,
                                                   std::optional<ErrorDetail> error,
                                                   OperationResult result) {
    std::lock_guard lock(mutex_);
    auto it = operations_.find(id);
    if (it == operations_.end()) return std::nullopt;

    auto& op = it->second;
    if (!is_terminal(state) || !can_transition(op.state, state)) return std::nullopt;

    op.state = state;
    op.end_time = std::chrono::system_clock::now();
    op.error = std::move(error);
    op.result = std::move(result);
    if (state == OperationState::Completed) {
        op.progress = 100;
        if (op.bytes_total > 0) op.bytes_transferred = op.bytes_total;
        op.status_text = "Completed";
    } else if (state == OperationState::Cancelled) {
        op.status_text = "Cancelled";
    } else {
        op.status_text = op.error ? "Failed: " + op.error->message : "Failed";
    }
    return op;
}

std::optional<Operation> OperationRegistry::get(OperationId id) const {
    std::lock_guard lock(mutex_);
    auto it = operations_.find(id);
    if (it == operations_.end()) return std::nullopt;
    return it->second;
}

std::optional<OperationState> OperationRegistry::state(OperationId id) const {
    std::lock_guard lock(mutex_);
    auto it = operations_.find(id);
    if (it == operations_.end()) return std::nullopt;
    return it->second.state;
}

std::vector<Operation> OperationRegistry::list() const {
    std::vector<Operation> out;
    {
        std::lock_guard lock(mutex_);
        out.reserve(operations_.size());
        for (const auto& [id, op] : operations_) {
            out.push_back(op);
        }
    }
    std::sort(out.begin(), out.end(),
              [](const Operation& a, const Operation& b) { return a.id < b.id; });
    return out;
}

size_t OperationRegistry::count(OperationState state) const {
    std::lock_guard lock(mutex_);
    return static_cast<size_t>(std::count_if(operations_.begin(), operations_.end(),
        [state](const auto& entry) { return entry.second.state == state; }));
}

size_t OperationRegistry::size() const {
    std::lock_guard lock(mutex_);
    return operations_.size();
}

size_t OperationRegistry::evict_expired(std::chrono::system_clock::time_point now,
                                        std::chrono::seconds ttl) {
    if (ttl.count() <= 0) return 0;

    std::lock_guard lock(mutex_);
    size_t removed = 0;
    for (auto it = operations_.begin(); it != operations_.end();) {
        const auto& op = it->second;
        if (is_terminal(op.state) && op.end_time && *op.end_time + ttl <= now) {
            it = operations_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

bool OperationRegistry::remove(OperationId id) {
    std::lock_guard lock(mutex_);
    auto it = operations_.find(id);
    if (it == operations_.end() || !is_terminal(it->second.state)) return false;
    operations_.erase(it);
    return true;
}

}  // namespace objxfer
