#pragma once

#include "objxfer/directory_transfer.hpp"
#include "objxfer/operation_events.hpp"
#include "objxfer/paginated_lister.hpp"
#include "objxfer/progress.hpp"
#include "objxfer/storage_backend.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace objxfer {

/// Kind-specific output of a completed operation.
struct OperationResult {
    std::vector<BucketInfo> buckets;            // ListBuckets
    std::optional<ListingResult> listing;       // List
    std::optional<ObjectMetadata> metadata;     // Head
    std::string url;                            // Presign
    std::optional<DirectoryResult> directory;   // UploadDir / DownloadDir / DeleteDir
    uint64_t bytes = 0;                         // Upload / Download
};

/// Typed record of one unit of work.
struct Operation {
    OperationId id = 0;
    OperationKind kind = OperationKind::List;
    OperationState state = OperationState::Queued;
    std::string description;

    int progress = 0;
    std::string status_text;
    uint64_t bytes_total = 0;
    uint64_t bytes_transferred = 0;
    double throughput_bytes_per_sec = 0.0;

    std::chrono::system_clock::time_point submit_time;
    std::optional<std::chrono::system_clock::time_point> start_time;
    std::optional<std::chrono::system_clock::time_point> end_time;

    std::optional<ErrorDetail> error;
    OperationResult result;
};

/// Owns every Operation record, keyed by id.
///
/// All state transitions go through here under one mutex. Transitions are
/// monotonic: Queued -> Active -> {Completed, Failed, Cancelling -> Cancelled},
/// Queued -> Cancelled, Cancelling -> {Completed, Failed}. Nothing leaves a
/// terminal state.
class OperationRegistry {
public:
    enum class CancelOutcome {
        NotFound,
        AlreadyTerminal,
        AlreadyCancelling,
        CancelledWhileQueued,   // now Cancelled
        Cancelling              // was Active, now Cancelling
    };

    static bool can_transition(OperationState from, OperationState to);

    OperationId create(OperationKind kind, std::string description);

    /// Queued -> Active. False if the operation is no longer queued.
    bool activate(OperationId id);

    CancelOutcome request_cancel(OperationId id);

    /// Apply a progress update. Percent never decreases, and
    /// bytes_transferred never exceeds a known bytes_total.
    /// Returns the update as applied; empty if the operation is unknown or
    /// terminal.
    std::optional<ProgressUpdate> update_progress(OperationId id, const ProgressUpdate& update);

    /// Move to a terminal state. Returns the settled record if this call
    /// settled it; empty if it was already terminal (or unknown).
    std::optional<Operation> settle(OperationId id,
                                    OperationState state,
                                    std::optional<ErrorDetail> error,
                                    OperationResult result = {});

    std::optional<Operation> get(OperationId id) const;
    std::optional<OperationState> state(OperationId id) const;

    /// All records, ordered by id.
    std::vector<Operation> list() const;

    size_t count(OperationState state) const;
    size_t size() const;

    /// Remove terminal records whose end_time + ttl <= now. A zero ttl
    /// disables eviction. Returns the number removed.
    size_t evict_expired(std::chrono::system_clock::time_point now,
                         std::chrono::seconds ttl);

    bool remove(OperationId id);

private:
    mutable std::mutex mutex_;
    std::unordered_map<OperationId, Operation> operations_;
    OperationId next_id_ = 1;
};

}  // namespace objxfer
