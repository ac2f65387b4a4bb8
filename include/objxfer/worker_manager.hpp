#pragma once

#include "objxfer/cancellation.hpp"
#include "objxfer/directory_transfer.hpp"
#include "objxfer/logger.hpp"
#include "objxfer/object_transfer.hpp"
#include "objxfer/operation_events.hpp"
#include "objxfer/operation_registry.hpp"
#include "objxfer/paginated_lister.hpp"
#include "objxfer/retry_executor.hpp"
#include "objxfer/storage_backend.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace objxfer {

class MetricsExporter;
class OperationJournal;

struct WorkerOptions {
    size_t max_concurrent = 5;
    std::chrono::seconds completed_ttl{5};             // 0 = never auto-remove
    std::chrono::seconds retry_deadline{0};            // 0 = no deadline
    std::chrono::milliseconds janitor_interval{1000};
};

/// Everything the engine needs beyond the backend, loaded once.
struct EngineOptions {
    RetryPolicy retry;
    ListerOptions lister;
    TransferOptions transfer;
    DirectoryOptions directory;
    WorkerOptions workers;
};

/// Parameters of one caller-facing operation.
struct OperationRequest {
    OperationKind kind = OperationKind::List;
    std::string bucket;
    std::string key;
    std::string prefix;
    std::string delimiter = "/";
    std::filesystem::path local_path;
    ObjectRef destination;                   // Copy
    std::chrono::seconds expiry{3600};       // Presign
    std::string description;                 // generated when empty

    static OperationRequest list_buckets();
    static OperationRequest list(const std::string& bucket, const std::string& prefix);
    static OperationRequest head(const std::string& bucket, const std::string& key);
    static OperationRequest upload(const std::filesystem::path& local_path,
                                   const std::string& bucket, const std::string& key);
    static OperationRequest download(const std::string& bucket, const std::string& key,
                                     const std::filesystem::path& local_path);
    static OperationRequest remove(const std::string& bucket, const std::string& key);
    static OperationRequest copy(const ObjectRef& source, const ObjectRef& destination);
    static OperationRequest presign(const std::string& bucket, const std::string& key,
                                    std::chrono::seconds expiry);
    static OperationRequest upload_dir(const std::filesystem::path& local_path,
                                       const std::string& bucket, const std::string& prefix);
    static OperationRequest download_dir(const std::string& bucket, const std::string& prefix,
                                         const std::filesystem::path& local_path);
    static OperationRequest delete_dir(const std::string& bucket, const std::string& prefix);

    // "upload ./a.txt -> bucket/a.txt"
    std::string describe() const;
};

/// Handle given to a running task: its id, its cancellation token, and the
/// sinks that publish progress and retry notices for it.
class OperationContext {
public:
    OperationContext(OperationId id,
                     OperationKind kind,
                     CancellationToken& token,
                     ProgressCallback report,
                     RetryListener on_retry)
        : id_(id)
        , kind_(kind)
        , token_(token)
        , report_(std::move(report))
        , on_retry_(std::move(on_retry)) {}

    OperationId id() const { return id_; }
    OperationKind kind() const { return kind_; }
    CancellationToken& token() { return token_; }

    /// Publish progress. Returns false once cancellation was requested.
    bool report(const ProgressUpdate& update) { return report_(update); }

    const ProgressCallback& progress_callback() const { return report_; }
    const RetryListener& retry_listener() const { return on_retry_; }

private:
    OperationId id_;
    OperationKind kind_;
    CancellationToken& token_;
    ProgressCallback report_;
    RetryListener on_retry_;
};

using OperationTask = std::function<OperationResult(OperationContext&)>;

/// Bounded pool of worker threads running submitted operations.
///
/// Each operation runs on one worker for its whole lifetime; directory
/// operations transfer their files sequentially on that worker, so total
/// concurrency is bounded by max_concurrent, not by file count. Submissions
/// beyond the pool size wait Queued until a worker frees up.
///
/// cancel() on a queued operation settles it as Cancelled immediately; on an
/// active one it moves to Cancelling and fires its token, which also aborts
/// backend transfers that support native cancellation. Every operation gets
/// exactly one settled event, and settled records are evicted after
/// completed_ttl (unless it is zero).
class WorkerManager {
public:
    WorkerManager(StorageBackend& backend,
                  EngineOptions options,
                  std::shared_ptr<Logger> logger = Logger::null());
    ~WorkerManager();

    WorkerManager(const WorkerManager&) = delete;
    WorkerManager& operator=(const WorkerManager&) = delete;

    /// Optional sinks; set before start(). Not owned.
    void set_metrics(MetricsExporter* metrics);
    void set_journal(OperationJournal* journal) { journal_ = journal; }

    /// Start worker threads (and the TTL janitor when enabled).
    void start();

    /// Cancel everything, then join all threads. Idempotent.
    void shutdown();

    OperationId submit(const OperationRequest& request);
    OperationId submit(OperationKind kind, std::string description, OperationTask task);

    /// True if the request changed anything (queued -> cancelled, or
    /// active -> cancelling). Cancelling a settled operation is a no-op.
    bool cancel(OperationId id);

    /// Cancel every queued and active operation. Returns how many were hit.
    size_t cancel_all();

    /// Operations holding a worker slot (Active or Cancelling).
    size_t active_count() const;
    size_t queued_count() const;

    std::optional<Operation> snapshot(OperationId id) const;
    std::vector<Operation> operations() const;

    /// Block until the operation settles (or the timeout passes). Returns
    /// the latest record; empty if it is unknown or already evicted.
    std::optional<Operation> wait(OperationId id,
                                  std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /// Block until nothing is queued or active.
    void wait_all();

    EventChannel& events() { return events_; }
    RetryExecutor& retry_executor() { return retry_; }
    const EngineOptions& options() const { return options_; }

private:
    struct Job {
        OperationId id = 0;
        OperationKind kind = OperationKind::List;
        OperationTask task;
        std::shared_ptr<CancellationToken> token;
    };

    OperationTask make_task(const OperationRequest& request);

    void worker_loop();
    void janitor_loop();
    void run_job(Job& job);

    // Side effects of a settled operation: metrics, journal, events, waiters
    void on_settled(const Operation& op);

    std::shared_ptr<CancellationToken> find_token(OperationId id);

    StorageBackend& backend_;
    EngineOptions options_;
    std::shared_ptr<Logger> logger_;

    RetryExecutor retry_;
    PaginatedLister lister_;
    ObjectTransfer transfer_;
    DirectoryTransfer directory_;

    OperationRegistry registry_;
    EventChannel events_;

    MetricsExporter* metrics_ = nullptr;
    OperationJournal* journal_ = nullptr;

    // Job queue
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<Job> queue_;
    std::unordered_map<OperationId, std::shared_ptr<CancellationToken>> tokens_;

    // Settlement notifications for wait()
    std::mutex settle_mutex_;
    std::condition_variable settle_cv_;

    std::atomic<bool> running_{false};
    bool started_ = false;      // guarded by queue_mutex_
    bool shut_down_ = false;    // guarded by queue_mutex_
    std::vector<std::thread> workers_;

    std::thread janitor_thread_;
    std::mutex janitor_mutex_;
    std::condition_variable janitor_cv_;
};

}  // namespace objxfer
