#include "objxfer/worker_manager.hpp"
#include "objxfer/metrics.hpp"
#include "objxfer/operation_journal.hpp"

#include <algorithm>
#include <stdexcept>

namespace objxfer {

// --- OperationRequest ---

OperationRequest OperationRequest::list_buckets() {
    OperationRequest r;
    r.kind = OperationKind::ListBuckets;
    return r;
}

OperationRequest OperationRequest::list(const std::string& bucket, const std::string& prefix) {
    OperationRequest r;
    r.kind = OperationKind::List;
    r.bucket = bucket;
    r.prefix = prefix;
    return r;
}

OperationRequest OperationRequest::head(const std::string& bucket, const std::string& key) {
    OperationRequest r;
    r.kind = OperationKind::Head;
    r.bucket = bucket;
    r.key = key;
    return r;
}

OperationRequest OperationRequest::upload(const std::filesystem::path& local_path,
                                          const std::string& bucket, const std::string& key) {
    OperationRequest r;
    r.kind = OperationKind::Upload;
    r.local_path = local_path;
    r.bucket = bucket;
    r.key = key;
    return r;
}

OperationRequest OperationRequest::download(const std::string& bucket, const std::string& key,
                                            const std::filesystem::path& local_path) {
    OperationRequest r;
    r.kind = OperationKind::Download;
    r.bucket = bucket;
    r.key = key;
    r.local_path = local_path;
    return r;
}

OperationRequest OperationRequest::remove(const std::string& bucket, const std::string& key) {
    OperationRequest r;
    r.kind = OperationKind::Delete;
    r.bucket = bucket;
    r.key = key;
    return r;
}

OperationRequest OperationRequest::copy(const ObjectRef& source, const ObjectRef& destination) {
    OperationRequest r;
    r.kind = OperationKind::Copy;
    r.bucket = source.bucket;
    r.key = source.key;
    r.destination = destination;
    return r;
}

OperationRequest OperationRequest::presign(const std::string& bucket, const std::string& key,
                                           std::chrono::seconds expiry) {
    OperationRequest r;
    r.kind = OperationKind::Presign;
    r.bucket = bucket;
    r.key = key;
    r.expiry = expiry;
    return r;
}

OperationRequest OperationRequest::upload_dir(const std::filesystem::path& local_path,
                                              const std::string& bucket,
                                              const std::string& prefix) {
    OperationRequest r;
    r.kind = OperationKind::UploadDir;
    r.local_path = local_path;
    r.bucket = bucket;
    r.prefix = prefix;
    return r;
}

OperationRequest OperationRequest::download_dir(const std::string& bucket,
                                                const std::string& prefix,
                                                const std::filesystem::path& local_path) {
    OperationRequest r;
    r.kind = OperationKind::DownloadDir;
    r.bucket = bucket;
    r.prefix = prefix;
    r.local_path = local_path;
    return r;
}

OperationRequest OperationRequest::delete_dir(const std::string& bucket,
                                              const std::string& prefix) {
    OperationRequest r;
    r.kind = OperationKind::DeleteDir;
    r.bucket = bucket;
    r.prefix = prefix;
    return r;
}

std::string OperationRequest::describe() const {
    if (!description.empty()) return description;

    auto remote = [](const std::string& b, const std::string& k) {
        return b + "/" + k;
    };
    std::string name = operation_kind_name(kind);
    switch (kind) {
        case OperationKind::ListBuckets:
            return name;
        case OperationKind::List:
        case OperationKind::DeleteDir:
            return name + " " + remote(bucket, prefix);
        case OperationKind::Head:
        case OperationKind::Delete:
        case OperationKind::Presign:
            return name + " " + remote(bucket, key);
        case OperationKind::Upload:
            return name + " " + local_path.string() + " -> " + remote(bucket, key);
        case OperationKind::Download:
            return name + " " + remote(bucket, key) + " -> " + local_path.string();
        case OperationKind::UploadDir:
            return name + " " + local_path.string() + " -> " + remote(bucket, prefix);
        case OperationKind::DownloadDir:
            return name + " " + remote(bucket, prefix) + " -> " + local_path.string();
        case OperationKind::Copy:
            return name + " " + remote(bucket, key) + " -> " +
                   remote(destination.bucket, destination.key);
    }
    return name;
}

// --- WorkerManager ---

WorkerManager::WorkerManager(StorageBackend& backend,
                             EngineOptions options,
                             std::shared_ptr<Logger> logger)
    : backend_(backend)
    , options_(std::move(options))
    , logger_(logger ? std::move(logger) : Logger::null())
    , retry_(options_.retry, logger_)
    , lister_(backend_, retry_, options_.lister, logger_)
    , transfer_(backend_, retry_, options_.transfer, logger_)
    , directory_(backend_, retry_, lister_, transfer_, options_.directory, logger_) {
    if (options_.workers.max_concurrent == 0) options_.workers.max_concurrent = 1;
}

WorkerManager::~WorkerManager() {
    shutdown();
    if (metrics_) metrics_->set_worker_manager(nullptr);
}

void WorkerManager::set_metrics(MetricsExporter* metrics) {
    metrics_ = metrics;
    if (metrics_) metrics_->set_worker_manager(this);
}

void WorkerManager::start() {
    {
        std::lock_guard lock(queue_mutex_);
        if (started_) return;
        started_ = true;
        running_ = true;
    }

    for (size_t i = 0; i < options_.workers.max_concurrent; ++i) {
        workers_.emplace_back(&WorkerManager::worker_loop, this);
    }
    if (options_.workers.completed_ttl.count() > 0) {
        janitor_thread_ = std::thread(&WorkerManager::janitor_loop, this);
    }

    logger_->debug("Started %zu workers (backend: %s)", workers_.size(),
                   backend_.type_name().c_str());
}

void WorkerManager::shutdown() {
    {
        std::lock_guard lock(queue_mutex_);
        if (shut_down_) return;
        shut_down_ = true;
    }

    size_t cancelled = cancel_all();
    if (cancelled > 0) {
        logger_->info("Shutdown: cancelled %zu operations", cancelled);
    }

    {
        std::lock_guard lock(queue_mutex_);
        running_ = false;
    }
    queue_cv_.notify_all();
    {
        std::lock_guard lock(janitor_mutex_);
    }
    janitor_cv_.notify_all();

    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
    workers_.clear();
    if (janitor_thread_.joinable()) janitor_thread_.join();

    if (metrics_) metrics_->set_worker_manager(nullptr);
}

// --- Submission ---

OperationId WorkerManager::submit(const OperationRequest& request) {
    return submit(request.kind, request.describe(), make_task(request));
}

OperationId WorkerManager::submit(OperationKind kind, std::string description, OperationTask task) {
    Job job;
    job.kind = kind;
    job.task = std::move(task);
    job.token = std::make_shared<CancellationToken>();

    OperationId id = 0;
    {
        std::lock_guard lock(queue_mutex_);
        if (shut_down_) {
            throw std::runtime_error("worker manager is shut down");
        }
        id = registry_.create(kind, description);
        job.id = id;
        tokens_.emplace(id, job.token);
        queue_.push_back(std::move(job));
    }
    queue_cv_.notify_one();

    logger_->debug("[#%llu] queued: %s", static_cast<unsigned long long>(id),
                   description.c_str());
    return id;
}

OperationTask WorkerManager::make_task(const OperationRequest& request) {
    auto req = request;
    switch (req.kind) {
        case OperationKind::ListBuckets:
            return [this](OperationContext& ctx) {
                OperationResult r;
                r.buckets = retry_.execute("list_buckets", [&] {
                    return backend_.list_buckets();
                }, &ctx.token(), ctx.retry_listener());
                return r;
            };
        case OperationKind::List:
            return [this, req](OperationContext& ctx) {
                OperationResult r;
                r.listing = lister_.list(req.bucket, req.prefix, req.delimiter,
                                         &ctx.token(), ctx.retry_listener());
                return r;
            };
        case OperationKind::Head:
            return [this, req](OperationContext& ctx) {
                OperationResult r;
                r.metadata = transfer_.head(req.bucket, req.key, ctx.token(),
                                            ctx.retry_listener());
                return r;
            };
        case OperationKind::Upload:
            return [this, req](OperationContext& ctx) {
                OperationResult r;
                r.bytes = transfer_.upload(req.local_path, req.bucket, req.key,
                                           ctx.progress_callback(), ctx.token(),
                                           ctx.retry_listener()).bytes;
                return r;
            };
        case OperationKind::Download:
            return [this, req](OperationContext& ctx) {
                OperationResult r;
                r.bytes = transfer_.download(req.bucket, req.key, req.local_path,
                                             ctx.progress_callback(), ctx.token(),
                                             ctx.retry_listener()).bytes;
                return r;
            };
        case OperationKind::Delete:
            return [this, req](OperationContext& ctx) {
                transfer_.remove(req.bucket, req.key, ctx.token(), ctx.retry_listener());
                return OperationResult{};
            };
        case OperationKind::Copy:
            return [this, req](OperationContext& ctx) {
                transfer_.copy(ObjectRef{req.bucket, req.key}, req.destination,
                               ctx.token(), ctx.retry_listener());
                return OperationResult{};
            };
        case OperationKind::Presign:
            return [this, req](OperationContext& ctx) {
                OperationResult r;
                r.url = transfer_.presign(req.bucket, req.key, req.expiry, ctx.token(),
                                          ctx.retry_listener());
                return r;
            };
        case OperationKind::UploadDir:
            return [this, req](OperationContext& ctx) {
                OperationResult r;
                r.directory = directory_.upload_directory(req.local_path, req.bucket, req.prefix,
                                                          ctx.progress_callback(), ctx.token(),
                                                          ctx.retry_listener());
                return r;
            };
        case OperationKind::DownloadDir:
            return [this, req](OperationContext& ctx) {
                OperationResult r;
                r.directory = directory_.download_directory(req.bucket, req.prefix, req.local_path,
                                                            ctx.progress_callback(), ctx.token(),
                                                            ctx.retry_listener());
                return r;
            };
        case OperationKind::DeleteDir:
            return [this, req](OperationContext& ctx) {
                OperationResult r;
                r.directory = directory_.delete_directory(req.bucket, req.prefix,
                                                          ctx.progress_callback(), ctx.token(),
                                                          ctx.retry_listener());
                return r;
            };
    }
    throw std::invalid_argument("unknown operation kind");
}

// --- Cancellation ---

std::shared_ptr<CancellationToken> WorkerManager::find_token(OperationId id) {
    std::lock_guard lock(queue_mutex_);
    auto it = tokens_.find(id);
    return it != tokens_.end() ? it->second : nullptr;
}

bool WorkerManager::cancel(OperationId id) {
    switch (registry_.request_cancel(id)) {
        case OperationRegistry::CancelOutcome::CancelledWhileQueued: {
            std::shared_ptr<CancellationToken> token;
            {
                std::lock_guard lock(queue_mutex_);
                queue_.erase(std::remove_if(queue_.begin(), queue_.end(),
                                            [id](const Job& job) { return job.id == id; }),
                             queue_.end());
                auto it = tokens_.find(id);
                if (it != tokens_.end()) {
                    token = it->second;
                    tokens_.erase(it);
                }
            }
            if (token) token->cancel();
            if (auto op = registry_.get(id)) on_settled(*op);
            return true;
        }
        case OperationRegistry::CancelOutcome::Cancelling: {
            logger_->info("[#%llu] cancelling", static_cast<unsigned long long>(id));
            events_.publish_state(StateEvent{id, OperationState::Active, OperationState::Cancelling});
            // Cancel outside the queue lock: callbacks may abort backend transfers
            if (auto token = find_token(id)) token->cancel();
            return true;
        }
        default:
            return false;
    }
}

size_t WorkerManager::cancel_all() {
    size_t cancelled = 0;
    for (const auto& op : registry_.list()) {
        if (is_terminal(op.state)) continue;
        if (cancel(op.id)) ++cancelled;
    }
    return cancelled;
}

// --- Queries ---

size_t WorkerManager::active_count() const {
    return registry_.count(OperationState::Active) + registry_.count(OperationState::Cancelling);
}

size_t WorkerManager::queued_count() const {
    return registry_.count(OperationState::Queued);
}

std::optional<Operation> WorkerManager::snapshot(OperationId id) const {
    return registry_.get(id);
}

std::vector<Operation> WorkerManager::operations() const {
    return registry_.list();
}

std::optional<Operation> WorkerManager::wait(OperationId id,
                                             std::optional<std::chrono::milliseconds> timeout) {
    auto settled = [&] {
        auto state = registry_.state(id);
        return !state || is_terminal(*state);
    };

    std::unique_lock lock(settle_mutex_);
    if (timeout) {
        settle_cv_.wait_for(lock, *timeout, settled);
    } else {
        settle_cv_.wait(lock, settled);
    }
    return registry_.get(id);
}

void WorkerManager::wait_all() {
    std::unique_lock lock(settle_mutex_);
    settle_cv_.wait(lock, [this] { return active_count() + queued_count() == 0; });
}

// --- Workers ---

void WorkerManager::worker_loop() {
    while (true) {
        Job job;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !running_ || !queue_.empty(); });
            if (queue_.empty()) break;  // stopping and drained
            job = std::move(queue_.front());
            queue_.pop_front();
        }
        run_job(job);
    }
}

void WorkerManager::run_job(Job& job) {
    auto id = job.id;
    if (!registry_.activate(id)) {
        // Cancelled while queued; already settled by cancel()
        return;
    }
    events_.publish_state(StateEvent{id, OperationState::Queued, OperationState::Active});

    if (auto op = registry_.get(id)) {
        logger_->info("[#%llu] started: %s", static_cast<unsigned long long>(id),
                      op->description.c_str());
    }

    if (options_.workers.retry_deadline.count() > 0) {
        job.token->set_deadline(CancellationToken::Clock::now() + options_.workers.retry_deadline);
    }

    auto token = job.token;
    ProgressCallback report = [this, id, token](const ProgressUpdate& update) {
        if (auto applied = registry_.update_progress(id, update)) {
            events_.publish_progress(ProgressEvent{id, *applied});
        }
        return !token->is_cancelled();
    };
    RetryListener on_retry = [this, id](const RetryNotice& notice) {
        if (metrics_) metrics_->retries_total().Increment();
        events_.publish_retry(RetryEvent{id, notice});
    };
    OperationContext ctx(id, job.kind, *token, std::move(report), std::move(on_retry));

    OperationState state = OperationState::Completed;
    std::optional<ErrorDetail> error;
    OperationResult result;
    try {
        result = job.task(ctx);
    } catch (const OperationError& e) {
        error = ErrorDetail::from(e);
        state = (e.is_cancelled() || token->is_cancelled()) ? OperationState::Cancelled
                                                            : OperationState::Failed;
    } catch (const std::exception& e) {
        ErrorDetail detail;
        detail.kind = token->is_cancelled() ? ErrorKind::Cancelled : ErrorKind::Fatal;
        detail.operation = operation_kind_name(job.kind);
        detail.code = token->is_cancelled() ? CANCELLED_CODE : CLIENT_ERROR_CODE;
        detail.message = e.what();
        error = std::move(detail);
        state = token->is_cancelled() ? OperationState::Cancelled : OperationState::Failed;
    } catch (...) {
        ErrorDetail detail;
        detail.kind = token->is_cancelled() ? ErrorKind::Cancelled : ErrorKind::Fatal;
        detail.operation = operation_kind_name(job.kind);
        detail.code = token->is_cancelled() ? CANCELLED_CODE : CLIENT_ERROR_CODE;
        detail.message = "unknown exception";
        error = std::move(detail);
        state = token->is_cancelled() ? OperationState::Cancelled : OperationState::Failed;
    }

    {
        std::lock_guard lock(queue_mutex_);
        tokens_.erase(id);
    }

    if (auto settled = registry_.settle(id, state, std::move(error), std::move(result))) {
        on_settled(*settled);
    }
}

void WorkerManager::on_settled(const Operation& op) {
    auto id = static_cast<unsigned long long>(op.id);
    const char* kind = operation_kind_name(op.kind);

    double duration = 0.0;
    if (op.start_time && op.end_time) {
        duration = std::chrono::duration<double>(*op.end_time - *op.start_time).count();
    }

    if (metrics_) {
        metrics_->record_operation(kind, operation_state_name(op.state), duration);
        if (op.state == OperationState::Completed) {
            switch (op.kind) {
                case OperationKind::Upload:
                    metrics_->record_bytes("upload", op.result.bytes);
                    break;
                case OperationKind::Download:
                    metrics_->record_bytes("download", op.result.bytes);
                    break;
                case OperationKind::UploadDir:
                    if (op.result.directory) {
                        metrics_->record_bytes("upload",
                                               op.result.directory->progress.transferred_bytes);
                    }
                    break;
                case OperationKind::DownloadDir:
                    if (op.result.directory) {
                        metrics_->record_bytes("download",
                                               op.result.directory->progress.transferred_bytes);
                    }
                    break;
                default:
                    break;
            }
        }
    }

    if (journal_ && !journal_->record(op)) {
        logger_->warn("[#%llu] could not record operation in journal", id);
    }

    switch (op.state) {
        case OperationState::Completed:
            logger_->info("[#%llu] %s completed in %.2fs", id, kind, duration);
            break;
        case OperationState::Cancelled:
            logger_->info("[#%llu] %s cancelled", id, kind);
            break;
        default:
            logger_->error("[#%llu] %s failed: %s: %s", id, kind,
                           op.error ? op.error->code.c_str() : CLIENT_ERROR_CODE,
                           op.error ? op.error->message.c_str() : "unknown error");
            break;
    }

    SettledEvent event;
    event.id = op.id;
    event.kind = op.kind;
    event.state = op.state;
    event.success = op.state == OperationState::Completed;
    event.cancelled = op.state == OperationState::Cancelled;
    event.error = op.error;
    events_.publish_settled(event);

    {
        std::lock_guard lock(settle_mutex_);
    }
    settle_cv_.notify_all();
}

// --- TTL eviction ---

void WorkerManager::janitor_loop() {
    while (true) {
        {
            std::unique_lock lock(janitor_mutex_);
            janitor_cv_.wait_for(lock, options_.workers.janitor_interval,
                                 [this] { return !running_; });
            if (!running_) break;
        }
        auto removed = registry_.evict_expired(std::chrono::system_clock::now(),
                                               options_.workers.completed_ttl);
        if (removed > 0) {
            logger_->debug("Evicted %zu settled operations", removed);
        }
    }
}

}  // namespace objxfer
