#include "objxfer/object_transfer.hpp"
#include "objxfer/checksum.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <mutex>
#include <optional>
#include <sstream>

namespace objxfer {

namespace fs = std::filesystem;

namespace {

// Translates cumulative backend byte counts into throttled, clamped,
// non-decreasing progress updates. on_bytes() may be called from a
// backend-internal thread.
class ProgressTracker {
public:
    ProgressTracker(const ProgressCallback& sink,
                    CancellationToken& token,
                    std::string verb,
                    std::string name,
                    uint64_t total,
                    std::chrono::milliseconds interval)
        : sink_(sink)
        , token_(token)
        , verb_(std::move(verb))
        , name_(std::move(name))
        , total_(total)
        , throttle_(interval) {}

    bool on_bytes(uint64_t done) {
        if (token_.is_cancelled()) return false;

        std::lock_guard lock(mutex_);
        // Zero-byte objects only ever report 0 and 100
        if (total_ == 0) return !token_.is_cancelled();

        high_water_ = std::max(high_water_, std::min(done, total_));
        int pct = clamp_percent(high_water_, total_, false);
        if (throttle_.should_emit(pct)) {
            publish(pct, high_water_);
        }
        return !token_.is_cancelled();
    }

    void start() {
        std::lock_guard lock(mutex_);
        meter_.restart();
        if (throttle_.should_emit(0, true)) publish(0, 0);
    }

    void finish() {
        std::lock_guard lock(mutex_);
        high_water_ = total_;
        if (throttle_.should_emit(100, true)) publish(100, total_);
    }

private:
    void publish(int pct, uint64_t done) {
        if (!sink_) return;

        ProgressUpdate update;
        update.percent = pct;
        update.bytes_transferred = done;
        update.bytes_total = total_;
        update.throughput_bytes_per_sec = meter_.bytes_per_sec(done);
        update.eta = pct == 100 ? std::optional<std::chrono::seconds>(std::chrono::seconds(0))
                                : meter_.eta(done, total_);
        update.status_text = verb_ + " " + name_ + ": " + format_size(done) + " / " +
                             format_size(total_) + " (" +
                             format_speed(update.throughput_bytes_per_sec) + ")";
        if (!sink_(update)) {
            token_.cancel();
        }
    }

    const ProgressCallback& sink_;
    CancellationToken& token_;
    std::string verb_;
    std::string name_;
    uint64_t total_;

    std::mutex mutex_;
    ProgressThrottle throttle_;
    ThroughputMeter meter_;
    uint64_t high_water_ = 0;
};

std::string base_name(const std::string& key) {
    auto trimmed = key;
    while (!trimmed.empty() && trimmed.back() == '/') trimmed.pop_back();
    auto slash = trimmed.rfind('/');
    return slash == std::string::npos ? trimmed : trimmed.substr(slash + 1);
}

std::string normalize_etag(std::string etag) {
    if (etag.size() >= 2 && etag.front() == '"' && etag.back() == '"') {
        etag = etag.substr(1, etag.size() - 2);
    }
    std::transform(etag.begin(), etag.end(), etag.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return etag;
}

}  // namespace

ObjectTransfer::ObjectTransfer(StorageBackend& backend,
                               const RetryExecutor& retry,
                               TransferOptions options,
                               std::shared_ptr<Logger> logger)
    : backend_(backend)
    , retry_(retry)
    , options_(options)
    , logger_(logger ? std::move(logger) : Logger::null()) {}

fs::path ObjectTransfer::partial_path(const fs::path& local_path) {
    auto part = local_path;
    part += PARTIAL_SUFFIX;
    return part;
}

size_t ObjectTransfer::remove_stale_partials(const fs::path& dir, std::chrono::seconds max_age) {
    const std::string suffix = PARTIAL_SUFFIX;
    auto cutoff = fs::file_time_type::clock::now() - max_age;
    size_t removed = 0;

    std::error_code ec;
    for (fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec), end;
         !ec && it != end; it.increment(ec)) {
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec) || it->is_symlink(entry_ec)) continue;
        auto name = it->path().filename().string();
        if (name.size() <= suffix.size() ||
            name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) {
            continue;
        }
        auto mtime = it->last_write_time(entry_ec);
        if (entry_ec || mtime > cutoff) continue;
        if (fs::remove(it->path(), entry_ec)) ++removed;
    }
    return removed;
}

// --- Upload ---

TransferResult ObjectTransfer::upload(const fs::path& local_path,
                                      const std::string& bucket,
                                      const std::string& key,
                                      const ProgressCallback& on_progress,
                                      CancellationToken& token,
                                      const RetryListener& on_retry) {
    std::map<std::string, std::string> details{
        {"bucket", bucket}, {"key", key}, {"local_path", local_path.string()}};

    if (token.is_cancelled()) throw make_cancelled("upload", details);

    std::error_code ec;
    if (!fs::is_regular_file(local_path, ec)) {
        throw OperationError(ErrorKind::Fatal, "upload", "LocalFileError",
                             "not a regular file: " + local_path.string(), 1, details);
    }
    uint64_t size = fs::file_size(local_path, ec);
    if (ec) {
        throw OperationError(ErrorKind::Fatal, "upload", "LocalFileError",
                             "cannot stat " + local_path.string() + ": " + ec.message(),
                             1, details);
    }

    ProgressTracker tracker(on_progress, token, "Uploading",
                            local_path.filename().string(), size,
                            options_.progress_interval);

    std::optional<CancellationRegistration> native_cancel;
    if (backend_.supports_native_cancel()) {
        native_cancel.emplace(token, [this, &bucket, &key] {
            backend_.abort_transfer(bucket, key);
        });
    }

    logger_->debug("Uploading %s -> %s/%s (%s)", local_path.c_str(), bucket.c_str(),
                   key.c_str(), format_size(size).c_str());
    tracker.start();

    bool put_started = false;
    try {
        retry_.execute("upload", [&] {
            std::ifstream in(local_path, std::ios::binary);
            if (!in) {
                throw OperationError(ErrorKind::Fatal, "upload", "LocalFileError",
                                     "cannot open " + local_path.string(), 1, details);
            }
            put_started = true;
            backend_.put_object(bucket, key, in, size,
                                [&tracker](uint64_t n) { return tracker.on_bytes(n); });
        }, &token, on_retry, details);
    } catch (const OperationError&) {
        // Best-effort removal of a partial object the backend may have exposed
        if (put_started && !backend_.supports_atomic_put()) {
            try {
                backend_.delete_object(bucket, key);
            } catch (const StorageError& e) {
                logger_->warn("Cleanup of partial upload %s/%s failed: %s",
                              bucket.c_str(), key.c_str(), e.what());
            }
        }
        throw;
    }

    tracker.finish();

    TransferResult result;
    result.bytes = size;
    return result;
}

// --- Download ---

TransferResult ObjectTransfer::download(const std::string& bucket,
                                        const std::string& key,
                                        const fs::path& local_path,
                                        const ProgressCallback& on_progress,
                                        CancellationToken& token,
                                        const RetryListener& on_retry) {
    std::map<std::string, std::string> details{
        {"bucket", bucket}, {"key", key}, {"local_path", local_path.string()}};

    if (token.is_cancelled()) throw make_cancelled("download", details);

    auto meta = retry_.execute("download", [&] {
        return backend_.head_object(bucket, key);
    }, &token, on_retry, details);

    std::error_code ec;
    if (local_path.has_parent_path()) {
        fs::create_directories(local_path.parent_path(), ec);
        if (ec) {
            throw OperationError(ErrorKind::Fatal, "download", "LocalFileError",
                                 "cannot create " + local_path.parent_path().string() +
                                 ": " + ec.message(), 1, details);
        }
    }

    auto part = partial_path(local_path);
    ProgressTracker tracker(on_progress, token, "Downloading", base_name(key), meta.size,
                            options_.progress_interval);

    std::optional<CancellationRegistration> native_cancel;
    if (backend_.supports_native_cancel()) {
        native_cancel.emplace(token, [this, &bucket, &key] {
            backend_.abort_transfer(bucket, key);
        });
    }

    logger_->debug("Downloading %s/%s -> %s (%s)", bucket.c_str(), key.c_str(),
                   local_path.c_str(), format_size(meta.size).c_str());
    tracker.start();

    try {
        retry_.execute("download", [&] {
            std::ofstream out(part, std::ios::binary | std::ios::trunc);
            if (!out) {
                throw OperationError(ErrorKind::Fatal, "download", "LocalFileError",
                                     "cannot create " + part.string(), 1, details);
            }
            backend_.get_object(bucket, key, out,
                                [&tracker](uint64_t n) { return tracker.on_bytes(n); });
            out.close();
            if (!out) {
                throw OperationError(ErrorKind::Fatal, "download", "LocalFileError",
                                     "write failed: " + part.string(), 1, details);
            }

            std::error_code size_ec;
            auto written = fs::file_size(part, size_ec);
            if (size_ec || written != meta.size) {
                throw StorageError("IncompleteBody",
                                   "expected " + std::to_string(meta.size) + " bytes, got " +
                                   std::to_string(size_ec ? 0 : written));
            }
        }, &token, on_retry, details);

        if (options_.verify_checksums && is_md5_etag(meta.etag)) {
            auto actual = file_md5_hex(part);
            if (!actual || *actual != normalize_etag(meta.etag)) {
                throw OperationError(ErrorKind::Fatal, "download", "BadDigest",
                                     "checksum mismatch for " + bucket + "/" + key,
                                     1, details);
            }
        }

        if (token.is_cancelled()) throw make_cancelled("download", details);

        fs::rename(part, local_path, ec);
        if (ec) {
            throw OperationError(ErrorKind::Fatal, "download", "LocalFileError",
                                 "cannot move into place: " + ec.message(), 1, details);
        }
    } catch (...) {
        std::error_code ignore;
        fs::remove(part, ignore);
        throw;
    }

    tracker.finish();

    TransferResult result;
    result.bytes = meta.size;
    result.etag = meta.etag;
    return result;
}

// --- Simple operations ---

void ObjectTransfer::remove(const std::string& bucket, const std::string& key,
                            CancellationToken& token, const RetryListener& on_retry) {
    retry_.execute("delete", [&] {
        backend_.delete_object(bucket, key);
    }, &token, on_retry, {{"bucket", bucket}, {"key", key}});
}

void ObjectTransfer::copy(const ObjectRef& source, const ObjectRef& destination,
                          CancellationToken& token, const RetryListener& on_retry) {
    std::map<std::string, std::string> details{
        {"bucket", source.bucket}, {"key", source.key},
        {"dest_bucket", destination.bucket}, {"dest_key", destination.key}};
    retry_.execute("copy", [&] {
        backend_.copy_object(source, destination);
    }, &token, on_retry, details);
}

ObjectMetadata ObjectTransfer::head(const std::string& bucket, const std::string& key,
                                    CancellationToken& token, const RetryListener& on_retry) {
    return retry_.execute("head", [&] {
        return backend_.head_object(bucket, key);
    }, &token, on_retry, {{"bucket", bucket}, {"key", key}});
}

std::string ObjectTransfer::presign(const std::string& bucket, const std::string& key,
                                    std::chrono::seconds expiry,
                                    CancellationToken& token, const RetryListener& on_retry) {
    return retry_.execute("presign", [&] {
        return backend_.presign_url(bucket, key, expiry);
    }, &token, on_retry, {{"bucket", bucket}, {"key", key}});
}

void ObjectTransfer::create_marker(const std::string& bucket, const std::string& key,
                                   CancellationToken& token, const RetryListener& on_retry) {
    if (key.empty() || key.back() != '/') {
        throw OperationError(ErrorKind::Fatal, "mkdir", "InvalidArgument",
                             "directory marker key must end with '/': " + key, 1,
                             {{"bucket", bucket}, {"key", key}});
    }
    retry_.execute("mkdir", [&] {
        std::istringstream empty;
        PutOptions options;
        options.content_type = "application/x-directory";
        backend_.put_object(bucket, key, empty, 0, nullptr, options);
    }, &token, on_retry, {{"bucket", bucket}, {"key", key}});
}

}  // namespace objxfer
