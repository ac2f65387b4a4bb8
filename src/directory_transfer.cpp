#include "objxfer/directory_transfer.hpp"

#include <algorithm>
#include <functional>
#include <sstream>
#include <vector>

namespace objxfer {

namespace fs = std::filesystem;

namespace {

// Directory trees map to '/'-separated keys whatever the listing delimiter
constexpr const char* KEY_SEPARATOR = "/";

// Publishes parent-level progress: (completed bytes + current file bytes) / total.
class AggregateReporter {
public:
    AggregateReporter(const ProgressCallback& sink,
                      CancellationToken& token,
                      std::string verb,
                      AggregateProgress& agg,
                      std::chrono::milliseconds interval)
        : sink_(sink)
        , token_(token)
        , verb_(std::move(verb))
        , agg_(agg)
        , throttle_(interval) {}

    void start() { publish(false, true); }

    void finish() {
        current_ = 0;
        publish(true, true);
    }

    void file_done(uint64_t bytes) {
        current_ = 0;
        ++agg_.completed_files;
        agg_.transferred_bytes += bytes;
        // A file may have grown since the scan
        agg_.total_bytes = std::max(agg_.total_bytes, agg_.transferred_bytes);
        publish(false, false);
    }

    // Progress sink handed to each child transfer
    ProgressCallback child_callback() {
        return [this](const ProgressUpdate& update) {
            current_ = update.bytes_transferred;
            publish(false, false);
            return !token_.is_cancelled();
        };
    }

private:
    void publish(bool confirmed, bool force) {
        uint64_t done = std::min(agg_.transferred_bytes + current_,
                                 std::max(agg_.total_bytes, agg_.transferred_bytes));
        int pct = agg_.total_bytes > 0
            ? clamp_percent(done, agg_.total_bytes, confirmed)
            : clamp_percent(agg_.completed_files, agg_.total_files, confirmed);
        if (!throttle_.should_emit(pct, force) || !sink_) return;

        ProgressUpdate update;
        update.percent = pct;
        update.bytes_transferred = done;
        update.bytes_total = agg_.total_bytes;
        update.throughput_bytes_per_sec = meter_.bytes_per_sec(done);
        update.eta = confirmed ? std::optional<std::chrono::seconds>(std::chrono::seconds(0))
                               : meter_.eta(done, agg_.total_bytes);

        std::ostringstream status;
        status << verb_ << " " << agg_.completed_files << "/" << agg_.total_files
               << " files, " << format_size(done) << " / " << format_size(agg_.total_bytes);
        if (update.eta) status << ", " << format_eta(*update.eta) << " left";
        update.status_text = status.str();

        if (!sink_(update)) {
            token_.cancel();
        }
    }

    const ProgressCallback& sink_;
    CancellationToken& token_;
    std::string verb_;
    AggregateProgress& agg_;
    ProgressThrottle throttle_;
    ThroughputMeter meter_;
    uint64_t current_ = 0;
};

// Re-raise a child failure as the directory operation's failure
OperationError fail_fast(const OperationError& error,
                         const std::string& operation,
                         const std::string& failed_item,
                         const AggregateProgress& agg,
                         const std::map<std::string, std::string>& details) {
    std::map<std::string, std::string> extra = details;
    extra["failed_item"] = failed_item;
    extra["completed"] = std::to_string(agg.completed_files);
    extra["total"] = std::to_string(agg.total_files);
    return OperationError(error.kind(), operation, error.code(), error.what(),
                          error.attempts(), extra).with_details(error.details());
}

// Relative key path safe to join under a local root
bool is_safe_relative(const std::string& rel) {
    if (rel.empty() || rel.front() == '/') return false;
    std::stringstream ss(rel);
    std::string segment;
    while (std::getline(ss, segment, '/')) {
        if (segment == "." || segment == "..") return false;
    }
    return true;
}

}  // namespace

DirectoryTransfer::DirectoryTransfer(StorageBackend& backend,
                                     const RetryExecutor& retry,
                                     const PaginatedLister& lister,
                                     ObjectTransfer& transfer,
                                     DirectoryOptions options,
                                     std::shared_ptr<Logger> logger)
    : backend_(backend)
    , retry_(retry)
    , lister_(lister)
    , transfer_(transfer)
    , options_(options)
    , logger_(logger ? std::move(logger) : Logger::null()) {
    if (options_.delete_batch_size == 0) options_.delete_batch_size = 1000;
}

std::string DirectoryTransfer::normalize_prefix(const std::string& prefix) {
    if (prefix.empty() || is_marker_key(prefix, KEY_SEPARATOR)) return prefix;
    return prefix + KEY_SEPARATOR;
}

// --- Upload ---

DirectoryResult DirectoryTransfer::upload_directory(const fs::path& local_root,
                                                    const std::string& bucket,
                                                    const std::string& prefix,
                                                    const ProgressCallback& on_progress,
                                                    CancellationToken& token,
                                                    const RetryListener& on_retry) {
    auto base = normalize_prefix(prefix);
    std::map<std::string, std::string> details{
        {"bucket", bucket}, {"prefix", base}, {"local_path", local_root.string()}};

    std::error_code ec;
    if (!fs::is_directory(local_root, ec)) {
        throw OperationError(ErrorKind::Fatal, "upload_dir", "LocalFileError",
                             "not a directory: " + local_root.string(), 1, details);
    }

    DirectoryResult result;
    auto& agg = result.progress;

    // Phase 1: scan for progress denominators
    for (fs::recursive_directory_iterator it(local_root, fs::directory_options::skip_permission_denied, ec), end;
         !ec && it != end; it.increment(ec)) {
        if (token.is_cancelled()) throw make_cancelled("upload_dir", details);
        std::error_code size_ec;
        if (it->is_regular_file(size_ec)) {
            auto size = it->file_size(size_ec);
            ++agg.total_files;
            agg.total_bytes += size_ec ? 0 : size;
        }
    }
    if (ec) {
        throw OperationError(ErrorKind::Fatal, "upload_dir", "LocalFileError",
                             "scan failed: " + ec.message(), 1, details);
    }
    logger_->info("Uploading %s -> %s/%s: %llu files, %s", local_root.c_str(),
                  bucket.c_str(), base.c_str(),
                  static_cast<unsigned long long>(agg.total_files),
                  format_size(agg.total_bytes).c_str());

    AggregateReporter reporter(on_progress, token, "Uploading", agg, options_.progress_interval);
    reporter.start();

    // Phase 2: depth-first transfer
    std::function<void(const fs::path&, const std::string&)> visit =
        [&](const fs::path& dir, const std::string& key_prefix) {
        std::vector<fs::directory_entry> entries;
        std::error_code dir_ec;
        for (const auto& entry : fs::directory_iterator(dir, dir_ec)) {
            entries.push_back(entry);
        }
        if (dir_ec) {
            throw fail_fast(OperationError(ErrorKind::Fatal, "upload_dir", "LocalFileError",
                                           "cannot read " + dir.string() + ": " + dir_ec.message()),
                            "upload_dir", dir.string(), agg, details);
        }
        std::sort(entries.begin(), entries.end(),
                  [](const fs::directory_entry& a, const fs::directory_entry& b) {
                      return a.path().filename() < b.path().filename();
                  });

        if (entries.empty() && !key_prefix.empty()) {
            try {
                transfer_.create_marker(bucket, key_prefix, token, on_retry);
            } catch (const OperationError& e) {
                throw fail_fast(e, "upload_dir", key_prefix, agg, details);
            }
            ++result.markers_created;
            return;
        }

        for (const auto& entry : entries) {
            auto name = entry.path().filename().string();
            if (token.is_cancelled()) {
                throw fail_fast(make_cancelled("upload_dir"), "upload_dir",
                                entry.path().string(), agg, details);
            }

            // Symlinked directories are not descended, matching the scan.
            // A symlink to a regular file is uploaded as that file.
            std::error_code type_ec;
            bool is_link = entry.is_symlink(type_ec);
            bool is_dir = !type_ec && !is_link && entry.is_directory(type_ec);
            bool is_file = !type_ec && !is_dir && entry.is_regular_file(type_ec);
            if (type_ec && !is_link) {
                throw fail_fast(OperationError(ErrorKind::Fatal, "upload_dir", "LocalFileError",
                                               "cannot stat " + entry.path().string() + ": " +
                                                   type_ec.message()),
                                "upload_dir", entry.path().string(), agg, details);
            }

            if (is_dir) {
                visit(entry.path(), key_prefix + name + KEY_SEPARATOR);
            } else if (is_file) {
                try {
                    auto r = transfer_.upload(entry.path(), bucket, key_prefix + name,
                                              reporter.child_callback(), token, on_retry);
                    reporter.file_done(r.bytes);
                } catch (const OperationError& e) {
                    if (!e.is_cancelled()) ++agg.failed_files;
                    throw fail_fast(e, "upload_dir", entry.path().string(), agg, details);
                }
            } else {
                logger_->debug("Skipping non-regular file %s", entry.path().c_str());
            }
        }
    };
    visit(local_root, base);

    reporter.finish();
    logger_->info("Uploaded %llu files (%s), %llu directory markers",
                  static_cast<unsigned long long>(agg.completed_files),
                  format_size(agg.transferred_bytes).c_str(),
                  static_cast<unsigned long long>(result.markers_created));
    return result;
}

// --- Download ---

DirectoryResult DirectoryTransfer::download_directory(const std::string& bucket,
                                                      const std::string& prefix,
                                                      const fs::path& local_root,
                                                      const ProgressCallback& on_progress,
                                                      CancellationToken& token,
                                                      const RetryListener& on_retry) {
    auto base = normalize_prefix(prefix);
    std::map<std::string, std::string> details{
        {"bucket", bucket}, {"prefix", base}, {"local_path", local_root.string()}};

    std::error_code ec;
    fs::create_directories(local_root, ec);
    if (ec) {
        throw OperationError(ErrorKind::Fatal, "download_dir", "LocalFileError",
                             "cannot create " + local_root.string() + ": " + ec.message(),
                             1, details);
    }

    DirectoryResult result;
    auto& agg = result.progress;

    // Phase 1: remote scan, one level at a time
    std::vector<ObjectSummary> objects;
    try {
        objects = lister_.collect_all(bucket, base, true, &token, on_retry);
    } catch (const OperationError& e) {
        throw fail_fast(e, "download_dir", base, agg, details);
    }
    for (const auto& obj : objects) {
        if (is_marker_key(obj.key, KEY_SEPARATOR)) continue;
        ++agg.total_files;
        agg.total_bytes += obj.size;
    }
    logger_->info("Downloading %s/%s -> %s: %llu files, %s", bucket.c_str(), base.c_str(),
                  local_root.c_str(), static_cast<unsigned long long>(agg.total_files),
                  format_size(agg.total_bytes).c_str());

    AggregateReporter reporter(on_progress, token, "Downloading", agg, options_.progress_interval);
    reporter.start();

    // Phase 2: keys in sorted order are already depth-first
    for (const auto& obj : objects) {
        if (token.is_cancelled()) {
            throw fail_fast(make_cancelled("download_dir"), "download_dir", obj.key, agg, details);
        }

        auto rel = obj.key.substr(base.size());
        bool is_marker = is_marker_key(obj.key, KEY_SEPARATOR);
        if (is_marker) {
            if (rel.empty()) continue;  // the prefix's own marker
            rel.pop_back();
        }
        if (!is_safe_relative(rel)) {
            ++agg.failed_files;
            throw fail_fast(OperationError(ErrorKind::Fatal, "download_dir", "InvalidKey",
                                           "key escapes the target directory: " + obj.key),
                            "download_dir", obj.key, agg, details);
        }

        auto dest = local_root / rel;
        if (is_marker) {
            fs::create_directories(dest, ec);
            if (ec) {
                throw fail_fast(OperationError(ErrorKind::Fatal, "download_dir", "LocalFileError",
                                               "cannot create " + dest.string() + ": " + ec.message()),
                                "download_dir", obj.key, agg, details);
            }
            continue;
        }

        try {
            auto r = transfer_.download(bucket, obj.key, dest, reporter.child_callback(),
                                        token, on_retry);
            reporter.file_done(r.bytes);
        } catch (const OperationError& e) {
            if (!e.is_cancelled()) ++agg.failed_files;
            throw fail_fast(e, "download_dir", obj.key, agg, details);
        }
    }

    reporter.finish();
    logger_->info("Downloaded %llu files (%s)",
                  static_cast<unsigned long long>(agg.completed_files),
                  format_size(agg.transferred_bytes).c_str());
    return result;
}

// --- Delete ---

DirectoryResult DirectoryTransfer::delete_directory(const std::string& bucket,
                                                    const std::string& prefix,
                                                    const ProgressCallback& on_progress,
                                                    CancellationToken& token,
                                                    const RetryListener& on_retry) {
    auto base = normalize_prefix(prefix);
    std::map<std::string, std::string> details{{"bucket", bucket}, {"prefix", base}};

    DirectoryResult result;
    auto& agg = result.progress;

    std::vector<ObjectSummary> objects;
    try {
        objects = lister_.collect_all(bucket, base, true, &token, on_retry);
    } catch (const OperationError& e) {
        throw fail_fast(e, "delete_dir", base, agg, details);
    }
    std::vector<std::string> keys;
    keys.reserve(objects.size());
    for (const auto& obj : objects) {
        keys.push_back(obj.key);
    }
    agg.total_files = keys.size();

    logger_->info("Deleting %s/%s: %zu keys in batches of %u", bucket.c_str(), base.c_str(),
                  keys.size(), options_.delete_batch_size);

    AggregateReporter reporter(on_progress, token, "Deleting", agg, options_.progress_interval);
    reporter.start();

    auto with_deleted = [&](const OperationError& e, const std::string& item) {
        return fail_fast(e, "delete_dir", item, agg, details)
            .with_details({{"deleted", std::to_string(result.deleted)}});
    };

    for (size_t start = 0; start < keys.size(); start += options_.delete_batch_size) {
        if (token.is_cancelled()) {
            throw with_deleted(make_cancelled("delete_dir"), keys[start]);
        }

        auto stop = std::min(keys.size(), start + options_.delete_batch_size);
        std::vector<std::string> batch(keys.begin() + static_cast<std::ptrdiff_t>(start),
                                       keys.begin() + static_cast<std::ptrdiff_t>(stop));

        std::vector<DeleteResult> outcomes;
        try {
            ++result.delete_batches;
            outcomes = retry_.execute("delete_dir", [&] {
                return backend_.delete_objects(bucket, batch);
            }, &token, on_retry, details);
        } catch (const OperationError& e) {
            if (!e.is_cancelled()) agg.failed_files += batch.size();
            throw with_deleted(e, batch.front());
        }

        const DeleteResult* first_failure = nullptr;
        for (const auto& outcome : outcomes) {
            if (outcome.deleted) {
                ++result.deleted;
                reporter.file_done(0);
            } else {
                ++agg.failed_files;
                if (!first_failure) first_failure = &outcome;
            }
        }
        if (first_failure) {
            auto code = first_failure->code.empty() ? std::string(CLIENT_ERROR_CODE)
                                                    : first_failure->code;
            throw with_deleted(OperationError(ErrorKind::Fatal, "delete_dir", code,
                                              first_failure->message),
                               first_failure->key);
        }
        logger_->debug("Deleted batch %u (%zu keys)", result.delete_batches, batch.size());
    }

    reporter.finish();
    logger_->info("Deleted %llu keys in %u batches",
                  static_cast<unsigned long long>(result.deleted), result.delete_batches);
    return result;
}

}  // namespace objxfer
