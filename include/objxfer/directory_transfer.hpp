#pragma once

#include "objxfer/cancellation.hpp"
#include "objxfer/logger.hpp"
#include "objxfer/object_transfer.hpp"
#include "objxfer/paginated_lister.hpp"
#include "objxfer/progress.hpp"
#include "objxfer/retry_executor.hpp"
#include "objxfer/storage_backend.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace objxfer {

struct DirectoryOptions {
    uint32_t delete_batch_size = 1000;
    std::chrono::milliseconds progress_interval{200};
};

/// Parent-level counters for a directory operation. Only the worker running
/// the operation touches these.
struct AggregateProgress {
    uint64_t total_bytes = 0;
    uint64_t transferred_bytes = 0;
    uint64_t total_files = 0;
    uint64_t completed_files = 0;
    uint64_t failed_files = 0;
};

struct DirectoryResult {
    AggregateProgress progress;
    uint64_t markers_created = 0;   // upload: empty-directory markers
    uint64_t deleted = 0;           // delete: keys removed
    uint32_t delete_batches = 0;    // delete: backend batch calls issued
};

/// Directory-level transfers built from single-object transfers.
///
/// Two phases: a scan computes the file count and byte total used as progress
/// denominators, then a depth-first pass transfers one file at a time on the
/// calling thread. The first fatal file error aborts the whole operation and
/// the raised error names the failed item and the completed count.
/// Cancellation stops scheduling further files; completed work stays.
class DirectoryTransfer {
public:
    DirectoryTransfer(StorageBackend& backend,
                      const RetryExecutor& retry,
                      const PaginatedLister& lister,
                      ObjectTransfer& transfer,
                      DirectoryOptions options,
                      std::shared_ptr<Logger> logger = Logger::null());

    /// Upload every file under local_root to bucket/prefix. Empty
    /// directories become "<prefix><dir>/" markers.
    DirectoryResult upload_directory(const std::filesystem::path& local_root,
                                     const std::string& bucket,
                                     const std::string& prefix,
                                     const ProgressCallback& on_progress,
                                     CancellationToken& token,
                                     const RetryListener& on_retry = {});

    /// Download every object under bucket/prefix into local_root. Markers
    /// become (possibly empty) local directories.
    DirectoryResult download_directory(const std::string& bucket,
                                       const std::string& prefix,
                                       const std::filesystem::path& local_root,
                                       const ProgressCallback& on_progress,
                                       CancellationToken& token,
                                       const RetryListener& on_retry = {});

    /// Delete every key under bucket/prefix in batches of delete_batch_size.
    /// A failed batch aborts the remaining ones.
    DirectoryResult delete_directory(const std::string& bucket,
                                     const std::string& prefix,
                                     const ProgressCallback& on_progress,
                                     CancellationToken& token,
                                     const RetryListener& on_retry = {});

    /// "photos" -> "photos/", "" stays "".
    static std::string normalize_prefix(const std::string& prefix);

private:
    StorageBackend& backend_;
    const RetryExecutor& retry_;
    const PaginatedLister& lister_;
    ObjectTransfer& transfer_;
    DirectoryOptions options_;
    std::shared_ptr<Logger> logger_;
};

}  // namespace objxfer
