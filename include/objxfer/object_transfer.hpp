#pragma once

#include "objxfer/cancellation.hpp"
#include "objxfer/logger.hpp"
#include "objxfer/progress.hpp"
#include "objxfer/retry_executor.hpp"
#include "objxfer/storage_backend.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

namespace objxfer {

struct TransferOptions {
    bool verify_checksums = false;                  // compare MD5 ETags after download
    std::chrono::milliseconds progress_interval{200};
};

struct TransferResult {
    uint64_t bytes = 0;
    std::string etag;
};

/// Single-object operations: upload, download, delete, copy, head, presign.
///
/// Every backend call goes through the RetryExecutor. Progress callbacks see
/// a percentage clamped to [0, 99] until the backend call has returned, then
/// exactly one 100. If the backend supports native cancellation, cancelling
/// the token also aborts the in-flight backend transfer directly.
///
/// Downloads land in "<dest>.objxfer-part" and are renamed into place only
/// after the full object arrived, so a failed or cancelled download never
/// leaves a partial file at the destination.
class ObjectTransfer {
public:
    static constexpr const char* PARTIAL_SUFFIX = ".objxfer-part";

    ObjectTransfer(StorageBackend& backend,
                   const RetryExecutor& retry,
                   TransferOptions options,
                   std::shared_ptr<Logger> logger = Logger::null());

    TransferResult upload(const std::filesystem::path& local_path,
                          const std::string& bucket,
                          const std::string& key,
                          const ProgressCallback& on_progress,
                          CancellationToken& token,
                          const RetryListener& on_retry = {});

    TransferResult download(const std::string& bucket,
                            const std::string& key,
                            const std::filesystem::path& local_path,
                            const ProgressCallback& on_progress,
                            CancellationToken& token,
                            const RetryListener& on_retry = {});

    void remove(const std::string& bucket, const std::string& key,
                CancellationToken& token, const RetryListener& on_retry = {});

    void copy(const ObjectRef& source, const ObjectRef& destination,
              CancellationToken& token, const RetryListener& on_retry = {});

    ObjectMetadata head(const std::string& bucket, const std::string& key,
                        CancellationToken& token, const RetryListener& on_retry = {});

    std::string presign(const std::string& bucket, const std::string& key,
                        std::chrono::seconds expiry,
                        CancellationToken& token, const RetryListener& on_retry = {});

    /// Zero-byte "key/" object standing in for an empty directory.
    void create_marker(const std::string& bucket, const std::string& key,
                       CancellationToken& token, const RetryListener& on_retry = {});

    static std::filesystem::path partial_path(const std::filesystem::path& local_path);

    /// Delete "*.objxfer-part" files under dir (recursively) last written
    /// more than max_age ago, left behind by a killed process. Returns the
    /// number removed.
    static size_t remove_stale_partials(const std::filesystem::path& dir,
                                        std::chrono::seconds max_age);

private:
    StorageBackend& backend_;
    const RetryExecutor& retry_;
    TransferOptions options_;
    std::shared_ptr<Logger> logger_;
};

}  // namespace objxfer
