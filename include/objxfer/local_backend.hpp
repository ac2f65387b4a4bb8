#pragma once

#include "objxfer/storage_backend.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace objxfer {

/// Object store emulated on a local directory tree.
///
/// Layout: <root>/<bucket>/<key>. A directory marker key ("photos/2024/") is
/// stored as the directory itself holding a hidden MARKER_FILE. Puts and copies
/// are written to a temp file and renamed into place, so an interrupted put
/// never leaves a partial object visible. ETags are the hex MD5 of the
/// content. Presigned URLs are file:// URLs signed with HMAC-SHA256.
class LocalStorageBackend : public StorageBackend {
public:
    static constexpr const char* MARKER_FILE = ".objxfer_dir";
    static constexpr const char* TEMP_PREFIX = ".objxfer-tmp.";

    struct Config {
        std::filesystem::path root;
        std::string signing_key;       // random per instance when empty
        size_t chunk_size = 64 * 1024; // progress granularity for get/put
    };

    explicit LocalStorageBackend(const Config& config);
    explicit LocalStorageBackend(const std::filesystem::path& root);

    std::string type_name() const override { return "local"; }

    /// Create a bucket directory (no-op if it exists).
    void create_bucket(const std::string& bucket);

    std::vector<BucketInfo> list_buckets() override;

    ListingPage list_objects(const std::string& bucket,
                             const std::string& prefix,
                             const std::string& delimiter,
                             const std::optional<std::string>& continuation_token,
                             uint32_t max_keys) override;

    ObjectMetadata head_object(const std::string& bucket,
                               const std::string& key) override;

    void get_object(const std::string& bucket,
                    const std::string& key,
                    std::ostream& dest,
                    const BackendProgressCallback& progress) override;

    void put_object(const std::string& bucket,
                    const std::string& key,
                    std::istream& src,
                    uint64_t size,
                    const BackendProgressCallback& progress,
                    const PutOptions& options = {}) override;

    void delete_object(const std::string& bucket,
                       const std::string& key) override;

    std::vector<DeleteResult> delete_objects(
        const std::string& bucket,
        const std::vector<std::string>& keys) override;

    void copy_object(const ObjectRef& source,
                     const ObjectRef& destination) override;

    std::string presign_url(const std::string& bucket,
                            const std::string& key,
                            std::chrono::seconds expiry) override;

    bool supports_native_cancel() const override { return true; }
    void abort_transfer(const std::string& bucket, const std::string& key) override;

    /// Check signature and expiry of a URL produced by presign_url().
    bool verify_presigned_url(const std::string& url) const;

    const std::filesystem::path& root() const { return root_; }

    /// Delete temp files of puts and copies that never completed (a killed
    /// process) and were last written more than max_age ago. Returns the
    /// number removed.
    size_t remove_stale_temp_files(std::chrono::seconds max_age);

private:
    struct Shard {
        mutable std::shared_mutex mutex;
    };

    Shard& get_shard(const std::string& bucket, const std::string& key) const;

    std::filesystem::path bucket_path(const std::string& bucket) const;
    std::filesystem::path key_to_path(const std::string& bucket, const std::string& key) const;

    // All keys in a bucket under prefix, sorted
    std::vector<std::string> collect_keys(const std::string& bucket,
                                          const std::string& prefix) const;

    void remove_key_locked(const std::string& bucket, const std::string& key);
    void prune_empty_parents(const std::filesystem::path& from,
                             const std::filesystem::path& stop) const;

    std::string sign(const std::string& bucket, const std::string& key,
                     int64_t expires) const;

    // In-flight transfer abort flags, keyed by "bucket/key"
    std::shared_ptr<std::atomic<bool>> begin_transfer(const std::string& bucket,
                                                      const std::string& key);
    void end_transfer(const std::string& bucket, const std::string& key,
                      const std::shared_ptr<std::atomic<bool>>& flag);

    std::filesystem::path root_;
    std::string signing_key_;
    size_t chunk_size_;

    std::vector<std::unique_ptr<Shard>> shards_;

    std::mutex inflight_mutex_;
    std::unordered_multimap<std::string, std::shared_ptr<std::atomic<bool>>> inflight_;
};

}  // namespace objxfer
