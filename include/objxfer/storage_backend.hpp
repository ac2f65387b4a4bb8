#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace objxfer {

// Summary of one object in a listing page
struct ObjectSummary {
    std::string key;
    uint64_t size = 0;
    std::chrono::system_clock::time_point last_modified;
    std::string etag;
    std::string storage_class;  // STANDARD, STANDARD_IA, GLACIER, ...
};

// A common prefix ("directory") returned when listing with a delimiter
struct DirectorySummary {
    std::string prefix;

    bool operator==(const DirectorySummary&) const = default;
};

// One page of a list_objects call
struct ListingPage {
    std::vector<ObjectSummary> objects;
    std::vector<DirectorySummary> prefixes;
    std::optional<std::string> continuation_token;
    bool is_truncated = false;
};

// Metadata about a stored object
struct ObjectMetadata {
    uint64_t size = 0;
    std::string content_type;
    std::string etag;
    std::chrono::system_clock::time_point last_modified;
    std::string storage_class;
};

struct BucketInfo {
    std::string name;
    std::chrono::system_clock::time_point creation_date;
};

// Bucket + key address of an object
struct ObjectRef {
    std::string bucket;
    std::string key;
};

// Per-key outcome of a batch delete
struct DeleteResult {
    std::string key;
    bool deleted = false;
    std::string code;
    std::string message;
};

// Options for put operations
struct PutOptions {
    std::string content_type = "application/octet-stream";
    std::map<std::string, std::string> metadata;
};

/// Error raised by a storage backend, tagged with a machine-readable code
/// (e.g. "NoSuchKey", "SlowDown", "RequestTimeout").
class StorageError : public std::runtime_error {
public:
    StorageError(std::string code, const std::string& message)
        : std::runtime_error(message), code_(std::move(code)) {}

    const std::string& code() const { return code_; }

private:
    std::string code_;
};

/// Progress callback used by get/put. Receives cumulative bytes moved so far.
/// Returning false asks the backend to abort the transfer; the backend then
/// throws StorageError with code "RequestAborted". May be invoked from a
/// backend-internal thread.
using BackendProgressCallback = std::function<bool(uint64_t bytes_so_far)>;

// Abstract interface for object-storage backends (bucket/key model).
// Implementations throw StorageError on failure.
class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    // Get the backend type name (for logging/debugging)
    virtual std::string type_name() const = 0;

    virtual std::vector<BucketInfo> list_buckets() = 0;

    // List one page of objects under prefix. Objects and common prefixes
    // both count toward max_keys.
    virtual ListingPage list_objects(const std::string& bucket,
                                     const std::string& prefix,
                                     const std::string& delimiter,
                                     const std::optional<std::string>& continuation_token,
                                     uint32_t max_keys) = 0;

    virtual ObjectMetadata head_object(const std::string& bucket,
                                       const std::string& key) = 0;

    // Stream object content into dest
    virtual void get_object(const std::string& bucket,
                            const std::string& key,
                            std::ostream& dest,
                            const BackendProgressCallback& progress) = 0;

    // Write size bytes read from src
    virtual void put_object(const std::string& bucket,
                            const std::string& key,
                            std::istream& src,
                            uint64_t size,
                            const BackendProgressCallback& progress,
                            const PutOptions& options = {}) = 0;

    virtual void delete_object(const std::string& bucket,
                               const std::string& key) = 0;

    // Batch delete; returns one result per requested key
    virtual std::vector<DeleteResult> delete_objects(
        const std::string& bucket,
        const std::vector<std::string>& keys) = 0;

    virtual void copy_object(const ObjectRef& source,
                             const ObjectRef& destination) = 0;

    virtual std::string presign_url(const std::string& bucket,
                                    const std::string& key,
                                    std::chrono::seconds expiry) = 0;

    // True if an interrupted put never leaves a partial object visible
    virtual bool supports_atomic_put() const { return true; }

    // Backend-native cancellation hook for in-flight get/put
    virtual bool supports_native_cancel() const { return false; }
    virtual void abort_transfer(const std::string& /*bucket*/,
                                const std::string& /*key*/) {}
};

// Factory for creating storage backends
class StorageBackendFactory {
public:
    // Create a backend from a type name and parameter map.
    // Throws StorageError("InvalidArgument") for unknown types or bad params.
    static std::unique_ptr<StorageBackend> create(
        const std::string& type,
        const std::map<std::string, std::string>& params);

    // Create a local filesystem backend
    static std::unique_ptr<StorageBackend> create_local(
        const std::string& root_path,
        const std::string& signing_key = "");
};

}  // namespace objxfer
