#pragma once

#include "objxfer/cancellation.hpp"
#include "objxfer/logger.hpp"
#include "objxfer/retry_executor.hpp"
#include "objxfer/storage_backend.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace objxfer {

struct ListerOptions {
    uint32_t page_size = 1000;  // max rows per backend call
    uint32_t max_pages = 20;    // safety ceiling per list() call
    std::string delimiter = "/";
};

/// True when key is a directory marker: a key ending in delimiter.
inline bool is_marker_key(const std::string& key, const std::string& delimiter) {
    return !key.empty() && !delimiter.empty() && key.size() >= delimiter.size() &&
           key.compare(key.size() - delimiter.size(), delimiter.size(), delimiter) == 0;
}

/// Merged result of one list() call.
struct ListingResult {
    std::vector<ObjectSummary> objects;        // backend order, deduplicated
    std::vector<DirectorySummary> prefixes;    // backend order, deduplicated
    uint32_t pages_fetched = 0;
    bool truncated = false;                    // stopped at max_pages

    // The queried prefix's own directory marker, filtered out of `objects`
    std::optional<ObjectSummary> prefix_marker;
};

/// Drives cursor-based list_objects calls into one merged listing.
///
/// Pages are fetched sequentially, each through the RetryExecutor, and the
/// token is checked between pages. Deep hierarchies are listed one level at
/// a time: walk() descends by narrowing the prefix instead of listing the
/// whole bucket flat.
class PaginatedLister {
public:
    PaginatedLister(StorageBackend& backend,
                    const RetryExecutor& retry,
                    ListerOptions options,
                    std::shared_ptr<Logger> logger = Logger::null());

    const ListerOptions& options() const { return options_; }

    ListingResult list(const std::string& bucket,
                       const std::string& prefix,
                       CancellationToken* token = nullptr,
                       const RetryListener& on_retry = {}) const;

    ListingResult list(const std::string& bucket,
                       const std::string& prefix,
                       const std::string& delimiter,
                       CancellationToken* token,
                       const RetryListener& on_retry = {}) const;

    /// Called once per listed level, parents before children.
    /// Return false to stop the walk.
    using Visitor = std::function<bool(const std::string& prefix, const ListingResult& level)>;

    /// Depth-first walk of prefix and every common prefix below it.
    void walk(const std::string& bucket,
              const std::string& prefix,
              const Visitor& visit,
              CancellationToken* token = nullptr,
              const RetryListener& on_retry = {}) const;

    /// Every object under prefix at any depth, sorted by key. Directory
    /// markers (keys ending in the configured delimiter, including prefix's
    /// own) are included when include_markers.
    std::vector<ObjectSummary> collect_all(const std::string& bucket,
                                           const std::string& prefix,
                                           bool include_markers,
                                           CancellationToken* token = nullptr,
                                           const RetryListener& on_retry = {}) const;

private:
    StorageBackend& backend_;
    const RetryExecutor& retry_;
    ListerOptions options_;
    std::shared_ptr<Logger> logger_;
};

}  // namespace objxfer
