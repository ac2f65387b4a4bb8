#include "objxfer/paginated_lister.hpp"

#include <algorithm>
#include <unordered_set>

namespace objxfer {

PaginatedLister::PaginatedLister(StorageBackend& backend,
                                 const RetryExecutor& retry,
                                 ListerOptions options,
                                 std::shared_ptr<Logger> logger)
    : backend_(backend)
    , retry_(retry)
    , options_(std::move(options))
    , logger_(logger ? std::move(logger) : Logger::null()) {
    if (options_.page_size == 0) options_.page_size = 1000;
    if (options_.max_pages == 0) options_.max_pages = 1;
}

ListingResult PaginatedLister::list(const std::string& bucket,
                                    const std::string& prefix,
                                    CancellationToken* token,
                                    const RetryListener& on_retry) const {
    return list(bucket, prefix, options_.delimiter, token, on_retry);
}

ListingResult PaginatedLister::list(const std::string& bucket,
                                    const std::string& prefix,
                                    const std::string& delimiter,
                                    CancellationToken* token,
                                    const RetryListener& on_retry) const {
    std::map<std::string, std::string> details{{"bucket", bucket}, {"prefix", prefix}};

    ListingResult result;
    std::unordered_set<std::string> seen_keys;
    std::unordered_set<std::string> seen_prefixes;
    std::optional<std::string> token_value;

    bool self_marker = is_marker_key(prefix, delimiter);

    while (true) {
        if (token) token->throw_if_cancelled("list");

        auto page = retry_.execute("list", [&] {
            return backend_.list_objects(bucket, prefix, delimiter, token_value,
                                         options_.page_size);
        }, token, on_retry, details);
        ++result.pages_fetched;

        for (auto& obj : page.objects) {
            if (self_marker && obj.key == prefix) {
                result.prefix_marker = obj;
                continue;
            }
            if (seen_keys.insert(obj.key).second) {
                result.objects.push_back(std::move(obj));
            }
        }
        for (auto& dir : page.prefixes) {
            if (dir.prefix == prefix) continue;
            if (seen_prefixes.insert(dir.prefix).second) {
                result.prefixes.push_back(std::move(dir));
            }
        }

        if (!page.is_truncated || !page.continuation_token) break;

        if (result.pages_fetched >= options_.max_pages) {
            result.truncated = true;
            logger_->warn("Listing of %s/%s stopped at %u pages (max_pages)",
                          bucket.c_str(), prefix.c_str(), result.pages_fetched);
            break;
        }
        token_value = std::move(page.continuation_token);
    }

    logger_->debug("Listed %s/%s: %zu objects, %zu prefixes, %u pages",
                   bucket.c_str(), prefix.c_str(), result.objects.size(),
                   result.prefixes.size(), result.pages_fetched);
    return result;
}

void PaginatedLister::walk(const std::string& bucket,
                           const std::string& prefix,
                           const Visitor& visit,
                           CancellationToken* token,
                           const RetryListener& on_retry) const {
    std::vector<std::string> stack{prefix};
    while (!stack.empty()) {
        auto current = std::move(stack.back());
        stack.pop_back();

        auto level = list(bucket, current, options_.delimiter, token, on_retry);
        if (!visit(current, level)) return;

        // Push in reverse so children are visited in listing order
        for (auto it = level.prefixes.rbegin(); it != level.prefixes.rend(); ++it) {
            stack.push_back(it->prefix);
        }
    }
}

std::vector<ObjectSummary> PaginatedLister::collect_all(const std::string& bucket,
                                                        const std::string& prefix,
                                                        bool include_markers,
                                                        CancellationToken* token,
                                                        const RetryListener& on_retry) const {
    std::vector<ObjectSummary> all;
    walk(bucket, prefix, [&](const std::string&, const ListingResult& level) {
        if (include_markers && level.prefix_marker) {
            all.push_back(*level.prefix_marker);
        }
        for (const auto& obj : level.objects) {
            if (!include_markers && is_marker_key(obj.key, options_.delimiter)) continue;
            all.push_back(obj);
        }
        return true;
    }, token, on_retry);

    std::sort(all.begin(), all.end(),
              [](const ObjectSummary& a, const ObjectSummary& b) { return a.key < b.key; });
    return all;
}

}  // namespace objxfer
