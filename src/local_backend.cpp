#include "objxfer/local_backend.hpp"
#include "objxfer/checksum.hpp"
#include "objxfer/errors.hpp"

#include <algorithm>
#include <fstream>
#include <functional>
#include <sstream>

namespace objxfer {

namespace fs = std::filesystem;

namespace {

constexpr size_t NUM_SHARDS = 64;

std::chrono::system_clock::time_point to_system_time(fs::file_time_type ftime) {
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        std::chrono::file_clock::to_sys(ftime));
}

bool is_marker_key(const std::string& key) {
    return !key.empty() && key.back() == '/';
}

std::string transfer_id(const std::string& bucket, const std::string& key) {
    return bucket + "/" + key;
}

// Continuation tokens: "k:<key>" after an object, "p:<prefix>" after a common prefix
std::string make_token(bool is_prefix, const std::string& value) {
    return (is_prefix ? "p:" : "k:") + value;
}

}  // namespace

LocalStorageBackend::LocalStorageBackend(const Config& config)
    : root_(fs::absolute(config.root))
    , signing_key_(config.signing_key.empty() ? random_hex(32) : config.signing_key)
    , chunk_size_(config.chunk_size == 0 ? 64 * 1024 : config.chunk_size) {
    fs::create_directories(root_);
    shards_.resize(NUM_SHARDS);
    for (auto& shard : shards_) {
        shard = std::make_unique<Shard>();
    }
}

LocalStorageBackend::LocalStorageBackend(const fs::path& root)
    : LocalStorageBackend(Config{root, {}, 64 * 1024}) {}

size_t LocalStorageBackend::remove_stale_temp_files(std::chrono::seconds max_age) {
    auto cutoff = fs::file_time_type::clock::now() - max_age;
    size_t removed = 0;

    std::error_code ec;
    for (fs::recursive_directory_iterator it(root_, fs::directory_options::skip_permission_denied, ec), end;
         !ec && it != end; it.increment(ec)) {
        if (it->path().filename().string().rfind(TEMP_PREFIX, 0) != 0) continue;
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec)) continue;
        auto mtime = it->last_write_time(entry_ec);
        if (entry_ec || mtime > cutoff) continue;
        if (fs::remove(it->path(), entry_ec)) ++removed;
    }
    return removed;
}

// --- Path helpers ---

LocalStorageBackend::Shard& LocalStorageBackend::get_shard(const std::string& bucket,
                                                           const std::string& key) const {
    auto h = std::hash<std::string>{}(transfer_id(bucket, key));
    return *shards_[h % shards_.size()];
}

fs::path LocalStorageBackend::bucket_path(const std::string& bucket) const {
    if (bucket.empty() || bucket.find('/') != std::string::npos ||
        bucket == "." || bucket == "..") {
        throw StorageError("InvalidBucketName", "invalid bucket name: " + bucket);
    }
    auto path = root_ / bucket;
    if (!fs::is_directory(path)) {
        throw StorageError("NoSuchBucket", "bucket does not exist: " + bucket);
    }
    return path;
}

fs::path LocalStorageBackend::key_to_path(const std::string& bucket,
                                          const std::string& key) const {
    if (key.empty() || key.front() == '/') {
        throw StorageError("InvalidArgument", "invalid key: '" + key + "'");
    }
    // Reject traversal and reserved names in any segment
    std::stringstream ss(key);
    std::string segment;
    while (std::getline(ss, segment, '/')) {
        if (segment == "." || segment == ".." || segment == MARKER_FILE ||
            segment.rfind(TEMP_PREFIX, 0) == 0) {
            throw StorageError("InvalidArgument", "invalid key: '" + key + "'");
        }
    }

    auto base = bucket_path(bucket);
    if (is_marker_key(key)) {
        return base / key.substr(0, key.size() - 1) / MARKER_FILE;
    }
    return base / key;
}

std::vector<std::string> LocalStorageBackend::collect_keys(const std::string& bucket,
                                                           const std::string& prefix) const {
    auto base = bucket_path(bucket);
    std::vector<std::string> keys;

    std::error_code ec;
    fs::recursive_directory_iterator it(base, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        throw StorageError("InternalError", "cannot list bucket: " + ec.message());
    }
    for (auto end = fs::recursive_directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            throw StorageError("InternalError", "listing interrupted: " + ec.message());
        }
        if (!it->is_regular_file()) continue;

        auto name = it->path().filename().string();
        if (name.rfind(TEMP_PREFIX, 0) == 0) continue;

        std::string key;
        if (name == MARKER_FILE) {
            auto rel = fs::relative(it->path().parent_path(), base).generic_string();
            if (rel == ".") continue;
            key = rel + "/";
        } else {
            key = fs::relative(it->path(), base).generic_string();
        }
        if (key.compare(0, prefix.size(), prefix) == 0) {
            keys.push_back(std::move(key));
        }
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

// --- Buckets ---

void LocalStorageBackend::create_bucket(const std::string& bucket) {
    if (bucket.empty() || bucket.find('/') != std::string::npos ||
        bucket == "." || bucket == "..") {
        throw StorageError("InvalidBucketName", "invalid bucket name: " + bucket);
    }
    std::error_code ec;
    fs::create_directories(root_ / bucket, ec);
    if (ec) {
        throw StorageError("InternalError", "cannot create bucket: " + ec.message());
    }
}

std::vector<BucketInfo> LocalStorageBackend::list_buckets() {
    std::vector<BucketInfo> buckets;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(root_, ec)) {
        if (!entry.is_directory()) continue;
        BucketInfo info;
        info.name = entry.path().filename().string();
        info.creation_date = to_system_time(entry.last_write_time());
        buckets.push_back(std::move(info));
    }
    if (ec) {
        throw StorageError("InternalError", "cannot list buckets: " + ec.message());
    }
    std::sort(buckets.begin(), buckets.end(),
              [](const BucketInfo& a, const BucketInfo& b) { return a.name < b.name; });
    return buckets;
}

// --- Listing ---

ListingPage LocalStorageBackend::list_objects(const std::string& bucket,
                                              const std::string& prefix,
                                              const std::string& delimiter,
                                              const std::optional<std::string>& continuation_token,
                                              uint32_t max_keys) {
    if (max_keys == 0) max_keys = 1000;

    std::string after;
    bool after_is_prefix = false;
    if (continuation_token && !continuation_token->empty()) {
        const auto& tok = *continuation_token;
        if (tok.size() < 2 || (tok[0] != 'k' && tok[0] != 'p') || tok[1] != ':') {
            throw StorageError("InvalidArgument", "malformed continuation token");
        }
        after_is_prefix = tok[0] == 'p';
        after = tok.substr(2);
    }

    auto keys = collect_keys(bucket, prefix);

    ListingPage page;
    uint32_t count = 0;
    std::string last_emitted;
    bool last_is_prefix = false;
    std::string last_prefix;

    for (const auto& key : keys) {
        if (!after.empty()) {
            if (key <= after) continue;
            if (after_is_prefix && key.compare(0, after.size(), after) == 0) continue;
        }

        // The prefix's own marker ("dir/" listed under "dir/") stays an object
        std::optional<std::string> common_prefix;
        if (!delimiter.empty()) {
            auto pos = key.find(delimiter, prefix.size());
            if (pos != std::string::npos) {
                common_prefix = key.substr(0, pos + delimiter.size());
            }
        }

        if (common_prefix && *common_prefix == last_prefix) continue;

        if (count >= max_keys) {
            page.is_truncated = true;
            page.continuation_token = make_token(last_is_prefix, last_emitted);
            break;
        }

        if (common_prefix) {
            page.prefixes.push_back(DirectorySummary{*common_prefix});
            last_prefix = *common_prefix;
            last_emitted = *common_prefix;
            last_is_prefix = true;
        } else {
            ObjectSummary obj;
            obj.key = key;
            obj.storage_class = "STANDARD";
            auto path = key_to_path(bucket, key);
            std::error_code ec;
            obj.size = is_marker_key(key) ? 0 : fs::file_size(path, ec);
            auto mtime = fs::last_write_time(path, ec);
            if (!ec) obj.last_modified = to_system_time(mtime);
            obj.etag = file_md5_hex(path).value_or("");
            page.objects.push_back(std::move(obj));
            last_emitted = key;
            last_is_prefix = false;
        }
        ++count;
    }
    return page;
}

// --- Objects ---

ObjectMetadata LocalStorageBackend::head_object(const std::string& bucket,
                                                const std::string& key) {
    auto& shard = get_shard(bucket, key);
    std::shared_lock lock(shard.mutex);

    auto path = key_to_path(bucket, key);
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw StorageError("NoSuchKey", "object does not exist: " + bucket + "/" + key);
    }

    ObjectMetadata meta;
    meta.size = is_marker_key(key) ? 0 : fs::file_size(path, ec);
    meta.content_type = is_marker_key(key) ? "application/x-directory"
                                           : "application/octet-stream";
    meta.etag = file_md5_hex(path).value_or("");
    auto mtime = fs::last_write_time(path, ec);
    if (!ec) meta.last_modified = to_system_time(mtime);
    meta.storage_class = "STANDARD";
    return meta;
}

void LocalStorageBackend::get_object(const std::string& bucket,
                                     const std::string& key,
                                     std::ostream& dest,
                                     const BackendProgressCallback& progress) {
    auto& shard = get_shard(bucket, key);
    std::shared_lock lock(shard.mutex);

    auto path = key_to_path(bucket, key);
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw StorageError("NoSuchKey", "object does not exist: " + bucket + "/" + key);
    }

    auto abort_flag = begin_transfer(bucket, key);
    std::vector<char> buf(chunk_size_);
    uint64_t done = 0;
    try {
        while (in) {
            in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
            auto n = in.gcount();
            if (n <= 0) break;
            dest.write(buf.data(), n);
            if (!dest) {
                throw StorageError("WriteError", "cannot write destination stream");
            }
            done += static_cast<uint64_t>(n);
            if (abort_flag->load() || (progress && !progress(done))) {
                throw StorageError(ABORTED_CODE, "transfer aborted: " + bucket + "/" + key);
            }
        }
        if (in.bad()) {
            throw StorageError("InternalError", "read failed: " + bucket + "/" + key);
        }
    } catch (...) {
        end_transfer(bucket, key, abort_flag);
        throw;
    }
    end_transfer(bucket, key, abort_flag);
}

void LocalStorageBackend::put_object(const std::string& bucket,
                                     const std::string& key,
                                     std::istream& src,
                                     uint64_t size,
                                     const BackendProgressCallback& progress,
                                     const PutOptions& /*options*/) {
    auto dest_path = key_to_path(bucket, key);

    std::error_code ec;
    fs::create_directories(dest_path.parent_path(), ec);
    if (ec) {
        throw StorageError("KeyConflict", "cannot create key path: " + ec.message());
    }

    auto temp_path = dest_path.parent_path() /
        (std::string(TEMP_PREFIX) + random_hex(8));

    auto abort_flag = begin_transfer(bucket, key);
    try {
        {
            std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
            if (!out) {
                throw StorageError("InternalError", "cannot create temp file");
            }

            std::vector<char> buf(chunk_size_);
            uint64_t done = 0;
            while (done < size) {
                auto want = static_cast<std::streamsize>(
                    std::min<uint64_t>(buf.size(), size - done));
                src.read(buf.data(), want);
                auto n = src.gcount();
                if (n <= 0) {
                    throw StorageError("IncompleteBody",
                                       "source ended after " + std::to_string(done) +
                                       " of " + std::to_string(size) + " bytes");
                }
                out.write(buf.data(), n);
                if (!out) {
                    throw StorageError("InternalError", "write failed: " + bucket + "/" + key);
                }
                done += static_cast<uint64_t>(n);
                if (abort_flag->load() || (progress && !progress(done))) {
                    throw StorageError(ABORTED_CODE, "transfer aborted: " + bucket + "/" + key);
                }
            }
        }

        // Atomic completion
        auto& shard = get_shard(bucket, key);
        std::unique_lock lock(shard.mutex);
        fs::rename(temp_path, dest_path, ec);
        if (ec) {
            throw StorageError("KeyConflict", "cannot commit object: " + ec.message());
        }
    } catch (...) {
        fs::remove(temp_path, ec);
        end_transfer(bucket, key, abort_flag);
        throw;
    }
    end_transfer(bucket, key, abort_flag);
}

void LocalStorageBackend::remove_key_locked(const std::string& bucket,
                                            const std::string& key) {
    auto path = key_to_path(bucket, key);
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        throw StorageError("InternalError", "cannot delete " + key + ": " + ec.message());
    }
    prune_empty_parents(path.parent_path(), bucket_path(bucket));
}

void LocalStorageBackend::prune_empty_parents(const fs::path& from,
                                              const fs::path& stop) const {
    std::error_code ec;
    auto dir = from;
    while (dir != stop && dir.string().size() > stop.string().size()) {
        if (!fs::is_directory(dir, ec) || !fs::is_empty(dir, ec)) break;
        fs::remove(dir, ec);
        if (ec) break;
        dir = dir.parent_path();
    }
}

void LocalStorageBackend::delete_object(const std::string& bucket,
                                        const std::string& key) {
    // Deleting a missing key succeeds, as in S3
    auto& shard = get_shard(bucket, key);
    std::unique_lock lock(shard.mutex);
    remove_key_locked(bucket, key);
}

std::vector<DeleteResult> LocalStorageBackend::delete_objects(
    const std::string& bucket,
    const std::vector<std::string>& keys) {
    bucket_path(bucket);  // NoSuchBucket fails the whole batch

    std::vector<DeleteResult> results;
    results.reserve(keys.size());
    for (const auto& key : keys) {
        DeleteResult r;
        r.key = key;
        try {
            delete_object(bucket, key);
            r.deleted = true;
        } catch (const StorageError& e) {
            r.code = e.code();
            r.message = e.what();
        }
        results.push_back(std::move(r));
    }
    return results;
}

void LocalStorageBackend::copy_object(const ObjectRef& source,
                                      const ObjectRef& destination) {
    auto src_path = key_to_path(source.bucket, source.key);
    auto dst_path = key_to_path(destination.bucket, destination.key);

    // Lock both shards in address order to avoid deadlock
    auto& src_shard = get_shard(source.bucket, source.key);
    auto& dst_shard = get_shard(destination.bucket, destination.key);
    std::shared_lock src_lock(src_shard.mutex, std::defer_lock);
    std::unique_lock dst_lock(dst_shard.mutex, std::defer_lock);
    if (&src_shard < &dst_shard) {
        src_lock.lock();
        dst_lock.lock();
    } else if (&src_shard > &dst_shard) {
        dst_lock.lock();
        src_lock.lock();
    } else {
        dst_lock.lock();
    }

    std::error_code ec;
    if (!fs::is_regular_file(src_path, ec)) {
        throw StorageError("NoSuchKey", "object does not exist: " +
                           source.bucket + "/" + source.key);
    }
    fs::create_directories(dst_path.parent_path(), ec);
    if (ec) {
        throw StorageError("KeyConflict", "cannot create key path: " + ec.message());
    }

    auto temp_path = dst_path.parent_path() / (std::string(TEMP_PREFIX) + random_hex(8));
    fs::copy_file(src_path, temp_path, fs::copy_options::overwrite_existing, ec);
    if (!ec) fs::rename(temp_path, dst_path, ec);
    if (ec) {
        std::error_code ignore;
        fs::remove(temp_path, ignore);
        throw StorageError("InternalError", "copy failed: " + ec.message());
    }
}

// --- Presigned URLs ---

std::string LocalStorageBackend::sign(const std::string& bucket,
                                      const std::string& key,
                                      int64_t expires) const {
    return hmac_sha256_hex(signing_key_,
                           bucket + "\n" + key + "\n" + std::to_string(expires));
}

std::string LocalStorageBackend::presign_url(const std::string& bucket,
                                             const std::string& key,
                                             std::chrono::seconds expiry) {
    auto path = key_to_path(bucket, key);
    if (is_marker_key(key)) path = path.parent_path();
    auto expires = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch() + expiry).count();

    std::ostringstream url;
    url << "file://" << path.generic_string()
        << "?X-Objxfer-Expires=" << expires
        << "&X-Objxfer-Signature=" << sign(bucket, key, expires);
    return url.str();
}

bool LocalStorageBackend::verify_presigned_url(const std::string& url) const {
    constexpr std::string_view scheme = "file://";
    if (url.compare(0, scheme.size(), scheme) != 0) return false;

    auto q = url.rfind('?');
    if (q == std::string::npos) return false;
    fs::path path = url.substr(scheme.size(), q - scheme.size());
    std::string query = url.substr(q + 1);

    std::string expires_str;
    std::string signature;
    std::stringstream ss(query);
    std::string param;
    while (std::getline(ss, param, '&')) {
        auto eq = param.find('=');
        if (eq == std::string::npos) continue;
        auto name = param.substr(0, eq);
        if (name == "X-Objxfer-Expires") expires_str = param.substr(eq + 1);
        if (name == "X-Objxfer-Signature") signature = param.substr(eq + 1);
    }
    if (expires_str.empty() || signature.empty()) return false;

    int64_t expires = 0;
    try {
        expires = std::stoll(expires_str);
    } catch (const std::exception&) {
        return false;
    }
    auto now = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    if (now > expires) return false;

    auto rel = fs::relative(path, root_).generic_string();
    auto slash = rel.find('/');
    if (rel.empty() || slash == std::string::npos || rel.compare(0, 2, "..") == 0) {
        return false;
    }
    auto bucket = rel.substr(0, slash);
    auto key = rel.substr(slash + 1);

    // Either a plain object key or a directory marker key
    return signature == sign(bucket, key, expires) ||
           signature == sign(bucket, key + "/", expires);
}

// --- Native cancellation ---

std::shared_ptr<std::atomic<bool>> LocalStorageBackend::begin_transfer(
    const std::string& bucket, const std::string& key) {
    auto flag = std::make_shared<std::atomic<bool>>(false);
    std::lock_guard lock(inflight_mutex_);
    inflight_.emplace(transfer_id(bucket, key), flag);
    return flag;
}

void LocalStorageBackend::end_transfer(const std::string& bucket,
                                       const std::string& key,
                                       const std::shared_ptr<std::atomic<bool>>& flag) {
    std::lock_guard lock(inflight_mutex_);
    auto range = inflight_.equal_range(transfer_id(bucket, key));
    for (auto it = range.first; it != range.second; ++it) {
        if (it->second == flag) {
            inflight_.erase(it);
            break;
        }
    }
}

void LocalStorageBackend::abort_transfer(const std::string& bucket,
                                         const std::string& key) {
    std::lock_guard lock(inflight_mutex_);
    auto range = inflight_.equal_range(transfer_id(bucket, key));
    for (auto it = range.first; it != range.second; ++it) {
        it->second->store(true);
    }
}

}  // namespace objxfer
