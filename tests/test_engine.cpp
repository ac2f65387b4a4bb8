// Test suite for the objxfer orchestration engine.
//
// Tests:
//   1. RetryExecutor: backoff schedule, attempt caps, classification
//   2. Progress helpers: clamping, throttling, formatting
//   3. PaginatedLister: page merging, deduplication, markers, page ceiling
//   4. ObjectTransfer: progress contract, cancellation, partial cleanup
//   5. DirectoryTransfer: aggregate counters, fail-fast, batch deletes
//   6. OperationRegistry: state machine, progress monotonicity, eviction
//   7. WorkerManager: concurrency bound, cancellation, events, TTL

#include "objxfer/cancellation.hpp"
#include "objxfer/directory_transfer.hpp"
#include "objxfer/errors.hpp"
#include "objxfer/object_transfer.hpp"
#include "objxfer/operation_registry.hpp"
#include "objxfer/paginated_lister.hpp"
#include "objxfer/progress.hpp"
#include "objxfer/retry_executor.hpp"
#include "objxfer/worker_manager.hpp"

#include "fake_backend.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace objxfer;
using namespace std::chrono_literals;

namespace {

// Retry executor that records backoff delays instead of sleeping
struct RecordingRetry {
    explicit RecordingRetry(RetryPolicy policy = {}) : executor(std::move(policy)) {
        executor.set_sleep_function([this](std::chrono::milliseconds d, CancellationToken*) {
            std::lock_guard lock(mutex);
            delays.push_back(d.count());
            return true;
        });
    }

    std::vector<long long> recorded() {
        std::lock_guard lock(mutex);
        return delays;
    }

    RetryExecutor executor;
    std::mutex mutex;
    std::vector<long long> delays;
};

bool non_decreasing(const std::vector<int>& v) {
    return std::is_sorted(v.begin(), v.end());
}

class RecordingObserver : public OperationObserver {
public:
    void on_progress(const ProgressEvent& e) override {
        std::lock_guard lock(mutex_);
        progress_[e.id].push_back(e.update.percent);
    }

    void on_state_changed(const StateEvent& e) override {
        std::lock_guard lock(mutex_);
        states_[e.id].push_back(e.to);
    }

    void on_retry(const RetryEvent& /*e*/) override {
        std::lock_guard lock(mutex_);
        ++retries_;
    }

    void on_settled(const SettledEvent& e) override {
        std::lock_guard lock(mutex_);
        settled_.push_back(e);
    }

    std::vector<int> percents(OperationId id) {
        std::lock_guard lock(mutex_);
        return progress_[id];
    }

    std::vector<OperationState> states(OperationId id) {
        std::lock_guard lock(mutex_);
        return states_[id];
    }

    int retries() {
        std::lock_guard lock(mutex_);
        return retries_;
    }

    std::vector<SettledEvent> settled_for(OperationId id) {
        std::lock_guard lock(mutex_);
        std::vector<SettledEvent> out;
        for (const auto& e : settled_) {
            if (e.id == id) out.push_back(e);
        }
        return out;
    }

    size_t settled_count() {
        std::lock_guard lock(mutex_);
        return settled_.size();
    }

private:
    std::mutex mutex_;
    std::map<OperationId, std::vector<int>> progress_;
    std::map<OperationId, std::vector<OperationState>> states_;
    std::vector<SettledEvent> settled_;
    int retries_ = 0;
};

EngineOptions fast_engine_options(size_t max_concurrent) {
    EngineOptions options;
    options.retry.base_delay = 1ms;
    options.transfer.progress_interval = 0ms;
    options.directory.progress_interval = 0ms;
    options.workers.max_concurrent = max_concurrent;
    options.workers.completed_ttl = 0s;
    options.workers.janitor_interval = 50ms;
    return options;
}

}  // namespace

// ---------------------------------------------------------------------------
// 1. RetryExecutor
// ---------------------------------------------------------------------------

static void test_retry_executor() {
    std::cout << "\n=== RetryExecutor ===" << std::endl;

    {
        TEST(delays_double_each_retry);
        RetryPolicy policy;
        policy.max_retries = 3;
        policy.base_delay = 100ms;
        RecordingRetry retry(policy);

        int calls = 0;
        std::optional<OperationError> error;
        try {
            retry.executor.execute("list", [&]() -> int {
                ++calls;
                throw StorageError("SlowDown", "please slow down");
            });
        } catch (const OperationError& e) {
            error = e;
        }
        ASSERT_TRUE(error.has_value(), "should throw after exhausting retries");
        ASSERT_EQ(calls, 4, "max_retries=3 means 4 attempts");
        ASSERT_EQ(error->attempts(), 4, "attempt count");
        ASSERT_EQ(error->code(), "SlowDown", "code preserved");
        ASSERT_TRUE(error->kind() == ErrorKind::Retryable, "kind retryable");
        ASSERT_EQ(error->operation(), "list", "operation name");
        auto delays = retry.recorded();
        ASSERT_EQ(delays.size(), 3u, "three backoff sleeps");
        ASSERT_EQ(delays[0], 100, "first delay");
        ASSERT_EQ(delays[1], 200, "second delay");
        ASSERT_EQ(delays[2], 400, "third delay");
        PASS();
    }

    {
        TEST(constant_delay_without_exponential_backoff);
        RetryPolicy policy;
        policy.max_retries = 2;
        policy.base_delay = 250ms;
        policy.exponential_backoff = false;
        RecordingRetry retry(policy);

        try {
            retry.executor.execute("upload", []() -> int {
                throw StorageError("RequestTimeout", "timed out");
            });
        } catch (const OperationError&) {
        }
        auto delays = retry.recorded();
        ASSERT_EQ(delays.size(), 2u, "two sleeps");
        ASSERT_EQ(delays[0], 250, "first delay");
        ASSERT_EQ(delays[1], 250, "second delay");
        PASS();
    }

    {
        TEST(fatal_code_surfaces_immediately);
        RecordingRetry retry;
        int calls = 0;
        std::optional<OperationError> error;
        try {
            retry.executor.execute("download", [&]() -> int {
                ++calls;
                throw StorageError("NoSuchKey", "missing");
            }, nullptr, {}, {{"bucket", "b"}, {"key", "k"}});
        } catch (const OperationError& e) {
            error = e;
        }
        ASSERT_TRUE(error.has_value(), "should throw");
        ASSERT_EQ(calls, 1, "no retry for fatal codes");
        ASSERT_TRUE(error->kind() == ErrorKind::Fatal, "kind fatal");
        ASSERT_EQ(error->detail("bucket"), "b", "bucket detail");
        ASSERT_EQ(error->detail("key"), "k", "key detail");
        ASSERT_TRUE(retry.recorded().empty(), "no sleeps");
        PASS();
    }

    {
        TEST(succeeds_after_transient_failures);
        RecordingRetry retry;
        int calls = 0;
        std::vector<int> notices;
        int value = retry.executor.execute("head", [&] {
            if (++calls < 3) throw StorageError("ServiceUnavailable", "busy");
            return 42;
        }, nullptr, [&](const RetryNotice& n) { notices.push_back(n.attempt); });
        ASSERT_EQ(value, 42, "returns the eventual result");
        ASSERT_EQ(calls, 3, "three calls");
        ASSERT_EQ(notices.size(), 2u, "two retry notices");
        ASSERT_EQ(notices[0], 1, "first notice after attempt 1");
        ASSERT_EQ(notices[1], 2, "second notice after attempt 2");
        PASS();
    }

    {
        TEST(zero_retries_means_single_attempt);
        RetryPolicy policy;
        policy.max_retries = 0;
        RecordingRetry retry(policy);
        int calls = 0;
        try {
            retry.executor.execute("list", [&]() -> int {
                ++calls;
                throw StorageError("InternalError", "oops");
            });
        } catch (const OperationError&) {
        }
        ASSERT_EQ(calls, 1, "one attempt");
        ASSERT_TRUE(retry.recorded().empty(), "no sleeps");
        PASS();
    }

    {
        TEST(unknown_exception_is_fatal_client_error);
        RecordingRetry retry;
        std::optional<OperationError> error;
        try {
            retry.executor.execute("copy", []() -> int {
                throw std::runtime_error("boom");
            });
        } catch (const OperationError& e) {
            error = e;
        }
        ASSERT_TRUE(error.has_value(), "should throw");
        ASSERT_EQ(error->code(), CLIENT_ERROR_CODE, "client error code");
        ASSERT_TRUE(error->kind() == ErrorKind::Fatal, "kind fatal");
        ASSERT_EQ(std::string(error->what()), "boom", "message kept");
        PASS();
    }

    {
        TEST(cancelled_token_skips_call);
        RecordingRetry retry;
        CancellationToken token;
        token.cancel();
        int calls = 0;
        std::optional<OperationError> error;
        try {
            retry.executor.execute("list", [&] { return ++calls; }, &token);
        } catch (const OperationError& e) {
            error = e;
        }
        ASSERT_TRUE(error.has_value(), "should throw");
        ASSERT_TRUE(error->is_cancelled(), "cancelled");
        ASSERT_EQ(calls, 0, "fn not invoked");
        PASS();
    }

    {
        TEST(cancel_during_backoff_stops_retrying);
        RetryExecutor executor(RetryPolicy{});
        executor.set_sleep_function([](std::chrono::milliseconds, CancellationToken*) {
            return false;  // woken by cancellation
        });
        int calls = 0;
        std::optional<OperationError> error;
        try {
            executor.execute("upload", [&]() -> int {
                ++calls;
                throw StorageError("Throttling", "throttled");
            });
        } catch (const OperationError& e) {
            error = e;
        }
        ASSERT_TRUE(error.has_value(), "should throw");
        ASSERT_TRUE(error->is_cancelled(), "cancelled, not retryable");
        ASSERT_EQ(calls, 1, "no further attempts");
        PASS();
    }

    {
        TEST(deadline_stops_retrying);
        RetryPolicy policy;
        policy.base_delay = 1000ms;
        RecordingRetry retry(policy);
        CancellationToken token;
        token.set_deadline(CancellationToken::Clock::now() + 100ms);
        int calls = 0;
        std::optional<OperationError> error;
        try {
            retry.executor.execute("list", [&]() -> int {
                ++calls;
                throw StorageError("SlowDown", "slow");
            }, &token);
        } catch (const OperationError& e) {
            error = e;
        }
        ASSERT_TRUE(error.has_value(), "should throw");
        ASSERT_EQ(calls, 1, "backoff would pass the deadline");
        ASSERT_TRUE(error->kind() == ErrorKind::Retryable, "last error surfaces");
        PASS();
    }

    {
        TEST(retryable_operation_error_is_retried);
        RecordingRetry retry;
        int calls = 0;
        int value = retry.executor.execute("download", [&] {
            if (++calls == 1) {
                throw OperationError(ErrorKind::Retryable, "inner", "IncompleteBody", "short");
            }
            return 7;
        });
        ASSERT_EQ(value, 7, "result");
        ASSERT_EQ(calls, 2, "retried once");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 2. Progress helpers
// ---------------------------------------------------------------------------

static void test_progress_helpers() {
    std::cout << "\n=== Progress helpers ===" << std::endl;

    {
        TEST(clamp_percent_holds_at_99_until_confirmed);
        ASSERT_EQ(clamp_percent(50, 100, false), 50, "half");
        ASSERT_EQ(clamp_percent(100, 100, false), 99, "complete but unconfirmed");
        ASSERT_EQ(clamp_percent(150, 100, false), 99, "overshoot");
        ASSERT_EQ(clamp_percent(100, 100, true), 100, "confirmed");
        ASSERT_EQ(clamp_percent(0, 0, false), 0, "zero total");
        ASSERT_EQ(clamp_percent(0, 0, true), 100, "zero total confirmed");
        PASS();
    }

    {
        TEST(format_size_units);
        ASSERT_EQ(format_size(0), "0 B", "zero");
        ASSERT_EQ(format_size(512), "512 B", "bytes");
        ASSERT_EQ(format_size(1536), "1.5 KB", "kilobytes");
        ASSERT_EQ(format_size(1048576), "1.0 MB", "megabytes");
        ASSERT_EQ(format_speed(2048.0), "2.0 KB/s", "speed");
        PASS();
    }

    {
        TEST(format_eta_ranges);
        ASSERT_EQ(format_eta(42s), "42s", "seconds");
        ASSERT_EQ(format_eta(185s), "3m 05s", "minutes");
        ASSERT_EQ(format_eta(3720s), "1h 02m", "hours");
        PASS();
    }

    {
        TEST(throttle_is_monotonic);
        ProgressThrottle throttle(1h);
        ASSERT_TRUE(throttle.should_emit(0), "first emission");
        ASSERT_TRUE(!throttle.should_emit(0), "same percent inside interval");
        ASSERT_TRUE(throttle.should_emit(5), "higher percent");
        ASSERT_TRUE(!throttle.should_emit(3), "never lower");
        ASSERT_TRUE(!throttle.should_emit(3, true), "force does not allow lower");
        ASSERT_TRUE(throttle.should_emit(5, true), "force re-emits same percent");
        ASSERT_EQ(throttle.last_percent(), 5, "last percent");
        PASS();
    }

    {
        TEST(throttle_reemits_after_interval);
        ProgressThrottle throttle(10ms);
        ASSERT_TRUE(throttle.should_emit(10), "first");
        std::this_thread::sleep_for(20ms);
        ASSERT_TRUE(throttle.should_emit(10), "interval elapsed");
        PASS();
    }

    {
        TEST(throughput_eta_empty_before_bytes);
        ThroughputMeter meter;
        ASSERT_TRUE(!meter.eta(0, 100).has_value(), "no eta at zero bytes");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 3. PaginatedLister
// ---------------------------------------------------------------------------

static void fill_flat(FakeBackend& backend, const std::string& bucket,
                      const std::string& prefix, int count) {
    for (int i = 0; i < count; ++i) {
        char name[32];
        std::snprintf(name, sizeof(name), "f%04d", i);
        backend.put(bucket, prefix + name, "x");
    }
}

static void test_paginated_lister() {
    std::cout << "\n=== PaginatedLister ===" << std::endl;

    {
        TEST(merges_pages_in_backend_order);
        FakeBackend backend;
        backend.add_bucket("b");
        fill_flat(backend, "b", "dir/", 25);
        RecordingRetry retry;
        ListerOptions options;
        options.page_size = 10;
        PaginatedLister lister(backend, retry.executor, options);

        auto result = lister.list("b", "dir/");
        ASSERT_EQ(result.pages_fetched, 3u, "three pages");
        ASSERT_EQ(result.objects.size(), 25u, "all objects");
        ASSERT_TRUE(!result.truncated, "not truncated");
        ASSERT_EQ(result.objects.front().key, "dir/f0000", "first key");
        ASSERT_EQ(result.objects.back().key, "dir/f0024", "last key");
        for (size_t i = 1; i < result.objects.size(); ++i) {
            ASSERT_TRUE(result.objects[i - 1].key < result.objects[i].key, "order kept");
        }
        auto sizes = backend.list_page_sizes();
        ASSERT_EQ(sizes.size(), 3u, "three backend calls");
        ASSERT_EQ(sizes[0], 10u, "page size passed through");
        PASS();
    }

    {
        TEST(deduplicates_repeated_page_boundaries);
        FakeBackend backend;
        backend.add_bucket("b");
        fill_flat(backend, "b", "dir/", 25);
        backend.set_repeat_page_boundary(true);
        RecordingRetry retry;
        ListerOptions options;
        options.page_size = 10;
        PaginatedLister lister(backend, retry.executor, options);

        auto result = lister.list("b", "dir/");
        ASSERT_EQ(result.objects.size(), 25u, "no duplicate keys");
        ASSERT_EQ(result.pages_fetched, 3u, "three pages");
        PASS();
    }

    {
        TEST(self_marker_is_filtered);
        FakeBackend backend;
        backend.add_bucket("b");
        backend.put("b", "dir/", "");
        backend.put("b", "dir/a", "aa");
        backend.put("b", "dir/sub/b", "bbb");
        RecordingRetry retry;
        PaginatedLister lister(backend, retry.executor, ListerOptions{});

        auto result = lister.list("b", "dir/");
        ASSERT_EQ(result.objects.size(), 1u, "one object");
        ASSERT_EQ(result.objects[0].key, "dir/a", "object key");
        ASSERT_EQ(result.prefixes.size(), 1u, "one prefix");
        ASSERT_EQ(result.prefixes[0].prefix, "dir/sub/", "common prefix");
        ASSERT_TRUE(result.prefix_marker.has_value(), "marker captured");
        ASSERT_EQ(result.prefix_marker->key, "dir/", "marker key");
        PASS();
    }

    {
        TEST(max_pages_truncates);
        FakeBackend backend;
        backend.add_bucket("b");
        fill_flat(backend, "b", "", 25);
        RecordingRetry retry;
        ListerOptions options;
        options.page_size = 10;
        options.max_pages = 2;
        PaginatedLister lister(backend, retry.executor, options);

        auto result = lister.list("b", "");
        ASSERT_TRUE(result.truncated, "truncated flag");
        ASSERT_EQ(result.pages_fetched, 2u, "stopped at ceiling");
        ASSERT_EQ(result.objects.size(), 20u, "two pages of objects");
        PASS();
    }

    {
        TEST(retries_failed_page);
        FakeBackend backend;
        backend.add_bucket("b");
        fill_flat(backend, "b", "", 15);
        backend.fail_next("list_objects", "SlowDown");
        RecordingRetry retry;
        ListerOptions options;
        options.page_size = 10;
        PaginatedLister lister(backend, retry.executor, options);

        auto result = lister.list("b", "");
        ASSERT_EQ(result.objects.size(), 15u, "all objects");
        ASSERT_EQ(backend.calls("list_objects"), 3, "one failed call plus two pages");
        ASSERT_EQ(retry.recorded().size(), 1u, "one backoff");
        PASS();
    }

    {
        TEST(missing_bucket_is_fatal);
        FakeBackend backend;
        RecordingRetry retry;
        PaginatedLister lister(backend, retry.executor, ListerOptions{});
        std::optional<OperationError> error;
        try {
            lister.list("nope", "");
        } catch (const OperationError& e) {
            error = e;
        }
        ASSERT_TRUE(error.has_value(), "should throw");
        ASSERT_EQ(error->code(), "NoSuchBucket", "code");
        ASSERT_EQ(error->detail("bucket"), "nope", "bucket detail");
        PASS();
    }

    {
        TEST(cancelled_before_first_page);
        FakeBackend backend;
        backend.add_bucket("b");
        RecordingRetry retry;
        PaginatedLister lister(backend, retry.executor, ListerOptions{});
        CancellationToken token;
        token.cancel();
        bool cancelled = false;
        try {
            lister.list("b", "", &token);
        } catch (const OperationError& e) {
            cancelled = e.is_cancelled();
        }
        ASSERT_TRUE(cancelled, "cancelled error");
        ASSERT_EQ(backend.calls("list_objects"), 0, "no backend call");
        PASS();
    }

    {
        TEST(collect_all_walks_levels);
        FakeBackend backend;
        backend.add_bucket("b");
        backend.put("b", "a/1", "1");
        backend.put("b", "a/b/2", "22");
        backend.put("b", "a/b/c/3", "333");
        backend.put("b", "a/d/", "");
        backend.put("b", "other/4", "4");
        RecordingRetry retry;
        PaginatedLister lister(backend, retry.executor, ListerOptions{});

        auto files = lister.collect_all("b", "a/", false);
        ASSERT_EQ(files.size(), 3u, "three files");
        ASSERT_EQ(files[0].key, "a/1", "first");
        ASSERT_EQ(files[1].key, "a/b/2", "second");
        ASSERT_EQ(files[2].key, "a/b/c/3", "third");

        auto with_markers = lister.collect_all("b", "a/", true);
        ASSERT_EQ(with_markers.size(), 4u, "files plus marker");
        ASSERT_TRUE(std::any_of(with_markers.begin(), with_markers.end(),
                                [](const ObjectSummary& o) { return o.key == "a/d/"; }),
                    "marker included");
        ASSERT_EQ(backend.calls("list_objects"), 8, "one call per level, twice");
        PASS();
    }

    {
        TEST(collect_all_markers_follow_configured_delimiter);
        FakeBackend backend;
        backend.add_bucket("b");
        backend.put("b", "a|1", "1");
        backend.put("b", "a|b|2", "22");
        backend.put("b", "a|d|", "");
        backend.put("b", "a|plain/", "p");
        RecordingRetry retry;
        ListerOptions options;
        options.delimiter = "|";
        PaginatedLister lister(backend, retry.executor, options);

        auto files = lister.collect_all("b", "a|", false);
        ASSERT_EQ(files.size(), 3u, "marker under '|' excluded");
        ASSERT_EQ(files[0].key, "a|1", "first");
        ASSERT_EQ(files[1].key, "a|b|2", "second");
        ASSERT_EQ(files[2].key, "a|plain/", "trailing '/' is an ordinary key");

        auto with_markers = lister.collect_all("b", "a|", true);
        ASSERT_EQ(with_markers.size(), 4u, "marker included");
        ASSERT_TRUE(is_marker_key("a|d|", "|"), "helper honours delimiter");
        ASSERT_TRUE(!is_marker_key("a|plain/", "|"), "slash is not the delimiter");
        PASS();
    }

    {
        TEST(walk_stops_when_visitor_returns_false);
        FakeBackend backend;
        backend.add_bucket("b");
        backend.put("b", "x/1/a", "a");
        backend.put("b", "x/2/b", "b");
        RecordingRetry retry;
        PaginatedLister lister(backend, retry.executor, ListerOptions{});

        std::vector<std::string> visited;
        lister.walk("b", "x/", [&](const std::string& prefix, const ListingResult&) {
            visited.push_back(prefix);
            return visited.size() < 2;
        });
        ASSERT_EQ(visited.size(), 2u, "stopped after two levels");
        ASSERT_EQ(visited[0], "x/", "root first");
        ASSERT_EQ(visited[1], "x/1/", "then first child");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 4. ObjectTransfer
// ---------------------------------------------------------------------------

static void test_object_transfer() {
    std::cout << "\n=== ObjectTransfer ===" << std::endl;

    auto tmpdir = make_temp_dir("objxfer-transfer");
    TransferOptions fast;
    fast.progress_interval = 0ms;

    {
        TEST(upload_progress_ends_with_single_100);
        FakeBackend backend;
        backend.add_bucket("b");
        RecordingRetry retry;
        ObjectTransfer transfer(backend, retry.executor, fast);
        auto src = tmpdir / "up.bin";
        write_file(src, std::string(1000, 'u'));

        std::vector<int> percents;
        CancellationToken token;
        auto r = transfer.upload(src, "b", "up.bin", [&](const ProgressUpdate& u) {
            percents.push_back(u.percent);
            return true;
        }, token);
        ASSERT_EQ(r.bytes, 1000u, "bytes");
        ASSERT_EQ(backend.content("b", "up.bin"), std::string(1000, 'u'), "stored content");
        ASSERT_TRUE(!percents.empty(), "progress emitted");
        ASSERT_TRUE(non_decreasing(percents), "never decreases");
        ASSERT_EQ(percents.back(), 100, "ends at 100");
        ASSERT_EQ(std::count(percents.begin(), percents.end(), 100), 1, "exactly one 100");
        PASS();
    }

    {
        TEST(zero_byte_upload_reports_0_and_100);
        FakeBackend backend;
        backend.add_bucket("b");
        RecordingRetry retry;
        ObjectTransfer transfer(backend, retry.executor, fast);
        auto src = tmpdir / "empty.bin";
        write_file(src, "");

        std::vector<int> percents;
        CancellationToken token;
        transfer.upload(src, "b", "empty.bin", [&](const ProgressUpdate& u) {
            percents.push_back(u.percent);
            return true;
        }, token);
        ASSERT_EQ(percents.size(), 2u, "two updates");
        ASSERT_EQ(percents[0], 0, "start");
        ASSERT_EQ(percents[1], 100, "done");
        ASSERT_TRUE(backend.exists("b", "empty.bin"), "object stored");
        PASS();
    }

    {
        TEST(upload_missing_file_is_fatal);
        FakeBackend backend;
        backend.add_bucket("b");
        RecordingRetry retry;
        ObjectTransfer transfer(backend, retry.executor, fast);
        CancellationToken token;
        std::optional<OperationError> error;
        try {
            transfer.upload(tmpdir / "nope", "b", "nope", nullptr, token);
        } catch (const OperationError& e) {
            error = e;
        }
        ASSERT_TRUE(error.has_value(), "should throw");
        ASSERT_EQ(error->code(), "LocalFileError", "code");
        ASSERT_TRUE(error->kind() == ErrorKind::Fatal, "fatal");
        ASSERT_EQ(backend.calls("put_object"), 0, "backend untouched");
        PASS();
    }

    {
        TEST(download_writes_file_and_retries_transient);
        FakeBackend backend;
        backend.add_bucket("b");
        backend.put("b", "docs/report.txt", "hello world");
        backend.fail_next("get_object", "InternalError");
        RecordingRetry retry;
        ObjectTransfer transfer(backend, retry.executor, fast);
        auto dest = tmpdir / "dl" / "report.txt";

        CancellationToken token;
        int retries = 0;
        auto r = transfer.download("b", "docs/report.txt", dest, nullptr, token,
                                   [&](const RetryNotice&) { ++retries; });
        ASSERT_EQ(r.bytes, 11u, "bytes");
        ASSERT_EQ(read_file(dest), "hello world", "content");
        ASSERT_TRUE(!fs::exists(ObjectTransfer::partial_path(dest)), "no partial left");
        ASSERT_EQ(backend.calls("get_object"), 2, "retried once");
        ASSERT_EQ(retries, 1, "retry listener notified");
        PASS();
    }

    {
        TEST(download_missing_key_fails_without_file);
        FakeBackend backend;
        backend.add_bucket("b");
        RecordingRetry retry;
        ObjectTransfer transfer(backend, retry.executor, fast);
        auto dest = tmpdir / "missing.txt";
        CancellationToken token;
        std::optional<OperationError> error;
        try {
            transfer.download("b", "missing.txt", dest, nullptr, token);
        } catch (const OperationError& e) {
            error = e;
        }
        ASSERT_TRUE(error.has_value(), "should throw");
        ASSERT_EQ(error->code(), "NoSuchKey", "code");
        ASSERT_TRUE(!fs::exists(dest), "no destination file");
        PASS();
    }

    {
        TEST(cancelled_download_leaves_no_partial_file);
        FakeBackend backend;
        backend.add_bucket("b");
        backend.put("b", "big.bin", std::string(4096, 'd'));
        backend.close_gate();
        RecordingRetry retry;
        ObjectTransfer transfer(backend, retry.executor, fast);
        auto dest = tmpdir / "big.bin";
        auto part = ObjectTransfer::partial_path(dest);

        CancellationToken token;
        std::optional<OperationError> error;
        std::thread worker([&] {
            try {
                transfer.download("b", "big.bin", dest, nullptr, token);
            } catch (const OperationError& e) {
                error = e;
            }
        });
        bool started = wait_for([&] { return backend.in_flight() == 1; });
        bool part_seen = fs::exists(part);
        token.cancel();
        worker.join();
        backend.open_gate();

        ASSERT_TRUE(started, "download reached the backend");
        ASSERT_TRUE(part_seen, "partial file exists mid-transfer");
        ASSERT_TRUE(error.has_value(), "should throw");
        ASSERT_TRUE(error->is_cancelled(), "cancelled, not failed");
        ASSERT_TRUE(!fs::exists(dest), "no destination file");
        ASSERT_TRUE(!fs::exists(part), "partial file removed");
        PASS();
    }

    {
        TEST(progress_callback_false_cancels_upload);
        FakeBackend backend;
        backend.add_bucket("b");
        RecordingRetry retry;
        ObjectTransfer transfer(backend, retry.executor, fast);
        auto src = tmpdir / "stop.bin";
        write_file(src, std::string(1000, 's'));

        CancellationToken token;
        bool cancelled = false;
        try {
            transfer.upload(src, "b", "stop.bin", [](const ProgressUpdate& u) {
                return u.percent == 0;
            }, token);
        } catch (const OperationError& e) {
            cancelled = e.is_cancelled();
        }
        ASSERT_TRUE(cancelled, "cancelled error");
        ASSERT_TRUE(token.is_cancelled(), "token fired");
        ASSERT_TRUE(!backend.exists("b", "stop.bin"), "nothing stored");
        PASS();
    }

    {
        TEST(non_atomic_backend_partial_object_removed);
        FakeBackend backend;
        backend.add_bucket("b");
        backend.set_atomic_put(false);
        backend.close_gate();
        RecordingRetry retry;
        ObjectTransfer transfer(backend, retry.executor, fast);
        auto src = tmpdir / "partial.bin";
        write_file(src, std::string(2000, 'p'));

        CancellationToken token;
        bool cancelled = false;
        std::thread worker([&] {
            try {
                transfer.upload(src, "b", "partial.bin", nullptr, token);
            } catch (const OperationError& e) {
                cancelled = e.is_cancelled();
            }
        });
        bool started = wait_for([&] { return backend.in_flight() == 1; });
        bool exposed = backend.exists("b", "partial.bin");
        token.cancel();
        worker.join();
        backend.open_gate();

        ASSERT_TRUE(started, "upload reached the backend");
        ASSERT_TRUE(exposed, "partial object visible mid-transfer");
        ASSERT_TRUE(cancelled, "cancelled error");
        ASSERT_TRUE(!backend.exists("b", "partial.bin"), "partial object deleted");
        ASSERT_EQ(backend.calls("delete_object"), 1, "one cleanup delete");
        PASS();
    }

    {
        TEST(stale_partials_swept_by_age);
        auto area = tmpdir / "sweep";
        auto stale = ObjectTransfer::partial_path(area / "nested" / "old.bin");
        auto fresh = ObjectTransfer::partial_path(area / "new.bin");
        auto ordinary = area / "kept.bin";
        write_file(stale, "half");
        write_file(fresh, "half");
        write_file(ordinary, "whole");
        auto two_hours_ago = fs::file_time_type::clock::now() - 2h;
        fs::last_write_time(stale, two_hours_ago);
        fs::last_write_time(ordinary, two_hours_ago);

        ASSERT_EQ(ObjectTransfer::remove_stale_partials(area, 1h), 1u, "one stale partial");
        ASSERT_TRUE(!fs::exists(stale), "stale partial removed");
        ASSERT_TRUE(fs::exists(fresh), "recent partial kept");
        ASSERT_TRUE(fs::exists(ordinary), "ordinary file kept");
        ASSERT_EQ(ObjectTransfer::remove_stale_partials(tmpdir / "absent", 1h), 0u,
                  "missing directory is a no-op");
        PASS();
    }

    {
        TEST(copy_head_presign_and_marker);
        FakeBackend backend;
        backend.add_bucket("b");
        backend.add_bucket("c");
        backend.put("b", "src", "12345");
        RecordingRetry retry;
        ObjectTransfer transfer(backend, retry.executor, fast);
        CancellationToken token;

        transfer.copy(ObjectRef{"b", "src"}, ObjectRef{"c", "dst"}, token);
        ASSERT_EQ(backend.content("c", "dst"), "12345", "copied");

        auto meta = transfer.head("c", "dst", token);
        ASSERT_EQ(meta.size, 5u, "head size");

        auto url = transfer.presign("b", "src", 60s, token);
        ASSERT_EQ(url, "fake://b/src?expires=60", "presigned url");

        transfer.create_marker("b", "folder/", token);
        ASSERT_TRUE(backend.exists("b", "folder/"), "marker stored");

        bool rejected = false;
        try {
            transfer.create_marker("b", "folder", token);
        } catch (const OperationError& e) {
            rejected = e.code() == "InvalidArgument";
        }
        ASSERT_TRUE(rejected, "marker key must end with '/'");

        transfer.remove("b", "src", token);
        ASSERT_TRUE(!backend.exists("b", "src"), "deleted");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 5. DirectoryTransfer
// ---------------------------------------------------------------------------

struct DirectoryFixture {
    explicit DirectoryFixture(FakeBackend& backend, DirectoryOptions dir_options = {})
        : lister(backend, retry.executor, ListerOptions{})
        , transfer(backend, retry.executor, transfer_options())
        , directory(backend, retry.executor, lister, transfer, with_fast_progress(dir_options)) {}

    static TransferOptions transfer_options() {
        TransferOptions options;
        options.progress_interval = 0ms;
        return options;
    }

    static DirectoryOptions with_fast_progress(DirectoryOptions options) {
        options.progress_interval = 0ms;
        return options;
    }

    RecordingRetry retry;
    PaginatedLister lister;
    ObjectTransfer transfer;
    DirectoryTransfer directory;
};

static void test_directory_transfer() {
    std::cout << "\n=== DirectoryTransfer ===" << std::endl;

    auto tmpdir = make_temp_dir("objxfer-dir");
    auto tree = tmpdir / "tree";
    write_file(tree / "a.txt", std::string(10, 'a'));
    write_file(tree / "sub" / "b.txt", std::string(20, 'b'));
    write_file(tree / "sub" / "deep" / "c.txt", std::string(30, 'c'));
    fs::create_directories(tree / "empty");

    {
        TEST(normalize_prefix);
        ASSERT_EQ(DirectoryTransfer::normalize_prefix("photos"), "photos/", "appends slash");
        ASSERT_EQ(DirectoryTransfer::normalize_prefix("photos/"), "photos/", "kept");
        ASSERT_EQ(DirectoryTransfer::normalize_prefix(""), "", "empty stays empty");
        PASS();
    }

    {
        TEST(upload_counts_files_bytes_and_markers);
        FakeBackend backend;
        backend.add_bucket("b");
        DirectoryFixture fx(backend);

        std::vector<int> percents;
        CancellationToken token;
        auto r = fx.directory.upload_directory(tree, "b", "pre", [&](const ProgressUpdate& u) {
            percents.push_back(u.percent);
            return true;
        }, token);

        ASSERT_EQ(r.progress.total_files, 3u, "total files");
        ASSERT_EQ(r.progress.completed_files, 3u, "completed files");
        ASSERT_EQ(r.progress.failed_files, 0u, "failed files");
        ASSERT_EQ(r.progress.total_bytes, 60u, "total bytes");
        ASSERT_EQ(r.progress.transferred_bytes, 60u, "transferred bytes");
        ASSERT_EQ(r.markers_created, 1u, "one empty directory");
        ASSERT_TRUE(backend.exists("b", "pre/a.txt"), "a.txt");
        ASSERT_TRUE(backend.exists("b", "pre/sub/b.txt"), "sub/b.txt");
        ASSERT_TRUE(backend.exists("b", "pre/sub/deep/c.txt"), "sub/deep/c.txt");
        ASSERT_TRUE(backend.exists("b", "pre/empty/"), "empty dir marker");
        ASSERT_TRUE(non_decreasing(percents), "aggregate progress never decreases");
        ASSERT_EQ(percents.back(), 100, "ends at 100");
        ASSERT_EQ(std::count(percents.begin(), percents.end(), 100), 1, "exactly one 100");
        PASS();
    }

    {
        TEST(upload_skips_directory_symlinks_and_loops);
        auto linked_tree = tmpdir / "linked-tree";
        auto outside = tmpdir / "outside";
        write_file(linked_tree / "a.txt", std::string(5, 'a'));
        write_file(linked_tree / "sub" / "b.txt", std::string(7, 'b'));
        write_file(outside / "big.bin", std::string(1000, 'x'));
        fs::create_directory_symlink("..", linked_tree / "sub" / "loop");
        fs::create_directory_symlink(outside, linked_tree / "linked");
        fs::create_symlink(linked_tree / "a.txt", linked_tree / "alias.txt");
        fs::create_symlink(linked_tree / "nowhere", linked_tree / "dangling");

        FakeBackend backend;
        backend.add_bucket("b");
        DirectoryFixture fx(backend);

        CancellationToken token;
        auto r = fx.directory.upload_directory(linked_tree, "b", "pre", nullptr, token);

        ASSERT_EQ(r.progress.total_files, 3u, "regular files and file links counted");
        ASSERT_EQ(r.progress.completed_files, r.progress.total_files, "completed matches scan");
        ASSERT_EQ(r.progress.total_bytes, 17u, "total bytes");
        ASSERT_EQ(r.progress.transferred_bytes, r.progress.total_bytes, "bytes match scan");
        ASSERT_TRUE(backend.exists("b", "pre/alias.txt"), "file symlink uploaded");
        ASSERT_TRUE(backend.exists("b", "pre/sub/b.txt"), "nested file");
        ASSERT_TRUE(!backend.exists("b", "pre/linked/big.bin"), "linked directory skipped");
        ASSERT_TRUE(!backend.exists("b", "pre/sub/loop/a.txt"), "loop not followed");
        ASSERT_EQ(backend.object_count("b"), 3u, "nothing else uploaded");
        PASS();
    }

    {
        TEST(upload_fails_fast_on_first_error);
        FakeBackend backend;
        backend.add_bucket("b");
        backend.fail_next("put_object", "AccessDenied");
        DirectoryFixture fx(backend);

        CancellationToken token;
        std::optional<OperationError> error;
        try {
            fx.directory.upload_directory(tree, "b", "pre/", nullptr, token);
        } catch (const OperationError& e) {
            error = e;
        }
        ASSERT_TRUE(error.has_value(), "should throw");
        ASSERT_EQ(error->operation(), "upload_dir", "operation");
        ASSERT_EQ(error->code(), "AccessDenied", "code");
        ASSERT_EQ(fs::path(error->detail("failed_item")).filename().string(), "a.txt",
                  "failed item named");
        ASSERT_EQ(error->detail("completed"), "0", "completed count");
        ASSERT_EQ(error->detail("total"), "3", "total count");
        ASSERT_EQ(backend.calls("put_object"), 1, "no further files attempted");
        PASS();
    }

    {
        TEST(upload_cancelled_stops_scheduling);
        FakeBackend backend;
        backend.add_bucket("b");
        DirectoryFixture fx(backend);

        CancellationToken token;
        bool cancelled = false;
        try {
            fx.directory.upload_directory(tree, "b", "pre/", [&](const ProgressUpdate& u) {
                // Stop once the first file finished
                return u.bytes_transferred < 10;
            }, token);
        } catch (const OperationError& e) {
            cancelled = e.is_cancelled();
        }
        ASSERT_TRUE(cancelled, "cancelled error");
        ASSERT_TRUE(backend.object_count("b") < 4, "not everything uploaded");
        PASS();
    }

    {
        TEST(download_recreates_tree_and_markers);
        FakeBackend backend;
        backend.add_bucket("b");
        backend.put("b", "p/x", "xxxxx");
        backend.put("b", "p/y/z", "zzz");
        backend.put("b", "p/e/", "");
        DirectoryFixture fx(backend);

        auto out = tmpdir / "download";
        CancellationToken token;
        auto r = fx.directory.download_directory("b", "p", out, nullptr, token);
        ASSERT_EQ(r.progress.total_files, 2u, "markers are not files");
        ASSERT_EQ(r.progress.completed_files, 2u, "completed");
        ASSERT_EQ(r.progress.transferred_bytes, 8u, "bytes");
        ASSERT_EQ(read_file(out / "x"), "xxxxx", "x content");
        ASSERT_EQ(read_file(out / "y" / "z"), "zzz", "nested content");
        ASSERT_TRUE(fs::is_directory(out / "e"), "marker became directory");
        PASS();
    }

    {
        TEST(download_rejects_escaping_key);
        FakeBackend backend;
        backend.add_bucket("b");
        backend.put("b", "p/../evil", "bad");
        DirectoryFixture fx(backend);

        auto out = tmpdir / "escape";
        CancellationToken token;
        std::optional<OperationError> error;
        try {
            fx.directory.download_directory("b", "p/", out, nullptr, token);
        } catch (const OperationError& e) {
            error = e;
        }
        ASSERT_TRUE(error.has_value(), "should throw");
        ASSERT_EQ(error->code(), "InvalidKey", "code");
        ASSERT_TRUE(!fs::exists(tmpdir / "evil"), "nothing written outside");
        PASS();
    }

    {
        TEST(delete_2500_keys_in_3_batches);
        FakeBackend backend;
        backend.add_bucket("b");
        fill_flat(backend, "b", "d/", 2500);
        backend.put("b", "keep", "k");
        DirectoryFixture fx(backend);

        CancellationToken token;
        auto r = fx.directory.delete_directory("b", "d", nullptr, token);
        auto sizes = backend.delete_batch_sizes();
        ASSERT_EQ(sizes.size(), 3u, "three batch calls");
        ASSERT_EQ(sizes[0], 1000u, "first batch");
        ASSERT_EQ(sizes[1], 1000u, "second batch");
        ASSERT_EQ(sizes[2], 500u, "third batch");
        ASSERT_EQ(r.deleted, 2500u, "deleted count");
        ASSERT_EQ(r.delete_batches, 3u, "batches recorded");
        ASSERT_EQ(backend.object_count("b"), 1u, "only the outside key remains");
        PASS();
    }

    {
        TEST(failed_batch_aborts_remaining);
        FakeBackend backend;
        backend.add_bucket("b");
        fill_flat(backend, "b", "d/", 2500);
        backend.fail_delete_batch(2, "AccessDenied");
        DirectoryFixture fx(backend);

        CancellationToken token;
        std::optional<OperationError> error;
        try {
            fx.directory.delete_directory("b", "d/", nullptr, token);
        } catch (const OperationError& e) {
            error = e;
        }
        ASSERT_TRUE(error.has_value(), "should throw");
        ASSERT_EQ(error->code(), "AccessDenied", "code");
        ASSERT_EQ(error->detail("deleted"), "1000", "first batch counted");
        ASSERT_EQ(backend.calls("delete_objects"), 2, "no third batch");
        ASSERT_EQ(backend.object_count("b"), 1500u, "remaining keys untouched");
        PASS();
    }

    {
        TEST(delete_uses_configured_batch_size);
        FakeBackend backend;
        backend.add_bucket("b");
        fill_flat(backend, "b", "d/", 25);
        DirectoryOptions options;
        options.delete_batch_size = 10;
        DirectoryFixture fx(backend, options);

        CancellationToken token;
        auto r = fx.directory.delete_directory("b", "d/", nullptr, token);
        ASSERT_EQ(r.delete_batches, 3u, "ceil(25/10) batches");
        ASSERT_EQ(r.deleted, 25u, "all deleted");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 6. OperationRegistry
// ---------------------------------------------------------------------------

static void test_operation_registry() {
    std::cout << "\n=== OperationRegistry ===" << std::endl;

    using S = OperationState;

    {
        TEST(transition_table);
        ASSERT_TRUE(OperationRegistry::can_transition(S::Queued, S::Active), "queued->active");
        ASSERT_TRUE(OperationRegistry::can_transition(S::Queued, S::Cancelled), "queued->cancelled");
        ASSERT_TRUE(!OperationRegistry::can_transition(S::Queued, S::Completed), "queued->completed");
        ASSERT_TRUE(OperationRegistry::can_transition(S::Active, S::Cancelling), "active->cancelling");
        ASSERT_TRUE(OperationRegistry::can_transition(S::Cancelling, S::Cancelled), "cancelling->cancelled");
        ASSERT_TRUE(!OperationRegistry::can_transition(S::Cancelling, S::Active), "cancelling->active");
        ASSERT_TRUE(!OperationRegistry::can_transition(S::Completed, S::Failed), "terminal is final");
        ASSERT_TRUE(!OperationRegistry::can_transition(S::Cancelled, S::Active), "terminal is final");
        PASS();
    }

    {
        TEST(progress_never_decreases_and_bytes_clamped);
        OperationRegistry registry;
        auto id = registry.create(OperationKind::Upload, "upload x");
        ASSERT_TRUE(registry.activate(id), "activate");

        ProgressUpdate u;
        u.percent = 50;
        u.bytes_total = 100;
        u.bytes_transferred = 50;
        registry.update_progress(id, u);

        u.percent = 30;
        u.bytes_transferred = 150;
        auto applied = registry.update_progress(id, u);
        ASSERT_TRUE(applied.has_value(), "applied");
        ASSERT_EQ(applied->percent, 50, "percent held");
        ASSERT_EQ(applied->bytes_transferred, 100u, "bytes clamped to total");
        auto op = registry.get(id);
        ASSERT_EQ(op->progress, 50, "record percent");
        PASS();
    }

    {
        TEST(settles_exactly_once);
        OperationRegistry registry;
        auto id = registry.create(OperationKind::Head, "head x");
        registry.activate(id);
        auto first = registry.settle(id, S::Completed, std::nullopt);
        auto second = registry.settle(id, S::Failed, std::nullopt);
        ASSERT_TRUE(first.has_value(), "first settle");
        ASSERT_TRUE(!second.has_value(), "second settle rejected");
        ASSERT_TRUE(registry.state(id) == S::Completed, "state kept");
        ASSERT_EQ(registry.get(id)->progress, 100, "completed means 100");

        ProgressUpdate late;
        late.percent = 10;
        ASSERT_TRUE(!registry.update_progress(id, late).has_value(), "no progress after settle");
        PASS();
    }

    {
        TEST(cancel_outcomes);
        OperationRegistry registry;
        auto queued = registry.create(OperationKind::List, "list");
        ASSERT_TRUE(registry.request_cancel(queued) ==
                    OperationRegistry::CancelOutcome::CancelledWhileQueued, "queued");
        ASSERT_TRUE(registry.request_cancel(queued) ==
                    OperationRegistry::CancelOutcome::AlreadyTerminal, "again");
        ASSERT_TRUE(!registry.activate(queued), "cannot activate cancelled");

        auto active = registry.create(OperationKind::Download, "download");
        registry.activate(active);
        ASSERT_TRUE(registry.request_cancel(active) ==
                    OperationRegistry::CancelOutcome::Cancelling, "active");
        ASSERT_TRUE(registry.request_cancel(active) ==
                    OperationRegistry::CancelOutcome::AlreadyCancelling, "cancelling");
        ASSERT_TRUE(registry.settle(active, S::Cancelled, std::nullopt).has_value(), "settle");
        ASSERT_TRUE(registry.request_cancel(999) ==
                    OperationRegistry::CancelOutcome::NotFound, "unknown id");
        PASS();
    }

    {
        TEST(evicts_after_ttl);
        OperationRegistry registry;
        auto done = registry.create(OperationKind::List, "list");
        registry.activate(done);
        registry.settle(done, S::Completed, std::nullopt);
        auto running = registry.create(OperationKind::List, "list");
        registry.activate(running);

        auto now = std::chrono::system_clock::now();
        ASSERT_EQ(registry.evict_expired(now + 10s, 0s), 0u, "zero ttl disables eviction");
        ASSERT_EQ(registry.evict_expired(now, 5s), 0u, "not yet expired");
        ASSERT_EQ(registry.evict_expired(now + 10s, 5s), 1u, "expired record removed");
        ASSERT_TRUE(!registry.get(done).has_value(), "gone");
        ASSERT_TRUE(registry.get(running).has_value(), "active record kept");
        ASSERT_TRUE(!registry.remove(running), "cannot remove active record");
        PASS();
    }

    {
        TEST(list_ordered_by_id);
        OperationRegistry registry;
        for (int i = 0; i < 5; ++i) registry.create(OperationKind::List, "list");
        auto all = registry.list();
        ASSERT_EQ(all.size(), 5u, "five records");
        for (size_t i = 1; i < all.size(); ++i) {
            ASSERT_TRUE(all[i - 1].id < all[i].id, "ascending ids");
        }
        ASSERT_EQ(registry.count(S::Queued), 5u, "all queued");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 7. WorkerManager
// ---------------------------------------------------------------------------

static void test_worker_manager() {
    std::cout << "\n=== WorkerManager ===" << std::endl;

    auto tmpdir = make_temp_dir("objxfer-workers");

    {
        TEST(concurrency_bounded_by_max_concurrent);
        FakeBackend backend;
        backend.add_bucket("b");
        for (int i = 0; i < 10; ++i) backend.put("b", "k" + std::to_string(i), "v");
        backend.set_gate_heads(true);
        backend.close_gate();

        WorkerManager manager(backend, fast_engine_options(3));
        manager.start();
        std::vector<OperationId> ids;
        for (int i = 0; i < 10; ++i) {
            ids.push_back(manager.submit(OperationRequest::head("b", "k" + std::to_string(i))));
        }

        bool saturated = wait_for([&] {
            return backend.in_flight() == 3 && manager.active_count() == 3 &&
                   manager.queued_count() == 7;
        });
        std::this_thread::sleep_for(50ms);
        int peak_while_blocked = backend.peak_in_flight();
        backend.open_gate();
        manager.wait_all();

        ASSERT_TRUE(saturated, "three active, seven queued");
        ASSERT_EQ(peak_while_blocked, 3, "never more than three in flight");
        ASSERT_EQ(backend.peak_in_flight(), 3, "peak stays at three");
        for (auto id : ids) {
            auto op = manager.snapshot(id);
            ASSERT_TRUE(op && op->state == OperationState::Completed, "all completed");
            ASSERT_TRUE(op->result.metadata.has_value(), "head result attached");
        }
        PASS();
    }

    {
        TEST(ten_downloads_hold_at_most_three_slots);
        FakeBackend backend;
        backend.add_bucket("b");
        for (int i = 0; i < 10; ++i) {
            backend.put("b", "f" + std::to_string(i), std::string(64, 'd'));
        }
        backend.close_gate();

        WorkerManager manager(backend, fast_engine_options(3));
        manager.start();
        std::vector<OperationId> ids;
        for (int i = 0; i < 10; ++i) {
            auto dest = tmpdir / "ten" / ("f" + std::to_string(i));
            ids.push_back(manager.submit(OperationRequest::download("b", "f" + std::to_string(i),
                                                                    dest)));
        }

        bool saturated = wait_for([&] {
            return backend.in_flight() == 3 && manager.active_count() == 3 &&
                   manager.queued_count() == 7;
        });
        std::this_thread::sleep_for(50ms);
        int peak_while_blocked = backend.peak_in_flight();
        backend.open_gate();
        manager.wait_all();

        ASSERT_TRUE(saturated, "three transferring, seven queued");
        ASSERT_EQ(peak_while_blocked, 3, "never more than three transfers");
        ASSERT_EQ(backend.peak_in_flight(), 3, "peak stays at three");
        for (int i = 0; i < 10; ++i) {
            auto op = manager.snapshot(ids[i]);
            ASSERT_TRUE(op && op->state == OperationState::Completed, "all completed");
            ASSERT_EQ(read_file(tmpdir / "ten" / ("f" + std::to_string(i))).size(), 64u,
                      "file written");
        }
        PASS();
    }

    {
        TEST(cancel_queued_operation_settles_immediately);
        FakeBackend backend;
        backend.add_bucket("b");
        backend.put("b", "k", "v");
        backend.set_gate_heads(true);
        backend.close_gate();

        auto observer = std::make_shared<RecordingObserver>();
        WorkerManager manager(backend, fast_engine_options(1));
        manager.events().subscribe(observer);
        manager.start();

        auto first = manager.submit(OperationRequest::head("b", "k"));
        auto second = manager.submit(OperationRequest::head("b", "k"));
        bool running = wait_for([&] { return backend.in_flight() == 1; });

        bool hit = manager.cancel(second);
        auto state = manager.snapshot(second)->state;
        backend.open_gate();
        manager.wait_all();

        ASSERT_TRUE(running, "first operation active");
        ASSERT_TRUE(hit, "cancel returned true");
        ASSERT_TRUE(state == OperationState::Cancelled, "queued op cancelled at once");
        ASSERT_TRUE(wait_for([&] { return observer->settled_for(first).size() == 1; }),
                    "first settled");
        auto settled = observer->settled_for(second);
        ASSERT_EQ(settled.size(), 1u, "exactly one settled event");
        ASSERT_TRUE(settled[0].cancelled && !settled[0].success, "cancelled, not success");
        ASSERT_TRUE(manager.snapshot(first)->state == OperationState::Completed,
                    "first completed");
        ASSERT_EQ(backend.calls("head_object"), 1, "cancelled op never ran");
        PASS();
    }

    {
        TEST(cancel_active_download_aborts_natively);
        FakeBackend backend;
        backend.add_bucket("b");
        backend.put("b", "big.bin", std::string(8192, 'z'));
        backend.set_native_cancel(true);
        backend.close_gate();

        auto observer = std::make_shared<RecordingObserver>();
        WorkerManager manager(backend, fast_engine_options(2));
        manager.events().subscribe(observer);
        manager.start();

        auto dest = tmpdir / "cancel" / "big.bin";
        auto id = manager.submit(OperationRequest::download("b", "big.bin", dest));
        bool started = wait_for([&] { return backend.in_flight() == 1; });
        bool hit = manager.cancel(id);
        auto op = manager.wait(id, 5000ms);

        ASSERT_TRUE(started, "download in flight");
        ASSERT_TRUE(hit, "cancel returned true");
        ASSERT_TRUE(op && op->state == OperationState::Cancelled, "settled cancelled");
        ASSERT_TRUE(!fs::exists(dest), "no destination file");
        ASSERT_TRUE(!fs::exists(ObjectTransfer::partial_path(dest)), "no partial file");
        ASSERT_TRUE(wait_for([&] { return observer->settled_for(id).size() == 1; }),
                    "one settled event");
        auto states = observer->states(id);
        ASSERT_TRUE(std::find(states.begin(), states.end(), OperationState::Cancelling) !=
                    states.end(), "passed through cancelling");
        ASSERT_TRUE(!observer->settled_for(id)[0].success, "not a success");
        PASS();
    }

    {
        TEST(cancel_settled_operation_is_noop);
        FakeBackend backend;
        backend.add_bucket("b");
        WorkerManager manager(backend, fast_engine_options(2));
        manager.start();
        auto id = manager.submit(OperationRequest::list("b", ""));
        auto op = manager.wait(id);
        ASSERT_TRUE(op && op->state == OperationState::Completed, "completed");
        ASSERT_TRUE(!manager.cancel(id), "cancel returns false");
        ASSERT_TRUE(manager.snapshot(id)->state == OperationState::Completed, "unchanged");
        ASSERT_TRUE(!manager.cancel(12345), "unknown id");
        PASS();
    }

    {
        TEST(failure_carries_error_detail);
        FakeBackend backend;
        backend.add_bucket("b");
        WorkerManager manager(backend, fast_engine_options(1));
        manager.start();
        auto id = manager.submit(OperationRequest::head("b", "missing"));
        auto op = manager.wait(id);
        ASSERT_TRUE(op && op->state == OperationState::Failed, "failed");
        ASSERT_TRUE(op->error.has_value(), "error attached");
        ASSERT_EQ(op->error->code, "NoSuchKey", "code");
        ASSERT_EQ(op->error->details["key"], "missing", "key detail");
        PASS();
    }

    {
        TEST(retry_events_published);
        FakeBackend backend;
        backend.add_bucket("b");
        backend.put("b", "k", "v");
        backend.fail_next("head_object", "SlowDown", 2);

        auto observer = std::make_shared<RecordingObserver>();
        WorkerManager manager(backend, fast_engine_options(1));
        manager.events().subscribe(observer);
        manager.start();
        auto id = manager.submit(OperationRequest::head("b", "k"));
        auto op = manager.wait(id);
        ASSERT_TRUE(op && op->state == OperationState::Completed, "completed after retries");
        ASSERT_EQ(observer->retries(), 2, "two retry events");
        PASS();
    }

    {
        TEST(upload_progress_events_monotonic);
        FakeBackend backend;
        backend.add_bucket("b");
        auto src = tmpdir / "progress.bin";
        write_file(src, std::string(5000, 'q'));

        auto observer = std::make_shared<RecordingObserver>();
        WorkerManager manager(backend, fast_engine_options(1));
        manager.events().subscribe(observer);
        manager.start();
        auto id = manager.submit(OperationRequest::upload(src, "b", "progress.bin"));
        auto op = manager.wait(id);
        ASSERT_TRUE(op && op->state == OperationState::Completed, "completed");
        ASSERT_EQ(op->progress, 100, "record at 100");
        ASSERT_EQ(op->result.bytes, 5000u, "bytes");
        auto percents = observer->percents(id);
        ASSERT_TRUE(!percents.empty(), "progress published");
        ASSERT_TRUE(non_decreasing(percents), "never decreases");
        ASSERT_EQ(percents.back(), 100, "last event 100");
        PASS();
    }

    {
        TEST(directory_operation_occupies_one_slot);
        FakeBackend backend;
        backend.add_bucket("b");
        auto tree = tmpdir / "slot";
        for (int i = 0; i < 5; ++i) {
            write_file(tree / ("f" + std::to_string(i)), std::string(100, 'f'));
        }
        backend.close_gate();

        WorkerManager manager(backend, fast_engine_options(4));
        manager.start();
        auto id = manager.submit(OperationRequest::upload_dir(tree, "b", "slot"));
        bool running = wait_for([&] { return backend.in_flight() == 1; });
        std::this_thread::sleep_for(50ms);
        int peak = backend.peak_in_flight();
        size_t active = manager.active_count();
        backend.open_gate();
        auto op = manager.wait(id);

        ASSERT_TRUE(running, "upload started");
        ASSERT_EQ(peak, 1, "files transferred sequentially");
        ASSERT_EQ(active, 1u, "one active operation");
        ASSERT_TRUE(op && op->state == OperationState::Completed, "completed");
        ASSERT_EQ(op->result.directory->progress.completed_files, 5u, "five files");
        PASS();
    }

    {
        TEST(settled_records_evicted_after_ttl);
        FakeBackend backend;
        backend.add_bucket("b");
        auto options = fast_engine_options(1);
        options.workers.completed_ttl = 1s;
        WorkerManager manager(backend, options);
        manager.start();
        auto id = manager.submit(OperationRequest::list_buckets());
        auto op = manager.wait(id);
        ASSERT_TRUE(op && op->state == OperationState::Completed, "completed");
        ASSERT_EQ(op->result.buckets.size(), 1u, "one bucket");
        ASSERT_TRUE(wait_for([&] { return !manager.snapshot(id).has_value(); }, 5000),
                    "evicted after ttl");
        PASS();
    }

    {
        TEST(shutdown_cancels_and_rejects_new_work);
        FakeBackend backend;
        backend.add_bucket("b");
        backend.put("b", "k", "v");
        backend.close_gate();

        auto observer = std::make_shared<RecordingObserver>();
        WorkerManager manager(backend, fast_engine_options(1));
        manager.events().subscribe(observer);
        manager.start();
        auto active = manager.submit(OperationRequest::download("b", "k", tmpdir / "sd.bin"));
        auto queued = manager.submit(OperationRequest::head("b", "k"));
        bool running = wait_for([&] { return backend.in_flight() == 1; });
        manager.shutdown();
        backend.open_gate();

        ASSERT_TRUE(running, "download in flight");
        ASSERT_TRUE(manager.snapshot(active)->state == OperationState::Cancelled,
                    "active op cancelled");
        ASSERT_TRUE(manager.snapshot(queued)->state == OperationState::Cancelled,
                    "queued op cancelled");
        ASSERT_EQ(observer->settled_count(), 2u, "both settled once");

        bool rejected = false;
        try {
            manager.submit(OperationRequest::list("b", ""));
        } catch (const std::runtime_error&) {
            rejected = true;
        }
        ASSERT_TRUE(rejected, "submit after shutdown throws");
        PASS();
    }

    {
        TEST(custom_task_submission);
        FakeBackend backend;
        WorkerManager manager(backend, fast_engine_options(1));
        manager.start();
        auto id = manager.submit(OperationKind::Presign, "custom", [](OperationContext& ctx) {
            ProgressUpdate u;
            u.percent = 40;
            ctx.report(u);
            OperationResult r;
            r.url = "custom://url";
            return r;
        });
        auto op = manager.wait(id);
        ASSERT_TRUE(op && op->state == OperationState::Completed, "completed");
        ASSERT_EQ(op->result.url, "custom://url", "result kept");
        ASSERT_EQ(op->description, "custom", "description kept");
        PASS();
    }

    {
        TEST(custom_task_throwing_non_exception_fails);
        FakeBackend backend;
        auto observer = std::make_shared<RecordingObserver>();
        WorkerManager manager(backend, fast_engine_options(1));
        manager.events().subscribe(observer);
        manager.start();
        auto id = manager.submit(OperationKind::List, "throws int",
                                 [](OperationContext&) -> OperationResult { throw 42; });
        auto op = manager.wait(id);
        ASSERT_TRUE(op && op->state == OperationState::Failed, "settled failed");
        ASSERT_TRUE(op->error.has_value(), "error attached");
        ASSERT_EQ(op->error->code, CLIENT_ERROR_CODE, "generic client error");
        ASSERT_TRUE(wait_for([&] { return observer->settled_for(id).size() == 1; }),
                    "one settled event");

        auto next = manager.submit(OperationRequest::list_buckets());
        auto after = manager.wait(next);
        ASSERT_TRUE(after && after->state == OperationState::Completed, "worker still serving");
        PASS();
    }

    {
        TEST(request_descriptions);
        ASSERT_EQ(OperationRequest::upload("./a.txt", "bucket", "a.txt").describe(),
                  "upload ./a.txt -> bucket/a.txt", "upload");
        ASSERT_EQ(OperationRequest::delete_dir("bucket", "logs/").describe(),
                  "delete_dir bucket/logs/", "delete_dir");
        ASSERT_EQ(OperationRequest::list_buckets().describe(), "list_buckets", "list_buckets");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// Main
// ---------------------------------------------------------------------------

int main() {
    std::cout << "objxfer engine test suite" << std::endl;
    std::cout << "=========================" << std::endl;

    test_retry_executor();
    test_progress_helpers();
    test_paginated_lister();
    test_object_transfer();
    test_directory_transfer();
    test_operation_registry();
    test_worker_manager();

    return report_results("Results");
}
