#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace objxfer {

/// One progress report for an operation.
struct ProgressUpdate {
    int percent = 0;
    std::string status_text;
    uint64_t bytes_transferred = 0;
    uint64_t bytes_total = 0;
    double throughput_bytes_per_sec = 0.0;
    std::optional<std::chrono::seconds> eta;
};

/// Progress sink. Returning false requests cancellation of the transfer.
using ProgressCallback = std::function<bool(const ProgressUpdate&)>;

// "0 B", "512 B", "1.5 KB", "3.2 MB", "1.0 GB"
std::string format_size(uint64_t bytes);

// "1.5 MB/s"
std::string format_speed(double bytes_per_sec);

// "42s", "3m 05s", "1h 02m"
std::string format_eta(std::chrono::seconds eta);

/// Percent of done/total, clamped to [0, 99] until the transfer is confirmed
/// complete. A zero total reports 0 (or 100 once confirmed).
int clamp_percent(uint64_t done, uint64_t total, bool confirmed);

/// Throughput since start() and the derived time remaining.
class ThroughputMeter {
public:
    using Clock = std::chrono::steady_clock;

    ThroughputMeter() : start_(Clock::now()) {}

    void restart() { start_ = Clock::now(); }

    double bytes_per_sec(uint64_t bytes_done) const;

    // Empty until some bytes have moved
    std::optional<std::chrono::seconds> eta(uint64_t bytes_done, uint64_t bytes_total) const;

private:
    Clock::time_point start_;
};

/// Rate limiter for progress events.
///
/// Emits when the percentage changes or when `interval` has elapsed since the
/// last emission. Never emits a percentage lower than one already emitted.
class ProgressThrottle {
public:
    using Clock = std::chrono::steady_clock;

    explicit ProgressThrottle(std::chrono::milliseconds interval) : interval_(interval) {}

    /// True if an event for `percent` should go out now. `force` bypasses the
    /// interval check but not the monotonic check.
    bool should_emit(int percent, bool force = false);

    int last_percent() const { return last_percent_; }

private:
    std::chrono::milliseconds interval_;
    int last_percent_ = -1;
    Clock::time_point last_emit_{};
};

}  // namespace objxfer
