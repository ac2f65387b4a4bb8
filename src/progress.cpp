#include "objxfer/progress.hpp"

#include <algorithm>
#include <cstdio>

namespace objxfer {

std::string format_size(uint64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    if (bytes < 1024) return std::to_string(bytes) + " B";

    double value = static_cast<double>(bytes);
    size_t unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        ++unit;
    }
    char buf[32];
    snprintf(buf, sizeof(buf), "%.1f %s", value, units[unit]);
    return buf;
}

std::string format_speed(double bytes_per_sec) {
    if (bytes_per_sec < 0) bytes_per_sec = 0;
    return format_size(static_cast<uint64_t>(bytes_per_sec)) + "/s";
}

std::string format_eta(std::chrono::seconds eta) {
    auto total = eta.count();
    if (total < 0) total = 0;
    char buf[32];
    if (total < 60) {
        snprintf(buf, sizeof(buf), "%llds", static_cast<long long>(total));
    } else if (total < 3600) {
        snprintf(buf, sizeof(buf), "%lldm %02llds",
                 static_cast<long long>(total / 60), static_cast<long long>(total % 60));
    } else {
        snprintf(buf, sizeof(buf), "%lldh %02lldm",
                 static_cast<long long>(total / 3600),
                 static_cast<long long>((total % 3600) / 60));
    }
    return buf;
}

int clamp_percent(uint64_t done, uint64_t total, bool confirmed) {
    if (confirmed) return 100;
    if (total == 0) return 0;
    auto pct = static_cast<int>((static_cast<long double>(done) * 100) / total);
    return std::clamp(pct, 0, 99);
}

// --- ThroughputMeter ---

double ThroughputMeter::bytes_per_sec(uint64_t bytes_done) const {
    double secs = std::chrono::duration<double>(Clock::now() - start_).count();
    if (secs <= 0.0) return 0.0;
    return static_cast<double>(bytes_done) / secs;
}

std::optional<std::chrono::seconds> ThroughputMeter::eta(uint64_t bytes_done,
                                                         uint64_t bytes_total) const {
    if (bytes_done == 0 || bytes_done > bytes_total) return std::nullopt;
    double rate = bytes_per_sec(bytes_done);
    if (rate <= 0.0) return std::nullopt;
    auto remaining = static_cast<double>(bytes_total - bytes_done) / rate;
    return std::chrono::seconds(static_cast<int64_t>(remaining + 0.5));
}

// --- ProgressThrottle ---

bool ProgressThrottle::should_emit(int percent, bool force) {
    if (percent < last_percent_) return false;

    auto now = Clock::now();
    if (percent == last_percent_ && !force && now - last_emit_ < interval_) {
        return false;
    }
    last_percent_ = percent;
    last_emit_ = now;
    return true;
}

}  // namespace objxfer
