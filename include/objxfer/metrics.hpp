#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace objxfer {

class WorkerManager;

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        double secs = std::chrono::duration<double>(elapsed).count();
        histogram_.Observe(secs);
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// Exports transfer metrics to a Prometheus textfile for node_exporter pickup.
///
/// A background writer thread periodically serializes the registry to the
/// .prom file using atomic temp+rename.
class MetricsExporter {
public:
    /// @param prom_file_path  Path to the .prom output file.
    /// @param write_interval  How often to write the file.
    /// @param labels          Constant labels applied to all metrics.
    MetricsExporter(const std::filesystem::path& prom_file_path,
                    std::chrono::seconds write_interval,
                    const std::map<std::string, std::string>& labels);
    ~MetricsExporter();

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    /// Source for the active/queued gauges (not owned).
    void set_worker_manager(WorkerManager* manager);

    void start();

    /// Stop the writer thread (writes one final snapshot).
    void stop();

    /// Write a snapshot now.
    void flush();

    // --- Recording ---

    /// Count one settled operation and observe its duration.
    void record_operation(const std::string& kind, const std::string& result,
                          double duration_secs);

    /// direction: "upload", "download"
    void record_bytes(const std::string& direction, uint64_t bytes);

    prometheus::Counter& retries_total() { return *retries_total_; }
    prometheus::Histogram& operation_duration() { return *operation_duration_; }

    const std::filesystem::path& path() const { return prom_file_path_; }

private:
    void writer_loop();
    void update_gauges();
    void write_file();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;

    std::shared_ptr<prometheus::Registry> registry_;

    // Gauge source (not owned)
    std::mutex source_mutex_;
    WorkerManager* manager_ = nullptr;

    // --- Counters ---
    prometheus::Family<prometheus::Counter>* operations_family_;
    prometheus::Family<prometheus::Counter>* bytes_family_;
    prometheus::Counter* retries_total_;

    // --- Gauges ---
    prometheus::Gauge* operations_active_;
    prometheus::Gauge* operations_queued_;

    // --- Histograms ---
    prometheus::Histogram* operation_duration_;

    // Writer thread
    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
};

}  // namespace objxfer
