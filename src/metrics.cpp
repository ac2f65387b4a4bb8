#include "objxfer/metrics.hpp"
#include "objxfer/worker_manager.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace objxfer {

MetricsExporter::MetricsExporter(const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds write_interval,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , registry_(std::make_shared<prometheus::Registry>()) {

    // --- Counters ---

    operations_family_ = &prometheus::BuildCounter()
        .Name("objxfer_operations_total")
        .Help("Total operations settled, by kind and result")
        .Labels(labels)
        .Register(*registry_);

    bytes_family_ = &prometheus::BuildCounter()
        .Name("objxfer_transfer_bytes_total")
        .Help("Total bytes transferred, by direction")
        .Labels(labels)
        .Register(*registry_);
    bytes_family_->Add({{"direction", "upload"}});
    bytes_family_->Add({{"direction", "download"}});

    retries_total_ = &prometheus::BuildCounter()
        .Name("objxfer_retries_total")
        .Help("Total backend call retries")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    // --- Gauges ---

    auto gauge_reg = [&](const std::string& name, const std::string& help) -> prometheus::Gauge& {
        return prometheus::BuildGauge()
            .Name(name)
            .Help(help)
            .Labels(labels)
            .Register(*registry_)
            .Add({});
    };

    operations_active_ = &gauge_reg("objxfer_operations_active", "Operations holding a worker slot");
    operations_queued_ = &gauge_reg("objxfer_operations_queued", "Operations waiting for a worker slot");

    // --- Histograms ---

    operation_duration_ = &prometheus::BuildHistogram()
        .Name("objxfer_operation_duration_seconds")
        .Help("Operation duration from activation to settlement in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.01, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60, 120, 300, 900});
}

MetricsExporter::~MetricsExporter() {
    stop();
}

void MetricsExporter::set_worker_manager(WorkerManager* manager) {
    std::lock_guard lock(source_mutex_);
    manager_ = manager;
}

void MetricsExporter::start() {
    {
        std::lock_guard lock(cv_mutex_);
        if (running_) return;
        running_ = true;
    }
    writer_thread_ = std::thread(&MetricsExporter::writer_loop, this);
}

void MetricsExporter::stop() {
    bool was_running = false;
    {
        std::lock_guard lock(cv_mutex_);
        was_running = running_;
        running_ = false;
    }
    if (was_running) {
        cv_.notify_all();
        if (writer_thread_.joinable()) {
            writer_thread_.join();
        }
    }
    // Always write a final snapshot
    flush();
}

void MetricsExporter::flush() {
    update_gauges();
    write_file();
}

void MetricsExporter::record_operation(const std::string& kind, const std::string& result,
                                       double duration_secs) {
    operations_family_->Add({{"kind", kind}, {"result", result}}).Increment();
    operation_duration_->Observe(duration_secs);
}

void MetricsExporter::record_bytes(const std::string& direction, uint64_t bytes) {
    if (bytes == 0) return;
    bytes_family_->Add({{"direction", direction}}).Increment(static_cast<double>(bytes));
}

void MetricsExporter::writer_loop() {
    while (true) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, write_interval_, [this] { return !running_; });
            if (!running_) break;
        }
        flush();
    }
}

void MetricsExporter::update_gauges() {
    std::lock_guard lock(source_mutex_);
    if (manager_) {
        operations_active_->Set(static_cast<double>(manager_->active_count()));
        operations_queued_->Set(static_cast<double>(manager_->queued_count()));
    }
}

void MetricsExporter::write_file() {
    if (prom_file_path_.empty()) return;

    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    prometheus::TextSerializer serializer;
    auto metrics = registry_->Collect();

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) return;
    ofs << serializer.Serialize(metrics);
    ofs.close();
    if (!ofs.good()) return;

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
}

}  // namespace objxfer
