#pragma once

#include "objxfer/worker_manager.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace objxfer {

/// Configuration for the storage backend.
struct BackendConfig {
    std::string type = "local";
    std::map<std::string, std::string> params;  // Passed to StorageBackendFactory

    bool empty() const { return type.empty(); }

    /// Validate required fields for this backend type.
    /// Returns error message or empty string on success.
    std::string validate() const;
};

/// Engine configuration, loaded once and read by every component.
struct EngineConfig {
    // Listing
    uint32_t page_size = 1000;
    uint32_t max_pages = 20;

    // Retry
    int max_retries = 5;
    double retry_delay_secs = 1.0;
    bool exponential_backoff = true;
    double retry_deadline_secs = 0;   // 0 = no deadline

    // Workers
    size_t max_concurrent_operations = 5;
    size_t completed_operation_ttl_secs = 5;   // 0 = never auto-remove

    // Transfers
    uint32_t delete_batch_size = 1000;
    size_t progress_interval_ms = 200;
    bool verify_checksums = false;
    size_t stale_temp_age_secs = 24 * 3600;    // 0 = never sweep leftover temp files

    BackendConfig backend;

    // Logging
    bool verbose = false;
    std::filesystem::path log_file;

    // Prometheus metrics (textfile collector)
    std::filesystem::path metrics_file;
    size_t metrics_interval_secs = 15;

    // Operation history (SQLite)
    std::filesystem::path journal_path;

    // Positional arguments: command name followed by its operands
    std::vector<std::string> command;

    /// Parse configuration from command line arguments.
    /// Returns empty optional on error or --help (prints usage to stderr).
    static std::optional<EngineConfig> from_args(int argc, char* argv[]);

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Fill in values taken from the environment (OBJXFER_*).
    void apply_defaults();

    /// Validate fields. Returns error message or empty string.
    std::string validate() const;

    RetryPolicy retry_policy() const;
    ListerOptions lister_options() const;
    TransferOptions transfer_options() const;
    DirectoryOptions directory_options() const;
    WorkerOptions worker_options() const;
    EngineOptions engine_options() const;

    static void print_usage();
};

}  // namespace objxfer
