#include "objxfer/engine_config.hpp"

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace objxfer {

// --- BackendConfig ---

std::string BackendConfig::validate() const {
    if (type.empty()) return "backend type is required";
    if (type == "local") {
        if (params.count("path") == 0 || params.at("path").empty())
            return "local backend requires 'path' (--backend-path or OBJXFER_BACKEND_PATH)";
    } else {
        return "unknown backend type: " + type;
    }
    return {};
}

// --- EngineConfig ---

namespace {

// Parse a --backend-X flag into the BackendConfig.
// Returns true if the flag was handled, false if it wasn't a backend flag.
bool parse_backend_flag(const std::string& arg, const char* value, BackendConfig& backend) {
    if (arg.compare(0, 10, "--backend-") != 0) return false;
    std::string suffix = arg.substr(10);

    if (suffix == "type") {
        backend.type = value;
    } else if (suffix == "path") {
        backend.params["path"] = value;
    } else if (suffix == "signing-key") {
        backend.params["signing_key"] = value;
    } else if (suffix == "chunk-size") {
        backend.params["chunk_size"] = value;
    } else {
        return false;
    }
    return true;
}

}  // namespace

void EngineConfig::print_usage() {
    std::cerr <<
        "Usage: objxfer [options] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  buckets                          List buckets\n"
        "  ls <bucket> [prefix]             List objects and prefixes one level deep\n"
        "  stat <bucket> <key>              Show object metadata\n"
        "  put <file> <bucket> <key>        Upload a file\n"
        "  get <bucket> <key> <file>        Download an object\n"
        "  rm <bucket> <key>                Delete an object\n"
        "  cp <bucket> <key> <dst-bucket> <dst-key>\n"
        "                                   Copy an object\n"
        "  put-dir <dir> <bucket> <prefix>  Upload a directory tree\n"
        "  get-dir <bucket> <prefix> <dir>  Download a prefix into a directory\n"
        "  rm-dir <bucket> <prefix>         Delete everything under a prefix\n"
        "  presign <bucket> <key> [secs]    Print a presigned URL (default: 3600s)\n"
        "  cleanup <dir>                    Remove stale partial downloads under a directory\n"
        "\n"
        "Backend:\n"
        "  --backend-type <type>            Backend type (default: local)\n"
        "  --backend-path <path>            Root directory (local, or OBJXFER_BACKEND_PATH env)\n"
        "  --backend-signing-key <key>      Presign key (local, or OBJXFER_SIGNING_KEY env)\n"
        "  --backend-chunk-size <bytes>     Transfer chunk size (local, default: 65536)\n"
        "\n"
        "Options:\n"
        "  --config <path>                  JSON config file\n"
        "  --page-size <N>                  Max listing rows per page (default: 1000)\n"
        "  --max-pages <N>                  Listing page ceiling (default: 20)\n"
        "  --max-retries <N>                Retries for transient errors (default: 5)\n"
        "  --retry-delay <secs>             Base retry delay (default: 1)\n"
        "  --no-exponential-backoff         Constant retry delay\n"
        "  --retry-deadline <secs>          Give up retrying after this long (default: none)\n"
        "  --max-concurrent <N>             Concurrent operations (default: 5)\n"
        "  --operation-ttl <secs>           Keep settled operations this long, 0 = forever (default: 5)\n"
        "  --delete-batch-size <N>          Keys per batch delete call (default: 1000)\n"
        "  --progress-interval <ms>         Min interval between progress lines (default: 200)\n"
        "  --verify-checksums               Verify downloads against MD5 ETags\n"
        "  --stale-temp-age <secs>          Sweep leftover temp files older than this, 0 = never (default: 86400)\n"
        "  --verbose                        Verbose output\n"
        "  --log-file <path>                Log file path\n"
        "  --metrics-file <path>            Prometheus .prom file for node_exporter textfile collector\n"
        "  --metrics-interval <secs>        Metrics write interval (default: 15)\n"
        "  --journal <path>                 SQLite history of settled operations\n"
        "  --help                           Show this help\n";
}

std::optional<EngineConfig> EngineConfig::from_args(int argc, char* argv[]) {
    EngineConfig config;

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    bool options_done = false;
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (options_done || arg.empty() || arg[0] != '-' || arg == "-") {
                config.command.push_back(arg);
                continue;
            }
            if (arg == "--") {
                options_done = true;
                continue;
            }

            // Backend flags (--backend-X <value>)
            if (arg.compare(0, 10, "--backend-") == 0) {
                auto* v = next_arg(i, arg.c_str());
                if (!v) return std::nullopt;
                if (!parse_backend_flag(arg, v, config.backend)) {
                    std::cerr << "Error: unknown option: " << arg << "\n";
                    return std::nullopt;
                }
                continue;
            }

            if (arg == "--config") {
                auto* v = next_arg(i, "--config");
                if (!v) return std::nullopt;
                if (!config.load_json(v)) return std::nullopt;
            } else if (arg == "--page-size") {
                auto* v = next_arg(i, "--page-size");
                if (!v) return std::nullopt;
                config.page_size = static_cast<uint32_t>(std::stoul(v));
            } else if (arg == "--max-pages") {
                auto* v = next_arg(i, "--max-pages");
                if (!v) return std::nullopt;
                config.max_pages = static_cast<uint32_t>(std::stoul(v));
            } else if (arg == "--max-retries") {
                auto* v = next_arg(i, "--max-retries");
                if (!v) return std::nullopt;
                config.max_retries = std::stoi(v);
            } else if (arg == "--retry-delay") {
                auto* v = next_arg(i, "--retry-delay");
                if (!v) return std::nullopt;
                config.retry_delay_secs = std::stod(v);
            } else if (arg == "--no-exponential-backoff") {
                config.exponential_backoff = false;
            } else if (arg == "--retry-deadline") {
                auto* v = next_arg(i, "--retry-deadline");
                if (!v) return std::nullopt;
                config.retry_deadline_secs = std::stod(v);
            } else if (arg == "--max-concurrent") {
                auto* v = next_arg(i, "--max-concurrent");
                if (!v) return std::nullopt;
                config.max_concurrent_operations = std::stoull(v);
            } else if (arg == "--operation-ttl") {
                auto* v = next_arg(i, "--operation-ttl");
                if (!v) return std::nullopt;
                config.completed_operation_ttl_secs = std::stoull(v);
            } else if (arg == "--delete-batch-size") {
                auto* v = next_arg(i, "--delete-batch-size");
                if (!v) return std::nullopt;
                config.delete_batch_size = static_cast<uint32_t>(std::stoul(v));
            } else if (arg == "--progress-interval") {
                auto* v = next_arg(i, "--progress-interval");
                if (!v) return std::nullopt;
                config.progress_interval_ms = std::stoull(v);
            } else if (arg == "--stale-temp-age") {
                auto* v = next_arg(i, "--stale-temp-age");
                if (!v) return std::nullopt;
                config.stale_temp_age_secs = std::stoull(v);
            } else if (arg == "--verify-checksums") {
                config.verify_checksums = true;
            } else if (arg == "--verbose" || arg == "-v") {
                config.verbose = true;
            } else if (arg == "--log-file") {
                auto* v = next_arg(i, "--log-file");
                if (!v) return std::nullopt;
                config.log_file = v;
            } else if (arg == "--metrics-file") {
                auto* v = next_arg(i, "--metrics-file");
                if (!v) return std::nullopt;
                config.metrics_file = v;
            } else if (arg == "--metrics-interval") {
                auto* v = next_arg(i, "--metrics-interval");
                if (!v) return std::nullopt;
                config.metrics_interval_secs = std::stoull(v);
            } else if (arg == "--journal") {
                auto* v = next_arg(i, "--journal");
                if (!v) return std::nullopt;
                config.journal_path = v;
            } else if (arg == "--help" || arg == "-h") {
                print_usage();
                return std::nullopt;
            } else {
                std::cerr << "Error: unknown option: " << arg << "\n";
                return std::nullopt;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: invalid numeric value (" << e.what() << ")\n";
        return std::nullopt;
    }

    config.apply_defaults();
    return config;
}

bool EngineConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("page_size")) page_size = j["page_size"].get<uint32_t>();
        if (j.contains("max_pages")) max_pages = j["max_pages"].get<uint32_t>();
        if (j.contains("max_retries")) max_retries = j["max_retries"].get<int>();
        if (j.contains("retry_delay")) retry_delay_secs = j["retry_delay"].get<double>();
        if (j.contains("exponential_backoff")) exponential_backoff = j["exponential_backoff"].get<bool>();
        if (j.contains("retry_deadline")) retry_deadline_secs = j["retry_deadline"].get<double>();
        if (j.contains("max_concurrent_operations"))
            max_concurrent_operations = j["max_concurrent_operations"].get<size_t>();
        if (j.contains("completed_operation_ttl"))
            completed_operation_ttl_secs = j["completed_operation_ttl"].get<size_t>();
        if (j.contains("delete_batch_size")) delete_batch_size = j["delete_batch_size"].get<uint32_t>();
        if (j.contains("progress_interval_ms")) progress_interval_ms = j["progress_interval_ms"].get<size_t>();
        if (j.contains("verify_checksums")) verify_checksums = j["verify_checksums"].get<bool>();
        if (j.contains("stale_temp_age")) stale_temp_age_secs = j["stale_temp_age"].get<size_t>();
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();
        if (j.contains("log_file")) log_file = j["log_file"].get<std::string>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval")) metrics_interval_secs = j["metrics_interval"].get<size_t>();
        if (j.contains("journal_path")) journal_path = j["journal_path"].get<std::string>();

        // Parse backend
        if (j.contains("backend") && j["backend"].is_object()) {
            auto& jb = j["backend"];
            if (jb.contains("type")) backend.type = jb["type"].get<std::string>();
            for (auto& [key, val] : jb.items()) {
                if (key == "type") continue;
                backend.params[key] = val.is_string() ? val.get<std::string>() : val.dump();
            }
        }

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

void EngineConfig::apply_defaults() {
    if (backend.type.empty()) backend.type = "local";

    // Fill local backend settings from environment if not set on CLI or in JSON
    if (backend.type == "local") {
        if (backend.params.count("path") == 0 || backend.params["path"].empty()) {
            if (const char* v = std::getenv("OBJXFER_BACKEND_PATH")) {
                backend.params["path"] = v;
            }
        }
        if (backend.params.count("signing_key") == 0 || backend.params["signing_key"].empty()) {
            if (const char* v = std::getenv("OBJXFER_SIGNING_KEY")) {
                backend.params["signing_key"] = v;
            }
        }
    }
}

std::string EngineConfig::validate() const {
    if (page_size == 0 || page_size > 1000) return "page_size must be between 1 and 1000";
    if (max_pages == 0) return "max_pages must be > 0";
    if (max_retries < 0) return "max_retries must be >= 0";
    if (!std::isfinite(retry_delay_secs) || retry_delay_secs < 0)
        return "retry_delay must be >= 0";
    if (!std::isfinite(retry_deadline_secs) || retry_deadline_secs < 0)
        return "retry_deadline must be >= 0";
    if (max_concurrent_operations == 0) return "max_concurrent_operations must be > 0";
    if (delete_batch_size == 0 || delete_batch_size > 1000)
        return "delete_batch_size must be between 1 and 1000";
    if (metrics_interval_secs == 0) return "metrics_interval must be > 0";
    auto err = backend.validate();
    if (!err.empty()) return "backend: " + err;
    return {};
}

RetryPolicy EngineConfig::retry_policy() const {
    RetryPolicy policy;
    policy.max_retries = max_retries;
    policy.base_delay = std::chrono::milliseconds(
        static_cast<int64_t>(std::llround(retry_delay_secs * 1000.0)));
    policy.exponential_backoff = exponential_backoff;
    return policy;
}

ListerOptions EngineConfig::lister_options() const {
    ListerOptions options;
    options.page_size = page_size;
    options.max_pages = max_pages;
    return options;
}

TransferOptions EngineConfig::transfer_options() const {
    TransferOptions options;
    options.verify_checksums = verify_checksums;
    options.progress_interval = std::chrono::milliseconds(progress_interval_ms);
    return options;
}

DirectoryOptions EngineConfig::directory_options() const {
    DirectoryOptions options;
    options.delete_batch_size = delete_batch_size;
    options.progress_interval = std::chrono::milliseconds(progress_interval_ms);
    return options;
}

WorkerOptions EngineConfig::worker_options() const {
    WorkerOptions options;
    options.max_concurrent = max_concurrent_operations;
    options.completed_ttl = std::chrono::seconds(completed_operation_ttl_secs);
    options.retry_deadline = std::chrono::seconds(
        static_cast<int64_t>(std::ceil(retry_deadline_secs)));
    return options;
}

EngineOptions EngineConfig::engine_options() const {
    EngineOptions options;
    options.retry = retry_policy();
    options.lister = lister_options();
    options.transfer = transfer_options();
    options.directory = directory_options();
    options.workers = worker_options();
    return options;
}

}  // namespace objxfer
