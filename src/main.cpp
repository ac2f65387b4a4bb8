#include "objxfer/engine_config.hpp"
#include "objxfer/local_backend.hpp"
#include "objxfer/logger.hpp"
#include "objxfer/metrics.hpp"
#include "objxfer/object_transfer.hpp"
#include "objxfer/operation_journal.hpp"
#include "objxfer/storage_backend.hpp"
#include "objxfer/worker_manager.hpp"

#include <chrono>
#include <csignal>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <unistd.h>

namespace {
volatile std::sig_atomic_t g_interrupted = 0;

void signal_handler(int sig) {
    (void)sig;
    g_interrupted = 1;
}

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILED = 1;
constexpr int EXIT_INTERRUPTED = 130;

std::string format_time(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

bool is_secret_param(const std::string& k) {
    return k.find("key") != std::string::npos || k.find("secret") != std::string::npos ||
           k.find("token") != std::string::npos || k.find("credential") != std::string::npos;
}

/// Renders progress and retry notices of the foreground operation on stderr.
class ConsoleObserver : public objxfer::OperationObserver {
public:
    explicit ConsoleObserver(bool interactive) : interactive_(interactive) {}

    void on_progress(const objxfer::ProgressEvent& event) override {
        if (!interactive_) return;
        std::lock_guard lock(mutex_);
        std::fprintf(stderr, "\r\033[K[%3d%%] %s", event.update.percent,
                     event.update.status_text.c_str());
        std::fflush(stderr);
        line_open_ = true;
    }

    void on_retry(const objxfer::RetryEvent& event) override {
        std::lock_guard lock(mutex_);
        end_line();
        const auto& n = event.notice;
        std::fprintf(stderr, "%s: %s, retrying in %.1fs (attempt %d/%d)\n",
                     n.operation.c_str(), n.code.c_str(),
                     std::chrono::duration<double>(n.delay).count(),
                     n.attempt + 1, n.max_attempts);
    }

    void on_settled(const objxfer::SettledEvent& /*event*/) override {
        std::lock_guard lock(mutex_);
        end_line();
    }

private:
    void end_line() {
        if (line_open_) {
            std::fputc('\n', stderr);
            line_open_ = false;
        }
    }

    bool interactive_;
    std::mutex mutex_;
    bool line_open_ = false;
};

// Build the request for the positional command. Empty on a usage error.
std::optional<objxfer::OperationRequest> parse_command(const std::vector<std::string>& cmd) {
    using objxfer::OperationRequest;
    if (cmd.empty()) return std::nullopt;

    const auto& name = cmd[0];
    size_t argn = cmd.size() - 1;
    auto arg = [&](size_t i) -> const std::string& { return cmd[i]; };

    try {
        if (name == "buckets" && argn == 0) {
            return OperationRequest::list_buckets();
        } else if (name == "ls" && (argn == 1 || argn == 2)) {
            return OperationRequest::list(arg(1), argn == 2 ? arg(2) : "");
        } else if (name == "stat" && argn == 2) {
            return OperationRequest::head(arg(1), arg(2));
        } else if (name == "put" && argn == 3) {
            return OperationRequest::upload(arg(1), arg(2), arg(3));
        } else if (name == "get" && argn == 3) {
            return OperationRequest::download(arg(1), arg(2), arg(3));
        } else if (name == "rm" && argn == 2) {
            return OperationRequest::remove(arg(1), arg(2));
        } else if (name == "cp" && argn == 4) {
            return OperationRequest::copy(objxfer::ObjectRef{arg(1), arg(2)},
                                          objxfer::ObjectRef{arg(3), arg(4)});
        } else if (name == "put-dir" && argn == 3) {
            return OperationRequest::upload_dir(arg(1), arg(2), arg(3));
        } else if (name == "get-dir" && argn == 3) {
            return OperationRequest::download_dir(arg(1), arg(2), arg(3));
        } else if (name == "rm-dir" && argn == 2) {
            return OperationRequest::delete_dir(arg(1), arg(2));
        } else if (name == "presign" && (argn == 2 || argn == 3)) {
            std::chrono::seconds expiry{3600};
            if (argn == 3) expiry = std::chrono::seconds(std::stoll(arg(3)));
            if (expiry.count() <= 0) return std::nullopt;
            return OperationRequest::presign(arg(1), arg(2), expiry);
        }
    } catch (const std::exception&) {
        // stoll on a bad expiry
        return std::nullopt;
    }
    return std::nullopt;
}

void print_result(const objxfer::Operation& op) {
    using objxfer::OperationKind;
    const auto& r = op.result;
    switch (op.kind) {
        case OperationKind::ListBuckets:
            for (const auto& b : r.buckets) {
                std::cout << format_time(b.creation_date) << "  " << b.name << "\n";
            }
            break;
        case OperationKind::List:
            if (!r.listing) break;
            for (const auto& p : r.listing->prefixes) {
                std::cout << std::string(19, ' ') << "  " << std::string(10, ' ')
                          << "  PRE " << p.prefix << "\n";
            }
            for (const auto& o : r.listing->objects) {
                char size[16];
                std::snprintf(size, sizeof(size), "%10llu",
                              static_cast<unsigned long long>(o.size));
                std::cout << format_time(o.last_modified) << "  " << size
                          << "  " << o.key << "\n";
            }
            if (r.listing->truncated) {
                std::cerr << "warning: listing truncated after "
                          << r.listing->pages_fetched << " pages\n";
            }
            break;
        case OperationKind::Head:
            if (!r.metadata) break;
            std::cout << "size:          " << r.metadata->size << "\n"
                      << "etag:          " << r.metadata->etag << "\n"
                      << "content-type:  " << r.metadata->content_type << "\n"
                      << "last-modified: " << format_time(r.metadata->last_modified) << "\n";
            if (!r.metadata->storage_class.empty()) {
                std::cout << "storage-class: " << r.metadata->storage_class << "\n";
            }
            break;
        case OperationKind::Presign:
            std::cout << r.url << "\n";
            break;
        case OperationKind::Upload:
        case OperationKind::Download:
            std::cout << op.description << " (" << objxfer::format_size(r.bytes) << ")\n";
            break;
        case OperationKind::UploadDir:
        case OperationKind::DownloadDir:
            if (!r.directory) break;
            std::cout << op.description << ": " << r.directory->progress.completed_files
                      << " files, " << objxfer::format_size(r.directory->progress.transferred_bytes);
            if (r.directory->markers_created > 0) {
                std::cout << ", " << r.directory->markers_created << " empty directories";
            }
            std::cout << "\n";
            break;
        case OperationKind::DeleteDir:
            if (!r.directory) break;
            std::cout << op.description << ": " << r.directory->deleted << " objects deleted\n";
            break;
        case OperationKind::Delete:
        case OperationKind::Copy:
            std::cout << op.description << "\n";
            break;
    }
}

void print_error(const objxfer::ErrorDetail& e) {
    std::cerr << "Error: " << e.operation << ": " << e.code << ": " << e.message;
    if (e.attempts > 1) std::cerr << " (after " << e.attempts << " attempts)";
    std::cerr << "\n";
    for (const auto& [k, v] : e.details) {
        std::cerr << "  " << k << ": " << v << "\n";
    }
}
}  // namespace

int main(int argc, char* argv[]) {
    auto config_opt = objxfer::EngineConfig::from_args(argc, argv);
    if (!config_opt) {
        return EXIT_FAILED;
    }
    auto config = std::move(*config_opt);

    // Local maintenance, no backend involved
    if (config.command.size() == 2 && config.command[0] == "cleanup") {
        auto removed = objxfer::ObjectTransfer::remove_stale_partials(
            config.command[1], std::chrono::seconds(config.stale_temp_age_secs));
        std::cout << "Removed " << removed << " stale partial files\n";
        return EXIT_OK;
    }

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return EXIT_FAILED;
    }

    auto request = parse_command(config.command);
    if (!request) {
        objxfer::EngineConfig::print_usage();
        return EXIT_FAILED;
    }

    auto logger = std::make_shared<objxfer::Logger>(config.verbose);
    logger->set_quiet(!config.verbose);
    if (!config.log_file.empty()) {
        err = logger->open_file(config.log_file);
        if (!err.empty()) {
            std::cerr << "Failed to open log file: " << err << "\n";
            return EXIT_FAILED;
        }
    }

    logger->debug("objxfer starting: %s", request->describe().c_str());
    logger->debug("  backend-type: %s", config.backend.type.c_str());
    for (const auto& [k, v] : config.backend.params) {
        // Mask secrets in log output
        logger->debug("  backend-%s: %s", k.c_str(), is_secret_param(k) ? "****" : v.c_str());
    }

    std::unique_ptr<objxfer::StorageBackend> backend;
    try {
        backend = objxfer::StorageBackendFactory::create(config.backend.type,
                                                         config.backend.params);
    } catch (const objxfer::StorageError& e) {
        std::cerr << "Failed to create backend: " << e.what() << "\n";
        return EXIT_FAILED;
    }

    if (config.stale_temp_age_secs > 0) {
        if (auto* local = dynamic_cast<objxfer::LocalStorageBackend*>(backend.get())) {
            auto removed = local->remove_stale_temp_files(
                std::chrono::seconds(config.stale_temp_age_secs));
            if (removed > 0) logger->info("Removed %zu stale temp files", removed);
        }
    }

    std::unique_ptr<objxfer::OperationJournal> journal;
    if (!config.journal_path.empty()) {
        try {
            journal = std::make_unique<objxfer::OperationJournal>(config.journal_path);
        } catch (const std::runtime_error& e) {
            std::cerr << "Failed to open journal: " << e.what() << "\n";
            return EXIT_FAILED;
        }
    }

    std::unique_ptr<objxfer::MetricsExporter> metrics;
    if (!config.metrics_file.empty()) {
        metrics = std::make_unique<objxfer::MetricsExporter>(
            config.metrics_file, std::chrono::seconds(config.metrics_interval_secs),
            std::map<std::string, std::string>{{"backend", backend->type_name()}});
    }

    // Install signal handlers
    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    objxfer::WorkerManager manager(*backend, config.engine_options(), logger);
    if (metrics) manager.set_metrics(metrics.get());
    if (journal) manager.set_journal(journal.get());

    auto observer = std::make_shared<ConsoleObserver>(isatty(STDERR_FILENO) != 0);
    manager.events().subscribe(observer);

    if (metrics) metrics->start();
    manager.start();

    objxfer::OperationId id = manager.submit(*request);

    std::optional<objxfer::Operation> op;
    bool cancel_sent = false;
    while (true) {
        op = manager.wait(id, std::chrono::milliseconds(100));
        if (!op || objxfer::is_terminal(op->state)) break;
        if (g_interrupted && !cancel_sent) {
            logger->info("Interrupted, cancelling operations...");
            manager.cancel_all();
            cancel_sent = true;
        }
    }

    manager.shutdown();
    if (metrics) metrics->stop();

    if (!op) {
        std::cerr << "Error: operation record lost\n";
        return EXIT_FAILED;
    }

    switch (op->state) {
        case objxfer::OperationState::Completed:
            print_result(*op);
            return EXIT_OK;
        case objxfer::OperationState::Cancelled:
            std::cerr << "Cancelled: " << op->description << "\n";
            return EXIT_INTERRUPTED;
        default:
            if (op->error) {
                print_error(*op->error);
            } else {
                std::cerr << "Error: " << op->description << " failed\n";
            }
            return EXIT_FAILED;
    }
}
