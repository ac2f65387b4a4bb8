#pragma once

#include <cstdarg>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

namespace objxfer {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

/// printf-style logger handle.
///
/// Info/debug lines go to stdout, warnings/errors to stderr. When a log file
/// is opened every line is also appended there. Debug lines are only written
/// in verbose mode. Components receive a shared_ptr<Logger> at construction.
class Logger {
public:
    explicit Logger(bool verbose = false);
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /// Append log lines to `path` (parent directories are created).
    /// Returns error message or empty string on success.
    std::string open_file(const std::filesystem::path& path);

    void set_verbose(bool verbose) { verbose_ = verbose; }
    bool verbose() const { return verbose_; }

    /// Suppress console output (file sink still receives everything).
    void set_quiet(bool quiet) { quiet_ = quiet; }

    void debug(const char* fmt, ...) __attribute__((format(printf, 2, 3)));
    void info(const char* fmt, ...) __attribute__((format(printf, 2, 3)));
    void warn(const char* fmt, ...) __attribute__((format(printf, 2, 3)));
    void error(const char* fmt, ...) __attribute__((format(printf, 2, 3)));

    /// Logger that writes nothing to the console (used by tests and as a default).
    static std::shared_ptr<Logger> null();

private:
    void write(LogLevel level, const char* fmt, va_list args);

    bool verbose_ = false;
    bool quiet_ = false;
    std::mutex mutex_;
    FILE* file_ = nullptr;
};

}  // namespace objxfer
