#include "objxfer/logger.hpp"

#include <chrono>
#include <ctime>

namespace objxfer {

namespace {

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

// "2026-10-19 09:26:00.123"
void format_timestamp(char* buf, size_t len) {
    auto now = std::chrono::system_clock::now();
    auto secs = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()).count() % 1000;
    struct tm tm_buf;
    localtime_r(&secs, &tm_buf);
    size_t n = strftime(buf, len, "%Y-%m-%d %H:%M:%S", &tm_buf);
    snprintf(buf + n, len - n, ".%03d", static_cast<int>(ms));
}

}  // namespace

Logger::Logger(bool verbose) : verbose_(verbose) {}

Logger::~Logger() {
    if (file_) fclose(file_);
}

std::string Logger::open_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) return "cannot create log directory: " + ec.message();
    }
    FILE* f = fopen(path.c_str(), "a");
    if (!f) return "cannot open log file: " + path.string();

    std::lock_guard lock(mutex_);
    if (file_) fclose(file_);
    file_ = f;
    return {};
}

void Logger::debug(const char* fmt, ...) {
    if (!verbose_) return;
    va_list args;
    va_start(args, fmt);
    write(LogLevel::Debug, fmt, args);
    va_end(args);
}

void Logger::info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write(LogLevel::Info, fmt, args);
    va_end(args);
}

void Logger::warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write(LogLevel::Warn, fmt, args);
    va_end(args);
}

void Logger::error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write(LogLevel::Error, fmt, args);
    va_end(args);
}

void Logger::write(LogLevel level, const char* fmt, va_list args) {
    char message[2048];
    vsnprintf(message, sizeof(message), fmt, args);

    char ts[40];
    format_timestamp(ts, sizeof(ts));

    std::lock_guard lock(mutex_);
    if (!quiet_) {
        FILE* out = level >= LogLevel::Warn ? stderr : stdout;
        if (level >= LogLevel::Warn) {
            fprintf(out, "%s: %s\n", level_tag(level), message);
        } else {
            fprintf(out, "%s\n", message);
        }
        fflush(out);
    }
    if (file_) {
        fprintf(file_, "%s [%s] %s\n", ts, level_tag(level), message);
        fflush(file_);
    }
}

std::shared_ptr<Logger> Logger::null() {
    auto logger = std::make_shared<Logger>(false);
    logger->set_quiet(true);
    return logger;
}

}  // namespace objxfer
