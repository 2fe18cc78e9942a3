#include <meshgate/core/logger.hpp>
#include <meshgate/core/utils.hpp>

namespace meshgate {

LogLevel parse_log_level(const std::string& name) {
    std::string n = to_lower(trim(name));
    if (n == "debug") return LogLevel::DEBUG;
    if (n == "warn" || n == "warning") return LogLevel::WARN;
    if (n == "error") return LogLevel::ERROR;
    if (n == "silent" || n == "none") return LogLevel::SILENT;
    return LogLevel::INFO;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO: return "info";
        case LogLevel::WARN: return "warn";
        case LogLevel::ERROR: return "error";
        case LogLevel::SILENT: return "silent";
    }
    return "info";
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::set_level(LogLevel level) { level_ = level; }

LogLevel Logger::level() const { return level_; }

void Logger::debug(const char* fmt, ...) {
    if (level_ > LogLevel::DEBUG) return;
    va_list args;
    va_start(args, fmt);
    log_impl("DEBUG", fmt, args);
    va_end(args);
}

void Logger::info(const char* fmt, ...) {
    if (level_ > LogLevel::INFO) return;
    va_list args;
    va_start(args, fmt);
    log_impl("INFO", fmt, args);
    va_end(args);
}

void Logger::warn(const char* fmt, ...) {
    if (level_ > LogLevel::WARN) return;
    va_list args;
    va_start(args, fmt);
    log_impl("WARN", fmt, args);
    va_end(args);
}

void Logger::error(const char* fmt, ...) {
    if (level_ > LogLevel::ERROR) return;
    va_list args;
    va_start(args, fmt);
    log_impl("ERROR", fmt, args);
    va_end(args);
}

Logger::Logger() : level_(LogLevel::INFO) {}

void Logger::log_impl(const char* level_str, const char* fmt, va_list args) {
    time_t now = time(NULL);
    struct tm t;
    localtime_r(&now, &t);
    char timestamp[32];
    strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &t);

    // Connection handlers log from many threads; keep lines whole
    std::lock_guard<std::mutex> lock(write_mutex_);
    fprintf(stderr, "[%s] [%s] ", timestamp, level_str);
    vfprintf(stderr, fmt, args);
    fprintf(stderr, "\n");
    fflush(stderr);
}

} // namespace meshgate
