#ifndef MESHGATE_CORE_LOGGER_HPP
#define MESHGATE_CORE_LOGGER_HPP

#include <string>
#include <cstdio>
#include <ctime>
#include <cstdarg>
#include <mutex>
#include <atomic>

namespace meshgate {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    SILENT = 4
};

// Parse "debug", "info", "warn", "error" or "silent" (case-insensitive).
// Unknown names map to INFO.
LogLevel parse_log_level(const std::string& name);

const char* log_level_name(LogLevel level);

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    LogLevel level() const;

    void debug(const char* fmt, ...);
    void info(const char* fmt, ...);
    void warn(const char* fmt, ...);
    void error(const char* fmt, ...);

private:
    Logger();
    Logger(const Logger&);
    Logger& operator=(const Logger&);

    void log_impl(const char* level_str, const char* fmt, va_list args);

    std::atomic<LogLevel> level_;
    std::mutex write_mutex_;
};

// Convenience macros
#define LOG_DEBUG(...) meshgate::Logger::instance().debug(__VA_ARGS__)
#define LOG_INFO(...)  meshgate::Logger::instance().info(__VA_ARGS__)
#define LOG_WARN(...)  meshgate::Logger::instance().warn(__VA_ARGS__)
#define LOG_ERROR(...) meshgate::Logger::instance().error(__VA_ARGS__)

} // namespace meshgate

#endif // MESHGATE_CORE_LOGGER_HPP
