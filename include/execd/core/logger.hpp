/*
 * execd C++ - Logger
 *
 * Process-wide leveled logger. Lines go to stderr with colored level tags;
 * at DEBUG they also carry the calling function and source location. An
 * optional log file receives the same lines without colors.
 */
#ifndef execd_CORE_LOGGER_HPP
#define execd_CORE_LOGGER_HPP

#include <string>
#include <cstdio>
#include <cstdarg>
#include <atomic>
#include <mutex>

namespace execd {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// Parse "debug" / "info" / "warn" / "error" (case-insensitive); unknown -> fallback
LogLevel parse_log_level(const std::string& name, LogLevel fallback = LogLevel::INFO);

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    LogLevel level() const;
    bool enabled(LogLevel level) const { return level >= level_.load(); }

    // Mirror every line (without colors) into a file. Empty path disables.
    bool set_file(const std::string& path);

    void write(LogLevel level, const char* file, int line, const char* func, const char* fmt, ...)
#ifdef __GNUC__
        __attribute__((format(printf, 6, 7)))
#endif
        ;

private:
    Logger();
    ~Logger();
    Logger(const Logger&);
    Logger& operator=(const Logger&);

    std::atomic<LogLevel> level_;
    FILE* file_;
    std::mutex mutex_;
};

#define EXECD_LOG(lvl, ...) \
    do { \
        if (execd::Logger::instance().enabled(lvl)) \
            execd::Logger::instance().write(lvl, __FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__); \
    } while (0)

#define LOG_DEBUG(...) EXECD_LOG(execd::LogLevel::DEBUG, __VA_ARGS__)
#define LOG_INFO(...)  EXECD_LOG(execd::LogLevel::INFO, __VA_ARGS__)
#define LOG_WARN(...)  EXECD_LOG(execd::LogLevel::WARN, __VA_ARGS__)
#define LOG_ERROR(...) EXECD_LOG(execd::LogLevel::ERROR, __VA_ARGS__)

} // namespace execd

#endif // execd_CORE_LOGGER_HPP
