/*
 * execd C++ - Logger Implementation
 */
#include <execd/core/logger.hpp>
#include <execd/core/utils.hpp>

#include <ctime>

namespace execd {

namespace {

const char* const kReset = "\033[0m";
const char* const kFunctionColor = "\033[36m";
const char* const kLocationColor = "\033[33m";

struct LevelStyle {
    const char* name;
    const char* color;
};

const LevelStyle kLevelStyles[] = {
    { "DEBUG", "\033[34m" },
    { "INFO",  "\033[32m" },
    { "WARN",  "\033[33m" },
    { "ERROR", "\033[31m" },
};

const LevelStyle& style_for(LogLevel level) {
    int index = static_cast<int>(level);
    if (index < 0 || index > 3) index = 3;
    return kLevelStyles[index];
}

// "void execd::Registry::append(const std::string&)" -> "Registry::append"
std::string short_function_name(const char* pretty) {
    std::string signature(pretty ? pretty : "");
    size_t paren = signature.find('(');
    if (paren != std::string::npos) {
        signature.erase(paren);
    }

    // Drop template arguments so the return type split below sees no spaces inside them
    std::string plain;
    int depth = 0;
    for (size_t i = 0; i < signature.size(); ++i) {
        char c = signature[i];
        if (c == '<') { ++depth; continue; }
        if (c == '>') { if (depth > 0) --depth; continue; }
        if (depth == 0) plain += c;
    }

    size_t space = plain.rfind(' ');
    std::string name = space == std::string::npos ? plain : plain.substr(space + 1);
    while (!name.empty() && (name[0] == '*' || name[0] == '&')) {
        name.erase(0, 1);
    }
    if (starts_with(name, "execd::")) {
        name.erase(0, 7);
    }
    return name;
}

} // anonymous namespace

LogLevel parse_log_level(const std::string& name, LogLevel fallback) {
    std::string lower = to_lower(trim(name));
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    return fallback;
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger() : level_(LogLevel::INFO), file_(nullptr) {}

Logger::~Logger() {
    if (file_) {
        fclose(file_);
    }
}

void Logger::set_level(LogLevel level) { level_ = level; }

LogLevel Logger::level() const { return level_.load(); }

bool Logger::set_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_) {
        fclose(file_);
        file_ = nullptr;
    }
    if (path.empty()) return true;
    file_ = fopen(path.c_str(), "a");
    return file_ != nullptr;
}

void Logger::write(LogLevel level, const char* file, int line, const char* func, const char* fmt, ...) {
    if (!enabled(level)) return;

    char message[4096];
    va_list args;
    va_start(args, fmt);
    vsnprintf(message, sizeof(message), fmt, args);
    va_end(args);

    time_t now = time(NULL);
    struct tm local;
    localtime_r(&now, &local);
    char stamp[32];
    strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &local);

    const LevelStyle& style = style_for(level);
    std::string prefix;
    if (level_.load() == LogLevel::DEBUG) {
        prefix = std::string(kFunctionColor) + "(" + short_function_name(func) + ")" + kReset +
                 " at " + kLocationColor + file + ":" + std::to_string(line) + kReset + " ";
    }

    std::lock_guard<std::mutex> lock(mutex_);
    fprintf(stderr, "[%s] %s[%s]%s %s%s\n", stamp, style.color, style.name, kReset, prefix.c_str(), message);
    fflush(stderr);

    if (file_) {
        fprintf(file_, "[%s] [%s] %s\n", stamp, style.name, message);
        fflush(file_);
    }
}

} // namespace execd
