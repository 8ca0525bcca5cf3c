#include <almanac/log.hpp>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <string>

namespace almanac {

namespace {

std::atomic<int> g_threshold{static_cast<int>(LogLevel::Info)};

struct LevelName {
    LogLevel level;
    const char* name;
};

constexpr LevelName LEVEL_NAMES[] = {
    {LogLevel::Trace, "trace"},
    {LogLevel::Debug, "debug"},
    {LogLevel::Info, "info"},
    {LogLevel::Notice, "notice"},
    {LogLevel::Warning, "warning"},
    {LogLevel::Error, "error"},
    {LogLevel::Critical, "critical"},
};

std::string lowercase(const std::string& s) {
    std::string out = s;
    for (auto& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

void vlog(LogLevel level, const char* component, const char* fmt, va_list args) {
    if (!log_enabled(level)) return;

    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&now_time_t, &tm_buf);
    char time_buf[16];
    std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &tm_buf);

    char msg_buf[1024];
    std::vsnprintf(msg_buf, sizeof(msg_buf), fmt, args);

    // Warnings and above carry their level so defects stand out in the stream
    const char* tag = "";
    if (level >= LogLevel::Warning) {
        tag = level == LogLevel::Warning ? "WARNING: "
            : level == LogLevel::Error   ? "ERROR: "
                                         : "CRITICAL: ";
    }

    std::fprintf(stderr, "[%s.%03d][%s] %s%s\n", time_buf,
                 static_cast<int>(now_ms.count()), component, tag, msg_buf);
}

} // namespace

LogLevel parse_log_level(const std::string& name) {
    std::string lower = lowercase(name);
    for (const auto& entry : LEVEL_NAMES) {
        if (lower == entry.name) return entry.level;
    }
    return LogLevel::Info;
}

bool is_log_level_name(const std::string& name) {
    std::string lower = lowercase(name);
    for (const auto& entry : LEVEL_NAMES) {
        if (lower == entry.name) return true;
    }
    return false;
}

const char* log_level_name(LogLevel level) {
    for (const auto& entry : LEVEL_NAMES) {
        if (entry.level == level) return entry.name;
    }
    return "info";
}

void set_log_level(LogLevel level) {
    g_threshold.store(static_cast<int>(level));
}

LogLevel log_level() {
    return static_cast<LogLevel>(g_threshold.load());
}

bool log_enabled(LogLevel level) {
    return static_cast<int>(level) >= g_threshold.load();
}

void log_at(LogLevel level, const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(level, component, fmt, args);
    va_end(args);
}

void log_trace(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Trace, component, fmt, args);
    va_end(args);
}

void log_debug(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Debug, component, fmt, args);
    va_end(args);
}

void log_info(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Info, component, fmt, args);
    va_end(args);
}

void log_notice(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Notice, component, fmt, args);
    va_end(args);
}

void log_warning(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Warning, component, fmt, args);
    va_end(args);
}

void log_error(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Error, component, fmt, args);
    va_end(args);
}

void log_critical(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Critical, component, fmt, args);
    va_end(args);
}

} // namespace almanac
