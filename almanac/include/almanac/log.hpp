#pragma once
// Log: component-tagged stderr logging
//
// Every line looks like
//   [12:04:55.123][http] message
// and is written with a single write so concurrent threads never interleave
// within a line. One process-wide threshold filters everything below it.

#include <string>

namespace almanac {

enum class LogLevel : int {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Notice = 3,
    Warning = 4,
    Error = 5,
    Critical = 6,
};

// Parse "trace".."critical" (case-insensitive). Unknown names yield Info.
LogLevel parse_log_level(const std::string& name);
bool is_log_level_name(const std::string& name);
const char* log_level_name(LogLevel level);

void set_log_level(LogLevel level);
LogLevel log_level();
bool log_enabled(LogLevel level);

// printf-style; fmt must be a literal
void log_at(LogLevel level, const char* component, const char* fmt, ...);

void log_trace(const char* component, const char* fmt, ...);
void log_debug(const char* component, const char* fmt, ...);
void log_info(const char* component, const char* fmt, ...);
void log_notice(const char* component, const char* fmt, ...);
void log_warning(const char* component, const char* fmt, ...);
void log_error(const char* component, const char* fmt, ...);
void log_critical(const char* component, const char* fmt, ...);

} // namespace almanac
