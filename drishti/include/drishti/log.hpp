#pragma once
// Log: component-tagged diagnostics on stderr
//
// Format: [HH:MM:SS.mmm][LEVEL][component] message
// Threshold is process-wide; stdout stays reserved for relayed protocol traffic.

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <mutex>
#include <string>

namespace drishti {

enum class LogLevel : int {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4
};

inline std::atomic<int>& log_threshold() {
    static std::atomic<int> threshold{static_cast<int>(LogLevel::Info)};
    return threshold;
}

inline void set_log_level(LogLevel level) {
    log_threshold().store(static_cast<int>(level));
}

inline bool log_enabled(LogLevel level) {
    return static_cast<int>(level) >= log_threshold().load();
}

// Accepts debug|info|warn|error|off (case-sensitive), leaves level untouched otherwise
inline bool parse_log_level(const std::string& name, LogLevel& out) {
    if (name == "debug") { out = LogLevel::Debug; return true; }
    if (name == "info")  { out = LogLevel::Info;  return true; }
    if (name == "warn")  { out = LogLevel::Warn;  return true; }
    if (name == "error") { out = LogLevel::Error; return true; }
    if (name == "off")   { out = LogLevel::Off;   return true; }
    return false;
}

inline const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        default: return "";
    }
}

inline void log_v(LogLevel level, const char* component, const char* fmt, va_list args) {
    if (!log_enabled(level)) return;

    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&now_time_t, &tm_buf);
    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &tm_buf);

    // Reader thread, dispatcher workers and main thread all log
    static std::mutex mutex;
    std::lock_guard<std::mutex> lock(mutex);
    std::fprintf(stderr, "[%s.%03d][%s][%s] ", time_buf,
                 static_cast<int>(now_ms.count()), log_level_name(level), component);
    std::vfprintf(stderr, fmt, args);
    std::fputc('\n', stderr);
}

#if defined(__GNUC__)
#define DRISHTI_PRINTF_LIKE(fmt_idx, args_idx) __attribute__((format(printf, fmt_idx, args_idx)))
#else
#define DRISHTI_PRINTF_LIKE(fmt_idx, args_idx)
#endif

inline void log_debug(const char* component, const char* fmt, ...) DRISHTI_PRINTF_LIKE(2, 3);
inline void log_info(const char* component, const char* fmt, ...) DRISHTI_PRINTF_LIKE(2, 3);
inline void log_warn(const char* component, const char* fmt, ...) DRISHTI_PRINTF_LIKE(2, 3);
inline void log_error(const char* component, const char* fmt, ...) DRISHTI_PRINTF_LIKE(2, 3);

inline void log_debug(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_v(LogLevel::Debug, component, fmt, args);
    va_end(args);
}

inline void log_info(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_v(LogLevel::Info, component, fmt, args);
    va_end(args);
}

inline void log_warn(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_v(LogLevel::Warn, component, fmt, args);
    va_end(args);
}

inline void log_error(const char* component, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_v(LogLevel::Error, component, fmt, args);
    va_end(args);
}

} // namespace drishti
