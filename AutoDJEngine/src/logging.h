#ifndef AUTODJ_LOGGING_H
#define AUTODJ_LOGGING_H

#include <cstdio>

namespace autodj {

// Error: the requested operation failed.
// Warn:  recoverable problem (skipped track, clamped setting, fallback).
// Info:  lifecycle (imports, transitions, party start/stop).
// Debug: per-transition numbers and other traces.
enum class LogLevel {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3
};

void setLogLevel(LogLevel level);

// Append log lines to `filepath`. nullptr or "" logs to stderr again.
bool setLogFile(const char* filepath);

bool shouldLog(LogLevel level);

#if defined(__GNUC__) || defined(__clang__)
__attribute__((format(printf, 2, 3)))
#endif
void logMessage(LogLevel level, const char* format, ...);

} // namespace autodj

#define AUTODJ_LOG(level, ...)                          \
    do {                                                \
        if (::autodj::shouldLog(level)) {               \
            ::autodj::logMessage(level, __VA_ARGS__);   \
        }                                               \
    } while (0)

#define AUTODJ_LOG_ERROR(...) AUTODJ_LOG(::autodj::LogLevel::Error, __VA_ARGS__)
#define AUTODJ_LOG_WARN(...) AUTODJ_LOG(::autodj::LogLevel::Warn, __VA_ARGS__)
#define AUTODJ_LOG_INFO(...) AUTODJ_LOG(::autodj::LogLevel::Info, __VA_ARGS__)
#define AUTODJ_LOG_DEBUG(...) AUTODJ_LOG(::autodj::LogLevel::Debug, __VA_ARGS__)

#endif // AUTODJ_LOGGING_H
