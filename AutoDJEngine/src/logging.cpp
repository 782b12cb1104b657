#include "logging.h"

#include <atomic>
#include <cstdarg>
#include <ctime>
#include <mutex>

namespace autodj {

namespace {

std::atomic<int> g_log_level{static_cast<int>(LogLevel::Warn)};

std::mutex g_log_mutex;
FILE* g_log_file = nullptr;  // nullptr = stderr

const char* levelTag(LogLevel level) {
    switch (level) {
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Info: return "INFO";
        case LogLevel::Debug: return "DEBUG";
    }
    return "?";
}

} // namespace

void setLogLevel(LogLevel level) {
    g_log_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

bool setLogFile(const char* filepath) {
    std::lock_guard<std::mutex> lock(g_log_mutex);

    if (g_log_file) {
        fclose(g_log_file);
        g_log_file = nullptr;
    }

    if (!filepath || filepath[0] == '\0') {
        return true;
    }

    g_log_file = fopen(filepath, "a");
    return g_log_file != nullptr;
}

bool shouldLog(LogLevel level) {
    return static_cast<int>(level) <= g_log_level.load(std::memory_order_relaxed);
}

void logMessage(LogLevel level, const char* format, ...) {
    char timestamp[32] = {0};
    std::time_t now = std::time(nullptr);
    std::tm tm_now;
#ifdef _WIN32
    const bool have_time = localtime_s(&tm_now, &now) == 0;
#else
    const bool have_time = localtime_r(&now, &tm_now) != nullptr;
#endif
    if (have_time) {
        std::strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &tm_now);
    }

    std::lock_guard<std::mutex> lock(g_log_mutex);
    FILE* out = g_log_file ? g_log_file : stderr;

    fprintf(out, "%s [AutoDJ][%s] ", timestamp, levelTag(level));

    va_list args;
    va_start(args, format);
    vfprintf(out, format, args);
    va_end(args);

    fputc('\n', out);
    fflush(out);
}

} // namespace autodj
