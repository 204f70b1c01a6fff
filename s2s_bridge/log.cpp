#include "log.h"
#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <algorithm>
#include <cctype>

namespace s2s_bridge {

static std::atomic<int> g_log_level{static_cast<int>(LogLevel::INFO)};
static std::mutex g_log_mutex;

static const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "S2S-DEBUG";
        case LogLevel::INFO:    return "S2S-INFO";
        case LogLevel::WARNING: return "S2S-WARNING";
        case LogLevel::ERROR:   return "S2S-ERROR";
    }
    return "S2S";
}

void set_log_level(LogLevel level) {
    g_log_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel log_level() {
    return static_cast<LogLevel>(g_log_level.load(std::memory_order_relaxed));
}

bool parse_log_level(const std::string& name, LogLevel& out) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug")                     { out = LogLevel::DEBUG;   return true; }
    if (lower == "info")                      { out = LogLevel::INFO;    return true; }
    if (lower == "warning" || lower == "warn") { out = LogLevel::WARNING; return true; }
    if (lower == "error")                     { out = LogLevel::ERROR;   return true; }
    return false;
}

void log_printf(LogLevel level, const char* fmt, ...) {
    if (static_cast<int>(level) < g_log_level.load(std::memory_order_relaxed)) return;

    char stamp[32];
    std::time_t now = std::time(nullptr);
    struct tm tm_buf;
    localtime_r(&now, &tm_buf);
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm_buf);

    /* one line per call, never interleaved between the loop and ws threads */
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::fprintf(stderr, "%s [%s] ", stamp, level_tag(level));
    va_list args;
    va_start(args, fmt);
    std::vfprintf(stderr, fmt, args);
    va_end(args);
}

}
