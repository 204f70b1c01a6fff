#ifndef S2S_BRIDGE_LOG_H
#define S2S_BRIDGE_LOG_H

#include <string>

namespace s2s_bridge {

enum class LogLevel {
    DEBUG = 0,
    INFO,
    WARNING,
    ERROR
};

void set_log_level(LogLevel level);
LogLevel log_level();

/* Accepts debug/info/warning/warn/error (any case). Returns false and leaves
 * `out` untouched for anything else. */
bool parse_log_level(const std::string& name, LogLevel& out);

void log_printf(LogLevel level, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;

}

#define S2S_LOG_DEBUG(fmt, ...)   ::s2s_bridge::log_printf(::s2s_bridge::LogLevel::DEBUG, fmt, ##__VA_ARGS__)
#define S2S_LOG_INFO(fmt, ...)    ::s2s_bridge::log_printf(::s2s_bridge::LogLevel::INFO, fmt, ##__VA_ARGS__)
#define S2S_LOG_WARNING(fmt, ...) ::s2s_bridge::log_printf(::s2s_bridge::LogLevel::WARNING, fmt, ##__VA_ARGS__)
#define S2S_LOG_ERROR(fmt, ...)   ::s2s_bridge::log_printf(::s2s_bridge::LogLevel::ERROR, fmt, ##__VA_ARGS__)

#endif
