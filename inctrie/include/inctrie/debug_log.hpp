#ifndef INCTRIE_DEBUG_LOG_HPP
#define INCTRIE_DEBUG_LOG_HPP

#include <atomic>
#include <cstdarg>
#include <cstdio>

namespace inctrie {
namespace debug {

enum class LogLevel {
    DEBUG,
    WARNING
};

// Callback function type for log output routing
// The callback receives the level and a formatted string (no newline at end)
using LogCallback = void (*)(LogLevel level, const char* message);

// Global log callback - set by an embedding application or a test
// When null, DEBUG messages go to stdout and WARNING messages to stderr
inline std::atomic<LogCallback> g_log_callback{nullptr};

inline void set_log_callback(LogCallback cb) {
    g_log_callback.store(cb, std::memory_order_release);
}

inline void clear_log_callback() {
    g_log_callback.store(nullptr, std::memory_order_release);
}

inline const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::WARNING: return "WARNING";
    }
    return "?";
}

// Internal: format and output a message
inline void log_output(LogLevel level, const char* fmt, ...) {
    char buffer[1024];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);

    char full_message[1100];
    snprintf(full_message, sizeof(full_message), "[inctrie][%s] %s", level_tag(level), buffer);

    LogCallback cb = g_log_callback.load(std::memory_order_acquire);
    if (cb) {
        cb(level, full_message);
    } else if (level == LogLevel::WARNING) {
        fprintf(stderr, "%s\n", full_message);
        fflush(stderr);
    } else {
        printf("%s\n", full_message);
        fflush(stdout);
    }
}

} // namespace debug
} // namespace inctrie

// Debug logging macro - compiled out unless ENABLE_DEBUG_OUTPUT is defined
#ifdef ENABLE_DEBUG_OUTPUT
    #define DEBUG_LOG(fmt, ...) ::inctrie::debug::log_output(::inctrie::debug::LogLevel::DEBUG, fmt, ##__VA_ARGS__)
#else
    #define DEBUG_LOG(fmt, ...) ((void)0)
#endif

// Warnings are always on
#define WARN_LOG(fmt, ...) ::inctrie::debug::log_output(::inctrie::debug::LogLevel::WARNING, fmt, ##__VA_ARGS__)

#endif // INCTRIE_DEBUG_LOG_HPP
