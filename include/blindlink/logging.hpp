#pragma once

#include <chrono>
#include <cstdio>
#include <string>

// Windows headers define ERROR, which breaks the LOG_*(ERROR, ...) macros
#ifdef ERROR
#undef ERROR
#endif

namespace blindlink {

enum class LogLevel : int {
    NONE = 0,
    ERROR = 1,
    WARN = 2,
    INFO = 3,
    DEBUG = 4,
    TRACE = 5,
};

// Per-category switches, all on by default
struct LogCategories {
    bool link = true;     // Connection lifecycle, coalescing, idle timer
    bool cmd = true;      // Command frames and write retries
    bool notify = true;   // Notification decoding and event dispatch
    bool sim = true;      // Simulated peripheral
};

extern LogLevel g_log_level;
extern LogCategories g_log_categories;
extern std::chrono::steady_clock::time_point g_log_start_time;

void setLogLevel(LogLevel level);
LogLevel getLogLevel();

// Mirror all log output to an already-open file (nullptr = stderr only)
void setLogFile(FILE* file);

const char* logLevelToString(LogLevel level);
LogLevel stringToLogLevel(const std::string& str);

#if defined(__GNUC__) || defined(__clang__)
void log(LogLevel level, const char* category, const char* fmt, ...)
    __attribute__((format(printf, 3, 4)));
#else
void log(LogLevel level, const char* category, const char* fmt, ...);
#endif

} // namespace blindlink

#define BLINDLINK_LOG(flag, category, level, ...)                                   \
    do {                                                                            \
        if (::blindlink::g_log_level >= ::blindlink::LogLevel::level &&             \
            ::blindlink::g_log_categories.flag) {                                   \
            ::blindlink::log(::blindlink::LogLevel::level, category, __VA_ARGS__);  \
        }                                                                           \
    } while (0)

#define LOG_LINK(level, ...)   BLINDLINK_LOG(link, "LINK", level, __VA_ARGS__)
#define LOG_CMD(level, ...)    BLINDLINK_LOG(cmd, "CMD", level, __VA_ARGS__)
#define LOG_NOTIFY(level, ...) BLINDLINK_LOG(notify, "NOTIFY", level, __VA_ARGS__)
#define LOG_SIM(level, ...)    BLINDLINK_LOG(sim, "SIM", level, __VA_ARGS__)
