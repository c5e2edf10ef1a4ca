#include "blindlink/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstdarg>
#include <mutex>

namespace blindlink {

LogLevel g_log_level = LogLevel::INFO;
LogCategories g_log_categories;
std::chrono::steady_clock::time_point g_log_start_time = std::chrono::steady_clock::now();

namespace {

std::mutex g_log_mutex;
FILE* g_log_file = nullptr;

const char* levelTag(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
        default:              return "     ";
    }
}

} // namespace

void setLogLevel(LogLevel level) {
    g_log_level = level;
}

LogLevel getLogLevel() {
    return g_log_level;
}

void setLogFile(FILE* file) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_file = file;
}

const char* logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::NONE:  return "NONE";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
        default: return "UNKNOWN";
    }
}

LogLevel stringToLogLevel(const std::string& str) {
    std::string upper = str;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "NONE" || upper == "OFF") return LogLevel::NONE;
    if (upper == "ERROR") return LogLevel::ERROR;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "TRACE") return LogLevel::TRACE;
    return LogLevel::INFO;
}

void log(LogLevel level, const char* category, const char* fmt, ...) {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - g_log_start_time).count();
    int secs = static_cast<int>(elapsed / 1000);
    int ms = static_cast<int>(elapsed % 1000);

    char buf[1024];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);

    std::lock_guard<std::mutex> lock(g_log_mutex);
    fprintf(stderr, "[%3d.%03d][%s][%-6s] %s\n", secs, ms, levelTag(level),
            category ? category : "", buf);
    if (g_log_file) {
        fprintf(g_log_file, "[%3d.%03d][%s][%-6s] %s\n", secs, ms, levelTag(level),
                category ? category : "", buf);
        fflush(g_log_file);
    }
}

} // namespace blindlink
