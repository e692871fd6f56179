#include "log.h"
#include <atomic>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <mutex>

static std::atomic<int>  log_threshold(LOG_INFO);
static std::atomic<bool> log_timestamps(false);
static std::mutex        log_lock;

void log_set_level(LogLevel level) { log_threshold = (int)level; }
LogLevel log_get_level(void) { return (LogLevel)log_threshold.load(); }
void log_set_timestamps(bool enabled) { log_timestamps = enabled; }

bool log_parse_level(const char* name, LogLevel* out) {
    if (strcmp(name, "debug") == 0) { *out = LOG_DEBUG; return true; }
    if (strcmp(name, "info") == 0)  { *out = LOG_INFO;  return true; }
    if (strcmp(name, "warn") == 0)  { *out = LOG_WARN;  return true; }
    if (strcmp(name, "error") == 0) { *out = LOG_ERROR; return true; }
    return false;
}

static const char* level_tag(LogLevel level) {
    switch (level) {
    case LOG_DEBUG: return "debug: ";
    case LOG_WARN:  return "warning: ";
    case LOG_ERROR: return "error: ";
    default:        return "";
    }
}

void log_message(LogLevel level, const char* fmt, ...) {
    if ((int)level < log_threshold.load()) return;

    char body[1024];
    va_list args;
    va_start(args, fmt);
    vsnprintf(body, sizeof(body), fmt, args);
    va_end(args);

    char stamp[40] = "";
    if (log_timestamps.load()) {
        time_t now = time(nullptr);
        struct tm parts;
#if defined(_WIN32)
        localtime_s(&parts, &now);
#else
        localtime_r(&now, &parts);
#endif
        strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%S ", &parts);
    }

    std::lock_guard<std::mutex> guard(log_lock);
    fprintf(stderr, "%s[luw] %s%s\n", stamp, level_tag(level), body);
    fflush(stderr);
}
