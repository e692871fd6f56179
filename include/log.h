#ifndef LUW_LOG_H
#define LUW_LOG_H

#include "common.h"

typedef enum {
    LOG_DEBUG = 0,
    LOG_INFO,
    LOG_WARN,
    LOG_ERROR,
} LogLevel;

void     log_set_level(LogLevel level);
LogLevel log_get_level(void);
void     log_set_timestamps(bool enabled);
bool     log_parse_level(const char* name, LogLevel* out);

/* Writes "[luw] <message>" to stderr when `level` passes the threshold.
 * Safe to call from cluster worker threads. */
void log_message(LogLevel level, const char* fmt, ...);

#endif
