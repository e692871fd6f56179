#ifndef LUW_CONFIG_H
#define LUW_CONFIG_H

#include "common.h"
#include "log.h"

typedef enum {
    RUN_REPL,
    RUN_SCRIPT,
    RUN_COMPILE,
    RUN_BINARY,
    RUN_VERSION,
    RUN_HELP,
} RunMode;

/* Defaults, then environment, then command line. */
typedef struct {
    RunMode     mode;
    const char* path;
    char**      script_argv;   /* borrowed from main's argv */
    int         script_argc;
    int         member_timeout_ms;
    bool        debug;
    LogLevel    log_level;
    bool        timestamps;
} Config;

void config_init(Config* config);
/* Reads LUW_MEMBER_TIMEOUT_MS, LUW_LOG_LEVEL and TIMESTAMP. */
bool config_from_env(Config* config, char* err, int err_len);
bool config_parse_args(Config* config, int argc, char** argv, char* err, int err_len);

#endif
