#include "config.h"
#include <cstring>

void config_init(Config* config) {
    config->mode = RUN_REPL;
    config->path = nullptr;
    config->script_argv = nullptr;
    config->script_argc = 0;
    config->member_timeout_ms = 0;
    config->debug = false;
    config->log_level = LOG_WARN;
    config->timestamps = false;
}

static bool parse_timeout(const char* text, int* out) {
    char* end;
    long ms = strtol(text, &end, 10);
    if (end == text || *end != '\0' || ms < 0 || ms > 86400000L) return false;
    *out = (int)ms;
    return true;
}

bool config_from_env(Config* config, char* err, int err_len) {
    const char* timeout = getenv("LUW_MEMBER_TIMEOUT_MS");
    if (timeout && *timeout && !parse_timeout(timeout, &config->member_timeout_ms)) {
        snprintf(err, err_len, "LUW_MEMBER_TIMEOUT_MS: '%s' is not a number of milliseconds", timeout);
        return false;
    }
    const char* level = getenv("LUW_LOG_LEVEL");
    if (level && *level && !log_parse_level(level, &config->log_level)) {
        snprintf(err, err_len, "LUW_LOG_LEVEL: unknown level '%s'", level);
        return false;
    }
    const char* stamp = getenv("TIMESTAMP");
    config->timestamps = stamp && strcmp(stamp, "1") == 0;
    return true;
}

static bool set_mode(Config* config, RunMode mode, const char* flag, char* err, int err_len) {
    if (config->mode != RUN_REPL) {
        snprintf(err, err_len, "%s cannot be combined with another mode", flag);
        return false;
    }
    config->mode = mode;
    return true;
}

bool config_parse_args(Config* config, int argc, char** argv, char* err, int err_len) {
    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];
        RunMode mode = RUN_REPL;
        if (strcmp(arg, "--script") == 0) mode = RUN_SCRIPT;
        else if (strcmp(arg, "--compile") == 0) mode = RUN_COMPILE;
        else if (strcmp(arg, "--binary") == 0) mode = RUN_BINARY;

        if (mode != RUN_REPL) {
            if (!set_mode(config, mode, arg, err, err_len)) return false;
            if (i + 1 >= argc) {
                snprintf(err, err_len, "%s needs a file", arg);
                return false;
            }
            config->path = argv[++i];
            /* everything after the file belongs to the script */
            if (mode != RUN_COMPILE) {
                config->script_argv = argv + i + 1;
                config->script_argc = argc - i - 1;
                return true;
            }
            continue;
        }

        if (strcmp(arg, "--timeout") == 0) {
            if (i + 1 >= argc || !parse_timeout(argv[i + 1], &config->member_timeout_ms)) {
                snprintf(err, err_len, "--timeout needs a number of milliseconds");
                return false;
            }
            i++;
        } else if (strcmp(arg, "--log-level") == 0) {
            if (i + 1 >= argc || !log_parse_level(argv[i + 1], &config->log_level)) {
                snprintf(err, err_len, "--log-level needs one of debug, info, warn, error");
                return false;
            }
            i++;
        } else if (strcmp(arg, "--debug") == 0) {
            config->debug = true;
        } else if (strcmp(arg, "--version") == 0) {
            if (!set_mode(config, RUN_VERSION, arg, err, err_len)) return false;
        } else if (strcmp(arg, "--help") == 0 || strcmp(arg, "-h") == 0) {
            if (!set_mode(config, RUN_HELP, arg, err, err_len)) return false;
        } else {
            snprintf(err, err_len, "unknown option '%s'", arg);
            return false;
        }
    }
    return true;
}
