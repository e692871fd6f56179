#ifndef LUW_COMMON_H
#define LUW_COMMON_H

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <stdint.h>
#include <stdbool.h>
#include <stdarg.h>
#include <ctype.h>

#define LUW_VERSION "0.3.0"

#define MAX_STACK        1024
#define MAX_FRAMES       256
#define MAX_CONSTANTS    65536
#define MAX_CALL_ARGS    255
#define MAX_ALIAS_DEPTH  5
#define MAX_CLUSTER_SIZE 255
#define MAX_SLEEP_SECONDS 1e9   /* longer sleeps are clamped */

/* Process exit codes */
#define LUW_EXIT_OK             0
#define LUW_EXIT_USAGE          64
#define LUW_EXIT_BUILD_ERROR    65   /* lex, parse, compile or bytecode format */
#define LUW_EXIT_NO_INPUT       66
#define LUW_EXIT_RUNTIME_FAULT  70
#define LUW_EXIT_TIMEOUT        124
#define LUW_EXIT_UNKNOWN_CMD    127

/* External shell targeted by a passthrough command */
typedef enum {
    SHELL_NONE = 0,
    SHELL_PWSH,
    SHELL_CMD,
} ShellKind;

// Uncomment for debug output
// #define DEBUG_TRACE_EXECUTION
// #define DEBUG_PRINT_BYTECODE

#endif
