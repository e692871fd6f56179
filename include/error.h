#ifndef LUW_ERROR_H
#define LUW_ERROR_H

#include "common.h"

typedef enum {
    ERR_NONE = 0,
    ERR_LEX,
    ERR_PARSE,
    ERR_COMPILE,
    ERR_FORMAT,
    ERR_DISPATCH,
    ERR_RUNTIME,
} ErrorKind;

/* FormatError codes */
typedef enum {
    FORMAT_BAD_MAGIC = 1,
    FORMAT_UNSUPPORTED_VERSION,
    FORMAT_TRUNCATED,
    FORMAT_CHECKSUM_MISMATCH,
    FORMAT_INVALID_PROGRAM,
    FORMAT_IO_ERROR,
} FormatErrorCode;

/* DispatchError codes */
typedef enum {
    DISPATCH_UNKNOWN_COMMAND = 1,
    DISPATCH_EXTERNAL_PROCESS_ERROR,
} DispatchErrorCode;

typedef struct {
    ErrorKind kind;
    int       code;         /* FormatErrorCode / DispatchErrorCode, 0 otherwise */
    int       line;         /* 0 when unknown */
    int       column;
    char      unexpected;   /* LexError: offending character */
    char      message[512];
} LuwError;

void        error_clear(LuwError* err);
void        error_set(LuwError* err, ErrorKind kind, int code, int line, int column, const char* fmt, ...);
const char* error_kind_name(ErrorKind kind);
const char* format_error_name(int code);
/* Prints "<file>:<line>:<col>: <Kind>Error: <message>" to `out`. */
void        error_print(const LuwError* err, const char* file, FILE* out);
void        error_format(const LuwError* err, const char* file, char* out, int out_len);
/* Exit code used by the driver when an error of this kind ends the run. */
int         error_exit_code(const LuwError* err);

#endif
