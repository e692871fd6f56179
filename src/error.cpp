#include "error.h"
#include <cstdio>
#include <cstring>

void error_clear(LuwError* err) {
    memset(err, 0, sizeof(LuwError));
}

void error_set(LuwError* err, ErrorKind kind, int code, int line, int column, const char* fmt, ...) {
    err->kind = kind;
    err->code = code;
    err->line = line;
    err->column = column;
    va_list args;
    va_start(args, fmt);
    vsnprintf(err->message, sizeof(err->message), fmt, args);
    va_end(args);
}

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ERR_NONE:     return "No";
    case ERR_LEX:      return "Lex";
    case ERR_PARSE:    return "Parse";
    case ERR_COMPILE:  return "Compile";
    case ERR_FORMAT:   return "Format";
    case ERR_DISPATCH: return "Dispatch";
    case ERR_RUNTIME:  return "Runtime";
    }
    return "?";
}

const char* format_error_name(int code) {
    switch (code) {
    case FORMAT_BAD_MAGIC:           return "bad-magic";
    case FORMAT_UNSUPPORTED_VERSION: return "unsupported-version";
    case FORMAT_TRUNCATED:           return "truncated";
    case FORMAT_CHECKSUM_MISMATCH:   return "checksum-mismatch";
    case FORMAT_INVALID_PROGRAM:     return "invalid-program";
    case FORMAT_IO_ERROR:            return "io-error";
    }
    return "unknown";
}

void error_format(const LuwError* err, const char* file, char* out, int out_len) {
    const char* tag = err->kind == ERR_RUNTIME ? "Fault" : "Error";
    const char* where = file ? file : "<input>";
    if (err->line > 0 && err->column > 0)
        snprintf(out, out_len, "%s:%d:%d: %s%s: %s", where, err->line, err->column,
                 error_kind_name(err->kind), tag, err->message);
    else if (err->line > 0)
        snprintf(out, out_len, "%s:%d: %s%s: %s", where, err->line,
                 error_kind_name(err->kind), tag, err->message);
    else
        snprintf(out, out_len, "%s: %s%s: %s", where,
                 error_kind_name(err->kind), tag, err->message);
}

void error_print(const LuwError* err, const char* file, FILE* out) {
    char buf[1024];
    error_format(err, file, buf, sizeof(buf));
    fprintf(out, "%s\n", buf);
}

int error_exit_code(const LuwError* err) {
    switch (err->kind) {
    case ERR_LEX: case ERR_PARSE: case ERR_COMPILE: case ERR_FORMAT:
        return LUW_EXIT_BUILD_ERROR;
    case ERR_DISPATCH:
        return err->code == DISPATCH_UNKNOWN_COMMAND ? LUW_EXIT_UNKNOWN_CMD : LUW_EXIT_RUNTIME_FAULT;
    case ERR_RUNTIME:
        return LUW_EXIT_RUNTIME_FAULT;
    case ERR_NONE:
        return LUW_EXIT_OK;
    }
    return LUW_EXIT_RUNTIME_FAULT;
}
