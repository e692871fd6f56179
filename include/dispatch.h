#ifndef LUW_DISPATCH_H
#define LUW_DISPATCH_H

#include "context.h"
#include "error.h"

/* One command invocation: all strings are owned. */
typedef struct {
    char*  name;
    char** args;
    int    argc;
    char** flag_names;    /* insertion ordered, unique */
    char** flag_values;
    int    flagc;
} Invocation;

typedef struct {
    Buffer out;
    Buffer err;
    int    exit_code;
} DispatchResult;

typedef bool (*BuiltinFn)(ExecContext* ctx, const Invocation* call, DispatchResult* result);

typedef struct {
    const char* name;
    BuiltinFn   fn;
    const char* summary;
} Builtin;

typedef enum {
    TARGET_BUILTIN,
    TARGET_FUNCTION,     /* executed by the caller (VM or interpreter) */
    TARGET_PASSTHROUGH,
} TargetKind;

typedef struct {
    TargetKind         kind;
    const Builtin*     builtin;
    const FunctionDef* function;
    ShellKind          shell;
    Invocation         call;   /* after alias expansion */
} Resolved;

void invocation_init(Invocation* call, const char* name);
void invocation_free(Invocation* call);
void invocation_add_arg(Invocation* call, const char* arg);
/* Last write wins; a repeated name keeps its first slot. */
void invocation_set_flag(Invocation* call, const char* name, const char* value);
/* Returns the flag value, or nullptr when the flag is absent. */
const char* invocation_flag(const Invocation* call, const char* name);
void invocation_copy(const Invocation* from, Invocation* to);

void dispatch_result_init(DispatchResult* result);
void dispatch_result_free(DispatchResult* result);

/* Alias expansion, then built-in, user function, passthrough. An unknown
 * name fails with DISPATCH_UNKNOWN_COMMAND and leaves `ctx` untouched.
 * On success `out->call` must be released with dispatch_resolved_free. */
bool dispatch_resolve(ExecContext* ctx, const Invocation* call, Resolved* out, LuwError* err);
void dispatch_resolved_free(Resolved* resolved);

/* Runs a built-in or passthrough target. A passthrough that cannot be
 * started reports exit code 127 and a message on `result->err`. */
void dispatch_invoke(ExecContext* ctx, const Resolved* resolved, DispatchResult* result);

/* Writes a result to the context streams. When `captured` is non-null the
 * stdout part goes there instead. */
void dispatch_emit(ExecContext* ctx, DispatchResult* result, Buffer* captured);

#endif
