#ifndef LUW_SHELL_H
#define LUW_SHELL_H

#include "dispatch.h"

/* Runs `raw` verbatim in the external shell named by `kind`, with the
 * context's environment and working directory. Output is collected into
 * `result`. Returns false (DISPATCH_EXTERNAL_PROCESS_ERROR) only when the
 * process cannot be started; a non-zero exit is a normal result. The child
 * is killed when the context is cancelled. */
bool shell_run(ShellKind kind, const char* raw, ExecContext* ctx, DispatchResult* result, LuwError* err);

const char* shell_name(ShellKind kind);

#endif
