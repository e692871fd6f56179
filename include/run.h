#ifndef LUW_RUN_H
#define LUW_RUN_H

#include "chunk.h"
#include "context.h"
#include "error.h"

/* Lexes and parses `source`, then either walks the tree or compiles and runs
 * the bytecode. Nothing executes unless the whole source builds. Returns
 * false on a build error or fault; the run's exit code is ctx->exit_code. */
bool run_source(ExecContext* ctx, const char* source, ExecMode mode, LuwError* err);

/* Runs an already compiled program. `chunk` must outlive `ctx`. */
bool run_chunk(ExecContext* ctx, const Chunk* chunk, LuwError* err);

/* Exit code the driver reports for a finished run. */
int  run_exit_code(const ExecContext* ctx, bool ok, const LuwError* err);

#endif
