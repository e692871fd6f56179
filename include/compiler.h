#ifndef LUW_COMPILER_H
#define LUW_COMPILER_H

#include "ast.h"
#include "chunk.h"
#include "error.h"

/* Lowers `program` into `out` (initialized here). Deterministic: the same
 * tree always yields the same bytes. On failure `out` is left empty and
 * `err` holds a CompileError. */
bool compiler_compile(ASTNode* program, Chunk* out, LuwError* err);

/* Lex, parse and compile in one step. */
bool compile_source(const char* source, Chunk* out, LuwError* err);

#endif
