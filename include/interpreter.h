#ifndef LUW_INTERPRETER_H
#define LUW_INTERPRETER_H

#include "ast.h"
#include "context.h"
#include "error.h"
#include "vm.h"

/* Walks the tree directly. Shares the VM's states, value operations and
 * dispatcher, so a program behaves the same in both modes. */
typedef struct {
    ExecContext* ctx;
    VMState      state;
    int          depth;        /* active function calls */
    char**       args;         /* positional arguments of the innermost function */
    int          argc;
    bool         in_function;
    bool         returning;
    LuwError*    err;
} Interpreter;

void interpreter_init(Interpreter* in, ExecContext* ctx);

/* Same contract as vm_run. `program` must outlive the context or be adopted by it. */
bool interpreter_run(Interpreter* in, const ASTNode* program, LuwError* err);

#endif
