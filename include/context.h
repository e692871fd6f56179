#ifndef LUW_CONTEXT_H
#define LUW_CONTEXT_H

#include "ast.h"
#include "chunk.h"
#include "stream.h"
#include "table.h"
#include <atomic>

typedef enum {
    EXEC_INTERPRET,   /* walk the AST */
    EXEC_COMPILED,    /* run bytecode */
} ExecMode;

/* A user function. Exactly one of `chunk` / `body` is set. */
typedef struct {
    char*          name;
    const Chunk*   chunk;   /* body is code[entry, end) */
    int            entry;
    int            end;
    const ASTNode* body;
} FunctionDef;

/* Everything a run may observe or change. Owned by one run on one thread;
 * cluster members get a deep copy (context_fork). */
typedef struct ExecContext {
    Table              vars;
    Table              env;
    Table              aliases;

    FunctionDef*       functions;
    int                function_count;
    int                function_capacity;
    Chunk**            owned_chunks;      /* programs whose functions are still defined */
    int                owned_count;
    ASTNode**          owned_trees;
    int                tree_count;

    char*              cwd;
    char*              script_name;       /* $0 */
    char**             argv;              /* $1 .. */
    int                argc;

    Stream*            out;
    Stream*            err;
    int                exit_code;         /* $? */
    bool               debug;
    bool               halt;              /* set by `exit` */
    int                member_timeout_ms; /* 0 = wait forever */
    ExecMode           mode;
    std::atomic<bool>* cancel;            /* may be null */
} ExecContext;

/* Environment copied from the process, cwd from getcwd(). Streams are borrowed. */
void context_init(ExecContext* ctx, Stream* out, Stream* err);
void context_free(ExecContext* ctx);
/* Deep copy of `parent` writing to `out` / `err`. Nothing is shared with the parent. */
void context_fork(ExecContext* parent, ExecContext* child, Stream* out, Stream* err);

void context_set_args(ExecContext* ctx, const char* script_name, int argc, char** argv);
bool context_cancelled(const ExecContext* ctx);

void               context_define_function(ExecContext* ctx, const FunctionDef* def);
const FunctionDef* context_find_function(ExecContext* ctx, const char* name);

/* Keeps a program alive as long as the context; takes ownership. */
void               context_adopt_chunk(ExecContext* ctx, Chunk* chunk);
void               context_adopt_tree(ExecContext* ctx, ASTNode* tree);

/* Environment lookup; returns "" when unset. */
const char* context_getenv(ExecContext* ctx, const char* name);
void        context_setenv(ExecContext* ctx, const char* name, const char* value);
/* Builds a NULL-terminated "K=V" array for execve; free with context_free_envp. */
char**      context_envp(ExecContext* ctx);
void        context_free_envp(char** envp);

/* Resolves `path` against ctx->cwd; caller frees. */
char*       context_resolve_path(ExecContext* ctx, const char* path);

#endif
