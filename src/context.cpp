#include "context.h"
#include <cstdlib>
#include <cstring>
#include <unistd.h>

extern char** environ;

static char* copy_string(const char* s) {
    size_t n = strlen(s);
    char* out = (char*)malloc(n + 1);
    memcpy(out, s, n + 1);
    return out;
}

void context_init(ExecContext* ctx, Stream* out, Stream* err) {
    table_init(&ctx->vars);
    table_init(&ctx->env);
    table_init(&ctx->aliases);
    ctx->functions = nullptr;
    ctx->function_count = 0;
    ctx->function_capacity = 0;
    ctx->owned_chunks = nullptr;
    ctx->owned_count = 0;
    ctx->owned_trees = nullptr;
    ctx->tree_count = 0;

    for (char** e = environ; e && *e; e++) {
        const char* eq = strchr(*e, '=');
        if (!eq || eq == *e) continue;
        char* key = (char*)malloc(eq - *e + 1);
        memcpy(key, *e, eq - *e);
        key[eq - *e] = '\0';
        Value v = value_cstring(eq + 1);
        table_set_cstr(&ctx->env, key, v);
        value_decref(v);
        free(key);
    }

    char buf[4096];
    ctx->cwd = copy_string(getcwd(buf, sizeof(buf)) ? buf : "/");
    ctx->script_name = copy_string("luw");
    ctx->argv = nullptr;
    ctx->argc = 0;

    ctx->out = out;
    ctx->err = err;
    ctx->exit_code = 0;
    ctx->debug = false;
    ctx->halt = false;
    ctx->member_timeout_ms = 0;
    ctx->mode = EXEC_INTERPRET;
    ctx->cancel = nullptr;
}

static void free_args(ExecContext* ctx) {
    for (int i = 0; i < ctx->argc; i++) free(ctx->argv[i]);
    free(ctx->argv);
    ctx->argv = nullptr;
    ctx->argc = 0;
}

void context_free(ExecContext* ctx) {
    table_free(&ctx->vars);
    table_free(&ctx->env);
    table_free(&ctx->aliases);
    for (int i = 0; i < ctx->function_count; i++) free(ctx->functions[i].name);
    free(ctx->functions);
    ctx->functions = nullptr;
    ctx->function_count = ctx->function_capacity = 0;
    for (int i = 0; i < ctx->owned_count; i++) {
        chunk_free(ctx->owned_chunks[i]);
        free(ctx->owned_chunks[i]);
    }
    free(ctx->owned_chunks);
    ctx->owned_chunks = nullptr;
    ctx->owned_count = 0;
    for (int i = 0; i < ctx->tree_count; i++) ast_free(ctx->owned_trees[i]);
    free(ctx->owned_trees);
    ctx->owned_trees = nullptr;
    ctx->tree_count = 0;
    free(ctx->cwd);
    free(ctx->script_name);
    ctx->cwd = ctx->script_name = nullptr;
    free_args(ctx);
}

void context_set_args(ExecContext* ctx, const char* script_name, int argc, char** argv) {
    free_args(ctx);
    free(ctx->script_name);
    ctx->script_name = copy_string(script_name ? script_name : "luw");
    ctx->argc = argc;
    ctx->argv = argc > 0 ? (char**)malloc(sizeof(char*) * argc) : nullptr;
    for (int i = 0; i < argc; i++) ctx->argv[i] = copy_string(argv[i]);
}

bool context_cancelled(const ExecContext* ctx) {
    return ctx->cancel && ctx->cancel->load(std::memory_order_relaxed);
}

void context_define_function(ExecContext* ctx, const FunctionDef* def) {
    for (int i = 0; i < ctx->function_count; i++) {
        FunctionDef* f = &ctx->functions[i];
        if (strcmp(f->name, def->name) == 0) {
            f->chunk = def->chunk;
            f->entry = def->entry;
            f->end = def->end;
            f->body = def->body;
            return;
        }
    }
    if (ctx->function_count >= ctx->function_capacity) {
        int cap = ctx->function_capacity < 8 ? 8 : ctx->function_capacity * 2;
        ctx->functions = (FunctionDef*)realloc(ctx->functions, sizeof(FunctionDef) * cap);
        ctx->function_capacity = cap;
    }
    FunctionDef* f = &ctx->functions[ctx->function_count++];
    *f = *def;
    f->name = copy_string(def->name);
}

const FunctionDef* context_find_function(ExecContext* ctx, const char* name) {
    for (int i = 0; i < ctx->function_count; i++) {
        if (strcmp(ctx->functions[i].name, name) == 0) return &ctx->functions[i];
    }
    return nullptr;
}

void context_fork(ExecContext* parent, ExecContext* child, Stream* out, Stream* err) {
    table_clone(&parent->vars, &child->vars);
    table_clone(&parent->env, &child->env);
    table_clone(&parent->aliases, &child->aliases);

    /* compiled bodies are cloned so no constant is shared between threads */
    child->functions = nullptr;
    child->function_count = 0;
    child->function_capacity = 0;
    child->owned_chunks = nullptr;
    child->owned_count = 0;
    child->owned_trees = nullptr;
    child->tree_count = 0;
    const Chunk** originals = nullptr;
    for (int i = 0; i < parent->function_count; i++) {
        FunctionDef def = parent->functions[i];
        if (def.chunk) {
            int found = -1;
            for (int k = 0; k < child->owned_count; k++) {
                if (originals[k] == def.chunk) { found = k; break; }
            }
            if (found < 0) {
                Chunk* copy = (Chunk*)malloc(sizeof(Chunk));
                chunk_clone(def.chunk, copy);
                originals = (const Chunk**)realloc(originals, sizeof(Chunk*) * (child->owned_count + 1));
                child->owned_chunks = (Chunk**)realloc(child->owned_chunks, sizeof(Chunk*) * (child->owned_count + 1));
                originals[child->owned_count] = def.chunk;
                child->owned_chunks[child->owned_count] = copy;
                found = child->owned_count++;
            }
            def.chunk = child->owned_chunks[found];
        }
        context_define_function(child, &def);
    }
    free(originals);

    child->cwd = copy_string(parent->cwd);
    child->script_name = copy_string(parent->script_name);
    child->argc = parent->argc;
    child->argv = parent->argc > 0 ? (char**)malloc(sizeof(char*) * parent->argc) : nullptr;
    for (int i = 0; i < parent->argc; i++) child->argv[i] = copy_string(parent->argv[i]);

    child->out = out;
    child->err = err;
    child->exit_code = parent->exit_code;
    child->debug = parent->debug;
    child->halt = false;
    child->member_timeout_ms = parent->member_timeout_ms;
    child->mode = parent->mode;
    child->cancel = nullptr;
}

void context_adopt_chunk(ExecContext* ctx, Chunk* chunk) {
    ctx->owned_chunks = (Chunk**)realloc(ctx->owned_chunks, sizeof(Chunk*) * (ctx->owned_count + 1));
    ctx->owned_chunks[ctx->owned_count++] = chunk;
}

void context_adopt_tree(ExecContext* ctx, ASTNode* tree) {
    ctx->owned_trees = (ASTNode**)realloc(ctx->owned_trees, sizeof(ASTNode*) * (ctx->tree_count + 1));
    ctx->owned_trees[ctx->tree_count++] = tree;
}

const char* context_getenv(ExecContext* ctx, const char* name) {
    Value v;
    if (table_get_cstr(&ctx->env, name, &v) && IS_STRING(v)) return AS_CSTRING(v);
    return "";
}

void context_setenv(ExecContext* ctx, const char* name, const char* value) {
    Value v = value_cstring(value);
    table_set_cstr(&ctx->env, name, v);
    value_decref(v);
}

char** context_envp(ExecContext* ctx) {
    int count = 0;
    ObjString** keys = table_sorted_keys(&ctx->env, &count);
    char** envp = (char**)malloc(sizeof(char*) * (count + 1));
    for (int i = 0; i < count; i++) {
        Value v;
        table_get(&ctx->env, keys[i], &v);
        char* value = value_to_cstring(v);
        size_t len = keys[i]->length + 1 + strlen(value) + 1;
        envp[i] = (char*)malloc(len);
        snprintf(envp[i], len, "%s=%s", keys[i]->chars, value);
        free(value);
    }
    envp[count] = nullptr;
    free(keys);
    return envp;
}

void context_free_envp(char** envp) {
    for (char** e = envp; e && *e; e++) free(*e);
    free(envp);
}

char* context_resolve_path(ExecContext* ctx, const char* path) {
    if (path[0] == '/') return copy_string(path);
    if (path[0] == '~' && (path[1] == '\0' || path[1] == '/')) {
        const char* home = context_getenv(ctx, "HOME");
        size_t len = strlen(home) + strlen(path);
        char* out = (char*)malloc(len + 1);
        snprintf(out, len + 1, "%s%s", home, path + 1);
        return out;
    }
    size_t len = strlen(ctx->cwd) + 1 + strlen(path);
    char* out = (char*)malloc(len + 1);
    if (strcmp(ctx->cwd, "/") == 0) snprintf(out, len + 1, "/%s", path);
    else snprintf(out, len + 1, "%s/%s", ctx->cwd, path);
    return out;
}
