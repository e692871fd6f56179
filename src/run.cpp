#include "run.h"
#include "compiler.h"
#include "interpreter.h"
#include "log.h"
#include "parser.h"
#include "vm.h"

static bool tree_defines_functions(const ASTNode* node) {
    if (!node) return false;
    switch (node->type) {
    case NODE_FUNC_DECL:
        return true;
    case NODE_PROGRAM:
        for (int i = 0; i < node->as.program.count; i++)
            if (tree_defines_functions(node->as.program.nodes[i])) return true;
        return false;
    case NODE_BLOCK:
        for (int i = 0; i < node->as.block.count; i++)
            if (tree_defines_functions(node->as.block.nodes[i])) return true;
        return false;
    case NODE_IF:
        return tree_defines_functions(node->as.if_stmt.then_b) || tree_defines_functions(node->as.if_stmt.else_b);
    case NODE_WHILE:
        return tree_defines_functions(node->as.while_stmt.body);
    default:
        return false;
    }
}

static bool chunk_defines_functions(const Chunk* chunk) {
    for (int offset = 0; offset < chunk->count;) {
        if (chunk->code[offset] == OP_FUNCTION) return true;
        int width = instruction_width(chunk->code[offset]);
        if (width == 0) return false;
        offset += width;
    }
    return false;
}

bool run_chunk(ExecContext* ctx, const Chunk* chunk, LuwError* err) {
    VM* vm = (VM*)malloc(sizeof(VM));
    vm_init(vm, ctx);
    ctx->mode = EXEC_COMPILED;
    bool ok = vm_run(vm, chunk, err);
    vm_free(vm);
    free(vm);
    return ok;
}

bool run_source(ExecContext* ctx, const char* source, ExecMode mode, LuwError* err) {
    error_clear(err);
    ASTNode* program = parse_source(source, err);
    if (!program) {
        ctx->exit_code = error_exit_code(err);
        return false;
    }

    /* compiling first surfaces compile errors before anything runs in either mode */
    Chunk* chunk = (Chunk*)malloc(sizeof(Chunk));
    if (!compiler_compile(program, chunk, err)) {
        free(chunk);
        ast_free(program);
        ctx->exit_code = error_exit_code(err);
        return false;
    }

    bool ok;
    if (mode == EXEC_COMPILED) {
        ast_free(program);
        ok = run_chunk(ctx, chunk, err);
        if (chunk_defines_functions(chunk)) {
            context_adopt_chunk(ctx, chunk);
        } else {
            chunk_free(chunk);
            free(chunk);
        }
    } else {
        chunk_free(chunk);
        free(chunk);
        Interpreter in;
        interpreter_init(&in, ctx);
        ctx->mode = EXEC_INTERPRET;
        ok = interpreter_run(&in, program, err);
        if (tree_defines_functions(program)) context_adopt_tree(ctx, program);
        else ast_free(program);
    }
    return ok;
}

int run_exit_code(const ExecContext* ctx, bool ok, const LuwError* err) {
    if (!ok && ctx->exit_code == 0) return error_exit_code(err);
    return ctx->exit_code;
}
