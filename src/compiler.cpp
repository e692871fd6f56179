#include "compiler.h"
#include "parser.h"
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <strings.h>

typedef struct {
    Chunk*    chunk;
    LuwError* err;
    bool      had_error;
    int       function_depth;
} Compiler;

static void compile_error(Compiler* c, int line, const char* fmt, const char* detail) {
    if (c->had_error) return;
    c->had_error = true;
    error_set(c->err, ERR_COMPILE, 0, line, 0, fmt, detail);
}

/* ── Helpers ──────────────────────────────────────── */
static void emit_byte(Compiler* c, int line, uint8_t byte) { chunk_write(c->chunk, byte, line); }
static void emit_bytes(Compiler* c, int line, uint8_t a, uint8_t b) { emit_byte(c, line, a); emit_byte(c, line, b); }

static void emit_u16(Compiler* c, int line, uint16_t v) {
    emit_byte(c, line, v & 0xff);
    emit_byte(c, line, (v >> 8) & 0xff);
}

static int emit_jump(Compiler* c, int line, uint8_t op) {
    emit_byte(c, line, op);
    emit_byte(c, line, 0xff);
    emit_byte(c, line, 0xff);
    return c->chunk->count - 2;
}

static void patch_jump(Compiler* c, int offset) {
    int jump = c->chunk->count - offset - 2;
    if (jump > UINT16_MAX) {
        compile_error(c, c->chunk->lines[offset], "%s", "too much code to jump over");
        return;
    }
    c->chunk->code[offset]     = (jump >> 8) & 0xff;
    c->chunk->code[offset + 1] = jump & 0xff;
}

static void emit_loop(Compiler* c, int line, int loop_start) {
    emit_byte(c, line, OP_LOOP);
    int offset = c->chunk->count - loop_start + 2;
    if (offset > UINT16_MAX) compile_error(c, line, "%s", "loop body too large");
    emit_byte(c, line, (offset >> 8) & 0xff);
    emit_byte(c, line, offset & 0xff);
}

static uint16_t make_constant(Compiler* c, int line, Value val) {
    int idx = chunk_add_constant(c->chunk, val);
    if (idx >= MAX_CONSTANTS) {
        compile_error(c, line, "%s", "too many constants in one script");
        return 0;
    }
    return (uint16_t)idx;
}

static uint16_t string_constant(Compiler* c, int line, const char* chars, int length) {
    Value s = value_string(chars, length);
    uint16_t idx = make_constant(c, line, s);
    value_decref(s);
    return idx;
}

static void emit_constant(Compiler* c, int line, Value val) {
    emit_byte(c, line, OP_CONSTANT);
    emit_u16(c, line, make_constant(c, line, val));
}

static void emit_string(Compiler* c, int line, const char* chars, int length) {
    emit_byte(c, line, OP_CONSTANT);
    emit_u16(c, line, string_constant(c, line, chars, length));
}

static void emit_named(Compiler* c, int line, uint8_t op, const char* name) {
    emit_byte(c, line, op);
    emit_u16(c, line, string_constant(c, line, name, (int)strlen(name)));
}

/* ── Compile AST nodes ────────────────────────────── */
static void compile_node(Compiler* c, ASTNode* node);
static void compile_command(Compiler* c, ASTNode* node, uint8_t op);

static void compile_expr(Compiler* c, ASTNode* node) {
    switch (node->type) {
    case NODE_INT_LIT:
        emit_constant(c, node->line, INT_VAL(node->as.int_literal)); break;
    case NODE_FLOAT_LIT:
        emit_constant(c, node->line, FLOAT_VAL(node->as.float_literal)); break;
    case NODE_STRING_LIT:
        emit_string(c, node->line, node->as.string_literal.value, node->as.string_literal.length); break;
    case NODE_BOOL_LIT:
        emit_byte(c, node->line, node->as.bool_literal ? OP_TRUE : OP_FALSE); break;

    case NODE_VARIABLE:
        switch (node->as.variable.kind) {
        case VAR_NAMED:  emit_named(c, node->line, OP_GET_VAR, node->as.variable.name); break;
        case VAR_ENV:    emit_named(c, node->line, OP_GET_ENV, node->as.variable.name); break;
        case VAR_STATUS: emit_byte(c, node->line, OP_GET_STATUS); break;
        case VAR_ARGC:   emit_byte(c, node->line, OP_GET_ARGC); break;
        case VAR_ARG:    emit_bytes(c, node->line, OP_GET_ARG, (uint8_t)node->as.variable.index); break;
        }
        break;

    case NODE_INTERP:
        if (node->as.interp.count > 255) {
            compile_error(c, node->line, "%s", "too many parts in one string");
            return;
        }
        for (int i = 0; i < node->as.interp.count; i++) compile_expr(c, node->as.interp.nodes[i]);
        emit_bytes(c, node->line, OP_CONCAT, (uint8_t)node->as.interp.count);
        break;

    case NODE_UNARY:
        compile_expr(c, node->as.unary.operand);
        emit_byte(c, node->line, node->as.unary.op == TOKEN_MINUS ? OP_NEGATE : OP_NOT);
        break;

    case NODE_BINARY:
        /* Short-circuit AND */
        if (node->as.binary.op == TOKEN_AND) {
            compile_expr(c, node->as.binary.left);
            int end_jump = emit_jump(c, node->line, OP_JUMP_IF_FALSE);
            emit_byte(c, node->line, OP_POP);
            compile_expr(c, node->as.binary.right);
            patch_jump(c, end_jump);
            break;
        }
        /* Short-circuit OR */
        if (node->as.binary.op == TOKEN_OR) {
            compile_expr(c, node->as.binary.left);
            int else_jump = emit_jump(c, node->line, OP_JUMP_IF_FALSE);
            int end_jump = emit_jump(c, node->line, OP_JUMP);
            patch_jump(c, else_jump);
            emit_byte(c, node->line, OP_POP);
            compile_expr(c, node->as.binary.right);
            patch_jump(c, end_jump);
            break;
        }
        compile_expr(c, node->as.binary.left);
        compile_expr(c, node->as.binary.right);
        switch (node->as.binary.op) {
        case TOKEN_PLUS:          emit_byte(c, node->line, OP_ADD); break;
        case TOKEN_MINUS:         emit_byte(c, node->line, OP_SUB); break;
        case TOKEN_STAR:          emit_byte(c, node->line, OP_MUL); break;
        case TOKEN_SLASH:         emit_byte(c, node->line, OP_DIV); break;
        case TOKEN_PERCENT:       emit_byte(c, node->line, OP_MOD); break;
        case TOKEN_EQUAL_EQUAL:   emit_byte(c, node->line, OP_EQ); break;
        case TOKEN_BANG_EQUAL:    emit_byte(c, node->line, OP_NEQ); break;
        case TOKEN_LESS:          emit_byte(c, node->line, OP_LT); break;
        case TOKEN_GREATER:       emit_byte(c, node->line, OP_GT); break;
        case TOKEN_LESS_EQUAL:    emit_byte(c, node->line, OP_LTE); break;
        case TOKEN_GREATER_EQUAL: emit_byte(c, node->line, OP_GTE); break;
        default:
            compile_error(c, node->line, "unsupported operator '%s'", token_type_name(node->as.binary.op));
            break;
        }
        break;

    case NODE_CAPTURE:
        compile_command(c, node->as.child, OP_CAPTURE);
        break;

    default:
        compile_error(c, node->line, "%s", "statement used where a value is expected");
        break;
    }
}

static void compile_command(Compiler* c, ASTNode* node, uint8_t op) {
    int argc = node->as.command.args.count;
    int flagc = node->as.command.flag_count;
    if (argc > MAX_CALL_ARGS) {
        compile_error(c, node->line, "too many arguments to '%s'", node->as.command.name);
        return;
    }
    if (flagc > MAX_CALL_ARGS) {
        compile_error(c, node->line, "too many flags to '%s'", node->as.command.name);
        return;
    }
    for (int i = 0; i < argc; i++) compile_expr(c, node->as.command.args.nodes[i]);
    for (int i = 0; i < flagc; i++) {
        const char* name = node->as.command.flag_names[i];
        emit_string(c, node->line, name, (int)strlen(name));
        compile_expr(c, node->as.command.flag_values[i]);
    }
    emit_named(c, node->line, op, node->as.command.name);
    emit_byte(c, node->line, (uint8_t)argc);
    emit_byte(c, node->line, (uint8_t)flagc);
}

static void compile_block(Compiler* c, ASTNode* block) {
    if (block->type != NODE_BLOCK) {
        compile_node(c, block);
        return;
    }
    for (int i = 0; i < block->as.block.count && !c->had_error; i++)
        compile_node(c, block->as.block.nodes[i]);
}

static void compile_node(Compiler* c, ASTNode* node) {
    switch (node->type) {
    case NODE_PROGRAM:
        for (int i = 0; i < node->as.program.count && !c->had_error; i++)
            compile_node(c, node->as.program.nodes[i]);
        break;

    case NODE_BLOCK:
        compile_block(c, node);
        break;

    case NODE_COMMAND:
        compile_command(c, node, OP_CALL);
        emit_byte(c, node->line, OP_POP);
        break;

    case NODE_CLUSTER: {
        int n = node->as.cluster.count;
        if (n > MAX_CLUSTER_SIZE) {
            compile_error(c, node->line, "%s", "too many members in one !mt line");
            return;
        }
        emit_bytes(c, node->line, OP_SPAWN_CLUSTER, (uint8_t)n);
        for (int i = 0; i < n; i++) {
            const char* line = node->as.cluster.lines[i];
            emit_string(c, node->line, line, (int)strlen(line));
        }
        emit_byte(c, node->line, OP_JOIN_CLUSTER);
    } break;

    case NODE_ASSIGN:
        compile_expr(c, node->as.assign.value);
        emit_named(c, node->line, OP_SET_VAR, node->as.assign.name);
        break;

    case NODE_IF: {
        compile_expr(c, node->as.if_stmt.cond);
        int then_jump = emit_jump(c, node->line, OP_JUMP_IF_FALSE);
        emit_byte(c, node->line, OP_POP); /* pop condition */
        compile_block(c, node->as.if_stmt.then_b);
        int else_jump = emit_jump(c, node->line, OP_JUMP);
        patch_jump(c, then_jump);
        emit_byte(c, node->line, OP_POP);
        if (node->as.if_stmt.else_b) compile_block(c, node->as.if_stmt.else_b);
        patch_jump(c, else_jump);
    } break;

    case NODE_WHILE: {
        int loop_start = c->chunk->count;
        compile_expr(c, node->as.while_stmt.cond);
        int exit_jump = emit_jump(c, node->line, OP_JUMP_IF_FALSE);
        emit_byte(c, node->line, OP_POP);
        compile_block(c, node->as.while_stmt.body);
        emit_loop(c, node->line, loop_start);
        patch_jump(c, exit_jump);
        emit_byte(c, node->line, OP_POP);
    } break;

    case NODE_FUNC_DECL: {
        emit_named(c, node->line, OP_FUNCTION, node->as.func_decl.name);
        int length_at = c->chunk->count;
        emit_u16(c, node->line, 0);
        c->function_depth++;
        compile_block(c, node->as.func_decl.body);
        c->function_depth--;
        /* falling off the end returns the current status */
        emit_byte(c, node->line, OP_GET_STATUS);
        emit_byte(c, node->line, OP_RETURN);
        int length = c->chunk->count - length_at - 2;
        if (length > UINT16_MAX) {
            compile_error(c, node->line, "function '%s' is too large", node->as.func_decl.name);
            return;
        }
        c->chunk->code[length_at]     = length & 0xff;
        c->chunk->code[length_at + 1] = (length >> 8) & 0xff;
    } break;

    case NODE_RETURN:
        if (c->function_depth == 0) {
            compile_error(c, node->line, "%s", "'return' outside a function");
            return;
        }
        if (node->as.child) compile_expr(c, node->as.child);
        else emit_byte(c, node->line, OP_GET_STATUS);
        emit_byte(c, node->line, OP_RETURN);
        break;

    case NODE_DIRECTIVE:
        if (strcasecmp(node->as.directive, "suppressdebug") == 0) {
            emit_bytes(c, node->line, OP_SET_DEBUG, 0);
        } else if (strcasecmp(node->as.directive, "resumedebug") == 0) {
            emit_bytes(c, node->line, OP_SET_DEBUG, 1);
        } else {
            compile_error(c, node->line, "unknown directive '!%s'", node->as.directive);
        }
        break;

    default:
        /* a bare expression is not a statement */
        compile_error(c, node->line, "%s", "expression has no effect");
        break;
    }
}

bool compiler_compile(ASTNode* program, Chunk* out, LuwError* err) {
    Compiler c;
    c.chunk = out;
    c.err = err;
    c.had_error = false;
    c.function_depth = 0;

    chunk_init(out);
    compile_node(&c, program);
    emit_byte(&c, 0, OP_HALT);

    if (c.had_error) {
        chunk_free(out);
        return false;
    }
#ifdef DEBUG_PRINT_BYTECODE
    chunk_disassemble(out, "script", stderr);
#endif
    return true;
}

bool compile_source(const char* source, Chunk* out, LuwError* err) {
    ASTNode* program = parse_source(source, err);
    if (!program) {
        chunk_init(out);
        return false;
    }
    bool ok = compiler_compile(program, out, err);
    ast_free(program);
    return ok;
}
