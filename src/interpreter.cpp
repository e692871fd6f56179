#include "interpreter.h"
#include "cluster.h"
#include "dispatch.h"
#include <cstdarg>
#include <cstring>
#include <strings.h>

void interpreter_init(Interpreter* in, ExecContext* ctx) {
    in->ctx = ctx;
    in->state = VM_READY;
    in->depth = 0;
    in->args = nullptr;
    in->argc = 0;
    in->in_function = false;
    in->returning = false;
    in->err = nullptr;
}

static bool fault(Interpreter* in, int line, const char* fmt, ...) {
    char message[512];
    va_list args;
    va_start(args, fmt);
    vsnprintf(message, sizeof(message), fmt, args);
    va_end(args);
    error_set(in->err, ERR_RUNTIME, 0, line, 0, "%s", message);
    in->state = VM_FAILED;
    return false;
}

static bool running(Interpreter* in) {
    return in->state == VM_RUNNING && !in->returning;
}

static char* trim_newlines(char* text) {
    size_t n = strlen(text);
    while (n > 0 && (text[n - 1] == '\n' || text[n - 1] == '\r')) text[--n] = '\0';
    return text;
}

static BinaryOp binary_op(TokenType type) {
    switch (type) {
    case TOKEN_PLUS:          return BIN_ADD;
    case TOKEN_MINUS:         return BIN_SUB;
    case TOKEN_STAR:          return BIN_MUL;
    case TOKEN_SLASH:         return BIN_DIV;
    case TOKEN_PERCENT:       return BIN_MOD;
    case TOKEN_EQUAL_EQUAL:   return BIN_EQ;
    case TOKEN_BANG_EQUAL:    return BIN_NEQ;
    case TOKEN_LESS:          return BIN_LT;
    case TOKEN_GREATER:       return BIN_GT;
    case TOKEN_LESS_EQUAL:    return BIN_LTE;
    default:                  return BIN_GTE;
    }
}

static bool eval(Interpreter* in, const ASTNode* node, Value* out);
static bool exec(Interpreter* in, const ASTNode* node);
static bool exec_call(Interpreter* in, const ASTNode* node, bool capture, Value* out);

static bool eval(Interpreter* in, const ASTNode* node, Value* out) {
    ExecContext* ctx = in->ctx;
    char msg[256];
    switch (node->type) {
    case NODE_INT_LIT:    *out = INT_VAL(node->as.int_literal); return true;
    case NODE_FLOAT_LIT:  *out = FLOAT_VAL(node->as.float_literal); return true;
    case NODE_BOOL_LIT:   *out = BOOL_VAL(node->as.bool_literal); return true;
    case NODE_STRING_LIT:
        *out = value_string(node->as.string_literal.value, node->as.string_literal.length);
        return true;

    case NODE_VARIABLE:
        switch (node->as.variable.kind) {
        case VAR_NAMED: {
            Value v;
            if (!table_get_cstr(&ctx->vars, node->as.variable.name, &v))
                return fault(in, node->line, "undefined variable '%s'", node->as.variable.name);
            value_incref(v);
            *out = v;
            return true;
        }
        case VAR_ENV:
            *out = value_cstring(context_getenv(ctx, node->as.variable.name));
            return true;
        case VAR_STATUS:
            *out = INT_VAL(ctx->exit_code);
            return true;
        case VAR_ARGC:
            *out = INT_VAL(in->in_function ? in->argc : ctx->argc);
            return true;
        case VAR_ARG: {
            int index = node->as.variable.index;
            const char* text;
            if (index == 0) text = ctx->script_name;
            else if (in->in_function) text = index <= in->argc ? in->args[index - 1] : "";
            else text = index <= ctx->argc ? ctx->argv[index - 1] : "";
            *out = value_cstring(text);
            return true;
        }
        }
        return fault(in, node->line, "bad variable");

    case NODE_INTERP: {
        Buffer joined;
        buffer_init(&joined);
        for (int i = 0; i < node->as.interp.count; i++) {
            Value part;
            if (!eval(in, node->as.interp.nodes[i], &part)) {
                buffer_free(&joined);
                return false;
            }
            value_to_buffer(part, &joined);
            value_decref(part);
        }
        int len = joined.length;
        *out = OBJ_VAL(obj_string_take(buffer_take(&joined), len));
        return true;
    }

    case NODE_UNARY: {
        Value a;
        if (!eval(in, node->as.unary.operand, &a)) return false;
        bool ok = true;
        if (node->as.unary.op == TOKEN_MINUS) {
            ok = value_negate(a, out, msg, sizeof(msg));
        } else {
            *out = BOOL_VAL(!value_truthy(a));
        }
        value_decref(a);
        if (!ok) return fault(in, node->line, "%s", msg);
        return true;
    }

    case NODE_BINARY: {
        TokenType op = node->as.binary.op;
        Value a;
        if (!eval(in, node->as.binary.left, &a)) return false;
        if (op == TOKEN_AND || op == TOKEN_OR) {
            bool truthy = value_truthy(a);
            if ((op == TOKEN_AND && !truthy) || (op == TOKEN_OR && truthy)) {
                *out = a;
                return true;
            }
            value_decref(a);
            return eval(in, node->as.binary.right, out);
        }
        Value b;
        if (!eval(in, node->as.binary.right, &b)) {
            value_decref(a);
            return false;
        }
        bool ok = value_binary(binary_op(op), a, b, out, msg, sizeof(msg));
        value_decref(a);
        value_decref(b);
        if (!ok) return fault(in, node->line, "%s", msg);
        return true;
    }

    case NODE_CAPTURE:
        return exec_call(in, node->as.child, true, out);

    default:
        return fault(in, node->line, "statement used where a value is expected");
    }
}

/* Evaluates arguments and flags the way the compiler orders them. */
static bool build_invocation(Interpreter* in, const ASTNode* node, Invocation* call) {
    invocation_init(call, node->as.command.name);
    for (int i = 0; i < node->as.command.args.count; i++) {
        Value v;
        if (!eval(in, node->as.command.args.nodes[i], &v)) return false;
        char* text = value_to_cstring(v);
        invocation_add_arg(call, text);
        free(text);
        value_decref(v);
    }
    for (int i = 0; i < node->as.command.flag_count; i++) {
        Value v;
        if (!eval(in, node->as.command.flag_values[i], &v)) return false;
        char* text = value_to_cstring(v);
        invocation_set_flag(call, node->as.command.flag_names[i], text);
        free(text);
        value_decref(v);
    }
    return true;
}

static bool call_function(Interpreter* in, const ASTNode* node, const FunctionDef* fn,
                          const Invocation* call, bool capture, Value* out) {
    ExecContext* ctx = in->ctx;
    if (in->depth + 1 >= MAX_FRAMES)
        return fault(in, node->line, "call depth exceeded %d calling '%s'", MAX_FRAMES, call->name);

    char** saved_args = in->args;
    int saved_argc = in->argc;
    bool saved_in_function = in->in_function;
    Stream* saved_out = ctx->out;
    Stream* capture_stream = nullptr;
    if (capture) {
        capture_stream = stream_new_capture(nullptr);
        ctx->out = capture_stream;
    }

    in->args = call->args;
    in->argc = call->argc;
    in->in_function = true;
    in->depth++;

    exec(in, fn->body);

    in->depth--;
    in->args = saved_args;
    in->argc = saved_argc;
    in->in_function = saved_in_function;
    in->returning = false;
    ctx->out = saved_out;

    char* text = capture_stream ? trim_newlines(stream_take(capture_stream)) : nullptr;
    stream_free(capture_stream);
    if (in->state != VM_RUNNING) {
        free(text);
        return false;
    }
    if (capture) *out = OBJ_VAL(obj_string_take(text, (int)strlen(text)));
    else *out = INT_VAL(ctx->exit_code);
    return true;
}

static bool exec_call(Interpreter* in, const ASTNode* node, bool capture, Value* out) {
    ExecContext* ctx = in->ctx;
    Invocation call;
    if (!build_invocation(in, node, &call)) {
        invocation_free(&call);
        return false;
    }

    Resolved target;
    if (!dispatch_resolve(ctx, &call, &target, in->err)) {
        in->err->line = node->line;
        in->state = VM_FAILED;
        ctx->exit_code = LUW_EXIT_UNKNOWN_CMD;
        invocation_free(&call);
        return false;
    }
    invocation_free(&call);

    if (target.kind == TARGET_FUNCTION) {
        FunctionDef fn = *target.function;
        bool ok = call_function(in, node, &fn, &target.call, capture, out);
        dispatch_resolved_free(&target);
        return ok;
    }

    DispatchResult result;
    dispatch_result_init(&result);
    dispatch_invoke(ctx, &target, &result);
    Buffer captured;
    buffer_init(&captured);
    dispatch_emit(ctx, &result, capture ? &captured : nullptr);
    ctx->exit_code = result.exit_code;
    dispatch_result_free(&result);
    dispatch_resolved_free(&target);

    if (capture) {
        char* text = trim_newlines(buffer_take(&captured));
        *out = OBJ_VAL(obj_string_take(text, (int)strlen(text)));
    } else {
        buffer_free(&captured);
        *out = INT_VAL(ctx->exit_code);
    }
    if (ctx->halt) {
        /* nothing after `exit` runs, not even the assignment it feeds */
        value_decref(*out);
        in->state = VM_COMPLETED;
        return false;
    }
    if (context_cancelled(ctx)) {
        value_decref(*out);
        return fault(in, node->line, "cancelled");
    }
    return true;
}

static bool exec_cluster(Interpreter* in, const ASTNode* node) {
    int count = node->as.cluster.count;
    ClusterResult* results = (ClusterResult*)malloc(sizeof(ClusterResult) * (count > 0 ? count : 1));
    in->state = VM_SUSPENDED_ON_CLUSTER;
    cluster_run(node->as.cluster.lines, count, in->ctx, EXEC_INTERPRET, in->ctx->member_timeout_ms, results);
    in->state = VM_RUNNING;
    cluster_results_free(results, count);
    free(results);
    if (context_cancelled(in->ctx)) return fault(in, node->line, "cancelled");
    return true;
}

static bool exec_block(Interpreter* in, const ASTNode* node) {
    if (node->type != NODE_BLOCK) return exec(in, node);
    for (int i = 0; i < node->as.block.count && running(in); i++) exec(in, node->as.block.nodes[i]);
    return in->state != VM_FAILED;
}

static bool exec(Interpreter* in, const ASTNode* node) {
    ExecContext* ctx = in->ctx;
    if (context_cancelled(ctx)) return fault(in, node->line, "cancelled");

    switch (node->type) {
    case NODE_PROGRAM:
        for (int i = 0; i < node->as.program.count && running(in); i++) exec(in, node->as.program.nodes[i]);
        return in->state != VM_FAILED;

    case NODE_BLOCK:
        return exec_block(in, node);

    case NODE_COMMAND: {
        Value v;
        if (!exec_call(in, node, false, &v)) return false;
        value_decref(v);
        return true;
    }

    case NODE_CLUSTER:
        return exec_cluster(in, node);

    case NODE_ASSIGN: {
        Value v;
        if (!eval(in, node->as.assign.value, &v)) return false;
        table_set_cstr(&ctx->vars, node->as.assign.name, v);
        value_decref(v);
        return true;
    }

    case NODE_IF: {
        Value cond;
        if (!eval(in, node->as.if_stmt.cond, &cond)) return false;
        bool truthy = value_truthy(cond);
        value_decref(cond);
        if (truthy) return exec_block(in, node->as.if_stmt.then_b);
        if (node->as.if_stmt.else_b) return exec_block(in, node->as.if_stmt.else_b);
        return true;
    }

    case NODE_WHILE:
        while (running(in)) {
            if (context_cancelled(ctx)) return fault(in, node->line, "cancelled");
            Value cond;
            if (!eval(in, node->as.while_stmt.cond, &cond)) return false;
            bool truthy = value_truthy(cond);
            value_decref(cond);
            if (!truthy) break;
            if (!exec_block(in, node->as.while_stmt.body)) return false;
        }
        return in->state != VM_FAILED;

    case NODE_FUNC_DECL: {
        FunctionDef def;
        def.name = node->as.func_decl.name;
        def.chunk = nullptr;
        def.entry = 0;
        def.end = 0;
        def.body = node->as.func_decl.body;
        context_define_function(ctx, &def);
        return true;
    }

    case NODE_RETURN: {
        if (!in->in_function) return fault(in, node->line, "'return' outside a function");
        int code = ctx->exit_code;
        if (node->as.child) {
            Value v;
            if (!eval(in, node->as.child, &v)) return false;
            char message[256];
            bool ok = value_to_exit_code(v, &code, message, sizeof(message));
            if (!ok) fault(in, node->line, "%s", message);
            value_decref(v);
            if (!ok) return false;
        }
        ctx->exit_code = code;
        in->returning = true;
        return true;
    }

    case NODE_DIRECTIVE:
        if (strcasecmp(node->as.directive, "suppressdebug") == 0) ctx->debug = false;
        else if (strcasecmp(node->as.directive, "resumedebug") == 0) ctx->debug = true;
        else return fault(in, node->line, "unknown directive '!%s'", node->as.directive);
        return true;

    default:
        return fault(in, node->line, "expression has no effect");
    }
}

bool interpreter_run(Interpreter* in, const ASTNode* program, LuwError* err) {
    in->err = err;
    error_clear(err);
    in->state = VM_RUNNING;
    in->returning = false;
    exec(in, program);
    if (in->state == VM_RUNNING) in->state = VM_COMPLETED;

    if (in->state == VM_FAILED) {
        if (context_cancelled(in->ctx)) in->ctx->exit_code = LUW_EXIT_TIMEOUT;
        else in->ctx->exit_code = error_exit_code(err);
        return false;
    }
    return true;
}
