#include "vm.h"
#include "cluster.h"
#include "dispatch.h"
#include "log.h"
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>

void vm_init(VM* vm, ExecContext* ctx) {
    vm->ctx = ctx;
    vm->state = VM_READY;
    vm->frame_count = 0;
    vm->stack_top = vm->stack;
    vm->pending_members = 0;
    vm->err = nullptr;
}

const char* vm_state_name(VMState state) {
    switch (state) {
    case VM_READY:                return "ready";
    case VM_RUNNING:              return "running";
    case VM_SUSPENDED_ON_CLUSTER: return "suspended-on-cluster";
    case VM_COMPLETED:            return "completed";
    case VM_FAILED:               return "failed";
    }
    return "?";
}

static void free_args(char** args, int argc) {
    for (int i = 0; i < argc; i++) free(args[i]);
    free(args);
}

/* Drops every frame and stack value; restores the output stream replaced by captures. */
static void unwind(VM* vm) {
    while (vm->frame_count > 0) {
        CallFrame* frame = &vm->frames[--vm->frame_count];
        if (frame->capture) {
            vm->ctx->out = frame->saved_out;
            stream_free(frame->capture);
            frame->capture = nullptr;
        }
        free_args(frame->args, frame->argc);
        frame->args = nullptr;
    }
    while (vm->stack_top > vm->stack) value_decref(*--vm->stack_top);
}

void vm_free(VM* vm) {
    unwind(vm);
}

static int current_line(VM* vm) {
    if (vm->frame_count == 0) return 0;
    CallFrame* frame = &vm->frames[vm->frame_count - 1];
    int offset = (int)(frame->ip - frame->chunk->code - 1);
    if (offset < 0) offset = 0;
    return frame->chunk->lines[offset];
}

static void vm_fault(VM* vm, const char* fmt, ...) {
    char message[512];
    va_list args;
    va_start(args, fmt);
    vsnprintf(message, sizeof(message), fmt, args);
    va_end(args);
    error_set(vm->err, ERR_RUNTIME, 0, current_line(vm), 0, "%s", message);
    vm->state = VM_FAILED;
}

static bool push(VM* vm, Value value) {
    if (vm->stack_top - vm->stack >= MAX_STACK) {
        value_decref(value);
        vm_fault(vm, "stack overflow");
        return false;
    }
    *vm->stack_top++ = value;
    return true;
}

static bool pop(VM* vm, Value* out) {
    Value* floor = vm->frame_count > 0 ? vm->frames[vm->frame_count - 1].slots : vm->stack;
    if (vm->stack_top <= floor) {
        vm_fault(vm, "stack underflow");
        return false;
    }
    *out = *--vm->stack_top;
    return true;
}

static bool peek(VM* vm, Value* out) {
    Value* floor = vm->frames[vm->frame_count - 1].slots;
    if (vm->stack_top <= floor) {
        vm_fault(vm, "stack underflow");
        return false;
    }
    *out = vm->stack_top[-1];
    return true;
}

static char* trim_newlines(char* text) {
    size_t n = strlen(text);
    while (n > 0 && (text[n - 1] == '\n' || text[n - 1] == '\r')) text[--n] = '\0';
    return text;
}

/* Positional argument `index` of the innermost function, or of the script. */
static const char* positional(VM* vm, int index) {
    if (index == 0) return vm->ctx->script_name;
    for (int i = vm->frame_count - 1; i >= 0; i--) {
        CallFrame* frame = &vm->frames[i];
        if (!frame->is_function) continue;
        return index <= frame->argc ? frame->args[index - 1] : "";
    }
    return index <= vm->ctx->argc ? vm->ctx->argv[index - 1] : "";
}

static int positional_count(VM* vm) {
    for (int i = vm->frame_count - 1; i >= 0; i--) {
        if (vm->frames[i].is_function) return vm->frames[i].argc;
    }
    return vm->ctx->argc;
}

/* Pops argc arguments and flagc (name, value) pairs into `call`. */
static bool pop_invocation(VM* vm, const char* name, int argc, int flagc, Invocation* call) {
    invocation_init(call, name);
    int total = argc + flagc * 2;
    Value* floor = vm->frames[vm->frame_count - 1].slots;
    if (vm->stack_top - floor < total) {
        vm_fault(vm, "stack underflow");
        return false;
    }
    Value* base = vm->stack_top - total;
    for (int i = 0; i < argc; i++) {
        char* text = value_to_cstring(base[i]);
        invocation_add_arg(call, text);
        free(text);
    }
    for (int i = 0; i < flagc; i++) {
        char* flag = value_to_cstring(base[argc + i * 2]);
        char* value = value_to_cstring(base[argc + i * 2 + 1]);
        invocation_set_flag(call, flag, value);
        free(flag);
        free(value);
    }
    while (vm->stack_top > base) value_decref(*--vm->stack_top);
    return true;
}

static bool call_function(VM* vm, const FunctionDef* fn, const Invocation* call, bool capture) {
    if (vm->frame_count >= MAX_FRAMES) {
        vm_fault(vm, "call depth exceeded %d calling '%s'", MAX_FRAMES, call->name);
        return false;
    }
    CallFrame* frame = &vm->frames[vm->frame_count++];
    frame->chunk = fn->chunk;
    frame->ip = fn->chunk->code + fn->entry;
    frame->slots = vm->stack_top;
    frame->is_function = true;
    frame->argc = call->argc;
    frame->args = call->argc > 0 ? (char**)malloc(sizeof(char*) * call->argc) : nullptr;
    for (int i = 0; i < call->argc; i++) frame->args[i] = strdup(call->args[i]);
    frame->capture = nullptr;
    frame->saved_out = nullptr;
    if (capture) {
        frame->capture = stream_new_capture(nullptr);
        frame->saved_out = vm->ctx->out;
        vm->ctx->out = frame->capture;
    }
    return true;
}

/* CALL / CAPTURE. Builtins and passthroughs finish here; a user function gets a new frame. */
static bool do_call(VM* vm, const char* name, int argc, int flagc, bool capture) {
    ExecContext* ctx = vm->ctx;
    Invocation call;
    if (!pop_invocation(vm, name, argc, flagc, &call)) {
        invocation_free(&call);
        return false;
    }

    Resolved target;
    if (!dispatch_resolve(ctx, &call, &target, vm->err)) {
        vm->err->line = current_line(vm);
        vm->state = VM_FAILED;
        ctx->exit_code = LUW_EXIT_UNKNOWN_CMD;
        invocation_free(&call);
        return false;
    }
    invocation_free(&call);

    if (target.kind == TARGET_FUNCTION) {
        bool ok = call_function(vm, target.function, &target.call, capture);
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
        Value v = OBJ_VAL(obj_string_take(text, (int)strlen(text)));
        if (!push(vm, v)) return false;
    } else {
        buffer_free(&captured);
        if (!push(vm, INT_VAL(ctx->exit_code))) return false;
    }

    if (ctx->halt) vm->state = VM_COMPLETED;
    else if (context_cancelled(ctx)) vm_fault(vm, "cancelled");
    return true;
}

static bool do_return(VM* vm) {
    Value v;
    if (!pop(vm, &v)) return false;
    int code;
    char message[256];
    bool ok = value_to_exit_code(v, &code, message, sizeof(message));
    if (!ok) vm_fault(vm, "%s", message);
    value_decref(v);
    if (!ok) return false;

    CallFrame* frame = &vm->frames[--vm->frame_count];
    while (vm->stack_top > frame->slots) value_decref(*--vm->stack_top);
    free_args(frame->args, frame->argc);
    frame->args = nullptr;
    vm->ctx->exit_code = code;

    if (frame->capture) {
        vm->ctx->out = frame->saved_out;
        char* text = trim_newlines(stream_take(frame->capture));
        stream_free(frame->capture);
        frame->capture = nullptr;
        return push(vm, OBJ_VAL(obj_string_take(text, (int)strlen(text))));
    }
    return push(vm, INT_VAL(code));
}

static bool join_cluster(VM* vm) {
    int count = vm->pending_members;
    vm->pending_members = 0;
    char** lines = (char**)malloc(sizeof(char*) * (count > 0 ? count : 1));
    for (int i = count - 1; i >= 0; i--) {
        Value v;
        if (!pop(vm, &v)) {
            for (int k = i + 1; k < count; k++) free(lines[k]);
            free(lines);
            return false;
        }
        lines[i] = value_to_cstring(v);
        value_decref(v);
    }

    ClusterResult* results = (ClusterResult*)malloc(sizeof(ClusterResult) * (count > 0 ? count : 1));
    vm->state = VM_SUSPENDED_ON_CLUSTER;
    cluster_run(lines, count, vm->ctx, EXEC_COMPILED, vm->ctx->member_timeout_ms, results);
    vm->state = VM_RUNNING;

    cluster_results_free(results, count);
    free(results);
    for (int i = 0; i < count; i++) free(lines[i]);
    free(lines);
    if (context_cancelled(vm->ctx)) vm_fault(vm, "cancelled");
    return true;
}

static void execute(VM* vm) {
    CallFrame* frame = &vm->frames[vm->frame_count - 1];
    ExecContext* ctx = vm->ctx;
    char msg[256];

#define READ_BYTE()      (*frame->ip++)
#define READ_SHORT()     (frame->ip += 2, read_u16_be(frame->ip - 2))
#define READ_CONST_IDX() (frame->ip += 2, read_u16_le(frame->ip - 2))
#define READ_CONSTANT()  (frame->chunk->constants[READ_CONST_IDX()])
#define READ_NAME()      (AS_CSTRING(READ_CONSTANT()))

    while (vm->state == VM_RUNNING) {
        if (context_cancelled(ctx)) {
            vm_fault(vm, "cancelled");
            break;
        }
        frame = &vm->frames[vm->frame_count - 1];
        if (frame->ip >= frame->chunk->code + frame->chunk->count) {
            vm->state = VM_COMPLETED;
            break;
        }
#ifdef DEBUG_TRACE_EXECUTION
        fprintf(stderr, "          %04d %s\n", (int)(frame->ip - frame->chunk->code), opcode_name(*frame->ip));
#endif
        uint8_t instruction = READ_BYTE();
        switch (instruction) {
        case OP_CONSTANT: {
            Value v = READ_CONSTANT();
            value_incref(v);
            push(vm, v);
        } break;
        case OP_TRUE:  push(vm, BOOL_VAL(true)); break;
        case OP_FALSE: push(vm, BOOL_VAL(false)); break;

        case OP_ADD: case OP_SUB: case OP_MUL: case OP_DIV: case OP_MOD:
        case OP_EQ: case OP_NEQ: case OP_LT: case OP_GT: case OP_LTE: case OP_GTE: {
            static const BinaryOp ops[] = {
                BIN_ADD, BIN_SUB, BIN_MUL, BIN_DIV, BIN_MOD, BIN_EQ, BIN_NEQ, BIN_LT, BIN_GT, BIN_LTE, BIN_GTE,
            };
            BinaryOp op = instruction <= OP_MOD ? ops[instruction - OP_ADD] : ops[5 + instruction - OP_EQ];
            Value b, a, result;
            if (!pop(vm, &b)) break;
            if (!pop(vm, &a)) { value_decref(b); break; }
            bool ok = value_binary(op, a, b, &result, msg, sizeof(msg));
            value_decref(a);
            value_decref(b);
            if (!ok) { vm_fault(vm, "%s", msg); break; }
            push(vm, result);
        } break;

        case OP_NEGATE: {
            Value a, result;
            if (!pop(vm, &a)) break;
            bool ok = value_negate(a, &result, msg, sizeof(msg));
            value_decref(a);
            if (!ok) { vm_fault(vm, "%s", msg); break; }
            push(vm, result);
        } break;

        case OP_NOT: {
            Value a;
            if (!pop(vm, &a)) break;
            bool truthy = value_truthy(a);
            value_decref(a);
            push(vm, BOOL_VAL(!truthy));
        } break;

        case OP_GET_VAR: {
            const char* name = READ_NAME();
            Value v;
            if (!table_get_cstr(&ctx->vars, name, &v)) {
                vm_fault(vm, "undefined variable '%s'", name);
                break;
            }
            value_incref(v);
            push(vm, v);
        } break;

        case OP_SET_VAR: {
            const char* name = READ_NAME();
            Value v;
            if (!pop(vm, &v)) break;
            table_set_cstr(&ctx->vars, name, v);
            value_decref(v);
        } break;

        case OP_GET_ENV:
            push(vm, value_cstring(context_getenv(ctx, READ_NAME())));
            break;
        case OP_GET_STATUS:
            push(vm, INT_VAL(ctx->exit_code));
            break;
        case OP_GET_ARG:
            push(vm, value_cstring(positional(vm, READ_BYTE())));
            break;
        case OP_GET_ARGC:
            push(vm, INT_VAL(positional_count(vm)));
            break;

        case OP_CONCAT: {
            int parts = READ_BYTE();
            if (vm->stack_top - frame->slots < parts) { vm_fault(vm, "stack underflow"); break; }
            Buffer joined;
            buffer_init(&joined);
            Value* base = vm->stack_top - parts;
            for (int i = 0; i < parts; i++) value_to_buffer(base[i], &joined);
            while (vm->stack_top > base) value_decref(*--vm->stack_top);
            int len = joined.length;
            push(vm, OBJ_VAL(obj_string_take(buffer_take(&joined), len)));
        } break;

        case OP_JUMP: {
            uint16_t offset = READ_SHORT();
            frame->ip += offset;
        } break;
        case OP_JUMP_IF_FALSE: {
            uint16_t offset = READ_SHORT();
            Value cond;
            if (!peek(vm, &cond)) break;
            if (!value_truthy(cond)) frame->ip += offset;
        } break;
        case OP_LOOP: {
            uint16_t offset = READ_SHORT();
            frame->ip -= offset;
        } break;
        case OP_POP: {
            Value v;
            if (pop(vm, &v)) value_decref(v);
        } break;

        case OP_CALL:
        case OP_CAPTURE: {
            const char* name = READ_NAME();
            int argc = READ_BYTE();
            int flagc = READ_BYTE();
            do_call(vm, name, argc, flagc, instruction == OP_CAPTURE);
        } break;

        case OP_SPAWN_CLUSTER:
            vm->pending_members = READ_BYTE();
            break;
        case OP_JOIN_CLUSTER:
            join_cluster(vm);
            break;

        case OP_FUNCTION: {
            FunctionDef def;
            def.name = (char*)READ_NAME();
            uint16_t length = READ_CONST_IDX();
            def.chunk = frame->chunk;
            def.entry = (int)(frame->ip - frame->chunk->code);
            def.end = def.entry + length;
            def.body = nullptr;
            context_define_function(ctx, &def);
            frame->ip += length;
        } break;

        case OP_RETURN:
            if (!frame->is_function) {
                vm_fault(vm, "'return' outside a function");
                break;
            }
            do_return(vm);
            break;

        case OP_SET_DEBUG:
            ctx->debug = READ_BYTE() != 0;
            break;

        case OP_HALT:
            vm->state = VM_COMPLETED;
            break;

        default:
            vm_fault(vm, "unknown opcode %d", instruction);
            break;
        }
    }

#undef READ_BYTE
#undef READ_SHORT
#undef READ_CONST_IDX
#undef READ_CONSTANT
#undef READ_NAME
}

bool vm_run(VM* vm, const Chunk* chunk, LuwError* err) {
    vm->err = err;
    error_clear(err);
    if (chunk->count == 0) {
        vm->state = VM_COMPLETED;
        return true;
    }
    CallFrame* frame = &vm->frames[vm->frame_count++];
    frame->chunk = chunk;
    frame->ip = chunk->code;
    frame->slots = vm->stack_top;
    frame->args = nullptr;
    frame->argc = 0;
    frame->is_function = false;
    frame->capture = nullptr;
    frame->saved_out = nullptr;

    vm->state = VM_RUNNING;
    execute(vm);
    unwind(vm);

    if (vm->state == VM_FAILED) {
        if (context_cancelled(vm->ctx)) vm->ctx->exit_code = LUW_EXIT_TIMEOUT;
        else vm->ctx->exit_code = error_exit_code(err);
        return false;
    }
    return true;
}
