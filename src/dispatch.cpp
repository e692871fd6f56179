#include "dispatch.h"
#include "builtins.h"
#include "log.h"
#include "shell.h"
#include <cstring>

static char* copy_string(const char* s) {
    size_t n = strlen(s);
    char* out = (char*)malloc(n + 1);
    memcpy(out, s, n + 1);
    return out;
}

/* ── Invocation ───────────────────────────────────── */
void invocation_init(Invocation* call, const char* name) {
    call->name = copy_string(name);
    call->args = nullptr;
    call->argc = 0;
    call->flag_names = nullptr;
    call->flag_values = nullptr;
    call->flagc = 0;
}

void invocation_free(Invocation* call) {
    free(call->name);
    for (int i = 0; i < call->argc; i++) free(call->args[i]);
    for (int i = 0; i < call->flagc; i++) {
        free(call->flag_names[i]);
        free(call->flag_values[i]);
    }
    free(call->args);
    free(call->flag_names);
    free(call->flag_values);
    call->name = nullptr;
    call->args = nullptr;
    call->flag_names = call->flag_values = nullptr;
    call->argc = call->flagc = 0;
}

void invocation_add_arg(Invocation* call, const char* arg) {
    call->args = (char**)realloc(call->args, sizeof(char*) * (call->argc + 1));
    call->args[call->argc++] = copy_string(arg);
}

void invocation_set_flag(Invocation* call, const char* name, const char* value) {
    for (int i = 0; i < call->flagc; i++) {
        if (strcmp(call->flag_names[i], name) == 0) {
            free(call->flag_values[i]);
            call->flag_values[i] = copy_string(value);
            return;
        }
    }
    call->flag_names = (char**)realloc(call->flag_names, sizeof(char*) * (call->flagc + 1));
    call->flag_values = (char**)realloc(call->flag_values, sizeof(char*) * (call->flagc + 1));
    call->flag_names[call->flagc] = copy_string(name);
    call->flag_values[call->flagc] = copy_string(value);
    call->flagc++;
}

const char* invocation_flag(const Invocation* call, const char* name) {
    for (int i = 0; i < call->flagc; i++) {
        if (strcmp(call->flag_names[i], name) == 0) return call->flag_values[i];
    }
    return nullptr;
}

void invocation_copy(const Invocation* from, Invocation* to) {
    invocation_init(to, from->name);
    for (int i = 0; i < from->argc; i++) invocation_add_arg(to, from->args[i]);
    for (int i = 0; i < from->flagc; i++) invocation_set_flag(to, from->flag_names[i], from->flag_values[i]);
}

void dispatch_result_init(DispatchResult* result) {
    buffer_init(&result->out);
    buffer_init(&result->err);
    result->exit_code = 0;
}

void dispatch_result_free(DispatchResult* result) {
    buffer_free(&result->out);
    buffer_free(&result->err);
}

/* ── Aliases ──────────────────────────────────────── */

/* Rewrites `call` with the words of `expansion` in front of its own
 * arguments. "--name value" pairs in the expansion become flags, and the
 * call's own flags are applied after them. */
static void expand_alias(Invocation* call, const char* expansion) {
    Invocation next;
    char* text = copy_string(expansion);
    char* words[256];
    int count = 0;
    for (char* tok = strtok(text, " \t"); tok && count < 256; tok = strtok(nullptr, " \t")) words[count++] = tok;

    invocation_init(&next, count > 0 ? words[0] : "");
    for (int i = 1; i < count; i++) {
        if (strncmp(words[i], "--", 2) == 0 && isalpha((unsigned char)words[i][2])) {
            bool has_value = i + 1 < count && strncmp(words[i + 1], "--", 2) != 0;
            invocation_set_flag(&next, words[i] + 2, has_value ? words[i + 1] : "");
            if (has_value) i++;
        } else {
            invocation_add_arg(&next, words[i]);
        }
    }
    for (int i = 0; i < call->argc; i++) invocation_add_arg(&next, call->args[i]);
    for (int i = 0; i < call->flagc; i++) invocation_set_flag(&next, call->flag_names[i], call->flag_values[i]);
    free(text);

    invocation_free(call);
    *call = next;
}

static ShellKind passthrough_kind(const char* name) {
    if (strcmp(name, "!pwsh") == 0) return SHELL_PWSH;
    if (strcmp(name, "!cmd") == 0) return SHELL_CMD;
    return SHELL_NONE;
}

/* ── Resolution ───────────────────────────────────── */
bool dispatch_resolve(ExecContext* ctx, const Invocation* call, Resolved* out, LuwError* err) {
    invocation_copy(call, &out->call);
    out->builtin = nullptr;
    out->function = nullptr;
    out->shell = SHELL_NONE;

    for (int depth = 0;; depth++) {
        Value expansion;
        if (!table_get_cstr(&ctx->aliases, out->call.name, &expansion)) break;
        if (depth >= MAX_ALIAS_DEPTH) {
            error_set(err, ERR_DISPATCH, DISPATCH_UNKNOWN_COMMAND, 0, 0,
                      "alias '%s' expands more than %d levels deep", call->name, MAX_ALIAS_DEPTH);
            invocation_free(&out->call);
            return false;
        }
        char* previous = copy_string(out->call.name);
        expand_alias(&out->call, AS_CSTRING(expansion));
        bool self = strcmp(previous, out->call.name) == 0;
        free(previous);
        if (self) break;
    }

    const Builtin* builtin = builtins_find(out->call.name);
    if (builtin) {
        out->kind = TARGET_BUILTIN;
        out->builtin = builtin;
        return true;
    }
    const FunctionDef* fn = context_find_function(ctx, out->call.name);
    if (fn) {
        out->kind = TARGET_FUNCTION;
        out->function = fn;
        return true;
    }
    ShellKind shell = passthrough_kind(out->call.name);
    if (shell != SHELL_NONE) {
        out->kind = TARGET_PASSTHROUGH;
        out->shell = shell;
        return true;
    }

    error_set(err, ERR_DISPATCH, DISPATCH_UNKNOWN_COMMAND, 0, 0, "unknown command '%s'", out->call.name);
    invocation_free(&out->call);
    return false;
}

void dispatch_resolved_free(Resolved* resolved) {
    invocation_free(&resolved->call);
}

void dispatch_invoke(ExecContext* ctx, const Resolved* resolved, DispatchResult* result) {
    result->exit_code = 0;
    switch (resolved->kind) {
    case TARGET_BUILTIN:
        if (!resolved->builtin->fn(ctx, &resolved->call, result) && result->exit_code == 0)
            result->exit_code = 1;
        break;

    case TARGET_PASSTHROUGH: {
        Buffer raw;
        buffer_init(&raw);
        for (int i = 0; i < resolved->call.argc; i++) {
            if (i > 0) buffer_append_char(&raw, ' ');
            buffer_append_str(&raw, resolved->call.args[i]);
        }
        LuwError err;
        error_clear(&err);
        if (!shell_run(resolved->shell, buffer_cstr(&raw), ctx, result, &err)) {
            buffer_appendf(&result->err, "%s\n", err.message);
            result->exit_code = LUW_EXIT_UNKNOWN_CMD;
        }
        buffer_free(&raw);
    } break;

    case TARGET_FUNCTION:
        log_message(LOG_ERROR, "dispatch_invoke called for function '%s'", resolved->call.name);
        result->exit_code = LUW_EXIT_RUNTIME_FAULT;
        break;
    }
}

void dispatch_emit(ExecContext* ctx, DispatchResult* result, Buffer* captured) {
    if (captured) buffer_append(captured, result->out.data, result->out.length);
    else stream_write(ctx->out, result->out.data, result->out.length);
    stream_write(ctx->err, result->err.data, result->err.length);
}
