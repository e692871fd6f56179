#include "bytecode_file.h"
#include "compiler.h"
#include "config.h"
#include "context.h"
#include "log.h"
#include "run.h"
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <strings.h>

static void print_usage(FILE* out) {
    fprintf(out,
            "Usage: luw [options] [--script <file> [args...] | --compile <file> | --binary <file> [args...]]\n"
            "\n"
            "  --script <file>     run a .luw / .latin script (a .le file runs as bytecode)\n"
            "  --compile <file>    compile a script to <name>.le in the current directory\n"
            "  --binary <file>     run a compiled .le file\n"
            "  --timeout <ms>      per-member timeout for !mt clusters (0 = none)\n"
            "  --debug             print cluster worker exit codes\n"
            "  --log-level <lvl>   debug, info, warn or error\n"
            "  --version           print the version\n"
            "\n"
            "With no file, luw reads commands line by line (exit or quit to leave).\n");
}

static char* read_file(const char* path) {
    FILE* f = fopen(path, "rb");
    if (!f) return nullptr;
    fseek(f, 0, SEEK_END);
    long size = ftell(f);
    rewind(f);
    if (size < 0) {
        fclose(f);
        return nullptr;
    }
    char* buf = (char*)malloc(size + 1);
    size_t read = fread(buf, 1, size, f);
    buf[read] = '\0';
    fclose(f);
    return buf;
}

static const char* extension_of(const char* path) {
    const char* slash = strrchr(path, '/');
    const char* dot = strrchr(path, '.');
    if (!dot || (slash && dot < slash)) return "";
    return dot + 1;
}

/* "dir/name.luw" -> "name.le" (written to the current directory) */
static char* make_bytecode_path(const char* source_path) {
    const char* base = strrchr(source_path, '/');
    base = base ? base + 1 : source_path;
    const char* dot = strrchr(base, '.');
    int stem = dot ? (int)(dot - base) : (int)strlen(base);
    char* out = (char*)malloc(stem + 4);
    memcpy(out, base, stem);
    memcpy(out + stem, ".le", 4);
    return out;
}

static int report(const LuwError* err, const char* file) {
    error_print(err, file, stderr);
    return error_exit_code(err);
}

static int finish_run(ExecContext* ctx, bool ok, const LuwError* err, const char* file) {
    if (!ok) error_print(err, file, stderr);
    return run_exit_code(ctx, ok, err);
}

static int run_binary_file(ExecContext* ctx, const char* path) {
    Chunk* chunk = (Chunk*)malloc(sizeof(Chunk));
    LuwError err;
    error_clear(&err);
    if (!bytecode_read(path, chunk, &err)) {
        free(chunk);
        if (err.code == FORMAT_IO_ERROR) {
            error_print(&err, path, stderr);
            return LUW_EXIT_NO_INPUT;
        }
        return report(&err, path);
    }
    log_message(LOG_INFO, "running %s (%d bytes of code)", path, chunk->count);
    bool ok = run_chunk(ctx, chunk, &err);
    /* the context may still hold functions that point into the chunk */
    context_adopt_chunk(ctx, chunk);
    return finish_run(ctx, ok, &err, path);
}

static int run_script_file(ExecContext* ctx, const char* path) {
    if (strcasecmp(extension_of(path), "le") == 0) return run_binary_file(ctx, path);
    char* source = read_file(path);
    if (!source) {
        fprintf(stderr, "luw: cannot read '%s'\n", path);
        return LUW_EXIT_NO_INPUT;
    }
    log_message(LOG_INFO, "running %s", path);
    LuwError err;
    bool ok = run_source(ctx, source, EXEC_INTERPRET, &err);
    free(source);
    return finish_run(ctx, ok, &err, path);
}

static int compile_file(const char* path) {
    const char* ext = extension_of(path);
    if (strcasecmp(ext, "luw") != 0 && strcasecmp(ext, "latin") != 0) {
        fprintf(stderr, "luw: --compile accepts .luw or .latin scripts, not '%s'\n", path);
        return LUW_EXIT_USAGE;
    }
    char* source = read_file(path);
    if (!source) {
        fprintf(stderr, "luw: cannot read '%s'\n", path);
        return LUW_EXIT_NO_INPUT;
    }

    Chunk chunk;
    LuwError err;
    error_clear(&err);
    bool ok = compile_source(source, &chunk, &err);
    free(source);
    if (!ok) return report(&err, path);

    char* out_path = make_bytecode_path(path);
    ok = bytecode_write(out_path, &chunk, &err);
    chunk_free(&chunk);
    if (!ok) {
        free(out_path);
        return report(&err, path);
    }
    printf("Compiled successfully to '%s'.\n", out_path);
    log_message(LOG_INFO, "compiled %s -> %s", path, out_path);
    free(out_path);
    return LUW_EXIT_OK;
}

static void trim_line(char* line) {
    size_t n = strlen(line);
    while (n > 0 && (line[n - 1] == '\n' || line[n - 1] == '\r')) line[--n] = '\0';
}

static int repl(ExecContext* ctx) {
    char line[4096];
    for (;;) {
        printf("LUW %s: ", ctx->cwd);
        fflush(stdout);
        if (!fgets(line, sizeof(line), stdin)) {
            printf("\n");
            break;
        }
        trim_line(line);
        const char* start = line;
        while (*start == ' ' || *start == '\t') start++;
        if (*start == '\0') continue;
        if (strcmp(start, "exit") == 0 || strcmp(start, "quit") == 0) break;

        LuwError err;
        if (!run_source(ctx, line, EXEC_INTERPRET, &err)) error_print(&err, "<stdin>", stderr);
        if (ctx->halt) break;
    }
    return ctx->exit_code;
}

int main(int argc, char* argv[]) {
    Config config;
    config_init(&config);
    char message[256];
    if (!config_from_env(&config, message, sizeof(message)) ||
        !config_parse_args(&config, argc, argv, message, sizeof(message))) {
        fprintf(stderr, "luw: %s\n", message);
        print_usage(stderr);
        return LUW_EXIT_USAGE;
    }
    log_set_level(config.log_level);
    log_set_timestamps(config.timestamps);

    switch (config.mode) {
    case RUN_VERSION:
        printf("luw %s\n", LUW_VERSION);
        return LUW_EXIT_OK;
    case RUN_HELP:
        print_usage(stdout);
        return LUW_EXIT_OK;
    case RUN_COMPILE:
        return compile_file(config.path);
    default:
        break;
    }

    Stream* out = stream_new_file(stdout);
    Stream* err = stream_new_file(stderr);
    ExecContext ctx;
    context_init(&ctx, out, err);
    ctx.debug = config.debug;
    ctx.member_timeout_ms = config.member_timeout_ms;

    int code;
    if (config.mode == RUN_SCRIPT || config.mode == RUN_BINARY) {
        context_set_args(&ctx, config.path, config.script_argc, config.script_argv);
        code = config.mode == RUN_SCRIPT ? run_script_file(&ctx, config.path)
                                         : run_binary_file(&ctx, config.path);
    } else {
        code = repl(&ctx);
    }

    context_free(&ctx);
    stream_free(out);
    stream_free(err);
    return code;
}
