#include "builtins.h"
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <climits>
#include <cstring>
#include <ctime>
#include <dirent.h>
#include <fnmatch.h>
#include <fcntl.h>
#include <pwd.h>
#include <regex>
#include <strings.h>
#include <sys/stat.h>
#include <sys/utsname.h>
#include <thread>
#include <unistd.h>

#define BUILTIN(fn) static bool fn(ExecContext* ctx, const Invocation* call, DispatchResult* result)

static bool fail(DispatchResult* result, int code, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    char message[1024];
    vsnprintf(message, sizeof(message), fmt, args);
    va_end(args);
    buffer_append_str(&result->err, message);
    buffer_append_char(&result->err, '\n');
    result->exit_code = code;
    return false;
}

#define USAGE(text) fail(result, 2, "usage: %s", text)

static void join_args(const Invocation* call, Buffer* out) {
    for (int i = 0; i < call->argc; i++) {
        if (i > 0) buffer_append_char(out, ' ');
        buffer_append_str(out, call->args[i]);
    }
}

static bool flag_on(const Invocation* call, const char* name) {
    const char* v = invocation_flag(call, name);
    if (!v) return false;
    return v[0] == '\0' || strcmp(v, "1") == 0 || strcasecmp(v, "true") == 0 ||
           strcasecmp(v, "yes") == 0 || strcasecmp(v, "on") == 0;
}

/* Accepts $env:NAME and $NAME as well as NAME. */
static const char* strip_sigil(const char* name) {
    if (strncmp(name, "$env:", 5) == 0) return name + 5;
    if (name[0] == '$') return name + 1;
    return name;
}

/* Collapses "." and ".." segments of an absolute path in place. */
static void normalize_path(char* path) {
    char* segments[512];
    int count = 0;
    char* copy = strdup(path);
    for (char* seg = strtok(copy, "/"); seg; seg = strtok(nullptr, "/")) {
        if (strcmp(seg, ".") == 0) continue;
        if (strcmp(seg, "..") == 0) {
            if (count > 0) count--;
            continue;
        }
        if (count < 512) segments[count++] = seg;
    }
    char* out = path;
    if (count == 0) *out++ = '/';
    for (int i = 0; i < count; i++) {
        size_t n = strlen(segments[i]);
        *out++ = '/';
        memmove(out, segments[i], n);
        out += n;
    }
    *out = '\0';
    free(copy);
}

static bool read_file(ExecContext* ctx, const char* name, Buffer* into, DispatchResult* result, const char* who) {
    char* path = context_resolve_path(ctx, name);
    FILE* f = fopen(path, "rb");
    free(path);
    if (!f) return fail(result, 1, "%s: %s: %s", who, name, strerror(errno));
    char chunk[4096];
    size_t n;
    while ((n = fread(chunk, 1, sizeof(chunk), f)) > 0) buffer_append(into, chunk, (int)n);
    fclose(f);
    if (!into->data) buffer_append(into, "", 0);
    return true;
}

static bool parse_count(const Invocation* call, int* out) {
    const char* v = invocation_flag(call, "n");
    if (!v) { *out = 10; return true; }
    char* end;
    long n = strtol(v, &end, 10);
    if (end == v || *end != '\0' || n < 0) return false;
    *out = (int)n;
    return true;
}

/* ── Output ───────────────────────────────────────── */
BUILTIN(builtin_echo) {
    (void)ctx;
    join_args(call, &result->out);
    buffer_append_char(&result->out, '\n');
    return true;
}

BUILTIN(builtin_pwd) {
    (void)call;
    buffer_appendf(&result->out, "%s\n", ctx->cwd);
    return true;
}

BUILTIN(builtin_upper) {
    (void)ctx;
    Buffer text;
    buffer_init(&text);
    join_args(call, &text);
    for (int i = 0; i < text.length; i++) text.data[i] = (char)toupper((unsigned char)text.data[i]);
    buffer_appendf(&result->out, "%s\n", buffer_cstr(&text));
    buffer_free(&text);
    return true;
}

BUILTIN(builtin_lower) {
    (void)ctx;
    Buffer text;
    buffer_init(&text);
    join_args(call, &text);
    for (int i = 0; i < text.length; i++) text.data[i] = (char)tolower((unsigned char)text.data[i]);
    buffer_appendf(&result->out, "%s\n", buffer_cstr(&text));
    buffer_free(&text);
    return true;
}

BUILTIN(builtin_reverse) {
    (void)ctx;
    Buffer text;
    buffer_init(&text);
    join_args(call, &text);
    for (int i = 0, j = text.length - 1; i < j; i++, j--) {
        char c = text.data[i];
        text.data[i] = text.data[j];
        text.data[j] = c;
    }
    buffer_appendf(&result->out, "%s\n", buffer_cstr(&text));
    buffer_free(&text);
    return true;
}

/* ── Filesystem ───────────────────────────────────── */
BUILTIN(builtin_cd) {
    const char* target = call->argc > 0 ? call->args[0] : context_getenv(ctx, "HOME");
    if (target[0] == '\0') return fail(result, 1, "cd: HOME not set");
    char* path = context_resolve_path(ctx, target);
    normalize_path(path);

    struct stat st;
    if (stat(path, &st) == -1) {
        bool create = flag_on(call, "mkdir") || flag_on(call, "create") || flag_on(call, "p");
        if (!create) {
            fail(result, 1, "cd: %s: %s", target, strerror(errno));
            free(path);
            return false;
        }
        for (char* p = path + 1;; p++) {
            if (*p == '/' || *p == '\0') {
                char saved = *p;
                *p = '\0';
                if (mkdir(path, 0755) == -1 && errno != EEXIST) {
                    fail(result, 1, "cd: cannot create %s: %s", path, strerror(errno));
                    free(path);
                    return false;
                }
                *p = saved;
                if (saved == '\0') break;
            }
        }
    } else if (!S_ISDIR(st.st_mode)) {
        fail(result, 1, "cd: %s: Not a directory", target);
        free(path);
        return false;
    }

    free(ctx->cwd);
    ctx->cwd = path;
    context_setenv(ctx, "PWD", path);
    return true;
}

static int compare_names(const void* a, const void* b) {
    return strcmp(*(char* const*)a, *(char* const*)b);
}

BUILTIN(builtin_ls) {
    const char* target = call->argc > 0 ? call->args[0] : ".";
    char* path = context_resolve_path(ctx, target);
    DIR* dir = opendir(path);
    free(path);
    if (!dir) return fail(result, 1, "ls: %s: %s", target, strerror(errno));

    char** names = nullptr;
    int count = 0, capacity = 0;
    struct dirent* entry;
    while ((entry = readdir(dir)) != nullptr) {
        if (strcmp(entry->d_name, ".") == 0 || strcmp(entry->d_name, "..") == 0) continue;
        if (count >= capacity) {
            capacity = capacity < 8 ? 8 : capacity * 2;
            names = (char**)realloc(names, sizeof(char*) * capacity);
        }
        names[count++] = strdup(entry->d_name);
    }
    closedir(dir);

    qsort(names, count, sizeof(char*), compare_names);
    for (int i = 0; i < count; i++) {
        buffer_appendf(&result->out, "%s\n", names[i]);
        free(names[i]);
    }
    free(names);
    return true;
}

BUILTIN(builtin_cat) {
    if (call->argc == 0) return USAGE("cat <file>...");
    bool ok = true;
    for (int i = 0; i < call->argc; i++) {
        Buffer content;
        buffer_init(&content);
        if (read_file(ctx, call->args[i], &content, result, "cat"))
            buffer_append(&result->out, content.data, content.length);
        else
            ok = false;
        buffer_free(&content);
    }
    return ok;
}

BUILTIN(builtin_head) {
    int n;
    if (call->argc == 0 || !parse_count(call, &n)) return USAGE("head <file> [--n N]");
    Buffer content;
    buffer_init(&content);
    if (!read_file(ctx, call->args[0], &content, result, "head")) {
        buffer_free(&content);
        return false;
    }
    const char* p = content.data;
    const char* end = content.data + content.length;
    for (int line = 0; line < n && p < end; line++) {
        const char* nl = (const char*)memchr(p, '\n', end - p);
        const char* stop = nl ? nl : end;
        buffer_append(&result->out, p, (int)(stop - p));
        buffer_append_char(&result->out, '\n');
        p = nl ? nl + 1 : end;
    }
    buffer_free(&content);
    return true;
}

BUILTIN(builtin_tail) {
    int n;
    if (call->argc == 0 || !parse_count(call, &n)) return USAGE("tail <file> [--n N]");
    Buffer content;
    buffer_init(&content);
    if (!read_file(ctx, call->args[0], &content, result, "tail")) {
        buffer_free(&content);
        return false;
    }
    int end = content.length;
    if (end > 0 && content.data[end - 1] == '\n') end--;
    int start = end, lines = 0;
    while (start > 0 && lines < n) {
        if (content.data[start - 1] == '\n') {
            lines++;
            if (lines == n) break;
        }
        start--;
    }
    if (n > 0 && end > 0) {
        buffer_append(&result->out, content.data + start, end - start);
        buffer_append_char(&result->out, '\n');
    }
    buffer_free(&content);
    return true;
}

BUILTIN(builtin_wc) {
    if (call->argc == 0) return USAGE("wc <file>");
    Buffer content;
    buffer_init(&content);
    if (!read_file(ctx, call->args[0], &content, result, "wc")) {
        buffer_free(&content);
        return false;
    }
    int lines = 0, words = 0;
    bool in_word = false;
    for (int i = 0; i < content.length; i++) {
        char c = content.data[i];
        if (c == '\n') lines++;
        if (isspace((unsigned char)c)) {
            in_word = false;
        } else if (!in_word) {
            in_word = true;
            words++;
        }
    }
    buffer_appendf(&result->out, "%d %d %d %s\n", lines, words, content.length, call->args[0]);
    buffer_free(&content);
    return true;
}

BUILTIN(builtin_touch) {
    if (call->argc == 0) return USAGE("touch <path>...");
    bool ok = true;
    for (int i = 0; i < call->argc; i++) {
        char* path = context_resolve_path(ctx, call->args[i]);
        int fd = open(path, O_WRONLY | O_CREAT, 0644);
        if (fd == -1) {
            fail(result, 1, "touch: %s: %s", call->args[i], strerror(errno));
            ok = false;
        } else {
            futimens(fd, nullptr);
            close(fd);
        }
        free(path);
    }
    return ok;
}

BUILTIN(builtin_mkdir) {
    if (call->argc == 0) return USAGE("mkdir <path> [--p]");
    bool parents = flag_on(call, "p");
    bool ok = true;
    for (int i = 0; i < call->argc; i++) {
        char* path = context_resolve_path(ctx, call->args[i]);
        if (parents) {
            for (char* p = path + 1;; p++) {
                if (*p != '/' && *p != '\0') continue;
                char saved = *p;
                *p = '\0';
                if (mkdir(path, 0755) == -1 && errno != EEXIST) {
                    fail(result, 1, "mkdir: %s: %s", call->args[i], strerror(errno));
                    ok = false;
                    *p = saved;
                    break;
                }
                *p = saved;
                if (saved == '\0') break;
            }
        } else if (mkdir(path, 0755) == -1) {
            fail(result, 1, "mkdir: %s: %s", call->args[i], strerror(errno));
            ok = false;
        }
        free(path);
    }
    return ok;
}

static bool remove_tree(const char* path) {
    struct stat st;
    if (lstat(path, &st) == -1) return false;
    if (!S_ISDIR(st.st_mode)) return unlink(path) == 0;
    DIR* dir = opendir(path);
    if (!dir) return false;
    struct dirent* entry;
    bool ok = true;
    while ((entry = readdir(dir)) != nullptr) {
        if (strcmp(entry->d_name, ".") == 0 || strcmp(entry->d_name, "..") == 0) continue;
        size_t len = strlen(path) + strlen(entry->d_name) + 2;
        char* child = (char*)malloc(len);
        snprintf(child, len, "%s/%s", path, entry->d_name);
        if (!remove_tree(child)) ok = false;
        free(child);
    }
    closedir(dir);
    return ok && rmdir(path) == 0;
}

BUILTIN(builtin_rm) {
    if (call->argc == 0) return USAGE("rm <path>... [--r]");
    bool recursive = flag_on(call, "r") || flag_on(call, "recursive");
    bool ok = true;
    for (int i = 0; i < call->argc; i++) {
        char* path = context_resolve_path(ctx, call->args[i]);
        struct stat st;
        bool removed;
        if (lstat(path, &st) == 0 && S_ISDIR(st.st_mode)) {
            if (!recursive) {
                fail(result, 1, "rm: %s: is a directory (use --r)", call->args[i]);
                ok = false;
                free(path);
                continue;
            }
            removed = remove_tree(path);
        } else {
            removed = unlink(path) == 0;
        }
        if (!removed) {
            fail(result, 1, "rm: %s: %s", call->args[i], strerror(errno));
            ok = false;
        }
        free(path);
    }
    return ok;
}

static char* join_path(const char* dir, const char* name) {
    size_t len = strlen(dir) + strlen(name) + 2;
    char* path = (char*)malloc(len);
    if (strcmp(dir, "/") == 0) snprintf(path, len, "/%s", name);
    else snprintf(path, len, "%s/%s", dir, name);
    return path;
}

/* `dst`, or dst/<last component of src> when dst is an existing directory. */
static char* destination_path(const char* src, const char* dst) {
    struct stat st;
    if (stat(dst, &st) == 0 && S_ISDIR(st.st_mode)) {
        const char* slash = strrchr(src, '/');
        return join_path(dst, slash ? slash + 1 : src);
    }
    return strdup(dst);
}

/* Copies one regular file; on failure errno describes the problem. */
static bool copy_file(const char* from, const char* to) {
    int in = open(from, O_RDONLY | O_CLOEXEC);
    if (in == -1) return false;
    struct stat st;
    if (fstat(in, &st) == -1) {
        close(in);
        return false;
    }
    if (S_ISDIR(st.st_mode)) {
        close(in);
        errno = EISDIR;
        return false;
    }
    int out = open(to, O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, st.st_mode & 0777);
    if (out == -1) {
        int saved = errno;
        close(in);
        errno = saved;
        return false;
    }
    char chunk[8192];
    ssize_t n;
    bool ok = true;
    while (ok && (n = read(in, chunk, sizeof(chunk))) != 0) {
        if (n < 0) {
            if (errno == EINTR) continue;
            ok = false;
            break;
        }
        for (ssize_t done = 0; done < n;) {
            ssize_t w = write(out, chunk + done, n - done);
            if (w < 0) {
                if (errno == EINTR) continue;
                ok = false;
                break;
            }
            done += w;
        }
    }
    int saved = errno;
    close(in);
    if (close(out) == -1 && ok) {
        saved = errno;
        ok = false;
    }
    errno = saved;
    return ok;
}

/* SRC DST as arguments, or --src/--dst (--to) flags. */
static bool source_and_destination(const Invocation* call, const char** src, const char** dst) {
    int next = 0;
    *src = invocation_flag(call, "src");
    if (!*src && next < call->argc) *src = call->args[next++];
    *dst = invocation_flag(call, "dst");
    if (!*dst) *dst = invocation_flag(call, "to");
    if (!*dst && next < call->argc) *dst = call->args[next++];
    return *src && **src && *dst && **dst && next == call->argc;
}

BUILTIN(builtin_cp) {
    const char *src, *dst;
    if (!source_and_destination(call, &src, &dst)) return USAGE("cp <src> <dst> | cp --src <src> --dst <dst>");
    char* from = context_resolve_path(ctx, src);
    char* dir = context_resolve_path(ctx, dst);
    char* to = destination_path(from, dir);
    bool ok = true;
    if (strcmp(from, to) == 0) ok = fail(result, 1, "cp: %s and %s are the same file", src, dst);
    else if (!copy_file(from, to)) ok = fail(result, 1, "cp: %s: %s", src, strerror(errno));
    free(from);
    free(dir);
    free(to);
    return ok;
}

BUILTIN(builtin_mv) {
    const char *src, *dst;
    if (!source_and_destination(call, &src, &dst)) return USAGE("mv <src> <dst> | mv --src <src> --dst <dst>");
    char* from = context_resolve_path(ctx, src);
    char* dir = context_resolve_path(ctx, dst);
    char* to = destination_path(from, dir);
    bool ok = true;
    if (rename(from, to) == -1) {
        /* across file systems: copy then remove */
        if (errno != EXDEV) ok = fail(result, 1, "mv: %s: %s", src, strerror(errno));
        else if (!copy_file(from, to) || unlink(from) == -1) ok = fail(result, 1, "mv: %s: %s", src, strerror(errno));
    }
    free(from);
    free(dir);
    free(to);
    return ok;
}

/* Prints matching lines; exit 1 when nothing matched. */
BUILTIN(builtin_grep) {
    const char* pattern = invocation_flag(call, "pattern");
    int first_file = 0;
    if (!pattern && call->argc > 0) pattern = call->args[first_file++];
    const char* file_flag = invocation_flag(call, "file");
    int file_count = call->argc - first_file + (file_flag ? 1 : 0);
    if (!pattern || file_count == 0) return USAGE("grep <pattern> <file>... [--i]");

    std::regex re;
    try {
        std::regex::flag_type flags = std::regex::ECMAScript;
        if (flag_on(call, "i")) flags |= std::regex::icase;
        re.assign(pattern, flags);
    } catch (const std::regex_error& e) {
        return fail(result, 2, "grep: bad pattern '%s': %s", pattern, e.what());
    }

    bool ok = true, matched = false;
    for (int i = 0; i < file_count; i++) {
        const char* name = file_flag ? (i == 0 ? file_flag : call->args[first_file + i - 1]) : call->args[first_file + i];
        Buffer content;
        buffer_init(&content);
        if (!read_file(ctx, name, &content, result, "grep")) {
            ok = false;
            buffer_free(&content);
            continue;
        }
        const char* p = content.data;
        const char* end = content.data + content.length;
        while (p < end) {
            const char* nl = (const char*)memchr(p, '\n', end - p);
            const char* stop = nl ? nl : end;
            if (std::regex_search(p, stop, re)) {
                matched = true;
                if (file_count > 1) buffer_appendf(&result->out, "%s:", name);
                buffer_append(&result->out, p, (int)(stop - p));
                buffer_append_char(&result->out, '\n');
            }
            p = nl ? nl + 1 : end;
        }
        buffer_free(&content);
    }
    if (!ok) return false;
    if (!matched) result->exit_code = 1;
    return true;
}

typedef struct {
    char** items;
    int    count;
    int    capacity;
} NameList;

static void namelist_add(NameList* list, char* name) {
    if (list->count >= list->capacity) {
        list->capacity = list->capacity < 8 ? 8 : list->capacity * 2;
        list->items = (char**)realloc(list->items, sizeof(char*) * list->capacity);
    }
    list->items[list->count++] = name;
}

static bool name_matches(const char* name, const char* pattern) {
    if (!pattern) return true;
    if (strpbrk(pattern, "*?[")) return fnmatch(pattern, name, 0) == 0;
    return strstr(name, pattern) != nullptr;
}

/* Walks `real`, reporting files under their `shown` path. */
static void find_walk(const char* real, const char* shown, const char* pattern, NameList* found) {
    DIR* dir = opendir(real);
    if (!dir) return;
    struct dirent* entry;
    while ((entry = readdir(dir)) != nullptr) {
        if (strcmp(entry->d_name, ".") == 0 || strcmp(entry->d_name, "..") == 0) continue;
        char* child_real = join_path(real, entry->d_name);
        char* child_shown = join_path(shown, entry->d_name);
        struct stat st;
        if (lstat(child_real, &st) == 0 && S_ISDIR(st.st_mode)) {
            find_walk(child_real, child_shown, pattern, found);
            free(child_shown);
        } else if (name_matches(entry->d_name, pattern)) {
            namelist_add(found, child_shown);
        } else {
            free(child_shown);
        }
        free(child_real);
    }
    closedir(dir);
}

BUILTIN(builtin_find) {
    const char* root = call->argc > 0 ? call->args[0] : invocation_flag(call, "path");
    if (!root || !*root) root = ".";
    if (call->argc > 1) return USAGE("find [path] [--name PATTERN]");
    const char* pattern = invocation_flag(call, "name");
    if (pattern && !*pattern) pattern = nullptr;

    char* real = context_resolve_path(ctx, root);
    struct stat st;
    if (stat(real, &st) == -1) {
        free(real);
        return fail(result, 1, "find: %s: %s", root, strerror(errno));
    }
    NameList found = {nullptr, 0, 0};
    if (S_ISDIR(st.st_mode)) find_walk(real, root, pattern, &found);
    else if (name_matches(root, pattern)) namelist_add(&found, strdup(root));
    free(real);

    qsort(found.items, found.count, sizeof(char*), compare_names);
    for (int i = 0; i < found.count; i++) {
        buffer_appendf(&result->out, "%s\n", found.items[i]);
        free(found.items[i]);
    }
    free(found.items);
    return true;
}

BUILTIN(builtin_basename) {
    (void)ctx;
    if (call->argc == 0) return USAGE("basename <path>");
    const char* path = call->args[0];
    int end = (int)strlen(path);
    while (end > 1 && path[end - 1] == '/') end--;
    int start = end;
    while (start > 0 && path[start - 1] != '/') start--;
    if (end == 1 && path[0] == '/') start = 0;
    buffer_append(&result->out, path + start, end - start);
    buffer_append_char(&result->out, '\n');
    return true;
}

BUILTIN(builtin_dirname) {
    (void)ctx;
    if (call->argc == 0) return USAGE("dirname <path>");
    const char* path = call->args[0];
    int end = (int)strlen(path);
    while (end > 1 && path[end - 1] == '/') end--;
    while (end > 0 && path[end - 1] != '/') end--;
    while (end > 1 && path[end - 1] == '/') end--;
    if (end == 0) buffer_append_char(&result->out, '.');
    else buffer_append(&result->out, path, end);
    buffer_append_char(&result->out, '\n');
    return true;
}

/* ── Environment ──────────────────────────────────── */
static void list_table(Table* table, Buffer* out, bool quoted) {
    int count = 0;
    ObjString** keys = table_sorted_keys(table, &count);
    for (int i = 0; i < count; i++) {
        Value v;
        table_get(table, keys[i], &v);
        char* text = value_to_cstring(v);
        if (quoted) buffer_appendf(out, "%s='%s'\n", keys[i]->chars, text);
        else buffer_appendf(out, "%s=%s\n", keys[i]->chars, text);
        free(text);
    }
    free(keys);
}

/* "NAME=VALUE" in one argument, or NAME followed by the value words. */
static bool split_assignment(const Invocation* call, Buffer* name, Buffer* value) {
    if (call->argc == 0) return false;
    const char* first = call->args[0];
    const char* eq = strchr(first, '=');
    if (eq && eq != first) {
        buffer_append(name, first, (int)(eq - first));
        buffer_append_str(value, eq + 1);
        for (int i = 1; i < call->argc; i++) {
            buffer_append_char(value, ' ');
            buffer_append_str(value, call->args[i]);
        }
    } else {
        if (call->argc < 2) return false;
        buffer_append_str(name, first);
        for (int i = 1; i < call->argc; i++) {
            if (i > 1) buffer_append_char(value, ' ');
            buffer_append_str(value, call->args[i]);
        }
    }
    buffer_append(value, "", 0);
    return true;
}

BUILTIN(builtin_set) {
    Buffer name, value;
    buffer_init(&name);
    buffer_init(&value);
    bool ok = split_assignment(call, &name, &value);
    if (ok) context_setenv(ctx, strip_sigil(buffer_cstr(&name)), buffer_cstr(&value));
    buffer_free(&name);
    buffer_free(&value);
    if (!ok) return USAGE("set NAME VALUE | set NAME=VALUE");
    return true;
}

BUILTIN(builtin_env) {
    if (call->argc == 0) {
        list_table(&ctx->env, &result->out, false);
        return true;
    }
    if (call->argc > 1 || strchr(call->args[0], '=')) return builtin_set(ctx, call, result);
    Value v;
    if (!table_get_cstr(&ctx->env, strip_sigil(call->args[0]), &v)) return false;
    char* text = value_to_cstring(v);
    buffer_appendf(&result->out, "%s\n", text);
    free(text);
    return true;
}

BUILTIN(builtin_get) {
    if (call->argc != 1) return USAGE("get NAME");
    Value v;
    if (!table_get_cstr(&ctx->env, strip_sigil(call->args[0]), &v)) return false;
    char* text = value_to_cstring(v);
    buffer_appendf(&result->out, "%s\n", text);
    free(text);
    return true;
}

BUILTIN(builtin_unset) {
    if (call->argc == 0) return USAGE("unset NAME...");
    for (int i = 0; i < call->argc; i++) table_delete_cstr(&ctx->env, strip_sigil(call->args[i]));
    return true;
}

BUILTIN(builtin_aliases) {
    (void)call;
    list_table(&ctx->aliases, &result->out, true);
    return true;
}

BUILTIN(builtin_alias) {
    if (call->argc == 0) return builtin_aliases(ctx, call, result);
    Buffer name, value;
    buffer_init(&name);
    buffer_init(&value);
    bool ok = split_assignment(call, &name, &value);
    if (ok && (name.length == 0 || value.length == 0)) ok = false;
    if (ok) {
        Value v = value_cstring(buffer_cstr(&value));
        table_set_cstr(&ctx->aliases, buffer_cstr(&name), v);
        value_decref(v);
    }
    buffer_free(&name);
    buffer_free(&value);
    if (!ok) return USAGE("alias NAME=COMMAND | alias NAME COMMAND...");
    return true;
}

BUILTIN(builtin_unalias) {
    if (call->argc == 0) return USAGE("unalias NAME...");
    bool ok = true;
    for (int i = 0; i < call->argc; i++) {
        if (!table_delete_cstr(&ctx->aliases, call->args[i])) {
            fail(result, 1, "unalias: %s: not found", call->args[i]);
            ok = false;
        }
    }
    return ok;
}

/* ── Process ──────────────────────────────────────── */
BUILTIN(builtin_sleep) {
    if (call->argc != 1) return USAGE("sleep SECONDS");
    char* end;
    double seconds = strtod(call->args[0], &end);
    if (end == call->args[0] || *end != '\0' || !(seconds >= 0)) return USAGE("sleep SECONDS");
    if (seconds > MAX_SLEEP_SECONDS) seconds = MAX_SLEEP_SECONDS;

    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::microseconds((long long)(seconds * 1e6));
    for (;;) {
        if (context_cancelled(ctx)) {
            result->exit_code = LUW_EXIT_TIMEOUT;
            return false;
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) break;
        auto step = std::min<std::chrono::steady_clock::duration>(deadline - now, std::chrono::milliseconds(10));
        std::this_thread::sleep_for(step);
    }
    return true;
}

BUILTIN(builtin_true) {
    (void)ctx; (void)call; (void)result;
    return true;
}

BUILTIN(builtin_false) {
    (void)ctx; (void)call;
    result->exit_code = 1;
    return false;
}

BUILTIN(builtin_exit) {
    int code = ctx->exit_code;
    if (call->argc > 0) {
        char* end;
        errno = 0;
        long long n = strtoll(call->args[0], &end, 10);
        if (end == call->args[0] || *end != '\0') return fail(result, 2, "exit: %s: numeric argument required", call->args[0]);
        if (errno == ERANGE || n < INT_MIN || n > INT_MAX) return fail(result, 2, "exit: %s: out of range", call->args[0]);
        code = (int)n;
    }
    ctx->halt = true;
    ctx->exit_code = code;
    result->exit_code = code;
    return true;
}

BUILTIN(builtin_whoami) {
    (void)call;
    struct passwd* pw = getpwuid(geteuid());
    const char* name = pw ? pw->pw_name : context_getenv(ctx, "USER");
    buffer_appendf(&result->out, "%s\n", name);
    return true;
}

BUILTIN(builtin_hostname) {
    (void)ctx;
    (void)call;
    char name[256];
    if (gethostname(name, sizeof(name)) == -1) return fail(result, 1, "hostname: %s", strerror(errno));
    name[sizeof(name) - 1] = '\0';
    buffer_appendf(&result->out, "%s\n", name);
    return true;
}

BUILTIN(builtin_uname) {
    (void)ctx;
    struct utsname u;
    if (uname(&u) == -1) return fail(result, 1, "uname: %s", strerror(errno));
    if (flag_on(call, "a"))
        buffer_appendf(&result->out, "%s %s %s %s %s\n", u.sysname, u.nodename, u.release, u.version, u.machine);
    else if (flag_on(call, "r"))
        buffer_appendf(&result->out, "%s\n", u.release);
    else if (flag_on(call, "m"))
        buffer_appendf(&result->out, "%s\n", u.machine);
    else
        buffer_appendf(&result->out, "%s\n", u.sysname);
    return true;
}

BUILTIN(builtin_date) {
    (void)ctx;
    const char* format = invocation_flag(call, "format");
    if (!format || format[0] == '\0') format = "%Y-%m-%d %H:%M:%S";
    time_t now = time(nullptr);
    struct tm local;
    localtime_r(&now, &local);
    char text[256];
    size_t n = strftime(text, sizeof(text), format, &local);
    buffer_append(&result->out, text, (int)n);
    buffer_append_char(&result->out, '\n');
    return true;
}

BUILTIN(builtin_help);

static const Builtin builtins[] = {
    {"echo",     builtin_echo,     "print the arguments"},
    {"print",    builtin_echo,     "print the arguments"},
    {"pwd",      builtin_pwd,      "print the working directory"},
    {"cd",       builtin_cd,       "change the working directory [--mkdir]"},
    {"ls",       builtin_ls,       "list a directory"},
    {"cat",      builtin_cat,      "print files"},
    {"head",     builtin_head,     "first lines of a file [--n N]"},
    {"tail",     builtin_tail,     "last lines of a file [--n N]"},
    {"wc",       builtin_wc,       "count lines, words and bytes"},
    {"touch",    builtin_touch,    "create a file or update its time"},
    {"mkdir",    builtin_mkdir,    "create a directory [--p]"},
    {"rm",       builtin_rm,       "remove files [--r]"},
    {"cp",       builtin_cp,       "copy a file"},
    {"mv",       builtin_mv,       "move or rename a file"},
    {"grep",     builtin_grep,     "print lines matching a pattern [--i]"},
    {"find",     builtin_find,     "list files below a directory [--name]"},
    {"basename", builtin_basename, "last path component"},
    {"dirname",  builtin_dirname,  "path without its last component"},
    {"env",      builtin_env,      "list, read or set environment variables"},
    {"set",      builtin_set,      "set an environment variable"},
    {"get",      builtin_get,      "read an environment variable"},
    {"unset",    builtin_unset,    "remove environment variables"},
    {"alias",    builtin_alias,    "define an alias"},
    {"unalias",  builtin_unalias,  "remove an alias"},
    {"aliases",  builtin_aliases,  "list aliases"},
    {"upper",    builtin_upper,    "upper-case the arguments"},
    {"lower",    builtin_lower,    "lower-case the arguments"},
    {"reverse",  builtin_reverse,  "reverse the arguments"},
    {"sleep",    builtin_sleep,    "wait for a number of seconds"},
    {"true",     builtin_true,     "succeed"},
    {"false",    builtin_false,    "fail"},
    {"exit",     builtin_exit,     "end the run [code]"},
    {"help",     builtin_help,     "list commands or describe one"},
    {"whoami",   builtin_whoami,   "current user name"},
    {"date",     builtin_date,     "current date and time [--format]"},
    {"hostname", builtin_hostname, "name of this machine"},
    {"uname",    builtin_uname,    "operating system name [--a --r --m]"},
};

#define BUILTIN_COUNT ((int)(sizeof(builtins) / sizeof(builtins[0])))

BUILTIN(builtin_help) {
    (void)ctx;
    if (call->argc > 0) {
        const Builtin* b = builtins_find(call->args[0]);
        if (!b) return fail(result, 1, "help: no help for '%s'", call->args[0]);
        buffer_appendf(&result->out, "%s: %s\n", b->name, b->summary);
        return true;
    }
    for (int i = 0; i < BUILTIN_COUNT; i++)
        buffer_appendf(&result->out, "  %-10s %s\n", builtins[i].name, builtins[i].summary);
    buffer_append_str(&result->out, "  !mt a & b  run command lines concurrently\n");
    buffer_append_str(&result->out, "  !pwsh ...  run a line in PowerShell\n");
    buffer_append_str(&result->out, "  !cmd ...   run a line in the system shell\n");
    return true;
}

const Builtin* builtins_table(int* count) {
    *count = BUILTIN_COUNT;
    return builtins;
}

const Builtin* builtins_find(const char* name) {
    for (int i = 0; i < BUILTIN_COUNT; i++) {
        if (strcmp(builtins[i].name, name) == 0) return &builtins[i];
    }
    return nullptr;
}
