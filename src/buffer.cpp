#include "buffer.h"
#include <cstdio>
#include <cstdlib>
#include <cstring>

void buffer_init(Buffer* b) {
    b->data = nullptr;
    b->length = 0;
    b->capacity = 0;
}

void buffer_free(Buffer* b) {
    free(b->data);
    buffer_init(b);
}

void buffer_clear(Buffer* b) {
    b->length = 0;
    if (b->data) b->data[0] = '\0';
}

static void ensure(Buffer* b, int extra) {
    if (b->length + extra + 1 <= b->capacity) return;
    int cap = b->capacity < 64 ? 64 : b->capacity;
    while (cap < b->length + extra + 1) cap *= 2;
    b->data = (char*)realloc(b->data, cap);
    b->capacity = cap;
}

void buffer_append(Buffer* b, const char* bytes, int length) {
    if (length <= 0) {
        ensure(b, 0);
        b->data[b->length] = '\0';
        return;
    }
    ensure(b, length);
    memcpy(b->data + b->length, bytes, length);
    b->length += length;
    b->data[b->length] = '\0';
}

void buffer_append_str(Buffer* b, const char* str) {
    buffer_append(b, str, (int)strlen(str));
}

void buffer_append_char(Buffer* b, char c) {
    buffer_append(b, &c, 1);
}

void buffer_appendf(Buffer* b, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    va_list copy;
    va_copy(copy, args);
    int needed = vsnprintf(nullptr, 0, fmt, copy);
    va_end(copy);
    if (needed > 0) {
        ensure(b, needed);
        vsnprintf(b->data + b->length, needed + 1, fmt, args);
        b->length += needed;
    }
    va_end(args);
}

const char* buffer_cstr(const Buffer* b) {
    return b->data ? b->data : "";
}

char* buffer_take(Buffer* b) {
    char* out = b->data;
    if (!out) {
        out = (char*)malloc(1);
        out[0] = '\0';
    }
    buffer_init(b);
    return out;
}
