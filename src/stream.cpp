#include "stream.h"
#include <cstdio>
#include <cstdlib>
#include <cstring>

Stream* stream_new_file(FILE* sink) {
    Stream* s = new Stream();
    s->sink = sink;
    s->parent = nullptr;
    s->capturing = false;
    buffer_init(&s->captured);
    return s;
}

Stream* stream_new_capture(Stream* parent) {
    Stream* s = new Stream();
    s->sink = nullptr;
    s->parent = parent;
    s->capturing = true;
    buffer_init(&s->captured);
    return s;
}

void stream_free(Stream* s) {
    if (!s) return;
    buffer_free(&s->captured);
    delete s;
}

void stream_write(Stream* s, const char* data, int length) {
    if (length <= 0) return;
    {
        std::lock_guard<std::mutex> guard(s->lock);
        if (s->capturing) buffer_append(&s->captured, data, length);
        if (s->sink) {
            fwrite(data, 1, length, s->sink);
            fflush(s->sink);
        }
    }
    if (s->parent) stream_write(s->parent, data, length);
}

void stream_puts(Stream* s, const char* text) {
    stream_write(s, text, (int)strlen(text));
}

void stream_printf(Stream* s, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    va_list copy;
    va_copy(copy, args);
    int needed = vsnprintf(nullptr, 0, fmt, copy);
    va_end(copy);
    if (needed > 0) {
        char* text = (char*)malloc(needed + 1);
        vsnprintf(text, needed + 1, fmt, args);
        stream_write(s, text, needed);
        free(text);
    }
    va_end(args);
}

char* stream_take(Stream* s) {
    std::lock_guard<std::mutex> guard(s->lock);
    return buffer_take(&s->captured);
}
