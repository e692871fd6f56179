#ifndef LUW_STREAM_H
#define LUW_STREAM_H

#include "buffer.h"
#include <mutex>

/* An output channel. Writes go to an optional FILE*, are optionally kept in
 * `captured`, and are forwarded to `parent`. Each write holds the lock for
 * its whole length, so concurrent writers interleave but never tear a write. */
typedef struct Stream {
    FILE*          sink;
    struct Stream* parent;
    bool           capturing;
    Buffer         captured;
    std::mutex     lock;
} Stream;

Stream* stream_new_file(FILE* sink);
/* Captures every write and forwards it to `parent` (which may be null). */
Stream* stream_new_capture(Stream* parent);
void    stream_free(Stream* stream);

void    stream_write(Stream* stream, const char* data, int length);
void    stream_puts(Stream* stream, const char* text);
void    stream_printf(Stream* stream, const char* fmt, ...);
/* Hands over the captured bytes (malloc'd) and clears them. */
char*   stream_take(Stream* stream);

#endif
