#ifndef LUW_BUFFER_H
#define LUW_BUFFER_H

#include "common.h"

/* Growable byte buffer. `data` is always NUL-terminated when non-null. */
typedef struct {
    char* data;
    int   length;
    int   capacity;
} Buffer;

void  buffer_init(Buffer* buf);
void  buffer_free(Buffer* buf);
void  buffer_clear(Buffer* buf);
void  buffer_append(Buffer* buf, const char* bytes, int length);
void  buffer_append_str(Buffer* buf, const char* str);
void  buffer_append_char(Buffer* buf, char c);
void  buffer_appendf(Buffer* buf, const char* fmt, ...);
const char* buffer_cstr(const Buffer* buf);
/* Hands the contents to the caller (malloc'd) and resets the buffer. */
char* buffer_take(Buffer* buf);

#endif
