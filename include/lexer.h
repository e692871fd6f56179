#ifndef LUW_LEXER_H
#define LUW_LEXER_H

#include "error.h"
#include "token.h"

typedef struct {
    const char* source;
    const char* start;
    const char* current;
    const char* line_start;
    int  line;
    bool space_before;
} Lexer;

void lexer_init(Lexer* lexer, const char* source);

/* Scans the whole source into `out` (terminated by TOKEN_EOF).
 * Returns false and fills `err` with a LexError on the first bad character. */
bool lexer_scan_tokens(Lexer* lexer, TokenList* out, LuwError* err);

#endif
