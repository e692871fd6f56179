#ifndef LUW_TOKEN_H
#define LUW_TOKEN_H

#include "common.h"

typedef enum {
    /* Single-character tokens */
    TOKEN_LEFT_PAREN, TOKEN_RIGHT_PAREN,
    TOKEN_LEFT_BRACE, TOKEN_RIGHT_BRACE,

    /* Arithmetic operators */
    TOKEN_PLUS, TOKEN_MINUS, TOKEN_STAR, TOKEN_SLASH, TOKEN_PERCENT,
    TOKEN_BANG,

    /* Comparison / assignment */
    TOKEN_EQUAL, TOKEN_EQUAL_EQUAL, TOKEN_BANG_EQUAL,
    TOKEN_LESS, TOKEN_GREATER,
    TOKEN_LESS_EQUAL, TOKEN_GREATER_EQUAL,

    /* Logical */
    TOKEN_AND, TOKEN_OR, TOKEN_NOT,

    /* Literals */
    TOKEN_NUMBER, TOKEN_STRING, TOKEN_RAW_STRING,
    TOKEN_WORD,
    TOKEN_VARIABLE,        /* $name ${name} $env:NAME $? $# $1 */
    TOKEN_DOLLAR_PAREN,    /* $( */
    TOKEN_FLAG,            /* --name */

    /* Keywords */
    TOKEN_IF, TOKEN_ELSE, TOKEN_WHILE, TOKEN_FUNC, TOKEN_RETURN,
    TOKEN_TRUE, TOKEN_FALSE,

    /* Directives */
    TOKEN_DIRECTIVE,       /* !name */
    TOKEN_RAW_LINE,        /* verbatim text after !pwsh / !cmd / !mt */
    TOKEN_AMPERSAND,       /* cluster join operator */

    /* Separators */
    TOKEN_NEWLINE, TOKEN_SEMICOLON,

    TOKEN_EOF,
} TokenType;

/* Coarse classification of token types. */
typedef enum {
    KIND_IDENTIFIER,
    KIND_STRING_LITERAL,
    KIND_NUMBER,
    KIND_OPERATOR,
    KIND_KEYWORD,
    KIND_SEPARATOR,
} TokenKind;

typedef struct {
    TokenType   type;
    const char* start;        /* points into the source text */
    int         length;
    int         line;
    int         column;
    bool        space_before; /* whitespace separates it from the previous token */
} Token;

typedef struct {
    Token* tokens;
    int count;
    int capacity;
} TokenList;

void        tokenlist_init(TokenList* list);
void        tokenlist_write(TokenList* list, Token token);
void        tokenlist_free(TokenList* list);
const char* token_type_name(TokenType type);
TokenKind   token_kind(TokenType type);

#endif
