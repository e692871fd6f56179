#include "token.h"

void tokenlist_init(TokenList* list) {
    list->tokens = nullptr;
    list->count = 0;
    list->capacity = 0;
}

void tokenlist_write(TokenList* list, Token token) {
    if (list->count >= list->capacity) {
        int cap = list->capacity < 8 ? 8 : list->capacity * 2;
        list->tokens = (Token*)realloc(list->tokens, sizeof(Token) * cap);
        list->capacity = cap;
    }
    list->tokens[list->count++] = token;
}

void tokenlist_free(TokenList* list) {
    free(list->tokens);
    tokenlist_init(list);
}

const char* token_type_name(TokenType type) {
    switch (type) {
        case TOKEN_LEFT_PAREN:    return "(";
        case TOKEN_RIGHT_PAREN:   return ")";
        case TOKEN_LEFT_BRACE:    return "{";
        case TOKEN_RIGHT_BRACE:   return "}";
        case TOKEN_PLUS:          return "+";
        case TOKEN_MINUS:         return "-";
        case TOKEN_STAR:          return "*";
        case TOKEN_SLASH:         return "/";
        case TOKEN_PERCENT:       return "%";
        case TOKEN_BANG:          return "!";
        case TOKEN_EQUAL:         return "=";
        case TOKEN_EQUAL_EQUAL:   return "==";
        case TOKEN_BANG_EQUAL:    return "!=";
        case TOKEN_LESS:          return "<";
        case TOKEN_GREATER:       return ">";
        case TOKEN_LESS_EQUAL:    return "<=";
        case TOKEN_GREATER_EQUAL: return ">=";
        case TOKEN_AND:           return "and";
        case TOKEN_OR:            return "or";
        case TOKEN_NOT:           return "not";
        case TOKEN_NUMBER:        return "NUMBER";
        case TOKEN_STRING:        return "STRING";
        case TOKEN_RAW_STRING:    return "STRING";
        case TOKEN_WORD:          return "WORD";
        case TOKEN_VARIABLE:      return "VARIABLE";
        case TOKEN_DOLLAR_PAREN:  return "$(";
        case TOKEN_FLAG:          return "FLAG";
        case TOKEN_IF:            return "if";
        case TOKEN_ELSE:          return "else";
        case TOKEN_WHILE:         return "while";
        case TOKEN_FUNC:          return "func";
        case TOKEN_RETURN:        return "return";
        case TOKEN_TRUE:          return "true";
        case TOKEN_FALSE:         return "false";
        case TOKEN_DIRECTIVE:     return "DIRECTIVE";
        case TOKEN_RAW_LINE:      return "RAW";
        case TOKEN_AMPERSAND:     return "&";
        case TOKEN_NEWLINE:       return "newline";
        case TOKEN_SEMICOLON:     return ";";
        case TOKEN_EOF:           return "EOF";
    }
    return "?";
}

TokenKind token_kind(TokenType type) {
    switch (type) {
    case TOKEN_WORD: case TOKEN_VARIABLE: case TOKEN_FLAG:
        return KIND_IDENTIFIER;
    case TOKEN_STRING: case TOKEN_RAW_STRING: case TOKEN_RAW_LINE:
        return KIND_STRING_LITERAL;
    case TOKEN_NUMBER:
        return KIND_NUMBER;
    case TOKEN_IF: case TOKEN_ELSE: case TOKEN_WHILE: case TOKEN_FUNC:
    case TOKEN_RETURN: case TOKEN_TRUE: case TOKEN_FALSE: case TOKEN_DIRECTIVE:
    case TOKEN_AND: case TOKEN_OR: case TOKEN_NOT:
        return KIND_KEYWORD;
    case TOKEN_NEWLINE: case TOKEN_SEMICOLON: case TOKEN_AMPERSAND: case TOKEN_EOF:
        return KIND_SEPARATOR;
    default:
        return KIND_OPERATOR;
    }
}
