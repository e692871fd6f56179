#include "lexer.h"
#include <cstring>
#include <cstdlib>
#include <strings.h>

void lexer_init(Lexer* lex, const char* source) {
    lex->source = source;
    lex->start = source;
    lex->current = source;
    lex->line_start = source;
    lex->line = 1;
    lex->space_before = true;
}

static bool is_at_end(Lexer* l) { return *l->current == '\0'; }
static char advance(Lexer* l) { return *l->current++; }
static char peek(Lexer* l) { return *l->current; }
static char peek_next(Lexer* l) { return is_at_end(l) ? '\0' : l->current[1]; }

static bool match(Lexer* l, char expected) {
    if (is_at_end(l) || *l->current != expected) return false;
    l->current++; return true;
}

static bool is_word_start(char c) {
    return isalpha((unsigned char)c) || c == '_' || c == '.' || c == '~' || c == '?';
}

static bool is_word_char(char c) {
    return isalnum((unsigned char)c) || (c != '\0' && strchr("_./~*?:@%+-", c) != nullptr);
}

static bool is_name_char(char c) {
    return isalnum((unsigned char)c) || c == '_';
}

static int column_of(Lexer* l, const char* p) {
    return (int)(p - l->line_start) + 1;
}

static void emit(Lexer* l, TokenList* out, TokenType type) {
    Token t;
    t.type = type;
    t.start = l->start;
    t.length = (int)(l->current - l->start);
    t.line = l->line;
    t.column = column_of(l, l->start);
    t.space_before = l->space_before;
    tokenlist_write(out, t);
    l->space_before = false;
}

static void emit_span(Lexer* l, TokenList* out, TokenType type, const char* start, int length) {
    Token t;
    t.type = type;
    t.start = start;
    t.length = length;
    t.line = l->line;
    t.column = column_of(l, start);
    t.space_before = l->space_before;
    tokenlist_write(out, t);
    l->space_before = false;
}

static bool lex_error(Lexer* l, LuwError* err, const char* at, const char* fmt, char c) {
    error_set(err, ERR_LEX, 0, l->line, column_of(l, at), fmt, c);
    err->unexpected = c;
    return false;
}

static void skip_whitespace(Lexer* l) {
    for (;;) {
        char c = peek(l);
        if (c == ' ' || c == '\r' || c == '\t') {
            advance(l);
            l->space_before = true;
        } else if (c == '\\' && peek_next(l) == '\n') {
            /* line continuation */
            advance(l); advance(l);
            l->line++;
            l->line_start = l->current;
            l->space_before = true;
        } else if (c == '#') {
            while (!is_at_end(l) && peek(l) != '\n') advance(l);
        } else return;
    }
}

static TokenType keyword_type(const char* s, int len) {
    switch (s[0]) {
    case 'a': if (len == 3 && memcmp(s, "and", 3) == 0) return TOKEN_AND; break;
    case 'e': if (len == 4 && memcmp(s, "else", 4) == 0) return TOKEN_ELSE; break;
    case 'f':
        if (len == 4 && memcmp(s, "func", 4) == 0) return TOKEN_FUNC;
        if (len == 5 && memcmp(s, "false", 5) == 0) return TOKEN_FALSE;
        break;
    case 'i': if (len == 2 && s[1] == 'f') return TOKEN_IF; break;
    case 'n': if (len == 3 && memcmp(s, "not", 3) == 0) return TOKEN_NOT; break;
    case 'o': if (len == 2 && s[1] == 'r') return TOKEN_OR; break;
    case 'r': if (len == 6 && memcmp(s, "return", 6) == 0) return TOKEN_RETURN; break;
    case 't': if (len == 4 && memcmp(s, "true", 4) == 0) return TOKEN_TRUE; break;
    case 'w': if (len == 5 && memcmp(s, "while", 5) == 0) return TOKEN_WHILE; break;
    }
    return TOKEN_WORD;
}

/* `\&` is part of a word; the parser turns it into a literal '&'. */
static void scan_word(Lexer* l, TokenList* out) {
    for (;;) {
        if (is_word_char(peek(l))) {
            advance(l);
        } else if (peek(l) == '\\' && peek_next(l) == '&') {
            advance(l);
            advance(l);
        } else {
            break;
        }
    }
    emit(l, out, keyword_type(l->start, (int)(l->current - l->start)));
}

static void scan_number(Lexer* l, TokenList* out) {
    while (isdigit((unsigned char)peek(l))) advance(l);
    if (peek(l) == '.' && isdigit((unsigned char)peek_next(l))) {
        advance(l);
        while (isdigit((unsigned char)peek(l))) advance(l);
    }
    if (isalpha((unsigned char)peek(l)) || peek(l) == '_') {
        scan_word(l, out);
        return;
    }
    emit(l, out, TOKEN_NUMBER);
}

static bool scan_string(Lexer* l, TokenList* out, LuwError* err) {
    while (!is_at_end(l) && peek(l) != '"') {
        if (peek(l) == '\n') { l->line++; l->line_start = l->current + 1; }
        if (peek(l) == '\\') {
            const char* at = l->current;
            advance(l); /* skip backslash */
            if (is_at_end(l)) break;
            char escape = peek(l);
            if (escape != 'n' && escape != 't' && escape != '\\' &&
                escape != '"' && escape != 'r' && escape != '0' && escape != '$' && escape != '&') {
                return lex_error(l, err, at, "invalid escape sequence '\\%c'", escape);
            }
        }
        advance(l);
    }
    if (is_at_end(l)) return lex_error(l, err, l->start, "unterminated string starting with '%c'", '"');
    advance(l); /* closing " */
    emit(l, out, TOKEN_STRING);
    return true;
}

static bool scan_raw_string(Lexer* l, TokenList* out, LuwError* err) {
    while (!is_at_end(l) && peek(l) != '\'') {
        if (peek(l) == '\n') { l->line++; l->line_start = l->current + 1; }
        if (peek(l) == '\\' && (peek_next(l) == '\'' || peek_next(l) == '\\')) advance(l);
        advance(l);
    }
    if (is_at_end(l)) return lex_error(l, err, l->start, "unterminated string starting with '%c'", '\'');
    advance(l);
    emit(l, out, TOKEN_RAW_STRING);
    return true;
}

static bool scan_variable(Lexer* l, TokenList* out, LuwError* err) {
    char c = peek(l);
    if (c == '(') {
        advance(l);
        emit(l, out, TOKEN_DOLLAR_PAREN);
        return true;
    }
    if (c == '{') {
        advance(l);
        if (!isalpha((unsigned char)peek(l)) && peek(l) != '_')
            return lex_error(l, err, l->current, "unexpected character '%c' in ${...}", peek(l));
        while (is_name_char(peek(l))) advance(l);
        if (peek(l) != '}')
            return lex_error(l, err, l->current, "expected '}' to close ${...}, found '%c'", peek(l));
        advance(l);
        emit(l, out, TOKEN_VARIABLE);
        return true;
    }
    if (c == '?' || c == '#' || isdigit((unsigned char)c)) {
        advance(l);
        emit(l, out, TOKEN_VARIABLE);
        return true;
    }
    if (isalpha((unsigned char)c) || c == '_') {
        if (strncmp(l->current, "env:", 4) == 0 &&
            (isalpha((unsigned char)l->current[4]) || l->current[4] == '_')) {
            l->current += 4;
        }
        while (is_name_char(peek(l))) advance(l);
        emit(l, out, TOKEN_VARIABLE);
        return true;
    }
    return lex_error(l, err, l->start, "unexpected character '%c'", '$');
}

static const char* trim_end(const char* begin, const char* end) {
    while (end > begin && (end[-1] == ' ' || end[-1] == '\t' || end[-1] == '\r')) end--;
    return end;
}

/* Rest of the line after !pwsh / !cmd, verbatim. */
static void scan_raw_line(Lexer* l, TokenList* out) {
    while (peek(l) == ' ' || peek(l) == '\t') { advance(l); l->space_before = true; }
    const char* begin = l->current;
    while (!is_at_end(l) && peek(l) != '\n') advance(l);
    const char* end = trim_end(begin, l->current);
    emit_span(l, out, TOKEN_RAW_LINE, begin, (int)(end - begin));
}

/* Rest of the line after !mt, cut at every unescaped, unquoted '&'. */
static void scan_cluster_line(Lexer* l, TokenList* out) {
    while (peek(l) == ' ' || peek(l) == '\t') { advance(l); l->space_before = true; }
    const char* seg = l->current;
    char quote = '\0';
    while (!is_at_end(l) && peek(l) != '\n') {
        char c = peek(l);
        if (c == '\\' && peek_next(l) != '\0' && peek_next(l) != '\n') {
            advance(l); advance(l);
            continue;
        }
        if (quote) {
            if (c == quote) quote = '\0';
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '&') {
            emit_span(l, out, TOKEN_RAW_LINE, seg, (int)(trim_end(seg, l->current) - seg));
            l->start = l->current;
            advance(l);
            emit(l, out, TOKEN_AMPERSAND);
            while (peek(l) == ' ' || peek(l) == '\t') { advance(l); l->space_before = true; }
            seg = l->current;
            continue;
        }
        advance(l);
    }
    emit_span(l, out, TOKEN_RAW_LINE, seg, (int)(trim_end(seg, l->current) - seg));
}

static bool directive_is(const char* start, int len, const char* name) {
    return (int)strlen(name) == len && strncasecmp(start, name, len) == 0;
}

static void scan_directive(Lexer* l, TokenList* out) {
    while (is_name_char(peek(l)) || peek(l) == '-') advance(l);
    emit(l, out, TOKEN_DIRECTIVE);
    const char* name = l->start + 1;
    int len = (int)(l->current - name);
    if (directive_is(name, len, "pwsh") || directive_is(name, len, "cmd")) {
        scan_raw_line(l, out);
    } else if (directive_is(name, len, "mt") || directive_is(name, len, "multithread")) {
        scan_cluster_line(l, out);
    }
}

static bool scan_token(Lexer* l, TokenList* out, LuwError* err) {
    skip_whitespace(l);
    l->start = l->current;
    if (is_at_end(l)) {
        emit(l, out, TOKEN_EOF);
        return true;
    }

    char c = advance(l);

    if (c == '\n') {
        emit(l, out, TOKEN_NEWLINE);
        l->line++;
        l->line_start = l->current;
        l->space_before = true;
        return true;
    }
    if (isdigit((unsigned char)c)) { scan_number(l, out); return true; }
    if (is_word_start(c)) { scan_word(l, out); return true; }

    switch (c) {
    case '(': emit(l, out, TOKEN_LEFT_PAREN); return true;
    case ')': emit(l, out, TOKEN_RIGHT_PAREN); return true;
    case '{': emit(l, out, TOKEN_LEFT_BRACE); return true;
    case '}': emit(l, out, TOKEN_RIGHT_BRACE); return true;
    case ';': emit(l, out, TOKEN_SEMICOLON); return true;
    case '+': emit(l, out, TOKEN_PLUS); return true;
    case '%': emit(l, out, TOKEN_PERCENT); return true;
    case '-':
        if (peek(l) == '-' && (isalpha((unsigned char)peek_next(l)))) {
            advance(l);
            while (is_name_char(peek(l)) || peek(l) == '-') advance(l);
            emit(l, out, TOKEN_FLAG);
            return true;
        }
        emit(l, out, TOKEN_MINUS);
        return true;
    case '/':
    case '*':
        /* a path or glob when it opens a fresh argument */
        if (l->space_before && is_word_char(peek(l))) { scan_word(l, out); return true; }
        emit(l, out, c == '/' ? TOKEN_SLASH : TOKEN_STAR);
        return true;
    case '&':
        emit(l, out, match(l, '&') ? TOKEN_AND : TOKEN_AMPERSAND);
        return true;
    case '\\':
        if (peek(l) == '&') { advance(l); scan_word(l, out); return true; }
        return lex_error(l, err, l->start, "unexpected character '%c'", c);
    case '|':
        if (match(l, '|')) { emit(l, out, TOKEN_OR); return true; }
        return lex_error(l, err, l->start, "unexpected character '%c'", c);
    case '!':
        if (isalpha((unsigned char)peek(l))) { scan_directive(l, out); return true; }
        emit(l, out, match(l, '=') ? TOKEN_BANG_EQUAL : TOKEN_BANG);
        return true;
    case '=': emit(l, out, match(l, '=') ? TOKEN_EQUAL_EQUAL : TOKEN_EQUAL); return true;
    case '<': emit(l, out, match(l, '=') ? TOKEN_LESS_EQUAL : TOKEN_LESS); return true;
    case '>': emit(l, out, match(l, '=') ? TOKEN_GREATER_EQUAL : TOKEN_GREATER); return true;
    case '"': return scan_string(l, out, err);
    case '\'': return scan_raw_string(l, out, err);
    case '$': return scan_variable(l, out, err);
    }
    return lex_error(l, err, l->start, "unexpected character '%c'", c);
}

bool lexer_scan_tokens(Lexer* l, TokenList* out, LuwError* err) {
    for (;;) {
        if (!scan_token(l, out, err)) return false;
        if (out->count > 0 && out->tokens[out->count - 1].type == TOKEN_EOF) return true;
    }
}
