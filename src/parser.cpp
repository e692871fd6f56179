#include "parser.h"
#include "buffer.h"
#include "lexer.h"
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <strings.h>

typedef struct {
    TokenList* tokens;
    int        current;
    int        capture_depth;   /* open $( ... ) */
    bool       had_error;
    LuwError*  err;
} Parser;

/* ── Helpers ──────────────────────────────────────── */
static Token* peek_tok(Parser* p)    { return &p->tokens->tokens[p->current]; }
static Token* peek_next(Parser* p)   { return p->current + 1 < p->tokens->count ? &p->tokens->tokens[p->current + 1] : peek_tok(p); }
static Token* previous(Parser* p)    { return &p->tokens->tokens[p->current - 1]; }
static bool   is_at_end(Parser* p)   { return peek_tok(p)->type == TOKEN_EOF; }

static Token* advance_tok(Parser* p) {
    if (!is_at_end(p)) p->current++;
    return previous(p);
}

static bool check(Parser* p, TokenType t) { return !is_at_end(p) && peek_tok(p)->type == t; }

static bool match(Parser* p, TokenType t) {
    if (!check(p, t)) return false;
    advance_tok(p); return true;
}

static void describe(Token* t, char* out, int len) {
    switch (t->type) {
    case TOKEN_EOF:     snprintf(out, len, "end of input"); break;
    case TOKEN_NEWLINE: snprintf(out, len, "newline"); break;
    default:            snprintf(out, len, "'%.*s'", t->length > 40 ? 40 : t->length, t->start); break;
    }
}

static void error_at(Parser* p, Token* t, const char* expected) {
    if (p->had_error) return;
    p->had_error = true;
    char found[64];
    describe(t, found, sizeof(found));
    error_set(p->err, ERR_PARSE, 0, t->line, t->column, "expected %s, found %s", expected, found);
}

static void error_msg(Parser* p, Token* t, const char* msg) {
    if (p->had_error) return;
    p->had_error = true;
    error_set(p->err, ERR_PARSE, 0, t->line, t->column, "%s", msg);
}

static Token* consume(Parser* p, TokenType t, const char* expected) {
    if (peek_tok(p)->type == t) return advance_tok(p);
    error_at(p, peek_tok(p), expected);
    return nullptr;
}

static char* copy_lexeme_str(const char* str, int len) {
    char* s = (char*)malloc(len + 1);
    memcpy(s, str, len);
    s[len] = '\0';
    return s;
}

/* Word text with each `\&` turned into '&'. */
static void append_word(Buffer* b, const char* s, int len) {
    for (int i = 0; i < len; i++) {
        if (s[i] == '\\' && i + 1 < len && s[i + 1] == '&') i++;
        buffer_append_char(b, s[i]);
    }
}

static bool is_name_char(char c) { return isalnum((unsigned char)c) || c == '_'; }

static bool is_valid_name(const char* s, int len) {
    if (len == 0 || !(isalpha((unsigned char)s[0]) || s[0] == '_')) return false;
    for (int i = 1; i < len; i++) if (!is_name_char(s[i])) return false;
    return true;
}

static ASTNode* string_node(const char* s, int len, int line) {
    ASTNode* n = ast_new(NODE_STRING_LIT, line);
    n->as.string_literal.value = copy_lexeme_str(s, len);
    n->as.string_literal.length = len;
    return n;
}

/* `s` points at the '$' of a complete variable reference. */
static ASTNode* variable_node(const char* s, int len, int line) {
    ASTNode* n = ast_new(NODE_VARIABLE, line);
    const char* body = s + 1;
    int blen = len - 1;
    if (blen == 1 && body[0] == '?') {
        n->as.variable.kind = VAR_STATUS;
    } else if (blen == 1 && body[0] == '#') {
        n->as.variable.kind = VAR_ARGC;
    } else if (blen == 1 && isdigit((unsigned char)body[0])) {
        n->as.variable.kind = VAR_ARG;
        n->as.variable.index = body[0] - '0';
    } else if (body[0] == '{') {
        n->as.variable.kind = VAR_NAMED;
        n->as.variable.name = copy_lexeme_str(body + 1, blen - 2);
    } else if (blen > 4 && strncmp(body, "env:", 4) == 0) {
        n->as.variable.kind = VAR_ENV;
        n->as.variable.name = copy_lexeme_str(body + 4, blen - 4);
    } else {
        n->as.variable.kind = VAR_NAMED;
        n->as.variable.name = copy_lexeme_str(body, blen);
    }
    return n;
}

/* Length of the variable reference at s[0] == '$' inside a string, 0 if none. */
static int var_ref_length(const char* s, int len) {
    if (len < 2) return 0;
    char c = s[1];
    if (c == '?' || c == '#' || isdigit((unsigned char)c)) return 2;
    if (c == '{') {
        int i = 2;
        if (i >= len || !(isalpha((unsigned char)s[i]) || s[i] == '_')) return 0;
        while (i < len && is_name_char(s[i])) i++;
        return (i < len && s[i] == '}') ? i + 1 : 0;
    }
    if (isalpha((unsigned char)c) || c == '_') {
        int i = 1;
        if (len >= 6 && strncmp(s + 1, "env:", 4) == 0 &&
            (isalpha((unsigned char)s[5]) || s[5] == '_')) i = 5;
        while (i < len && is_name_char(s[i])) i++;
        return i;
    }
    return 0;
}

/* Decodes a double-quoted token into a STRING_LIT, or an INTERP when it references variables. */
static ASTNode* decode_string(Token* t) {
    const char* src = t->start + 1;
    int src_len = t->length - 2;
    Buffer text;
    buffer_init(&text);
    NodeList parts;
    nodelist_init(&parts);

    for (int i = 0; i < src_len; i++) {
        if (src[i] == '\\' && i + 1 < src_len) {
            i++;
            switch (src[i]) {
            case 'n':  buffer_append_char(&text, '\n'); break;
            case 't':  buffer_append_char(&text, '\t'); break;
            case 'r':  buffer_append_char(&text, '\r'); break;
            case '0':  buffer_append_char(&text, '\0'); break;
            default:   buffer_append_char(&text, src[i]); break;   /* \\ \" \$ */
            }
            continue;
        }
        if (src[i] == '$') {
            int ref = var_ref_length(src + i, src_len - i);
            if (ref > 0) {
                if (text.length > 0) {
                    nodelist_add(&parts, string_node(text.data, text.length, t->line));
                    buffer_clear(&text);
                }
                nodelist_add(&parts, variable_node(src + i, ref, t->line));
                i += ref - 1;
                continue;
            }
        }
        buffer_append_char(&text, src[i]);
    }

    ASTNode* n;
    if (parts.count == 0) {
        n = string_node(text.data ? text.data : "", text.length, t->line);
        nodelist_free(&parts);
    } else {
        if (text.length > 0) nodelist_add(&parts, string_node(text.data, text.length, t->line));
        n = ast_new(NODE_INTERP, t->line);
        n->as.interp = parts;
    }
    buffer_free(&text);
    return n;
}

static void decode_raw_string(Token* t, Buffer* out) {
    const char* src = t->start + 1;
    int src_len = t->length - 2;
    for (int i = 0; i < src_len; i++) {
        if (src[i] == '\\' && i + 1 < src_len && (src[i + 1] == '\'' || src[i + 1] == '\\')) i++;
        buffer_append_char(out, src[i]);
    }
}

/* ── Forward declarations ─────────────────────────── */
static ASTNode* expression(Parser* p);
static ASTNode* statement(Parser* p);
static ASTNode* command(Parser* p);

static ASTNode* capture(Parser* p, int line) {
    p->capture_depth++;
    ASTNode* cmd = command(p);
    p->capture_depth--;
    if (!cmd) return nullptr;
    if (!consume(p, TOKEN_RIGHT_PAREN, "')' to close '$('")) {
        ast_free(cmd);
        return nullptr;
    }
    ASTNode* n = ast_new(NODE_CAPTURE, line);
    n->as.child = cmd;
    return n;
}

/* ── Expressions (precedence climbing) ────────────── */
static ASTNode* primary(Parser* p) {
    if (match(p, TOKEN_NUMBER)) {
        Token* t = previous(p);
        char* s = copy_lexeme_str(t->start, t->length);
        ASTNode* n;
        if (strchr(s, '.')) {
            n = ast_new(NODE_FLOAT_LIT, t->line);
            n->as.float_literal = strtod(s, nullptr);
        } else {
            n = ast_new(NODE_INT_LIT, t->line);
            n->as.int_literal = strtoll(s, nullptr, 10);
        }
        free(s);
        return n;
    }
    if (match(p, TOKEN_STRING)) return decode_string(previous(p));
    if (match(p, TOKEN_RAW_STRING)) {
        Buffer b;
        buffer_init(&b);
        decode_raw_string(previous(p), &b);
        ASTNode* n = string_node(buffer_cstr(&b), b.length, previous(p)->line);
        buffer_free(&b);
        return n;
    }
    if (match(p, TOKEN_TRUE))  { ASTNode* n = ast_new(NODE_BOOL_LIT, previous(p)->line); n->as.bool_literal = true; return n; }
    if (match(p, TOKEN_FALSE)) { ASTNode* n = ast_new(NODE_BOOL_LIT, previous(p)->line); n->as.bool_literal = false; return n; }

    /* bare words are strings */
    if (match(p, TOKEN_WORD)) {
        Buffer b;
        buffer_init(&b);
        append_word(&b, previous(p)->start, previous(p)->length);
        ASTNode* n = string_node(buffer_cstr(&b), b.length, previous(p)->line);
        buffer_free(&b);
        return n;
    }
    if (match(p, TOKEN_VARIABLE)) return variable_node(previous(p)->start, previous(p)->length, previous(p)->line);
    if (match(p, TOKEN_LEFT_PAREN)) {
        ASTNode* expr = expression(p);
        if (!expr) return nullptr;
        if (!consume(p, TOKEN_RIGHT_PAREN, "')'")) { ast_free(expr); return nullptr; }
        return expr;
    }
    if (match(p, TOKEN_DOLLAR_PAREN)) return capture(p, previous(p)->line);

    error_at(p, peek_tok(p), "expression");
    return nullptr;
}

static ASTNode* unary(Parser* p) {
    if (match(p, TOKEN_MINUS) || match(p, TOKEN_BANG) || match(p, TOKEN_NOT)) {
        Token* op = previous(p);
        ASTNode* operand = unary(p);
        if (!operand) return nullptr;
        ASTNode* n = ast_new(NODE_UNARY, op->line);
        n->as.unary.op = op->type == TOKEN_MINUS ? TOKEN_MINUS : TOKEN_NOT;
        n->as.unary.operand = operand;
        return n;
    }
    return primary(p);
}

static ASTNode* make_binary(TokenType op, ASTNode* left, ASTNode* right, int line) {
    ASTNode* n = ast_new(NODE_BINARY, line);
    n->as.binary.op = op;
    n->as.binary.left = left;
    n->as.binary.right = right;
    return n;
}

typedef ASTNode* (*ParseFn)(Parser*);

static ASTNode* binary_level(Parser* p, ParseFn next, const TokenType* ops, int op_count) {
    ASTNode* left = next(p);
    while (left) {
        TokenType found = TOKEN_EOF;
        for (int i = 0; i < op_count; i++) {
            if (check(p, ops[i])) { found = ops[i]; break; }
        }
        if (found == TOKEN_EOF) break;
        Token* op = advance_tok(p);
        ASTNode* right = next(p);
        if (!right) { ast_free(left); return nullptr; }
        left = make_binary(found, left, right, op->line);
    }
    return left;
}

static ASTNode* factor(Parser* p) {
    static const TokenType ops[] = { TOKEN_STAR, TOKEN_SLASH, TOKEN_PERCENT };
    return binary_level(p, unary, ops, 3);
}

static ASTNode* term(Parser* p) {
    static const TokenType ops[] = { TOKEN_PLUS, TOKEN_MINUS };
    return binary_level(p, factor, ops, 2);
}

static ASTNode* comparison(Parser* p) {
    static const TokenType ops[] = { TOKEN_LESS, TOKEN_GREATER, TOKEN_LESS_EQUAL, TOKEN_GREATER_EQUAL };
    return binary_level(p, term, ops, 4);
}

static ASTNode* equality(Parser* p) {
    static const TokenType ops[] = { TOKEN_EQUAL_EQUAL, TOKEN_BANG_EQUAL };
    return binary_level(p, comparison, ops, 2);
}

static ASTNode* and_expr(Parser* p) {
    static const TokenType ops[] = { TOKEN_AND };
    return binary_level(p, equality, ops, 1);
}

static ASTNode* or_expr(Parser* p) {
    static const TokenType ops[] = { TOKEN_OR };
    return binary_level(p, and_expr, ops, 1);
}

static ASTNode* expression(Parser* p) { return or_expr(p); }

/* ── Command arguments ────────────────────────────── */
static bool is_terminator(Parser* p, Token* t) {
    switch (t->type) {
    case TOKEN_NEWLINE: case TOKEN_SEMICOLON: case TOKEN_EOF: case TOKEN_RIGHT_BRACE:
        return true;
    case TOKEN_RIGHT_PAREN:
        return p->capture_depth > 0;
    default:
        return false;
    }
}

/* A flag stands alone when nothing is glued to it. */
static bool is_standalone_flag(Parser* p) {
    if (peek_tok(p)->type != TOKEN_FLAG) return false;
    Token* next = peek_next(p);
    return is_terminator(p, next) || next->space_before;
}

typedef struct {
    NodeList parts;
    Buffer   text;
    int      line;
} ArgBuilder;

static void arg_flush(ArgBuilder* a) {
    if (a->text.length == 0) return;
    nodelist_add(&a->parts, string_node(a->text.data, a->text.length, a->line));
    buffer_clear(&a->text);
}

static void arg_add(ArgBuilder* a, ASTNode* part) {
    arg_flush(a);
    nodelist_add(&a->parts, part);
}

static void arg_discard(ArgBuilder* a) {
    for (int i = 0; i < a->parts.count; i++) ast_free(a->parts.nodes[i]);
    nodelist_free(&a->parts);
    buffer_free(&a->text);
}

static ASTNode* arg_finish(ArgBuilder* a) {
    arg_flush(a);
    ASTNode* result;
    if (a->parts.count == 0) {
        result = string_node("", 0, a->line);
        nodelist_free(&a->parts);
    } else if (a->parts.count == 1) {
        result = a->parts.nodes[0];
        nodelist_free(&a->parts);
    } else {
        result = ast_new(NODE_INTERP, a->line);
        result->as.interp = a->parts;
    }
    buffer_free(&a->text);
    return result;
}

/* One argument: a run of tokens with no whitespace between them. */
static ASTNode* argument(Parser* p) {
    ArgBuilder a;
    nodelist_init(&a.parts);
    buffer_init(&a.text);
    a.line = peek_tok(p)->line;

    bool first = true;
    while (!p->had_error) {
        Token* t = peek_tok(p);
        if (is_terminator(p, t)) break;
        if (!first && t->space_before) break;
        if (t->type == TOKEN_AMPERSAND) {
            error_msg(p, t, "'&' is only allowed on a !mt line");
            break;
        }
        first = false;
        advance_tok(p);

        switch (t->type) {
        case TOKEN_STRING: {
            ASTNode* s = decode_string(t);
            if (s->type == NODE_STRING_LIT) {
                buffer_append(&a.text, s->as.string_literal.value, s->as.string_literal.length);
            } else {
                for (int i = 0; i < s->as.interp.count; i++) {
                    ASTNode* part = s->as.interp.nodes[i];
                    if (part->type == NODE_STRING_LIT) {
                        buffer_append(&a.text, part->as.string_literal.value, part->as.string_literal.length);
                        ast_free(part);
                    } else {
                        arg_add(&a, part);
                    }
                }
                s->as.interp.count = 0;
            }
            ast_free(s);
            break;
        }
        case TOKEN_RAW_STRING:
            decode_raw_string(t, &a.text);
            break;
        case TOKEN_VARIABLE:
            arg_add(&a, variable_node(t->start, t->length, t->line));
            break;
        case TOKEN_DOLLAR_PAREN: {
            ASTNode* c = capture(p, t->line);
            if (c) arg_add(&a, c);
            break;
        }
        case TOKEN_LEFT_PAREN: {
            ASTNode* e = expression(p);
            if (!e) break;
            if (!consume(p, TOKEN_RIGHT_PAREN, "')'")) { ast_free(e); break; }
            arg_add(&a, e);
            break;
        }
        default:
            append_word(&a.text, t->start, t->length);
            break;
        }
    }

    if (p->had_error) {
        arg_discard(&a);
        return nullptr;
    }
    return arg_finish(&a);
}

static bool is_plain_piece(TokenType type) {
    switch (type) {
    case TOKEN_STRING: case TOKEN_RAW_STRING: case TOKEN_VARIABLE:
    case TOKEN_DOLLAR_PAREN: case TOKEN_LEFT_PAREN: case TOKEN_AMPERSAND:
        return false;
    default:
        return true;
    }
}

static ASTNode* command(Parser* p) {
    Token* name_tok = peek_tok(p);
    if (name_tok->type != TOKEN_WORD && name_tok->type != TOKEN_TRUE && name_tok->type != TOKEN_FALSE) {
        error_at(p, name_tok, "command name");
        return nullptr;
    }
    advance_tok(p);

    Buffer name;
    buffer_init(&name);
    append_word(&name, name_tok->start, name_tok->length);
    while (!is_terminator(p, peek_tok(p)) && !peek_tok(p)->space_before && is_plain_piece(peek_tok(p)->type)) {
        Token* t = advance_tok(p);
        append_word(&name, t->start, t->length);
    }

    ASTNode* cmd = ast_new(NODE_COMMAND, name_tok->line);
    cmd->as.command.name = buffer_take(&name);
    cmd->as.command.shell = SHELL_NONE;
    nodelist_init(&cmd->as.command.args);

    while (!is_terminator(p, peek_tok(p))) {
        if (is_standalone_flag(p)) {
            Token* flag = advance_tok(p);
            char* flag_name = copy_lexeme_str(flag->start + 2, flag->length - 2);
            ASTNode* value;
            if (is_terminator(p, peek_tok(p)) || is_standalone_flag(p)) {
                value = string_node("", 0, flag->line);
            } else {
                value = argument(p);
                if (!value) { free(flag_name); ast_free(cmd); return nullptr; }
            }
            ast_command_set_flag(cmd, flag_name, value);
            continue;
        }
        ASTNode* arg = argument(p);
        if (!arg) { ast_free(cmd); return nullptr; }
        nodelist_add(&cmd->as.command.args, arg);
    }
    return cmd;
}

/* ── Statements ───────────────────────────────────── */
static bool directive_is(Token* t, const char* name) {
    int len = t->length - 1;
    return (int)strlen(name) == len && strncasecmp(t->start + 1, name, len) == 0;
}

static bool starts_with_word(const char* s, const char* word) {
    size_t n = strlen(word);
    return strncasecmp(s, word, n) == 0 && (s[n] == '\0' || s[n] == ' ' || s[n] == '\t');
}

/* Trims surrounding blanks. An escaped "\&" stays escaped for the member's own lexer. */
static char* cluster_segment(Token* raw) {
    const char* s = raw->start;
    int begin = 0, end = raw->length;
    while (begin < end && (s[begin] == ' ' || s[begin] == '\t')) begin++;
    while (end > begin && (s[end - 1] == ' ' || s[end - 1] == '\t')) end--;
    return copy_lexeme_str(s + begin, end - begin);
}

static ASTNode* cluster_statement(Parser* p, Token* directive) {
    ASTNode* c = ast_new(NODE_CLUSTER, directive->line);
    const char* prefix = nullptr;
    bool first = true;
    do {
        Token* raw = consume(p, TOKEN_RAW_LINE, "command line");
        if (!raw) { ast_free(c); return nullptr; }
        char* seg = cluster_segment(raw);
        if (seg[0] == '\0') { free(seg); continue; }
        if (first) {
            if (starts_with_word(seg, "!pwsh")) prefix = "!pwsh";
            else if (starts_with_word(seg, "!cmd")) prefix = "!cmd";
            first = false;
        } else if (prefix && seg[0] != '!') {
            Buffer b;
            buffer_init(&b);
            buffer_appendf(&b, "%s %s", prefix, seg);
            free(seg);
            seg = buffer_take(&b);
        }
        ast_cluster_add(c, seg);
    } while (match(p, TOKEN_AMPERSAND));

    if (c->as.cluster.count == 0) {
        error_msg(p, directive, "expected at least one command after '!mt'");
        ast_free(c);
        return nullptr;
    }
    return c;
}

static ASTNode* directive_statement(Parser* p) {
    Token* t = advance_tok(p);
    if (directive_is(t, "mt") || directive_is(t, "multithread")) return cluster_statement(p, t);

    if (directive_is(t, "pwsh") || directive_is(t, "cmd")) {
        bool pwsh = directive_is(t, "pwsh");
        Token* raw = consume(p, TOKEN_RAW_LINE, "command line");
        if (!raw) return nullptr;
        if (raw->length == 0) {
            error_msg(p, t, pwsh ? "expected a command line after '!pwsh'" : "expected a command line after '!cmd'");
            return nullptr;
        }
        ASTNode* cmd = ast_new(NODE_COMMAND, t->line);
        cmd->as.command.name = copy_lexeme_str(pwsh ? "!pwsh" : "!cmd", pwsh ? 5 : 4);
        cmd->as.command.shell = pwsh ? SHELL_PWSH : SHELL_CMD;
        nodelist_init(&cmd->as.command.args);
        nodelist_add(&cmd->as.command.args, string_node(raw->start, raw->length, raw->line));
        return cmd;
    }

    ASTNode* d = ast_new(NODE_DIRECTIVE, t->line);
    d->as.directive = copy_lexeme_str(t->start + 1, t->length - 1);
    return d;
}

static ASTNode* block(Parser* p) {
    Token* open = consume(p, TOKEN_LEFT_BRACE, "'{'");
    if (!open) return nullptr;
    ASTNode* b = ast_new(NODE_BLOCK, open->line);
    nodelist_init(&b->as.block);
    for (;;) {
        while (match(p, TOKEN_NEWLINE) || match(p, TOKEN_SEMICOLON)) {}
        if (match(p, TOKEN_RIGHT_BRACE)) return b;
        if (is_at_end(p)) {
            error_at(p, peek_tok(p), "'}'");
            ast_free(b);
            return nullptr;
        }
        ASTNode* s = statement(p);
        if (!s) { ast_free(b); return nullptr; }
        nodelist_add(&b->as.block, s);
        if (peek_tok(p)->type != TOKEN_RIGHT_BRACE && !match(p, TOKEN_NEWLINE) && !match(p, TOKEN_SEMICOLON)) {
            error_at(p, peek_tok(p), "newline or ';'");
            ast_free(b);
            return nullptr;
        }
    }
}

static ASTNode* if_statement(Parser* p) {
    int line = advance_tok(p)->line;
    ASTNode* cond = expression(p);
    if (!cond) return nullptr;
    ASTNode* then_b = block(p);
    if (!then_b) { ast_free(cond); return nullptr; }

    ASTNode* else_b = nullptr;
    int save = p->current;
    while (match(p, TOKEN_NEWLINE)) {}
    if (match(p, TOKEN_ELSE)) {
        else_b = check(p, TOKEN_IF) ? if_statement(p) : block(p);
        if (!else_b) { ast_free(cond); ast_free(then_b); return nullptr; }
    } else {
        p->current = save;
    }

    ASTNode* n = ast_new(NODE_IF, line);
    n->as.if_stmt.cond = cond;
    n->as.if_stmt.then_b = then_b;
    n->as.if_stmt.else_b = else_b;
    return n;
}

static ASTNode* while_statement(Parser* p) {
    int line = advance_tok(p)->line;
    ASTNode* cond = expression(p);
    if (!cond) return nullptr;
    ASTNode* body = block(p);
    if (!body) { ast_free(cond); return nullptr; }
    ASTNode* n = ast_new(NODE_WHILE, line);
    n->as.while_stmt.cond = cond;
    n->as.while_stmt.body = body;
    return n;
}

static ASTNode* func_statement(Parser* p) {
    int line = advance_tok(p)->line;
    Token* name = consume(p, TOKEN_WORD, "function name");
    if (!name) return nullptr;
    ASTNode* body = block(p);
    if (!body) return nullptr;
    ASTNode* n = ast_new(NODE_FUNC_DECL, line);
    n->as.func_decl.name = copy_lexeme_str(name->start, name->length);
    n->as.func_decl.body = body;
    return n;
}

static ASTNode* return_statement(Parser* p) {
    int line = advance_tok(p)->line;
    ASTNode* value = nullptr;
    if (!is_terminator(p, peek_tok(p))) {
        value = expression(p);
        if (!value) return nullptr;
    }
    ASTNode* n = ast_new(NODE_RETURN, line);
    n->as.child = value;
    return n;
}

static ASTNode* assignment(Parser* p, const char* name, int len) {
    Token* target = advance_tok(p);
    advance_tok(p); /* '=' */
    if (!is_valid_name(name, len)) {
        error_msg(p, target, "invalid variable name in assignment");
        return nullptr;
    }
    ASTNode* value = expression(p);
    if (!value) return nullptr;
    ASTNode* n = ast_new(NODE_ASSIGN, target->line);
    n->as.assign.name = copy_lexeme_str(name, len);
    n->as.assign.value = value;
    return n;
}

static ASTNode* statement(Parser* p) {
    Token* t = peek_tok(p);
    switch (t->type) {
    case TOKEN_DIRECTIVE: return directive_statement(p);
    case TOKEN_IF:        return if_statement(p);
    case TOKEN_WHILE:     return while_statement(p);
    case TOKEN_FUNC:      return func_statement(p);
    case TOKEN_RETURN:    return return_statement(p);
    case TOKEN_WORD:
        if (peek_next(p)->type == TOKEN_EQUAL) return assignment(p, t->start, t->length);
        return command(p);
    case TOKEN_VARIABLE:
        if (peek_next(p)->type == TOKEN_EQUAL) {
            /* $name = expr */
            if (t->length > 1 && (isalpha((unsigned char)t->start[1]) || t->start[1] == '_') &&
                strncmp(t->start + 1, "env:", 4) != 0)
                return assignment(p, t->start + 1, t->length - 1);
        }
        error_at(p, t, "statement");
        return nullptr;
    case TOKEN_TRUE:
    case TOKEN_FALSE:
        return command(p);
    default:
        error_at(p, t, "statement");
        return nullptr;
    }
}

ASTNode* parser_parse(TokenList* tokens, LuwError* err) {
    Parser p;
    p.tokens = tokens;
    p.current = 0;
    p.capture_depth = 0;
    p.had_error = false;
    p.err = err;

    ASTNode* program = ast_new(NODE_PROGRAM, 1);
    nodelist_init(&program->as.program);
    for (;;) {
        while (match(&p, TOKEN_NEWLINE) || match(&p, TOKEN_SEMICOLON)) {}
        if (is_at_end(&p)) break;
        ASTNode* s = statement(&p);
        if (!s || p.had_error) {
            ast_free(s);
            ast_free(program);
            return nullptr;
        }
        nodelist_add(&program->as.program, s);
        if (is_at_end(&p)) break;
        if (!match(&p, TOKEN_NEWLINE) && !match(&p, TOKEN_SEMICOLON)) {
            error_at(&p, peek_tok(&p), "newline or ';'");
            ast_free(program);
            return nullptr;
        }
    }
    return program;
}

ASTNode* parse_source(const char* source, LuwError* err) {
    Lexer lexer;
    lexer_init(&lexer, source);
    TokenList tokens;
    tokenlist_init(&tokens);
    ASTNode* program = nullptr;
    if (lexer_scan_tokens(&lexer, &tokens, err)) program = parser_parse(&tokens, err);
    tokenlist_free(&tokens);
    return program;
}
