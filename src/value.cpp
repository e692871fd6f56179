#include "value.h"
#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>

uint32_t hash_string(const char* key, int length) {
    uint32_t h = 2166136261u;
    for (int i = 0; i < length; i++) {
        h ^= (uint8_t)key[i];
        h *= 16777619u;
    }
    return h;
}

ObjString* obj_string_take(char* chars, int length) {
    ObjString* s = (ObjString*)malloc(sizeof(ObjString));
    s->obj.type = OBJ_STRING;
    s->obj.refcount = 1;
    s->length = length;
    s->chars = chars;
    s->hash = hash_string(chars, length);
    return s;
}

ObjString* obj_string_new(const char* chars, int length) {
    char* copy = (char*)malloc(length + 1);
    memcpy(copy, chars, length);
    copy[length] = '\0';
    return obj_string_take(copy, length);
}

Value value_string(const char* chars, int length) { return OBJ_VAL(obj_string_new(chars, length)); }
Value value_cstring(const char* chars) { return value_string(chars, (int)strlen(chars)); }

/* ── Ref counting ─────────────────────────────────── */
void value_incref(Value v) {
    if (!IS_OBJ(v) || !AS_OBJ(v)) return;
    AS_OBJ(v)->refcount++;
}

void value_decref(Value v) {
    if (!IS_OBJ(v) || !AS_OBJ(v)) return;
    Obj* o = AS_OBJ(v);
    if (--o->refcount > 0) return;
    switch (o->type) {
    case OBJ_STRING: free(((ObjString*)o)->chars); break;
    }
    free(o);
}

Value value_clone(Value v) {
    if (IS_STRING(v)) return value_string(AS_CSTRING(v), AS_STRING(v)->length);
    return v;
}

/* ── Utilities ────────────────────────────────────── */
bool value_equal(Value a, Value b) {
    if (a.type != b.type) return false;
    switch (a.type) {
    case VAL_INT:   return AS_INT(a) == AS_INT(b);
    case VAL_FLOAT: return memcmp(&a.as.floating, &b.as.floating, sizeof(double)) == 0;
    case VAL_BOOL:  return AS_BOOL(a) == AS_BOOL(b);
    case VAL_NULL:  return true;
    case VAL_OBJ: {
        ObjString* x = AS_STRING(a);
        ObjString* y = AS_STRING(b);
        return x->length == y->length && x->hash == y->hash && memcmp(x->chars, y->chars, x->length) == 0;
    }
    }
    return false;
}

bool value_truthy(Value v) {
    switch (v.type) {
    case VAL_BOOL:  return AS_BOOL(v);
    case VAL_INT:   return AS_INT(v) != 0;
    case VAL_FLOAT: return AS_FLOAT(v) != 0.0;
    case VAL_NULL:  return false;
    case VAL_OBJ:   return AS_STRING(v)->length > 0;
    }
    return false;
}

const char* value_type_name(Value v) {
    switch (v.type) {
    case VAL_INT:   return "int";
    case VAL_FLOAT: return "float";
    case VAL_BOOL:  return "bool";
    case VAL_NULL:  return "nothing";
    case VAL_OBJ:   return "string";
    }
    return "unknown";
}

static void format_float(double d, char* out, int len) {
    if (std::isnan(d)) { snprintf(out, len, "nan"); return; }
    if (std::isinf(d)) { snprintf(out, len, d < 0 ? "-inf" : "inf"); return; }
    snprintf(out, len, "%.15g", d);
    if (!strchr(out, '.') && !strchr(out, 'e')) strncat(out, ".0", len - strlen(out) - 1);
}

void value_to_buffer(Value v, Buffer* out) {
    char num[64];
    switch (v.type) {
    case VAL_INT:
        buffer_appendf(out, "%lld", (long long)AS_INT(v));
        break;
    case VAL_FLOAT:
        format_float(AS_FLOAT(v), num, sizeof(num));
        buffer_append_str(out, num);
        break;
    case VAL_BOOL:
        buffer_append_str(out, AS_BOOL(v) ? "true" : "false");
        break;
    case VAL_NULL:
        break;
    case VAL_OBJ:
        buffer_append(out, AS_CSTRING(v), AS_STRING(v)->length);
        break;
    }
}

char* value_to_cstring(Value v) {
    Buffer b;
    buffer_init(&b);
    value_to_buffer(v, &b);
    if (!b.data) buffer_append(&b, "", 0);
    return buffer_take(&b);
}

void value_print(Value v, FILE* out) {
    char* s = value_to_cstring(v);
    fputs(s, out);
    free(s);
}

static bool parse_numeric(const char* s, Value* out) {
    while (*s == ' ' || *s == '\t') s++;
    if (*s == '\0') return false;
    char* end;
    errno = 0;
    long long i = strtoll(s, &end, 10);
    const char* rest = end;
    while (*rest == ' ' || *rest == '\t') rest++;
    if (end != s && *rest == '\0' && errno == 0) {
        *out = INT_VAL((int64_t)i);
        return true;
    }
    double d = strtod(s, &end);
    rest = end;
    while (*rest == ' ' || *rest == '\t') rest++;
    if (end != s && *rest == '\0' && (isdigit((unsigned char)*s) || *s == '-' || *s == '+' || *s == '.')) {
        *out = FLOAT_VAL(d);
        return true;
    }
    return false;
}

bool value_as_numeric(Value v, Value* out) {
    if (IS_NUMBER(v)) { *out = v; return true; }
    if (IS_STRING(v)) return parse_numeric(AS_CSTRING(v), out);
    return false;
}

static bool exit_code_error(Value v, const char* fmt, char* err, int err_len) {
    char* text = value_to_cstring(v);
    snprintf(err, err_len, fmt, text);
    free(text);
    return false;
}

bool value_to_exit_code(Value v, int* out, char* err, int err_len) {
    if (IS_BOOL(v)) { *out = AS_BOOL(v) ? 0 : 1; return true; }
    Value n;
    if (!value_as_numeric(v, &n)) return exit_code_error(v, "cannot return '%s' as an exit code", err, err_len);
    bool in_range = IS_INT(n) ? AS_INT(n) >= INT_MIN && AS_INT(n) <= INT_MAX
                              : AS_FLOAT(n) >= (double)INT_MIN && AS_FLOAT(n) <= (double)INT_MAX;
    if (!in_range) return exit_code_error(v, "exit code '%s' out of range", err, err_len);
    *out = IS_INT(n) ? (int)AS_INT(n) : (int)AS_FLOAT(n);
    return true;
}

/* ── Operators ────────────────────────────────────── */
static const char* op_symbol(BinaryOp op) {
    switch (op) {
    case BIN_ADD: return "+";  case BIN_SUB: return "-";
    case BIN_MUL: return "*";  case BIN_DIV: return "/";
    case BIN_MOD: return "%";  case BIN_EQ:  return "==";
    case BIN_NEQ: return "!="; case BIN_LT:  return "<";
    case BIN_GT:  return ">";  case BIN_LTE: return "<=";
    case BIN_GTE: return ">=";
    }
    return "?";
}

static double as_double(Value n) { return IS_INT(n) ? (double)AS_INT(n) : AS_FLOAT(n); }

static int compare_strings(Value a, Value b) {
    char* x = value_to_cstring(a);
    char* y = value_to_cstring(b);
    int c = strcmp(x, y);
    free(x);
    free(y);
    return c;
}

static bool arithmetic(BinaryOp op, Value x, Value y, Value* out, char* err, int err_len) {
    if (IS_INT(x) && IS_INT(y)) {
        uint64_t a = (uint64_t)AS_INT(x), b = (uint64_t)AS_INT(y);
        switch (op) {
        case BIN_ADD: *out = INT_VAL((int64_t)(a + b)); return true;
        case BIN_SUB: *out = INT_VAL((int64_t)(a - b)); return true;
        case BIN_MUL: *out = INT_VAL((int64_t)(a * b)); return true;
        case BIN_DIV:
        case BIN_MOD:
            if (AS_INT(y) == 0) {
                snprintf(err, err_len, op == BIN_DIV ? "division by zero" : "modulo by zero");
                return false;
            }
            if (AS_INT(y) == -1) {
                *out = INT_VAL(op == BIN_DIV ? (int64_t)(0 - a) : 0);
                return true;
            }
            *out = INT_VAL(op == BIN_DIV ? AS_INT(x) / AS_INT(y) : AS_INT(x) % AS_INT(y));
            return true;
        default: break;
        }
    }
    double a = as_double(x), b = as_double(y);
    switch (op) {
    case BIN_ADD: *out = FLOAT_VAL(a + b); return true;
    case BIN_SUB: *out = FLOAT_VAL(a - b); return true;
    case BIN_MUL: *out = FLOAT_VAL(a * b); return true;
    case BIN_DIV: *out = FLOAT_VAL(a / b); return true;
    case BIN_MOD: *out = FLOAT_VAL(fmod(a, b)); return true;
    default: break;
    }
    snprintf(err, err_len, "bad operator");
    return false;
}

bool value_binary(BinaryOp op, Value a, Value b, Value* out, char* err, int err_len) {
    Value x, y;
    switch (op) {
    case BIN_ADD:
        if (value_as_numeric(a, &x) && value_as_numeric(b, &y)) return arithmetic(op, x, y, out, err, err_len);
        {
            Buffer joined;
            buffer_init(&joined);
            value_to_buffer(a, &joined);
            value_to_buffer(b, &joined);
            int len = joined.length;
            if (!joined.data) buffer_append(&joined, "", 0);
            *out = OBJ_VAL(obj_string_take(buffer_take(&joined), len));
        }
        return true;
    case BIN_SUB: case BIN_MUL: case BIN_DIV: case BIN_MOD:
        if (!value_as_numeric(a, &x) || !value_as_numeric(b, &y)) {
            snprintf(err, err_len, "operands of '%s' must be numbers (got %s and %s)",
                     op_symbol(op), value_type_name(a), value_type_name(b));
            return false;
        }
        return arithmetic(op, x, y, out, err, err_len);
    case BIN_EQ: case BIN_NEQ: {
        bool eq;
        if (value_as_numeric(a, &x) && value_as_numeric(b, &y))
            eq = (IS_INT(x) && IS_INT(y)) ? AS_INT(x) == AS_INT(y) : as_double(x) == as_double(y);
        else if (IS_BOOL(a) && IS_BOOL(b))
            eq = AS_BOOL(a) == AS_BOOL(b);
        else
            eq = compare_strings(a, b) == 0;
        *out = BOOL_VAL(op == BIN_EQ ? eq : !eq);
        return true;
    }
    case BIN_LT: case BIN_GT: case BIN_LTE: case BIN_GTE: {
        int c;
        if (value_as_numeric(a, &x) && value_as_numeric(b, &y)) {
            if (IS_INT(x) && IS_INT(y)) {
                c = AS_INT(x) < AS_INT(y) ? -1 : (AS_INT(x) > AS_INT(y) ? 1 : 0);
            } else {
                double p = as_double(x), q = as_double(y);
                c = p < q ? -1 : (p > q ? 1 : 0);
            }
        } else {
            c = compare_strings(a, b);
        }
        bool r = op == BIN_LT ? c < 0 : op == BIN_GT ? c > 0 : op == BIN_LTE ? c <= 0 : c >= 0;
        *out = BOOL_VAL(r);
        return true;
    }
    }
    snprintf(err, err_len, "unknown operator");
    return false;
}

bool value_negate(Value a, Value* out, char* err, int err_len) {
    Value n;
    if (!value_as_numeric(a, &n)) {
        snprintf(err, err_len, "operand of '-' must be a number (got %s)", value_type_name(a));
        return false;
    }
    *out = IS_INT(n) ? INT_VAL((int64_t)(0 - (uint64_t)AS_INT(n))) : FLOAT_VAL(-AS_FLOAT(n));
    return true;
}
