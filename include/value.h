#ifndef LUW_VALUE_H
#define LUW_VALUE_H

#include "common.h"
#include "buffer.h"

typedef struct Obj Obj;
typedef struct ObjString ObjString;

/* VAL_NULL never reaches a script; it marks empty table slots. */
typedef enum { VAL_INT, VAL_FLOAT, VAL_BOOL, VAL_NULL, VAL_OBJ } ValueType;

typedef struct {
    ValueType type;
    union { int64_t integer; double floating; bool boolean; Obj* obj; } as;
} Value;

static inline Value INT_VAL(int64_t v)  { Value r; r.type = VAL_INT;   r.as.integer  = v; return r; }
static inline Value FLOAT_VAL(double v) { Value r; r.type = VAL_FLOAT; r.as.floating = v; return r; }
static inline Value BOOL_VAL(bool v)    { Value r; r.type = VAL_BOOL;  r.as.boolean  = v; return r; }
static inline Value OBJ_VAL(void* o)    { Value r; r.type = VAL_OBJ;   r.as.obj = (Obj*)o; return r; }
static inline Value NULL_VAL_MAKE()     { Value r; r.type = VAL_NULL;  r.as.integer  = 0; return r; }
#define NULL_VAL NULL_VAL_MAKE()

typedef enum { OBJ_STRING } ObjType;

/* Refcounts are plain ints: a value is only ever touched by the thread that owns its context. */
struct Obj       { ObjType type; int refcount; };
struct ObjString { Obj obj; int length; char* chars; uint32_t hash; };

#define IS_INT(v)      ((v).type == VAL_INT)
#define IS_FLOAT(v)    ((v).type == VAL_FLOAT)
#define IS_BOOL(v)     ((v).type == VAL_BOOL)
#define IS_NULL(v)     ((v).type == VAL_NULL)
#define IS_OBJ(v)      ((v).type == VAL_OBJ)
#define IS_NUMBER(v)   (IS_INT(v) || IS_FLOAT(v))
#define OBJ_TYPE(v)    (AS_OBJ(v)->type)
#define IS_STRING(v)   (IS_OBJ(v) && OBJ_TYPE(v) == OBJ_STRING)

#define AS_INT(v)      ((v).as.integer)
#define AS_FLOAT(v)    ((v).as.floating)
#define AS_BOOL(v)     ((v).as.boolean)
#define AS_OBJ(v)      ((v).as.obj)
#define AS_STRING(v)   ((ObjString*)AS_OBJ(v))
#define AS_CSTRING(v)  (((ObjString*)AS_OBJ(v))->chars)

/* Operators shared by the VM and the AST interpreter. */
typedef enum {
    BIN_ADD, BIN_SUB, BIN_MUL, BIN_DIV, BIN_MOD,
    BIN_EQ, BIN_NEQ, BIN_LT, BIN_GT, BIN_LTE, BIN_GTE,
} BinaryOp;

uint32_t    hash_string(const char* key, int length);
ObjString*  obj_string_new(const char* chars, int length);
/* Adopts a malloc'd buffer of `length` bytes plus terminator. */
ObjString*  obj_string_take(char* chars, int length);
Value       value_string(const char* chars, int length);
Value       value_cstring(const char* chars);

void        value_incref(Value v);
void        value_decref(Value v);
/* Fresh copy that shares no objects with `v`; used when forking contexts across threads. */
Value       value_clone(Value v);

bool        value_equal(Value a, Value b);    /* same type and same contents */
bool        value_truthy(Value v);
const char* value_type_name(Value v);
void        value_to_buffer(Value v, Buffer* out);
/* Caller frees. */
char*       value_to_cstring(Value v);
void        value_print(Value v, FILE* out);

/* Parses ints and numeric strings. Returns false for anything else. */
bool        value_as_numeric(Value v, Value* out);
/* Bools map to 0/1; numbers must fit an int. On failure `err` holds the fault message. */
bool        value_to_exit_code(Value v, int* out, char* err, int err_len);

/* Result is owned by the caller. On failure `err` holds the fault message. */
bool        value_binary(BinaryOp op, Value a, Value b, Value* out, char* err, int err_len);
bool        value_negate(Value a, Value* out, char* err, int err_len);

#endif
