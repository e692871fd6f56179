#ifndef LUW_CHUNK_H
#define LUW_CHUNK_H

#include "value.h"

/* Operand encodings: idx16 is a little-endian constant index, off16 a
 * big-endian jump distance, n8 a single byte. */
typedef enum {
    OP_CONSTANT,        /* idx16 */
    OP_TRUE, OP_FALSE,

    /* Arithmetic */
    OP_ADD, OP_SUB, OP_MUL, OP_DIV, OP_MOD, OP_NEGATE,

    /* Comparison */
    OP_EQ, OP_NEQ, OP_LT, OP_GT, OP_LTE, OP_GTE,

    /* Logical */
    OP_NOT,

    /* Variables */
    OP_GET_VAR,         /* idx16 name */
    OP_SET_VAR,         /* idx16 name, pops */
    OP_GET_ENV,         /* idx16 name */
    OP_GET_STATUS,
    OP_GET_ARG,         /* n8 position */
    OP_GET_ARGC,
    OP_CONCAT,          /* n8 parts */

    /* Control flow */
    OP_JUMP, OP_JUMP_IF_FALSE, OP_LOOP,   /* off16 */
    OP_POP,

    /* Commands */
    OP_CALL,            /* idx16 name, n8 argc, n8 flagc; pushes the exit code */
    OP_CAPTURE,         /* same operands; pushes captured stdout */
    OP_SPAWN_CLUSTER,   /* n8 members, followed by that many OP_CONSTANTs */
    OP_JOIN_CLUSTER,

    /* Functions */
    OP_FUNCTION,        /* idx16 name, u16 body length; body follows inline */
    OP_RETURN,

    /* Directives */
    OP_SET_DEBUG,       /* n8 0 or 1 */

    OP_HALT,
} OpCode;

#define OP_COUNT (OP_HALT + 1)

typedef struct Chunk {
    uint8_t* code;
    int      count;
    int      capacity;
    int*     lines;
    Value*   constants;
    int      const_count;
    int      const_capacity;
} Chunk;

void        chunk_init(Chunk* chunk);
void        chunk_free(Chunk* chunk);
void        chunk_write(Chunk* chunk, uint8_t byte, int line);
/* Returns the index of an equal constant when one exists, otherwise appends it. */
int         chunk_add_constant(Chunk* chunk, Value value);
void        chunk_clone(const Chunk* from, Chunk* to);
/* Appends a constant without deduplicating; used by the decoder. */
void        chunk_push_constant(Chunk* chunk, Value value);

const char* opcode_name(uint8_t op);
/* Width in bytes (opcode plus operands) of the instruction at `offset`, 0 for an unknown opcode. */
int         instruction_width(uint8_t op);
uint16_t    read_u16_le(const uint8_t* p);
uint16_t    read_u16_be(const uint8_t* p);

void        chunk_disassemble(const Chunk* chunk, const char* name, FILE* out);

#endif
