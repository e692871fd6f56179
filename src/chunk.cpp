#include "chunk.h"
#include <cstdio>
#include <cstdlib>

void chunk_init(Chunk* c) {
    c->code = nullptr; c->count = 0; c->capacity = 0;
    c->lines = nullptr;
    c->constants = nullptr; c->const_count = 0; c->const_capacity = 0;
}

void chunk_write(Chunk* c, uint8_t byte, int line) {
    if (c->count >= c->capacity) {
        int cap = c->capacity < 8 ? 8 : c->capacity * 2;
        c->code  = (uint8_t*)realloc(c->code, cap);
        c->lines = (int*)realloc(c->lines, sizeof(int) * cap);
        c->capacity = cap;
    }
    c->code[c->count]  = byte;
    c->lines[c->count] = line;
    c->count++;
}

void chunk_push_constant(Chunk* c, Value value) {
    if (c->const_count >= c->const_capacity) {
        int cap = c->const_capacity < 8 ? 8 : c->const_capacity * 2;
        c->constants = (Value*)realloc(c->constants, sizeof(Value) * cap);
        c->const_capacity = cap;
    }
    value_incref(value);
    c->constants[c->const_count++] = value;
}

int chunk_add_constant(Chunk* c, Value value) {
    for (int i = 0; i < c->const_count; i++) {
        if (value_equal(c->constants[i], value)) return i;
    }
    chunk_push_constant(c, value);
    return c->const_count - 1;
}

void chunk_clone(const Chunk* from, Chunk* to) {
    chunk_init(to);
    for (int i = 0; i < from->count; i++) chunk_write(to, from->code[i], from->lines[i]);
    for (int i = 0; i < from->const_count; i++) {
        Value v = value_clone(from->constants[i]);
        chunk_push_constant(to, v);
        value_decref(v);
    }
}

void chunk_free(Chunk* c) {
    for (int i = 0; i < c->const_count; i++) value_decref(c->constants[i]);
    free(c->code);
    free(c->lines);
    free(c->constants);
    chunk_init(c);
}

uint16_t read_u16_le(const uint8_t* p) { return (uint16_t)(p[0] | (p[1] << 8)); }
uint16_t read_u16_be(const uint8_t* p) { return (uint16_t)((p[0] << 8) | p[1]); }

const char* opcode_name(uint8_t op) {
    switch ((OpCode)op) {
    case OP_CONSTANT:      return "CONSTANT";
    case OP_TRUE:          return "TRUE";
    case OP_FALSE:         return "FALSE";
    case OP_ADD:           return "ADD";
    case OP_SUB:           return "SUB";
    case OP_MUL:           return "MUL";
    case OP_DIV:           return "DIV";
    case OP_MOD:           return "MOD";
    case OP_NEGATE:        return "NEGATE";
    case OP_EQ:            return "EQ";
    case OP_NEQ:           return "NEQ";
    case OP_LT:            return "LT";
    case OP_GT:            return "GT";
    case OP_LTE:           return "LTE";
    case OP_GTE:           return "GTE";
    case OP_NOT:           return "NOT";
    case OP_GET_VAR:       return "GET_VAR";
    case OP_SET_VAR:       return "SET_VAR";
    case OP_GET_ENV:       return "GET_ENV";
    case OP_GET_STATUS:    return "GET_STATUS";
    case OP_GET_ARG:       return "GET_ARG";
    case OP_GET_ARGC:      return "GET_ARGC";
    case OP_CONCAT:        return "CONCAT";
    case OP_JUMP:          return "JUMP";
    case OP_JUMP_IF_FALSE: return "JUMP_IF_FALSE";
    case OP_LOOP:          return "LOOP";
    case OP_POP:           return "POP";
    case OP_CALL:          return "CALL";
    case OP_CAPTURE:       return "CAPTURE";
    case OP_SPAWN_CLUSTER: return "SPAWN_CLUSTER";
    case OP_JOIN_CLUSTER:  return "JOIN_CLUSTER";
    case OP_FUNCTION:      return "FUNCTION";
    case OP_RETURN:        return "RETURN";
    case OP_SET_DEBUG:     return "SET_DEBUG";
    case OP_HALT:          return "HALT";
    }
    return "UNKNOWN";
}

int instruction_width(uint8_t op) {
    switch ((OpCode)op) {
    case OP_CONSTANT: case OP_GET_VAR: case OP_SET_VAR: case OP_GET_ENV:
    case OP_JUMP: case OP_JUMP_IF_FALSE: case OP_LOOP:
        return 3;
    case OP_GET_ARG: case OP_CONCAT: case OP_SPAWN_CLUSTER: case OP_SET_DEBUG:
        return 2;
    case OP_CALL: case OP_CAPTURE:
        return 5;
    case OP_FUNCTION:
        return 5;
    case OP_TRUE: case OP_FALSE:
    case OP_ADD: case OP_SUB: case OP_MUL: case OP_DIV: case OP_MOD: case OP_NEGATE:
    case OP_EQ: case OP_NEQ: case OP_LT: case OP_GT: case OP_LTE: case OP_GTE:
    case OP_NOT: case OP_GET_STATUS: case OP_GET_ARGC: case OP_POP:
    case OP_JOIN_CLUSTER: case OP_RETURN: case OP_HALT:
        return 1;
    }
    return 0;
}

static void print_constant(const Chunk* c, int idx, FILE* out) {
    if (idx >= c->const_count) { fprintf(out, "<bad %d>", idx); return; }
    Value v = c->constants[idx];
    if (IS_STRING(v)) fprintf(out, "\"%s\"", AS_CSTRING(v));
    else value_print(v, out);
}

void chunk_disassemble(const Chunk* c, const char* name, FILE* out) {
    fprintf(out, "== %s ==\n", name);
    int offset = 0;
    while (offset < c->count) {
        uint8_t op = c->code[offset];
        int width = instruction_width(op);
        fprintf(out, "%04d %4d %-14s", offset, c->lines[offset], opcode_name(op));
        if (width == 0 || offset + width > c->count) {
            fprintf(out, " <truncated>\n");
            return;
        }
        const uint8_t* operand = c->code + offset + 1;
        switch ((OpCode)op) {
        case OP_CONSTANT: case OP_GET_VAR: case OP_SET_VAR: case OP_GET_ENV:
            fprintf(out, " %4d ", read_u16_le(operand));
            print_constant(c, read_u16_le(operand), out);
            break;
        case OP_JUMP: case OP_JUMP_IF_FALSE:
            fprintf(out, " -> %d", offset + 3 + read_u16_be(operand));
            break;
        case OP_LOOP:
            fprintf(out, " -> %d", offset + 3 - read_u16_be(operand));
            break;
        case OP_GET_ARG: case OP_CONCAT: case OP_SPAWN_CLUSTER: case OP_SET_DEBUG:
            fprintf(out, " %d", operand[0]);
            break;
        case OP_CALL: case OP_CAPTURE:
            fprintf(out, " ");
            print_constant(c, read_u16_le(operand), out);
            fprintf(out, " args=%d flags=%d", operand[2], operand[3]);
            break;
        case OP_FUNCTION:
            fprintf(out, " ");
            print_constant(c, read_u16_le(operand), out);
            fprintf(out, " body=%d", read_u16_le(operand + 2));
            break;
        default:
            break;
        }
        fprintf(out, "\n");
        offset += width;
    }
}
