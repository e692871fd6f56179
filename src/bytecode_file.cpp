#include "bytecode_file.h"
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>

enum { TAG_INT = 0, TAG_FLOAT = 1, TAG_STRING = 2, TAG_TRUE = 3, TAG_FALSE = 4 };

uint32_t bytecode_checksum(const uint8_t* data, size_t length) {
    uint32_t h = 2166136261u;
    for (size_t i = 0; i < length; i++) {
        h ^= data[i];
        h *= 16777619u;
    }
    return h;
}

/* ── Little-endian writers ────────────────────────── */
static void write_u8(Buffer* b, uint8_t v) { buffer_append_char(b, (char)v); }
static void write_u32(Buffer* b, uint32_t v) {
    char bytes[4] = { (char)(v), (char)(v >> 8), (char)(v >> 16), (char)(v >> 24) };
    buffer_append(b, bytes, 4);
}
static void write_u64(Buffer* b, uint64_t u) {
    char bytes[8];
    for (int i = 0; i < 8; i++) bytes[i] = (char)(u >> (i * 8));
    buffer_append(b, bytes, 8);
}

/* ── Bounds-checked reader ────────────────────────── */
typedef struct {
    const uint8_t* data;
    size_t         length;
    size_t         pos;
} Reader;

static bool read_u8(Reader* r, uint8_t* out) {
    if (r->length - r->pos < 1) return false;
    *out = r->data[r->pos++];
    return true;
}
static bool read_u32(Reader* r, uint32_t* out) {
    if (r->length - r->pos < 4) return false;
    const uint8_t* b = r->data + r->pos;
    *out = (uint32_t)b[0] | ((uint32_t)b[1] << 8) | ((uint32_t)b[2] << 16) | ((uint32_t)b[3] << 24);
    r->pos += 4;
    return true;
}
static bool read_u64(Reader* r, uint64_t* out) {
    if (r->length - r->pos < 8) return false;
    uint64_t u = 0;
    for (int i = 0; i < 8; i++) u |= ((uint64_t)r->data[r->pos + i] << (i * 8));
    r->pos += 8;
    *out = u;
    return true;
}
static bool read_bytes(Reader* r, size_t n, const uint8_t** out) {
    if (r->length - r->pos < n) return false;
    *out = r->data + r->pos;
    r->pos += n;
    return true;
}

static bool format_error(LuwError* err, FormatErrorCode code, const char* msg) {
    error_set(err, ERR_FORMAT, code, 0, 0, "%s: %s", format_error_name(code), msg);
    return false;
}

static bool invalid_at(LuwError* err, int offset, const char* msg) {
    error_set(err, ERR_FORMAT, FORMAT_INVALID_PROGRAM, 0, 0, "%s: %s at offset %d",
              format_error_name(FORMAT_INVALID_PROGRAM), msg, offset);
    return false;
}

/* ── Encode ───────────────────────────────────────── */
static void encode_payload(const Chunk* c, Buffer* b) {
    write_u32(b, (uint32_t)c->const_count);
    for (int i = 0; i < c->const_count; i++) {
        Value v = c->constants[i];
        if (IS_INT(v)) {
            write_u8(b, TAG_INT);
            write_u64(b, (uint64_t)AS_INT(v));
        } else if (IS_FLOAT(v)) {
            write_u8(b, TAG_FLOAT);
            uint64_t bits;
            double d = AS_FLOAT(v);
            memcpy(&bits, &d, sizeof(bits));
            write_u64(b, bits);
        } else if (IS_STRING(v)) {
            write_u8(b, TAG_STRING);
            write_u32(b, (uint32_t)AS_STRING(v)->length);
            buffer_append(b, AS_CSTRING(v), AS_STRING(v)->length);
        } else {
            write_u8(b, IS_BOOL(v) && AS_BOOL(v) ? TAG_TRUE : TAG_FALSE);
        }
    }

    write_u32(b, (uint32_t)c->count);
    buffer_append(b, (const char*)c->code, c->count);

    write_u32(b, (uint32_t)c->count);
    for (int i = 0; i < c->count; i++) write_u32(b, (uint32_t)(int32_t)c->lines[i]);
}

void bytecode_encode(const Chunk* c, Buffer* out) {
    Buffer payload;
    buffer_init(&payload);
    encode_payload(c, &payload);

    buffer_append(out, BYTECODE_MAGIC, 4);
    write_u8(out, BYTECODE_VERSION);
    write_u8(out, 0);
    write_u32(out, (uint32_t)payload.length);
    write_u32(out, bytecode_checksum((const uint8_t*)payload.data, payload.length));
    buffer_append(out, payload.data, payload.length);
    buffer_free(&payload);
}

/* ── Decode ───────────────────────────────────────── */
static bool decode_payload(Reader* r, Chunk* c, LuwError* err) {
    uint32_t const_count;
    if (!read_u32(r, &const_count)) return format_error(err, FORMAT_TRUNCATED, "constant pool cut short");
    if (const_count > MAX_CONSTANTS) return format_error(err, FORMAT_INVALID_PROGRAM, "constant pool too large");

    for (uint32_t i = 0; i < const_count; i++) {
        uint8_t tag;
        if (!read_u8(r, &tag)) return format_error(err, FORMAT_TRUNCATED, "constant pool cut short");
        Value v;
        uint64_t bits;
        switch (tag) {
        case TAG_INT:
            if (!read_u64(r, &bits)) return format_error(err, FORMAT_TRUNCATED, "constant pool cut short");
            v = INT_VAL((int64_t)bits);
            break;
        case TAG_FLOAT: {
            if (!read_u64(r, &bits)) return format_error(err, FORMAT_TRUNCATED, "constant pool cut short");
            double d;
            memcpy(&d, &bits, sizeof(d));
            v = FLOAT_VAL(d);
        } break;
        case TAG_STRING: {
            uint32_t len;
            const uint8_t* bytes;
            if (!read_u32(r, &len) || !read_bytes(r, len, &bytes))
                return format_error(err, FORMAT_TRUNCATED, "string constant cut short");
            if (len > INT32_MAX / 2) return format_error(err, FORMAT_INVALID_PROGRAM, "string constant too long");
            v = value_string((const char*)bytes, (int)len);
        } break;
        case TAG_TRUE:  v = BOOL_VAL(true); break;
        case TAG_FALSE: v = BOOL_VAL(false); break;
        default:
            return format_error(err, FORMAT_INVALID_PROGRAM, "unknown constant tag");
        }
        chunk_push_constant(c, v);
        value_decref(v);
    }

    uint32_t code_len;
    const uint8_t* code;
    if (!read_u32(r, &code_len) || !read_bytes(r, code_len, &code))
        return format_error(err, FORMAT_TRUNCATED, "instruction section cut short");

    uint32_t line_count;
    if (!read_u32(r, &line_count)) return format_error(err, FORMAT_TRUNCATED, "line table cut short");
    if (line_count != code_len) return format_error(err, FORMAT_INVALID_PROGRAM, "line table does not match code");
    if ((r->length - r->pos) / 4 < line_count) return format_error(err, FORMAT_TRUNCATED, "line table cut short");

    for (uint32_t i = 0; i < code_len; i++) {
        uint32_t line;
        read_u32(r, &line);
        chunk_write(c, code[i], (int)(int32_t)line);
    }

    if (r->pos != r->length) return format_error(err, FORMAT_INVALID_PROGRAM, "unexpected bytes after line table");
    return true;
}

bool bytecode_decode(const uint8_t* bytes, size_t length, Chunk* out, LuwError* err) {
    chunk_init(out);
    Reader r = { bytes, length, 0 };

    size_t magic_len = length < 4 ? length : 4;
    if (memcmp(bytes, BYTECODE_MAGIC, magic_len) != 0)
        return format_error(err, FORMAT_BAD_MAGIC, "not a LUW bytecode file");
    if (length < 4) return format_error(err, FORMAT_TRUNCATED, "header cut short");
    r.pos = 4;

    uint8_t version, reserved;
    if (!read_u8(&r, &version)) return format_error(err, FORMAT_TRUNCATED, "header cut short");
    if (version != BYTECODE_VERSION) {
        error_set(err, ERR_FORMAT, FORMAT_UNSUPPORTED_VERSION, 0, 0,
                  "%s: version %d not supported (expected %d)",
                  format_error_name(FORMAT_UNSUPPORTED_VERSION), version, BYTECODE_VERSION);
        return false;
    }

    uint32_t payload_len, checksum;
    if (!read_u8(&r, &reserved) || !read_u32(&r, &payload_len) || !read_u32(&r, &checksum))
        return format_error(err, FORMAT_TRUNCATED, "header cut short");
    if (length - r.pos < payload_len) return format_error(err, FORMAT_TRUNCATED, "payload cut short");
    if (length - r.pos > payload_len) return format_error(err, FORMAT_INVALID_PROGRAM, "unexpected bytes after payload");
    if (bytecode_checksum(bytes + r.pos, payload_len) != checksum)
        return format_error(err, FORMAT_CHECKSUM_MISMATCH, "payload does not match its checksum");

    if (!decode_payload(&r, out, err) || !bytecode_validate(out, err)) {
        chunk_free(out);
        return false;
    }
    return true;
}

/* ── Validation ───────────────────────────────────── */
static bool string_operand(const Chunk* c, int offset, LuwError* err) {
    uint16_t idx = read_u16_le(c->code + offset + 1);
    if (idx >= c->const_count) return invalid_at(err, offset, "constant index out of range");
    if (!IS_STRING(c->constants[idx])) return invalid_at(err, offset, "name operand is not a string");
    return true;
}

bool bytecode_validate(const Chunk* c, LuwError* err) {
    if (c->count == 0) return format_error(err, FORMAT_INVALID_PROGRAM, "empty instruction section");

    bool* boundary = (bool*)calloc(c->count + 1, sizeof(bool));
    bool ok = true;
    uint8_t last_op = OP_HALT;

    /* pass 1: decode every instruction and its operands */
    int offset = 0;
    while (ok && offset < c->count) {
        uint8_t op = c->code[offset];
        int width = instruction_width(op);
        if (width == 0) { ok = invalid_at(err, offset, "unknown opcode"); break; }
        if (offset + width > c->count) { ok = invalid_at(err, offset, "instruction cut short"); break; }
        boundary[offset] = true;
        last_op = op;

        switch ((OpCode)op) {
        case OP_CONSTANT:
            if (read_u16_le(c->code + offset + 1) >= c->const_count)
                ok = invalid_at(err, offset, "constant index out of range");
            break;
        case OP_GET_VAR: case OP_SET_VAR: case OP_GET_ENV:
        case OP_CALL: case OP_CAPTURE: case OP_FUNCTION:
            ok = string_operand(c, offset, err);
            break;
        case OP_GET_ARG:
            if (c->code[offset + 1] > 9) ok = invalid_at(err, offset, "positional argument out of range");
            break;
        case OP_SET_DEBUG:
            if (c->code[offset + 1] > 1) ok = invalid_at(err, offset, "bad debug switch");
            break;
        case OP_SPAWN_CLUSTER: {
            int members = c->code[offset + 1];
            if (members == 0) { ok = invalid_at(err, offset, "empty cluster"); break; }
            int at = offset + width;
            for (int i = 0; ok && i < members; i++) {
                if (at + 3 > c->count || c->code[at] != OP_CONSTANT) {
                    ok = invalid_at(err, offset, "cluster member is not a constant");
                    break;
                }
                if (!string_operand(c, at, err)) { ok = false; break; }
                boundary[at] = true;
                at += 3;
            }
            if (!ok) break;
            if (at >= c->count || c->code[at] != OP_JOIN_CLUSTER) {
                ok = invalid_at(err, offset, "cluster without JOIN_CLUSTER");
                break;
            }
            boundary[at] = true;
            last_op = OP_JOIN_CLUSTER;
            offset = at + 1;
            continue;
        }
        case OP_JOIN_CLUSTER:
            ok = invalid_at(err, offset, "JOIN_CLUSTER without SPAWN_CLUSTER");
            break;
        default:
            break;
        }
        offset += width;
    }
    if (ok) boundary[c->count] = true;
    if (ok && last_op != OP_HALT) ok = format_error(err, FORMAT_INVALID_PROGRAM, "program does not end with HALT");

    /* pass 2: every jump and function body lands on an instruction boundary */
    offset = 0;
    while (ok && offset < c->count) {
        uint8_t op = c->code[offset];
        int width = instruction_width(op);
        long target = -1;
        switch ((OpCode)op) {
        case OP_JUMP: case OP_JUMP_IF_FALSE:
            target = offset + 3 + (long)read_u16_be(c->code + offset + 1);
            break;
        case OP_LOOP:
            target = offset + 3 - (long)read_u16_be(c->code + offset + 1);
            break;
        case OP_FUNCTION:
            target = offset + 5 + (long)read_u16_le(c->code + offset + 3);
            break;
        default:
            break;
        }
        if (target != -1 && (target < 0 || target >= c->count || !boundary[target]))
            ok = invalid_at(err, offset, "jump target is not an instruction boundary");
        if (op == OP_SPAWN_CLUSTER) {
            /* skip over the member constants and the join */
            offset += width + 3 * c->code[offset + 1] + 1;
            continue;
        }
        offset += width;
    }

    free(boundary);
    return ok;
}

/* ── Files ────────────────────────────────────────── */
bool bytecode_write(const char* path, const Chunk* chunk, LuwError* err) {
    Buffer bytes;
    buffer_init(&bytes);
    bytecode_encode(chunk, &bytes);

    FILE* f = fopen(path, "wb");
    if (!f) {
        error_set(err, ERR_FORMAT, FORMAT_IO_ERROR, 0, 0, "%s: could not write '%s': %s",
                  format_error_name(FORMAT_IO_ERROR), path, strerror(errno));
        buffer_free(&bytes);
        return false;
    }
    bool ok = fwrite(bytes.data, 1, bytes.length, f) == (size_t)bytes.length;
    if (fclose(f) != 0) ok = false;
    buffer_free(&bytes);
    if (!ok) {
        error_set(err, ERR_FORMAT, FORMAT_IO_ERROR, 0, 0, "%s: short write to '%s'",
                  format_error_name(FORMAT_IO_ERROR), path);
    }
    return ok;
}

bool bytecode_read(const char* path, Chunk* out, LuwError* err) {
    chunk_init(out);
    FILE* f = fopen(path, "rb");
    if (!f) {
        error_set(err, ERR_FORMAT, FORMAT_IO_ERROR, 0, 0, "%s: could not open '%s': %s",
                  format_error_name(FORMAT_IO_ERROR), path, strerror(errno));
        return false;
    }
    Buffer bytes;
    buffer_init(&bytes);
    char block[4096];
    size_t n;
    while ((n = fread(block, 1, sizeof(block), f)) > 0) buffer_append(&bytes, block, (int)n);
    bool read_failed = ferror(f) != 0;
    fclose(f);
    if (read_failed) {
        buffer_free(&bytes);
        error_set(err, ERR_FORMAT, FORMAT_IO_ERROR, 0, 0, "%s: could not read '%s'",
                  format_error_name(FORMAT_IO_ERROR), path);
        return false;
    }
    static const uint8_t empty[1] = { 0 };
    const uint8_t* data = bytes.data ? (const uint8_t*)bytes.data : empty;
    bool ok = bytecode_decode(data, bytes.length, out, err);
    buffer_free(&bytes);
    return ok;
}
