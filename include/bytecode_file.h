#ifndef LUW_BYTECODE_FILE_H
#define LUW_BYTECODE_FILE_H

#include "buffer.h"
#include "chunk.h"
#include "error.h"

/*
 * .le artifact format (little-endian throughout):
 *
 *   Header (14 bytes):
 *     magic        : "LUWB"
 *     version      : uint8
 *     reserved     : uint8 (0)
 *     payload_len  : uint32
 *     checksum     : uint32  FNV-1a over the payload
 *
 *   Payload:
 *     const_count  : uint32
 *     constants    : [const_count entries]
 *       tag        : uint8 (0=int, 1=float, 2=string, 3=true, 4=false)
 *       data       : int64 | float64 bits | uint32 length + bytes | nothing
 *     code_len     : uint32
 *     code         : code_len bytes
 *     line_count   : uint32 (== code_len)
 *     lines        : line_count * int32
 */

#define BYTECODE_MAGIC       "LUWB"
#define BYTECODE_VERSION     1
#define BYTECODE_HEADER_SIZE 14

uint32_t bytecode_checksum(const uint8_t* data, size_t length);

void bytecode_encode(const Chunk* chunk, Buffer* out);

/* Never reads outside [bytes, bytes + length). On failure `out` is empty
 * and `err` holds a FormatError. */
bool bytecode_decode(const uint8_t* bytes, size_t length, Chunk* out, LuwError* err);

/* Checks operand indices, jump targets and cluster shape. */
bool bytecode_validate(const Chunk* chunk, LuwError* err);

bool bytecode_write(const char* path, const Chunk* chunk, LuwError* err);
bool bytecode_read(const char* path, Chunk* out, LuwError* err);

#endif
