#ifndef LUW_VM_H
#define LUW_VM_H

#include "chunk.h"
#include "context.h"
#include "error.h"

typedef enum {
    VM_READY,
    VM_RUNNING,
    VM_SUSPENDED_ON_CLUSTER,
    VM_COMPLETED,
    VM_FAILED,
} VMState;

typedef struct {
    const Chunk*   chunk;
    const uint8_t* ip;
    Value*         slots;       /* stack top when the frame was entered */
    char**         args;        /* positional arguments of a function frame */
    int            argc;
    bool           is_function;
    Stream*        capture;     /* non-null when the call was a $(...) */
    Stream*        saved_out;
} CallFrame;

typedef struct {
    ExecContext* ctx;
    VMState      state;
    CallFrame    frames[MAX_FRAMES];
    int          frame_count;
    Value        stack[MAX_STACK];
    Value*       stack_top;
    int          pending_members;   /* opened by SPAWN_CLUSTER */
    LuwError*    err;
} VM;

void vm_init(VM* vm, ExecContext* ctx);
void vm_free(VM* vm);

/* Runs `chunk` to completion. Returns false when the run faults; `err` then
 * holds the RuntimeFault or DispatchError. The exit code of the run is left
 * in ctx->exit_code. Functions defined by the chunk point into it, so the
 * chunk must outlive the context or be adopted by it. */
bool vm_run(VM* vm, const Chunk* chunk, LuwError* err);

const char* vm_state_name(VMState state);

#endif
