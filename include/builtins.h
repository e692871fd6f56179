#ifndef LUW_BUILTINS_H
#define LUW_BUILTINS_H

#include "dispatch.h"

/* Immutable name -> function table, sorted by nothing in particular. */
const Builtin* builtins_table(int* count);
const Builtin* builtins_find(const char* name);

#endif
