#ifndef LUW_TABLE_H
#define LUW_TABLE_H

#include "value.h"

typedef struct {
    ObjString* key;
    Value      value;
} TableEntry;

/* Open addressing, keys compared by contents. The table holds a reference
 * to every key and value it stores. */
typedef struct {
    TableEntry* entries;
    int         count;      /* live entries plus tombstones */
    int         capacity;
} Table;

void table_init(Table* table);
void table_free(Table* table);
bool table_set(Table* table, ObjString* key, Value value);
bool table_get(Table* table, ObjString* key, Value* out);
bool table_delete(Table* table, ObjString* key);

bool table_set_cstr(Table* table, const char* key, Value value);
bool table_get_cstr(Table* table, const char* key, Value* out);
bool table_delete_cstr(Table* table, const char* key);

/* Deep copy for handing a table to another thread. */
void table_clone(Table* from, Table* to);
int  table_size(Table* table);
/* Live keys sorted by byte order; free the array (not the keys) when done. */
ObjString** table_sorted_keys(Table* table, int* count);

#endif
