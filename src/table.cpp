#include "table.h"
#include <cstdlib>
#include <cstring>

#define TABLE_MAX_LOAD 0.75

void table_init(Table* t) { t->entries = nullptr; t->count = 0; t->capacity = 0; }

void table_free(Table* t) {
    for (int i = 0; i < t->capacity; i++) {
        if (!t->entries[i].key) continue;
        value_decref(OBJ_VAL(t->entries[i].key));
        value_decref(t->entries[i].value);
    }
    free(t->entries);
    table_init(t);
}

static bool same_key(ObjString* a, ObjString* b) {
    return a == b || (a->hash == b->hash && a->length == b->length &&
                      memcmp(a->chars, b->chars, a->length) == 0);
}

static TableEntry* find_entry(TableEntry* entries, int cap, ObjString* key) {
    uint32_t idx = key->hash & (cap - 1);
    TableEntry* tombstone = nullptr;
    for (;;) {
        TableEntry* e = &entries[idx];
        if (e->key == nullptr) {
            if (IS_NULL(e->value)) return tombstone ? tombstone : e;
            if (!tombstone) tombstone = e;
        } else if (same_key(e->key, key)) {
            return e;
        }
        idx = (idx + 1) & (cap - 1);
    }
}

static void adjust_capacity(Table* t, int cap) {
    TableEntry* entries = (TableEntry*)calloc(cap, sizeof(TableEntry));
    for (int i = 0; i < cap; i++) { entries[i].key = nullptr; entries[i].value = NULL_VAL; }
    t->count = 0;
    for (int i = 0; i < t->capacity; i++) {
        TableEntry* src = &t->entries[i];
        if (!src->key) continue;
        TableEntry* dst = find_entry(entries, cap, src->key);
        dst->key = src->key;
        dst->value = src->value;
        t->count++;
    }
    free(t->entries);
    t->entries = entries;
    t->capacity = cap;
}

bool table_set(Table* t, ObjString* key, Value value) {
    if (t->count + 1 > t->capacity * TABLE_MAX_LOAD) {
        int cap = t->capacity < 8 ? 8 : t->capacity * 2;
        adjust_capacity(t, cap);
    }
    TableEntry* e = find_entry(t->entries, t->capacity, key);
    bool is_new = (e->key == nullptr);
    if (is_new && IS_NULL(e->value)) t->count++;
    value_incref(value);
    if (is_new) {
        value_incref(OBJ_VAL(key));
        e->key = key;
    } else {
        value_decref(e->value);
    }
    e->value = value;
    return is_new;
}

bool table_get(Table* t, ObjString* key, Value* out) {
    if (t->count == 0) return false;
    TableEntry* e = find_entry(t->entries, t->capacity, key);
    if (!e->key) return false;
    *out = e->value;
    return true;
}

bool table_delete(Table* t, ObjString* key) {
    if (t->count == 0) return false;
    TableEntry* e = find_entry(t->entries, t->capacity, key);
    if (!e->key) return false;
    value_decref(OBJ_VAL(e->key));
    value_decref(e->value);
    e->key = nullptr;
    e->value = BOOL_VAL(true); /* tombstone */
    return true;
}

bool table_set_cstr(Table* t, const char* key, Value value) {
    ObjString* k = obj_string_new(key, (int)strlen(key));
    bool is_new = table_set(t, k, value);
    value_decref(OBJ_VAL(k));
    return is_new;
}

bool table_get_cstr(Table* t, const char* key, Value* out) {
    if (t->count == 0) return false;
    ObjString lookup;
    lookup.obj.type = OBJ_STRING;
    lookup.obj.refcount = 1;
    lookup.chars = (char*)key;
    lookup.length = (int)strlen(key);
    lookup.hash = hash_string(key, lookup.length);
    return table_get(t, &lookup, out);
}

bool table_delete_cstr(Table* t, const char* key) {
    ObjString* k = obj_string_new(key, (int)strlen(key));
    bool found = table_delete(t, k);
    value_decref(OBJ_VAL(k));
    return found;
}

void table_clone(Table* from, Table* to) {
    table_init(to);
    for (int i = 0; i < from->capacity; i++) {
        TableEntry* e = &from->entries[i];
        if (!e->key) continue;
        ObjString* key = obj_string_new(e->key->chars, e->key->length);
        Value value = value_clone(e->value);
        table_set(to, key, value);
        value_decref(OBJ_VAL(key));
        value_decref(value);
    }
}

int table_size(Table* t) {
    int n = 0;
    for (int i = 0; i < t->capacity; i++) if (t->entries[i].key) n++;
    return n;
}

static int compare_keys(const void* a, const void* b) {
    ObjString* x = *(ObjString* const*)a;
    ObjString* y = *(ObjString* const*)b;
    return strcmp(x->chars, y->chars);
}

ObjString** table_sorted_keys(Table* t, int* count) {
    int n = table_size(t);
    ObjString** keys = (ObjString**)malloc(sizeof(ObjString*) * (n > 0 ? n : 1));
    int k = 0;
    for (int i = 0; i < t->capacity; i++) if (t->entries[i].key) keys[k++] = t->entries[i].key;
    qsort(keys, n, sizeof(ObjString*), compare_keys);
    *count = n;
    return keys;
}
