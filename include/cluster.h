#ifndef LUW_CLUSTER_H
#define LUW_CLUSTER_H

#include "context.h"

typedef struct {
    int    exit_code;
    Buffer out;          /* everything the member wrote, in its own order */
    Buffer err;
    bool   timed_out;
    long   elapsed_ms;
} ClusterResult;

/* Runs every line as its own task on its own thread with a forked copy of
 * `parent`, and returns once all of them are terminal. Build errors and
 * faults inside a member become that member's result; this never fails.
 * `timeout_ms` of 0 waits forever. Member output is forwarded to the
 * parent's streams as it is written. On return parent->exit_code holds the
 * first non-zero member code, or 0. `results` must have room for `count`. */
void cluster_run(char** lines, int count, ExecContext* parent, ExecMode mode,
                 int timeout_ms, ClusterResult* results);

void cluster_results_free(ClusterResult* results, int count);

#endif
