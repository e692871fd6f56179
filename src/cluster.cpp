#include "cluster.h"
#include "log.h"
#include "run.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>

typedef std::chrono::steady_clock Clock;

/* One completion message per member. */
typedef struct {
    std::mutex              lock;
    std::condition_variable ready;
    std::deque<int>         done;
} CompletionQueue;

typedef struct {
    int                index;
    const char*        line;
    ExecMode           mode;
    ExecContext        ctx;
    Stream*            out;
    Stream*            err;
    std::atomic<bool>  cancel;
    int                exit_code;
    Clock::time_point  started;
    CompletionQueue*   queue;
} MemberTask;

static void member_main(MemberTask* task) {
    log_message(LOG_DEBUG, "member %d started: %s", task->index, task->line);
    LuwError err;
    error_clear(&err);
    bool ok = run_source(&task->ctx, task->line, task->mode, &err);
    if (!ok) {
        char message[640];
        error_format(&err, "<mt>", message, sizeof(message));
        stream_printf(task->err, "%s\n", message);
    }
    task->exit_code = task->ctx.exit_code;
    if (task->cancel.load()) task->exit_code = LUW_EXIT_TIMEOUT;
    log_message(LOG_DEBUG, "member %d finished with %d", task->index, task->exit_code);

    std::lock_guard<std::mutex> guard(task->queue->lock);
    task->queue->done.push_back(task->index);
    task->queue->ready.notify_one();
}

void cluster_run(char** lines, int count, ExecContext* parent, ExecMode mode,
                 int timeout_ms, ClusterResult* results) {
    CompletionQueue queue;
    MemberTask* tasks = new MemberTask[count > 0 ? count : 1];
    std::thread* threads = new std::thread[count > 0 ? count : 1];
    bool* finished = new bool[count > 0 ? count : 1];

    /* every fork is taken before any member starts */
    for (int i = 0; i < count; i++) {
        MemberTask* task = &tasks[i];
        task->index = i;
        task->line = lines[i];
        task->mode = mode;
        task->out = stream_new_capture(parent->out);
        task->err = stream_new_capture(parent->err);
        context_fork(parent, &task->ctx, task->out, task->err);
        task->cancel.store(false);
        task->ctx.cancel = &task->cancel;
        task->exit_code = 0;
        task->queue = &queue;
        finished[i] = false;

        buffer_init(&results[i].out);
        buffer_init(&results[i].err);
        results[i].exit_code = 0;
        results[i].timed_out = false;
        results[i].elapsed_ms = 0;
    }

    Clock::time_point start = Clock::now();
    for (int i = 0; i < count; i++) {
        tasks[i].started = Clock::now();
        threads[i] = std::thread(member_main, &tasks[i]);
    }

    int remaining = count;
    bool cancelled = false;
    while (remaining > 0) {
        std::unique_lock<std::mutex> guard(queue.lock);
        queue.ready.wait_for(guard, std::chrono::milliseconds(50), [&queue] { return !queue.done.empty(); });
        while (!queue.done.empty()) {
            int index = queue.done.front();
            queue.done.pop_front();
            finished[index] = true;
            results[index].elapsed_ms = (long)std::chrono::duration_cast<std::chrono::milliseconds>(
                Clock::now() - tasks[index].started).count();
            remaining--;
        }
        guard.unlock();

        if (cancelled || remaining == 0) continue;
        bool expired = timeout_ms > 0 &&
                       Clock::now() - start >= std::chrono::milliseconds(timeout_ms);
        if (expired || context_cancelled(parent)) {
            cancelled = true;
            for (int i = 0; i < count; i++) {
                if (finished[i]) continue;
                tasks[i].cancel.store(true);
                results[i].timed_out = expired;
                if (expired) log_message(LOG_WARN, "member %d timed out after %d ms: %s", i, timeout_ms, lines[i]);
            }
        }
    }

    for (int i = 0; i < count; i++) threads[i].join();

    int first_failure = 0;
    for (int i = 0; i < count; i++) {
        MemberTask* task = &tasks[i];
        results[i].exit_code = results[i].timed_out ? LUW_EXIT_TIMEOUT : task->exit_code;
        char* out = stream_take(task->out);
        char* err = stream_take(task->err);
        buffer_append_str(&results[i].out, out);
        buffer_append_str(&results[i].err, err);
        free(out);
        free(err);

        context_free(&task->ctx);
        stream_free(task->out);
        stream_free(task->err);

        if (first_failure == 0) first_failure = results[i].exit_code;
        if (parent->debug) stream_printf(parent->err, "[Worker %d] exited with code %d\n", i, results[i].exit_code);
    }
    parent->exit_code = first_failure;

    delete[] finished;
    delete[] threads;
    delete[] tasks;
}

void cluster_results_free(ClusterResult* results, int count) {
    for (int i = 0; i < count; i++) {
        buffer_free(&results[i].out);
        buffer_free(&results[i].err);
    }
}
