#include "shell.h"
#include "log.h"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

const char* shell_name(ShellKind kind) {
    switch (kind) {
    case SHELL_PWSH: return "pwsh";
    case SHELL_CMD:  return "cmd";
    case SHELL_NONE: break;
    }
    return "none";
}

/* argv for the child; the strings are static or borrowed from `raw`. */
static void shell_argv(ShellKind kind, const char* raw, const char** argv) {
    if (kind == SHELL_PWSH) {
        argv[0] = "pwsh";
        argv[1] = "-NoProfile";
        argv[2] = "-Command";
        argv[3] = raw;
        argv[4] = nullptr;
    } else {
        argv[0] = "/bin/sh";
        argv[1] = "-c";
        argv[2] = raw;
        argv[3] = nullptr;
    }
}

static void close_pair(int fds[2]) {
    if (fds[0] >= 0) close(fds[0]);
    if (fds[1] >= 0) close(fds[1]);
}

/* Reads what is available on `fd` into `into`. Returns false at EOF. */
static bool drain(int fd, Buffer* into) {
    char chunk[4096];
    ssize_t n = read(fd, chunk, sizeof(chunk));
    if (n > 0) {
        buffer_append(into, chunk, (int)n);
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) return true;
    return false;
}

bool shell_run(ShellKind kind, const char* raw, ExecContext* ctx, DispatchResult* result, LuwError* err) {
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};   /* reports an exec failure back to the parent */
    /* cluster members fork concurrently; no child may inherit another member's pipe ends */
    if (pipe2(out_pipe, O_CLOEXEC) == -1 || pipe2(err_pipe, O_CLOEXEC) == -1 ||
        pipe2(exec_pipe, O_CLOEXEC) == -1) {
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(exec_pipe);
        error_set(err, ERR_DISPATCH, DISPATCH_EXTERNAL_PROCESS_ERROR, 0, 0,
                  "cannot start %s: %s", shell_name(kind), strerror(errno));
        return false;
    }

    const char* argv[5];
    shell_argv(kind, raw, argv);
    char** envp = context_envp(ctx);

    log_message(LOG_DEBUG, "%s: %s", shell_name(kind), raw);
    pid_t pid = fork();
    if (pid == -1) {
        context_free_envp(envp);
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(exec_pipe);
        error_set(err, ERR_DISPATCH, DISPATCH_EXTERNAL_PROCESS_ERROR, 0, 0,
                  "cannot start %s: %s", shell_name(kind), strerror(errno));
        return false;
    }

    if (pid == 0) {
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        int devnull = open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (devnull >= 0) dup2(devnull, STDIN_FILENO);
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);
        close(exec_pipe[0]);
        if (chdir(ctx->cwd) == -1) {
            int code = errno;
            ssize_t w = write(exec_pipe[1], &code, sizeof(code));
            (void)w;
            _exit(127);
        }
        if (argv[0][0] == '/') execve(argv[0], (char* const*)argv, envp);
        else execvpe(argv[0], (char* const*)argv, envp);
        int code = errno;
        ssize_t w = write(exec_pipe[1], &code, sizeof(code));
        (void)w;
        _exit(127);
    }

    context_free_envp(envp);
    close(out_pipe[1]);
    close(err_pipe[1]);
    close(exec_pipe[1]);

    int exec_errno = 0;
    ssize_t got = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    close(exec_pipe[0]);

    struct pollfd fds[2];
    fds[0].fd = out_pipe[0]; fds[0].events = POLLIN;
    fds[1].fd = err_pipe[0]; fds[1].events = POLLIN;
    bool open_out = true, open_err = true, killed = false;
    while (open_out || open_err) {
        if (!killed && context_cancelled(ctx)) {
            kill(pid, SIGKILL);
            killed = true;
        }
        fds[0].fd = open_out ? out_pipe[0] : -1;
        fds[1].fd = open_err ? err_pipe[0] : -1;
        int rc = poll(fds, 2, 10);
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (rc == 0) continue;
        if (open_out && (fds[0].revents & (POLLIN | POLLHUP | POLLERR))) open_out = drain(out_pipe[0], &result->out);
        if (open_err && (fds[1].revents & (POLLIN | POLLHUP | POLLERR))) open_err = drain(err_pipe[0], &result->err);
    }
    close(out_pipe[0]);
    close(err_pipe[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {}

    if (got == (ssize_t)sizeof(exec_errno)) {
        error_set(err, ERR_DISPATCH, DISPATCH_EXTERNAL_PROCESS_ERROR, 0, 0,
                  "cannot start %s: %s", shell_name(kind), strerror(exec_errno));
        log_message(LOG_WARN, "%s", err->message);
        return false;
    }
    if (killed) result->exit_code = LUW_EXIT_TIMEOUT;
    else if (WIFEXITED(status)) result->exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) result->exit_code = 128 + WTERMSIG(status);
    else result->exit_code = 1;
    return true;
}
