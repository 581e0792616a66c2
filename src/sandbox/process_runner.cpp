#include "sandbox/process_runner.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <string>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include "core/logging/logger.hpp"

namespace hearth::sandbox {

using core::errors::ErrorCategory;
using core::errors::HearthError;

namespace {

// After SIGKILL, stop waiting for pipes held open by anything that escaped
// the group.
constexpr std::int64_t kKillGraceMs = 2000;

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void drain_pipe(int& fd, std::string& out, const std::size_t limit, bool& truncated) {
    if (fd < 0) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            const auto count = static_cast<std::size_t>(n);
            if (out.size() < limit) {
                const std::size_t room = limit - out.size();
                out.append(buffer, count < room ? count : room);
                if (count > room) {
                    truncated = true;
                }
            } else {
                truncated = true;
            }
            continue;
        }
        if (n == 0) {
            close_fd(fd);
            return;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        }
        close_fd(fd);
        return;
    }
}

enum class StopPhase {
    Running,
    Terminating,
    Killed
};

void signal_group(const pid_t pid, const int signo) {
    if (killpg(pid, signo) != 0) {
        static_cast<void>(kill(pid, signo));
    }
}

std::int64_t elapsed_ms(const std::chrono::steady_clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - since)
        .count();
}

}  // namespace

core::errors::Result<ProcessCapture> run_process(const std::vector<std::string>& argv,
                                                 const ProcessOptions& options) {
    if (argv.empty() || argv.front().empty()) {
        return HearthError{ErrorCategory::Input, "Process argv cannot be empty.",
                           "empty_argv"};
    }

    if (options.cancel_token && options.cancel_token->load()) {
        ProcessCapture capture;
        capture.cancelled = true;
        capture.stderr_text = "Process cancelled before start.";
        return capture;
    }

    std::vector<char*> exec_argv;
    exec_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        exec_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    exec_argv.push_back(nullptr);

    const std::string cwd =
        options.working_directory.has_value() ? options.working_directory->string() : "";

    // Close-on-exec everywhere: concurrent spawns from other threads must not
    // inherit our pipe ends. The exec-status pipe reports execvp failures.
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    if (pipe2(stdout_pipe, O_CLOEXEC) != 0 || pipe2(stderr_pipe, O_CLOEXEC) != 0 ||
        pipe2(status_pipe, O_CLOEXEC) != 0) {
        close_fd(stdout_pipe[0]);
        close_fd(stdout_pipe[1]);
        close_fd(stderr_pipe[0]);
        close_fd(stderr_pipe[1]);
        close_fd(status_pipe[0]);
        close_fd(status_pipe[1]);
        return HearthError{ErrorCategory::Execution, "Failed to create process pipes.",
                           "spawn_failed"};
    }

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        close_fd(stdout_pipe[0]);
        close_fd(stdout_pipe[1]);
        close_fd(stderr_pipe[0]);
        close_fd(stderr_pipe[1]);
        close_fd(status_pipe[0]);
        close_fd(status_pipe[1]);
        return HearthError{ErrorCategory::Execution, "Failed to fork process.",
                           "spawn_failed"};
    }

    if (pid == 0) {
        static_cast<void>(setpgid(0, 0));
        const int null_fd = open("/dev/null", O_RDONLY);
        if (null_fd >= 0) {
            static_cast<void>(dup2(null_fd, STDIN_FILENO));
        }
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        int child_errno = 0;
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            child_errno = errno;
        } else {
            execvp(exec_argv[0], exec_argv.data());
            child_errno = errno;
        }
        static_cast<void>(write(status_pipe[1], &child_errno, sizeof(child_errno)));
        _exit(127);
    }

    // Mirror the child's setpgid so killpg works even if we race it.
    static_cast<void>(setpgid(pid, pid));

    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(status_pipe[1]);

    int child_errno = 0;
    ssize_t status_read = 0;
    do {
        status_read = read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (status_read < 0 && errno == EINTR);
    close_fd(status_pipe[0]);

    if (status_read == static_cast<ssize_t>(sizeof(child_errno))) {
        int ignored = 0;
        static_cast<void>(waitpid(pid, &ignored, 0));
        close_fd(stdout_pipe[0]);
        close_fd(stderr_pipe[0]);
        if (child_errno == ENOENT) {
            return HearthError{ErrorCategory::Execution,
                               "Executable not found: " + argv.front(),
                               "executable_not_found"};
        }
        return HearthError{ErrorCategory::Execution,
                           "Failed to launch " + argv.front() + ": " +
                               std::strerror(child_errno),
                           "spawn_failed"};
    }

    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    ProcessCapture capture;
    int stdout_fd = stdout_pipe[0];
    int stderr_fd = stderr_pipe[0];
    bool child_exited = false;
    StopPhase phase = StopPhase::Running;
    std::chrono::steady_clock::time_point phase_since;
    int status = 0;
    struct rusage usage {};

    while (stdout_fd >= 0 || stderr_fd >= 0 || !child_exited) {
        if (phase == StopPhase::Running) {
            const bool cancel_requested =
                options.cancel_token && options.cancel_token->load();
            const bool expired =
                options.timeout_ms > 0 &&
                elapsed_ms(started) > static_cast<std::int64_t>(options.timeout_ms);
            if (cancel_requested || expired) {
                // A lingering descendant after the main child exited is
                // stopped but does not change the outcome.
                if (!child_exited) {
                    capture.cancelled = cancel_requested;
                    capture.timed_out = !cancel_requested;
                }
                if (options.terminate_grace_ms > 0 && !child_exited) {
                    signal_group(pid, SIGTERM);
                    phase = StopPhase::Terminating;
                } else {
                    signal_group(pid, SIGKILL);
                    phase = StopPhase::Killed;
                }
                phase_since = std::chrono::steady_clock::now();
            }
        } else if (phase == StopPhase::Terminating &&
                   (child_exited || elapsed_ms(phase_since) >
                                        static_cast<std::int64_t>(options.terminate_grace_ms))) {
            signal_group(pid, SIGKILL);
            phase = StopPhase::Killed;
            phase_since = std::chrono::steady_clock::now();
        } else if (phase == StopPhase::Killed && elapsed_ms(phase_since) > kKillGraceMs) {
            break;
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (stdout_fd >= 0) {
            fds[nfds].fd = stdout_fd;
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_fd >= 0) {
            fds[nfds].fd = stderr_fd;
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, 50));
        } else {
            static_cast<void>(usleep(10 * 1000));
        }

        drain_pipe(stdout_fd, capture.stdout_text, options.max_output_bytes,
                   capture.output_truncated);
        drain_pipe(stderr_fd, capture.stderr_text, options.max_output_bytes,
                   capture.output_truncated);

        if (!child_exited) {
            const pid_t waited = wait4(pid, &status, WNOHANG, &usage);
            if (waited == pid) {
                child_exited = true;
                // Leftover group members would keep the pipes open.
                if (phase == StopPhase::Killed) {
                    signal_group(pid, SIGKILL);
                }
            }
        }
    }

    close_fd(stdout_fd);
    close_fd(stderr_fd);

    if (!child_exited) {
        signal_group(pid, SIGKILL);
        static_cast<void>(wait4(pid, &status, 0, &usage));
    }
    // Background jobs the child left behind share its group. The leader is
    // reaped, so only killpg is safe here; ESRCH means nothing was left.
    if (killpg(pid, SIGKILL) != 0 && errno != ESRCH) {
        HEARTH_LOG_WARN("Unable to clear process group " + std::to_string(pid) + ": " +
                        std::strerror(errno));
    }

    if (WIFEXITED(status)) {
        capture.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        capture.exit_code = 128 + WTERMSIG(status);
    } else {
        capture.exit_code = -1;
    }

    capture.duration_ms = std::chrono::duration<double, std::milli>(
                              std::chrono::steady_clock::now() - started)
                              .count();
    capture.max_rss_mb = static_cast<double>(usage.ru_maxrss) / 1024.0;
    capture.cpu_time_seconds =
        static_cast<double>(usage.ru_utime.tv_sec + usage.ru_stime.tv_sec) +
        static_cast<double>(usage.ru_utime.tv_usec + usage.ru_stime.tv_usec) / 1e6;
    return capture;
}

}  // namespace hearth::sandbox
