#include "process_runner.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <poll.h>
#include <signal.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

const char* to_string(ProcessStatus s) {
    switch (s) {
        case ProcessStatus::Completed: return "completed";
        case ProcessStatus::SpawnFailed: return "spawn_failed";
        case ProcessStatus::TimedOut: return "timed_out";
    }
    return "unknown";
}

static void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

static void append_limited(std::vector<uint8_t>& dst, const uint8_t* src, size_t n,
                           size_t limit, bool& truncated) {
    size_t avail = dst.size() < limit ? limit - dst.size() : 0;
    size_t take = std::min(n, avail);
    dst.insert(dst.end(), src, src + take);
    if (take < n) truncated = true;
}

// Reads whatever is available; bytes past `limit` are read and dropped.
// Returns false once the pipe reached EOF or failed.
static bool drain(int fd, std::vector<uint8_t>& out, size_t limit, bool& truncated) {
    uint8_t buf[4096];
    for (;;) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            append_limited(out, buf, static_cast<size_t>(n), limit, truncated);
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
        return false;
    }
}

// Children must not inherit server sockets or other pipelines' descriptors.
static void close_inherited_fds(int keep) {
#ifdef SYS_close_range
    if (keep > 3) ::syscall(SYS_close_range, 3u, static_cast<unsigned>(keep - 1), 0u);
    if (::syscall(SYS_close_range, static_cast<unsigned>(keep + 1), ~0u, 0u) == 0) return;
#endif
    long maxfd = ::sysconf(_SC_OPEN_MAX);
    if (maxfd < 256) maxfd = 256;
    for (int fd = 3; fd < (int)maxfd; fd++) {
        if (fd != keep) ::close(fd);
    }
}

static void record_status(ProcessOutcome& r, int status) {
    if (WIFEXITED(status)) {
        r.exited = true;
        r.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        r.term_signal = WTERMSIG(status);
    }
}

static pid_t wait_child(pid_t pid, int* status, int options) {
    for (;;) {
        pid_t w = ::waitpid(pid, status, options);
        if (w < 0 && errno == EINTR) continue;
        return w;
    }
}

ProcessOutcome run_process(const ProcessSpec& spec) {
    ProcessOutcome r;

    if (spec.argv.empty()) {
        r.error = "empty command line";
        return r;
    }

    // Everything the child touches is prepared before fork.
    std::vector<char*> argv;
    for (auto& a : spec.argv) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);
    const std::string cwd = spec.cwd.string();

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1}; // carries errno when exec fails
    if (::pipe2(out_pipe, O_CLOEXEC) != 0 || ::pipe2(err_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(exec_pipe, O_CLOEXEC) != 0) {
        r.error = std::string("failed to create pipes: ") + std::strerror(errno);
        for (int* p : {out_pipe, err_pipe, exec_pipe}) { close_fd(p[0]); close_fd(p[1]); }
        return r;
    }

    auto t0 = std::chrono::steady_clock::now();
    const auto deadline = t0 + spec.timeout;

    pid_t pid = ::fork();
    if (pid < 0) {
        r.error = std::string("fork failed: ") + std::strerror(errno);
        for (int* p : {out_pipe, err_pipe, exec_pipe}) { close_fd(p[0]); close_fd(p[1]); }
        return r;
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        close_inherited_fds(exec_pipe[1]);
        if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
            int e = errno;
            ssize_t wr = ::write(exec_pipe[1], &e, sizeof(e));
            (void)wr;
            ::_exit(127);
        }
        ::execvp(argv[0], argv.data());
        int e = errno;
        ssize_t wr = ::write(exec_pipe[1], &e, sizeof(e));
        (void)wr;
        ::_exit(127);
    }

    // Mirror the child's setpgid so killpg works even if we win the race.
    ::setpgid(pid, pid);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    // exec_pipe closes on a successful exec (CLOEXEC) or delivers errno.
    int exec_errno = 0;
    ssize_t got;
    do {
        got = ::read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (got < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    if (got == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        wait_child(pid, &status, 0);
        close_fd(out_pipe[0]);
        close_fd(err_pipe[0]);
        r.status = ProcessStatus::SpawnFailed;
        r.error = std::strerror(exec_errno);
        return r;
    }

    ::fcntl(out_pipe[0], F_SETFL, ::fcntl(out_pipe[0], F_GETFL) | O_NONBLOCK);
    ::fcntl(err_pipe[0], F_SETFL, ::fcntl(err_pipe[0], F_GETFL) | O_NONBLOCK);

    int status = 0;
    bool reaped = false;
    bool timed_out = false;

    // Done when the child has exited and both pipes reached EOF.
    while (!(reaped && out_pipe[0] < 0 && err_pipe[0] < 0)) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            timed_out = true;
            break;
        }
        auto remain = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
        int wait_ms = static_cast<int>(std::min<long long>(remain, 50));

        pollfd fds[2];
        nfds_t nfds = 0;
        if (out_pipe[0] >= 0) fds[nfds++] = pollfd{out_pipe[0], POLLIN, 0};
        if (err_pipe[0] >= 0) fds[nfds++] = pollfd{err_pipe[0], POLLIN, 0};

        if (nfds > 0) {
            int ready = ::poll(fds, nfds, wait_ms);
            if (ready < 0 && errno != EINTR) {
                std::cerr << "[process] poll failed: " << std::strerror(errno) << std::endl;
            }
            if (out_pipe[0] >= 0 && !drain(out_pipe[0], r.stdout_bytes, spec.max_output_bytes, r.stdout_truncated)) {
                close_fd(out_pipe[0]);
            }
            if (err_pipe[0] >= 0 && !drain(err_pipe[0], r.stderr_bytes, spec.max_output_bytes, r.stderr_truncated)) {
                close_fd(err_pipe[0]);
            }
        } else {
            ::usleep(static_cast<useconds_t>(wait_ms) * 1000);
        }

        if (!reaped && wait_child(pid, &status, WNOHANG) == pid) {
            reaped = true;
        }
    }

    if (timed_out) {
        ::killpg(pid, SIGKILL);
        if (!reaped) {
            wait_child(pid, &status, 0);
        }
        close_fd(out_pipe[0]);
        close_fd(err_pipe[0]);
        r.status = ProcessStatus::TimedOut;
        r.stdout_bytes.clear();
        r.stderr_bytes.clear();
        r.stdout_truncated = r.stderr_truncated = false;
        r.ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();
        std::cerr << "[process] " << spec.argv[0] << " (pid " << pid << ") exceeded "
                  << spec.timeout.count() << "ms, process group killed" << std::endl;
        return r;
    }

    r.status = ProcessStatus::Completed;
    record_status(r, status);
    r.ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();
    return r;
}
