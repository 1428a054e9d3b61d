#include "utils/SubProcess.hpp"
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <thread>
#include <spdlog/spdlog.h>

namespace code_agent {

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Drains what is currently readable; returns false once the writer side closed.
bool drain(int fd, std::string& sink, size_t limit) {
    char buffer[4096];
    while (true) {
        ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            if (sink.size() < limit) {
                size_t room = limit - sink.size();
                sink.append(buffer, std::min(room, static_cast<size_t>(n)));
            }
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

} // namespace

ProcessResult SubProcess::run(const std::vector<std::string>& argv,
                              std::chrono::milliseconds timeout,
                              size_t output_limit) {
    ProcessResult result;
    if (argv.empty()) {
        result.std_err = "empty command";
        return result;
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};   // carries errno from a failed execvp
    if (::pipe2(out_pipe, O_CLOEXEC) != 0 || ::pipe2(err_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(exec_pipe, O_CLOEXEC) != 0) {
        result.std_err = std::string("pipe() failed: ") + std::strerror(errno);
        for (int* fd : {&out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1], &exec_pipe[0], &exec_pipe[1]})
            close_fd(*fd);
        return result;
    }

    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& a : argv) c_argv.push_back(const_cast<char*>(a.c_str()));
    c_argv.push_back(nullptr);

    auto start = std::chrono::steady_clock::now();
    pid_t pid = ::fork();
    if (pid < 0) {
        result.std_err = std::string("fork() failed: ") + std::strerror(errno);
        for (int* fd : {&out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1], &exec_pipe[0], &exec_pipe[1]})
            close_fd(*fd);
        return result;
    }

    if (pid == 0) {
        // Own process group so a timeout kill reaches grandchildren too.
        ::setpgid(0, 0);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::execvp(c_argv[0], c_argv.data());
        int code = errno;
        ssize_t ignored = ::write(exec_pipe[1], &code, sizeof(code));
        (void)ignored;
        ::_exit(127);
    }

    // Also from the parent, so kill(-pid) has a group to hit whichever side runs first.
    ::setpgid(pid, pid);

    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    int exec_errno = 0;
    ssize_t got = ::read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    close_fd(exec_pipe[0]);
    if (got == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        close_fd(out_pipe[0]);
        close_fd(err_pipe[0]);
        result.std_err = "failed to execute " + argv[0] + ": " + std::strerror(exec_errno);
        return result;
    }
    result.spawned = true;

    ::fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
    ::fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);

    auto deadline = start + timeout;
    bool out_open = true;
    bool err_open = true;
    while (out_open || err_open) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            result.timed_out = true;
            break;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);

        struct pollfd fds[2];
        nfds_t count = 0;
        if (out_open) fds[count++] = {out_pipe[0], POLLIN, 0};
        if (err_open) fds[count++] = {err_pipe[0], POLLIN, 0};

        int ready = ::poll(fds, count, static_cast<int>(std::max<long long>(1, remaining.count())));
        if (ready < 0) {
            if (errno == EINTR) continue;
            spdlog::warn("poll() failed while waiting on {}: {}", argv[0], std::strerror(errno));
            break;
        }
        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) continue;
            if (fds[i].fd == out_pipe[0]) out_open = drain(out_pipe[0], result.std_out, output_limit);
            else err_open = drain(err_pipe[0], result.std_err, output_limit);
        }
    }

    // Both streams closed does not mean the child is gone; keep honoring the deadline.
    int status = 0;
    bool reaped = false;
    while (!result.timed_out && !reaped) {
        pid_t w = ::waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            reaped = true;
        } else if (w < 0 && errno != EINTR) {
            break;
        } else if (std::chrono::steady_clock::now() >= deadline) {
            result.timed_out = true;
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }
    if (result.timed_out) {
        ::kill(-pid, SIGKILL);
        ::kill(pid, SIGKILL);
        ::waitpid(pid, &status, 0);
    } else {
        drain(out_pipe[0], result.std_out, output_limit);
        drain(err_pipe[0], result.std_err, output_limit);
    }
    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);

    auto end = std::chrono::steady_clock::now();
    result.elapsed_ms = std::chrono::duration<double, std::milli>(end - start).count();

    if (!result.timed_out && reaped && WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else {
        result.exit_code = -1;
    }
    return result;
}

} // namespace code_agent
