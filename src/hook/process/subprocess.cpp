#include "process/subprocess.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <optional>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace subprocess {

namespace {

// Writing to a handler that exited early must not kill us with SIGPIPE.
struct SigpipeGuard {
    struct sigaction old_action{};

    SigpipeGuard() {
        struct sigaction ignore{};
        ignore.sa_handler = SIG_IGN;
        sigemptyset(&ignore.sa_mask);
        ::sigaction(SIGPIPE, &ignore, &old_action);
    }
    ~SigpipeGuard() { ::sigaction(SIGPIPE, &old_action, nullptr); }

    SigpipeGuard(const SigpipeGuard&) = delete;
    SigpipeGuard& operator=(const SigpipeGuard&) = delete;
};

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

std::string errno_message(const char* what) {
    return std::string(what) + " failed: " + std::strerror(errno);
}

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

std::expected<int, std::string> reap(pid_t pid) {
    int status;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return std::unexpected(errno_message("waitpid()"));
    }
    return decode_status(status);
}

// Wait for exit until deadline. nullopt when the child is still running.
std::expected<std::optional<int>, std::string>
reap_until(pid_t pid, std::chrono::steady_clock::time_point deadline) {
    while (true) {
        int status;
        pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid) return std::optional<int>(decode_status(status));
        if (r < 0 && errno != EINTR) return std::unexpected(errno_message("waitpid()"));
        if (std::chrono::steady_clock::now() >= deadline) return std::optional<int>();
        ::usleep(5000); // 5ms
    }
}

} // namespace

std::expected<Result, std::string> run(const std::vector<std::string>& argv,
                                       const std::string& stdin_data,
                                       std::chrono::milliseconds timeout) {
    if (argv.empty()) {
        return std::unexpected(std::string("empty argv"));
    }

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    auto close_all = [&] {
        for (int* p : {in_pipe, out_pipe, err_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
    };

    if (::pipe2(in_pipe, O_CLOEXEC) < 0 || ::pipe2(out_pipe, O_CLOEXEC) < 0 ||
        ::pipe2(err_pipe, O_CLOEXEC) < 0) {
        auto msg = errno_message("pipe()");
        close_all();
        return std::unexpected(msg);
    }

    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& a : argv) c_argv.push_back(const_cast<char*>(a.c_str()));
    c_argv.push_back(nullptr);

    SigpipeGuard sigpipe_guard;

    pid_t pid = ::fork();
    if (pid < 0) {
        auto msg = errno_message("fork()");
        close_all();
        return std::unexpected(msg);
    }

    if (pid == 0) {
        // Child: own process group so a timeout can take down grandchildren too
        ::setpgid(0, 0);
        // SigpipeGuard's SIG_IGN would otherwise survive exec
        ::signal(SIGPIPE, SIG_DFL);
        ::dup2(in_pipe[0], STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::execvp(c_argv[0], c_argv.data());
        ::_exit(127);
    }

    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);

    for (int fd : {in_pipe[1], out_pipe[0], err_pipe[0]}) {
        ::fcntl(fd, F_SETFL, ::fcntl(fd, F_GETFL) | O_NONBLOCK);
    }

    Result result;
    size_t written = 0;
    if (stdin_data.empty()) close_fd(in_pipe[1]);

    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (in_pipe[1] >= 0 || out_pipe[0] >= 0 || err_pipe[0] >= 0) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            result.timed_out = true;
            break;
        }

        pollfd pfds[3] = {
            {.fd = in_pipe[1], .events = POLLOUT, .revents = 0},
            {.fd = out_pipe[0], .events = POLLIN, .revents = 0},
            {.fd = err_pipe[0], .events = POLLIN, .revents = 0},
        };

        int ret = ::poll(pfds, 3, static_cast<int>(remaining.count()));
        if (ret < 0) {
            if (errno == EINTR) continue;
            result.timed_out = true;
            break;
        }
        if (ret == 0) {
            result.timed_out = true;
            break;
        }

        if (pfds[0].revents & (POLLOUT | POLLERR | POLLHUP)) {
            ssize_t n = ::write(in_pipe[1], stdin_data.data() + written,
                                stdin_data.size() - written);
            if (n > 0) written += static_cast<size_t>(n);
            if (n < 0 && errno != EAGAIN && errno != EINTR) {
                // EPIPE: child stopped reading, nothing more to deliver
                close_fd(in_pipe[1]);
            } else if (written == stdin_data.size()) {
                close_fd(in_pipe[1]);
            }
        }

        struct Sink {
            int& fd;
            std::string& buf;
            short revents;
        };
        for (Sink s : {Sink{out_pipe[0], result.out, pfds[1].revents},
                       Sink{err_pipe[0], result.err, pfds[2].revents}}) {
            if (!(s.revents & (POLLIN | POLLERR | POLLHUP))) continue;
            char tmp[4096];
            ssize_t n = ::read(s.fd, tmp, sizeof(tmp));
            if (n > 0) {
                s.buf.append(tmp, static_cast<size_t>(n));
            } else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
                close_fd(s.fd);
            }
        }
    }

    close_all();

    if (!result.timed_out) {
        // Output closed; the child may still be running past the deadline
        auto exited = reap_until(pid, deadline);
        if (!exited) return std::unexpected(exited.error());
        if (*exited) {
            result.exit_code = **exited;
            return result;
        }
        result.timed_out = true;
    }

    ::kill(-pid, SIGKILL);
    ::kill(pid, SIGKILL);

    auto code = reap(pid);
    if (!code) return std::unexpected(code.error());
    result.exit_code = *code;
    return result;
}

} // namespace subprocess
