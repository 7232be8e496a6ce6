#include "qapp/platform.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace qapp {

namespace {

// Owns the two ends of a pipe
struct Pipe {
    int fds[2] = {-1, -1};

    ~Pipe() {
        close_read();
        close_write();
    }

    bool open() { return pipe2(fds, O_CLOEXEC) == 0; }
    int read_end() const { return fds[0]; }
    int write_end() const { return fds[1]; }

    void close_read() {
        if (fds[0] >= 0) { ::close(fds[0]); fds[0] = -1; }
    }
    void close_write() {
        if (fds[1] >= 0) { ::close(fds[1]); fds[1] = -1; }
    }
};

// Drain whatever is readable; returns false on EOF
bool drain(int fd, std::string& out) {
    char buf[4096];
    ssize_t n = read(fd, buf, sizeof(buf));
    if (n > 0) {
        out.append(buf, static_cast<size_t>(n));
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
        return true;
    }
    return false;
}

void fill_exit_status(int status, ProcessResult& result) {
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        result.ok = true;
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
        result.ok = true;
    } else {
        result.error = "process terminated abnormally";
    }
}

} // namespace

ProcessResult run_process(const std::vector<std::string>& argv,
                          std::chrono::seconds timeout) {
    ProcessResult result;

    if (argv.empty()) {
        result.error = "empty command";
        return result;
    }

    std::vector<char*> c_argv;
    for (const auto& s : argv) {
        c_argv.push_back(const_cast<char*>(s.c_str()));
    }
    c_argv.push_back(nullptr);

    Pipe out_pipe;
    Pipe err_pipe;
    if (!out_pipe.open() || !err_pipe.open()) {
        result.error = "pipe failed: " + std::string(strerror(errno));
        return result;
    }

    pid_t pid = fork();
    if (pid == -1) {
        result.error = "fork failed: " + std::string(strerror(errno));
        return result;
    }

    if (pid == 0) {
        // Child process
        dup2(out_pipe.write_end(), STDOUT_FILENO);
        dup2(err_pipe.write_end(), STDERR_FILENO);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
        }
        execvp(c_argv[0], c_argv.data());
        _exit(127);
    }

    out_pipe.close_write();
    err_pipe.close_write();

    auto deadline = std::chrono::steady_clock::now() + timeout;
    bool out_open = true;
    bool err_open = true;

    while (out_open || err_open) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            result.timed_out = true;
            break;
        }

        struct pollfd pfds[2];
        nfds_t count = 0;
        if (out_open) pfds[count++] = {out_pipe.read_end(), POLLIN, 0};
        if (err_open) pfds[count++] = {err_pipe.read_end(), POLLIN, 0};

        int rc = poll(pfds, count, static_cast<int>(remaining.count()));
        if (rc < 0) {
            if (errno == EINTR) continue;
            result.error = "poll failed: " + std::string(strerror(errno));
            break;
        }
        if (rc == 0) continue;

        for (nfds_t i = 0; i < count; ++i) {
            if (!(pfds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            if (pfds[i].fd == out_pipe.read_end()) {
                out_open = drain(pfds[i].fd, result.output);
            } else {
                err_open = drain(pfds[i].fd, result.error_output);
            }
        }
    }

    // Both pipes closed: the child is exiting, wait for it within the deadline
    while (!result.timed_out && result.error.empty()) {
        int status = 0;
        pid_t waited = waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            fill_exit_status(status, result);
            return result;
        }
        if (waited < 0 && errno != EINTR) {
            result.error = "waitpid failed: " + std::string(strerror(errno));
            return result;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            result.timed_out = true;
            break;
        }
        usleep(10 * 1000);
    }

    kill(pid, SIGKILL);
    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    return result;
}

} // namespace qapp
