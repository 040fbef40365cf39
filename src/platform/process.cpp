#include "process.hpp"

#include <unistd.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>

namespace platform {

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    close_pipes();
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept
    : pid_(other.pid_), out_fd_(other.out_fd_), err_fd_(other.err_fd_) {
    other.pid_ = -1;
    other.out_fd_ = -1;
    other.err_fd_ = -1;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        close_pipes();
        pid_ = other.pid_;
        out_fd_ = other.out_fd_;
        err_fd_ = other.err_fd_;
        other.pid_ = -1;
        other.out_fd_ = -1;
        other.err_fd_ = -1;
    }
    return *this;
}

void ProcessHandle::close_pipes() {
    if (out_fd_ >= 0) { close(out_fd_); out_fd_ = -1; }
    if (err_fd_ >= 0) { close(err_fd_); err_fd_ = -1; }
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

int ProcessHandle::wait() {
    if (pid_ <= 0) return -1;
    int status = 0;
    pid_t ret;
    do {
        ret = waitpid(pid_, &status, 0);
    } while (ret < 0 && errno == EINTR);
    pid_ = -1;
    if (ret < 0) return -1;
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

// ── spawn ────────────────────────────────────────────────────

ProcessHandle spawn_captured(const std::string& program,
                             const std::vector<std::string>& args) {
    ProcessHandle handle;

    int out_pipe[2];
    int err_pipe[2];
    if (pipe(out_pipe) != 0) return handle;
    if (pipe(err_pipe) != 0) {
        close(out_pipe[0]);
        close(out_pipe[1]);
        return handle;
    }

    pid_t pid = fork();
    if (pid < 0) {
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);
        return handle;
    }

    if (pid == 0) {
        // Child process
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);

        // Build argv array
        std::vector<const char*> argv;
        argv.push_back(program.c_str());
        for (const auto& a : args) argv.push_back(a.c_str());
        argv.push_back(nullptr);

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        _exit(127);  // exec failed
    }

    // Parent
    close(out_pipe[1]);
    close(err_pipe[1]);
    handle.pid_ = pid;
    handle.out_fd_ = out_pipe[0];
    handle.err_fd_ = err_pipe[0];
    return handle;
}

ProcessOutput run_captured(const std::string& program,
                           const std::vector<std::string>& args) {
    ProcessOutput result;
    ProcessHandle child = spawn_captured(program, args);
    if (!child.valid()) {
        result.stderr_data = "failed to spawn " + program;
        return result;
    }
    result.spawned = true;

    struct pollfd fds[2];
    fds[0] = {child.stdout_fd(), POLLIN, 0};
    fds[1] = {child.stderr_fd(), POLLIN, 0};
    std::string* sinks[2] = {&result.stdout_data, &result.stderr_data};
    int open_count = 2;
    char buf[4096];

    // Drain both pipes together so a chatty stderr can't block stdout
    while (open_count > 0) {
        int ret = poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (int i = 0; i < 2; i++) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            ssize_t n = read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) {
                sinks[i]->append(buf, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                fds[i].fd = -1;
                open_count--;
            }
        }
    }

    result.exit_code = child.wait();
    return result;
}

} // namespace platform
