#pragma once

#include <string>
#include <vector>

namespace platform {

// Opaque handle to a spawned child process.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // Wait for the process to exit. Returns exit code, or -1 if it was
    // killed by a signal or the handle is invalid.
    int wait();

    // Read ends of the child's stdout/stderr pipes (-1 when not captured).
    int stdout_fd() const { return out_fd_; }
    int stderr_fd() const { return err_fd_; }

private:
    int pid_ = -1;
    int out_fd_ = -1;
    int err_fd_ = -1;

    void close_pipes();

    friend ProcessHandle spawn_captured(const std::string& program,
                                        const std::vector<std::string>& args);
};

// Spawn a child with stdin from /dev/null and stdout/stderr connected to pipes.
ProcessHandle spawn_captured(const std::string& program,
                             const std::vector<std::string>& args);

struct ProcessOutput {
    int exit_code = -1;
    std::string stdout_data;
    std::string stderr_data;
    bool spawned = false;
};

// Spawn, drain both pipes until EOF, and wait. Blocks for the child's lifetime.
ProcessOutput run_captured(const std::string& program,
                           const std::vector<std::string>& args);

} // namespace platform
