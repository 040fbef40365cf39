#pragma once

#include <string>
#include <core/types.hpp>

// libssh2 forward declarations
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

class SessionManager;

// What the remote reported when a sub-session ended.
struct ExitInfo {
    bool exit_code_reported = false;  // false when killed by a signal
    int exit_code = 0;
    std::string exit_signal;
};

// Collapse a sub-session outcome into the reported status:
//   exited with N        -> N, no error
//   no exit code (kill)  -> STATUS_MISSING, no error
//   transport failure    -> STATUS_COMMAND_FAILED, error
// A server that sends neither exit-status nor exit-signal reads as exit 0:
// libssh2 gives no way to tell that apart from a real zero.
CommandResult classify_exit(const std::string& transport_error, const ExitInfo& info);

// One short-lived exec sub-session on a SessionManager. Released exactly once,
// by release() or the destructor, on every exit path.
class ExecChannel {
public:
    explicit ExecChannel(SessionManager& session);
    ~ExecChannel();

    ExecChannel(const ExecChannel&) = delete;
    ExecChannel& operator=(const ExecChannel&) = delete;

    Result<void> open();
    Result<void> request_pty();
    Result<void> exec(const std::string& command);

    // Write the whole buffer to the command's stdin.
    Result<void> write_all(const char* data, size_t len);
    Result<void> send_eof();

    // Read stdout and stderr until the remote signals EOF. Null sinks discard.
    Result<void> drain(std::string* out, std::string* err);

    // Close our side, wait for the remote close, then collect exit info.
    Result<ExitInfo> finish();

    void release();
    bool released() const { return released_; }

private:
    SessionManager& session_;
    LIBSSH2_CHANNEL* channel_ = nullptr;
    bool released_ = false;

    std::string error(const std::string& what) const;
};
