#include "exec_channel.hpp"
#include "session.hpp"
#include <core/constants.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <cstdint>

CommandResult classify_exit(const std::string& transport_error, const ExitInfo& info) {
    CommandResult r;
    if (!transport_error.empty()) {
        r.exit_status = STATUS_COMMAND_FAILED;
        r.error = transport_error;
    } else if (!info.exit_code_reported) {
        r.exit_status = STATUS_MISSING;
    } else {
        r.exit_status = info.exit_code;
    }
    return r;
}

// ── Terminal modes ───────────────────────────────────────────
// RFC 4254 encoding: opcode byte + uint32 value, terminated by TTY_OP_END.

static void append_mode(std::string& modes, unsigned char opcode, uint32_t value) {
    modes += static_cast<char>(opcode);
    modes += static_cast<char>((value >> 24) & 0xFF);
    modes += static_cast<char>((value >> 16) & 0xFF);
    modes += static_cast<char>((value >> 8) & 0xFF);
    modes += static_cast<char>(value & 0xFF);
}

static std::string terminal_modes() {
    std::string modes;
    append_mode(modes, 53, 0);                // ECHO off
    append_mode(modes, 128, SSH_PTY_BAUD);    // TTY_OP_ISPEED
    append_mode(modes, 129, SSH_PTY_BAUD);    // TTY_OP_OSPEED
    modes += static_cast<char>(0);            // TTY_OP_END
    return modes;
}

// ── ExecChannel ──────────────────────────────────────────────

ExecChannel::ExecChannel(SessionManager& session)
    : session_(session) {
}

ExecChannel::~ExecChannel() {
    release();
}

std::string ExecChannel::error(const std::string& what) const {
    return fmt::format("{} on {}: {}", what, session_.get_target(), session_.last_error());
}

Result<void> ExecChannel::open() {
    LIBSSH2_SESSION* s = session_.get_raw_session();
    if (!s || !session_.is_active()) {
        return Result<void>::Err(ErrorKind::CommandTransportFailure,
                                 "unable to create session: connection is closed");
    }
    if (!session_.send_keepalive()) {
        return Result<void>::Err(ErrorKind::CommandTransportFailure,
                                 error("unable to create session"));
    }

    while ((channel_ = libssh2_channel_open_session(s)) == nullptr) {
        if (libssh2_session_last_errno(s) != LIBSSH2_ERROR_EAGAIN || !session_.wait_socket()) {
            return Result<void>::Err(ErrorKind::CommandTransportFailure,
                                     error("unable to create session"));
        }
    }
    return Result<void>::Ok();
}

Result<void> ExecChannel::request_pty() {
    std::string modes = terminal_modes();
    int rc;
    while ((rc = libssh2_channel_request_pty_ex(channel_, SSH_PTY_TERM,
                static_cast<unsigned>(std::char_traits<char>::length(SSH_PTY_TERM)),
                modes.data(), static_cast<unsigned>(modes.size()),
                SSH_PTY_WIDTH, SSH_PTY_HEIGHT, 0, 0)) == LIBSSH2_ERROR_EAGAIN) {
        if (!session_.wait_socket()) break;
    }
    if (rc != 0) {
        return Result<void>::Err(ErrorKind::CommandTransportFailure,
                                 error("request for pseudo terminal failed"));
    }
    return Result<void>::Ok();
}

Result<void> ExecChannel::exec(const std::string& command) {
    int rc;
    while ((rc = libssh2_channel_exec(channel_, command.c_str())) == LIBSSH2_ERROR_EAGAIN) {
        if (!session_.wait_socket()) break;
    }
    if (rc != 0) {
        return Result<void>::Err(ErrorKind::CommandTransportFailure,
                                 error("failed to start command"));
    }
    return Result<void>::Ok();
}

Result<void> ExecChannel::write_all(const char* data, size_t len) {
    size_t sent = 0;
    while (sent < len) {
        ssize_t w = libssh2_channel_write(channel_, data + sent, len - sent);
        if (w == LIBSSH2_ERROR_EAGAIN) {
            if (!session_.wait_socket()) {
                return Result<void>::Err(ErrorKind::CommandTransportFailure,
                                         error("connection lost while sending data"));
            }
            continue;
        }
        if (w < 0) {
            return Result<void>::Err(ErrorKind::CommandTransportFailure,
                                     error("channel write error sending data"));
        }
        sent += static_cast<size_t>(w);
    }
    return Result<void>::Ok();
}

Result<void> ExecChannel::send_eof() {
    int rc;
    while ((rc = libssh2_channel_send_eof(channel_)) == LIBSSH2_ERROR_EAGAIN) {
        if (!session_.wait_socket()) break;
    }
    if (rc != 0) {
        return Result<void>::Err(ErrorKind::CommandTransportFailure,
                                 error("failed to close command input"));
    }
    return Result<void>::Ok();
}

Result<void> ExecChannel::drain(std::string* out, std::string* err) {
    char buf[SSH_READ_BUF_SIZE];

    while (true) {
        ssize_t n = libssh2_channel_read(channel_, buf, sizeof(buf));
        if (n > 0 && out) out->append(buf, static_cast<size_t>(n));
        if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) {
            return Result<void>::Err(ErrorKind::CommandTransportFailure,
                                     error("SSH channel read error"));
        }

        ssize_t m = libssh2_channel_read_stderr(channel_, buf, sizeof(buf));
        if (m > 0 && err) err->append(buf, static_cast<size_t>(m));
        if (m < 0 && m != LIBSSH2_ERROR_EAGAIN) {
            return Result<void>::Err(ErrorKind::CommandTransportFailure,
                                     error("SSH channel read error"));
        }

        if (n > 0 || m > 0) continue;

        if (libssh2_channel_eof(channel_)) break;

        if (!session_.wait_socket()) {
            return Result<void>::Err(ErrorKind::CommandTransportFailure,
                                     error("connection lost while reading output"));
        }
    }
    return Result<void>::Ok();
}

Result<ExitInfo> ExecChannel::finish() {
    int rc;
    while ((rc = libssh2_channel_close(channel_)) == LIBSSH2_ERROR_EAGAIN) {
        if (!session_.wait_socket()) break;
    }
    if (rc != 0) {
        return Result<ExitInfo>::Err(ErrorKind::CommandTransportFailure,
                                     error("failed to close session"));
    }
    while ((rc = libssh2_channel_wait_closed(channel_)) == LIBSSH2_ERROR_EAGAIN) {
        if (!session_.wait_socket()) break;
    }
    if (rc != 0) {
        return Result<ExitInfo>::Err(ErrorKind::CommandTransportFailure,
                                     error("remote did not close session"));
    }

    ExitInfo info;
    char* signal = nullptr;
    size_t signal_len = 0;
    libssh2_channel_get_exit_signal(channel_, &signal, &signal_len,
                                    nullptr, nullptr, nullptr, nullptr);
    if (signal) {
        info.exit_signal.assign(signal, signal_len);
        libssh2_free(session_.get_raw_session(), signal);
    }
    // libssh2 reports 0 when the server sent neither exit-status nor
    // exit-signal, so only a signal can be told apart as a missing code
    if (info.exit_signal.empty()) {
        info.exit_code_reported = true;
        info.exit_code = libssh2_channel_get_exit_status(channel_);
    }
    return Result<ExitInfo>::Ok(info);
}

void ExecChannel::release() {
    if (released_) return;
    released_ = true;
    if (!channel_) return;
    if (!session_.get_raw_session()) {
        // The transport already freed every channel it owned
        channel_ = nullptr;
        return;
    }

    // Frees even an unclosed channel; a dead transport can't finish the
    // close handshake, so give up waiting once the socket reports an error.
    while (libssh2_channel_free(channel_) == LIBSSH2_ERROR_EAGAIN) {
        if (!session_.wait_socket()) break;
    }
    channel_ = nullptr;
}
