#pragma once

#include <string>
#include <core/constants.hpp>
#include <core/types.hpp>
#include <platform/socket_util.hpp>
#include "host_key.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;

struct SessionTarget {
    std::string address;
    int port = SSH_PORT;
    std::string user;
    std::string private_key_path;
    HostKey host_key;
    int timeout = SSH_CONNECT_TIMEOUT_SECS;
};

// One authenticated SSH transport. Owns the socket and the libssh2 session;
// sub-sessions (ExecChannel) borrow it for the duration of one operation.
class SessionManager {
public:
    explicit SessionManager(const SessionTarget& target);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // TCP connect, pinned-key handshake, public key auth. Every failure is
    // ConnectFailed and leaves nothing open.
    Result<void> establish(StatusCallback callback = nullptr);
    void close();
    bool is_active() const;

    // Block until the socket is ready in the direction libssh2 is waiting on.
    // Returns false once the connection is unusable.
    bool wait_socket(int timeout_ms = SSH_SOCKET_WAIT_MS);

    // Send a keepalive if one is due. Only called with no sub-session
    // mid-transfer. Returns false and marks the session inactive on failure.
    bool send_keepalive();

    // libssh2's description of the most recent session error.
    std::string last_error() const;

    LIBSSH2_SESSION* get_raw_session() { return session_; }
    const std::string& get_target() const { return target_str_; }

private:
    SessionTarget target_;
    LIBSSH2_SESSION* session_;
    socket_t sock_;
    bool active_;
    std::string target_str_;

    Result<void> establish_connection(StatusCallback callback);
    Result<void> verify_host_key();
    Result<void> ssh_userauth(StatusCallback callback);
    Result<void> fail(const std::string& reason, const std::string& message);
};
