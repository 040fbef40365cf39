#include "session.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <chrono>
#include <cstdlib>
#include <cstring>

SessionManager::SessionManager(const SessionTarget& target)
    : target_(target), session_(nullptr), sock_(AWSRENDER_INVALID_SOCKET), active_(false) {
    target_str_ = fmt::format("{}@{}:{}", target_.user, target_.address, target_.port);
}

SessionManager::~SessionManager() {
    close();
}

Result<void> SessionManager::establish(StatusCallback callback) {
    auto result = establish_connection(callback);
    if (result.is_err()) {
        app_log_error("establish " + target_str_, result);
    }
    return result;
}

Result<void> SessionManager::fail(const std::string& reason, const std::string& message) {
    if (session_) {
        libssh2_session_disconnect(session_, reason.c_str());
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != AWSRENDER_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = AWSRENDER_INVALID_SOCKET;
    }
    active_ = false;
    return Result<void>::Err(ErrorKind::ConnectFailed, message);
}

Result<void> SessionManager::establish_connection(StatusCallback callback) {
    if (callback) {
        callback("Connecting to " + target_.address + "...");
    }

    // Initialize libssh2
    int rc = libssh2_init(0);
    if (rc != 0) {
        return Result<void>::Err(ErrorKind::ConnectFailed, "Failed to initialize libssh2");
    }

    std::string net_error;
    sock_ = platform::connect_tcp(target_.address, target_.port,
                                  target_.timeout * 1000, net_error);
    if (sock_ == AWSRENDER_INVALID_SOCKET) {
        return Result<void>::Err(ErrorKind::ConnectFailed,
            fmt::format("unable to reach {}:{}: {}", target_.address, target_.port, net_error));
    }

    if (callback) callback("TCP connected, starting SSH handshake...");

    // Create SSH session
    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        return fail("Init failed", "Failed to create SSH session");
    }

    // Offer only the algorithms that can verify with the pinned key, so a key
    // of another type fails negotiation instead of being silently replaced.
    std::string prefs = target_.host_key.algorithm_prefs();
    rc = libssh2_session_method_pref(session_, LIBSSH2_METHOD_HOSTKEY, prefs.c_str());
    if (rc != 0) {
        return fail("Unsupported host key",
            fmt::format("local libssh2 cannot negotiate host key algorithm {}: {}",
                        prefs, last_error()));
    }

    libssh2_session_set_blocking(session_, 0);
    // Bounds blocking calls (the keepalive); non-blocking ones ignore it
    libssh2_session_set_timeout(session_, SSH_CONNECT_TIMEOUT_SECS * 1000L);

    // SSH handshake (key exchange)
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(target_.timeout);
    while ((rc = libssh2_session_handshake(session_, sock_)) == LIBSSH2_ERROR_EAGAIN) {
        if (std::chrono::steady_clock::now() >= deadline || !wait_socket()) break;
    }
    if (rc != 0) {
        return fail("Handshake failed",
            fmt::format("SSH handshake with {} failed: {}", target_.address, last_error()));
    }

    auto key_result = verify_host_key();
    if (key_result.is_err()) {
        return fail("Host key mismatch", key_result.error);
    }

    // Sent between sub-sessions by send_keepalive, never mid-transfer
    libssh2_keepalive_config(session_, 1, SSH_KEEPALIVE_SECS);

    if (callback) callback("Host key verified, authenticating...");

    auto auth_result = ssh_userauth(callback);
    if (auth_result.is_err()) {
        return fail("Authentication failed", auth_result.error);
    }

    active_ = true;

    if (callback) {
        callback("Connected to " + target_.address);
    }
    app_log("SSH session established: " + target_str_);

    return Result<void>::Ok();
}

Result<void> SessionManager::verify_host_key() {
    size_t len = 0;
    int type = 0;
    const char* key = libssh2_session_hostkey(session_, &len, &type);
    if (!key || len == 0) {
        return Result<void>::Err(ErrorKind::ConnectFailed,
            fmt::format("{} presented no host key", target_.address));
    }

    std::string presented(key, len);
    if (target_.host_key.matches(presented)) {
        return Result<void>::Ok();
    }

    std::string presented_fp = "unavailable";
    const char* hash = libssh2_hostkey_hash(session_, LIBSSH2_HOSTKEY_HASH_SHA256);
    if (hash) {
        presented_fp = base64_encode(std::string(hash, 32));
        // OpenSSH prints SHA256 fingerprints without base64 padding
        while (!presented_fp.empty() && presented_fp.back() == '=') presented_fp.pop_back();
        presented_fp = "SHA256:" + presented_fp;
    }

    return Result<void>::Err(ErrorKind::ConnectFailed,
        fmt::format("host key mismatch for {}: expected {} key {}, server presented {} key {}",
                    target_.address, target_.host_key.type_name,
                    target_.host_key.to_text().substr(0, 60) + "...",
                    blob_type_name(presented), presented_fp));
}

Result<void> SessionManager::ssh_userauth(StatusCallback callback) {
    int rc;

    // Check what auth methods the server supports
    char* auth_list = nullptr;
    while ((auth_list = libssh2_userauth_list(session_, target_.user.c_str(),
                                              static_cast<unsigned>(target_.user.length()))) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
            break;
        }
        if (!wait_socket()) break;
    }

    std::string methods = auth_list ? auth_list : "";
    if (callback && !methods.empty()) {
        callback("Auth methods: " + methods);
    }
    if (methods.find("publickey") == std::string::npos) {
        return Result<void>::Err(ErrorKind::ConnectFailed,
            fmt::format("authentication rejected for {}: server does not offer publickey (offers: {})",
                        target_.user, methods.empty() ? "none" : methods));
    }

    // libssh2 derives the public half from the private key when none is given
    const char* passphrase = std::getenv("AWSRENDER_KEY_PASSPHRASE");
    while ((rc = libssh2_userauth_publickey_fromfile_ex(session_,
                target_.user.c_str(), static_cast<unsigned>(target_.user.length()),
                nullptr, target_.private_key_path.c_str(), passphrase)) == LIBSSH2_ERROR_EAGAIN) {
        if (!wait_socket()) break;
    }

    if (rc != 0) {
        return Result<void>::Err(ErrorKind::ConnectFailed,
            fmt::format("authentication rejected for user {} with key {}: {}",
                        target_.user, target_.private_key_path, last_error()));
    }

    if (callback) callback("Authentication successful");
    return Result<void>::Ok();
}

bool SessionManager::wait_socket(int timeout_ms) {
    if (!session_ || sock_ == AWSRENDER_INVALID_SOCKET) return false;

    short events = 0;
    int dir = libssh2_session_block_directions(session_);
    if (dir & LIBSSH2_SESSION_BLOCK_INBOUND) events |= POLLIN;
    if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND) events |= POLLOUT;
    if (events == 0) events = POLLIN;

    int revents = platform::poll_socket(sock_, events, timeout_ms);
    if (revents & (POLLERR | POLLNVAL)) {
        active_ = false;
        return false;
    }
    return true;
}

bool SessionManager::send_keepalive() {
    if (!session_ || !active_) return false;

    // Blocking for the one packet so nothing is left half-sent for the
    // next libssh2 call to complete on its behalf
    libssh2_session_set_blocking(session_, 1);
    int seconds_to_next = 0;
    int rc = libssh2_keepalive_send(session_, &seconds_to_next);
    libssh2_session_set_blocking(session_, 0);

    if (rc != 0) {
        app_log(fmt::format("keepalive to {} failed: {}", target_str_, last_error()));
        active_ = false;
        return false;
    }
    return true;
}

std::string SessionManager::last_error() const {
    if (!session_) return "no session";
    char* msg = nullptr;
    int len = 0;
    int code = libssh2_session_last_error(session_, &msg, &len, 0);
    if (!msg || len <= 0) return fmt::format("libssh2 error {}", code);
    return fmt::format("{} ({})", std::string(msg, static_cast<size_t>(len)), code);
}

void SessionManager::close() {
    // Mark inactive first so sub-sessions bail out early
    active_ = false;

    if (session_) {
        libssh2_session_disconnect(session_, "Normal disconnection");
        libssh2_session_free(session_);
        session_ = nullptr;
        app_log("SSH session closed: " + target_str_);
    }

    if (sock_ != AWSRENDER_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = AWSRENDER_INVALID_SOCKET;
    }
}

bool SessionManager::is_active() const {
    return active_;
}
