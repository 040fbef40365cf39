#include "socket_util.hpp"

#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <netdb.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace platform {

void set_nonblocking(socket_t sock) {
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
}

int poll_socket(socket_t sock, short events, int timeout_ms) {
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
}

static socket_t connect_one(const struct addrinfo* ai, int timeout_ms, std::string& error) {
    socket_t sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (sock < 0) {
        error = std::string("socket: ") + strerror(errno);
        return AWSRENDER_INVALID_SOCKET;
    }
    set_nonblocking(sock);

    int ret = connect(sock, ai->ai_addr, ai->ai_addrlen);
    if (ret < 0 && errno != EINPROGRESS) {
        error = strerror(errno);
        close_socket(sock);
        return AWSRENDER_INVALID_SOCKET;
    }

    // Wait for non-blocking connect to complete
    if (ret < 0) {
        int revents = poll_socket(sock, POLLOUT, timeout_ms);
        if (revents == 0) {
            error = "connection timed out";
            close_socket(sock);
            return AWSRENDER_INVALID_SOCKET;
        }
        int sock_err = 0;
        socklen_t err_len = sizeof(sock_err);
        getsockopt(sock, SOL_SOCKET, SO_ERROR, &sock_err, &err_len);
        if (sock_err != 0) {
            error = strerror(sock_err);
            close_socket(sock);
            return AWSRENDER_INVALID_SOCKET;
        }
    }

    int keepalive = 1;
    setsockopt(sock, SOL_SOCKET, SO_KEEPALIVE, &keepalive, sizeof(keepalive));
#ifdef TCP_KEEPIDLE
    int keepidle = 60;
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPIDLE, &keepidle, sizeof(keepidle));
#endif
    return sock;
}

socket_t connect_tcp(const std::string& host, int port, int timeout_ms,
                     std::string& error) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_NUMERICSERV;

    struct addrinfo* res = nullptr;
    std::string service = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
    if (rc != 0) {
        error = std::string("cannot resolve ") + host + ": " + gai_strerror(rc);
        return AWSRENDER_INVALID_SOCKET;
    }

    socket_t sock = AWSRENDER_INVALID_SOCKET;
    for (const struct addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
        sock = connect_one(ai, timeout_ms, error);
        if (sock != AWSRENDER_INVALID_SOCKET) break;
    }
    freeaddrinfo(res);
    return sock;
}

void close_socket(socket_t sock) {
    close(sock);
}

} // namespace platform
