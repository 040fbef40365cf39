#pragma once

#include <string>
#include <poll.h>

using socket_t = int;
#define AWSRENDER_INVALID_SOCKET (-1)

namespace platform {

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Resolve host (name or literal address) and connect a TCP socket to it,
// trying each resolved address in turn. On failure returns
// AWSRENDER_INVALID_SOCKET and fills error.
socket_t connect_tcp(const std::string& host, int port, int timeout_ms,
                     std::string& error);

// Close a socket.
void close_socket(socket_t sock);

} // namespace platform
