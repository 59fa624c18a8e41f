#pragma once

// POSIX socket helpers used by the libssh2 transport and the port forwarder.

#include <poll.h>
#include <string>
#include <core/types.hpp>

using socket_t = int;
#define HOSTLINK_INVALID_SOCKET (-1)

namespace platform {

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Close a socket (no-op for an invalid one).
void close_socket(socket_t sock);

// Resolve host and connect with a deadline. The returned socket is non-blocking.
Result<socket_t> connect_tcp(const std::string& host, int port, int timeout_ms);

// Enable TCP keepalive (idle 60s, interval 10s, count 3). A positive
// user_timeout_ms also bounds how long sent data may stay unacknowledged
// before the socket errors (TCP_USER_TIMEOUT, Linux only).
void enable_tcp_keepalive(socket_t sock, int user_timeout_ms = 0);

// Create a connected AF_UNIX stream pair.
Result<void> socket_pair(socket_t& a, socket_t& b);

// Listen on 127.0.0.1:port. Port 0 picks a free port; bound_port receives it.
Result<socket_t> listen_local(int port, int& bound_port);

} // namespace platform
