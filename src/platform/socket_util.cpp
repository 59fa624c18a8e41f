#include "socket_util.hpp"
#include <sys/socket.h>
#include <sys/un.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <chrono>
#include <fmt/format.h>

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

void close_socket(socket_t sock) {
    if (sock != HOSTLINK_INVALID_SOCKET) close(sock);
}

void enable_tcp_keepalive(socket_t sock, int user_timeout_ms) {
    int on = 1;
    setsockopt(sock, SOL_SOCKET, SO_KEEPALIVE, &on, sizeof(on));
    int keepidle = 60;
    int keepintvl = 10;
    int keepcnt = 3;
#ifdef TCP_KEEPIDLE
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPIDLE, &keepidle, sizeof(keepidle));
#endif
#ifdef TCP_KEEPINTVL
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPINTVL, &keepintvl, sizeof(keepintvl));
#endif
#ifdef TCP_KEEPCNT
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPCNT, &keepcnt, sizeof(keepcnt));
#endif
#ifdef TCP_USER_TIMEOUT
    if (user_timeout_ms > 0) {
        unsigned int timeout = static_cast<unsigned int>(user_timeout_ms);
        setsockopt(sock, IPPROTO_TCP, TCP_USER_TIMEOUT, &timeout, sizeof(timeout));
    }
#endif
}

// Try one resolved address with a non-blocking connect bounded by the deadline.
static int try_connect(const struct addrinfo* ai,
                       std::chrono::steady_clock::time_point deadline,
                       std::string& err) {
    int sock = socket(ai->ai_family, SOCK_STREAM, 0);
    if (sock < 0) {
        err = fmt::format("socket(): {}", std::strerror(errno));
        return -1;
    }
    set_nonblocking(sock);

    int ret = connect(sock, ai->ai_addr, ai->ai_addrlen);
    if (ret == 0) return sock;
    if (errno != EINPROGRESS) {
        err = fmt::format("connect(): {}", std::strerror(errno));
        close(sock);
        return -1;
    }

    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    if (remaining <= 0 || poll_socket(sock, POLLOUT, static_cast<int>(remaining)) == 0) {
        err = "connection timed out";
        close(sock);
        return -1;
    }

    int sock_err = 0;
    socklen_t err_len = sizeof(sock_err);
    getsockopt(sock, SOL_SOCKET, SO_ERROR, &sock_err, &err_len);
    if (sock_err != 0) {
        err = fmt::format("connect(): {}", std::strerror(sock_err));
        close(sock);
        return -1;
    }
    return sock;
}

Result<socket_t> connect_tcp(const std::string& host, int port, int timeout_ms) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    std::string port_str = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
    if (rc != 0 || !res) {
        return Result<socket_t>::Err(ErrorKind::ConnectFailed, "resolve", host,
                                     gai_strerror(rc));
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    std::string err = "no addresses";
    int sock = -1;
    for (auto* ai = res; ai && sock < 0; ai = ai->ai_next) {
        sock = try_connect(ai, deadline, err);
    }
    freeaddrinfo(res);

    if (sock < 0) {
        return Result<socket_t>::Err(ErrorKind::ConnectFailed, "connect",
                                     fmt::format("{}:{}", host, port), err);
    }
    return Result<socket_t>::Ok(sock);
}

Result<void> socket_pair(socket_t& a, socket_t& b) {
    int sv[2];
    if (socketpair(AF_UNIX, SOCK_STREAM, 0, sv) < 0) {
        return Result<void>::Err(ErrorKind::ConnectFailed, "socketpair", "",
                                 std::strerror(errno));
    }
    a = sv[0];
    b = sv[1];
    return Result<void>::Ok();
}

Result<socket_t> listen_local(int port, int& bound_port) {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        return Result<socket_t>::Err(ErrorKind::InvalidArgument, "listen",
                                     std::to_string(port), std::strerror(errno));
    }

    int reuse = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

    if (bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0 ||
        listen(fd, 8) < 0) {
        std::string err = std::strerror(errno);
        close(fd);
        return Result<socket_t>::Err(ErrorKind::InvalidArgument, "listen",
                                     std::to_string(port), err);
    }

    socklen_t len = sizeof(addr);
    getsockname(fd, reinterpret_cast<struct sockaddr*>(&addr), &len);
    bound_port = ntohs(addr.sin_port);
    return Result<socket_t>::Ok(fd);
}

} // namespace platform
