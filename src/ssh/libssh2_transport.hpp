#pragma once

#include <core/config.hpp>
#include "transport.hpp"

// Libssh2TransportFactory: real SSH connections over libssh2.
//
// Each Transport owns one non-blocking LIBSSH2_SESSION. Every libssh2 call is
// made under the session's io mutex, held only for that call, so channels on
// the same session can be driven from different threads.
//
// Jump hosts: the outer session opens a direct-tcpip channel to the target,
// a pump thread copies bytes between that channel and one end of a
// socketpair, and the inner session handshakes over the other end.
class Libssh2TransportFactory : public TransportFactory {
public:
    explicit Libssh2TransportFactory(const KeepaliveSettings& keepalive);

    Result<std::unique_ptr<Transport>> connect(const ConnectionConfig& config,
                                               StatusCallback callback = nullptr) override;

private:
    KeepaliveSettings keepalive_;
};
