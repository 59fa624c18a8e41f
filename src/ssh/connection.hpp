#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <core/types.hpp>
#include <core/config.hpp>
#include "channel_mux.hpp"
#include "transport.hpp"

enum class ConnectionState { Connecting, Active, Degraded, Closed };

const char* connection_state_name(ConnectionState state);

// Connection: one authenticated transport to a remote endpoint.
//
// Owns the transport and the channel table. Liveness is tracked by
// tick_keepalive(): each unanswered keepalive moves the connection to Degraded,
// alive_count_max consecutive misses close it. Any transport-level fault,
// reported by a channel or seen by a keepalive, closes the connection and
// invalidates every channel at once.
class Connection {
public:
    using StateListener = std::function<void(ConnectionState state, const std::string& reason)>;

    // Channel faults reach the connection through a weak reference, so a
    // worker reporting a fault never races the owner dropping it.
    static std::shared_ptr<Connection> create(ConnectionConfig config,
                                              std::unique_ptr<Transport> transport,
                                              const ClientSettings& settings);

    Connection(ConnectionConfig config, std::unique_ptr<Transport> transport,
               const ClientSettings& settings);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    const ConnectionConfig& config() const { return config_; }
    ConnectionState state() const;
    bool is_open() const;
    std::string close_reason() const;

    ChannelMux& channels() { return *mux_; }

    void set_state_listener(StateListener listener);

    // Send one keepalive. Returns false once the connection is Closed.
    bool tick_keepalive();
    int missed_keepalives() const { return missed_.load(); }

    // Fail the connection if the transport has reported a fault.
    bool check_fault();

    // Transport fault: Closed, every channel invalidated.
    void fail(const std::string& reason);

    // Graceful teardown: close channels, then the transport.
    void close();

private:
    void transition(ConnectionState next, const std::string& reason);

    ConnectionConfig config_;
    std::unique_ptr<Transport> transport_;
    std::unique_ptr<ChannelMux> mux_;
    const int alive_count_max_;

    mutable std::mutex mutex_;
    ConnectionState state_ = ConnectionState::Connecting;
    std::string close_reason_;
    std::atomic<int> missed_{0};
    StateListener listener_;
};
