#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <core/types.hpp>
#include "channel.hpp"
#include "transport.hpp"

// ChannelMux: creates and tracks the logical channels of one Connection.
//
// The registry lock is held only to reserve a slot or update the table,
// never across transport I/O, so a slow channel open does not stall
// releases or lookups on other channels.
class ChannelMux {
public:
    ChannelMux(Transport& transport, int max_channels, int eof_wait_ms);
    ~ChannelMux();

    ChannelMux(const ChannelMux&) = delete;
    ChannelMux& operator=(const ChannelMux&) = delete;

    // Open a channel of the given type. Fails with ChannelLimitExceeded when
    // max_channels are already open or opening.
    Result<std::shared_ptr<Channel>> open(ChannelType type, const ChannelParams& params = {});

    // Gracefully close a channel and drop it from the table. Idempotent.
    void release(const std::shared_ptr<Channel>& channel);

    // Close every channel gracefully (normal disconnect).
    void close_all();

    // Mark every channel Closed without I/O (transport fault).
    void invalidate_all(const std::string& reason);

    void set_fault_handler(Channel::FaultHandler handler);

    int open_count() const;
    int max_channels() const { return max_channels_; }
    std::vector<std::shared_ptr<Channel>> channels() const;

private:
    Transport& transport_;
    const int max_channels_;
    const int eof_wait_ms_;

    mutable std::mutex mutex_;
    std::map<int, std::shared_ptr<Channel>> channels_;
    int reserved_ = 0;              // opens in flight
    int next_id_ = 1;
    Channel::FaultHandler on_fault_;
};
