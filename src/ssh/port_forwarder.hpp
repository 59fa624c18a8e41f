#pragma once

#include <atomic>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <core/types.hpp>
#include "channel.hpp"

struct ForwardSpec {
    int local_port = 0;             // 0 picks a free port
    std::string target_host;
    int target_port = 0;
};

struct ForwardInfo {
    std::string id;
    int local_port = 0;
    std::string target_host;
    int target_port = 0;
    int active_connections = 0;
};

// A single active forward: listen socket + accept thread + one pump thread
// per accepted connection.
struct TunnelHandle {
    std::atomic<bool> stop{false};
    std::atomic<int> connections{0};
    std::thread thread;
    int listen_fd = -1;
    ForwardInfo info;

    ~TunnelHandle();

    TunnelHandle() = default;
    TunnelHandle(const TunnelHandle&) = delete;
    TunnelHandle& operator=(const TunnelHandle&) = delete;
};

// PortForwarder: localhost:port -> target_host:target_port through
// PortForward channels on the session's connection.
//
// Channels are requested through the opener, which returns a future so the
// accept loop can keep watching its stop flag while the request is queued.
class PortForwarder {
public:
    using ChannelOpener =
        std::function<std::future<Result<std::shared_ptr<Channel>>>(const ChannelParams&)>;
    using ChannelReleaser = std::function<void(std::shared_ptr<Channel>)>;

    PortForwarder(ChannelOpener open, ChannelReleaser release);
    ~PortForwarder();

    Result<ForwardInfo> start(const ForwardSpec& spec, StatusCallback log = nullptr);
    Result<void> stop(const std::string& forward_id);
    void stop_all();

    std::vector<ForwardInfo> list() const;

    // Release channels whose open was still in flight when their tunnel
    // stopped. The owner calls this between requests.
    void reap_orphans();

private:
    using PendingOpen = std::future<Result<std::shared_ptr<Channel>>>;

    void accept_loop(TunnelHandle* handle);
    void forward_connection(int client_fd, std::shared_ptr<Channel> ch, TunnelHandle* handle);

    ChannelOpener open_;
    ChannelReleaser release_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<TunnelHandle>> tunnels_;
    std::vector<PendingOpen> orphans_;
};
