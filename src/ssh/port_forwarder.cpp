#include "port_forwarder.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <fmt/format.h>
#include <unistd.h>
#include <sys/socket.h>
#include <chrono>

// ── TunnelHandle ──────────────────────────────────────────

TunnelHandle::~TunnelHandle() {
    stop.store(true);
    if (thread.joinable()) thread.join();
    platform::close_socket(listen_fd);
}

// ── PortForwarder ─────────────────────────────────────────

PortForwarder::PortForwarder(ChannelOpener open, ChannelReleaser release)
    : open_(std::move(open)), release_(std::move(release)) {}

PortForwarder::~PortForwarder() {
    stop_all();
}

// ── Forwarding threads ────────────────────────────────────

// Copy data between a local TCP client and a PortForward channel.
// Runs until either side closes or the tunnel is stopped.
void PortForwarder::forward_connection(int client_fd, std::shared_ptr<Channel> ch,
                                       TunnelHandle* handle) {
    char buf[FORWARD_BUF_SIZE];

    while (!handle->stop.load() && !ch->invalidated()) {
        bool idle = true;

        // local -> channel
        int revents = platform::poll_socket(client_fd, POLLIN, 0);
        if (revents & (POLLIN | POLLHUP)) {
            ssize_t n = ::read(client_fd, buf, sizeof(buf));
            if (n <= 0) break;  // client closed
            idle = false;
            if (ch->write_all(std::string(buf, static_cast<size_t>(n)), &handle->stop).is_err()) break;
        }

        // channel -> local
        auto r = ch->read(buf, sizeof(buf));
        if (r.status == IoStatus::Ok) {
            idle = false;
            size_t sent = 0;
            while (sent < r.bytes) {
                ssize_t w = ::write(client_fd, buf + sent, r.bytes - sent);
                if (w <= 0) goto done;
                sent += static_cast<size_t>(w);
            }
        } else if (r.status == IoStatus::Eof || r.status == IoStatus::Error) {
            break;  // remote closed
        }

        if (idle) platform::poll_socket(client_fd, POLLIN, 10);
    }

done:
    close(client_fd);
    release_(std::move(ch));
    handle->connections--;
}

void PortForwarder::accept_loop(TunnelHandle* handle) {
    std::vector<std::thread> conn_threads;
    const std::string& target = handle->info.target_host;
    const int target_port = handle->info.target_port;

    while (!handle->stop.load()) {
        // Accept with timeout so we can check the stop flag
        if (!(platform::poll_socket(handle->listen_fd, POLLIN, 200) & POLLIN)) continue;

        int client = accept(handle->listen_fd, nullptr, nullptr);
        if (client < 0) continue;

        ChannelParams params;
        params.target_host = target;
        params.target_port = target_port;
        auto pending = open_(params);

        while (!handle->stop.load() &&
               pending.wait_for(std::chrono::milliseconds(50)) != std::future_status::ready) {}
        if (handle->stop.load()) {
            close(client);
            std::lock_guard<std::mutex> lock(mutex_);
            orphans_.push_back(std::move(pending));
            break;
        }

        auto opened = pending.get();
        if (opened.is_err()) {
            hostlink_log(fmt::format("PortForwarder: direct-tcpip to {}:{} failed: {}",
                                     target, target_port, opened.error.describe()));
            close(client);
            continue;
        }

        handle->connections++;
        conn_threads.emplace_back(&PortForwarder::forward_connection, this,
                                  client, opened.value, handle);
    }

    for (auto& t : conn_threads) {
        if (t.joinable()) t.join();
    }
}

// ── Start/Stop ────────────────────────────────────────────

Result<ForwardInfo> PortForwarder::start(const ForwardSpec& spec, StatusCallback log) {
    auto emit = [&](const std::string& msg) {
        hostlink_log(fmt::format("PortForwarder: {}", msg));
        if (log) log(msg);
    };

    if (spec.target_host.empty() || spec.target_port <= 0) {
        return Result<ForwardInfo>::Err(ErrorKind::InvalidArgument, "forward",
                                        spec.target_host, "target host and port are required");
    }

    int bound_port = 0;
    auto listener = platform::listen_local(spec.local_port, bound_port);
    if (listener.is_err()) {
        emit(fmt::format("listen on port {} failed: {}", spec.local_port, listener.error.message));
        return Result<ForwardInfo>::Err(listener.error);
    }

    auto handle = std::make_shared<TunnelHandle>();
    handle->listen_fd = listener.value;
    handle->info.id = generate_id("fwd");
    handle->info.local_port = bound_port;
    handle->info.target_host = spec.target_host;
    handle->info.target_port = spec.target_port;
    handle->thread = std::thread(&PortForwarder::accept_loop, this, handle.get());

    {
        std::lock_guard<std::mutex> lock(mutex_);
        tunnels_[handle->info.id] = handle;
    }

    emit(fmt::format("localhost:{} -> {}:{} ready", bound_port, spec.target_host, spec.target_port));
    return Result<ForwardInfo>::Ok(handle->info);
}

Result<void> PortForwarder::stop(const std::string& forward_id) {
    std::shared_ptr<TunnelHandle> handle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tunnels_.find(forward_id);
        if (it == tunnels_.end()) {
            return Result<void>::Err(ErrorKind::InvalidArgument, "stop-forward", forward_id,
                                     "no such forward");
        }
        handle = it->second;
        tunnels_.erase(it);
    }
    // Destructor joins threads and closes sockets
    handle->stop.store(true);
    handle.reset();
    reap_orphans();
    return Result<void>::Ok();
}

void PortForwarder::stop_all() {
    std::map<std::string, std::shared_ptr<TunnelHandle>> handles;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handles.swap(tunnels_);
    }
    for (auto& [_, h] : handles) h->stop.store(true);
    handles.clear();
    reap_orphans();
}

void PortForwarder::reap_orphans() {
    std::vector<PendingOpen> ready;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = orphans_.begin(); it != orphans_.end();) {
            if (it->wait_for(std::chrono::milliseconds(0)) == std::future_status::ready) {
                ready.push_back(std::move(*it));
                it = orphans_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& pending : ready) {
        auto opened = pending.get();
        if (opened.is_ok()) release_(opened.value);
    }
}

std::vector<ForwardInfo> PortForwarder::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ForwardInfo> out;
    for (const auto& [_, h] : tunnels_) {
        ForwardInfo info = h->info;
        info.active_connections = h->connections.load();
        out.push_back(info);
    }
    return out;
}
