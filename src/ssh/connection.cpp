#include "connection.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

const char* connection_state_name(ConnectionState state) {
    switch (state) {
        case ConnectionState::Connecting: return "connecting";
        case ConnectionState::Active:     return "active";
        case ConnectionState::Degraded:   return "degraded";
        case ConnectionState::Closed:     return "closed";
    }
    return "unknown";
}

Connection::Connection(ConnectionConfig config, std::unique_ptr<Transport> transport,
                       const ClientSettings& settings)
    : config_(std::move(config)),
      transport_(std::move(transport)),
      mux_(std::make_unique<ChannelMux>(*transport_, settings.channels.max_per_connection,
                                        settings.channels.eof_wait_ms)),
      alive_count_max_(settings.keepalive.alive_count_max) {
    transition(ConnectionState::Active, "");
}

std::shared_ptr<Connection> Connection::create(ConnectionConfig config,
                                               std::unique_ptr<Transport> transport,
                                               const ClientSettings& settings) {
    auto conn = std::make_shared<Connection>(std::move(config), std::move(transport), settings);
    std::weak_ptr<Connection> weak = conn;
    conn->mux_->set_fault_handler([weak](const std::string& reason) {
        if (auto c = weak.lock()) c->fail(reason);
    });
    return conn;
}

Connection::~Connection() {
    close();
}

ConnectionState Connection::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool Connection::is_open() const {
    auto s = state();
    return s == ConnectionState::Active || s == ConnectionState::Degraded;
}

std::string Connection::close_reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return close_reason_;
}

void Connection::set_state_listener(StateListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = std::move(listener);
}

void Connection::transition(ConnectionState next, const std::string& reason) {
    StateListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == next || state_ == ConnectionState::Closed) return;
        state_ = next;
        if (next == ConnectionState::Closed) close_reason_ = reason;
        listener = listener_;
    }
    hostlink_log(fmt::format("[conn {}] -> {}{}", config_.identity(), connection_state_name(next),
                             reason.empty() ? "" : " (" + reason + ")"));
    if (listener) listener(next, reason);
}

// ── Liveness ───────────────────────────────────────────────────

bool Connection::tick_keepalive() {
    if (!is_open()) return false;

    if (transport_->faulted()) {
        fail("transport fault");
        return false;
    }

    if (transport_->send_keepalive()) {
        missed_ = 0;
        transition(ConnectionState::Active, "");
        return true;
    }

    int missed = ++missed_;
    if (transport_->faulted() || missed >= alive_count_max_) {
        fail(fmt::format("keepalive: {} keepalive(s) unanswered", missed));
        return false;
    }
    transition(ConnectionState::Degraded, fmt::format("{} keepalive(s) unanswered", missed));
    return true;
}

bool Connection::check_fault() {
    if (!is_open() || !transport_->faulted()) return false;
    fail("transport fault");
    return true;
}

void Connection::fail(const std::string& reason) {
    if (state() == ConnectionState::Closed) return;
    mux_->invalidate_all(reason);
    transition(ConnectionState::Closed, reason);
}

void Connection::close() {
    if (is_open()) {
        mux_->close_all();
        transition(ConnectionState::Closed, "disconnected");
    }
    // Channels still held elsewhere must not touch the transport once it is gone
    mux_->invalidate_all("connection closed");
    transport_->disconnect();
}
