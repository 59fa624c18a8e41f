#include "channel.hpp"
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <chrono>

const char* channel_type_name(ChannelType type) {
    switch (type) {
        case ChannelType::Shell:       return "shell";
        case ChannelType::Exec:        return "exec";
        case ChannelType::Sftp:        return "sftp";
        case ChannelType::PortForward: return "port-forward";
    }
    return "unknown";
}

const char* channel_state_name(ChannelState state) {
    switch (state) {
        case ChannelState::Opening:     return "opening";
        case ChannelState::Open:        return "open";
        case ChannelState::EofSent:     return "eof-sent";
        case ChannelState::EofReceived: return "eof-received";
        case ChannelState::Closed:      return "closed";
    }
    return "unknown";
}

Channel::Channel(int id, ChannelType type, std::unique_ptr<ChannelIo> io)
    : id_(id), type_(type), io_(std::move(io)) {}

Channel::Channel(int id, std::unique_ptr<SftpIo> sftp)
    : id_(id), type_(ChannelType::Sftp), sftp_(std::move(sftp)) {}

ChannelState Channel::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

bool Channel::usable() const {
    auto s = state();
    return s == ChannelState::Open || s == ChannelState::EofReceived;
}

std::string Channel::invalidation_reason() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return invalid_reason_;
}

void Channel::mark_open() {
    set_state(ChannelState::Open);
}

void Channel::set_state(ChannelState s) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ == ChannelState::Closed) return;
    state_ = s;
}

// ── Stream I/O ─────────────────────────────────────────────────

IoResult Channel::checked(IoResult r) {
    if (r.status == IoStatus::Error && r.fatal && on_fault_) {
        on_fault_(fmt::format("{} channel {}: {}", channel_type_name(type_), id_, r.error));
    }
    if (r.status == IoStatus::Eof && state() == ChannelState::Open) {
        set_state(ChannelState::EofReceived);
    }
    return r;
}

IoResult Channel::read(char* buf, std::size_t len) {
    if (invalidated() || !io_) return IoResult::failure(invalidation_reason(), true);
    return checked(io_->read(buf, len));
}

IoResult Channel::read_stderr(char* buf, std::size_t len) {
    if (invalidated() || !io_) return IoResult::failure(invalidation_reason(), true);
    return checked(io_->read_stderr(buf, len));
}

IoResult Channel::write(const char* data, std::size_t len) {
    if (invalidated() || !io_) return IoResult::failure(invalidation_reason(), true);
    return checked(io_->write(data, len));
}

Result<void> Channel::write_all(const std::string& data, const std::atomic<bool>* cancel) {
    std::size_t sent = 0;
    while (sent < data.size()) {
        if (cancel && cancel->load()) {
            return Result<void>::Err(ErrorKind::Cancelled, "write", std::to_string(id_),
                                     "cancelled by request");
        }
        auto r = write(data.data() + sent, data.size() - sent);
        if (r.status == IoStatus::Ok) {
            sent += r.bytes;
        } else if (r.status == IoStatus::Again) {
            platform::sleep_ms(1);
        } else {
            return Result<void>::Err(r.fatal ? ErrorKind::SessionLost : ErrorKind::ChannelProtocolError,
                                     "write", std::to_string(id_),
                                     r.error.empty() ? "channel closed" : r.error);
        }
    }
    return Result<void>::Ok();
}

bool Channel::remote_eof() {
    if (invalidated() || !io_) return true;
    bool eof = io_->remote_eof();
    if (eof && state() == ChannelState::Open) set_state(ChannelState::EofReceived);
    return eof;
}

Result<void> Channel::resize(int cols, int rows) {
    if (invalidated() || !io_) {
        return Result<void>::Err(ErrorKind::SessionLost, "resize", std::to_string(id_),
                                 invalidation_reason());
    }
    return io_->resize(cols, rows);
}

// ── Lifecycle ──────────────────────────────────────────────────

void Channel::shutdown(int eof_wait_ms) {
    if (invalidated() || state() == ChannelState::Closed) return;

    if (sftp_) {
        sftp_->close();
        set_state(ChannelState::Closed);
        return;
    }
    if (!io_) {
        set_state(ChannelState::Closed);
        return;
    }

    auto prior = state();
    if (prior == ChannelState::Open || prior == ChannelState::EofReceived) {
        auto eof = io_->send_eof();
        if (eof.is_err()) {
            hostlink_log(fmt::format("[channel {}] send eof failed: {}", id_, eof.error.describe()));
        }
        if (prior == ChannelState::Open) set_state(ChannelState::EofSent);
    }

    // Drain until the peer's EOF or the wait runs out
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(eof_wait_ms);
    char buf[1024];
    while (!io_->remote_eof() && std::chrono::steady_clock::now() < deadline) {
        auto r = io_->read(buf, sizeof(buf));
        if (r.status == IoStatus::Error) break;
        if (r.status != IoStatus::Ok) platform::sleep_ms(5);
    }

    auto closed = io_->close();
    if (closed.is_err()) {
        hostlink_log(fmt::format("[channel {}] close failed: {}", id_, closed.error.describe()));
    }
    exit_status_ = io_->exit_status();
    set_state(ChannelState::Closed);
}

void Channel::invalidate(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == ChannelState::Closed) return;
        state_ = ChannelState::Closed;
        invalid_reason_ = reason;
    }
    invalidated_ = true;
}
