#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <core/types.hpp>
#include "transport.hpp"

enum class ChannelState { Opening, Open, EofSent, EofReceived, Closed };

const char* channel_state_name(ChannelState state);

// Channel: one logical stream over a Connection.
//
// Shell, Exec and PortForward channels carry a ChannelIo; Sftp channels
// carry an SftpIo. Only the task that owns a channel drives its I/O; the
// connection may invalidate it from any thread when the transport fails.
class Channel {
public:
    using FaultHandler = std::function<void(const std::string& reason)>;

    Channel(int id, ChannelType type, std::unique_ptr<ChannelIo> io);
    Channel(int id, std::unique_ptr<SftpIo> sftp);

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    int id() const { return id_; }
    ChannelType type() const { return type_; }
    ChannelState state() const;
    bool usable() const;
    bool invalidated() const { return invalidated_.load(); }
    std::string invalidation_reason() const;

    void mark_open();
    void set_fault_handler(FaultHandler handler) { on_fault_ = std::move(handler); }

    // ── Stream I/O (Shell, Exec, PortForward) ──────────────────

    IoResult read(char* buf, std::size_t len);
    IoResult read_stderr(char* buf, std::size_t len);
    IoResult write(const char* data, std::size_t len);

    // Write everything, polling on Again. Stops early if the channel is
    // invalidated or *cancel becomes true.
    Result<void> write_all(const std::string& data, const std::atomic<bool>* cancel = nullptr);

    bool remote_eof();
    int exit_status() const { return exit_status_; }
    Result<void> resize(int cols, int rows);

    // ── SFTP ───────────────────────────────────────────────────

    SftpIo* sftp() { return sftp_.get(); }

    // ── Lifecycle ──────────────────────────────────────────────

    // Graceful close: send EOF, wait up to eof_wait_ms for the peer's EOF,
    // then close. Safe to call more than once.
    void shutdown(int eof_wait_ms);

    // Mark the channel Closed without touching the transport.
    void invalidate(const std::string& reason);

private:
    IoResult checked(IoResult r);
    void set_state(ChannelState s);

    const int id_;
    const ChannelType type_;
    std::unique_ptr<ChannelIo> io_;
    std::unique_ptr<SftpIo> sftp_;
    FaultHandler on_fault_;

    mutable std::mutex state_mutex_;
    ChannelState state_ = ChannelState::Opening;
    std::string invalid_reason_;
    std::atomic<bool> invalidated_{false};
    int exit_status_ = -1;
};
