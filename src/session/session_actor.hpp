#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <core/cancel_registry.hpp>
#include <core/config.hpp>
#include <core/types.hpp>
#include <ssh/connection.hpp>
#include <ssh/port_forwarder.hpp>
#include <ssh/transport.hpp>
#include "command_executor.hpp"
#include "events.hpp"
#include "sftp_ops.hpp"

// SessionActor: owns one session's connection and serialises every request
// against it.
//
// Requests are queued in a FIFO mailbox and handled one at a time on the
// actor thread; each answers through a future. Exec commands only open
// their channel on the actor thread and then run as independent tasks, so
// a long command never delays later requests. Between messages the actor
// pumps shell output, sends keepalives and drives reconnect backoff.
class SessionActor {
public:
    SessionActor(std::string id, ConnectionConfig config, const ClientSettings& settings,
                 TransportFactory& factory, CancelRegistry& commands, EventListener& events);
    ~SessionActor();

    SessionActor(const SessionActor&) = delete;
    SessionActor& operator=(const SessionActor&) = delete;

    void start();

    // Disconnect, finish queued requests and join every thread.
    void stop();

    const std::string& id() const { return id_; }
    const ConnectionConfig& config() const { return config_; }
    SessionStatus status() const;

    // ── Lifecycle ──────────────────────────────────────────────

    // First call connects once. Later calls on a lost session run the
    // reconnect backoff and resolve when it succeeds or is exhausted.
    std::future<Result<void>> connect();
    std::future<Result<void>> disconnect();

    // ── Shell ──────────────────────────────────────────────────

    std::future<Result<void>> open_shell(int cols, int rows);
    std::future<Result<void>> write_shell(std::string data);
    std::future<Result<void>> resize_shell(int cols, int rows);
    std::future<Result<void>> close_shell();

    // ── Commands ───────────────────────────────────────────────

    std::future<Result<ExecOutput>> exec(std::string command, std::string command_id);
    std::future<Result<void>> cancel_exec(std::string command_id);

    // ── Files and channels ─────────────────────────────────────

    std::future<Result<SftpReply>> sftp(SftpOp op);
    std::future<Result<std::shared_ptr<Channel>>> open_channel(ChannelType type,
                                                               ChannelParams params = {});
    void release_channel(std::shared_ptr<Channel> channel);

    // ── Port forwarding ────────────────────────────────────────

    std::future<Result<ForwardInfo>> start_forward(ForwardSpec spec);
    std::future<Result<void>> stop_forward(std::string forward_id);
    std::future<Result<std::vector<ForwardInfo>>> list_forwards();

private:
    using Clock = std::chrono::steady_clock;

    enum class MessageKind {
        Connect, Disconnect, OpenShell, WriteShell, ResizeShell, CloseShell,
        Exec, CancelExec, Sftp, OpenChannel, ReleaseChannel,
        StartForward, StopForward, ListForwards,
    };

    struct Message {
        MessageKind kind;
        std::function<void()> handle;
    };

    struct ExecTask {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    template <typename T>
    using PromisePtr = std::shared_ptr<std::promise<Result<T>>>;

    static const char* message_kind_name(MessageKind kind);

    // Queue a request whose handler fulfils the promise, now or later.
    template <typename T>
    std::future<Result<T>> request(MessageKind kind, std::function<void(PromisePtr<T>)> handler) {
        auto promise = std::make_shared<std::promise<Result<T>>>();
        auto future = promise->get_future();
        if (!post(kind, [promise, handler] { handler(promise); })) {
            promise->set_value(Result<T>::Err(ErrorKind::SessionNotFound, message_kind_name(kind),
                                               id_, "session has been shut down"));
        }
        return future;
    }

    bool post(MessageKind kind, std::function<void()> handle);
    void wake();
    void run();
    Clock::time_point next_wakeup() const;
    void service();

    // ── Actor-thread handlers ──────────────────────────────────

    bool connected() const;
    Result<void> not_connected(const char* op) const;
    void set_status(SessionStatus status);
    Result<void> establish();
    void handle_connect(PromisePtr<void> promise);
    Result<void> handle_disconnect(const std::string& reason);
    void handle_connection_lost();
    void begin_reconnect(Clock::time_point first_attempt);
    void attempt_reconnect();
    void finish_reconnect(const Result<void>& outcome);

    Result<void> handle_open_shell(int cols, int rows);
    Result<void> handle_close_shell();
    void pump_shell();

    void handle_exec(const std::string& command, const std::string& command_id,
                     PromisePtr<ExecOutput> promise);
    void reap_tasks(bool all);

    Result<SftpReply> handle_sftp(const SftpOp& op);
    Result<std::shared_ptr<Channel>> handle_open_channel(ChannelType type, const ChannelParams& params);
    Result<ForwardInfo> handle_start_forward(const ForwardSpec& spec);

    const std::string id_;
    const ConnectionConfig config_;
    const ClientSettings settings_;
    TransportFactory& factory_;
    CancelRegistry& commands_;
    EventListener& events_;
    CommandExecutor executor_;

    std::thread thread_;
    std::mutex mailbox_mutex_;
    std::condition_variable mailbox_cv_;
    std::deque<Message> mailbox_;
    bool accepting_ = true;             // guarded by mailbox_mutex_
    bool stopping_ = false;             // guarded by mailbox_mutex_
    std::atomic<bool> lost_{false};

    mutable std::mutex status_mutex_;
    SessionStatus status_ = SessionStatus::Disconnected;

    // Actor thread only
    std::shared_ptr<Connection> connection_;
    std::shared_ptr<Channel> shell_;
    std::shared_ptr<Channel> browse_sftp_;
    std::unique_ptr<PortForwarder> forwarder_;
    std::vector<ExecTask> tasks_;
    bool ever_connected_ = false;
    Clock::time_point next_keepalive_;

    bool reconnecting_ = false;
    int reconnect_attempt_ = 0;
    int reconnect_delay_ms_ = 0;
    Clock::time_point next_reconnect_;
    Error last_reconnect_error_;
    std::vector<PromisePtr<void>> reconnect_waiters_;
};
