#include "session_actor.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>

const char* SessionActor::message_kind_name(MessageKind kind) {
    switch (kind) {
        case MessageKind::Connect:        return "connect";
        case MessageKind::Disconnect:     return "disconnect";
        case MessageKind::OpenShell:      return "open-shell";
        case MessageKind::WriteShell:     return "write-shell";
        case MessageKind::ResizeShell:    return "resize-shell";
        case MessageKind::CloseShell:     return "close-shell";
        case MessageKind::Exec:           return "exec";
        case MessageKind::CancelExec:     return "cancel-exec";
        case MessageKind::Sftp:           return "sftp";
        case MessageKind::OpenChannel:    return "open-channel";
        case MessageKind::ReleaseChannel: return "release-channel";
        case MessageKind::StartForward:   return "start-forward";
        case MessageKind::StopForward:    return "stop-forward";
        case MessageKind::ListForwards:   return "list-forwards";
    }
    return "unknown";
}

// ── Lifecycle ──────────────────────────────────────────────────

SessionActor::SessionActor(std::string id, ConnectionConfig config, const ClientSettings& settings,
                           TransportFactory& factory, CancelRegistry& commands,
                           EventListener& events)
    : id_(std::move(id)),
      config_(std::move(config)),
      settings_(settings),
      factory_(factory),
      commands_(commands),
      events_(events),
      executor_(commands, settings.exec, settings.channels.eof_wait_ms) {}

SessionActor::~SessionActor() {
    stop();
}

void SessionActor::start() {
    if (thread_.joinable()) return;
    thread_ = std::thread([this] { run(); });
}

void SessionActor::stop() {
    if (!thread_.joinable()) return;
    post(MessageKind::Disconnect, [this] { handle_disconnect("session closed"); });
    {
        std::lock_guard<std::mutex> lock(mailbox_mutex_);
        accepting_ = false;
        stopping_ = true;
    }
    mailbox_cv_.notify_all();
    thread_.join();
}

SessionStatus SessionActor::status() const {
    std::lock_guard<std::mutex> lock(status_mutex_);
    return status_;
}

// ── Mailbox ────────────────────────────────────────────────────

bool SessionActor::post(MessageKind kind, std::function<void()> handle) {
    {
        std::lock_guard<std::mutex> lock(mailbox_mutex_);
        if (!accepting_) return false;
        mailbox_.push_back(Message{kind, std::move(handle)});
    }
    mailbox_cv_.notify_all();
    return true;
}

void SessionActor::wake() {
    { std::lock_guard<std::mutex> lock(mailbox_mutex_); }
    mailbox_cv_.notify_all();
}

SessionActor::Clock::time_point SessionActor::next_wakeup() const {
    auto now = Clock::now();
    auto next = now + std::chrono::milliseconds(250);
    if (shell_) next = std::min(next, now + std::chrono::milliseconds(ACTOR_IDLE_WAIT_MS));
    if (connection_ && connection_->is_open()) next = std::min(next, next_keepalive_);
    if (reconnecting_) next = std::min(next, next_reconnect_);
    return next;
}

void SessionActor::run() {
    hostlink_log(fmt::format("[session {}] actor started for {}", id_, config_.identity()));
    for (;;) {
        std::deque<Message> batch;
        {
            std::unique_lock<std::mutex> lock(mailbox_mutex_);
            mailbox_cv_.wait_until(lock, next_wakeup(), [this] {
                return !mailbox_.empty() || stopping_ || lost_.load();
            });
            if (stopping_ && mailbox_.empty()) break;
            batch.swap(mailbox_);
        }

        for (auto& msg : batch) {
            if (msg.kind != MessageKind::WriteShell && msg.kind != MessageKind::ReleaseChannel) {
                hostlink_log(fmt::format("[session {}] {}", id_, message_kind_name(msg.kind)));
            }
            msg.handle();
        }
        service();
    }

    reap_tasks(true);
    finish_reconnect(Result<void>::Err(ErrorKind::SessionLost, "connect", id_, "session closed"));
    hostlink_log(fmt::format("[session {}] actor stopped", id_));
}

// Work done between messages: fault detection, task reaping, keepalive,
// shell output, reconnect timers.
void SessionActor::service() {
    if (connection_) {
        connection_->check_fault();
        if (lost_.exchange(false) || !connection_->is_open()) handle_connection_lost();
    } else {
        lost_ = false;
    }

    reap_tasks(false);
    if (forwarder_) forwarder_->reap_orphans();

    auto now = Clock::now();
    if (connection_ && now >= next_keepalive_) {
        next_keepalive_ = now + std::chrono::seconds(settings_.keepalive.interval_secs);
        if (!connection_->tick_keepalive()) handle_connection_lost();
    }

    if (shell_) pump_shell();

    if (reconnecting_ && Clock::now() >= next_reconnect_) attempt_reconnect();
}

// ── Connection handling ────────────────────────────────────────

bool SessionActor::connected() const {
    return connection_ && connection_->is_open();
}

Result<void> SessionActor::not_connected(const char* op) const {
    return Result<void>::Err(ErrorKind::SessionLost, op, id_, "session is not connected");
}

void SessionActor::set_status(SessionStatus status) {
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        if (status_ == status) return;
        status_ = status;
    }
    hostlink_log(fmt::format("[session {}] status {}", id_, session_status_name(status)));
    events_.session_status_changed(id_, status);
}

Result<void> SessionActor::establish() {
    auto transport = factory_.connect(config_, [this](const std::string& msg) {
        hostlink_log(fmt::format("[session {}] {}", id_, msg));
    });
    if (transport.is_err()) {
        Error err = transport.error;
        if (err.kind != ErrorKind::ConnectFailed) {
            err = make_error(ErrorKind::ConnectFailed, "connect", id_, err.describe());
        }
        return Result<void>::Err(err);
    }

    connection_ = Connection::create(config_, std::move(transport.value), settings_);
    connection_->set_state_listener([this](ConnectionState state, const std::string&) {
        if (state == ConnectionState::Closed) {
            lost_ = true;
            wake();
        }
    });
    next_keepalive_ = Clock::now() + std::chrono::seconds(settings_.keepalive.interval_secs);
    ever_connected_ = true;
    return Result<void>::Ok();
}

void SessionActor::handle_connect(PromisePtr<void> promise) {
    if (connected()) {
        promise->set_value(Result<void>::Ok());
        return;
    }
    if (reconnecting_) {
        reconnect_waiters_.push_back(promise);
        next_reconnect_ = Clock::now();
        return;
    }
    if (ever_connected_) {
        reconnect_waiters_.push_back(promise);
        begin_reconnect(Clock::now());
        return;
    }

    set_status(SessionStatus::Connecting);
    auto r = establish();
    set_status(r.is_ok() ? SessionStatus::Connected : SessionStatus::Disconnected);
    promise->set_value(r);
}

Result<void> SessionActor::handle_disconnect(const std::string& reason) {
    reconnecting_ = false;
    finish_reconnect(Result<void>::Err(ErrorKind::SessionLost, "connect", id_, reason));

    int cancelled = commands_.cancel_owned(id_);
    if (cancelled > 0) {
        hostlink_log(fmt::format("[session {}] cancelling {} command(s) on disconnect", id_, cancelled));
    }
    reap_tasks(true);

    if (forwarder_) forwarder_->stop_all();
    if (shell_) handle_close_shell();
    browse_sftp_.reset();

    if (connection_) {
        connection_->set_state_listener(nullptr);
        connection_->close();
        connection_.reset();
    }
    lost_ = false;
    set_status(SessionStatus::Disconnected);
    return Result<void>::Ok();
}

void SessionActor::handle_connection_lost() {
    if (!connection_) return;

    std::string reason = connection_->close_reason();
    if (reason.empty()) reason = "connection lost";
    connection_->fail(reason);
    hostlink_log(fmt::format("[session {}] connection lost: {}", id_, reason));

    // Exec tasks see their channels invalidated and answer SessionLost
    if (forwarder_) forwarder_->stop_all();
    if (shell_) {
        shell_.reset();
        events_.shell_closed(id_);
    }
    browse_sftp_.reset();
    connection_->set_state_listener(nullptr);
    connection_.reset();
    set_status(SessionStatus::Disconnected);

    if (settings_.reconnect.automatic) {
        begin_reconnect(Clock::now() + std::chrono::milliseconds(settings_.reconnect.initial_delay_ms));
    }
}

// ── Reconnect ──────────────────────────────────────────────────

void SessionActor::begin_reconnect(Clock::time_point first_attempt) {
    reconnecting_ = true;
    reconnect_attempt_ = 0;
    reconnect_delay_ms_ = settings_.reconnect.initial_delay_ms;
    next_reconnect_ = first_attempt;
    hostlink_log(fmt::format("[session {}] reconnect scheduled", id_));
}

void SessionActor::attempt_reconnect() {
    reconnect_attempt_++;
    set_status(SessionStatus::Connecting);

    auto r = establish();
    if (r.is_ok()) {
        reconnecting_ = false;
        hostlink_log(fmt::format("[session {}] reconnected after {} attempt(s)", id_, reconnect_attempt_));
        set_status(SessionStatus::Connected);
        finish_reconnect(r);
        return;
    }

    last_reconnect_error_ = make_error(ErrorKind::ReconnectAttemptFailed, "reconnect", id_,
                                       r.error.describe());
    hostlink_log(fmt::format("[session {}] reconnect attempt {} failed: {}",
                             id_, reconnect_attempt_, r.error.describe()));
    set_status(SessionStatus::Disconnected);
    events_.reconnect_attempt_failed(id_, reconnect_attempt_, last_reconnect_error_);

    if (reconnect_attempt_ >= settings_.reconnect.max_attempts) {
        reconnecting_ = false;
        events_.reconnect_exhausted(id_);
        finish_reconnect(Result<void>::Err(ErrorKind::ReconnectExhausted, "reconnect", id_,
                                           fmt::format("gave up after {} attempts: {}",
                                                       reconnect_attempt_, r.error.message)));
        return;
    }

    next_reconnect_ = Clock::now() + std::chrono::milliseconds(reconnect_delay_ms_);
    reconnect_delay_ms_ = std::min(reconnect_delay_ms_ * 2, settings_.reconnect.max_delay_ms);
}

void SessionActor::finish_reconnect(const Result<void>& outcome) {
    auto waiters = std::move(reconnect_waiters_);
    reconnect_waiters_.clear();
    for (auto& w : waiters) w->set_value(outcome);
}

// ── Shell ──────────────────────────────────────────────────────

Result<void> SessionActor::handle_open_shell(int cols, int rows) {
    if (!connected()) return not_connected("open-shell");
    if (shell_) handle_close_shell();

    ChannelParams params;
    params.cols = cols;
    params.rows = rows;
    auto ch = connection_->channels().open(ChannelType::Shell, params);
    if (ch.is_err()) return Result<void>::Err(ch.error);
    shell_ = ch.value;
    return Result<void>::Ok();
}

Result<void> SessionActor::handle_close_shell() {
    if (!shell_) return Result<void>::Err(ErrorKind::InvalidArgument, "close-shell", id_, "no shell open");
    if (connection_) connection_->channels().release(shell_);
    shell_.reset();
    events_.shell_closed(id_);
    return Result<void>::Ok();
}

void SessionActor::pump_shell() {
    char buf[SSH_READ_BUF_SIZE];
    for (int i = 0; i < 16 && shell_; i++) {
        auto r = shell_->read(buf, sizeof(buf));
        if (r.status == IoStatus::Ok) {
            events_.shell_output(id_, std::string(buf, r.bytes));
            continue;
        }
        if (r.status == IoStatus::Eof || (r.status == IoStatus::Error && !r.fatal)) {
            handle_close_shell();
        }
        // Fatal errors already failed the connection; service() handles it
        break;
    }
}

// ── Commands ───────────────────────────────────────────────────

void SessionActor::handle_exec(const std::string& command, const std::string& command_id,
                               PromisePtr<ExecOutput> promise) {
    using R = Result<ExecOutput>;
    if (!connected()) {
        promise->set_value(R::Err(ErrorKind::SessionLost, "exec", command_id, "session is not connected"));
        return;
    }

    auto admitted = executor_.admit(command_id, id_);
    if (admitted.is_err()) {
        promise->set_value(R::Err(admitted.error));
        return;
    }

    ChannelParams params;
    params.command = command;
    auto ch = connection_->channels().open(ChannelType::Exec, params);
    if (ch.is_err()) {
        Error err = ch.error;
        err.id = command_id;
        admitted.value = CancelRegistry::Registration();
        promise->set_value(R::Err(err));
        return;
    }

    ExecTask task;
    task.done = std::make_shared<std::atomic<bool>>(false);
    auto done = task.done;
    auto channel = ch.value;
    auto registration = std::make_shared<CancelRegistry::Registration>(std::move(admitted.value));

    task.thread = std::thread([this, command, channel, registration, promise, done] {
        const std::string cid = registration->id();
        auto result = executor_.execute(*channel, command, *registration,
                                        [this, &cid](const std::string& chunk) {
                                            events_.command_output(cid, chunk);
                                        });
        release_channel(channel);
        // Free the id before answering so the caller may reuse it
        *registration = CancelRegistry::Registration();
        promise->set_value(std::move(result));
        done->store(true);
        wake();
    });
    tasks_.push_back(std::move(task));
}

void SessionActor::reap_tasks(bool all) {
    for (auto it = tasks_.begin(); it != tasks_.end();) {
        if (all || it->done->load()) {
            if (it->thread.joinable()) it->thread.join();
            it = tasks_.erase(it);
        } else {
            ++it;
        }
    }
}

// ── Files and channels ─────────────────────────────────────────

Result<SftpReply> SessionActor::handle_sftp(const SftpOp& op) {
    using R = Result<SftpReply>;
    if (!connected()) return R::Err(not_connected(sftp_op_name(op.kind)).error);

    if (!browse_sftp_ || !browse_sftp_->usable()) {
        auto ch = connection_->channels().open(ChannelType::Sftp);
        if (ch.is_err()) return R::Err(ch.error);
        browse_sftp_ = ch.value;
    }

    auto r = run_sftp_op(*browse_sftp_->sftp(), op);
    if (r.is_err() && r.kind() == ErrorKind::SessionLost) connection_->check_fault();
    return r;
}

Result<std::shared_ptr<Channel>> SessionActor::handle_open_channel(ChannelType type,
                                                                   const ChannelParams& params) {
    using R = Result<std::shared_ptr<Channel>>;
    if (!connected()) return R::Err(not_connected("open-channel").error);
    return connection_->channels().open(type, params);
}

Result<ForwardInfo> SessionActor::handle_start_forward(const ForwardSpec& spec) {
    using R = Result<ForwardInfo>;
    if (!connected()) return R::Err(not_connected("start-forward").error);

    if (!forwarder_) {
        forwarder_ = std::make_unique<PortForwarder>(
            [this](const ChannelParams& params) {
                return open_channel(ChannelType::PortForward, params);
            },
            [this](std::shared_ptr<Channel> ch) { release_channel(std::move(ch)); });
    }
    return forwarder_->start(spec, [this](const std::string& msg) {
        hostlink_log(fmt::format("[session {}] {}", id_, msg));
    });
}

// ── Public requests ────────────────────────────────────────────

std::future<Result<void>> SessionActor::connect() {
    return request<void>(MessageKind::Connect, [this](PromisePtr<void> p) { handle_connect(p); });
}

std::future<Result<void>> SessionActor::disconnect() {
    return request<void>(MessageKind::Disconnect, [this](PromisePtr<void> p) {
        p->set_value(handle_disconnect("disconnected by request"));
    });
}

std::future<Result<void>> SessionActor::open_shell(int cols, int rows) {
    return request<void>(MessageKind::OpenShell, [this, cols, rows](PromisePtr<void> p) {
        p->set_value(handle_open_shell(cols, rows));
    });
}

std::future<Result<void>> SessionActor::write_shell(std::string data) {
    return request<void>(MessageKind::WriteShell, [this, data](PromisePtr<void> p) {
        if (!shell_) {
            p->set_value(Result<void>::Err(ErrorKind::InvalidArgument, "write-shell", id_, "no shell open"));
            return;
        }
        p->set_value(shell_->write_all(data));
    });
}

std::future<Result<void>> SessionActor::resize_shell(int cols, int rows) {
    return request<void>(MessageKind::ResizeShell, [this, cols, rows](PromisePtr<void> p) {
        if (!shell_) {
            p->set_value(Result<void>::Err(ErrorKind::InvalidArgument, "resize-shell", id_, "no shell open"));
            return;
        }
        p->set_value(shell_->resize(cols, rows));
    });
}

std::future<Result<void>> SessionActor::close_shell() {
    return request<void>(MessageKind::CloseShell, [this](PromisePtr<void> p) {
        p->set_value(handle_close_shell());
    });
}

std::future<Result<ExecOutput>> SessionActor::exec(std::string command, std::string command_id) {
    return request<ExecOutput>(MessageKind::Exec, [this, command, command_id](PromisePtr<ExecOutput> p) {
        handle_exec(command, command_id, p);
    });
}

std::future<Result<void>> SessionActor::cancel_exec(std::string command_id) {
    return request<void>(MessageKind::CancelExec, [this, command_id](PromisePtr<void> p) {
        auto owner = commands_.owner(command_id);
        if (!owner || *owner != id_) {
            p->set_value(Result<void>::Err(ErrorKind::CommandNotFound, "cancel", command_id,
                                           "no command in flight with this id"));
            return;
        }
        p->set_value(executor_.cancel(command_id));
    });
}

std::future<Result<SftpReply>> SessionActor::sftp(SftpOp op) {
    return request<SftpReply>(MessageKind::Sftp, [this, op](PromisePtr<SftpReply> p) {
        p->set_value(handle_sftp(op));
    });
}

std::future<Result<std::shared_ptr<Channel>>> SessionActor::open_channel(ChannelType type,
                                                                         ChannelParams params) {
    return request<std::shared_ptr<Channel>>(MessageKind::OpenChannel,
        [this, type, params](PromisePtr<std::shared_ptr<Channel>> p) {
            p->set_value(handle_open_channel(type, params));
        });
}

void SessionActor::release_channel(std::shared_ptr<Channel> channel) {
    if (!channel) return;
    bool posted = post(MessageKind::ReleaseChannel, [this, channel] {
        if (connection_) connection_->channels().release(channel);
        else channel->invalidate("session closed");
    });
    if (!posted) channel->invalidate("session closed");
}

std::future<Result<ForwardInfo>> SessionActor::start_forward(ForwardSpec spec) {
    return request<ForwardInfo>(MessageKind::StartForward, [this, spec](PromisePtr<ForwardInfo> p) {
        p->set_value(handle_start_forward(spec));
    });
}

std::future<Result<void>> SessionActor::stop_forward(std::string forward_id) {
    return request<void>(MessageKind::StopForward, [this, forward_id](PromisePtr<void> p) {
        if (!forwarder_) {
            p->set_value(Result<void>::Err(ErrorKind::InvalidArgument, "stop-forward", forward_id,
                                           "no such forward"));
            return;
        }
        p->set_value(forwarder_->stop(forward_id));
    });
}

std::future<Result<std::vector<ForwardInfo>>> SessionActor::list_forwards() {
    return request<std::vector<ForwardInfo>>(MessageKind::ListForwards,
        [this](PromisePtr<std::vector<ForwardInfo>> p) {
            std::vector<ForwardInfo> out;
            if (forwarder_) out = forwarder_->list();
            p->set_value(Result<std::vector<ForwardInfo>>::Ok(std::move(out)));
        });
}
