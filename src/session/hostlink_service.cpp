#include "hostlink_service.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <ssh/libssh2_transport.hpp>
#include <fmt/format.h>
#include <chrono>

namespace {

Config load_or_default() {
    auto loaded = Config::load();
    if (loaded.is_ok()) return loaded.value;
    hostlink_log(fmt::format("[service] config: {}; using defaults", loaded.error.describe()));
    return Config();
}

} // namespace

HostlinkService::HostlinkService(EventListener& events) : config_(load_or_default()) {
    owned_factory_ = std::make_unique<Libssh2TransportFactory>(config_.settings().keepalive);
    owned_storage_ = std::make_unique<FileSystemStorage>();
    init(*owned_factory_, *owned_storage_, events);
}

HostlinkService::HostlinkService(Config config, TransportFactory& factory, LocalStorage& storage,
                                 EventListener& events)
    : config_(std::move(config)) {
    init(factory, storage, events);
}

HostlinkService::~HostlinkService() {
    shutdown();
}

void HostlinkService::init(TransportFactory& factory, LocalStorage& storage, EventListener& events) {
    sessions_ = std::make_unique<SessionRegistry>(config_.settings(), factory, events);
    transfers_ = std::make_unique<TransferEngine>(*sessions_, storage, config_.settings().transfers, events);
    transfers_->start();
}

void HostlinkService::shutdown() {
    if (transfers_) transfers_->shutdown();
    if (sessions_) sessions_->disconnect_all();
}

Result<std::shared_ptr<SessionActor>> HostlinkService::session(const std::string& session_id) const {
    return sessions_->get(session_id);
}

// ── Sessions ──────────────────────────────────────────────────

Result<std::string> HostlinkService::connect(const ConnectionConfig& config, const std::string& existing_id) {
    return sessions_->connect(config, existing_id);
}

Result<std::string> HostlinkService::connect_profile(const std::string& name) {
    auto profile = config_.find_connection(name);
    if (!profile) {
        return Result<std::string>::Err(ErrorKind::ConfigError, "connect", name,
                                        fmt::format("no connection named '{}' in {}", name,
                                                    get_config_path().string()));
    }
    return sessions_->connect(*profile);
}

Result<void> HostlinkService::disconnect(const std::string& session_id) {
    auto r = sessions_->disconnect(session_id);
    if (r.is_ok()) {
        std::lock_guard<std::mutex> lock(forwards_mutex_);
        for (auto it = forward_owner_.begin(); it != forward_owner_.end();) {
            if (it->second == session_id) it = forward_owner_.erase(it);
            else ++it;
        }
    }
    return r;
}

std::vector<SessionSummary> HostlinkService::list_sessions() const {
    return sessions_->list();
}

// ── Shell ─────────────────────────────────────────────────────

Result<void> HostlinkService::open_shell(const std::string& session_id, int cols, int rows) {
    auto s = session(session_id);
    if (s.is_err()) return Result<void>::Err(s.error);
    return s.value->open_shell(cols, rows).get();
}

Result<void> HostlinkService::close_shell(const std::string& session_id) {
    auto s = session(session_id);
    if (s.is_err()) return Result<void>::Err(s.error);
    return s.value->close_shell().get();
}

Result<void> HostlinkService::resize(const std::string& session_id, int cols, int rows) {
    auto s = session(session_id);
    if (s.is_err()) return Result<void>::Err(s.error);
    return s.value->resize_shell(cols, rows).get();
}

Result<void> HostlinkService::write(const std::string& session_id, const std::string& data) {
    auto s = session(session_id);
    if (s.is_err()) return Result<void>::Err(s.error);
    return s.value->write_shell(data).get();
}

// ── Commands ──────────────────────────────────────────────────

std::future<Result<ExecOutput>> HostlinkService::exec_async(const std::string& session_id,
                                                            const std::string& command,
                                                            const std::string& command_id) {
    auto s = session(session_id);
    if (s.is_err()) {
        std::promise<Result<ExecOutput>> failed;
        failed.set_value(Result<ExecOutput>::Err(s.error));
        return failed.get_future();
    }
    return s.value->exec(command, command_id.empty() ? generate_id("cmd") : command_id);
}

Result<ExecOutput> HostlinkService::exec(const std::string& session_id, const std::string& command,
                                         const std::string& command_id) {
    return exec_async(session_id, command, command_id).get();
}

Result<void> HostlinkService::cancel_exec(const std::string& command_id) {
    auto owner = sessions_->commands().owner(command_id);
    if (!owner) {
        return Result<void>::Err(ErrorKind::CommandNotFound, "cancel", command_id,
                                 "no command in flight with this id");
    }
    auto s = session(*owner);
    if (s.is_err()) return sessions_->commands().cancel(command_id);
    return s.value->cancel_exec(command_id).get();
}

// ── Host queries ──────────────────────────────────────────────

Result<ExecOutput> HostlinkService::exec_bounded(const std::string& session_id, const std::string& command,
                                                 const std::string& op, const std::string& target,
                                                 int timeout_secs) {
    using R = Result<ExecOutput>;
    std::string command_id = generate_id(op);
    auto pending = exec_async(session_id, command, command_id);
    if (pending.wait_for(std::chrono::seconds(timeout_secs)) != std::future_status::ready) {
        auto cancelled = cancel_exec(command_id);
        if (cancelled.is_err()) {
            hostlink_log(fmt::format("[service] cancel {}: {}", command_id, cancelled.error.describe()));
        }
        pending.wait();
        return R::Err(ErrorKind::Timeout, op, target, fmt::format("no answer within {}s", timeout_secs));
    }
    auto out = pending.get();
    hostlink_log_exec("[" + op + "]", command.substr(0, command.find('\n')), out);
    return out;
}

Result<SystemStatus> HostlinkService::system_status(const std::string& session_id) {
    using R = Result<SystemStatus>;
    auto out = exec_bounded(session_id, system_status_command(), "status", session_id,
                            config_.settings().exec.query_timeout_secs);
    if (out.is_err()) return R::Err(out.error);
    if (out.value.stdout_data.find("UPTIME_START") == std::string::npos) {
        return R::Err(ErrorKind::ChannelProtocolError, "status", session_id,
                      fmt::format("unexpected output (exit {}): {}", out.value.exit_status,
                                  out.value.stderr_data));
    }
    return R::Ok(parse_system_status(out.value.stdout_data));
}

Result<std::vector<SearchMatch>> HostlinkService::search(const std::string& session_id,
                                                         const std::string& root,
                                                         const std::string& pattern, int max_results) {
    using R = Result<std::vector<SearchMatch>>;
    if (root.empty() || pattern.empty()) {
        return R::Err(ErrorKind::InvalidArgument, "search", root, "root and pattern are required");
    }
    if (max_results <= 0) {
        return R::Err(ErrorKind::InvalidArgument, "search", root,
                      fmt::format("max_results must be positive (got {})", max_results));
    }

    auto out = exec_bounded(session_id, search_command(root, pattern, max_results), "search", root,
                            config_.settings().exec.query_timeout_secs);
    if (out.is_err()) return R::Err(out.error);
    if (out.value.exit_status != 0) {
        std::string err = out.value.stderr_data;
        trim(err);
        return R::Err(ErrorKind::ChannelProtocolError, "search", root,
                      fmt::format("exited {}: {}", out.value.exit_status, err));
    }
    return R::Ok(parse_search_output(out.value.stdout_data));
}

Result<std::string> HostlinkService::working_directory(const std::string& session_id) {
    using R = Result<std::string>;
    auto out = exec(session_id, "pwd");
    if (out.is_err()) return R::Err(out.error);
    if (out.value.exit_status != 0) {
        return R::Err(ErrorKind::ChannelProtocolError, "pwd", session_id,
                      fmt::format("pwd exited {}", out.value.exit_status));
    }
    std::string dir = out.value.stdout_data;
    trim(dir);
    return R::Ok(dir);
}

// ── Remote files ──────────────────────────────────────────────

Result<SftpReply> HostlinkService::sftp(const std::string& session_id, SftpOp op) {
    auto s = session(session_id);
    if (s.is_err()) return Result<SftpReply>::Err(s.error);
    return s.value->sftp(std::move(op)).get();
}

Result<std::vector<RemoteEntry>> HostlinkService::list_dir(const std::string& session_id,
                                                           const std::string& path) {
    SftpOp op;
    op.kind = SftpOpKind::List;
    op.path = path;
    auto r = sftp(session_id, op);
    if (r.is_err()) return Result<std::vector<RemoteEntry>>::Err(r.error);
    return Result<std::vector<RemoteEntry>>::Ok(std::move(r.value.entries));
}

Result<RemoteEntry> HostlinkService::stat(const std::string& session_id, const std::string& path) {
    SftpOp op;
    op.kind = SftpOpKind::Stat;
    op.path = path;
    auto r = sftp(session_id, op);
    if (r.is_err()) return Result<RemoteEntry>::Err(r.error);
    return Result<RemoteEntry>::Ok(std::move(r.value.entry));
}

Result<void> HostlinkService::mkdir(const std::string& session_id, const std::string& path) {
    SftpOp op;
    op.kind = SftpOpKind::Mkdir;
    op.path = path;
    auto r = sftp(session_id, op);
    return r.is_ok() ? Result<void>::Ok() : Result<void>::Err(r.error);
}

Result<void> HostlinkService::create_file(const std::string& session_id, const std::string& path) {
    SftpOp op;
    op.kind = SftpOpKind::CreateFile;
    op.path = path;
    auto r = sftp(session_id, op);
    return r.is_ok() ? Result<void>::Ok() : Result<void>::Err(r.error);
}

Result<void> HostlinkService::remove(const std::string& session_id, const std::string& path, bool recursive) {
    SftpOp op;
    op.kind = SftpOpKind::Remove;
    op.path = path;
    op.recursive = recursive;
    auto r = sftp(session_id, op);
    return r.is_ok() ? Result<void>::Ok() : Result<void>::Err(r.error);
}

Result<void> HostlinkService::rename(const std::string& session_id, const std::string& from,
                                     const std::string& to) {
    SftpOp op;
    op.kind = SftpOpKind::Rename;
    op.path = from;
    op.target = to;
    auto r = sftp(session_id, op);
    return r.is_ok() ? Result<void>::Ok() : Result<void>::Err(r.error);
}

Result<void> HostlinkService::chmod(const std::string& session_id, const std::string& path,
                                    std::uint32_t mode) {
    SftpOp op;
    op.kind = SftpOpKind::Chmod;
    op.path = path;
    op.mode = mode;
    auto r = sftp(session_id, op);
    return r.is_ok() ? Result<void>::Ok() : Result<void>::Err(r.error);
}

Result<std::string> HostlinkService::read_file(const std::string& session_id, const std::string& path,
                                               std::optional<std::uint64_t> max_bytes) {
    SftpOp op;
    op.kind = SftpOpKind::ReadFile;
    op.path = path;
    op.max_bytes = max_bytes;
    auto r = sftp(session_id, op);
    if (r.is_err()) return Result<std::string>::Err(r.error);
    return Result<std::string>::Ok(std::move(r.value.content));
}

Result<void> HostlinkService::write_file(const std::string& session_id, const std::string& path,
                                         const std::string& content) {
    SftpOp op;
    op.kind = SftpOpKind::WriteFile;
    op.path = path;
    op.content = content;
    auto r = sftp(session_id, op);
    return r.is_ok() ? Result<void>::Ok() : Result<void>::Err(r.error);
}

// ── Transfers ─────────────────────────────────────────────────

Result<std::string> HostlinkService::enqueue_upload(const std::string& session_id,
                                                    const std::string& local_path,
                                                    const std::string& remote_path) {
    return transfers_->enqueue_upload(session_id, local_path, remote_path);
}

Result<std::string> HostlinkService::enqueue_download(const std::string& session_id,
                                                      const std::string& remote_path,
                                                      const std::string& local_path) {
    return transfers_->enqueue_download(session_id, remote_path, local_path);
}

Result<void> HostlinkService::pause_transfer(const std::string& transfer_id) {
    return transfers_->pause(transfer_id);
}

Result<void> HostlinkService::resume_transfer(const std::string& transfer_id) {
    return transfers_->resume(transfer_id);
}

Result<void> HostlinkService::cancel_transfer(const std::string& transfer_id) {
    return transfers_->cancel(transfer_id);
}

Result<void> HostlinkService::remove_transfer(const std::string& transfer_id) {
    return transfers_->remove(transfer_id);
}

std::vector<BatchOutcome> HostlinkService::batch_pause(const std::string& session_id) {
    return transfers_->batch_pause(session_id);
}

std::vector<BatchOutcome> HostlinkService::batch_resume(const std::string& session_id) {
    return transfers_->batch_resume(session_id);
}

std::vector<BatchOutcome> HostlinkService::batch_cancel(const std::string& session_id) {
    return transfers_->batch_cancel(session_id);
}

std::vector<BatchOutcome> HostlinkService::batch_delete(const std::string& session_id) {
    return transfers_->batch_delete(session_id);
}

std::vector<TransferSnapshot> HostlinkService::list_transfers(const std::string& session_id) const {
    return transfers_->list(session_id);
}

Result<TransferSnapshot> HostlinkService::get_transfer(const std::string& transfer_id) const {
    return transfers_->get(transfer_id);
}

int HostlinkService::clear_transfer_history() {
    return transfers_->clear_history();
}

// ── Port forwarding ───────────────────────────────────────────

Result<ForwardInfo> HostlinkService::start_forward(const std::string& session_id, int local_port,
                                                   const std::string& remote_host, int remote_port) {
    auto s = session(session_id);
    if (s.is_err()) return Result<ForwardInfo>::Err(s.error);

    ForwardSpec spec;
    spec.local_port = local_port;
    spec.target_host = remote_host;
    spec.target_port = remote_port;
    auto r = s.value->start_forward(spec).get();
    if (r.is_ok()) {
        std::lock_guard<std::mutex> lock(forwards_mutex_);
        forward_owner_[r.value.id] = session_id;
    }
    return r;
}

Result<void> HostlinkService::stop_forward(const std::string& forward_id) {
    std::string owner;
    {
        std::lock_guard<std::mutex> lock(forwards_mutex_);
        auto it = forward_owner_.find(forward_id);
        if (it == forward_owner_.end()) {
            return Result<void>::Err(ErrorKind::InvalidArgument, "stop-forward", forward_id, "no such forward");
        }
        owner = it->second;
        forward_owner_.erase(it);
    }
    auto s = session(owner);
    if (s.is_err()) return Result<void>::Err(s.error);
    return s.value->stop_forward(forward_id).get();
}

Result<std::vector<ForwardInfo>> HostlinkService::list_forwards(const std::string& session_id) {
    auto s = session(session_id);
    if (s.is_err()) return Result<std::vector<ForwardInfo>>::Err(s.error);
    return s.value->list_forwards().get();
}
