#pragma once

#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <ssh/transport.hpp>
#include <transfer/local_storage.hpp>
#include <transfer/transfer_engine.hpp>
#include "events.hpp"
#include "remote_info.hpp"
#include "session_registry.hpp"

// Headless service facade: owns the session registry and the transfer
// engine and exposes every client operation. Any frontend can drive it.
class HostlinkService {
public:
    // Loads ~/.hostlink/config.yaml and talks SSH through libssh2.
    explicit HostlinkService(EventListener& events);

    // Explicit collaborators, used by tests and embedders.
    HostlinkService(Config config, TransportFactory& factory, LocalStorage& storage,
                    EventListener& events);

    ~HostlinkService();

    HostlinkService(const HostlinkService&) = delete;
    HostlinkService& operator=(const HostlinkService&) = delete;

    const Config& config() const { return config_; }
    void shutdown();

    // ── Sessions ──────────────────────────────────────────────

    Result<std::string> connect(const ConnectionConfig& config, const std::string& existing_id = "");

    // Connect using a named profile from the config file.
    Result<std::string> connect_profile(const std::string& name);

    Result<void> disconnect(const std::string& session_id);
    std::vector<SessionSummary> list_sessions() const;

    // ── Shell ─────────────────────────────────────────────────

    Result<void> open_shell(const std::string& session_id, int cols, int rows);
    Result<void> close_shell(const std::string& session_id);
    Result<void> resize(const std::string& session_id, int cols, int rows);
    Result<void> write(const std::string& session_id, const std::string& data);

    // ── Commands ──────────────────────────────────────────────

    // An empty command_id is replaced by a generated one.
    Result<ExecOutput> exec(const std::string& session_id, const std::string& command,
                            const std::string& command_id = "");
    std::future<Result<ExecOutput>> exec_async(const std::string& session_id, const std::string& command,
                                               const std::string& command_id);
    Result<void> cancel_exec(const std::string& command_id);

    // ── Remote files ──────────────────────────────────────────

    Result<std::vector<RemoteEntry>> list_dir(const std::string& session_id, const std::string& path);
    Result<RemoteEntry> stat(const std::string& session_id, const std::string& path);
    Result<void> mkdir(const std::string& session_id, const std::string& path);
    Result<void> create_file(const std::string& session_id, const std::string& path);
    Result<void> remove(const std::string& session_id, const std::string& path, bool recursive);
    Result<void> rename(const std::string& session_id, const std::string& from, const std::string& to);
    Result<void> chmod(const std::string& session_id, const std::string& path, std::uint32_t mode);
    // Whole file, or only its first max_bytes when given
    Result<std::string> read_file(const std::string& session_id, const std::string& path,
                                  std::optional<std::uint64_t> max_bytes = std::nullopt);
    Result<void> write_file(const std::string& session_id, const std::string& path,
                            const std::string& content);

    // ── Host queries ──────────────────────────────────────────

    // Uptime, address, CPU, memory, mounts and top processes in one exec.
    Result<SystemStatus> system_status(const std::string& session_id);

    // grep below root. Fails with Timeout after exec.query_timeout_secs.
    Result<std::vector<SearchMatch>> search(const std::string& session_id, const std::string& root,
                                            const std::string& pattern,
                                            int max_results = SEARCH_MAX_RESULTS);

    Result<std::string> working_directory(const std::string& session_id);

    // ── Transfers ─────────────────────────────────────────────

    Result<std::string> enqueue_upload(const std::string& session_id, const std::string& local_path,
                                       const std::string& remote_path);
    Result<std::string> enqueue_download(const std::string& session_id, const std::string& remote_path,
                                         const std::string& local_path);
    Result<void> pause_transfer(const std::string& transfer_id);
    Result<void> resume_transfer(const std::string& transfer_id);
    Result<void> cancel_transfer(const std::string& transfer_id);
    Result<void> remove_transfer(const std::string& transfer_id);
    std::vector<BatchOutcome> batch_pause(const std::string& session_id);
    std::vector<BatchOutcome> batch_resume(const std::string& session_id);
    std::vector<BatchOutcome> batch_cancel(const std::string& session_id);
    std::vector<BatchOutcome> batch_delete(const std::string& session_id);
    std::vector<TransferSnapshot> list_transfers(const std::string& session_id = "") const;
    Result<TransferSnapshot> get_transfer(const std::string& transfer_id) const;
    int clear_transfer_history();

    // ── Port forwarding ───────────────────────────────────────

    Result<ForwardInfo> start_forward(const std::string& session_id, int local_port,
                                      const std::string& remote_host, int remote_port);
    Result<void> stop_forward(const std::string& forward_id);
    Result<std::vector<ForwardInfo>> list_forwards(const std::string& session_id);

private:
    void init(TransportFactory& factory, LocalStorage& storage, EventListener& events);
    Result<SftpReply> sftp(const std::string& session_id, SftpOp op);
    Result<std::shared_ptr<SessionActor>> session(const std::string& session_id) const;
    // exec with a deadline; on expiry the command is cancelled
    Result<ExecOutput> exec_bounded(const std::string& session_id, const std::string& command,
                                    const std::string& op, const std::string& target, int timeout_secs);

    Config config_;
    std::unique_ptr<TransportFactory> owned_factory_;
    std::unique_ptr<LocalStorage> owned_storage_;

    // The engine is destroyed first; its workers use the registry
    std::unique_ptr<SessionRegistry> sessions_;
    std::unique_ptr<TransferEngine> transfers_;

    mutable std::mutex forwards_mutex_;
    std::map<std::string, std::string> forward_owner_;   // forward id -> session id
};
