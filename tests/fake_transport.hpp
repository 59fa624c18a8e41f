#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <ssh/transport.hpp>
#include <session/events.hpp>
#include <transfer/local_storage.hpp>

// In-memory SSH host for tests.
//
// Holds a small filesystem for SFTP and interprets a handful of exec
// commands:
//   echo <text>        prints text and a newline, exits 0
//   err <text>         prints text on stderr, exits 1
//   exit <n>           exits n
//   sleep <secs>       produces nothing until the time passes or the
//                      channel is closed, exits 0
//   sha256sum '<path>' digest of a stored file in sha256sum format
//   pwd                prints the home directory
//   cd '<root>' && grep -R -n --text -- '<pattern>' . | head -n <n>
//                      substring search over stored files below root
// Replies registered with set_exec_reply take precedence.
// Anything else prints "command not found" on stderr and exits 127.
// Shell and port-forward channels echo what they are sent.
class FakeHost {
public:
    FakeHost();

    // ── Filesystem ─────────────────────────────────────────────

    void put_file(const std::string& path, const std::string& content);
    void put_dir(const std::string& path);
    bool has_file(const std::string& path) const;
    bool has_dir(const std::string& path) const;
    std::string file(const std::string& path) const;

    // ── Exec ───────────────────────────────────────────────────

    // Commands starting with prefix print out and exit with exit_code,
    // after delay_secs of silence.
    void set_exec_reply(const std::string& prefix, const std::string& out, int exit_code = 0,
                        int delay_secs = 0);

    // ── Fault injection ────────────────────────────────────────

    // Every live transport faults; new connects keep working unless refused.
    void kill();
    void set_refuse_connections(bool refuse) { refuse_ = refuse; }
    void set_answer_keepalives(bool answer) { answer_keepalives_ = answer; }

    // While closed, remote file reads and writes report Again.
    void close_gate();
    void open_gate();

    // ── Observation ────────────────────────────────────────────

    int connects() const { return connects_.load(); }
    int open_remote_files() const { return open_files_.load(); }
    int peak_remote_files() const { return peak_files_.load(); }
    std::vector<std::string> exec_log() const;

private:
    friend class FakeTransport;
    friend class FakeTransportFactory;
    friend class FakeChannelIo;
    friend class FakeSftp;
    friend class FakeRemoteFile;

    std::shared_ptr<std::atomic<bool>> register_transport();
    void note_exec(const std::string& command);
    void file_opened();
    void file_closed();
    bool gate_open() const { return gate_open_.load(); }

    // Unlocked helpers
    bool parent_exists_locked(const std::string& path) const;

    mutable std::mutex mutex_;
    std::map<std::string, std::string> files_;
    std::set<std::string> dirs_;
    std::vector<std::string> exec_log_;
    struct ExecReply {
        std::string prefix;
        std::string out;
        int exit_code = 0;
        int delay_secs = 0;
    };
    std::vector<ExecReply> replies_;
    std::vector<std::weak_ptr<std::atomic<bool>>> faults_;

    std::atomic<bool> refuse_{false};
    std::atomic<bool> answer_keepalives_{true};
    std::atomic<bool> gate_open_{true};
    std::atomic<int> connects_{0};
    std::atomic<int> open_files_{0};
    std::atomic<int> peak_files_{0};
};

class FakeTransport : public Transport {
public:
    explicit FakeTransport(std::shared_ptr<FakeHost> host);

    Result<std::unique_ptr<ChannelIo>> open_channel(ChannelType type, const ChannelParams& params) override;
    Result<std::unique_ptr<SftpIo>> open_sftp() override;
    bool send_keepalive() override;
    bool faulted() const override { return fault_->load(); }
    void disconnect() override;

private:
    std::shared_ptr<FakeHost> host_;
    std::shared_ptr<std::atomic<bool>> fault_;
};

class FakeTransportFactory : public TransportFactory {
public:
    explicit FakeTransportFactory(std::shared_ptr<FakeHost> host) : host_(std::move(host)) {}

    Result<std::unique_ptr<Transport>> connect(const ConnectionConfig& config,
                                               StatusCallback callback = nullptr) override;

private:
    std::shared_ptr<FakeHost> host_;
};

// Thread-safe recorder for every event the service raises
class RecordingEvents : public EventListener {
public:
    struct ProgressSample {
        std::string id;
        std::uint64_t transferred = 0;
        std::uint64_t total = 0;
    };

    void session_status_changed(const std::string& session_id, SessionStatus status) override;
    void command_output(const std::string& command_id, const std::string& chunk) override;
    void transfer_progress(const std::string& transfer_id, std::uint64_t transferred,
                           std::uint64_t total) override;
    void transfer_status_changed(const std::string& transfer_id, TransferStatus status,
                                 const std::optional<Error>& error) override;
    void reconnect_attempt_failed(const std::string& session_id, int attempt,
                                  const Error& error) override;
    void reconnect_exhausted(const std::string& session_id) override;
    void shell_output(const std::string& session_id, const std::string& data) override;
    void shell_closed(const std::string& session_id) override;

    std::vector<SessionStatus> session_statuses(const std::string& session_id) const;
    std::string output_of(const std::string& command_id) const;
    std::vector<std::pair<std::uint64_t, std::uint64_t>> progress_of(const std::string& transfer_id) const;
    std::vector<TransferStatus> statuses_of(const std::string& transfer_id) const;
    // Every progress sample of every transfer, in emission order
    std::vector<ProgressSample> progress_log() const;
    std::vector<int> failed_attempts(const std::string& session_id) const;
    bool exhausted(const std::string& session_id) const;
    std::string shell_text(const std::string& session_id) const;
    int shells_closed(const std::string& session_id) const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::vector<SessionStatus>> sessions_;
    std::map<std::string, std::string> output_;
    std::map<std::string, std::vector<std::pair<std::uint64_t, std::uint64_t>>> progress_;
    std::vector<ProgressSample> progress_log_;
    std::map<std::string, std::vector<TransferStatus>> transfers_;
    std::map<std::string, std::vector<int>> attempts_;
    std::set<std::string> exhausted_;
    std::map<std::string, std::string> shell_;
    std::map<std::string, int> shell_closed_;
};

// In-memory local filesystem for the transfer engine
class MemoryStorage : public LocalStorage {
public:
    void put_file(const std::string& path, const std::string& content);
    std::string file(const std::string& path) const;
    bool has_file(const std::string& path) const;

    bool exists(const std::string& path) override;
    bool is_directory(const std::string& path) override;
    Result<std::uint64_t> size(const std::string& path) override;
    Result<std::unique_ptr<LocalFile>> open(const std::string& path, Mode mode,
                                            std::uint64_t offset = 0) override;
    Result<void> make_dirs(const std::string& path) override;
    Result<std::vector<LocalEntry>> list_tree(const std::string& root) override;

private:
    friend class MemoryFile;
    mutable std::mutex mutex_;
    std::map<std::string, std::string> files_;
    std::set<std::string> dirs_;
};

// Poll cond every few milliseconds until it holds or timeout_ms passes.
bool wait_until(const std::function<bool()>& cond, int timeout_ms = 5000);

ConnectionConfig fake_config(const std::string& name = "box");
ClientSettings fast_settings();
