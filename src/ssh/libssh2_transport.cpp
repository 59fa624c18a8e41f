#include "libssh2_transport.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <libssh2.h>
#include <libssh2_sftp.h>
#include <fmt/format.h>
#include <sys/socket.h>
#include <unistd.h>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <mutex>
#include <thread>

namespace {

using Clock = std::chrono::steady_clock;

// Shared state of one LIBSSH2_SESSION. Channels and SFTP handles hold a
// reference so they never call into a freed session.
struct SessionHandle {
    LIBSSH2_SESSION* session = nullptr;
    socket_t sock = HOSTLINK_INVALID_SOCKET;
    std::mutex io;
    bool freed = false;                 // guarded by io
    std::atomic<bool> faulted{false};
};

using HandlePtr = std::shared_ptr<SessionHandle>;

bool is_fatal(int rc) {
    return rc == LIBSSH2_ERROR_SOCKET_NONE ||
           rc == LIBSSH2_ERROR_SOCKET_SEND ||
           rc == LIBSSH2_ERROR_SOCKET_RECV ||
           rc == LIBSSH2_ERROR_SOCKET_DISCONNECT ||
           rc == LIBSSH2_ERROR_SOCKET_TIMEOUT;
}

// Caller holds the io mutex.
std::string last_error(LIBSSH2_SESSION* session) {
    char* msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session, &msg, &len, 0);
    if (!msg || len <= 0) return "unknown libssh2 error";
    return std::string(msg, static_cast<size_t>(len));
}

// Wait until the socket is ready in whichever direction libssh2 blocked on.
void wait_socket(SessionHandle& h, int timeout_ms) {
    int dir;
    {
        std::lock_guard<std::mutex> lock(h.io);
        if (h.freed) return;
        dir = libssh2_session_block_directions(h.session);
    }
    short events = 0;
    if (dir & LIBSSH2_SESSION_BLOCK_INBOUND) events |= POLLIN;
    if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND) events |= POLLOUT;
    if (events == 0) {
        platform::sleep_ms(1);
        return;
    }
    platform::poll_socket(h.sock, events, timeout_ms);
}

// Run an int-returning libssh2 call until it stops returning EAGAIN.
template <typename Fn>
int retry(SessionHandle& h, Fn fn, int timeout_ms, std::string* err = nullptr) {
    auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
    for (;;) {
        int rc;
        {
            std::lock_guard<std::mutex> lock(h.io);
            if (h.freed) {
                if (err) *err = "session closed";
                return LIBSSH2_ERROR_SOCKET_DISCONNECT;
            }
            rc = fn();
            if (rc < 0 && rc != LIBSSH2_ERROR_EAGAIN && err) *err = last_error(h.session);
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) {
            if (is_fatal(rc)) h.faulted = true;
            return rc;
        }
        if (Clock::now() >= deadline) {
            if (err) *err = "timed out waiting for the server";
            return LIBSSH2_ERROR_TIMEOUT;
        }
        wait_socket(h, 10);
    }
}

// Same for calls that return a handle and signal EAGAIN through last_errno.
template <typename T, typename Fn>
T* retry_ptr(SessionHandle& h, Fn fn, int timeout_ms, std::string& err, int& rc) {
    auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
    for (;;) {
        T* ptr = nullptr;
        {
            std::lock_guard<std::mutex> lock(h.io);
            if (h.freed) {
                err = "session closed";
                rc = LIBSSH2_ERROR_SOCKET_DISCONNECT;
                return nullptr;
            }
            ptr = fn();
            rc = ptr ? 0 : libssh2_session_last_errno(h.session);
            if (!ptr && rc != LIBSSH2_ERROR_EAGAIN) err = last_error(h.session);
        }
        if (ptr) return ptr;
        if (rc != LIBSSH2_ERROR_EAGAIN) {
            if (is_fatal(rc)) h.faulted = true;
            return nullptr;
        }
        if (Clock::now() >= deadline) {
            err = "timed out waiting for the server";
            rc = LIBSSH2_ERROR_TIMEOUT;
            return nullptr;
        }
        wait_socket(h, 10);
    }
}

Error channel_error(const std::string& op, const std::string& id, int rc, const std::string& msg) {
    return make_error(is_fatal(rc) ? ErrorKind::SessionLost : ErrorKind::ChannelProtocolError,
                      op, id, msg);
}

// ── Channels ───────────────────────────────────────────────────

class Libssh2Channel : public ChannelIo {
public:
    Libssh2Channel(HandlePtr h, LIBSSH2_CHANNEL* ch) : h_(std::move(h)), ch_(ch) {}

    ~Libssh2Channel() override {
        if (!ch_) return;
        retry(*h_, [&] { return libssh2_channel_free(ch_); }, 1000);
        ch_ = nullptr;
    }

    IoResult read(char* buf, std::size_t len) override { return read_stream(0, buf, len); }

    IoResult read_stderr(char* buf, std::size_t len) override {
        return read_stream(SSH_EXTENDED_DATA_STDERR, buf, len);
    }

    IoResult write(const char* data, std::size_t len) override {
        ssize_t n;
        std::string err;
        {
            std::lock_guard<std::mutex> lock(h_->io);
            if (h_->freed || closed_) return IoResult::failure("channel closed", h_->freed);
            n = libssh2_channel_write(ch_, data, len);
            if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) err = last_error(h_->session);
        }
        if (n >= 0) return n > 0 ? IoResult::ok(static_cast<size_t>(n)) : IoResult::again();
        if (n == LIBSSH2_ERROR_EAGAIN) return IoResult::again();
        bool fatal = is_fatal(static_cast<int>(n));
        if (fatal) h_->faulted = true;
        return IoResult::failure(err, fatal);
    }

    Result<void> send_eof() override {
        std::string err;
        int rc = retry(*h_, [&] { return libssh2_channel_send_eof(ch_); },
                       CHANNEL_EOF_WAIT_MS, &err);
        if (rc != 0) return Result<void>::Err(channel_error("send-eof", "", rc, err));
        return Result<void>::Ok();
    }

    bool remote_eof() override {
        std::lock_guard<std::mutex> lock(h_->io);
        if (h_->freed || closed_) return true;
        return libssh2_channel_eof(ch_) != 0;
    }

    Result<void> close() override {
        if (closed_) return Result<void>::Ok();
        std::string err;
        int rc = retry(*h_, [&] { return libssh2_channel_close(ch_); },
                       CHANNEL_EOF_WAIT_MS, &err);
        if (rc == 0) {
            retry(*h_, [&] { return libssh2_channel_wait_closed(ch_); }, 500);
        }
        {
            std::lock_guard<std::mutex> lock(h_->io);
            if (!h_->freed) exit_status_ = libssh2_channel_get_exit_status(ch_);
        }
        closed_ = true;
        if (rc != 0) return Result<void>::Err(channel_error("close", "", rc, err));
        return Result<void>::Ok();
    }

    int exit_status() override {
        if (closed_) return exit_status_;
        std::lock_guard<std::mutex> lock(h_->io);
        if (h_->freed) return exit_status_;
        return libssh2_channel_get_exit_status(ch_);
    }

    Result<void> resize(int cols, int rows) override {
        std::string err;
        int rc = retry(*h_, [&] { return libssh2_channel_request_pty_size(ch_, cols, rows); },
                       CHANNEL_OPEN_TIMEOUT_SECS * 1000, &err);
        if (rc != 0) return Result<void>::Err(channel_error("resize", "", rc, err));
        return Result<void>::Ok();
    }

private:
    IoResult read_stream(int stream, char* buf, std::size_t len) {
        ssize_t n;
        bool at_eof = false;
        std::string err;
        {
            std::lock_guard<std::mutex> lock(h_->io);
            if (h_->freed || closed_) return IoResult::failure("channel closed", h_->freed);
            n = libssh2_channel_read_ex(ch_, stream, buf, len);
            if (n == 0 || n == LIBSSH2_ERROR_EAGAIN) at_eof = libssh2_channel_eof(ch_) != 0;
            if (n < 0 && n != LIBSSH2_ERROR_EAGAIN) err = last_error(h_->session);
        }
        if (n > 0) return IoResult::ok(static_cast<size_t>(n));
        if (n == 0 || n == LIBSSH2_ERROR_EAGAIN) return at_eof ? IoResult::eof() : IoResult::again();
        bool fatal = is_fatal(static_cast<int>(n));
        if (fatal) h_->faulted = true;
        return IoResult::failure(err, fatal);
    }

    HandlePtr h_;
    LIBSSH2_CHANNEL* ch_;
    bool closed_ = false;
    int exit_status_ = -1;
};

// ── SFTP ───────────────────────────────────────────────────────

struct SftpState {
    LIBSSH2_SFTP* sftp = nullptr;
    bool shut = false;                  // guarded by the session io mutex
};

std::string sftp_message(SessionHandle& h, LIBSSH2_SFTP* sftp, int rc) {
    if (rc != LIBSSH2_ERROR_SFTP_PROTOCOL) return {};
    unsigned long code;
    {
        std::lock_guard<std::mutex> lock(h.io);
        if (h.freed) return "session closed";
        code = libssh2_sftp_last_error(sftp);
    }
    switch (code) {
        case LIBSSH2_FX_NO_SUCH_FILE:       return "no such file";
        case LIBSSH2_FX_PERMISSION_DENIED:  return "permission denied";
        case LIBSSH2_FX_FILE_ALREADY_EXISTS: return "file already exists";
        case LIBSSH2_FX_NO_SPACE_ON_FILESYSTEM: return "no space left on remote filesystem";
        case LIBSSH2_FX_DIR_NOT_EMPTY:      return "directory not empty";
        case LIBSSH2_FX_NOT_A_DIRECTORY:    return "not a directory";
        default: return fmt::format("sftp status {}", code);
    }
}

Error sftp_error(SessionHandle& h, LIBSSH2_SFTP* sftp, const std::string& op,
                 const std::string& path, int rc, const std::string& fallback) {
    std::string msg = sftp_message(h, sftp, rc);
    if (msg.empty()) msg = fallback;
    return make_error(is_fatal(rc) ? ErrorKind::SessionLost : ErrorKind::TransferIoError,
                      op, path, msg);
}

RemoteEntry to_entry(const std::string& name, const std::string& path,
                     const LIBSSH2_SFTP_ATTRIBUTES& attrs) {
    RemoteEntry e;
    e.name = name;
    e.path = path;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) {
        e.permissions = static_cast<uint32_t>(attrs.permissions);
        e.is_dir = (attrs.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR;
    }
    if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) e.size = attrs.filesize;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) e.mtime = attrs.mtime;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_UIDGID) e.uid = static_cast<uint32_t>(attrs.uid);
    return e;
}

class Libssh2RemoteFile : public RemoteFile {
public:
    Libssh2RemoteFile(HandlePtr h, std::shared_ptr<SftpState> state, LIBSSH2_SFTP_HANDLE* fh)
        : h_(std::move(h)), state_(std::move(state)), fh_(fh) {}

    ~Libssh2RemoteFile() override { close(); }

    IoResult read(char* buf, std::size_t len) override {
        ssize_t n;
        {
            std::lock_guard<std::mutex> lock(h_->io);
            if (h_->freed || state_->shut || !fh_) return IoResult::failure("file closed", h_->freed);
            n = libssh2_sftp_read(fh_, buf, len);
        }
        if (n > 0) return IoResult::ok(static_cast<size_t>(n));
        if (n == 0) return IoResult::eof();
        return failure(static_cast<int>(n), "read failed");
    }

    IoResult write(const char* data, std::size_t len) override {
        ssize_t n;
        {
            std::lock_guard<std::mutex> lock(h_->io);
            if (h_->freed || state_->shut || !fh_) return IoResult::failure("file closed", h_->freed);
            n = libssh2_sftp_write(fh_, data, len);
        }
        if (n > 0) return IoResult::ok(static_cast<size_t>(n));
        if (n == 0) return IoResult::again();
        return failure(static_cast<int>(n), "write failed");
    }

    void close() override {
        if (!fh_) return;
        retry(*h_, [&] {
            return state_->shut ? 0 : libssh2_sftp_close_handle(fh_);
        }, CHANNEL_EOF_WAIT_MS);
        fh_ = nullptr;
    }

private:
    IoResult failure(int rc, const char* what) {
        if (rc == LIBSSH2_ERROR_EAGAIN) return IoResult::again();
        bool fatal = is_fatal(rc);
        if (fatal) h_->faulted = true;
        std::string msg = sftp_message(*h_, state_->sftp, rc);
        return IoResult::failure(msg.empty() ? what : msg, fatal);
    }

    HandlePtr h_;
    std::shared_ptr<SftpState> state_;
    LIBSSH2_SFTP_HANDLE* fh_;
};

class Libssh2Sftp : public SftpIo {
public:
    Libssh2Sftp(HandlePtr h, LIBSSH2_SFTP* sftp)
        : h_(std::move(h)), state_(std::make_shared<SftpState>()) {
        state_->sftp = sftp;
    }

    ~Libssh2Sftp() override { close(); }

    Result<RemoteEntry> stat(const std::string& path) override {
        LIBSSH2_SFTP_ATTRIBUTES attrs;
        std::memset(&attrs, 0, sizeof(attrs));
        std::string err;
        int rc = retry(*h_, [&] {
            return libssh2_sftp_stat_ex(sftp(), path.c_str(), static_cast<unsigned>(path.size()),
                                        LIBSSH2_SFTP_STAT, &attrs);
        }, timeout_ms(), &err);
        if (rc != 0) return Result<RemoteEntry>::Err(sftp_error(*h_, sftp(), "stat", path, rc, err));
        return Result<RemoteEntry>::Ok(to_entry(remote_basename(path), path, attrs));
    }

    Result<std::vector<RemoteEntry>> list(const std::string& path) override {
        using R = Result<std::vector<RemoteEntry>>;
        std::string err;
        int rc = 0;
        LIBSSH2_SFTP_HANDLE* dir = retry_ptr<LIBSSH2_SFTP_HANDLE>(*h_, [&] {
            return libssh2_sftp_open_ex(sftp(), path.c_str(), static_cast<unsigned>(path.size()),
                                        0, 0, LIBSSH2_SFTP_OPENDIR);
        }, timeout_ms(), err, rc);
        if (!dir) return R::Err(sftp_error(*h_, sftp(), "list", path, rc, err));

        std::vector<RemoteEntry> out;
        char filename[512];
        char longentry[1024];
        for (;;) {
            LIBSSH2_SFTP_ATTRIBUTES attrs;
            std::memset(&attrs, 0, sizeof(attrs));
            rc = retry(*h_, [&] {
                return libssh2_sftp_readdir_ex(dir, filename, sizeof(filename),
                                               longentry, sizeof(longentry), &attrs);
            }, timeout_ms(), &err);
            if (rc == 0) break;
            if (rc < 0) {
                retry(*h_, [&] { return libssh2_sftp_close_handle(dir); }, timeout_ms());
                return R::Err(sftp_error(*h_, sftp(), "list", path, rc, err));
            }
            std::string name(filename, static_cast<size_t>(rc));
            if (name == "." || name == "..") continue;
            out.push_back(to_entry(name, join_remote(path, name), attrs));
        }
        retry(*h_, [&] { return libssh2_sftp_close_handle(dir); }, timeout_ms());
        return R::Ok(std::move(out));
    }

    Result<std::unique_ptr<RemoteFile>> open(const std::string& path, OpenMode mode,
                                             std::uint64_t offset) override {
        using R = Result<std::unique_ptr<RemoteFile>>;
        unsigned long flags = LIBSSH2_FXF_READ;
        if (mode == OpenMode::WriteTruncate)
            flags = LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC;
        else if (mode == OpenMode::WriteAt)
            flags = LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT;
        long perms = mode == OpenMode::Read ? 0 : 0644;

        std::string err;
        int rc = 0;
        LIBSSH2_SFTP_HANDLE* fh = retry_ptr<LIBSSH2_SFTP_HANDLE>(*h_, [&] {
            return libssh2_sftp_open_ex(sftp(), path.c_str(), static_cast<unsigned>(path.size()),
                                        flags, perms, LIBSSH2_SFTP_OPENFILE);
        }, timeout_ms(), err, rc);
        if (!fh) return R::Err(sftp_error(*h_, sftp(), "open", path, rc, err));

        if (offset > 0) {
            std::lock_guard<std::mutex> lock(h_->io);
            libssh2_sftp_seek64(fh, static_cast<libssh2_uint64_t>(offset));
        }
        return R::Ok(std::make_unique<Libssh2RemoteFile>(h_, state_, fh));
    }

    Result<void> mkdir(const std::string& path, std::uint32_t mode) override {
        return simple("mkdir", path, [&] {
            return libssh2_sftp_mkdir_ex(sftp(), path.c_str(), static_cast<unsigned>(path.size()),
                                         static_cast<long>(mode));
        });
    }

    Result<void> remove_file(const std::string& path) override {
        return simple("remove", path, [&] {
            return libssh2_sftp_unlink_ex(sftp(), path.c_str(), static_cast<unsigned>(path.size()));
        });
    }

    Result<void> remove_dir(const std::string& path) override {
        return simple("rmdir", path, [&] {
            return libssh2_sftp_rmdir_ex(sftp(), path.c_str(), static_cast<unsigned>(path.size()));
        });
    }

    Result<void> rename(const std::string& from, const std::string& to) override {
        return simple("rename", from, [&] {
            return libssh2_sftp_rename_ex(sftp(), from.c_str(), static_cast<unsigned>(from.size()),
                                          to.c_str(), static_cast<unsigned>(to.size()),
                                          LIBSSH2_SFTP_RENAME_OVERWRITE |
                                          LIBSSH2_SFTP_RENAME_ATOMIC |
                                          LIBSSH2_SFTP_RENAME_NATIVE);
        });
    }

    Result<void> chmod(const std::string& path, std::uint32_t mode) override {
        LIBSSH2_SFTP_ATTRIBUTES attrs;
        std::memset(&attrs, 0, sizeof(attrs));
        attrs.flags = LIBSSH2_SFTP_ATTR_PERMISSIONS;
        attrs.permissions = mode;
        return simple("chmod", path, [&] {
            return libssh2_sftp_stat_ex(sftp(), path.c_str(), static_cast<unsigned>(path.size()),
                                        LIBSSH2_SFTP_SETSTAT, &attrs);
        });
    }

    void close() override {
        if (!state_->sftp) return;
        retry(*h_, [&] {
            if (state_->shut) return 0;
            int rc = libssh2_sftp_shutdown(state_->sftp);
            if (rc != LIBSSH2_ERROR_EAGAIN) state_->shut = true;
            return rc;
        }, CHANNEL_EOF_WAIT_MS);
        std::lock_guard<std::mutex> lock(h_->io);
        state_->shut = true;
    }

private:
    LIBSSH2_SFTP* sftp() const { return state_->sftp; }
    static int timeout_ms() { return CHANNEL_OPEN_TIMEOUT_SECS * 1000; }

    template <typename Fn>
    Result<void> simple(const std::string& op, const std::string& path, Fn fn) {
        std::string err;
        int rc = retry(*h_, fn, timeout_ms(), &err);
        if (rc != 0) return Result<void>::Err(sftp_error(*h_, sftp(), op, path, rc, err));
        return Result<void>::Ok();
    }

    HandlePtr h_;
    std::shared_ptr<SftpState> state_;
};

// ── Jump host pump ─────────────────────────────────────────────

// Copies bytes between a direct-tcpip channel on the outer session and the
// local end of a socketpair whose other end carries the inner session.
struct TunnelPump {
    std::unique_ptr<ChannelIo> channel;
    socket_t local = HOSTLINK_INVALID_SOCKET;
    std::atomic<bool> stop{false};
    std::thread thread;

    void start() {
        thread = std::thread([this] { run(); });
    }

    void shutdown() {
        stop = true;
        if (thread.joinable()) thread.join();
        if (channel) channel->close();
        platform::close_socket(local);
        local = HOSTLINK_INVALID_SOCKET;
    }

    void run() {
        char buf[FORWARD_BUF_SIZE];
        while (!stop.load()) {
            bool idle = true;

            auto r = channel->read(buf, sizeof(buf));
            if (r.status == IoStatus::Ok) {
                idle = false;
                if (!write_local(buf, r.bytes)) break;
            } else if (r.status == IoStatus::Eof || r.status == IoStatus::Error) {
                hostlink_log("[jump] tunnel channel closed: " + r.error);
                break;
            }

            if (platform::poll_socket(local, POLLIN, 0) & (POLLIN | POLLHUP)) {
                ssize_t n = ::read(local, buf, sizeof(buf));
                if (n <= 0) break;
                idle = false;
                if (!write_channel(buf, static_cast<size_t>(n))) break;
            }

            if (idle) platform::poll_socket(local, POLLIN, 5);
        }
        // Wake the inner session so it sees the hop go away
        ::shutdown(local, SHUT_RDWR);
    }

    bool write_local(const char* data, size_t len) {
        size_t sent = 0;
        while (sent < len && !stop.load()) {
            ssize_t w = ::write(local, data + sent, len - sent);
            if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                platform::poll_socket(local, POLLOUT, 10);
                continue;
            }
            if (w <= 0) return false;
            sent += static_cast<size_t>(w);
        }
        return sent == len;
    }

    bool write_channel(const char* data, size_t len) {
        size_t sent = 0;
        while (sent < len && !stop.load()) {
            auto w = channel->write(data + sent, len - sent);
            if (w.status == IoStatus::Again) { platform::sleep_ms(1); continue; }
            if (w.status != IoStatus::Ok) return false;
            sent += w.bytes;
        }
        return sent == len;
    }
};

// ── Transport ──────────────────────────────────────────────────

class Libssh2Transport : public Transport {
public:
    Libssh2Transport(HandlePtr h, std::string identity)
        : h_(std::move(h)), identity_(std::move(identity)) {}

    ~Libssh2Transport() override { disconnect(); }

    void attach_jump(std::unique_ptr<Transport> outer, std::unique_ptr<TunnelPump> pump) {
        outer_ = std::move(outer);
        pump_ = std::move(pump);
    }

    Result<std::unique_ptr<ChannelIo>> open_channel(ChannelType type,
                                                    const ChannelParams& params) override {
        using R = Result<std::unique_ptr<ChannelIo>>;
        const int timeout = CHANNEL_OPEN_TIMEOUT_SECS * 1000;
        std::string err;
        int rc = 0;

        LIBSSH2_CHANNEL* ch = nullptr;
        if (type == ChannelType::PortForward) {
            ch = retry_ptr<LIBSSH2_CHANNEL>(*h_, [&] {
                return libssh2_channel_direct_tcpip(h_->session, params.target_host.c_str(),
                                                    params.target_port);
            }, timeout, err, rc);
        } else if (type == ChannelType::Shell || type == ChannelType::Exec) {
            ch = retry_ptr<LIBSSH2_CHANNEL>(*h_, [&] {
                return libssh2_channel_open_session(h_->session);
            }, timeout, err, rc);
        } else {
            return R::Err(ErrorKind::InvalidArgument, "open-channel", identity_,
                          "sftp channels are opened with open_sftp");
        }
        if (!ch) return R::Err(channel_error("open-channel", identity_, rc, err));

        std::unique_ptr<ChannelIo> io = std::make_unique<Libssh2Channel>(h_, ch);

        if (type == ChannelType::Shell) {
            rc = retry(*h_, [&] {
                return libssh2_channel_request_pty_ex(ch, params.term.c_str(),
                                                      static_cast<unsigned>(params.term.size()),
                                                      nullptr, 0, params.cols, params.rows, 0, 0);
            }, timeout, &err);
            if (rc == 0) rc = retry(*h_, [&] { return libssh2_channel_shell(ch); }, timeout, &err);
        } else if (type == ChannelType::Exec) {
            rc = retry(*h_, [&] {
                return libssh2_channel_exec(ch, params.command.c_str());
            }, timeout, &err);
        }
        if (rc != 0) return R::Err(channel_error("open-channel", identity_, rc, err));
        return R::Ok(std::move(io));
    }

    Result<std::unique_ptr<SftpIo>> open_sftp() override {
        using R = Result<std::unique_ptr<SftpIo>>;
        std::string err;
        int rc = 0;
        LIBSSH2_SFTP* sftp = retry_ptr<LIBSSH2_SFTP>(*h_, [&] {
            return libssh2_sftp_init(h_->session);
        }, CHANNEL_OPEN_TIMEOUT_SECS * 1000, err, rc);
        if (!sftp) return R::Err(channel_error("open-sftp", identity_, rc, err));
        return R::Ok(std::make_unique<Libssh2Sftp>(h_, sftp));
    }

    bool send_keepalive() override {
        std::lock_guard<std::mutex> lock(h_->io);
        if (h_->freed) return false;

        int seconds_to_next = 0;
        int rc = libssh2_keepalive_send(h_->session, &seconds_to_next);
        if (rc != 0 && rc != LIBSSH2_ERROR_EAGAIN) {
            if (is_fatal(rc)) h_->faulted = true;
            return false;
        }

        int revents = platform::poll_socket(h_->sock, POLLIN, 0);
        if (revents & (POLLERR | POLLHUP | POLLNVAL)) {
            h_->faulted = true;
            return false;
        }
        return true;
    }

    bool faulted() const override { return h_->faulted.load(); }

    void disconnect() override {
        {
            std::lock_guard<std::mutex> lock(h_->io);
            if (h_->freed) return;
        }
        retry(*h_, [&] {
            return libssh2_session_disconnect(h_->session, "Normal disconnection");
        }, 1000);
        retry(*h_, [&] { return libssh2_session_free(h_->session); }, 1000);
        {
            std::lock_guard<std::mutex> lock(h_->io);
            h_->freed = true;
            h_->session = nullptr;
        }
        platform::close_socket(h_->sock);
        h_->sock = HOSTLINK_INVALID_SOCKET;

        if (pump_) {
            pump_->shutdown();
            pump_.reset();
        }
        if (outer_) {
            outer_->disconnect();
            outer_.reset();
        }
        hostlink_log("[ssh] disconnected " + identity_);
    }

private:
    HandlePtr h_;
    std::string identity_;
    std::unique_ptr<Transport> outer_;
    std::unique_ptr<TunnelPump> pump_;
};

// ── Authentication ─────────────────────────────────────────────

struct KbdAuthData {
    std::string password;
    StatusCallback callback;
};

void kbd_callback(const char* /*name*/, int /*name_len*/,
                  const char* /*instruction*/, int /*instruction_len*/,
                  int num_prompts,
                  const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                  LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                  void** abstract) {
    KbdAuthData* data = static_cast<KbdAuthData*>(*abstract);
    for (int i = 0; i < num_prompts; i++) {
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = static_cast<unsigned int>(data->password.length());
    }
}

Result<void> auth_agent(SessionHandle& h, const ConnectionConfig& cfg, int timeout) {
    std::string id = cfg.identity();
    LIBSSH2_AGENT* agent;
    {
        std::lock_guard<std::mutex> lock(h.io);
        agent = libssh2_agent_init(h.session);
    }
    if (!agent) return Result<void>::Err(ErrorKind::ConnectFailed, "auth-agent", id,
                                         "failed to initialise ssh-agent support");

    Result<void> result = Result<void>::Err(ErrorKind::ConnectFailed, "auth-agent", id,
                                            "ssh-agent has no usable identity");
    if (libssh2_agent_connect(agent) != 0) {
        result = Result<void>::Err(ErrorKind::ConnectFailed, "auth-agent", id,
                                   "could not connect to ssh-agent");
    } else if (libssh2_agent_list_identities(agent) == 0) {
        struct libssh2_agent_publickey* identity = nullptr;
        struct libssh2_agent_publickey* prev = nullptr;
        while (libssh2_agent_get_identity(agent, &identity, prev) == 0) {
            int rc = retry(h, [&] {
                return libssh2_agent_userauth(agent, cfg.username.c_str(), identity);
            }, timeout);
            if (rc == 0) {
                result = Result<void>::Ok();
                break;
            }
            prev = identity;
        }
    }
    libssh2_agent_disconnect(agent);
    libssh2_agent_free(agent);
    return result;
}

Result<void> authenticate(SessionHandle& h, const ConnectionConfig& cfg, StatusCallback callback) {
    const int timeout = cfg.connect_timeout_secs * 1000;
    std::string id = cfg.identity();
    std::string err;
    int rc = 0;

    char* auth_list = retry_ptr<char>(h, [&] {
        return libssh2_userauth_list(h.session, cfg.username.c_str(),
                                     static_cast<unsigned>(cfg.username.size()));
    }, timeout, err, rc);
    std::string methods = auth_list ? auth_list : "";
    if (callback && !methods.empty()) callback("Auth methods: " + methods);

    if (cfg.auth == AuthMode::Agent) return auth_agent(h, cfg, timeout);

    if (cfg.auth == AuthMode::Key) {
        if (!cfg.key_path) {
            return Result<void>::Err(ErrorKind::ConnectFailed, "auth-key", id, "no key_path configured");
        }
        const char* passphrase = cfg.key_passphrase ? cfg.key_passphrase->c_str() : nullptr;
        rc = retry(h, [&] {
            return libssh2_userauth_publickey_fromfile(h.session, cfg.username.c_str(), nullptr,
                                                       cfg.key_path->c_str(), passphrase);
        }, timeout, &err);
        if (rc != 0) return Result<void>::Err(ErrorKind::ConnectFailed, "auth-key", id, err);
        return Result<void>::Ok();
    }

    std::string password = cfg.password.value_or("");
    if (methods.empty() || methods.find("password") != std::string::npos) {
        if (callback) callback("Using password auth...");
        rc = retry(h, [&] {
            return libssh2_userauth_password(h.session, cfg.username.c_str(), password.c_str());
        }, timeout, &err);
        if (rc == 0) return Result<void>::Ok();
    }

    if (methods.find("keyboard-interactive") != std::string::npos) {
        if (callback) callback("Using keyboard-interactive auth...");
        KbdAuthData kbd{password, callback};
        {
            std::lock_guard<std::mutex> lock(h.io);
            *libssh2_session_abstract(h.session) = &kbd;
        }
        rc = retry(h, [&] {
            return libssh2_userauth_keyboard_interactive(h.session, cfg.username.c_str(),
                                                         kbd_callback);
        }, timeout, &err);
        {
            std::lock_guard<std::mutex> lock(h.io);
            *libssh2_session_abstract(h.session) = nullptr;
        }
        if (rc == 0) return Result<void>::Ok();
    }

    return Result<void>::Err(ErrorKind::ConnectFailed, "auth-password", id,
                             err.empty() ? "authentication failed" : err);
}

// Handshake and authenticate over an already-connected socket. Takes
// ownership of sock.
Result<HandlePtr> establish(socket_t sock, const ConnectionConfig& cfg,
                            const KeepaliveSettings& keepalive, StatusCallback callback) {
    std::string id = cfg.identity();
    auto h = std::make_shared<SessionHandle>();
    h->sock = sock;
    h->session = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!h->session) {
        platform::close_socket(sock);
        return Result<HandlePtr>::Err(ErrorKind::ConnectFailed, "handshake", id,
                                      "failed to create SSH session");
    }
    libssh2_session_set_blocking(h->session, 0);

    auto fail = [&](const std::string& op, const Error& e) {
        libssh2_session_free(h->session);
        h->session = nullptr;
        h->freed = true;
        platform::close_socket(sock);
        hostlink_log(fmt::format("[ssh] {} {} failed: {}", op, id, e.describe()));
        return Result<HandlePtr>::Err(e);
    };

    std::string err;
    int rc = retry(*h, [&] { return libssh2_session_handshake(h->session, sock); },
                   cfg.connect_timeout_secs * 1000, &err);
    if (rc != 0) {
        return fail("handshake", make_error(ErrorKind::ConnectFailed, "handshake", id,
                                            err.empty() ? "SSH handshake failed" : err));
    }

    // Unacknowledged keepalives fault the socket before alive_count_max runs out
    platform::enable_tcp_keepalive(sock, keepalive.interval_secs * keepalive.alive_count_max * 1000);
    libssh2_keepalive_config(h->session, 1, static_cast<unsigned>(keepalive.interval_secs));

    if (callback) callback("SSH handshake complete, authenticating...");

    auto auth = authenticate(*h, cfg, callback);
    if (auth.is_err()) return fail("auth", auth.error);

    if (callback) callback("Authentication successful");
    return Result<HandlePtr>::Ok(h);
}

std::once_flag g_libssh2_init;

} // namespace

// ── Factory ────────────────────────────────────────────────────

Libssh2TransportFactory::Libssh2TransportFactory(const KeepaliveSettings& keepalive)
    : keepalive_(keepalive) {
    std::call_once(g_libssh2_init, [] { libssh2_init(0); });
}

Result<std::unique_ptr<Transport>> Libssh2TransportFactory::connect(const ConnectionConfig& config,
                                                                    StatusCallback callback) {
    using R = Result<std::unique_ptr<Transport>>;
    std::string id = config.identity();

    std::unique_ptr<Transport> outer;
    std::unique_ptr<TunnelPump> pump;
    socket_t sock = HOSTLINK_INVALID_SOCKET;

    if (const ConnectionConfig* jump = config.jump_host()) {
        if (callback) callback("Connecting to jump host " + jump->identity() + "...");
        auto outer_r = connect(*jump, callback);
        if (outer_r.is_err()) {
            return R::Err(ErrorKind::ConnectFailed, "connect-jump", id, outer_r.error.describe());
        }
        outer = std::move(outer_r.value);

        ChannelParams params;
        params.target_host = config.host;
        params.target_port = config.port;
        auto tunnel = outer->open_channel(ChannelType::PortForward, params);
        if (tunnel.is_err()) {
            return R::Err(ErrorKind::ConnectFailed, "connect-jump", id, tunnel.error.describe());
        }

        socket_t local = HOSTLINK_INVALID_SOCKET;
        auto pair = platform::socket_pair(local, sock);
        if (pair.is_err()) return R::Err(pair.error);
        platform::set_nonblocking(sock);

        pump = std::make_unique<TunnelPump>();
        pump->channel = std::move(tunnel.value);
        pump->local = local;
        pump->start();
    } else {
        if (callback) callback("Connecting to " + id + "...");
        auto sock_r = platform::connect_tcp(config.host, config.port,
                                            config.connect_timeout_secs * 1000);
        if (sock_r.is_err()) return R::Err(sock_r.error);
        sock = sock_r.value;
        if (callback) callback("TCP connected, starting SSH handshake...");
    }

    auto h = establish(sock, config, keepalive_, callback);
    if (h.is_err()) {
        if (pump) pump->shutdown();
        if (outer) outer->disconnect();
        return R::Err(h.error);
    }

    auto transport = std::make_unique<Libssh2Transport>(h.value, id);
    if (outer) transport->attach_jump(std::move(outer), std::move(pump));

    hostlink_log("[ssh] connected " + id);
    if (callback) callback("Connected to " + config.host);
    return R::Ok(std::move(transport));
}
