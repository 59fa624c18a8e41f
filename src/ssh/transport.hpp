#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <core/types.hpp>

// Transport abstraction over one authenticated SSH session.
//
// The libssh2 implementation lives in libssh2_transport.*; tests plug in an
// in-memory transport. Every operation is non-blocking at the stream level:
// reads and writes report Again instead of waiting, so callers can poll
// cancellation flags between I/O attempts.

enum class IoStatus { Ok, Again, Eof, Error };

struct IoResult {
    IoStatus status = IoStatus::Again;
    std::size_t bytes = 0;
    bool fatal = false;        // transport-level fault, not just this stream
    std::string error;

    static IoResult ok(std::size_t n) { return {IoStatus::Ok, n, false, ""}; }
    static IoResult again() { return {IoStatus::Again, 0, false, ""}; }
    static IoResult eof() { return {IoStatus::Eof, 0, false, ""}; }
    static IoResult failure(std::string msg, bool fatal_fault = false) {
        return {IoStatus::Error, 0, fatal_fault, std::move(msg)};
    }
};

enum class ChannelType { Shell, Exec, Sftp, PortForward };

const char* channel_type_name(ChannelType type);

struct ChannelParams {
    std::string command;            // Exec
    std::string term = "xterm";     // Shell
    int cols = 80;
    int rows = 24;
    std::string target_host;        // PortForward
    int target_port = 0;
};

// One session-type or direct-tcpip channel
class ChannelIo {
public:
    virtual ~ChannelIo() = default;

    virtual IoResult read(char* buf, std::size_t len) = 0;
    virtual IoResult read_stderr(char* buf, std::size_t len) = 0;
    virtual IoResult write(const char* data, std::size_t len) = 0;

    virtual Result<void> send_eof() = 0;
    virtual bool remote_eof() = 0;

    // Send close and wait briefly for the peer's close. Idempotent.
    virtual Result<void> close() = 0;

    // Valid after remote EOF or close; -1 when unknown.
    virtual int exit_status() = 0;

    virtual Result<void> resize(int cols, int rows) = 0;
};

enum class OpenMode { Read, WriteTruncate, WriteAt };

// An open remote file handle
class RemoteFile {
public:
    virtual ~RemoteFile() = default;
    virtual IoResult read(char* buf, std::size_t len) = 0;
    virtual IoResult write(const char* data, std::size_t len) = 0;
    virtual void close() = 0;
};

// SFTP subsystem on its own channel
class SftpIo {
public:
    virtual ~SftpIo() = default;

    virtual Result<RemoteEntry> stat(const std::string& path) = 0;
    virtual Result<std::vector<RemoteEntry>> list(const std::string& path) = 0;
    virtual Result<std::unique_ptr<RemoteFile>> open(const std::string& path, OpenMode mode,
                                                     std::uint64_t offset = 0) = 0;
    virtual Result<void> mkdir(const std::string& path, std::uint32_t mode = 0755) = 0;
    virtual Result<void> remove_file(const std::string& path) = 0;
    virtual Result<void> remove_dir(const std::string& path) = 0;
    virtual Result<void> rename(const std::string& from, const std::string& to) = 0;
    virtual Result<void> chmod(const std::string& path, std::uint32_t mode) = 0;

    // Shut the subsystem down. Idempotent.
    virtual void close() = 0;
};

class Transport {
public:
    virtual ~Transport() = default;

    virtual Result<std::unique_ptr<ChannelIo>> open_channel(ChannelType type,
                                                            const ChannelParams& params) = 0;
    virtual Result<std::unique_ptr<SftpIo>> open_sftp() = 0;

    // Send one keepalive. False when it went unanswered.
    virtual bool send_keepalive() = 0;

    // True once any operation has hit a transport-level fault.
    virtual bool faulted() const = 0;

    virtual void disconnect() = 0;
};

class TransportFactory {
public:
    virtual ~TransportFactory() = default;

    // Resolve, connect (through the jump host if configured), handshake, authenticate.
    virtual Result<std::unique_ptr<Transport>> connect(const ConnectionConfig& config,
                                                       StatusCallback callback = nullptr) = 0;
};
