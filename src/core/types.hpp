#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>
#include <cstdint>

// Error taxonomy surfaced across component boundaries.
enum class ErrorKind {
    None,
    ConnectFailed,
    ChannelLimitExceeded,
    SessionLost,
    ReconnectAttemptFailed,
    ReconnectExhausted,
    Cancelled,
    DuplicateCommandId,
    CommandNotFound,
    TransferIoError,
    IntegrityError,
    ChannelProtocolError,
    SessionNotFound,
    TransferNotFound,
    InvalidArgument,
    ConfigError,
    Timeout,
};

const char* error_kind_name(ErrorKind kind);

// Every surfaced error names the operation, the id it concerned and the
// underlying message.
struct Error {
    ErrorKind kind = ErrorKind::None;
    std::string operation;
    std::string id;
    std::string message;

    std::string describe() const;
};

inline Error make_error(ErrorKind kind, std::string operation,
                        std::string id, std::string message) {
    return Error{kind, std::move(operation), std::move(id), std::move(message)};
}

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    Error error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), Error{}};
    }

    static Result<T> Err(Error err) {
        return {false, T{}, std::move(err)};
    }

    static Result<T> Err(ErrorKind kind, const std::string& operation,
                         const std::string& id, const std::string& message) {
        return {false, T{}, make_error(kind, operation, id, message)};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
    ErrorKind kind() const { return error.kind; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    Error error;

    static Result<void> Ok() {
        return {true, Error{}};
    }

    static Result<void> Err(Error err) {
        return {false, std::move(err)};
    }

    static Result<void> Err(ErrorKind kind, const std::string& operation,
                            const std::string& id, const std::string& message) {
        return {false, make_error(kind, operation, id, message)};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
    ErrorKind kind() const { return error.kind; }
};

// Output of one exec-channel command
struct ExecOutput {
    int exit_status = -1;
    std::string stdout_data;
    std::string stderr_data;

    bool succeeded() const { return exit_status == 0; }

    std::string get_output() const {
        return stdout_data.empty() ? stderr_data : stdout_data;
    }
};

enum class AuthMode { Password, Key, Agent };

struct ConnectionConfig {
    std::string name;
    std::string host;
    int port = 22;
    std::string username;
    AuthMode auth = AuthMode::Password;
    std::optional<std::string> password;
    std::optional<std::string> key_path;
    std::optional<std::string> key_passphrase;
    int connect_timeout_secs = 10;

    // Optional jump host; nested jumps are allowed.
    std::vector<ConnectionConfig> jump;  // zero or one element

    const ConnectionConfig* jump_host() const {
        return jump.empty() ? nullptr : &jump.front();
    }

    // user@host:port
    std::string identity() const;
};

// Metadata for one remote filesystem entry
struct RemoteEntry {
    std::string name;
    std::string path;
    bool is_dir = false;
    std::uint64_t size = 0;
    std::uint64_t mtime = 0;
    std::uint32_t permissions = 0;
    std::uint32_t uid = 0;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
