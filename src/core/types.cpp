#include "types.hpp"
#include <fmt/format.h>

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                   return "None";
        case ErrorKind::ConnectFailed:          return "ConnectFailed";
        case ErrorKind::ChannelLimitExceeded:   return "ChannelLimitExceeded";
        case ErrorKind::SessionLost:            return "SessionLost";
        case ErrorKind::ReconnectAttemptFailed: return "ReconnectAttemptFailed";
        case ErrorKind::ReconnectExhausted:     return "ReconnectExhausted";
        case ErrorKind::Cancelled:              return "Cancelled";
        case ErrorKind::DuplicateCommandId:     return "DuplicateCommandId";
        case ErrorKind::CommandNotFound:        return "CommandNotFound";
        case ErrorKind::TransferIoError:        return "TransferIoError";
        case ErrorKind::IntegrityError:         return "IntegrityError";
        case ErrorKind::ChannelProtocolError:   return "ChannelProtocolError";
        case ErrorKind::SessionNotFound:        return "SessionNotFound";
        case ErrorKind::TransferNotFound:       return "TransferNotFound";
        case ErrorKind::InvalidArgument:        return "InvalidArgument";
        case ErrorKind::ConfigError:            return "ConfigError";
        case ErrorKind::Timeout:                return "Timeout";
    }
    return "Unknown";
}

std::string Error::describe() const {
    if (kind == ErrorKind::None) return "";
    std::string where = operation;
    if (!id.empty()) where += where.empty() ? id : " [" + id + "]";
    if (where.empty())
        return fmt::format("{}: {}", error_kind_name(kind), message);
    if (message.empty())
        return fmt::format("{}: {}", where, error_kind_name(kind));
    return fmt::format("{}: {}: {}", where, error_kind_name(kind), message);
}

std::string ConnectionConfig::identity() const {
    return fmt::format("{}@{}:{}", username, host, port);
}
