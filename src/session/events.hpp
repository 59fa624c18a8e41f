#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <core/types.hpp>
#include <transfer/transfer_item.hpp>

enum class SessionStatus { Connecting, Connected, Disconnected };

inline const char* session_status_name(SessionStatus status) {
    switch (status) {
        case SessionStatus::Connecting:   return "connecting";
        case SessionStatus::Connected:    return "connected";
        case SessionStatus::Disconnected: return "disconnected";
    }
    return "unknown";
}

// EventListener: outbound notifications.
//
// Called from session actor threads, exec task threads and transfer
// workers. Implementations must be thread-safe and must not call back into
// the service synchronously. Defaults do nothing.
class EventListener {
public:
    virtual ~EventListener() = default;

    virtual void session_status_changed(const std::string& /*session_id*/,
                                        SessionStatus /*status*/) {}

    virtual void command_output(const std::string& /*command_id*/,
                                const std::string& /*chunk*/) {}

    virtual void transfer_progress(const std::string& /*transfer_id*/,
                                   std::uint64_t /*transferred*/, std::uint64_t /*total*/) {}

    virtual void transfer_status_changed(const std::string& /*transfer_id*/,
                                         TransferStatus /*status*/,
                                         const std::optional<Error>& /*error*/) {}

    virtual void reconnect_attempt_failed(const std::string& /*session_id*/, int /*attempt*/,
                                          const Error& /*error*/) {}

    virtual void reconnect_exhausted(const std::string& /*session_id*/) {}

    virtual void shell_output(const std::string& /*session_id*/, const std::string& /*data*/) {}

    virtual void shell_closed(const std::string& /*session_id*/) {}
};
