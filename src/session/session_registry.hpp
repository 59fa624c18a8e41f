#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <core/cancel_registry.hpp>
#include <core/config.hpp>
#include <ssh/transport.hpp>
#include <transfer/transfer_backend.hpp>
#include "events.hpp"
#include "session_actor.hpp"

struct SessionSummary {
    std::string id;
    std::string name;
    std::string identity;     // user@host:port
    SessionStatus status = SessionStatus::Disconnected;
};

// SessionRegistry: process-wide directory of session actors.
//
// Routes every request to the actor that owns the session, and gives the
// transfer engine its channels through the same actors. The command
// cancellation registry is shared by all sessions so a command id is unique
// process-wide.
class SessionRegistry : public TransferBackend {
public:
    SessionRegistry(const ClientSettings& settings, TransportFactory& factory, EventListener& events);
    ~SessionRegistry() override;

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // New session when existing_id is empty; otherwise reconnect that session
    // with its stored config, keeping the id. A new session is only kept if
    // its first connect succeeds.
    Result<std::string> connect(const ConnectionConfig& config, const std::string& existing_id = "");

    // Stop the actor and forget the session.
    Result<void> disconnect(const std::string& session_id);
    void disconnect_all();

    Result<std::shared_ptr<SessionActor>> get(const std::string& session_id) const;
    std::vector<SessionSummary> list() const;

    CancelRegistry& commands() { return commands_; }

    // ── TransferBackend ────────────────────────────────────────

    bool has_session(const std::string& session_id) override;
    Result<std::shared_ptr<Channel>> open_sftp(const std::string& session_id) override;
    void release_channel(const std::string& session_id, std::shared_ptr<Channel> channel) override;
    Result<std::string> remote_sha256(const std::string& session_id, const std::string& path) override;

private:
    const ClientSettings settings_;
    TransportFactory& factory_;
    EventListener& events_;
    CancelRegistry commands_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<SessionActor>> sessions_;
    std::vector<std::string> order_;
};
