#pragma once

#include <memory>
#include <string>
#include <core/types.hpp>
#include <ssh/channel.hpp>

// What the transfer engine needs from the sessions it moves files over.
// Channels are opened and released by the owning session; the engine only
// drives I/O on the ones it is handed.
class TransferBackend {
public:
    virtual ~TransferBackend() = default;

    virtual bool has_session(const std::string& session_id) = 0;

    // ChannelLimitExceeded when the session's ceiling is reached.
    virtual Result<std::shared_ptr<Channel>> open_sftp(const std::string& session_id) = 0;
    virtual void release_channel(const std::string& session_id, std::shared_ptr<Channel> channel) = 0;

    // Hex SHA-256 of a remote file, computed on the host.
    virtual Result<std::string> remote_sha256(const std::string& session_id,
                                              const std::string& path) = 0;
};
