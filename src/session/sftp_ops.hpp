#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <ssh/transport.hpp>

// File-browsing operations run on a session's shared SFTP channel.

enum class SftpOpKind {
    List,
    Stat,
    Mkdir,
    CreateFile,
    Remove,         // file or directory; directories honour `recursive`
    Rename,
    Chmod,
    ReadFile,       // whole file, or its first max_bytes
    WriteFile,
    Walk,           // every regular file below path, recursively
};

const char* sftp_op_name(SftpOpKind kind);

struct SftpOp {
    SftpOpKind kind = SftpOpKind::List;
    std::string path;
    std::string target;             // Rename
    std::uint32_t mode = 0755;      // Mkdir, Chmod
    bool recursive = false;         // Remove
    std::string content;            // WriteFile
    std::optional<std::uint64_t> max_bytes;      // ReadFile
};

struct SftpReply {
    std::vector<RemoteEntry> entries;   // List, Walk
    RemoteEntry entry;                  // Stat
    std::string content;                // ReadFile
};

Result<SftpReply> run_sftp_op(SftpIo& sftp, const SftpOp& op);

// Recursive helpers, also used by the transfer engine
Result<std::vector<RemoteEntry>> walk_remote(SftpIo& sftp, const std::string& root);
Result<void> remove_remote_tree(SftpIo& sftp, const std::string& path);
Result<void> make_remote_dirs(SftpIo& sftp, const std::string& path);
