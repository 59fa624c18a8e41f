#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>

enum class TransferDirection { Upload, Download };

enum class TransferStatus { Pending, Running, Paused, Completed, Error, Cancelled };

const char* transfer_status_name(TransferStatus status);
const char* transfer_direction_name(TransferDirection direction);

// One queued file transfer, or the aggregate for a directory transfer.
//
// For a directory, size/transferred/status are derived from its children
// whenever a snapshot is taken; only paused_child_ids is stored.
struct TransferItem {
    std::string id;
    std::string session_id;
    std::string name;
    TransferDirection direction = TransferDirection::Upload;
    std::string local_path;
    std::string remote_path;
    std::uint64_t size = 0;
    std::uint64_t transferred = 0;
    TransferStatus status = TransferStatus::Pending;
    std::optional<Error> error;

    std::string parent_id;              // empty for top-level items
    bool is_directory = false;
    std::vector<std::string> child_ids; // directories: admission order
    std::vector<std::string> paused_child_ids;

    bool resume = false;                // re-admitted: continue from the partial destination
};

struct DirectoryAggregate {
    std::size_t total_files = 0;
    std::size_t completed_files = 0;
    std::uint64_t total_bytes = 0;
    std::uint64_t transferred_bytes = 0;
    std::vector<std::string> paused_child_ids;
};

struct TransferSnapshot {
    TransferItem item;
    std::optional<DirectoryAggregate> aggregate;
};

// Result of applying one batch operation to one item
struct BatchOutcome {
    std::string transfer_id;
    Result<void> result;
};
