#include "transfer_item.hpp"

const char* transfer_status_name(TransferStatus status) {
    switch (status) {
        case TransferStatus::Pending:   return "pending";
        case TransferStatus::Running:   return "running";
        case TransferStatus::Paused:    return "paused";
        case TransferStatus::Completed: return "completed";
        case TransferStatus::Error:     return "error";
        case TransferStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

const char* transfer_direction_name(TransferDirection direction) {
    return direction == TransferDirection::Upload ? "upload" : "download";
}
