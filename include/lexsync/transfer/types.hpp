#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lexsync::transfer {

enum class TransferStatus {
    Pending,
    Transferring,
    Completed,
    Error
};

inline const char* to_string(TransferStatus status) {
    switch (status) {
        case TransferStatus::Pending: return "pending";
        case TransferStatus::Transferring: return "transferring";
        case TransferStatus::Completed: return "completed";
        case TransferStatus::Error: return "error";
    }
    return "unknown";
}

enum class TransferDirection {
    Outgoing,
    Incoming
};

/**
 * @brief Progress record for one file in flight, in either direction
 */
struct FileTransfer {
    std::string id;
    std::string name;
    std::uint64_t size = 0;
    std::string mime_type;
    std::uint32_t total_chunks = 0;
    std::uint32_t chunks_done = 0;      ///< sent or received
    double progress = 0.0;              ///< percent, 0-100
    TransferStatus status = TransferStatus::Pending;
    TransferDirection direction = TransferDirection::Outgoing;
    std::optional<std::string> error;
};

/// A file queued for sending
struct OutgoingFile {
    std::string name;
    std::string mime_type;
    std::vector<std::uint8_t> data;
};

/// A fully reassembled, size-checked incoming file
struct ReceivedFile {
    std::string id;
    std::string name;
    std::string mime_type;
    std::vector<std::uint8_t> data;
};

} // namespace lexsync::transfer
