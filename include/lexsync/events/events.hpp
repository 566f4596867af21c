/**
 * @file events.hpp
 * @brief Event types published by the connection manager and sync engine
 *
 * NAMING CONVENTION:
 * - Events are past-tense or state snapshots: FileReceivedEvent,
 *   ConnectionStateChangedEvent
 *
 * All events are delivered synchronously on the io_context thread that
 * produced them.
 */

#pragma once

#include "lexsync/core/clock.hpp"
#include "lexsync/core/role.hpp"
#include "lexsync/session/types.hpp"
#include "lexsync/sync/types.hpp"
#include "lexsync/transfer/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lexsync::events {

// ════════════════════════════════════════════════════════
// Log Events
// ════════════════════════════════════════════════════════

enum class LogLevel {
    Info,
    Success,
    Warning,
    Error
};

inline const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Info: return "info";
        case LogLevel::Success: return "success";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error: return "error";
    }
    return "unknown";
}

/**
 * @brief One entry of the user-facing connection log
 *
 * WHO EMITS: ConnectionManager, SyncEngine
 * WHO SUBSCRIBES: LoggerComponent (spdlog), UIs, tests
 */
struct LogEntryEvent {
    TimestampMs timestamp = 0;
    LogLevel level = LogLevel::Info;
    std::string message;
    std::optional<std::string> detail;
};

// ════════════════════════════════════════════════════════
// Connection Events
// ════════════════════════════════════════════════════════

struct ConnectionStateChangedEvent {
    session::ConnectionState previous;
    session::ConnectionState current;
    std::optional<std::string> error;
};

/**
 * @brief A verification code is ready to show
 *
 * Sender: the code it generated, to be read out to the other user.
 * Receiver: the code the sender transmitted.
 */
struct VerificationCodeEvent {
    std::string code;
    Role role;
};

// ════════════════════════════════════════════════════════
// Transfer Events
// ════════════════════════════════════════════════════════

struct FileProgressEvent {
    transfer::FileTransfer transfer;
};

struct FileReceivedEvent {
    transfer::ReceivedFile file;
};

struct FileTransferFailedEvent {
    std::string file_id;
    std::string name;
    std::string reason;
};

struct TextReceivedEvent {
    std::string content;
    std::optional<std::string> content_type;
    TimestampMs timestamp = 0;
};

// ════════════════════════════════════════════════════════
// Sync Events
// ════════════════════════════════════════════════════════

struct SyncStatusChangedEvent {
    sync::SyncStatus status;
};

} // namespace lexsync::events
