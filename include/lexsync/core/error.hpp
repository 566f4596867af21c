#pragma once

#include <string>

namespace lexsync {

/**
 * @brief Failure categories surfaced by the engine
 *
 * Callers branch on the code; the message is for humans and logs.
 */
enum class ErrorCode {
    Transport,          // channel failed to open, closed or errored
    ConnectionTimeout,  // channel did not open within the connect window
    SessionTimeout,     // idle session expired
    SyncTimeout,        // sync round-trip did not settle in time
    Verification,       // wrong or malformed verification code
    Integrity,          // chunk index/size or reassembled size mismatch
    ProfileMismatch,    // incompatible language pair
    NotVerified,        // operation attempted on an unverified/idle session
    SyncInProgress,     // single in-flight sync guard
    Busy,               // a file batch or sync round already owns the channel
    RemoteRejected,     // peer answered with sync-error
    Protocol,           // undecodable or unexpected message
    Storage,            // record store / state persistence failure
    InvalidArgument,
    Config
};

struct Error {
    ErrorCode code = ErrorCode::Protocol;
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string m) : code(c), message(std::move(m)) {}
};

inline const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Transport: return "transport";
        case ErrorCode::ConnectionTimeout: return "connection-timeout";
        case ErrorCode::SessionTimeout: return "session-timeout";
        case ErrorCode::SyncTimeout: return "sync-timeout";
        case ErrorCode::Verification: return "verification";
        case ErrorCode::Integrity: return "integrity";
        case ErrorCode::ProfileMismatch: return "profile-mismatch";
        case ErrorCode::NotVerified: return "not-verified";
        case ErrorCode::SyncInProgress: return "sync-in-progress";
        case ErrorCode::Busy: return "busy";
        case ErrorCode::RemoteRejected: return "remote-rejected";
        case ErrorCode::Protocol: return "protocol";
        case ErrorCode::Storage: return "storage";
        case ErrorCode::InvalidArgument: return "invalid-argument";
        case ErrorCode::Config: return "config";
    }
    return "unknown";
}

} // namespace lexsync
