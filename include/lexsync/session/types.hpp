#pragma once

namespace lexsync::session {

/**
 * @brief Lifecycle of one peer connection
 *
 *   waiting ──┐
 *             ├─> verifying -> connected <-> transferring
 *   connecting┘
 *
 * Any state may drop to disconnected.
 */
enum class ConnectionState {
    Waiting,        ///< receiver published its id, no peer yet
    Connecting,     ///< resolving/opening the channel
    Verifying,      ///< channel open, code exchange in progress
    Connected,      ///< verified and idle
    Transferring,   ///< file batch or sync round in flight
    Disconnected
};

inline const char* to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::Waiting: return "waiting";
        case ConnectionState::Connecting: return "connecting";
        case ConnectionState::Verifying: return "verifying";
        case ConnectionState::Connected: return "connected";
        case ConnectionState::Transferring: return "transferring";
        case ConnectionState::Disconnected: return "disconnected";
    }
    return "unknown";
}

} // namespace lexsync::session
