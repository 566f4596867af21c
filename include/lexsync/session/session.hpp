#pragma once

#include "lexsync/core/result.hpp"
#include "lexsync/core/role.hpp"
#include "lexsync/session/types.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace lexsync::session {

/**
 * @brief State of the single session a connection manager owns
 *
 * Holds role, published/dialed session id, verification progress and the
 * last fatal error. All transitions go through transition_to(), which
 * rejects moves the handshake does not allow.
 */
class Session {
public:
    Session() = default;

    /// Start over for a new connect(); keeps nothing from the last session
    void reset(Role role);

    [[nodiscard]] Role role() const noexcept { return role_; }
    [[nodiscard]] ConnectionState state() const noexcept { return state_; }
    [[nodiscard]] bool is_verified() const noexcept { return verified_; }
    [[nodiscard]] const std::optional<std::string>& session_id() const noexcept { return session_id_; }
    [[nodiscard]] const std::optional<std::string>& verification_code() const noexcept { return verification_code_; }
    [[nodiscard]] const std::optional<std::string>& error() const noexcept { return error_; }

    Result<void> transition_to(ConnectionState next_state);

    /// Verifying -> Connected and clears the pending code
    Result<void> mark_verified();

    void set_session_id(std::string id) { session_id_ = std::move(id); }
    void set_verification_code(std::string code) { verification_code_ = std::move(code); }
    void clear_verification_code() { verification_code_.reset(); }
    void set_error(std::string message) { error_ = std::move(message); }
    void clear_error() { error_.reset(); }

    [[nodiscard]] std::chrono::steady_clock::time_point last_transition() const noexcept {
        return last_transition_;
    }

private:
    [[nodiscard]] bool can_transition(ConnectionState target) const noexcept;

    Role role_ = Role::Receiver;
    ConnectionState state_ = ConnectionState::Disconnected;
    bool verified_ = false;
    std::optional<std::string> session_id_;
    std::optional<std::string> verification_code_;
    std::optional<std::string> error_;
    std::chrono::steady_clock::time_point last_transition_{};
};

/// Six random decimal digits, never with a leading zero
std::string generate_verification_code();

/// Exactly six ASCII digits
bool is_valid_verification_code(const std::string& code);

} // namespace lexsync::session
