#pragma once

#include <optional>
#include <string>

namespace lexsync {

/**
 * @brief Which end of the pairing a device plays
 *
 * The receiver publishes a session id and waits; the sender dials it and
 * arbitrates the verification code.
 */
enum class Role {
    Sender,
    Receiver
};

inline const char* to_string(Role role) {
    return role == Role::Sender ? "sender" : "receiver";
}

inline std::optional<Role> parse_role(const std::string& text) {
    if (text == "sender" || text == "send") {
        return Role::Sender;
    }
    if (text == "receiver" || text == "receive") {
        return Role::Receiver;
    }
    return std::nullopt;
}

} // namespace lexsync
