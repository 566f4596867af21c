#include "lexsync/session/session.hpp"

#include <algorithm>
#include <random>
#include <unordered_map>
#include <vector>

namespace lexsync::session {
namespace {

bool is_progressive(ConnectionState current, ConnectionState target) {
    static const std::unordered_map<ConnectionState, std::vector<ConnectionState>> transitions {
        {ConnectionState::Disconnected, {ConnectionState::Waiting, ConnectionState::Connecting}},
        {ConnectionState::Waiting, {ConnectionState::Connecting, ConnectionState::Verifying}},
        {ConnectionState::Connecting, {ConnectionState::Waiting, ConnectionState::Verifying}},
        {ConnectionState::Verifying, {ConnectionState::Connected}},
        {ConnectionState::Connected, {ConnectionState::Transferring}},
        {ConnectionState::Transferring, {ConnectionState::Connected}},
    };

    if (target == ConnectionState::Disconnected) {
        return true;
    }

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed_list = it->second;
    return std::find(allowed_list.begin(), allowed_list.end(), target) != allowed_list.end();
}

} // namespace

void Session::reset(Role role) {
    role_ = role;
    state_ = ConnectionState::Disconnected;
    verified_ = false;
    session_id_.reset();
    verification_code_.reset();
    error_.reset();
    last_transition_ = std::chrono::steady_clock::now();
}

Result<void> Session::transition_to(ConnectionState next_state) {
    if (state_ == next_state) {
        return Ok();
    }

    if (!can_transition(next_state)) {
        return Err<void>(ErrorCode::Protocol,
                         std::string("Illegal connection state transition: ") +
                         to_string(state_) + " -> " + to_string(next_state));
    }

    state_ = next_state;
    last_transition_ = std::chrono::steady_clock::now();
    if (next_state == ConnectionState::Disconnected) {
        verified_ = false;
        verification_code_.reset();
    }
    return Ok();
}

Result<void> Session::mark_verified() {
    if (state_ != ConnectionState::Verifying) {
        return Err<void>(ErrorCode::Verification,
                         std::string("Cannot verify in state ") + to_string(state_));
    }
    if (auto res = transition_to(ConnectionState::Connected); res.is_error()) {
        return res;
    }
    verified_ = true;
    verification_code_.reset();
    error_.reset();
    return Ok();
}

bool Session::can_transition(ConnectionState target) const noexcept {
    if (state_ == target) {
        return true;
    }
    return is_progressive(state_, target);
}

std::string generate_verification_code() {
    static thread_local std::mt19937 engine{std::random_device{}()};
    std::uniform_int_distribution<int> dist(100000, 999999);
    return std::to_string(dist(engine));
}

bool is_valid_verification_code(const std::string& code) {
    return code.size() == 6 &&
           std::all_of(code.begin(), code.end(), [](char c) { return c >= '0' && c <= '9'; });
}

} // namespace lexsync::session
