#pragma once

/**
 * @file channel.hpp
 * @brief Transport bootstrap boundary
 *
 * A Transport turns (role, session id) into one open Channel. A Channel
 * carries whole binary frames in order, both ways. The connection manager
 * sees nothing below these two interfaces.
 *
 * CALLBACK RULES:
 * - Every handler runs on the io_context the implementation was built with
 * - No handler is ever invoked from inside the call that registered it
 * - close() is local: it does not fire this side's on_close
 */

#include "lexsync/core/error.hpp"
#include "lexsync/core/result.hpp"
#include "lexsync/core/role.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lexsync::network {

struct ChannelHandlers {
    std::function<void()> on_open;
    std::function<void(std::vector<std::uint8_t>)> on_data;
    std::function<void()> on_close;                 ///< peer closed
    std::function<void(const Error&)> on_error;     ///< channel is unusable afterwards
};

class Channel {
public:
    virtual ~Channel() = default;

    /// Install handlers and begin delivering events; call once
    virtual void start(ChannelHandlers handlers) = 0;

    [[nodiscard]] virtual bool is_open() const = 0;

    /// Queue one frame; Transport error if the channel is closed
    virtual Result<void> send(std::vector<std::uint8_t> frame) = 0;

    virtual void close() = 0;
};

struct TransportHandlers {
    std::function<void(std::string local_session_id)> on_ready;
    std::function<void(std::shared_ptr<Channel>)> on_channel;
    std::function<void(const Error&)> on_error;
};

class Transport {
public:
    virtual ~Transport() = default;

    /**
     * @brief Start one connection attempt
     *
     * Receiver: publish a session id via on_ready, then deliver the first
     * peer that attaches via on_channel. Sender: dial `remote_id` and
     * deliver the channel via on_channel.
     */
    virtual void open(Role role, std::optional<std::string> remote_id, TransportHandlers handlers) = 0;

    /// Abandon any attempt in progress; no handler fires afterwards
    virtual void shutdown() = 0;
};

} // namespace lexsync::network
