#pragma once

#include "lexsync/network/channel.hpp"

#include <boost/asio/io_context.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <string>

namespace lexsync::network {

namespace asio = boost::asio;

class LoopbackTransport;

/**
 * @brief In-process rendezvous for peers on one io_context
 *
 * Receivers register under "peer-<n>"; a sender dialing that id gets a
 * channel pair wired straight to the receiver. Used by tests and demos.
 *
 * set_stalled(true) makes dial attempts hang forever, which is how tests
 * reach the connect timeout.
 */
class LoopbackHub {
public:
    explicit LoopbackHub(asio::io_context& io_context) : io_context_(io_context) {}

    LoopbackHub(const LoopbackHub&) = delete;
    LoopbackHub& operator=(const LoopbackHub&) = delete;

    /// New transport endpoint bound to this hub
    std::unique_ptr<LoopbackTransport> make_transport();

    void set_stalled(bool stalled) { stalled_ = stalled; }
    [[nodiscard]] bool stalled() const noexcept { return stalled_; }

    [[nodiscard]] std::size_t listener_count() const noexcept { return listeners_.size(); }

private:
    friend class LoopbackTransport;

    struct Listener {
        std::uint64_t owner;
        TransportHandlers handlers;
    };

    std::string register_listener(std::uint64_t owner, TransportHandlers handlers);
    void remove_listeners(std::uint64_t owner);
    void dial(std::uint64_t owner, const std::string& remote_id, TransportHandlers handlers);

    asio::io_context& io_context_;
    std::map<std::string, Listener> listeners_;
    std::uint64_t next_peer_ = 1;
    std::uint64_t next_owner_ = 1;
    bool stalled_ = false;
};

class LoopbackTransport : public Transport {
public:
    LoopbackTransport(LoopbackHub& hub, std::uint64_t owner) : hub_(hub), owner_(owner) {}
    ~LoopbackTransport() override { shutdown(); }

    void open(Role role, std::optional<std::string> remote_id, TransportHandlers handlers) override;
    void shutdown() override;

private:
    LoopbackHub& hub_;
    std::uint64_t owner_;
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

} // namespace lexsync::network
