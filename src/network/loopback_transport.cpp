#include "lexsync/network/loopback_transport.hpp"

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include <deque>

namespace lexsync::network {
namespace {

/**
 * @brief One end of an in-memory channel pair
 *
 * Frames are posted to the peer end, so delivery is always asynchronous
 * and in send order.
 */
class LoopbackChannel : public Channel, public std::enable_shared_from_this<LoopbackChannel> {
public:
    explicit LoopbackChannel(asio::io_context& io_context) : io_context_(io_context) {}

    static std::pair<std::shared_ptr<LoopbackChannel>, std::shared_ptr<LoopbackChannel>>
    make_pair(asio::io_context& io_context) {
        auto a = std::make_shared<LoopbackChannel>(io_context);
        auto b = std::make_shared<LoopbackChannel>(io_context);
        a->peer_ = b;
        b->peer_ = a;
        return {a, b};
    }

    void start(ChannelHandlers handlers) override {
        handlers_ = std::move(handlers);
        asio::post(io_context_, [self = shared_from_this()] {
            if (!self->open_) {
                return;
            }
            self->opened_ = true;
            if (self->handlers_.on_open) {
                self->handlers_.on_open();
            }
            while (self->open_ && !self->backlog_.empty()) {
                auto frame = std::move(self->backlog_.front());
                self->backlog_.pop_front();
                self->dispatch(std::move(frame));
            }
        });
    }

    bool is_open() const override { return open_; }

    Result<void> send(std::vector<std::uint8_t> frame) override {
        if (!open_) {
            return Err<void>(ErrorCode::Transport, "Channel is closed");
        }
        auto peer = peer_.lock();
        if (!peer) {
            return Err<void>(ErrorCode::Transport, "Peer channel is gone");
        }
        asio::post(io_context_, [peer, frame = std::move(frame)]() mutable {
            peer->deliver(std::move(frame));
        });
        return Ok();
    }

    void close() override {
        if (!open_) {
            return;
        }
        open_ = false;
        backlog_.clear();
        if (auto peer = peer_.lock()) {
            asio::post(io_context_, [peer] { peer->remote_closed(); });
        }
    }

private:
    void deliver(std::vector<std::uint8_t> frame) {
        if (!open_) {
            return;
        }
        if (!opened_) {
            backlog_.push_back(std::move(frame));
            return;
        }
        dispatch(std::move(frame));
    }

    void dispatch(std::vector<std::uint8_t> frame) {
        if (handlers_.on_data) {
            handlers_.on_data(std::move(frame));
        }
    }

    void remote_closed() {
        if (!open_) {
            return;
        }
        open_ = false;
        backlog_.clear();
        if (opened_ && handlers_.on_close) {
            handlers_.on_close();
        }
    }

    asio::io_context& io_context_;
    std::weak_ptr<LoopbackChannel> peer_;
    ChannelHandlers handlers_;
    std::deque<std::vector<std::uint8_t>> backlog_;  // frames that beat on_open
    bool open_ = true;
    bool opened_ = false;
};

/// Wrap handlers so nothing fires once the owning attempt is abandoned
TransportHandlers guard(TransportHandlers handlers, const std::shared_ptr<bool>& alive) {
    std::weak_ptr<bool> token = alive;
    return TransportHandlers{
        [token, f = std::move(handlers.on_ready)](std::string id) {
            auto live = token.lock();
            if (live && *live && f) {
                f(std::move(id));
            }
        },
        [token, f = std::move(handlers.on_channel)](std::shared_ptr<Channel> channel) {
            auto live = token.lock();
            if (live && *live && f) {
                f(std::move(channel));
            } else {
                channel->close();
            }
        },
        [token, f = std::move(handlers.on_error)](const Error& error) {
            auto live = token.lock();
            if (live && *live && f) {
                f(error);
            }
        },
    };
}

} // namespace

std::unique_ptr<LoopbackTransport> LoopbackHub::make_transport() {
    return std::make_unique<LoopbackTransport>(*this, next_owner_++);
}

std::string LoopbackHub::register_listener(std::uint64_t owner, TransportHandlers handlers) {
    std::string id = "peer-" + std::to_string(next_peer_++);
    listeners_[id] = Listener{owner, std::move(handlers)};
    spdlog::debug("Loopback listener registered: {}", id);
    return id;
}

void LoopbackHub::remove_listeners(std::uint64_t owner) {
    for (auto it = listeners_.begin(); it != listeners_.end();) {
        if (it->second.owner == owner) {
            it = listeners_.erase(it);
        } else {
            ++it;
        }
    }
}

void LoopbackHub::dial(std::uint64_t owner, const std::string& remote_id, TransportHandlers handlers) {
    asio::post(io_context_, [this, owner, remote_id, handlers = std::move(handlers)] {
        if (stalled_) {
            spdlog::debug("Loopback hub stalled, dropping dial to {}", remote_id);
            return;
        }

        auto it = listeners_.find(remote_id);
        if (it == listeners_.end() || it->second.owner == owner) {
            handlers.on_error(Error(ErrorCode::Transport, "Peer not found: " + remote_id));
            return;
        }

        Listener listener = std::move(it->second);
        listeners_.erase(it);

        auto [dialer_end, listener_end] = LoopbackChannel::make_pair(io_context_);
        handlers.on_ready("peer-" + std::to_string(next_peer_++));
        listener.handlers.on_channel(listener_end);
        handlers.on_channel(dialer_end);
    });
}

void LoopbackTransport::open(Role role, std::optional<std::string> remote_id, TransportHandlers handlers) {
    shutdown();
    alive_ = std::make_shared<bool>(true);
    auto guarded = guard(std::move(handlers), alive_);

    if (role == Role::Receiver) {
        const std::string id = hub_.register_listener(owner_, guarded);
        asio::post(hub_.io_context_, [on_ready = guarded.on_ready, id] { on_ready(id); });
        return;
    }

    if (!remote_id || remote_id->empty()) {
        asio::post(hub_.io_context_, [on_error = guarded.on_error] {
            on_error(Error(ErrorCode::Transport, "Sender needs a session id to dial"));
        });
        return;
    }
    hub_.dial(owner_, *remote_id, std::move(guarded));
}

void LoopbackTransport::shutdown() {
    if (alive_) {
        *alive_ = false;
    }
    hub_.remove_listeners(owner_);
}

} // namespace lexsync::network
