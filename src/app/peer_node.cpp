#include "lexsync/app/peer_node.hpp"
#include "lexsync/events/log.hpp"

#include <boost/asio/post.hpp>

namespace lexsync::app {

using events::LogLevel;
using session::ConnectionState;

PeerNode::PeerNode(asio::io_context& io_context,
                   network::Transport& transport,
                   vocab::VocabularyStore& store,
                   sync::LastSyncStore& last_sync,
                   const sync::ProfileProvider& profiles,
                   EngineConfig config,
                   PeerNodeOptions options)
    : io_context_(io_context)
    , connection_(io_context, bus_, transport, codec_, config)
    , engine_(io_context, bus_, store, last_sync, profiles, config.sync_timeout)
    , options_(std::move(options)) {
    engine_.attach(&connection_);
    connection_.set_sync_handler([this](const protocol::SyncMessage& message) {
        engine_.handle_message(message);
    });
    state_subscription_ = bus_.subscribe<events::ConnectionStateChangedEvent>(
        [this](const events::ConnectionStateChangedEvent& event) { on_state_changed(event); });
}

PeerNode::~PeerNode() {
    alive_.reset();
    state_subscription_.unsubscribe();
    connection_.set_sync_handler({});
    engine_.attach(nullptr);
}

void PeerNode::listen(session::ConnectionManager::ConnectCallback callback) {
    connection_.connect(Role::Receiver, std::nullopt, std::move(callback));
}

void PeerNode::dial(const std::string& session_id, session::ConnectionManager::ConnectCallback callback) {
    connection_.connect(Role::Sender, session_id, std::move(callback));
}

void PeerNode::on_state_changed(const events::ConnectionStateChangedEvent& event) {
    if (event.current == ConnectionState::Disconnected) {
        engine_.abort(Error(ErrorCode::Transport, event.error.value_or("Connection closed")));
        return;
    }

    if (event.previous == ConnectionState::Verifying && event.current == ConnectionState::Connected &&
        options_.auto_sync && connection_.role() == Role::Sender) {
        // verification-success must reach the peer before the sync request
        asio::post(io_context_, [this, token = std::weak_ptr<bool>(alive_)] {
            if (!token.expired()) {
                run_auto_sync();
            }
        });
    }
}

void PeerNode::run_auto_sync() {
    events::publish_log(bus_, LogLevel::Info, "Starting automatic sync");
    engine_.start_sync([this, token = std::weak_ptr<bool>(alive_)](Result<sync::SyncStats> result) {
        if (token.expired()) {
            return;
        }
        if (result.is_error()) {
            events::publish_log(bus_, LogLevel::Warning, "Automatic sync failed", result.error().message);
        }
        if (options_.on_auto_sync) {
            options_.on_auto_sync(std::move(result));
        }
    });
}

} // namespace lexsync::app
