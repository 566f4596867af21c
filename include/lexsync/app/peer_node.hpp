#pragma once

/**
 * @file peer_node.hpp
 * @brief One device: a connection, a sync engine and their collaborators
 *
 * The node owns its own EventBus, so two nodes on one io_context (the
 * loopback tests, a demo) never see each other's events. Transport and
 * stores are injected and must outlive the node.
 *
 * WIRING:
 * - the connection manager is the engine's SyncLink
 * - verified sync messages go straight to SyncEngine::handle_message
 * - a drop to disconnected aborts any sync round in flight
 * - with auto_sync, the sender starts one round right after verification
 */

#include "lexsync/core/config.hpp"
#include "lexsync/events/event_bus.hpp"
#include "lexsync/events/events.hpp"
#include "lexsync/network/channel.hpp"
#include "lexsync/protocol/codec.hpp"
#include "lexsync/session/connection_manager.hpp"
#include "lexsync/sync/last_sync_store.hpp"
#include "lexsync/sync/profile.hpp"
#include "lexsync/sync/sync_engine.hpp"
#include "lexsync/vocab/store.hpp"

#include <boost/asio/io_context.hpp>

#include <memory>
#include <optional>
#include <string>

namespace lexsync::app {

namespace asio = boost::asio;

struct PeerNodeOptions {
    bool auto_sync = false;
    /// Receives the outcome of an automatic round; failures are logged either way
    sync::SyncEngine::SyncCallback on_auto_sync;
};

class PeerNode {
public:
    PeerNode(asio::io_context& io_context,
             network::Transport& transport,
             vocab::VocabularyStore& store,
             sync::LastSyncStore& last_sync,
             const sync::ProfileProvider& profiles,
             EngineConfig config,
             PeerNodeOptions options = {});

    ~PeerNode();

    PeerNode(const PeerNode&) = delete;
    PeerNode& operator=(const PeerNode&) = delete;

    /// Publish a session id and wait for a sender
    void listen(session::ConnectionManager::ConnectCallback callback);

    /// Dial a receiver's session id
    void dial(const std::string& session_id, session::ConnectionManager::ConnectCallback callback);

    void sync(sync::SyncEngine::SyncCallback callback) { engine_.start_sync(std::move(callback)); }

    void disconnect() { connection_.disconnect(); }

    [[nodiscard]] events::EventBus& bus() noexcept { return bus_; }
    [[nodiscard]] session::ConnectionManager& connection() noexcept { return connection_; }
    [[nodiscard]] sync::SyncEngine& engine() noexcept { return engine_; }

private:
    void on_state_changed(const events::ConnectionStateChangedEvent& event);
    void run_auto_sync();

    asio::io_context& io_context_;
    events::EventBus bus_;
    protocol::JsonCodec codec_;
    session::ConnectionManager connection_;
    sync::SyncEngine engine_;
    PeerNodeOptions options_;
    events::Subscription state_subscription_;
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

} // namespace lexsync::app
