#include "lexsync/app/peer_node.hpp"
#include "lexsync/network/loopback_transport.hpp"

#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace lexsync;
using namespace std::chrono_literals;
using lexsync::app::PeerNode;
using lexsync::app::PeerNodeOptions;
using lexsync::session::ConnectionState;
using lexsync::sync::SyncState;
using lexsync::sync::SyncStats;
using lexsync::vocab::VocabularyEntry;

namespace {

VocabularyEntry record(const std::string& id, TimestampMs updated_at) {
    VocabularyEntry entry;
    entry.id = id;
    entry.word = "word-" + id;
    entry.translation = "translation-" + id;
    entry.updated_at = updated_at;
    return entry;
}

std::vector<std::string> ids(const vocab::VocabularyStore& store) {
    std::vector<std::string> out;
    for (const auto& e : store.get_all()) {
        out.push_back(e.id);
    }
    return out;
}

/// Stores and node of one device
struct Device {
    Device(boost::asio::io_context& io, network::LoopbackHub& hub,
           std::vector<VocabularyEntry> entries, PeerNodeOptions options = {})
        : transport(hub.make_transport())
        , store(std::move(entries))
        , profiles(sync::SyncProfile{"p1", "Spanish", "en", "es"})
        , node(io, *transport, store, last_sync, profiles, test_config(), std::move(options)) {
        code_sub = node.bus().subscribe<events::VerificationCodeEvent>(
            [this](const events::VerificationCodeEvent& e) { code = e.code; });
    }

    static EngineConfig test_config() {
        EngineConfig config;
        config.connect_timeout = 500ms;
        config.sync_timeout = 2s;
        config.chunk_yield = 0ms;
        config.inter_file_delay = 1ms;
        return config;
    }

    std::unique_ptr<network::LoopbackTransport> transport;
    vocab::InMemoryVocabularyStore store;
    sync::InMemoryLastSyncStore last_sync;
    sync::FixedProfileProvider profiles;
    PeerNode node;
    std::optional<std::string> code;
    events::Subscription code_sub;
};

template <typename Pred>
bool run_until(boost::asio::io_context& io, Pred done) {
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (!done() && std::chrono::steady_clock::now() < deadline) {
        io.run_for(5ms);
        io.restart();
    }
    return done();
}

/// Listen, dial and confirm the code on the receiver
bool connect_and_verify(boost::asio::io_context& io, Device& receiver, Device& sender) {
    std::optional<Result<std::string>> listening;
    receiver.node.listen([&](Result<std::string> r) { listening = std::move(r); });
    if (!run_until(io, [&] { return listening.has_value(); }) || listening->is_error()) {
        return false;
    }

    sender.node.dial(listening->value(), [](Result<std::string>) {});
    if (!run_until(io, [&] { return receiver.code.has_value(); })) {
        return false;
    }
    if (!receiver.node.connection().submit_verification_code(*receiver.code)) {
        return false;
    }
    return run_until(io, [&] {
        return sender.node.connection().is_verified() && receiver.node.connection().is_verified();
    });
}

} // namespace

TEST(PeerNodeTest, AutoSyncMergesBothVocabularies) {
    boost::asio::io_context io;
    network::LoopbackHub hub(io);

    std::optional<Result<SyncStats>> outcome;
    PeerNodeOptions options;
    options.auto_sync = true;
    options.on_auto_sync = [&](Result<SyncStats> r) { outcome = std::move(r); };

    Device receiver(io, hub, {record("b", 20)});
    Device sender(io, hub, {record("a", 10)}, std::move(options));

    ASSERT_TRUE(connect_and_verify(io, receiver, sender));
    ASSERT_EQ(*sender.code, *receiver.code);

    ASSERT_TRUE(run_until(io, [&] {
        return outcome.has_value() && receiver.node.engine().status().state == SyncState::Completed;
    }));
    ASSERT_TRUE(outcome->is_ok()) << outcome->error().message;
    EXPECT_EQ(outcome->value().remote_added, 1u);

    EXPECT_EQ(ids(sender.store), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(ids(receiver.store), (std::vector<std::string>{"b", "a"}));
    ASSERT_TRUE(receiver.node.engine().status().stats.has_value());
    EXPECT_EQ(receiver.node.engine().status().stats->remote_added, 1u);

    EXPECT_GT(sender.last_sync.load(), 0);
    EXPECT_EQ(sender.last_sync.load(), receiver.last_sync.load());

    // The round releases the channel on both ends
    ASSERT_TRUE(run_until(io, [&] {
        return sender.node.connection().state() == ConnectionState::Connected &&
               receiver.node.connection().state() == ConnectionState::Connected;
    }));
}

TEST(PeerNodeTest, ManualSyncFromReceiver) {
    boost::asio::io_context io;
    network::LoopbackHub hub(io);
    Device receiver(io, hub, {record("b", 20), record("shared", 5)});
    Device sender(io, hub, {record("a", 10), record("shared", 50)});

    ASSERT_TRUE(connect_and_verify(io, receiver, sender));

    std::optional<Result<SyncStats>> outcome;
    receiver.node.sync([&](Result<SyncStats> r) { outcome = std::move(r); });
    ASSERT_TRUE(run_until(io, [&] { return outcome.has_value(); }));
    ASSERT_TRUE(outcome->is_ok()) << outcome->error().message;

    // "a" is new here, the sender's newer "shared" replaces ours
    EXPECT_EQ(outcome->value().remote_added, 1u);
    EXPECT_EQ(outcome->value().local_updated, 1u);
    EXPECT_EQ(outcome->value().local_added, 0u);
    EXPECT_EQ(outcome->value().total_merged, 2u);
    for (const auto& entry : receiver.store.get_all()) {
        if (entry.id == "shared") {
            EXPECT_EQ(entry.updated_at, 50);
        }
    }
    EXPECT_EQ(receiver.store.size(), 3u);
}

TEST(PeerNodeTest, SyncBeforeVerificationFails) {
    boost::asio::io_context io;
    network::LoopbackHub hub(io);
    Device sender(io, hub, {record("a", 10)});

    std::optional<Result<SyncStats>> outcome;
    sender.node.sync([&](Result<SyncStats> r) { outcome = std::move(r); });
    ASSERT_TRUE(run_until(io, [&] { return outcome.has_value(); }));

    ASSERT_TRUE(outcome->is_error());
    EXPECT_EQ(outcome->error().code, ErrorCode::NotVerified);
    EXPECT_EQ(ids(sender.store), (std::vector<std::string>{"a"}));
}

TEST(PeerNodeTest, DisconnectAbortsPendingSync) {
    boost::asio::io_context io;
    network::LoopbackHub hub(io);
    Device receiver(io, hub, {record("b", 20)});
    Device sender(io, hub, {record("a", 10)});
    ASSERT_TRUE(connect_and_verify(io, receiver, sender));

    std::optional<Result<SyncStats>> outcome;
    sender.node.sync([&](Result<SyncStats> r) { outcome = std::move(r); });
    ASSERT_TRUE(sender.node.engine().is_syncing());
    sender.node.disconnect();

    ASSERT_TRUE(run_until(io, [&] { return outcome.has_value(); }));
    ASSERT_TRUE(outcome->is_error());
    EXPECT_EQ(outcome->error().code, ErrorCode::Transport);
    EXPECT_FALSE(sender.node.engine().is_syncing());
    EXPECT_EQ(ids(sender.store), (std::vector<std::string>{"a"}));
    EXPECT_EQ(sender.last_sync.load(), 0);

    ASSERT_TRUE(run_until(io, [&] {
        return receiver.node.connection().state() == ConnectionState::Disconnected;
    }));
}
