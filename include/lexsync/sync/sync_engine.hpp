#pragma once

/**
 * @file sync_engine.hpp
 * @brief Request/response vocabulary sync over a verified connection
 *
 * ROUND TRIP:
 *   initiator                         responder
 *   sync-request{profile, lastSync, entries} ->
 *                                     validate profile, merge, persist
 *                  <- sync-response{profile, entries, timestamp}
 *   validate, merge, persist
 *   sync-complete{stats, timestamp} ->
 *
 * Both sides then store lastSync = max(lastSync, response timestamp).
 * A profile mismatch or a busy engine answers with sync-error and leaves
 * storage untouched.
 *
 * THREADING:
 * Single io_context thread. Callbacks and events fire on that thread.
 */

#include "lexsync/core/result.hpp"
#include "lexsync/events/event_bus.hpp"
#include "lexsync/protocol/messages.hpp"
#include "lexsync/sync/last_sync_store.hpp"
#include "lexsync/sync/profile.hpp"
#include "lexsync/sync/types.hpp"
#include "lexsync/vocab/store.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>

namespace lexsync::sync {

namespace asio = boost::asio;

/**
 * @brief What the engine needs from the connection it runs over
 */
class SyncLink {
public:
    virtual ~SyncLink() = default;

    /// NotVerified when the session cannot carry sync traffic
    virtual Result<void> send_sync(const protocol::SyncMessage& message) = 0;

    /// Claim the channel for one round; Busy if a file batch holds it
    virtual Result<void> begin_exchange() = 0;

    virtual void end_exchange() = 0;
};

class SyncEngine {
public:
    using SyncCallback = std::function<void(Result<SyncStats>)>;

    SyncEngine(asio::io_context& io_context,
               events::EventBus& bus,
               vocab::VocabularyStore& store,
               LastSyncStore& last_sync,
               const ProfileProvider& profiles,
               std::chrono::milliseconds sync_timeout);

    ~SyncEngine();

    SyncEngine(const SyncEngine&) = delete;
    SyncEngine& operator=(const SyncEngine&) = delete;

    /// nullptr detaches; a detached engine refuses to start
    void attach(SyncLink* link) { link_ = link; }

    /**
     * @brief Run one round as initiator
     *
     * The callback fires exactly once: with the merge stats after the
     * response was applied, or with SyncInProgress, NotVerified,
     * ProfileMismatch, RemoteRejected, SyncTimeout, Storage or Transport.
     */
    void start_sync(SyncCallback callback);

    /// Feed one verified inbound sync message
    void handle_message(const protocol::SyncMessage& message);

    /// Settle whatever is in flight (connection lost)
    void abort(const Error& error);

    /// Entries changed since lastSync, or every entry if none changed
    Result<protocol::SyncRequest> create_sync_request() const;

    Result<void> reset_sync();

    [[nodiscard]] TimestampMs last_sync_time() const { return last_sync_.load(); }
    [[nodiscard]] bool is_syncing() const noexcept { return role_ != RoundRole::None; }
    [[nodiscard]] const SyncStatus& status() const noexcept { return status_; }

private:
    enum class RoundRole { None, Initiator, Responder };

    void on_request(const protocol::SyncRequest& request);
    void on_response(const protocol::SyncResponse& response);
    void on_complete(const protocol::SyncComplete& complete);
    void on_remote_error(const protocol::SyncError& error);

    void begin_round(RoundRole role);
    void finish_round(Result<SyncStats> result);
    void arm_timer();
    void reject_request(const std::string& reason);

    Result<SyncStats> apply_remote(const SyncProfile& local_profile,
                                   const SyncProfile& remote_profile,
                                   const std::vector<vocab::VocabularyEntry>& remote_entries);
    Result<void> persist(const std::vector<vocab::VocabularyEntry>& merged,
                         const std::vector<vocab::VocabularyEntry>& original);
    Result<void> advance_last_sync(TimestampMs timestamp);

    void set_status(SyncStatus status);
    void send_or_log(const protocol::SyncMessage& message);

    asio::io_context& io_context_;
    events::EventBus& bus_;
    vocab::VocabularyStore& store_;
    LastSyncStore& last_sync_;
    const ProfileProvider& profiles_;
    std::chrono::milliseconds sync_timeout_;

    SyncLink* link_ = nullptr;
    asio::steady_timer timer_;
    std::uint64_t round_ = 0;           // bumps per round, stale timers compare against it
    RoundRole role_ = RoundRole::None;
    SyncCallback pending_;              // initiator's single pending slot
    std::optional<SyncStats> responder_stats_;
    TimestampMs response_timestamp_ = 0;
    SyncStatus status_;
};

} // namespace lexsync::sync
