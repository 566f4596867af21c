#include "lexsync/sync/sync_engine.hpp"
#include "lexsync/events/log.hpp"
#include "lexsync/sync/merge.hpp"

#include <boost/asio/post.hpp>
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <type_traits>

namespace lexsync::sync {

using events::LogLevel;
using events::publish_log;

SyncEngine::SyncEngine(asio::io_context& io_context,
                       events::EventBus& bus,
                       vocab::VocabularyStore& store,
                       LastSyncStore& last_sync,
                       const ProfileProvider& profiles,
                       std::chrono::milliseconds sync_timeout)
    : io_context_(io_context)
    , bus_(bus)
    , store_(store)
    , last_sync_(last_sync)
    , profiles_(profiles)
    , sync_timeout_(sync_timeout)
    , timer_(io_context) {}

SyncEngine::~SyncEngine() {
    timer_.cancel();
}

void SyncEngine::start_sync(SyncCallback callback) {
    auto fail_async = [this, &callback](ErrorCode code, std::string message) {
        publish_log(bus_, LogLevel::Error, "Sync not started", message);
        asio::post(io_context_, [cb = std::move(callback), error = Error(code, std::move(message))] {
            cb(Err<SyncStats>(error));
        });
    };

    if (role_ != RoundRole::None || pending_) {
        fail_async(ErrorCode::SyncInProgress, "Sync already in progress");
        return;
    }
    if (link_ == nullptr) {
        fail_async(ErrorCode::NotVerified, "No verified connection");
        return;
    }

    auto request = create_sync_request();
    if (request.is_error()) {
        fail_async(request.error().code, request.error().message);
        return;
    }
    if (auto claimed = link_->begin_exchange(); claimed.is_error()) {
        fail_async(claimed.error().code, claimed.error().message);
        return;
    }

    pending_ = std::move(callback);
    begin_round(RoundRole::Initiator);
    publish_log(bus_, LogLevel::Info, "Starting sync",
                fmt::format("{} entries since {}", request.value().vocabulary_entries.size(),
                            request.value().last_sync));

    if (auto sent = link_->send_sync(request.value()); sent.is_error()) {
        finish_round(Err<SyncStats>(sent.error()));
    }
}

void SyncEngine::handle_message(const protocol::SyncMessage& message) {
    std::visit([this](const auto& m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, protocol::SyncRequest>) {
            on_request(m);
        } else if constexpr (std::is_same_v<T, protocol::SyncResponse>) {
            on_response(m);
        } else if constexpr (std::is_same_v<T, protocol::SyncComplete>) {
            on_complete(m);
        } else {
            on_remote_error(m);
        }
    }, message);
}

void SyncEngine::abort(const Error& error) {
    if (role_ == RoundRole::None) {
        return;
    }
    finish_round(Err<SyncStats>(error));
}

Result<protocol::SyncRequest> SyncEngine::create_sync_request() const {
    auto profile = profiles_.sync_profile();
    if (!profile) {
        return Err<protocol::SyncRequest>(ErrorCode::InvalidArgument, "No active sync profile");
    }

    protocol::SyncRequest request;
    request.profile = *profile;
    request.last_sync = last_sync_.load();
    request.vocabulary_entries = select_entries_since(store_.get_all(), request.last_sync);
    return Ok(std::move(request));
}

Result<void> SyncEngine::reset_sync() {
    if (auto res = last_sync_.save(0); res.is_error()) {
        return res;
    }
    publish_log(bus_, LogLevel::Info, "Sync state reset");
    if (role_ == RoundRole::None) {
        set_status(SyncStatus{});
    }
    return Ok();
}

// ──────────────────────────────────────────────────────────
// Responder side
// ──────────────────────────────────────────────────────────

void SyncEngine::on_request(const protocol::SyncRequest& request) {
    publish_log(bus_, LogLevel::Info, "Sync request received",
                fmt::format("{} entries, lastSync {}", request.vocabulary_entries.size(), request.last_sync));

    if (role_ != RoundRole::None) {
        reject_request("Sync already in progress");
        return;
    }

    const auto local = profiles_.sync_profile();
    if (!local) {
        reject_request("No active sync profile");
        set_status(SyncStatus{SyncState::Error, std::nullopt, std::string("No active sync profile")});
        return;
    }
    if (auto match = validate_profile_match(*local, request.profile); match.is_error()) {
        reject_request(match.error().message);
        set_status(SyncStatus{SyncState::Error, std::nullopt, match.error().message});
        return;
    }
    if (link_ == nullptr) {
        return;
    }
    if (auto claimed = link_->begin_exchange(); claimed.is_error()) {
        reject_request(claimed.error().message);
        return;
    }

    begin_round(RoundRole::Responder);

    // Our side of the exchange is what we had before taking theirs
    const auto outgoing = select_entries_since(store_.get_all(), last_sync_.load());

    auto merged = apply_remote(*local, request.profile, request.vocabulary_entries);
    if (merged.is_error()) {
        send_or_log(protocol::SyncError{merged.error().message});
        finish_round(std::move(merged));
        return;
    }

    responder_stats_ = merged.value();
    response_timestamp_ = now_ms();

    protocol::SyncResponse response;
    response.profile = *local;
    response.vocabulary_entries = outgoing;
    response.timestamp = response_timestamp_;
    if (auto sent = link_->send_sync(response); sent.is_error()) {
        finish_round(Err<SyncStats>(sent.error()));
    }
}

void SyncEngine::on_complete(const protocol::SyncComplete& complete) {
    if (role_ != RoundRole::Responder) {
        publish_log(bus_, LogLevel::Warning, "Unexpected sync-complete ignored");
        return;
    }

    publish_log(bus_, LogLevel::Info, "Peer finished merging",
                fmt::format("{} changes", complete.stats.total_merged));

    if (auto saved = advance_last_sync(response_timestamp_); saved.is_error()) {
        publish_log(bus_, LogLevel::Warning, "Failed to store last sync time", saved.error().message);
    }
    finish_round(Ok(responder_stats_.value_or(SyncStats{})));
}

// ──────────────────────────────────────────────────────────
// Initiator side
// ──────────────────────────────────────────────────────────

void SyncEngine::on_response(const protocol::SyncResponse& response) {
    if (role_ != RoundRole::Initiator) {
        publish_log(bus_, LogLevel::Warning, "Unexpected sync-response ignored");
        return;
    }

    publish_log(bus_, LogLevel::Info, "Sync response received",
                fmt::format("{} entries", response.vocabulary_entries.size()));

    const auto local = profiles_.sync_profile();
    if (!local) {
        send_or_log(protocol::SyncError{"No active sync profile"});
        finish_round(Err<SyncStats>(ErrorCode::InvalidArgument, "No active sync profile"));
        return;
    }

    auto merged = apply_remote(*local, response.profile, response.vocabulary_entries);
    if (merged.is_error()) {
        send_or_log(protocol::SyncError{merged.error().message});
        finish_round(std::move(merged));
        return;
    }

    if (auto saved = advance_last_sync(response.timestamp); saved.is_error()) {
        publish_log(bus_, LogLevel::Warning, "Failed to store last sync time", saved.error().message);
    }

    send_or_log(protocol::SyncComplete{merged.value(), now_ms()});
    finish_round(std::move(merged));
}

void SyncEngine::on_remote_error(const protocol::SyncError& error) {
    publish_log(bus_, LogLevel::Error, "Peer rejected sync", error.error);
    if (role_ == RoundRole::None) {
        return;
    }
    finish_round(Err<SyncStats>(ErrorCode::RemoteRejected, error.error));
}

// ──────────────────────────────────────────────────────────
// Round bookkeeping
// ──────────────────────────────────────────────────────────

void SyncEngine::begin_round(RoundRole role) {
    role_ = role;
    ++round_;
    responder_stats_.reset();
    response_timestamp_ = 0;
    set_status(SyncStatus{SyncState::Syncing, std::nullopt, std::nullopt});
    arm_timer();
}

void SyncEngine::finish_round(Result<SyncStats> result) {
    timer_.cancel();
    ++round_;
    role_ = RoundRole::None;
    responder_stats_.reset();

    if (link_ != nullptr) {
        link_->end_exchange();
    }

    if (result.is_ok()) {
        const auto& stats = result.value();
        set_status(SyncStatus{SyncState::Completed, stats, std::nullopt});
        if (stats.total_merged > 0) {
            publish_log(bus_, LogLevel::Success, "Sync complete",
                        fmt::format("added {}, updated {}", stats.remote_added, stats.local_updated));
        } else {
            publish_log(bus_, LogLevel::Success, "Sync complete", "no changes detected");
        }
    } else {
        set_status(SyncStatus{SyncState::Error, std::nullopt, result.error().message});
        publish_log(bus_, LogLevel::Error, "Sync failed", result.error().message);
    }

    if (pending_) {
        auto callback = std::move(pending_);
        pending_ = nullptr;
        asio::post(io_context_, [callback = std::move(callback), result = std::move(result)] {
            callback(result);
        });
    }
}

void SyncEngine::arm_timer() {
    timer_.expires_after(sync_timeout_);
    const auto round = round_;
    timer_.async_wait([this, round](const boost::system::error_code& ec) {
        if (ec == asio::error::operation_aborted || round != round_) {
            return;
        }
        finish_round(Err<SyncStats>(ErrorCode::SyncTimeout, "Sync timeout"));
    });
}

void SyncEngine::reject_request(const std::string& reason) {
    publish_log(bus_, LogLevel::Warning, "Sync request rejected", reason);
    send_or_log(protocol::SyncError{reason});
}

Result<SyncStats> SyncEngine::apply_remote(const SyncProfile& local_profile,
                                           const SyncProfile& remote_profile,
                                           const std::vector<vocab::VocabularyEntry>& remote_entries) {
    if (auto match = validate_profile_match(local_profile, remote_profile); match.is_error()) {
        return Err<SyncStats>(match.error());
    }

    const auto local = store_.get_all();
    auto merged = merge_entries(local, remote_entries);
    if (merged.stats.local_updated > 0 || merged.stats.remote_added > 0) {
        if (auto saved = persist(merged.entries, local); saved.is_error()) {
            return Err<SyncStats>(saved.error());
        }
    }
    return Ok(merged.stats);
}

Result<void> SyncEngine::persist(const std::vector<vocab::VocabularyEntry>& merged,
                                 const std::vector<vocab::VocabularyEntry>& original) {
    if (auto cleared = store_.clear(); cleared.is_error()) {
        return Err<void>(ErrorCode::Storage, "Failed to clear store: " + cleared.error().message);
    }
    if (auto inserted = store_.bulk_insert(merged); inserted.is_error()) {
        if (auto restored = store_.bulk_insert(original); restored.is_error()) {
            publish_log(bus_, LogLevel::Error, "Failed to restore vocabulary after failed save",
                        restored.error().message);
        }
        return Err<void>(ErrorCode::Storage, "Failed to save merged entries: " + inserted.error().message);
    }
    return Ok();
}

Result<void> SyncEngine::advance_last_sync(TimestampMs timestamp) {
    const auto current = last_sync_.load();
    const auto next = std::max(current, timestamp);
    if (next == current) {
        return Ok();
    }
    return last_sync_.save(next);
}

void SyncEngine::set_status(SyncStatus status) {
    status_ = std::move(status);
    bus_.emit(events::SyncStatusChangedEvent{status_});
}

void SyncEngine::send_or_log(const protocol::SyncMessage& message) {
    if (link_ == nullptr) {
        publish_log(bus_, LogLevel::Warning, std::string("Cannot send ") + protocol::type_name(message),
                    "no connection");
        return;
    }
    if (auto sent = link_->send_sync(message); sent.is_error()) {
        publish_log(bus_, LogLevel::Warning, std::string("Failed to send ") + protocol::type_name(message),
                    sent.error().message);
    }
}

} // namespace lexsync::sync
