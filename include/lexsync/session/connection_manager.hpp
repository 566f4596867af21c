#pragma once

/**
 * @file connection_manager.hpp
 * @brief Owns the one peer channel of a device
 *
 * RESPONSIBILITIES:
 * - Drive the session state machine and the sender-arbitrated code check
 * - Bound connection setup (connect_timeout) and idleness (idle_timeout)
 * - Decode inbound frames and route them: handshake here, files and text
 *   to the transfer receiver, sync messages to the registered handler
 * - Chunk outgoing files and pace them with an async timer chain
 *
 * Everything that happens is published on the EventBus; callers that
 * started an operation additionally get a Result.
 *
 * THREADING:
 * Not thread-safe. All calls and callbacks on the io_context thread.
 */

#include "lexsync/core/config.hpp"
#include "lexsync/core/result.hpp"
#include "lexsync/core/role.hpp"
#include "lexsync/events/event_bus.hpp"
#include "lexsync/events/events.hpp"
#include "lexsync/network/channel.hpp"
#include "lexsync/protocol/codec.hpp"
#include "lexsync/session/session.hpp"
#include "lexsync/sync/sync_engine.hpp"
#include "lexsync/transfer/receiver.hpp"
#include "lexsync/transfer/types.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lexsync::session {

namespace asio = boost::asio;

struct ConnectionSnapshot {
    ConnectionState connection_state = ConnectionState::Disconnected;
    std::vector<transfer::FileTransfer> files;
    std::optional<std::string> error;
    std::optional<std::string> verification_code;
    bool is_verified = false;
    std::optional<std::string> session_id;
    Role role = Role::Receiver;
};

class ConnectionManager : public sync::SyncLink {
public:
    using ConnectCallback = std::function<void(Result<std::string>)>;
    using SendCallback = std::function<void(Result<void>)>;
    using SyncHandler = std::function<void(const protocol::SyncMessage&)>;

    /// Transfers listed by snapshot(); older finished ones are dropped first
    static constexpr std::size_t kFileHistory = 32;

    ConnectionManager(asio::io_context& io_context,
                      events::EventBus& bus,
                      network::Transport& transport,
                      const protocol::MessageCodec& codec,
                      EngineConfig config);

    ~ConnectionManager() override;

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /**
     * @brief Tear down any current session and start a new one
     *
     * Receiver: callback gets the published session id once the transport
     * is ready. Sender: `session_id` is required; callback gets the local
     * id once the channel opens. Fails with ConnectionTimeout, Transport
     * or InvalidArgument.
     */
    void connect(Role role, std::optional<std::string> session_id, ConnectCallback callback);

    /**
     * @brief Send the code the user typed as verification-response
     *
     * @return false (and records an error) unless code is six digits and
     *         a channel is open
     */
    bool submit_verification_code(const std::string& code);

    /**
     * @brief Send files back to back, fire-and-forget per file
     *
     * Requires a verified, connected session (NotVerified otherwise) and
     * no other batch or sync round (Busy). A file that fails is marked
     * error and the batch moves on; the callback reports whether every
     * file went out.
     */
    void send_files(std::vector<transfer::OutgoingFile> files, SendCallback callback = {});

    Result<void> send_text(const std::string& text, const std::string& content_type = "text");

    /**
     * @brief Encode and send one message as is
     *
     * @throws std::logic_error if no channel was ever established
     */
    Result<void> send_message(const protocol::Message& message);

    /// Receives every sync message from a verified peer
    void set_sync_handler(SyncHandler handler) { sync_handler_ = std::move(handler); }

    /// Drop the session; state becomes disconnected with no error
    void disconnect();

    [[nodiscard]] ConnectionSnapshot snapshot() const;
    [[nodiscard]] ConnectionState state() const noexcept { return session_.state(); }
    [[nodiscard]] bool is_verified() const noexcept { return session_.is_verified(); }
    [[nodiscard]] Role role() const noexcept { return session_.role(); }
    [[nodiscard]] const std::optional<std::string>& error() const noexcept { return session_.error(); }
    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

    // sync::SyncLink
    Result<void> send_sync(const protocol::SyncMessage& message) override;
    Result<void> begin_exchange() override;
    void end_exchange() override;

private:
    struct OutgoingBatch {
        std::vector<transfer::OutgoingFile> files;
        std::size_t file_index = 0;
        std::string file_id;
        std::uint32_t next_chunk = 0;
        std::uint32_t total_chunks = 0;
        std::size_t failures = 0;
        SendCallback callback;
    };

    // Transport / channel events
    void on_transport_ready(const std::string& local_id);
    void on_channel(std::shared_ptr<network::Channel> channel);
    void on_channel_open();
    void on_channel_data(const std::vector<std::uint8_t>& frame);

    // Inbound dispatch
    void dispatch(const protocol::Message& message);
    void on_verification_request(const protocol::VerificationRequest& message);
    void on_verification_response(const protocol::VerificationResponse& message);
    void on_verification_success();
    void on_verification_failed();
    void on_file_metadata(const protocol::FileMetadata& message);
    void on_file_chunk(const protocol::FileChunk& message);
    void on_text(const protocol::TextContent& message);
    void complete_incoming(transfer::ReceivedFile file);

    // Outgoing batch chain
    void start_file();
    void send_next_chunk();
    void file_sent();
    void file_failed(const Error& error);
    void advance_batch();
    void finish_batch(Result<void> result);
    void schedule(std::chrono::milliseconds delay, std::function<void()> step);

    // Session plumbing
    Result<void> check_ready_to_send() const;
    void set_state(ConnectionState next);
    void announce(ConnectionState previous);
    bool verify_session();
    void refresh_transfer_state();
    void reset_idle_timer();
    void fail_session(ErrorCode code, const std::string& message);
    void teardown(const Error& reason);
    void settle_connect(Result<std::string> result);
    void log(events::LogLevel level, std::string message, std::optional<std::string> detail = std::nullopt);
    transfer::FileTransfer* find_file(const std::string& id);
    void track_file(transfer::FileTransfer file);
    void publish_progress(const transfer::FileTransfer& file);

    /// Wrap a callback so it is dropped once this session is replaced
    template<typename F>
    auto guarded(F f) {
        return [token = std::weak_ptr<bool>(alive_), generation = generation_, this, f = std::move(f)](auto&&... args) {
            if (token.expired() || generation != generation_) {
                return;
            }
            f(std::forward<decltype(args)>(args)...);
        };
    }

    asio::io_context& io_context_;
    events::EventBus& bus_;
    network::Transport& transport_;
    const protocol::MessageCodec& codec_;
    EngineConfig config_;

    Session session_;
    std::shared_ptr<network::Channel> channel_;
    std::string local_id_;
    asio::steady_timer connect_timer_;
    asio::steady_timer idle_timer_;
    asio::steady_timer send_timer_;
    ConnectCallback connect_callback_;
    SyncHandler sync_handler_;

    transfer::TransferReceiver receiver_;
    std::vector<transfer::FileTransfer> files_;
    std::optional<OutgoingBatch> batch_;
    bool sync_active_ = false;

    std::uint64_t generation_ = 0;
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

} // namespace lexsync::session
