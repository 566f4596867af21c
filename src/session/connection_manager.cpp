#include "lexsync/session/connection_manager.hpp"
#include "lexsync/events/log.hpp"
#include "lexsync/transfer/sender.hpp"

#include <boost/asio/post.hpp>
#include <spdlog/fmt/fmt.h>

#include <stdexcept>
#include <type_traits>

namespace lexsync::session {

using events::LogLevel;

ConnectionManager::ConnectionManager(asio::io_context& io_context,
                                     events::EventBus& bus,
                                     network::Transport& transport,
                                     const protocol::MessageCodec& codec,
                                     EngineConfig config)
    : io_context_(io_context)
    , bus_(bus)
    , transport_(transport)
    , codec_(codec)
    , config_(std::move(config))
    , connect_timer_(io_context)
    , idle_timer_(io_context)
    , send_timer_(io_context)
    , receiver_(config_.chunk_size, config_.max_file_bytes) {}

ConnectionManager::~ConnectionManager() {
    alive_.reset();
    connect_timer_.cancel();
    idle_timer_.cancel();
    send_timer_.cancel();
    transport_.shutdown();
    if (channel_) {
        channel_->close();
    }
}

// ──────────────────────────────────────────────────────────
// Public API
// ──────────────────────────────────────────────────────────

void ConnectionManager::connect(Role role, std::optional<std::string> session_id, ConnectCallback callback) {
    if (session_.state() != ConnectionState::Disconnected) {
        teardown(Error(ErrorCode::Transport, "Superseded by a new connection"));
        set_state(ConnectionState::Disconnected);
    }

    ++generation_;
    session_.reset(role);
    files_.clear();
    local_id_.clear();

    if (role == Role::Sender && (!session_id || session_id->empty())) {
        session_.set_error("Session id required to connect as sender");
        log(LogLevel::Error, "Cannot connect", "Session id required to connect as sender");
        asio::post(io_context_, [cb = std::move(callback)] {
            cb(Err<std::string>(ErrorCode::InvalidArgument, "Session id required to connect as sender"));
        });
        return;
    }

    if (session_id) {
        session_.set_session_id(*session_id);
    }
    connect_callback_ = std::move(callback);
    set_state(ConnectionState::Connecting);
    log(LogLevel::Info, "Starting connection", std::string("role: ") + to_string(role));

    connect_timer_.expires_after(config_.connect_timeout);
    connect_timer_.async_wait(guarded([this](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        log(LogLevel::Warning, "Connection timed out",
            fmt::format("no channel after {} ms", config_.connect_timeout.count()));
        fail_session(ErrorCode::ConnectionTimeout, "Connection timeout");
    }));

    network::TransportHandlers handlers{
        guarded([this](std::string id) { on_transport_ready(id); }),
        guarded([this](std::shared_ptr<network::Channel> channel) { on_channel(std::move(channel)); }),
        guarded([this](const Error& error) {
            log(LogLevel::Error, "Connection failed", error.message);
            fail_session(ErrorCode::Transport, error.message);
        }),
    };
    transport_.open(role, std::move(session_id), std::move(handlers));
}

bool ConnectionManager::submit_verification_code(const std::string& code) {
    if (!is_valid_verification_code(code)) {
        log(LogLevel::Error, "Invalid verification code format", "Code must be 6 digits");
        session_.set_error("Please enter a valid 6-digit code");
        return false;
    }
    if (!channel_ || !channel_->is_open()) {
        log(LogLevel::Error, "Cannot submit verification code", "no open connection");
        session_.set_error("No active connection");
        return false;
    }

    if (auto sent = send_message(protocol::VerificationResponse{code}); sent.is_error()) {
        log(LogLevel::Error, "Failed to submit verification code", sent.error().message);
        session_.set_error("Failed to submit verification code");
        return false;
    }
    log(LogLevel::Info, "Verification code submitted", "Waiting for confirmation");
    session_.clear_error();
    return true;
}

void ConnectionManager::send_files(std::vector<transfer::OutgoingFile> files, SendCallback callback) {
    auto reject = [this, &callback](Error error) {
        session_.set_error(error.message);
        log(LogLevel::Error, "Cannot send files", error.message);
        if (callback) {
            asio::post(io_context_, [cb = std::move(callback), error = std::move(error)] {
                cb(Err<void>(error));
            });
        }
    };

    if (auto ready = check_ready_to_send(); ready.is_error()) {
        if (session_.state() == ConnectionState::Transferring) {
            reject(Error(ErrorCode::Busy, "Another transfer is in progress"));
        } else {
            reject(ready.error());
        }
        return;
    }
    if (batch_ || sync_active_) {
        reject(Error(ErrorCode::Busy, "Another transfer is in progress"));
        return;
    }
    if (files.empty()) {
        if (callback) {
            asio::post(io_context_, [cb = std::move(callback)] { cb(Ok()); });
        }
        return;
    }

    batch_ = OutgoingBatch{};
    batch_->files = std::move(files);
    batch_->callback = std::move(callback);
    refresh_transfer_state();
    log(LogLevel::Info, fmt::format("Sending {} file(s)", batch_->files.size()));
    start_file();
}

Result<void> ConnectionManager::send_text(const std::string& text, const std::string& content_type) {
    if (auto ready = check_ready_to_send(); ready.is_error()) {
        session_.set_error(ready.error().message);
        return ready;
    }

    log(LogLevel::Info, "Sending text content");
    protocol::TextContent message{text, content_type, now_ms()};
    if (auto sent = send_message(message); sent.is_error()) {
        log(LogLevel::Error, "Failed to send text", sent.error().message);
        session_.set_error("Failed to send content");
        return sent;
    }
    log(LogLevel::Success, "Text content sent successfully");
    return Ok();
}

Result<void> ConnectionManager::send_message(const protocol::Message& message) {
    if (!channel_) {
        throw std::logic_error("send_message called without a connection");
    }

    auto frame = codec_.encode(message);
    if (frame.is_error()) {
        return Err<void>(frame.error());
    }
    if (frame.value().size() > config_.max_message_bytes) {
        return Err<void>(ErrorCode::Protocol,
                         fmt::format("{} of {} bytes exceeds max_message_bytes",
                                     protocol::type_name(message), frame.value().size()));
    }
    return channel_->send(std::move(frame.value()));
}

void ConnectionManager::disconnect() {
    const bool was_active = session_.state() != ConnectionState::Disconnected;
    teardown(Error(ErrorCode::Transport, "Disconnected"));
    session_.clear_error();
    if (was_active) {
        set_state(ConnectionState::Disconnected);
        log(LogLevel::Info, "Disconnected");
    }
}

ConnectionSnapshot ConnectionManager::snapshot() const {
    ConnectionSnapshot snap;
    snap.connection_state = session_.state();
    snap.files = files_;
    snap.error = session_.error();
    snap.verification_code = session_.verification_code();
    snap.is_verified = session_.is_verified();
    snap.session_id = session_.session_id();
    snap.role = session_.role();
    return snap;
}

// ──────────────────────────────────────────────────────────
// SyncLink
// ──────────────────────────────────────────────────────────

Result<void> ConnectionManager::send_sync(const protocol::SyncMessage& message) {
    const auto state = session_.state();
    if (!channel_ || !session_.is_verified() ||
        (state != ConnectionState::Connected && state != ConnectionState::Transferring)) {
        return Err<void>(ErrorCode::NotVerified, "Connection not verified yet");
    }
    log(LogLevel::Info, std::string("Sending sync message: ") + protocol::type_name(message));
    return send_message(protocol::to_message(message));
}

Result<void> ConnectionManager::begin_exchange() {
    const auto state = session_.state();
    if (!session_.is_verified() ||
        (state != ConnectionState::Connected && state != ConnectionState::Transferring)) {
        return Err<void>(ErrorCode::NotVerified, "No active connection. Please verify the connection first.");
    }
    if (sync_active_) {
        return Err<void>(ErrorCode::SyncInProgress, "Sync already in progress");
    }
    if (batch_) {
        return Err<void>(ErrorCode::Busy, "File transfer in progress");
    }
    sync_active_ = true;
    refresh_transfer_state();
    return Ok();
}

void ConnectionManager::end_exchange() {
    if (!sync_active_) {
        return;
    }
    sync_active_ = false;
    refresh_transfer_state();
}

// ──────────────────────────────────────────────────────────
// Transport / channel events
// ──────────────────────────────────────────────────────────

void ConnectionManager::on_transport_ready(const std::string& local_id) {
    local_id_ = local_id;
    if (session_.role() == Role::Sender) {
        log(LogLevel::Info, "Transport ready", local_id);
        return;
    }

    connect_timer_.cancel();
    session_.set_session_id(local_id);
    set_state(ConnectionState::Waiting);
    log(LogLevel::Success, "Receiver ready, waiting for sender connection", local_id);
    settle_connect(Ok(local_id));
}

void ConnectionManager::on_channel(std::shared_ptr<network::Channel> channel) {
    if (channel_) {
        log(LogLevel::Warning, "Rejecting additional peer connection");
        channel->close();
        return;
    }

    channel_ = std::move(channel);
    log(LogLevel::Success,
        session_.role() == Role::Receiver ? "Sender connected" : "Data connection established");

    channel_->start(network::ChannelHandlers{
        guarded([this] { on_channel_open(); }),
        guarded([this](std::vector<std::uint8_t> frame) { on_channel_data(frame); }),
        guarded([this] {
            log(LogLevel::Info, "Connection closed");
            fail_session(ErrorCode::Transport, "Connection closed");
        }),
        guarded([this](const Error& error) {
            log(LogLevel::Error, "Connection error", error.message);
            fail_session(ErrorCode::Transport, error.message);
        }),
    });
}

void ConnectionManager::on_channel_open() {
    connect_timer_.cancel();
    log(LogLevel::Success, "Data channel open");
    set_state(ConnectionState::Verifying);
    session_.clear_error();
    reset_idle_timer();

    if (session_.role() == Role::Receiver) {
        log(LogLevel::Info, "Waiting for verification code");
        return;
    }

    const std::string code = generate_verification_code();
    session_.set_verification_code(code);
    bus_.emit(events::VerificationCodeEvent{code, Role::Sender});
    log(LogLevel::Info, "Verification code generated", "Code: " + code);

    if (auto sent = send_message(protocol::VerificationRequest{code}); sent.is_error()) {
        log(LogLevel::Error, "Failed to send verification request", sent.error().message);
    }
    settle_connect(Ok(local_id_));
}

void ConnectionManager::on_channel_data(const std::vector<std::uint8_t>& frame) {
    reset_idle_timer();

    auto decoded = codec_.decode(frame);
    if (decoded.is_error()) {
        log(LogLevel::Error, "Failed to decode message", decoded.error().message);
        return;
    }
    dispatch(decoded.value());
}

// ──────────────────────────────────────────────────────────
// Inbound dispatch
// ──────────────────────────────────────────────────────────

void ConnectionManager::dispatch(const protocol::Message& message) {
    const char* type = protocol::type_name(message);

    if (auto sync_message = protocol::as_sync_message(message)) {
        if (!session_.is_verified()) {
            log(LogLevel::Error, "Sync message received before verification", type);
            return;
        }
        log(LogLevel::Info, std::string("Sync message received: ") + type);
        if (sync_handler_) {
            sync_handler_(*sync_message);
        } else {
            log(LogLevel::Warning, "No sync handler registered", type);
        }
        return;
    }

    std::visit([this, type](const auto& m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, protocol::VerificationRequest>) {
            on_verification_request(m);
        } else if constexpr (std::is_same_v<T, protocol::VerificationResponse>) {
            on_verification_response(m);
        } else if constexpr (std::is_same_v<T, protocol::VerificationSuccess>) {
            on_verification_success();
        } else if constexpr (std::is_same_v<T, protocol::VerificationFailed>) {
            on_verification_failed();
        } else if constexpr (std::is_same_v<T, protocol::FileMetadata> ||
                             std::is_same_v<T, protocol::FileChunk> ||
                             std::is_same_v<T, protocol::TextContent>) {
            if (!session_.is_verified()) {
                log(LogLevel::Error, std::string(type) + " received before verification");
                return;
            }
            if constexpr (std::is_same_v<T, protocol::FileMetadata>) {
                on_file_metadata(m);
            } else if constexpr (std::is_same_v<T, protocol::FileChunk>) {
                on_file_chunk(m);
            } else {
                on_text(m);
            }
        }
    }, message);
}

void ConnectionManager::on_verification_request(const protocol::VerificationRequest& message) {
    if (session_.role() != Role::Receiver) {
        log(LogLevel::Warning, "Ignoring verification request sent to the sender");
        return;
    }
    session_.set_verification_code(message.verification_code);
    bus_.emit(events::VerificationCodeEvent{message.verification_code, Role::Receiver});
    log(LogLevel::Info, "Verification code received", "Waiting for user to confirm");
}

void ConnectionManager::on_verification_response(const protocol::VerificationResponse& message) {
    if (session_.role() != Role::Sender) {
        log(LogLevel::Warning, "Ignoring verification response sent to the receiver");
        return;
    }
    if (session_.is_verified()) {
        log(LogLevel::Info, "Duplicate verification response ignored");
        return;
    }

    const auto& expected = session_.verification_code();
    log(LogLevel::Info, "Received verification response");

    if (expected && message.verification_code == *expected) {
        if (!verify_session()) {
            return;
        }
        log(LogLevel::Success, "Receiver verified the connection");
        if (auto sent = send_message(protocol::VerificationSuccess{}); sent.is_error()) {
            log(LogLevel::Error, "Failed to send verification success", sent.error().message);
        }
        return;
    }

    log(LogLevel::Error, "Receiver entered incorrect code",
        fmt::format("Expected: {}, Got: {}", expected.value_or(""), message.verification_code));
    session_.set_error("Receiver verification failed - incorrect code");
    if (auto sent = send_message(protocol::VerificationFailed{}); sent.is_error()) {
        log(LogLevel::Error, "Failed to send verification failure", sent.error().message);
        return;
    }
    log(LogLevel::Info, "Sent verification failure to receiver");
}

void ConnectionManager::on_verification_success() {
    if (session_.role() != Role::Receiver || session_.is_verified()) {
        return;
    }
    if (verify_session()) {
        log(LogLevel::Success, "Verification successful");
    }
}

void ConnectionManager::on_verification_failed() {
    if (session_.role() != Role::Receiver) {
        return;
    }
    log(LogLevel::Error, "Verification failed - incorrect code entered");
    session_.set_error("Verification failed - please check the code and try again");
}

void ConnectionManager::on_file_metadata(const protocol::FileMetadata& message) {
    transfer::FileTransfer tracked;
    tracked.id = message.id;
    tracked.name = message.name;
    tracked.size = message.size;
    tracked.mime_type = message.file_type;
    tracked.total_chunks = message.total_chunks;
    tracked.status = transfer::TransferStatus::Transferring;
    tracked.direction = transfer::TransferDirection::Incoming;

    auto registered = receiver_.on_metadata(message);
    if (registered.is_error()) {
        tracked.status = transfer::TransferStatus::Error;
        tracked.error = registered.error().message;
    }

    if (auto* existing = find_file(message.id)) {
        *existing = tracked;
    } else {
        track_file(tracked);
    }

    if (registered.is_error()) {
        log(LogLevel::Error, "Rejected file " + message.name, registered.error().message);
        bus_.emit(events::FileTransferFailedEvent{message.id, message.name, registered.error().message});
        return;
    }

    log(LogLevel::Info, "Receiving: " + message.name,
        fmt::format("{:.2f} MB, {} chunks", static_cast<double>(message.size) / 1024.0 / 1024.0,
                    message.total_chunks));

    if (registered.value()) {
        complete_incoming(std::move(*registered.value()));
    }
    refresh_transfer_state();
}

void ConnectionManager::on_file_chunk(const protocol::FileChunk& message) {
    auto stored = receiver_.on_chunk(message);
    auto* tracked = find_file(message.file_id);

    if (stored.is_error()) {
        if (stored.fails_with(ErrorCode::Protocol)) {
            log(LogLevel::Warning, "Chunk for unknown file ignored", message.file_id);
            return;
        }
        const std::string name = tracked ? tracked->name : message.file_id;
        if (tracked) {
            tracked->status = transfer::TransferStatus::Error;
            tracked->error = stored.error().message;
        }
        log(LogLevel::Error, "File transfer failed: " + name, stored.error().message);
        bus_.emit(events::FileTransferFailedEvent{message.file_id, name, stored.error().message});
        refresh_transfer_state();
        return;
    }

    if (stored.value()) {
        if (tracked) {
            log(LogLevel::Info, "File chunk progress: " + tracked->name,
                fmt::format("{}/{} chunks (100.0%)", tracked->total_chunks, tracked->total_chunks));
        }
        complete_incoming(std::move(*stored.value()));
    } else if (tracked) {
        if (auto counts = receiver_.progress(message.file_id)) {
            tracked->chunks_done = counts->first;
            tracked->progress = 100.0 * counts->first / counts->second;
            publish_progress(*tracked);
            if (counts->first % 10 == 0) {
                log(LogLevel::Info, "File chunk progress: " + tracked->name,
                    fmt::format("{}/{} chunks ({:.1f}%)", counts->first, counts->second, tracked->progress));
            }
        }
    }
    refresh_transfer_state();
}

void ConnectionManager::complete_incoming(transfer::ReceivedFile file) {
    if (auto* tracked = find_file(file.id)) {
        tracked->chunks_done = tracked->total_chunks;
        tracked->progress = 100.0;
        tracked->status = transfer::TransferStatus::Completed;
        publish_progress(*tracked);
    }
    log(LogLevel::Success, fmt::format("Received: {} ({} bytes)", file.name, file.data.size()));
    bus_.emit(events::FileReceivedEvent{std::move(file)});
}

void ConnectionManager::on_text(const protocol::TextContent& message) {
    if (message.content.empty()) {
        log(LogLevel::Warning, "Empty text content ignored");
        return;
    }
    bus_.emit(events::TextReceivedEvent{message.content, message.content_type, message.timestamp});
    log(LogLevel::Success, "Text content received",
        fmt::format("{} characters, type: {}", message.content.size(), message.content_type.value_or("text")));
}

// ──────────────────────────────────────────────────────────
// Outgoing batch chain
// ──────────────────────────────────────────────────────────

void ConnectionManager::start_file() {
    auto& batch = *batch_;
    const auto& file = batch.files[batch.file_index];
    batch.file_id = transfer::generate_file_id();
    batch.next_chunk = 0;
    batch.total_chunks = transfer::total_chunks(file.data.size(), config_.chunk_size);

    transfer::FileTransfer tracked;
    tracked.id = batch.file_id;
    tracked.name = file.name;
    tracked.size = file.data.size();
    tracked.mime_type = file.mime_type;
    tracked.total_chunks = batch.total_chunks;
    tracked.status = transfer::TransferStatus::Transferring;
    tracked.direction = transfer::TransferDirection::Outgoing;
    track_file(tracked);

    log(LogLevel::Info,
        fmt::format("Sending: {} ({}/{})", file.name, batch.file_index + 1, batch.files.size()),
        fmt::format("{:.2f} MB", static_cast<double>(file.data.size()) / 1024.0 / 1024.0));

    if (auto sent = send_message(transfer::make_metadata(batch.file_id, file, config_.chunk_size));
        sent.is_error()) {
        file_failed(sent.error());
        return;
    }

    if (batch.total_chunks == 0) {
        if (auto* t = find_file(batch.file_id)) {
            t->progress = 100.0;
            t->status = transfer::TransferStatus::Completed;
            publish_progress(*t);
        }
        file_sent();
        return;
    }
    send_next_chunk();
}

void ConnectionManager::send_next_chunk() {
    auto& batch = *batch_;
    const auto& file = batch.files[batch.file_index];
    const std::uint32_t index = batch.next_chunk;

    if (auto sent = send_message(transfer::make_chunk(batch.file_id, file, index, config_.chunk_size));
        sent.is_error()) {
        file_failed(sent.error());
        return;
    }

    const std::uint32_t done = index + 1;
    if (auto* t = find_file(batch.file_id)) {
        t->chunks_done = done;
        t->progress = 100.0 * done / batch.total_chunks;
        if (done == batch.total_chunks) {
            t->status = transfer::TransferStatus::Completed;
        }
        publish_progress(*t);
        if (done % 10 == 0 || done == batch.total_chunks) {
            log(LogLevel::Info, "Chunk progress: " + file.name,
                fmt::format("{}/{} chunks ({:.1f}%)", done, batch.total_chunks, t->progress));
        }
    }
    reset_idle_timer();

    batch.next_chunk = done;
    if (batch.next_chunk < batch.total_chunks) {
        schedule(config_.chunk_yield, [this] { send_next_chunk(); });
    } else {
        file_sent();
    }
}

void ConnectionManager::file_sent() {
    log(LogLevel::Success, "Sent: " + batch_->files[batch_->file_index].name);
    advance_batch();
}

void ConnectionManager::file_failed(const Error& error) {
    auto& batch = *batch_;
    const std::string name = batch.files[batch.file_index].name;
    ++batch.failures;

    if (auto* t = find_file(batch.file_id)) {
        t->status = transfer::TransferStatus::Error;
        t->error = error.message;
    }
    log(LogLevel::Error, "Failed to send: " + name, error.message);
    bus_.emit(events::FileTransferFailedEvent{batch.file_id, name, error.message});

    if (!channel_ || !channel_->is_open()) {
        finish_batch(Err<void>(ErrorCode::Transport, "Connection lost during transfer"));
        return;
    }
    advance_batch();
}

void ConnectionManager::advance_batch() {
    auto& batch = *batch_;
    ++batch.file_index;
    if (batch.file_index < batch.files.size()) {
        schedule(config_.inter_file_delay, [this] { start_file(); });
        return;
    }

    if (batch.failures == 0) {
        finish_batch(Ok());
    } else {
        finish_batch(Err<void>(ErrorCode::Transport,
                               fmt::format("{} of {} files failed", batch.failures, batch.files.size())));
    }
}

void ConnectionManager::finish_batch(Result<void> result) {
    if (!batch_) {
        return;
    }
    auto callback = std::move(batch_->callback);
    batch_.reset();
    send_timer_.cancel();
    refresh_transfer_state();

    if (result.is_error()) {
        session_.set_error("Failed to send files");
        log(LogLevel::Error, "Transfer failed", result.error().message);
    }
    if (callback) {
        asio::post(io_context_, [callback = std::move(callback), result = std::move(result)] {
            callback(result);
        });
    }
}

void ConnectionManager::schedule(std::chrono::milliseconds delay, std::function<void()> step) {
    send_timer_.expires_after(delay);
    send_timer_.async_wait(guarded([this, step = std::move(step)](const boost::system::error_code& ec) {
        if (ec || !batch_) {
            return;
        }
        step();
    }));
}

// ──────────────────────────────────────────────────────────
// Session plumbing
// ──────────────────────────────────────────────────────────

Result<void> ConnectionManager::check_ready_to_send() const {
    if (session_.state() != ConnectionState::Connected) {
        return Err<void>(ErrorCode::NotVerified, "No active connection. Please verify the connection first.");
    }
    if (!session_.is_verified()) {
        return Err<void>(ErrorCode::NotVerified, "Connection not verified yet");
    }
    return Ok();
}

void ConnectionManager::set_state(ConnectionState next) {
    const auto previous = session_.state();
    if (previous == next) {
        return;
    }
    if (auto moved = session_.transition_to(next); moved.is_error()) {
        log(LogLevel::Warning, "Ignored state change", moved.error().message);
        return;
    }
    announce(previous);
}

void ConnectionManager::announce(ConnectionState previous) {
    bus_.emit(events::ConnectionStateChangedEvent{previous, session_.state(), session_.error()});
    log(LogLevel::Info, "Connection state changed",
        fmt::format("{} -> {}", to_string(previous), to_string(session_.state())));
}

bool ConnectionManager::verify_session() {
    const auto previous = session_.state();
    if (auto verified = session_.mark_verified(); verified.is_error()) {
        log(LogLevel::Warning, "Verification ignored", verified.error().message);
        return false;
    }
    announce(previous);
    return true;
}

void ConnectionManager::refresh_transfer_state() {
    const auto state = session_.state();
    if (state != ConnectionState::Connected && state != ConnectionState::Transferring) {
        return;
    }
    const bool busy = batch_.has_value() || sync_active_ || receiver_.pending_count() > 0;
    set_state(busy ? ConnectionState::Transferring : ConnectionState::Connected);
}

void ConnectionManager::reset_idle_timer() {
    idle_timer_.expires_after(config_.idle_timeout);
    idle_timer_.async_wait(guarded([this](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        if (session_.state() == ConnectionState::Transferring) {
            reset_idle_timer();
            return;
        }
        log(LogLevel::Warning, "Session timed out",
            fmt::format("idle for {} ms", config_.idle_timeout.count()));
        fail_session(ErrorCode::SessionTimeout, "Session timed out");
    }));
}

void ConnectionManager::fail_session(ErrorCode code, const std::string& message) {
    if (session_.state() == ConnectionState::Disconnected) {
        return;
    }
    teardown(Error(code, message));
    session_.set_error(message);
    set_state(ConnectionState::Disconnected);
}

void ConnectionManager::teardown(const Error& reason) {
    ++generation_;
    connect_timer_.cancel();
    idle_timer_.cancel();
    send_timer_.cancel();
    transport_.shutdown();

    if (channel_) {
        channel_->close();
        channel_.reset();
    }
    receiver_.clear();

    for (auto& file : files_) {
        if (file.status == transfer::TransferStatus::Pending ||
            file.status == transfer::TransferStatus::Transferring) {
            file.status = transfer::TransferStatus::Error;
            file.error = reason.message;
        }
    }

    if (batch_) {
        auto callback = std::move(batch_->callback);
        batch_.reset();
        if (callback) {
            asio::post(io_context_, [callback = std::move(callback), reason] {
                callback(Err<void>(reason));
            });
        }
    }
    sync_active_ = false;
    settle_connect(Err<std::string>(reason));
}

void ConnectionManager::settle_connect(Result<std::string> result) {
    if (!connect_callback_) {
        return;
    }
    auto callback = std::move(connect_callback_);
    connect_callback_ = nullptr;
    asio::post(io_context_, [callback = std::move(callback), result = std::move(result)] {
        callback(result);
    });
}

void ConnectionManager::log(LogLevel level, std::string message, std::optional<std::string> detail) {
    events::publish_log(bus_, level, std::move(message), std::move(detail));
}

transfer::FileTransfer* ConnectionManager::find_file(const std::string& id) {
    for (auto& file : files_) {
        if (file.id == id) {
            return &file;
        }
    }
    return nullptr;
}

void ConnectionManager::track_file(transfer::FileTransfer file) {
    files_.push_back(std::move(file));

    // In-flight entries are never dropped
    for (auto it = files_.begin(); files_.size() > kFileHistory && it != files_.end();) {
        if (it->status == transfer::TransferStatus::Completed || it->status == transfer::TransferStatus::Error) {
            it = files_.erase(it);
        } else {
            ++it;
        }
    }
}

void ConnectionManager::publish_progress(const transfer::FileTransfer& file) {
    bus_.emit(events::FileProgressEvent{file});
}

} // namespace lexsync::session
