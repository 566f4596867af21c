#pragma once

/**
 * @file messages.hpp
 * @brief Every message that travels over a peer channel
 *
 * Each struct maps to one `type` discriminator on the wire:
 *
 *   verification-request / -response / -success / -failed   (handshake)
 *   file-metadata / file-chunk / text-content                (transfer)
 *   sync-request / sync-response / sync-complete / sync-error (sync)
 *
 * The encoding itself lives behind protocol::MessageCodec.
 */

#include "lexsync/core/clock.hpp"
#include "lexsync/sync/types.hpp"
#include "lexsync/vocab/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace lexsync::protocol {

struct VerificationRequest {
    std::string verification_code;
};

struct VerificationResponse {
    std::string verification_code;
};

struct VerificationSuccess {};

struct VerificationFailed {};

struct FileMetadata {
    std::string id;
    std::string name;
    std::uint64_t size = 0;
    std::string file_type;       ///< MIME type, may be empty
    std::uint32_t total_chunks = 0;
};

struct FileChunk {
    std::string file_id;
    std::uint32_t chunk_index = 0;
    std::vector<std::uint8_t> chunk;
};

struct TextContent {
    std::string content;
    std::optional<std::string> content_type;
    TimestampMs timestamp = 0;
};

struct SyncRequest {
    sync::SyncProfile profile;
    TimestampMs last_sync = 0;
    std::vector<vocab::VocabularyEntry> vocabulary_entries;
};

struct SyncResponse {
    sync::SyncProfile profile;
    std::vector<vocab::VocabularyEntry> vocabulary_entries;
    TimestampMs timestamp = 0;
};

struct SyncComplete {
    sync::SyncStats stats;
    TimestampMs timestamp = 0;
};

struct SyncError {
    std::string error;
};

using SyncMessage = std::variant<SyncRequest, SyncResponse, SyncComplete, SyncError>;

using Message = std::variant<
    VerificationRequest,
    VerificationResponse,
    VerificationSuccess,
    VerificationFailed,
    FileMetadata,
    FileChunk,
    TextContent,
    SyncRequest,
    SyncResponse,
    SyncComplete,
    SyncError
>;

/// Wire discriminator, e.g. "file-chunk"
const char* type_name(const Message& message);
const char* type_name(const SyncMessage& message);

/// Narrow to the sync subset; nullopt for handshake/transfer messages
std::optional<SyncMessage> as_sync_message(Message message);

Message to_message(SyncMessage message);

} // namespace lexsync::protocol
