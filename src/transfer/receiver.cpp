#include "lexsync/transfer/receiver.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace lexsync::transfer {

TransferReceiver::TransferReceiver(std::size_t chunk_size, std::uint64_t max_file_bytes)
    : chunk_size_(chunk_size)
    , max_file_bytes_(max_file_bytes) {
    if (chunk_size_ == 0) {
        throw std::invalid_argument("chunk_size must be positive");
    }
}

Result<TransferReceiver::Completion> TransferReceiver::on_metadata(const protocol::FileMetadata& metadata) {
    if (metadata.id.empty()) {
        return Err<Completion>(ErrorCode::Protocol, "file-metadata without id");
    }
    if (metadata.total_chunks == 0 && metadata.size != 0) {
        return Err<Completion>(ErrorCode::Integrity,
                               "File " + metadata.name + " declares " + std::to_string(metadata.size) +
                               " bytes in zero chunks");
    }
    if (metadata.size > max_file_bytes_) {
        return Err<Completion>(ErrorCode::Integrity,
                               "File " + metadata.name + " of " + std::to_string(metadata.size) +
                               " bytes exceeds the limit of " + std::to_string(max_file_bytes_));
    }
    const std::uint64_t expected = metadata.size / chunk_size_ + (metadata.size % chunk_size_ != 0 ? 1 : 0);
    if (metadata.total_chunks != expected) {
        return Err<Completion>(ErrorCode::Integrity,
                               "File " + metadata.name + " declares " + std::to_string(metadata.total_chunks) +
                               " chunks for " + std::to_string(metadata.size) + " bytes, expected " +
                               std::to_string(expected));
    }

    if (pending_.erase(metadata.id) > 0) {
        spdlog::warn("Restarting transfer of {} ({})", metadata.name, metadata.id);
    }

    auto [it, inserted] = pending_.emplace(metadata.id, PendingFile{metadata, ChunkArena(metadata.total_chunks)});
    if (it->second.arena.complete()) {
        return finish(it);
    }
    return Ok<Completion>(std::nullopt);
}

Result<TransferReceiver::Completion> TransferReceiver::on_chunk(const protocol::FileChunk& chunk) {
    auto it = pending_.find(chunk.file_id);
    if (it == pending_.end()) {
        return Err<Completion>(ErrorCode::Protocol, "Chunk for unknown file " + chunk.file_id);
    }

    auto& file = it->second;
    if (auto res = check_chunk_length(file, chunk); res.is_error()) {
        pending_.erase(it);
        return Err<Completion>(res.error());
    }
    if (auto res = file.arena.store(chunk.chunk_index, chunk.chunk); res.is_error()) {
        pending_.erase(it);
        return Err<Completion>(res.error());
    }

    if (file.arena.bytes_stored() > file.metadata.size) {
        Error error(ErrorCode::Integrity,
                    "File " + file.metadata.name + " exceeds declared size of " +
                    std::to_string(file.metadata.size) + " bytes");
        pending_.erase(it);
        return Err<Completion>(std::move(error));
    }

    if (!file.arena.complete()) {
        return Ok<Completion>(std::nullopt);
    }
    return finish(it);
}

Result<TransferReceiver::Completion> TransferReceiver::finish(
    std::unordered_map<std::string, PendingFile>::iterator it) {
    PendingFile file = std::move(it->second);
    pending_.erase(it);

    auto data = file.arena.assemble();
    if (data.size() != file.metadata.size) {
        return Err<Completion>(ErrorCode::Integrity,
                               "Size mismatch for " + file.metadata.name + ": expected " +
                               std::to_string(file.metadata.size) + ", got " +
                               std::to_string(data.size()));
    }

    return Ok<Completion>(ReceivedFile{
        file.metadata.id,
        file.metadata.name,
        file.metadata.file_type,
        std::move(data),
    });
}

Result<void> TransferReceiver::check_chunk_length(const PendingFile& file,
                                                  const protocol::FileChunk& chunk) const {
    const std::uint32_t total = file.metadata.total_chunks;
    if (chunk.chunk_index >= total) {
        return Ok(); // ChunkArena::store reports the index
    }
    const std::uint64_t expected = chunk.chunk_index + 1 < total
        ? chunk_size_
        : file.metadata.size - static_cast<std::uint64_t>(total - 1) * chunk_size_;
    if (chunk.chunk.size() != expected) {
        return Err<void>(ErrorCode::Integrity,
                         "Chunk " + std::to_string(chunk.chunk_index) + " of " + file.metadata.name +
                         " is " + std::to_string(chunk.chunk.size()) + " bytes, expected " +
                         std::to_string(expected));
    }
    return Ok();
}

bool TransferReceiver::is_pending(const std::string& file_id) const {
    return pending_.count(file_id) > 0;
}

std::optional<std::pair<std::uint32_t, std::uint32_t>> TransferReceiver::progress(const std::string& file_id) const {
    auto it = pending_.find(file_id);
    if (it == pending_.end()) {
        return std::nullopt;
    }
    return std::make_pair(it->second.arena.filled(), it->second.arena.total());
}

} // namespace lexsync::transfer
