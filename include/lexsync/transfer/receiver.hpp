#pragma once

#include "lexsync/core/result.hpp"
#include "lexsync/protocol/messages.hpp"
#include "lexsync/transfer/chunk_arena.hpp"
#include "lexsync/transfer/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace lexsync::transfer {

/**
 * @brief Reassembles incoming chunk streams into files
 *
 * One ChunkArena per announced file. A file is handed out exactly once,
 * when its last slot fills and the joined length equals the declared size.
 * Any integrity failure drops that file only; a gap keeps it pending until
 * clear().
 *
 * Both peers slice with the same chunk size, so the declared chunk count
 * must equal ceil(size / chunk_size) and every chunk but the last must be
 * exactly chunk_size bytes long.
 */
class TransferReceiver {
public:
    using Completion = std::optional<ReceivedFile>;

    static constexpr std::size_t kDefaultChunkSize = 8192;
    static constexpr std::uint64_t kDefaultMaxFileBytes = 1024ull * 1024 * 1024;

    explicit TransferReceiver(std::size_t chunk_size = kDefaultChunkSize,
                              std::uint64_t max_file_bytes = kDefaultMaxFileBytes);

    /**
     * @brief Register a file announced by file-metadata
     *
     * A zero-byte file with zero chunks completes immediately. Re-announcing
     * a known id restarts that file.
     *
     * @return Integrity when the size exceeds the file limit or the chunk
     *         count does not match the size
     */
    Result<Completion> on_metadata(const protocol::FileMetadata& metadata);

    /**
     * @brief Store one chunk
     *
     * @return the finished file when this chunk completed it, nullopt while
     *         slots are still empty, Protocol for an unknown file id,
     *         Integrity for a bad index, a chunk of the wrong length or a
     *         size mismatch
     */
    Result<Completion> on_chunk(const protocol::FileChunk& chunk);

    [[nodiscard]] bool is_pending(const std::string& file_id) const;
    [[nodiscard]] std::size_t pending_count() const noexcept { return pending_.size(); }

    /// Received/total for a pending file
    [[nodiscard]] std::optional<std::pair<std::uint32_t, std::uint32_t>> progress(const std::string& file_id) const;

    /// Drop every partial file (session reset)
    void clear() { pending_.clear(); }

private:
    struct PendingFile {
        protocol::FileMetadata metadata;
        ChunkArena arena;
    };

    Result<Completion> finish(std::unordered_map<std::string, PendingFile>::iterator it);
    Result<void> check_chunk_length(const PendingFile& file, const protocol::FileChunk& chunk) const;

    std::size_t chunk_size_;
    std::uint64_t max_file_bytes_;
    std::unordered_map<std::string, PendingFile> pending_;
};

} // namespace lexsync::transfer
