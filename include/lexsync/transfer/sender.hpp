#pragma once

#include "lexsync/core/result.hpp"
#include "lexsync/protocol/messages.hpp"
#include "lexsync/transfer/types.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace lexsync::transfer {

/**
 * @brief ceil(size / chunk_size); zero for an empty file
 *
 * @throws std::invalid_argument if chunk_size is 0
 */
std::uint32_t total_chunks(std::uint64_t size, std::size_t chunk_size);

/// "file-<epoch ms>-<random>", unique enough for one session
std::string generate_file_id();

protocol::FileMetadata make_metadata(const std::string& file_id,
                                     const OutgoingFile& file,
                                     std::size_t chunk_size);

/// Slice `index` of the file; the last slice may be short
protocol::FileChunk make_chunk(const std::string& file_id,
                               const OutgoingFile& file,
                               std::uint32_t index,
                               std::size_t chunk_size);

/**
 * @brief Read a file from disk for sending
 *
 * The MIME type is guessed from the extension when not given.
 */
Result<OutgoingFile> load_file(const std::filesystem::path& path, std::string mime_type = {});

std::string guess_mime_type(const std::filesystem::path& path);

} // namespace lexsync::transfer
