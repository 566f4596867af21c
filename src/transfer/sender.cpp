#include "lexsync/transfer/sender.hpp"
#include "lexsync/core/clock.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <random>
#include <stdexcept>
#include <unordered_map>

namespace lexsync::transfer {
namespace fs = std::filesystem;

std::uint32_t total_chunks(std::uint64_t size, std::size_t chunk_size) {
    if (chunk_size == 0) {
        throw std::invalid_argument("chunk_size must be > 0");
    }
    return static_cast<std::uint32_t>((size + chunk_size - 1) / chunk_size);
}

std::string generate_file_id() {
    static thread_local std::mt19937_64 engine{std::random_device{}()};
    static const char alphabet[] = "abcdefghijklmnopqrstuvwxyz0123456789";
    std::uniform_int_distribution<std::size_t> dist(0, sizeof(alphabet) - 2);

    std::string suffix(9, '0');
    for (auto& c : suffix) {
        c = alphabet[dist(engine)];
    }
    return "file-" + std::to_string(now_ms()) + "-" + suffix;
}

protocol::FileMetadata make_metadata(const std::string& file_id,
                                     const OutgoingFile& file,
                                     std::size_t chunk_size) {
    protocol::FileMetadata metadata;
    metadata.id = file_id;
    metadata.name = file.name;
    metadata.size = file.data.size();
    metadata.file_type = file.mime_type;
    metadata.total_chunks = total_chunks(file.data.size(), chunk_size);
    return metadata;
}

protocol::FileChunk make_chunk(const std::string& file_id,
                               const OutgoingFile& file,
                               std::uint32_t index,
                               std::size_t chunk_size) {
    const std::size_t begin = std::min(static_cast<std::size_t>(index) * chunk_size, file.data.size());
    const std::size_t end = std::min(begin + chunk_size, file.data.size());

    protocol::FileChunk chunk;
    chunk.file_id = file_id;
    chunk.chunk_index = index;
    chunk.chunk.assign(file.data.begin() + static_cast<std::ptrdiff_t>(begin),
                       file.data.begin() + static_cast<std::ptrdiff_t>(end));
    return chunk;
}

std::string guess_mime_type(const fs::path& path) {
    static const std::unordered_map<std::string, std::string> types {
        {".txt", "text/plain"},
        {".json", "application/json"},
        {".csv", "text/csv"},
        {".html", "text/html"},
        {".pdf", "application/pdf"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".mp3", "audio/mpeg"},
        {".wav", "audio/wav"},
        {".zip", "application/zip"},
    };

    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = types.find(ext);
    return it != types.end() ? it->second : "application/octet-stream";
}

Result<OutgoingFile> load_file(const fs::path& path, std::string mime_type) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<OutgoingFile>(ErrorCode::InvalidArgument, "Failed to open file: " + path.string());
    }

    OutgoingFile file;
    file.name = path.filename().string();
    file.mime_type = mime_type.empty() ? guess_mime_type(path) : std::move(mime_type);
    file.data.assign(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
    if (input.bad()) {
        return Err<OutgoingFile>(ErrorCode::InvalidArgument, "Failed to read file: " + path.string());
    }
    return Ok(std::move(file));
}

} // namespace lexsync::transfer
