#include "lexsync/transfer/chunk_arena.hpp"

#include <stdexcept>
#include <string>

namespace lexsync::transfer {

ChunkArena::ChunkArena(std::uint32_t total_chunks)
    : slots_(total_chunks) {}

Result<void> ChunkArena::store(std::uint32_t index, std::vector<std::uint8_t> bytes) {
    if (index >= slots_.size()) {
        return Err<void>(ErrorCode::Integrity,
                         "Chunk index " + std::to_string(index) + " out of range (total " +
                         std::to_string(slots_.size()) + ")");
    }

    auto& slot = slots_[index];
    if (slot) {
        bytes_ -= slot->size();
    } else {
        ++filled_;
    }
    bytes_ += bytes.size();
    slot = std::move(bytes);
    return Ok();
}

bool ChunkArena::has(std::uint32_t index) const {
    return index < slots_.size() && slots_[index].has_value();
}

std::vector<std::uint32_t> ChunkArena::missing() const {
    std::vector<std::uint32_t> result;
    for (std::uint32_t i = 0; i < slots_.size(); ++i) {
        if (!slots_[i]) {
            result.push_back(i);
        }
    }
    return result;
}

std::vector<std::uint8_t> ChunkArena::assemble() const {
    if (!complete()) {
        throw std::logic_error("ChunkArena::assemble called with missing chunks");
    }
    std::vector<std::uint8_t> out;
    out.reserve(static_cast<std::size_t>(bytes_));
    for (const auto& slot : slots_) {
        out.insert(out.end(), slot->begin(), slot->end());
    }
    return out;
}

} // namespace lexsync::transfer
