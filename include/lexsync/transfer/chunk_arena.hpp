#pragma once

#include "lexsync/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace lexsync::transfer {

/**
 * @brief Fixed set of chunk slots addressed by index
 *
 * Sized once from the declared chunk count. Chunks may arrive in any
 * order; a repeated index replaces the slot without counting twice.
 * complete() only turns true when every slot holds data.
 */
class ChunkArena {
public:
    explicit ChunkArena(std::uint32_t total_chunks);

    /// Integrity error when index is outside [0, total)
    Result<void> store(std::uint32_t index, std::vector<std::uint8_t> bytes);

    [[nodiscard]] bool has(std::uint32_t index) const;
    [[nodiscard]] bool complete() const noexcept { return filled_ == slots_.size(); }
    [[nodiscard]] std::uint32_t filled() const noexcept { return filled_; }
    [[nodiscard]] std::uint32_t total() const noexcept { return static_cast<std::uint32_t>(slots_.size()); }
    [[nodiscard]] std::uint64_t bytes_stored() const noexcept { return bytes_; }

    /// Missing slot indices, ascending
    [[nodiscard]] std::vector<std::uint32_t> missing() const;

    /**
     * @brief Concatenate slots in index order
     *
     * @throws std::logic_error if called before complete()
     */
    [[nodiscard]] std::vector<std::uint8_t> assemble() const;

private:
    std::vector<std::optional<std::vector<std::uint8_t>>> slots_;
    std::uint32_t filled_ = 0;
    std::uint64_t bytes_ = 0;
};

} // namespace lexsync::transfer
