#pragma once

#include "lexsync/core/clock.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace lexsync::sync {

/**
 * @brief Identity of the vocabulary set taking part in a sync
 *
 * Two profiles are compatible when the language pair matches exactly;
 * id and name are informational.
 */
struct SyncProfile {
    std::string profile_id;
    std::string profile_name;
    std::string source_language;
    std::string target_language;
};

/**
 * @brief Counters produced by one merge, shown to the user
 *
 * - local_added:   reserved, never incremented by merge
 * - local_updated: incoming record was newer and replaced ours
 * - remote_added:  incoming record did not exist here
 * - remote_updated: our record was newer; the peer needs ours
 * - total_merged:  sum of the three counters above
 */
struct SyncStats {
    std::size_t local_added = 0;
    std::size_t local_updated = 0;
    std::size_t remote_added = 0;
    std::size_t remote_updated = 0;
    std::size_t total_merged = 0;

    bool operator==(const SyncStats& other) const {
        return local_added == other.local_added && local_updated == other.local_updated &&
               remote_added == other.remote_added && remote_updated == other.remote_updated &&
               total_merged == other.total_merged;
    }
};

enum class SyncState {
    Idle,
    Syncing,
    Completed,
    Error
};

inline const char* to_string(SyncState state) {
    switch (state) {
        case SyncState::Idle: return "idle";
        case SyncState::Syncing: return "syncing";
        case SyncState::Completed: return "completed";
        case SyncState::Error: return "error";
    }
    return "unknown";
}

struct SyncStatus {
    SyncState state = SyncState::Idle;
    std::optional<SyncStats> stats;
    std::optional<std::string> error;
};

} // namespace lexsync::sync
