#pragma once

#include "lexsync/sync/types.hpp"
#include "lexsync/vocab/types.hpp"

#include <vector>

namespace lexsync::sync {

struct MergeResult {
    std::vector<vocab::VocabularyEntry> entries;  ///< full merged set
    SyncStats stats;
};

/**
 * @brief Merge the peer's records into the local set
 *
 * Per id: missing locally -> insert; equal updated_at -> keep local;
 * incoming newer -> take incoming, but keep whichever srs has the later
 * next_review; local newer -> keep local. Nothing is ever removed.
 * Local order is preserved, new ids are appended in incoming order.
 */
MergeResult merge_entries(const std::vector<vocab::VocabularyEntry>& local,
                          const std::vector<vocab::VocabularyEntry>& remote);

/**
 * @brief Records changed after `since`, or all of them if none qualify
 *
 * The all-records fallback covers a stale or corrupted lastSync value
 * (e.g. a clock that was set into the future).
 */
std::vector<vocab::VocabularyEntry> select_entries_since(
    const std::vector<vocab::VocabularyEntry>& entries, TimestampMs since);

} // namespace lexsync::sync
