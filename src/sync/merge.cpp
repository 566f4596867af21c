#include "lexsync/sync/merge.hpp"

#include <string>
#include <unordered_map>

namespace lexsync::sync {
namespace {

using vocab::VocabularyEntry;

// Incoming wins field by field, except optional fields it leaves unset.
VocabularyEntry take_newer(const VocabularyEntry& local, const VocabularyEntry& remote) {
    VocabularyEntry merged = remote;
    if (!merged.pronunciation) merged.pronunciation = local.pronunciation;
    if (!merged.audio_url) merged.audio_url = local.audio_url;
    if (!merged.part_of_speech) merged.part_of_speech = local.part_of_speech;
    if (!merged.notes) merged.notes = local.notes;
    if (!merged.last_reviewed_at) merged.last_reviewed_at = local.last_reviewed_at;

    // Review progress is never rolled back by an older schedule
    merged.srs = remote.srs.next_review > local.srs.next_review ? remote.srs : local.srs;
    return merged;
}

} // namespace

MergeResult merge_entries(const std::vector<VocabularyEntry>& local,
                          const std::vector<VocabularyEntry>& remote) {
    MergeResult result;
    std::unordered_map<std::string, std::size_t> slots;  // id -> index in result.entries

    result.entries.reserve(local.size() + remote.size());
    for (const auto& entry : local) {
        if (entry.id.empty()) {
            continue;
        }
        auto [it, inserted] = slots.emplace(entry.id, result.entries.size());
        if (inserted) {
            result.entries.push_back(entry);
        } else {
            result.entries[it->second] = entry;
        }
    }

    auto& stats = result.stats;
    for (const auto& incoming : remote) {
        if (incoming.id.empty()) {
            continue;
        }

        auto it = slots.find(incoming.id);
        if (it == slots.end()) {
            slots.emplace(incoming.id, result.entries.size());
            result.entries.push_back(incoming);
            ++stats.remote_added;
            ++stats.total_merged;
            continue;
        }

        auto& current = result.entries[it->second];
        if (incoming.updated_at > current.updated_at) {
            current = take_newer(current, incoming);
            ++stats.local_updated;
            ++stats.total_merged;
        } else if (current.updated_at > incoming.updated_at) {
            ++stats.remote_updated;
            ++stats.total_merged;
        }
    }

    return result;
}

std::vector<VocabularyEntry> select_entries_since(const std::vector<VocabularyEntry>& entries,
                                                  TimestampMs since) {
    std::vector<VocabularyEntry> selected;
    for (const auto& entry : entries) {
        if (entry.updated_at > since) {
            selected.push_back(entry);
        }
    }
    if (selected.empty()) {
        return entries;
    }
    return selected;
}

} // namespace lexsync::sync
