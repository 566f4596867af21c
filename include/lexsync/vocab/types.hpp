#pragma once

/**
 * @file types.hpp
 * @brief Vocabulary record as exchanged between devices
 *
 * The sync engine only looks at three things in a record: its stable id,
 * its updated_at timestamp and srs.next_review. Everything else is carried
 * along untouched so the other device ends up with the same entry.
 */

#include "lexsync/core/clock.hpp"

#include <optional>
#include <string>
#include <vector>

namespace lexsync::vocab {

/**
 * @brief Spaced-repetition scheduling state of one entry
 *
 * Computed by the scheduler outside this engine; merge only compares
 * next_review to decide which side's review progress survives.
 */
struct SrsData {
    int interval = 0;            ///< Days until next review
    int repetition = 0;          ///< Successful reviews in a row
    double efactor = 2.5;        ///< Easiness factor
    TimestampMs next_review = 0;

    bool operator==(const SrsData& other) const {
        return interval == other.interval && repetition == other.repetition &&
               efactor == other.efactor && next_review == other.next_review;
    }
    bool operator!=(const SrsData& other) const { return !(*this == other); }
};

struct VocabularyEntry {
    std::string id;
    std::string word;
    std::string translation;
    std::optional<std::string> pronunciation;   ///< IPA notation
    std::optional<std::string> audio_url;
    std::optional<std::string> part_of_speech;
    std::vector<std::string> definitions;
    std::vector<std::string> example_sentences;
    std::vector<std::string> tags;
    std::optional<std::string> notes;
    int difficulty = 1;                         ///< 1..5
    TimestampMs created_at = 0;
    TimestampMs updated_at = 0;
    std::optional<TimestampMs> last_reviewed_at;
    SrsData srs;

    bool operator==(const VocabularyEntry& other) const {
        return id == other.id && word == other.word && translation == other.translation &&
               pronunciation == other.pronunciation && audio_url == other.audio_url &&
               part_of_speech == other.part_of_speech && definitions == other.definitions &&
               example_sentences == other.example_sentences && tags == other.tags &&
               notes == other.notes && difficulty == other.difficulty &&
               created_at == other.created_at && updated_at == other.updated_at &&
               last_reviewed_at == other.last_reviewed_at && srs == other.srs;
    }
    bool operator!=(const VocabularyEntry& other) const { return !(*this == other); }
};

} // namespace lexsync::vocab
