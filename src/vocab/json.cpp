#include "lexsync/vocab/json.hpp"

#include <spdlog/spdlog.h>

#include <cmath>

namespace lexsync::vocab {
namespace {

using json = nlohmann::json;

std::string string_or(const json& j, const char* key, const std::string& fallback = {}) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return fallback;
    }
    return it->get<std::string>();
}

std::optional<std::string> optional_string(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

// Timestamps come from Date.now() on the web client; accept floats too.
std::optional<std::int64_t> optional_int(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) {
        return std::nullopt;
    }
    if (it->is_number_float()) {
        return static_cast<std::int64_t>(std::llround(it->get<double>()));
    }
    return it->get<std::int64_t>();
}

std::vector<std::string> string_list(const json& j, const char* key) {
    std::vector<std::string> out;
    auto it = j.find(key);
    if (it == j.end() || !it->is_array()) {
        return out;
    }
    for (const auto& item : *it) {
        if (item.is_string()) {
            out.push_back(item.get<std::string>());
        }
    }
    return out;
}

SrsData srs_from_json(const json& j) {
    SrsData srs;
    if (!j.is_object()) {
        return srs;
    }
    srs.interval = static_cast<int>(optional_int(j, "interval").value_or(0));
    srs.repetition = static_cast<int>(optional_int(j, "repetition").value_or(0));
    auto efactor = j.find("efactor");
    if (efactor != j.end() && efactor->is_number()) {
        srs.efactor = efactor->get<double>();
    }
    srs.next_review = optional_int(j, "nextReview").value_or(0);
    return srs;
}

} // namespace

void to_json(json& j, const SrsData& srs) {
    j = json{
        {"interval", srs.interval},
        {"repetition", srs.repetition},
        {"efactor", srs.efactor},
        {"nextReview", srs.next_review},
    };
}

void to_json(json& j, const VocabularyEntry& entry) {
    j = json{
        {"id", entry.id},
        {"word", entry.word},
        {"translation", entry.translation},
        {"definitions", entry.definitions},
        {"exampleSentences", entry.example_sentences},
        {"tags", entry.tags},
        {"difficulty", entry.difficulty},
        {"createdAt", entry.created_at},
        {"updatedAt", entry.updated_at},
        {"srsData", entry.srs},
    };
    if (entry.pronunciation) j["pronunciation"] = *entry.pronunciation;
    if (entry.audio_url) j["audioUrl"] = *entry.audio_url;
    if (entry.part_of_speech) j["partOfSpeech"] = *entry.part_of_speech;
    if (entry.notes) j["notes"] = *entry.notes;
    if (entry.last_reviewed_at) j["lastReviewedAt"] = *entry.last_reviewed_at;
}

std::optional<VocabularyEntry> entry_from_json(const json& j) {
    if (!j.is_object()) {
        return std::nullopt;
    }
    VocabularyEntry entry;
    entry.id = string_or(j, "id");
    if (entry.id.empty()) {
        return std::nullopt;
    }
    entry.word = string_or(j, "word");
    entry.translation = string_or(j, "translation");
    entry.pronunciation = optional_string(j, "pronunciation");
    entry.audio_url = optional_string(j, "audioUrl");
    entry.part_of_speech = optional_string(j, "partOfSpeech");
    entry.definitions = string_list(j, "definitions");
    entry.example_sentences = string_list(j, "exampleSentences");
    entry.tags = string_list(j, "tags");
    entry.notes = optional_string(j, "notes");
    entry.difficulty = static_cast<int>(optional_int(j, "difficulty").value_or(1));
    entry.created_at = optional_int(j, "createdAt").value_or(0);
    entry.updated_at = optional_int(j, "updatedAt").value_or(0);
    entry.last_reviewed_at = optional_int(j, "lastReviewedAt");
    if (auto srs = j.find("srsData"); srs != j.end()) {
        entry.srs = srs_from_json(*srs);
    }
    return entry;
}

std::vector<VocabularyEntry> entries_from_json(const json& array) {
    std::vector<VocabularyEntry> entries;
    if (!array.is_array()) {
        return entries;
    }
    entries.reserve(array.size());
    std::size_t skipped = 0;
    for (const auto& item : array) {
        if (auto entry = entry_from_json(item)) {
            entries.push_back(std::move(*entry));
        } else {
            ++skipped;
        }
    }
    if (skipped > 0) {
        spdlog::warn("Skipped {} vocabulary record(s) without an id", skipped);
    }
    return entries;
}

json entries_to_json(const std::vector<VocabularyEntry>& entries) {
    json array = json::array();
    for (const auto& entry : entries) {
        array.push_back(entry);
    }
    return array;
}

} // namespace lexsync::vocab
