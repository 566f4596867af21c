#pragma once

#include "lexsync/vocab/types.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <vector>

namespace lexsync::vocab {

// camelCase field names, matching the records the web client stores
void to_json(nlohmann::json& j, const SrsData& srs);
void to_json(nlohmann::json& j, const VocabularyEntry& entry);

/**
 * @brief Lenient decode of one record
 *
 * Only `id` is mandatory (a non-empty string); any other missing or
 * mistyped field falls back to its default.
 *
 * @return nullopt when the record has no usable id
 */
std::optional<VocabularyEntry> entry_from_json(const nlohmann::json& j);

/**
 * @brief Decode an array of records, skipping the ones without an id
 */
std::vector<VocabularyEntry> entries_from_json(const nlohmann::json& array);

nlohmann::json entries_to_json(const std::vector<VocabularyEntry>& entries);

} // namespace lexsync::vocab
