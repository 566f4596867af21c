#include "lexsync/vocab/store.hpp"
#include "lexsync/vocab/json.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstddef>
#include <fstream>
#include <mutex>
#include <sstream>
#include <unordered_set>

namespace lexsync::vocab {
namespace fs = std::filesystem;

InMemoryVocabularyStore::InMemoryVocabularyStore(std::vector<VocabularyEntry> initial) {
    auto result = insert_locked(initial);
    if (result.is_error()) {
        spdlog::warn("Initial vocabulary rejected: {}", result.error().message);
    }
}

std::vector<VocabularyEntry> InMemoryVocabularyStore::get_all() const {
    std::shared_lock lock(mutex_);
    return entries_;
}

Result<void> InMemoryVocabularyStore::clear() {
    std::unique_lock lock(mutex_);
    entries_.clear();
    index_.clear();
    return Ok();
}

Result<void> InMemoryVocabularyStore::bulk_insert(const std::vector<VocabularyEntry>& entries) {
    std::unique_lock lock(mutex_);
    return insert_locked(entries);
}

std::size_t InMemoryVocabularyStore::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

Result<void> InMemoryVocabularyStore::insert_locked(const std::vector<VocabularyEntry>& entries) {
    // Validate the whole batch first so a rejected batch leaves nothing behind
    std::unordered_set<std::string> batch_ids;
    for (const auto& entry : entries) {
        if (entry.id.empty()) {
            return Err<void>(ErrorCode::Storage, "Vocabulary entry without id");
        }
        if (index_.count(entry.id) > 0 || !batch_ids.insert(entry.id).second) {
            return Err<void>(ErrorCode::Storage, "Duplicate vocabulary id: " + entry.id);
        }
    }

    entries_.reserve(entries_.size() + entries.size());
    for (const auto& entry : entries) {
        index_.emplace(entry.id, entries_.size());
        entries_.push_back(entry);
    }
    return Ok();
}

// ──────────────────────────────────────────────────────────
// JsonFileVocabularyStore
// ──────────────────────────────────────────────────────────

JsonFileVocabularyStore::JsonFileVocabularyStore(fs::path path)
    : path_(std::move(path)) {
}

Result<std::unique_ptr<JsonFileVocabularyStore>> JsonFileVocabularyStore::open(fs::path path) {
    std::unique_ptr<JsonFileVocabularyStore> store(new JsonFileVocabularyStore(std::move(path)));

    if (!fs::exists(store->path_)) {
        spdlog::info("Vocabulary file {} does not exist yet, starting empty", store->path_.string());
        return Ok(std::move(store));
    }

    std::ifstream input(store->path_);
    if (!input) {
        return Err<std::unique_ptr<JsonFileVocabularyStore>>(
            ErrorCode::Storage, "Failed to open vocabulary file: " + store->path_.string());
    }
    std::ostringstream contents;
    contents << input.rdbuf();

    const auto doc = nlohmann::json::parse(contents.str(), nullptr, false);
    if (doc.is_discarded() || !doc.is_array()) {
        return Err<std::unique_ptr<JsonFileVocabularyStore>>(
            ErrorCode::Storage, "Vocabulary file is not a JSON array: " + store->path_.string());
    }

    std::unique_lock lock(store->mutex_);
    auto inserted = store->insert_locked(entries_from_json(doc));
    if (inserted.is_error()) {
        return Err<std::unique_ptr<JsonFileVocabularyStore>>(inserted.error());
    }
    spdlog::info("Loaded {} vocabulary entries from {}", store->entries_.size(), store->path_.string());
    lock.unlock();

    return Ok(std::move(store));
}

Result<void> JsonFileVocabularyStore::clear() {
    std::unique_lock lock(mutex_);
    entries_.clear();
    index_.clear();
    return flush_locked();
}

Result<void> JsonFileVocabularyStore::bulk_insert(const std::vector<VocabularyEntry>& entries) {
    std::unique_lock lock(mutex_);
    const auto before = entries_.size();
    auto inserted = insert_locked(entries);
    if (inserted.is_error()) {
        return inserted;
    }

    auto flushed = flush_locked();
    if (flushed.is_error()) {
        // Memory never runs ahead of the file
        for (auto i = before; i < entries_.size(); ++i) {
            index_.erase(entries_[i].id);
        }
        entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(before), entries_.end());
    }
    return flushed;
}

Result<void> JsonFileVocabularyStore::flush_locked() const {
    const auto parent = path_.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec && !fs::exists(parent)) {
            return Err<void>(ErrorCode::Storage, "Failed to create directory: " + parent.string());
        }
    }

    // Write beside the target and rename so a crash never leaves half a file
    fs::path temp = path_;
    temp += ".tmp";
    {
        std::ofstream out(temp, std::ios::trunc);
        if (!out) {
            return Err<void>(ErrorCode::Storage, "Failed to write vocabulary file: " + temp.string());
        }
        try {
            out << entries_to_json(entries_).dump(2);
        } catch (const nlohmann::json::type_error& e) {
            out.close();
            std::error_code ignored;
            fs::remove(temp, ignored);
            return Err<void>(ErrorCode::Storage, std::string("Cannot serialize vocabulary: ") + e.what());
        }
        if (!out) {
            return Err<void>(ErrorCode::Storage, "Failed to write vocabulary file: " + temp.string());
        }
    }

    std::error_code ec;
    fs::rename(temp, path_, ec);
    if (ec) {
        return Err<void>(ErrorCode::Storage, "Failed to replace vocabulary file: " + path_.string());
    }
    return Ok();
}

} // namespace lexsync::vocab
