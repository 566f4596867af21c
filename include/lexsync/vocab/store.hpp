#pragma once

/**
 * @file store.hpp
 * @brief Record store the sync engine reads from and writes merged sets to
 *
 * WHY THIS FILE EXISTS:
 * The canonical vocabulary lives in the application's persistent store.
 * The engine only needs three operations from it: read everything, wipe,
 * and insert a batch. Sync persists a merge as clear() + bulk_insert().
 *
 * IMPLEMENTATIONS:
 * - InMemoryVocabularyStore: tests and embedding
 * - JsonFileVocabularyStore: one JSON array on disk, rewritten per mutation
 *
 * THREAD SAFETY PATTERN:
 * - Readers take a shared_lock, writers a unique_lock
 */

#include "lexsync/core/result.hpp"
#include "lexsync/vocab/types.hpp"

#include <filesystem>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace lexsync::vocab {

class VocabularyStore {
public:
    virtual ~VocabularyStore() = default;

    /// Every record, in insertion order
    virtual std::vector<VocabularyEntry> get_all() const = 0;

    virtual Result<void> clear() = 0;

    /// Insert a batch; fails without partial insert if any id already exists
    virtual Result<void> bulk_insert(const std::vector<VocabularyEntry>& entries) = 0;

    virtual std::size_t size() const = 0;
};

class InMemoryVocabularyStore : public VocabularyStore {
public:
    InMemoryVocabularyStore() = default;
    explicit InMemoryVocabularyStore(std::vector<VocabularyEntry> initial);

    std::vector<VocabularyEntry> get_all() const override;
    Result<void> clear() override;
    Result<void> bulk_insert(const std::vector<VocabularyEntry>& entries) override;
    std::size_t size() const override;

protected:
    /// Caller holds the unique lock
    Result<void> insert_locked(const std::vector<VocabularyEntry>& entries);

    mutable std::shared_mutex mutex_;
    std::vector<VocabularyEntry> entries_;
    std::unordered_map<std::string, std::size_t> index_;  // id -> position in entries_
};

/**
 * @brief Store backed by a JSON file
 *
 * The file holds one array of records in the web client's field layout.
 * A missing file is an empty store; the file is created on first write.
 */
class JsonFileVocabularyStore : public InMemoryVocabularyStore {
public:
    static Result<std::unique_ptr<JsonFileVocabularyStore>> open(std::filesystem::path path);

    Result<void> clear() override;
    Result<void> bulk_insert(const std::vector<VocabularyEntry>& entries) override;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    explicit JsonFileVocabularyStore(std::filesystem::path path);

    Result<void> flush_locked() const;

    std::filesystem::path path_;
};

} // namespace lexsync::vocab
