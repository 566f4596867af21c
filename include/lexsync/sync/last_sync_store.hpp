#pragma once

#include "lexsync/core/clock.hpp"
#include "lexsync/core/result.hpp"

#include <filesystem>

namespace lexsync::sync {

/**
 * @brief Persistence for the last completed sync timestamp
 *
 * The engine only ever stores max(current, incoming), so implementations
 * just read and write the value.
 */
class LastSyncStore {
public:
    virtual ~LastSyncStore() = default;

    virtual TimestampMs load() const = 0;
    virtual Result<void> save(TimestampMs value) = 0;
};

class InMemoryLastSyncStore : public LastSyncStore {
public:
    explicit InMemoryLastSyncStore(TimestampMs initial = 0) : value_(initial) {}

    TimestampMs load() const override { return value_; }

    Result<void> save(TimestampMs value) override {
        value_ = value;
        return Ok();
    }

private:
    TimestampMs value_;
};

/**
 * @brief Keeps {"lastSync": <ms>} in a small JSON file
 *
 * An unreadable or missing file loads as 0 (never synced).
 */
class JsonFileLastSyncStore : public LastSyncStore {
public:
    explicit JsonFileLastSyncStore(std::filesystem::path path);

    TimestampMs load() const override;
    Result<void> save(TimestampMs value) override;

private:
    std::filesystem::path path_;
};

} // namespace lexsync::sync
