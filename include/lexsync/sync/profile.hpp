#pragma once

#include "lexsync/core/result.hpp"
#include "lexsync/sync/types.hpp"

#include <optional>

namespace lexsync::sync {

/**
 * @brief Supplies the local profile (current profile + language settings)
 */
class ProfileProvider {
public:
    virtual ~ProfileProvider() = default;

    /// nullopt while the application has no active profile
    virtual std::optional<SyncProfile> sync_profile() const = 0;
};

class FixedProfileProvider : public ProfileProvider {
public:
    FixedProfileProvider() = default;
    explicit FixedProfileProvider(SyncProfile profile) : profile_(std::move(profile)) {}

    std::optional<SyncProfile> sync_profile() const override { return profile_; }

    void set_profile(SyncProfile profile) { profile_ = std::move(profile); }

private:
    std::optional<SyncProfile> profile_;
};

/**
 * @brief Check that a remote profile can be merged into the local one
 *
 * @return ProfileMismatch naming the first differing language
 */
Result<void> validate_profile_match(const SyncProfile& local, const SyncProfile& remote);

} // namespace lexsync::sync
