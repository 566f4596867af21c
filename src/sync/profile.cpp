#include "lexsync/sync/profile.hpp"

namespace lexsync::sync {

Result<void> validate_profile_match(const SyncProfile& local, const SyncProfile& remote) {
    if (local.source_language != remote.source_language) {
        return Err<void>(ErrorCode::ProfileMismatch,
                         "Source language mismatch: local (" + local.source_language +
                         ") vs remote (" + remote.source_language + ")");
    }
    if (local.target_language != remote.target_language) {
        return Err<void>(ErrorCode::ProfileMismatch,
                         "Target language mismatch: local (" + local.target_language +
                         ") vs remote (" + remote.target_language + ")");
    }
    return Ok();
}

} // namespace lexsync::sync
