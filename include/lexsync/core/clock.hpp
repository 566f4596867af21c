#pragma once

#include <chrono>
#include <cstdint>

namespace lexsync {

/// Milliseconds since the Unix epoch, the unit of every wire timestamp.
using TimestampMs = std::int64_t;

inline TimestampMs now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace lexsync
