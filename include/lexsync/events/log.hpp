#pragma once

#include "lexsync/events/event_bus.hpp"
#include "lexsync/events/events.hpp"

#include <optional>
#include <string>

namespace lexsync::events {

/// Publish one LogEntryEvent stamped with the current time
inline void publish_log(const EventBus& bus,
                        LogLevel level,
                        std::string message,
                        std::optional<std::string> detail = std::nullopt) {
    bus.emit(LogEntryEvent{now_ms(), level, std::move(message), std::move(detail)});
}

} // namespace lexsync::events
