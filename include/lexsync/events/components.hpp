/**
 * @file components.hpp
 * @brief Ready-made bus subscribers
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * // every log entry and state change now reaches spdlog
 */

#pragma once

#include "lexsync/events/event_bus.hpp"
#include "lexsync/events/events.hpp"

#include <vector>

namespace lexsync::events {

/**
 * @brief Forwards engine events to spdlog
 *
 * Log entries map onto spdlog levels (success logs at info). Holds its
 * subscriptions and detaches them on destruction, so it may be dropped
 * before the bus.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus);
    ~LoggerComponent();

    LoggerComponent(const LoggerComponent&) = delete;
    LoggerComponent& operator=(const LoggerComponent&) = delete;

private:
    void on_log_entry(const LogEntryEvent& e);
    void on_state_changed(const ConnectionStateChangedEvent& e);
    void on_file_received(const FileReceivedEvent& e);
    void on_transfer_failed(const FileTransferFailedEvent& e);
    void on_sync_status(const SyncStatusChangedEvent& e);

    std::vector<Subscription> subscriptions_;
};

} // namespace lexsync::events
