#include "lexsync/events/components.hpp"

#include <spdlog/spdlog.h>

namespace lexsync::events {

LoggerComponent::LoggerComponent(EventBus& bus) {
    subscriptions_.push_back(bus.subscribe<LogEntryEvent>([this](const LogEntryEvent& e) {
        on_log_entry(e);
    }));

    subscriptions_.push_back(bus.subscribe<ConnectionStateChangedEvent>([this](const ConnectionStateChangedEvent& e) {
        on_state_changed(e);
    }));

    subscriptions_.push_back(bus.subscribe<FileReceivedEvent>([this](const FileReceivedEvent& e) {
        on_file_received(e);
    }));

    subscriptions_.push_back(bus.subscribe<FileTransferFailedEvent>([this](const FileTransferFailedEvent& e) {
        on_transfer_failed(e);
    }));

    subscriptions_.push_back(bus.subscribe<SyncStatusChangedEvent>([this](const SyncStatusChangedEvent& e) {
        on_sync_status(e);
    }));
}

LoggerComponent::~LoggerComponent() {
    for (auto& subscription : subscriptions_) {
        subscription.unsubscribe();
    }
}

void LoggerComponent::on_log_entry(const LogEntryEvent& e) {
    const std::string detail = e.detail ? " (" + *e.detail + ")" : std::string();
    switch (e.level) {
        case LogLevel::Info:
            spdlog::info("{}{}", e.message, detail);
            break;
        case LogLevel::Success:
            spdlog::info("[ok] {}{}", e.message, detail);
            break;
        case LogLevel::Warning:
            spdlog::warn("{}{}", e.message, detail);
            break;
        case LogLevel::Error:
            spdlog::error("{}{}", e.message, detail);
            break;
    }
}

void LoggerComponent::on_state_changed(const ConnectionStateChangedEvent& e) {
    spdlog::debug("[StateChanged] {} -> {}{}", session::to_string(e.previous), session::to_string(e.current),
                  e.error ? " error=" + *e.error : std::string());
}

void LoggerComponent::on_file_received(const FileReceivedEvent& e) {
    spdlog::debug("[FileReceived] id={} name={} bytes={}", e.file.id, e.file.name, e.file.data.size());
}

void LoggerComponent::on_transfer_failed(const FileTransferFailedEvent& e) {
    spdlog::warn("[TransferFailed] id={} name={} reason={}", e.file_id, e.name, e.reason);
}

void LoggerComponent::on_sync_status(const SyncStatusChangedEvent& e) {
    if (e.status.stats) {
        const auto& s = *e.status.stats;
        spdlog::debug("[SyncStatus] {} local_updated={} remote_added={} remote_updated={} total={}",
                      sync::to_string(e.status.state), s.local_updated, s.remote_added,
                      s.remote_updated, s.total_merged);
    } else {
        spdlog::debug("[SyncStatus] {}{}", sync::to_string(e.status.state),
                      e.status.error ? " error=" + *e.status.error : std::string());
    }
}

} // namespace lexsync::events
