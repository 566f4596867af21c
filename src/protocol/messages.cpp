#include "lexsync/protocol/messages.hpp"

#include <type_traits>

namespace lexsync::protocol {
namespace {

template<typename T>
constexpr const char* name_of() {
    if constexpr (std::is_same_v<T, VerificationRequest>) return "verification-request";
    else if constexpr (std::is_same_v<T, VerificationResponse>) return "verification-response";
    else if constexpr (std::is_same_v<T, VerificationSuccess>) return "verification-success";
    else if constexpr (std::is_same_v<T, VerificationFailed>) return "verification-failed";
    else if constexpr (std::is_same_v<T, FileMetadata>) return "file-metadata";
    else if constexpr (std::is_same_v<T, FileChunk>) return "file-chunk";
    else if constexpr (std::is_same_v<T, TextContent>) return "text-content";
    else if constexpr (std::is_same_v<T, SyncRequest>) return "sync-request";
    else if constexpr (std::is_same_v<T, SyncResponse>) return "sync-response";
    else if constexpr (std::is_same_v<T, SyncComplete>) return "sync-complete";
    else return "sync-error";
}

} // namespace

const char* type_name(const Message& message) {
    return std::visit([](const auto& m) { return name_of<std::decay_t<decltype(m)>>(); }, message);
}

const char* type_name(const SyncMessage& message) {
    return std::visit([](const auto& m) { return name_of<std::decay_t<decltype(m)>>(); }, message);
}

std::optional<SyncMessage> as_sync_message(Message message) {
    if (auto* m = std::get_if<SyncRequest>(&message)) return SyncMessage{std::move(*m)};
    if (auto* m = std::get_if<SyncResponse>(&message)) return SyncMessage{std::move(*m)};
    if (auto* m = std::get_if<SyncComplete>(&message)) return SyncMessage{std::move(*m)};
    if (auto* m = std::get_if<SyncError>(&message)) return SyncMessage{std::move(*m)};
    return std::nullopt;
}

Message to_message(SyncMessage message) {
    return std::visit([](auto&& m) -> Message { return Message{std::move(m)}; }, std::move(message));
}

} // namespace lexsync::protocol
