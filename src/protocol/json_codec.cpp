#include "lexsync/protocol/codec.hpp"
#include "lexsync/vocab/json.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <string>

namespace lexsync::protocol {
namespace {

using json = nlohmann::json;

/**
 * @brief Typed field access that remembers the first failure
 *
 * Lets each decoder read all of its fields straight-line and check once.
 */
class FieldReader {
public:
    FieldReader(const json& object, const std::string& type)
        : object_(object), type_(type) {}

    std::string string(const char* key) {
        const json* value = find(key);
        if (value == nullptr) {
            return {};
        }
        if (!value->is_string()) {
            fail(key, "a string");
            return {};
        }
        return value->get<std::string>();
    }

    std::optional<std::string> optional_string(const char* key) {
        auto it = object_.find(key);
        if (it == object_.end() || it->is_null()) {
            return std::nullopt;
        }
        if (!it->is_string()) {
            fail(key, "a string");
            return std::nullopt;
        }
        return it->get<std::string>();
    }

    std::int64_t timestamp(const char* key) {
        const json* value = find(key);
        if (value == nullptr) {
            return 0;
        }
        if (value->is_number_integer()) {
            return value->get<std::int64_t>();
        }
        if (value->is_number_float()) {
            return static_cast<std::int64_t>(std::llround(value->get<double>()));
        }
        fail(key, "a number");
        return 0;
    }

    std::uint64_t count(const char* key) {
        const json* value = find(key);
        if (value == nullptr) {
            return 0;
        }
        if (!value->is_number_unsigned()) {
            fail(key, "a non-negative integer");
            return 0;
        }
        return value->get<std::uint64_t>();
    }

    const json* array(const char* key) {
        const json* value = find(key);
        if (value != nullptr && !value->is_array()) {
            fail(key, "an array");
            return nullptr;
        }
        return value;
    }

    const json* object(const char* key) {
        const json* value = find(key);
        if (value != nullptr && !value->is_object()) {
            fail(key, "an object");
            return nullptr;
        }
        return value;
    }

    void fail(const std::string& message) {
        if (!error_) {
            error_ = type_ + ": " + message;
        }
    }

    [[nodiscard]] bool ok() const noexcept { return !error_.has_value(); }
    [[nodiscard]] const std::string& error() const { return *error_; }

private:
    const json* find(const char* key) {
        auto it = object_.find(key);
        if (it == object_.end()) {
            fail(std::string("missing field '") + key + "'");
            return nullptr;
        }
        return &*it;
    }

    void fail(const char* key, const char* expected) {
        fail(std::string("field '") + key + "' must be " + expected);
    }

    const json& object_;
    std::string type_;
    std::optional<std::string> error_;
};

json profile_to_json(const sync::SyncProfile& profile) {
    return json{
        {"profileId", profile.profile_id},
        {"profileName", profile.profile_name},
        {"sourceLanguage", profile.source_language},
        {"targetLanguage", profile.target_language},
    };
}

sync::SyncProfile profile_from_json(const json* value, FieldReader& outer) {
    sync::SyncProfile profile;
    if (value == nullptr) {
        return profile;
    }
    FieldReader fields(*value, "profile");
    profile.profile_id = fields.optional_string("profileId").value_or("");
    profile.profile_name = fields.optional_string("profileName").value_or("");
    profile.source_language = fields.string("sourceLanguage");
    profile.target_language = fields.string("targetLanguage");
    if (!fields.ok()) {
        outer.fail(fields.error());
    }
    return profile;
}

json stats_to_json(const sync::SyncStats& stats) {
    return json{
        {"localAdded", stats.local_added},
        {"localUpdated", stats.local_updated},
        {"remoteAdded", stats.remote_added},
        {"remoteUpdated", stats.remote_updated},
        {"totalMerged", stats.total_merged},
    };
}

sync::SyncStats stats_from_json(const json* value, FieldReader& outer) {
    sync::SyncStats stats;
    if (value == nullptr) {
        return stats;
    }
    FieldReader fields(*value, "stats");
    stats.local_added = fields.count("localAdded");
    stats.local_updated = fields.count("localUpdated");
    stats.remote_added = fields.count("remoteAdded");
    stats.remote_updated = fields.count("remoteUpdated");
    stats.total_merged = fields.count("totalMerged");
    if (!fields.ok()) {
        outer.fail(fields.error());
    }
    return stats;
}

std::vector<std::uint8_t> bytes_from_json(const json* value, FieldReader& fields) {
    std::vector<std::uint8_t> bytes;
    if (value == nullptr) {
        return bytes;
    }
    bytes.reserve(value->size());
    for (const auto& item : *value) {
        if (!item.is_number_unsigned() || item.get<std::uint64_t>() > 0xFF) {
            fields.fail("chunk bytes must be integers 0-255");
            return {};
        }
        bytes.push_back(static_cast<std::uint8_t>(item.get<std::uint64_t>()));
    }
    return bytes;
}

struct Encoder {
    json operator()(const VerificationRequest& m) const {
        return {{"type", "verification-request"}, {"verificationCode", m.verification_code}};
    }
    json operator()(const VerificationResponse& m) const {
        return {{"type", "verification-response"}, {"verificationCode", m.verification_code}};
    }
    json operator()(const VerificationSuccess&) const {
        return {{"type", "verification-success"}};
    }
    json operator()(const VerificationFailed&) const {
        return {{"type", "verification-failed"}};
    }
    json operator()(const FileMetadata& m) const {
        return {
            {"type", "file-metadata"},
            {"id", m.id},
            {"name", m.name},
            {"size", m.size},
            {"fileType", m.file_type},
            {"totalChunks", m.total_chunks},
        };
    }
    json operator()(const FileChunk& m) const {
        return {
            {"type", "file-chunk"},
            {"fileId", m.file_id},
            {"chunkIndex", m.chunk_index},
            {"chunk", m.chunk},
        };
    }
    json operator()(const TextContent& m) const {
        json j = {{"type", "text-content"}, {"content", m.content}, {"timestamp", m.timestamp}};
        if (m.content_type) {
            j["contentType"] = *m.content_type;
        }
        return j;
    }
    json operator()(const SyncRequest& m) const {
        return {
            {"type", "sync-request"},
            {"profile", profile_to_json(m.profile)},
            {"lastSync", m.last_sync},
            {"vocabularyEntries", vocab::entries_to_json(m.vocabulary_entries)},
        };
    }
    json operator()(const SyncResponse& m) const {
        return {
            {"type", "sync-response"},
            {"profile", profile_to_json(m.profile)},
            {"vocabularyEntries", vocab::entries_to_json(m.vocabulary_entries)},
            {"timestamp", m.timestamp},
        };
    }
    json operator()(const SyncComplete& m) const {
        return {{"type", "sync-complete"}, {"stats", stats_to_json(m.stats)}, {"timestamp", m.timestamp}};
    }
    json operator()(const SyncError& m) const {
        return {{"type", "sync-error"}, {"error", m.error}};
    }
};

Result<Message> decode_object(const json& doc) {
    auto type_it = doc.find("type");
    if (type_it == doc.end() || !type_it->is_string()) {
        return Err<Message>(ErrorCode::Protocol, "Message without a type discriminator");
    }
    const std::string type = type_it->get<std::string>();
    FieldReader fields(doc, type);
    Message message;

    if (type == "verification-request") {
        message = VerificationRequest{fields.string("verificationCode")};
    } else if (type == "verification-response") {
        message = VerificationResponse{fields.string("verificationCode")};
    } else if (type == "verification-success") {
        message = VerificationSuccess{};
    } else if (type == "verification-failed") {
        message = VerificationFailed{};
    } else if (type == "file-metadata") {
        FileMetadata m;
        m.id = fields.string("id");
        m.name = fields.string("name");
        m.size = fields.count("size");
        m.file_type = fields.optional_string("fileType").value_or("");
        const auto total = fields.count("totalChunks");
        if (total > UINT32_MAX) {
            fields.fail("totalChunks out of range");
        }
        m.total_chunks = static_cast<std::uint32_t>(total);
        message = std::move(m);
    } else if (type == "file-chunk") {
        FileChunk m;
        m.file_id = fields.string("fileId");
        const auto index = fields.count("chunkIndex");
        if (index > UINT32_MAX) {
            fields.fail("chunkIndex out of range");
        }
        m.chunk_index = static_cast<std::uint32_t>(index);
        m.chunk = bytes_from_json(fields.array("chunk"), fields);
        message = std::move(m);
    } else if (type == "text-content") {
        TextContent m;
        m.content = fields.string("content");
        m.content_type = fields.optional_string("contentType");
        m.timestamp = doc.contains("timestamp") ? fields.timestamp("timestamp") : 0;
        message = std::move(m);
    } else if (type == "sync-request") {
        SyncRequest m;
        m.profile = profile_from_json(fields.object("profile"), fields);
        m.last_sync = fields.timestamp("lastSync");
        if (const json* entries = fields.array("vocabularyEntries")) {
            m.vocabulary_entries = vocab::entries_from_json(*entries);
        }
        message = std::move(m);
    } else if (type == "sync-response") {
        SyncResponse m;
        m.profile = profile_from_json(fields.object("profile"), fields);
        if (const json* entries = fields.array("vocabularyEntries")) {
            m.vocabulary_entries = vocab::entries_from_json(*entries);
        }
        m.timestamp = fields.timestamp("timestamp");
        message = std::move(m);
    } else if (type == "sync-complete") {
        SyncComplete m;
        m.stats = stats_from_json(fields.object("stats"), fields);
        m.timestamp = fields.timestamp("timestamp");
        message = std::move(m);
    } else if (type == "sync-error") {
        message = SyncError{fields.string("error")};
    } else {
        return Err<Message>(ErrorCode::Protocol, "Unknown message type: " + type);
    }

    if (!fields.ok()) {
        return Err<Message>(ErrorCode::Protocol, fields.error());
    }
    return Ok(std::move(message));
}

} // namespace

Result<std::vector<std::uint8_t>> JsonCodec::encode(const Message& message) const {
    std::string text;
    try {
        text = std::visit(Encoder{}, message).dump();
    } catch (const json::type_error& e) {
        return Err<std::vector<std::uint8_t>>(ErrorCode::Protocol,
                                              std::string("Cannot encode ") + type_name(message) + ": " + e.what());
    }
    return Ok(std::vector<std::uint8_t>(text.begin(), text.end()));
}

Result<Message> JsonCodec::decode(const std::uint8_t* data, std::size_t size) const {
    if (data == nullptr || size == 0) {
        return Err<Message>(ErrorCode::Protocol, "Empty frame");
    }
    const json doc = json::parse(data, data + size, nullptr, false);
    if (doc.is_discarded()) {
        return Err<Message>(ErrorCode::Protocol, "Frame is not valid JSON");
    }
    if (!doc.is_object()) {
        return Err<Message>(ErrorCode::Protocol, "Frame is not a JSON object");
    }
    return decode_object(doc);
}

} // namespace lexsync::protocol
