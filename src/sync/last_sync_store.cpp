#include "lexsync/sync/last_sync_store.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

namespace lexsync::sync {
namespace fs = std::filesystem;

JsonFileLastSyncStore::JsonFileLastSyncStore(fs::path path)
    : path_(std::move(path)) {
}

TimestampMs JsonFileLastSyncStore::load() const {
    std::ifstream input(path_);
    if (!input) {
        return 0;
    }
    std::ostringstream contents;
    contents << input.rdbuf();

    const auto doc = nlohmann::json::parse(contents.str(), nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        spdlog::warn("Ignoring unreadable sync state file {}", path_.string());
        return 0;
    }
    auto it = doc.find("lastSync");
    if (it == doc.end() || !it->is_number_integer()) {
        return 0;
    }
    return it->get<TimestampMs>();
}

Result<void> JsonFileLastSyncStore::save(TimestampMs value) {
    const auto parent = path_.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec && !fs::exists(parent)) {
            return Err<void>(ErrorCode::Storage, "Failed to create directory: " + parent.string());
        }
    }

    fs::path temp = path_;
    temp += ".tmp";
    {
        std::ofstream out(temp, std::ios::trunc);
        if (!out) {
            return Err<void>(ErrorCode::Storage, "Failed to write sync state: " + temp.string());
        }
        out << nlohmann::json{{"lastSync", value}}.dump();
        if (!out) {
            return Err<void>(ErrorCode::Storage, "Failed to write sync state: " + temp.string());
        }
    }

    std::error_code ec;
    fs::rename(temp, path_, ec);
    if (ec) {
        return Err<void>(ErrorCode::Storage, "Failed to replace sync state: " + path_.string());
    }
    return Ok();
}

} // namespace lexsync::sync
