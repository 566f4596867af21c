#include "lexsync/core/config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

namespace lexsync {
namespace {

using json = nlohmann::json;

Result<std::chrono::milliseconds> read_duration(const json& doc,
                                                const char* key,
                                                std::chrono::milliseconds current,
                                                bool allow_zero) {
    if (!doc.contains(key)) {
        return Ok(current);
    }
    const auto& value = doc.at(key);
    if (!value.is_number_integer()) {
        return Err<std::chrono::milliseconds>(ErrorCode::Config,
                                              std::string(key) + " must be an integer");
    }
    const auto ms = value.get<std::int64_t>();
    if (ms < 0 || (!allow_zero && ms == 0)) {
        return Err<std::chrono::milliseconds>(ErrorCode::Config,
                                              std::string(key) + " out of range");
    }
    return Ok(std::chrono::milliseconds(ms));
}

Result<std::string> read_string(const json& doc, const char* key, std::string current) {
    if (!doc.contains(key)) {
        return Ok(std::move(current));
    }
    if (!doc.at(key).is_string()) {
        return Err<std::string>(ErrorCode::Config, std::string(key) + " must be a string");
    }
    return Ok(doc.at(key).get<std::string>());
}

} // namespace

Result<EngineConfig> parse_config(const std::string& json_text) {
    const json doc = json::parse(json_text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return Err<EngineConfig>(ErrorCode::Config, "Config is not a JSON object");
    }

    EngineConfig config;

    if (doc.contains("chunk_size")) {
        const auto& value = doc.at("chunk_size");
        if (!value.is_number_unsigned() || value.get<std::uint64_t>() == 0) {
            return Err<EngineConfig>(ErrorCode::Config, "chunk_size must be a positive integer");
        }
        config.chunk_size = value.get<std::size_t>();
    }

    if (doc.contains("max_message_bytes")) {
        const auto& value = doc.at("max_message_bytes");
        if (!value.is_number_unsigned() || value.get<std::uint64_t>() == 0) {
            return Err<EngineConfig>(ErrorCode::Config, "max_message_bytes must be a positive integer");
        }
        config.max_message_bytes = value.get<std::size_t>();
    }

    if (doc.contains("max_file_bytes")) {
        const auto& value = doc.at("max_file_bytes");
        if (!value.is_number_unsigned() || value.get<std::uint64_t>() == 0) {
            return Err<EngineConfig>(ErrorCode::Config, "max_file_bytes must be a positive integer");
        }
        config.max_file_bytes = value.get<std::uint64_t>();
    }

    if (doc.contains("listen_port")) {
        const auto& value = doc.at("listen_port");
        if (!value.is_number_unsigned() || value.get<std::uint64_t>() > 65535) {
            return Err<EngineConfig>(ErrorCode::Config, "listen_port must be 0-65535");
        }
        config.listen_port = static_cast<std::uint16_t>(value.get<std::uint64_t>());
    }

    struct DurationField {
        const char* key;
        std::chrono::milliseconds* target;
        bool allow_zero;
    };
    const DurationField durations[] = {
        {"connect_timeout_ms", &config.connect_timeout, false},
        {"idle_timeout_ms", &config.idle_timeout, false},
        {"sync_timeout_ms", &config.sync_timeout, false},
        {"chunk_yield_ms", &config.chunk_yield, true},
        {"inter_file_delay_ms", &config.inter_file_delay, true},
    };
    for (const auto& field : durations) {
        auto parsed = read_duration(doc, field.key, *field.target, field.allow_zero);
        if (parsed.is_error()) {
            return Err<EngineConfig>(parsed.error());
        }
        *field.target = parsed.value();
    }

    struct StringField {
        const char* key;
        std::string* target;
    };
    const StringField strings[] = {
        {"listen_address", &config.listen_address},
        {"advertise_host", &config.advertise_host},
        {"log_level", &config.log_level},
    };
    for (const auto& field : strings) {
        auto parsed = read_string(doc, field.key, *field.target);
        if (parsed.is_error()) {
            return Err<EngineConfig>(parsed.error());
        }
        *field.target = parsed.value();
    }

    if (spdlog::level::from_str(config.log_level) == spdlog::level::off && config.log_level != "off") {
        return Err<EngineConfig>(ErrorCode::Config, "Unknown log_level: " + config.log_level);
    }

    return Ok(config);
}

Result<EngineConfig> load_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<EngineConfig>(ErrorCode::Config, "Failed to open config file: " + path.string());
    }
    std::ostringstream contents;
    contents << input.rdbuf();
    return parse_config(contents.str());
}

void configure_logging(const EngineConfig& config) {
    spdlog::set_level(spdlog::level::from_str(config.log_level));
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
}

} // namespace lexsync
