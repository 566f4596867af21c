#pragma once

/**
 * @file config.hpp
 * @brief Engine tunables and their JSON loader
 *
 * Every timeout and size the engine uses lives here so tests can shrink
 * the 15 minute idle window to a few milliseconds without touching the
 * protocol code.
 *
 * FILE FORMAT (all keys optional):
 * {
 *   "chunk_size": 8192,
 *   "connect_timeout_ms": 15000,
 *   "idle_timeout_ms": 900000,
 *   "sync_timeout_ms": 30000,
 *   "chunk_yield_ms": 1,
 *   "inter_file_delay_ms": 100,
 *   "max_message_bytes": 67108864,
 *   "max_file_bytes": 1073741824,
 *   "listen_address": "0.0.0.0",
 *   "listen_port": 0,
 *   "advertise_host": "127.0.0.1",
 *   "log_level": "info"
 * }
 */

#include "lexsync/core/result.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace lexsync {

struct EngineConfig {
    std::size_t chunk_size = 8192;
    std::chrono::milliseconds connect_timeout{15000};
    std::chrono::milliseconds idle_timeout{15 * 60 * 1000};
    std::chrono::milliseconds sync_timeout{30000};
    std::chrono::milliseconds chunk_yield{1};
    std::chrono::milliseconds inter_file_delay{100};
    std::size_t max_message_bytes = 64 * 1024 * 1024;
    std::uint64_t max_file_bytes = 1024ull * 1024 * 1024; ///< largest file a peer may announce

    std::string listen_address = "0.0.0.0";
    std::uint16_t listen_port = 0;      ///< 0 picks an ephemeral port
    std::string advertise_host = "127.0.0.1";

    std::string log_level = "info";
};

/**
 * @brief Parse a JSON document into a config, starting from defaults
 */
Result<EngineConfig> parse_config(const std::string& json_text);

/**
 * @brief Read and parse a config file
 */
Result<EngineConfig> load_config(const std::filesystem::path& path);

/**
 * @brief Apply level and pattern from the config to the default spdlog logger
 */
void configure_logging(const EngineConfig& config);

} // namespace lexsync
