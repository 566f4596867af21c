#include <gtest/gtest.h>
#include "lexsync/core/config.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>

using namespace lexsync;
using namespace std::chrono_literals;

TEST(EngineConfig, DefaultsMatchProtocolConstants) {
    EngineConfig config;
    EXPECT_EQ(config.chunk_size, 8192u);
    EXPECT_EQ(config.connect_timeout, 15s);
    EXPECT_EQ(config.idle_timeout, 15min);
    EXPECT_EQ(config.sync_timeout, 30s);
    EXPECT_EQ(config.inter_file_delay, 100ms);
    EXPECT_EQ(config.max_file_bytes, 1024ull * 1024 * 1024);
}

TEST(EngineConfig, EmptyObjectKeepsDefaults) {
    auto parsed = parse_config("{}");
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().chunk_size, 8192u);
    EXPECT_EQ(parsed.value().log_level, "info");
}

TEST(EngineConfig, ParsesEveryKey) {
    auto parsed = parse_config(R"({
        "chunk_size": 1024,
        "connect_timeout_ms": 50,
        "idle_timeout_ms": 200,
        "sync_timeout_ms": 300,
        "chunk_yield_ms": 0,
        "inter_file_delay_ms": 5,
        "max_message_bytes": 4096,
        "max_file_bytes": 65536,
        "listen_address": "127.0.0.1",
        "listen_port": 9000,
        "advertise_host": "10.0.0.2",
        "log_level": "debug",
        "something_else": true
    })");
    ASSERT_TRUE(parsed.is_ok()) << parsed.error().message;

    const auto& config = parsed.value();
    EXPECT_EQ(config.chunk_size, 1024u);
    EXPECT_EQ(config.connect_timeout, 50ms);
    EXPECT_EQ(config.idle_timeout, 200ms);
    EXPECT_EQ(config.sync_timeout, 300ms);
    EXPECT_EQ(config.chunk_yield, 0ms);
    EXPECT_EQ(config.inter_file_delay, 5ms);
    EXPECT_EQ(config.max_message_bytes, 4096u);
    EXPECT_EQ(config.max_file_bytes, 65536u);
    EXPECT_EQ(config.listen_address, "127.0.0.1");
    EXPECT_EQ(config.listen_port, 9000);
    EXPECT_EQ(config.advertise_host, "10.0.0.2");
    EXPECT_EQ(config.log_level, "debug");
}

TEST(EngineConfig, RejectsInvalidValues) {
    const char* bad[] = {
        "not json",
        "[1, 2]",
        R"({"chunk_size": 0})",
        R"({"chunk_size": -5})",
        R"({"connect_timeout_ms": 0})",
        R"({"idle_timeout_ms": "soon"})",
        R"({"listen_port": 70000})",
        R"({"max_file_bytes": 0})",
        R"({"advertise_host": 12})",
        R"({"log_level": "chatty"})",
    };
    for (const char* text : bad) {
        auto parsed = parse_config(text);
        ASSERT_TRUE(parsed.is_error()) << text;
        EXPECT_EQ(parsed.error().code, ErrorCode::Config) << text;
    }
}

TEST(EngineConfig, LoadsFromFile) {
    const auto path = std::filesystem::temp_directory_path() / "lexsync_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"chunk_size": 2048, "sync_timeout_ms": 1000})";
    }

    auto loaded = load_config(path);
    std::filesystem::remove(path);

    ASSERT_TRUE(loaded.is_ok());
    EXPECT_EQ(loaded.value().chunk_size, 2048u);
    EXPECT_EQ(loaded.value().sync_timeout, 1000ms);
}

TEST(EngineConfig, MissingFileIsConfigError) {
    auto loaded = load_config("/nonexistent/lexsync/config.json");
    ASSERT_TRUE(loaded.is_error());
    EXPECT_EQ(loaded.error().code, ErrorCode::Config);
}
