#include "lexsync/transfer/sender.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <set>
#include <stdexcept>

namespace fs = std::filesystem;
using lexsync::ErrorCode;
using lexsync::transfer::OutgoingFile;

TEST(SenderTest, ChunkCountRoundsUp) {
    using lexsync::transfer::total_chunks;
    EXPECT_EQ(total_chunks(0, 8192), 0u);
    EXPECT_EQ(total_chunks(1, 8192), 1u);
    EXPECT_EQ(total_chunks(8192, 8192), 1u);
    EXPECT_EQ(total_chunks(8193, 8192), 2u);
    EXPECT_EQ(total_chunks(20000, 8192), 3u);
    EXPECT_THROW(total_chunks(10, 0), std::invalid_argument);
}

TEST(SenderTest, ChunksCoverFileExactly) {
    OutgoingFile file{"a.bin", "application/octet-stream", std::vector<std::uint8_t>(20000, 7)};
    const auto metadata = lexsync::transfer::make_metadata("f1", file, 8192);
    EXPECT_EQ(metadata.size, 20000u);
    EXPECT_EQ(metadata.total_chunks, 3u);
    EXPECT_EQ(metadata.file_type, "application/octet-stream");

    std::size_t total = 0;
    for (std::uint32_t i = 0; i < metadata.total_chunks; ++i) {
        const auto chunk = lexsync::transfer::make_chunk("f1", file, i, 8192);
        EXPECT_EQ(chunk.file_id, "f1");
        EXPECT_EQ(chunk.chunk_index, i);
        total += chunk.chunk.size();
    }
    EXPECT_EQ(total, 20000u);
    EXPECT_EQ(lexsync::transfer::make_chunk("f1", file, 2, 8192).chunk.size(), 20000u - 2 * 8192);
}

TEST(SenderTest, FileIdsAreUnique) {
    std::set<std::string> ids;
    for (int i = 0; i < 100; ++i) {
        const auto id = lexsync::transfer::generate_file_id();
        EXPECT_EQ(id.rfind("file-", 0), 0u);
        ids.insert(id);
    }
    EXPECT_EQ(ids.size(), 100u);
}

TEST(SenderTest, LoadsFileAndGuessesMime) {
    const auto path = fs::temp_directory_path() / "lexsync_sender_test.JSON";
    {
        std::ofstream out(path, std::ios::binary);
        out << R"([{"id":"a"}])";
    }

    auto loaded = lexsync::transfer::load_file(path);
    fs::remove(path);

    ASSERT_TRUE(loaded.is_ok());
    EXPECT_EQ(loaded.value().name, "lexsync_sender_test.JSON");
    EXPECT_EQ(loaded.value().mime_type, "application/json");
    EXPECT_EQ(loaded.value().data.size(), 12u);

    EXPECT_EQ(lexsync::transfer::guess_mime_type("x.unknownext"), "application/octet-stream");
}

TEST(SenderTest, MissingFileIsInvalidArgument) {
    auto loaded = lexsync::transfer::load_file("/nonexistent/lexsync/file.txt");
    ASSERT_TRUE(loaded.is_error());
    EXPECT_EQ(loaded.error().code, ErrorCode::InvalidArgument);
}
