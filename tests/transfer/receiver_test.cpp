#include "lexsync/transfer/receiver.hpp"
#include "lexsync/transfer/sender.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <numeric>
#include <random>

using lexsync::ErrorCode;
using lexsync::protocol::FileChunk;
using lexsync::protocol::FileMetadata;
using lexsync::transfer::OutgoingFile;
using lexsync::transfer::TransferReceiver;

namespace {

constexpr std::size_t kChunk = 8192;

OutgoingFile make_file(std::size_t size) {
    OutgoingFile file;
    file.name = "deck.bin";
    file.mime_type = "application/octet-stream";
    file.data.resize(size);
    for (std::size_t i = 0; i < size; ++i) {
        file.data[i] = static_cast<std::uint8_t>((i * 31 + 7) & 0xFF);
    }
    return file;
}

} // namespace

TEST(TransferReceiverTest, ReassemblesShuffledChunks) {
    const auto file = make_file(3 * kChunk + 123);
    const auto metadata = lexsync::transfer::make_metadata("f1", file, kChunk);
    ASSERT_EQ(metadata.total_chunks, 4u);

    TransferReceiver receiver(kChunk);
    auto announced = receiver.on_metadata(metadata);
    ASSERT_TRUE(announced.is_ok());
    EXPECT_FALSE(announced.value().has_value());

    std::vector<std::uint32_t> order(metadata.total_chunks);
    std::iota(order.begin(), order.end(), 0u);
    std::shuffle(order.begin(), order.end(), std::mt19937(42));

    TransferReceiver::Completion done;
    for (std::size_t i = 0; i < order.size(); ++i) {
        auto stored = receiver.on_chunk(lexsync::transfer::make_chunk("f1", file, order[i], kChunk));
        ASSERT_TRUE(stored.is_ok()) << stored.error().message;
        if (i + 1 < order.size()) {
            EXPECT_FALSE(stored.value().has_value());
        } else {
            done = std::move(stored.value());
        }
    }

    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(done->id, "f1");
    EXPECT_EQ(done->name, "deck.bin");
    EXPECT_EQ(done->data, file.data);
    EXPECT_EQ(receiver.pending_count(), 0u);
}

TEST(TransferReceiverTest, MissingChunkKeepsFilePending) {
    const auto file = make_file(2 * kChunk + 1);
    TransferReceiver receiver(kChunk);
    ASSERT_TRUE(receiver.on_metadata(lexsync::transfer::make_metadata("f1", file, kChunk)).is_ok());

    ASSERT_TRUE(receiver.on_chunk(lexsync::transfer::make_chunk("f1", file, 0, kChunk)).is_ok());
    auto last = receiver.on_chunk(lexsync::transfer::make_chunk("f1", file, 2, kChunk));
    ASSERT_TRUE(last.is_ok());
    EXPECT_FALSE(last.value().has_value());

    EXPECT_TRUE(receiver.is_pending("f1"));
    auto progress = receiver.progress("f1");
    ASSERT_TRUE(progress.has_value());
    EXPECT_EQ(progress->first, 2u);
    EXPECT_EQ(progress->second, 3u);
}

TEST(TransferReceiverTest, ZeroByteFileCompletesOnMetadata) {
    TransferReceiver receiver;
    auto done = receiver.on_metadata(FileMetadata{"f0", "empty.txt", 0, "text/plain", 0});
    ASSERT_TRUE(done.is_ok());
    ASSERT_TRUE(done.value().has_value());
    EXPECT_TRUE(done.value()->data.empty());
    EXPECT_FALSE(receiver.is_pending("f0"));
}

TEST(TransferReceiverTest, UnknownFileIsProtocolError) {
    TransferReceiver receiver;
    auto stored = receiver.on_chunk(FileChunk{"nope", 0, {1}});
    ASSERT_TRUE(stored.is_error());
    EXPECT_EQ(stored.error().code, ErrorCode::Protocol);
}

TEST(TransferReceiverTest, BadIndexDropsFile) {
    TransferReceiver receiver(8);
    ASSERT_TRUE(receiver.on_metadata(FileMetadata{"f1", "a", 10, "", 2}).is_ok());

    auto stored = receiver.on_chunk(FileChunk{"f1", 5, {1}});
    ASSERT_TRUE(stored.is_error());
    EXPECT_EQ(stored.error().code, ErrorCode::Integrity);
    EXPECT_FALSE(receiver.is_pending("f1"));
}

TEST(TransferReceiverTest, ChunkCountMustMatchDeclaredSize) {
    TransferReceiver receiver(8);

    auto bogus = receiver.on_metadata(FileMetadata{"f1", "a", 10, "", 4000000000u});
    ASSERT_TRUE(bogus.is_error());
    EXPECT_EQ(bogus.error().code, ErrorCode::Integrity);
    EXPECT_FALSE(receiver.is_pending("f1"));

    auto too_few = receiver.on_metadata(FileMetadata{"f2", "b", 17, "", 2});
    ASSERT_TRUE(too_few.is_error());
    EXPECT_EQ(too_few.error().code, ErrorCode::Integrity);

    EXPECT_TRUE(receiver.on_metadata(FileMetadata{"f3", "c", 17, "", 3}).is_ok());
    EXPECT_TRUE(receiver.on_metadata(FileMetadata{"f4", "d", 16, "", 2}).is_ok());
    EXPECT_EQ(receiver.pending_count(), 2u);
}

TEST(TransferReceiverTest, FileAboveLimitIsRejected) {
    TransferReceiver receiver(8, 100);

    auto big = receiver.on_metadata(FileMetadata{"f1", "big.bin", 101, "", 13});
    ASSERT_TRUE(big.is_error());
    EXPECT_EQ(big.error().code, ErrorCode::Integrity);
    EXPECT_EQ(receiver.pending_count(), 0u);

    EXPECT_TRUE(receiver.on_metadata(FileMetadata{"f2", "ok.bin", 100, "", 13}).is_ok());
}

TEST(TransferReceiverTest, ShortNonFinalChunkDropsFile) {
    TransferReceiver receiver(4);
    ASSERT_TRUE(receiver.on_metadata(FileMetadata{"f1", "a", 10, "", 3}).is_ok());

    auto stored = receiver.on_chunk(FileChunk{"f1", 0, {1, 2, 3}});
    ASSERT_TRUE(stored.is_error());
    EXPECT_EQ(stored.error().code, ErrorCode::Integrity);
    EXPECT_FALSE(receiver.is_pending("f1"));
}

TEST(TransferReceiverTest, OversizedChunksAreRejectedEarly) {
    TransferReceiver receiver(4);
    ASSERT_TRUE(receiver.on_metadata(FileMetadata{"f1", "a", 10, "", 3}).is_ok());

    auto stored = receiver.on_chunk(FileChunk{"f1", 0, {1, 2, 3, 4, 5}});
    ASSERT_TRUE(stored.is_error());
    EXPECT_EQ(stored.error().code, ErrorCode::Integrity);
    EXPECT_FALSE(receiver.is_pending("f1"));
}

TEST(TransferReceiverTest, FinalChunkMustCarryTheRemainder) {
    TransferReceiver receiver(4);
    ASSERT_TRUE(receiver.on_metadata(FileMetadata{"f1", "a", 10, "", 3}).is_ok());
    ASSERT_TRUE(receiver.on_chunk(FileChunk{"f1", 0, {1, 2, 3, 4}}).is_ok());
    ASSERT_TRUE(receiver.on_chunk(FileChunk{"f1", 1, {5, 6, 7, 8}}).is_ok());

    auto last = receiver.on_chunk(FileChunk{"f1", 2, {9}});
    ASSERT_TRUE(last.is_error());
    EXPECT_EQ(last.error().code, ErrorCode::Integrity);
    EXPECT_FALSE(receiver.is_pending("f1"));

    ASSERT_TRUE(receiver.on_metadata(FileMetadata{"f1", "a", 10, "", 3}).is_ok());
    ASSERT_TRUE(receiver.on_chunk(FileChunk{"f1", 2, {9, 10}}).is_ok());
    ASSERT_TRUE(receiver.on_chunk(FileChunk{"f1", 0, {1, 2, 3, 4}}).is_ok());
    auto done = receiver.on_chunk(FileChunk{"f1", 1, {5, 6, 7, 8}});
    ASSERT_TRUE(done.is_ok());
    ASSERT_TRUE(done.value().has_value());
    EXPECT_EQ(done.value()->data, (std::vector<std::uint8_t>{1, 2, 3, 4, 5, 6, 7, 8, 9, 10}));
}

TEST(TransferReceiverTest, ChunkCountWithoutBytesIsRejected) {
    TransferReceiver receiver;
    auto announced = receiver.on_metadata(FileMetadata{"f1", "a", 100, "", 0});
    ASSERT_TRUE(announced.is_error());
    EXPECT_EQ(announced.error().code, ErrorCode::Integrity);
}

TEST(TransferReceiverTest, ReannouncedFileStartsOver) {
    TransferReceiver receiver(1);
    ASSERT_TRUE(receiver.on_metadata(FileMetadata{"f1", "a", 2, "", 2}).is_ok());
    ASSERT_TRUE(receiver.on_chunk(FileChunk{"f1", 0, {1}}).is_ok());

    ASSERT_TRUE(receiver.on_metadata(FileMetadata{"f1", "a", 2, "", 2}).is_ok());
    EXPECT_EQ(receiver.progress("f1")->first, 0u);

    receiver.clear();
    EXPECT_EQ(receiver.pending_count(), 0u);
}
