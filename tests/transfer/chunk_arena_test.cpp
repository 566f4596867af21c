#include "lexsync/transfer/chunk_arena.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using lexsync::ErrorCode;
using lexsync::transfer::ChunkArena;

TEST(ChunkArenaTest, CompletesOnlyWhenEverySlotFilled) {
    ChunkArena arena(3);
    EXPECT_FALSE(arena.complete());

    ASSERT_TRUE(arena.store(2, {5, 6}).is_ok());
    ASSERT_TRUE(arena.store(0, {1, 2}).is_ok());
    EXPECT_FALSE(arena.complete());
    EXPECT_EQ(arena.filled(), 2u);
    EXPECT_EQ(arena.missing(), std::vector<std::uint32_t>{1});

    ASSERT_TRUE(arena.store(1, {3, 4}).is_ok());
    EXPECT_TRUE(arena.complete());
    EXPECT_EQ(arena.assemble(), (std::vector<std::uint8_t>{1, 2, 3, 4, 5, 6}));
}

TEST(ChunkArenaTest, RepeatedIndexReplacesWithoutDoubleCounting) {
    ChunkArena arena(2);
    ASSERT_TRUE(arena.store(0, {1, 1, 1}).is_ok());
    ASSERT_TRUE(arena.store(0, {9}).is_ok());

    EXPECT_EQ(arena.filled(), 1u);
    EXPECT_EQ(arena.bytes_stored(), 1u);
    EXPECT_FALSE(arena.complete());
}

TEST(ChunkArenaTest, OutOfRangeIndexIsIntegrityError) {
    ChunkArena arena(2);
    auto result = arena.store(2, {1});
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::Integrity);
    EXPECT_EQ(arena.filled(), 0u);
}

TEST(ChunkArenaTest, EmptyArenaIsComplete) {
    ChunkArena arena(0);
    EXPECT_TRUE(arena.complete());
    EXPECT_TRUE(arena.assemble().empty());
}

TEST(ChunkArenaTest, AssembleBeforeCompleteThrows) {
    ChunkArena arena(2);
    ASSERT_TRUE(arena.store(0, {1}).is_ok());
    EXPECT_THROW((void)arena.assemble(), std::logic_error);
}
