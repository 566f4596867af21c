#include <gtest/gtest.h>
#include "lexsync/sync/last_sync_store.hpp"

#include <filesystem>
#include <fstream>

using namespace lexsync;
using namespace lexsync::sync;
namespace fs = std::filesystem;

namespace {

class LastSyncStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               (std::string("lexsync_last_sync_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(dir_);
        path_ = dir_ / "state" / "sync.json";
    }

    void TearDown() override {
        fs::remove_all(dir_);
    }

    fs::path dir_;
    fs::path path_;
};

} // namespace

TEST_F(LastSyncStoreTest, MissingFileLoadsAsNeverSynced) {
    JsonFileLastSyncStore store(path_);
    EXPECT_EQ(store.load(), 0);
}

TEST_F(LastSyncStoreTest, SaveReplacesPreviousValue) {
    JsonFileLastSyncStore store(path_);
    ASSERT_TRUE(store.save(1700000000000).is_ok());
    ASSERT_TRUE(store.save(1700000005000).is_ok());

    EXPECT_EQ(JsonFileLastSyncStore(path_).load(), 1700000005000);

    fs::path temp = path_;
    temp += ".tmp";
    EXPECT_FALSE(fs::exists(temp));
}

TEST_F(LastSyncStoreTest, UnreadableFileLoadsAsZero) {
    fs::create_directories(path_.parent_path());
    std::ofstream(path_) << "{\"lastSync\": ";

    JsonFileLastSyncStore store(path_);
    EXPECT_EQ(store.load(), 0);
    ASSERT_TRUE(store.save(42).is_ok());
    EXPECT_EQ(store.load(), 42);
}

TEST_F(LastSyncStoreTest, UnwritableLocationIsStorageError) {
    fs::create_directories(dir_);
    std::ofstream(dir_ / "state") << "not a directory";

    JsonFileLastSyncStore store(path_);
    auto saved = store.save(42);
    ASSERT_TRUE(saved.is_error());
    EXPECT_EQ(saved.error().code, ErrorCode::Storage);
}
