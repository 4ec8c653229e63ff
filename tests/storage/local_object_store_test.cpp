#include "s3sync/storage/local_object_store.hpp"

#include "../support/test_utils.hpp"

#include <gtest/gtest.h>

#include <sstream>

namespace fs = std::filesystem;
using s3sync::ErrorCode;
using s3sync::storage::LocalObjectStore;
using s3sync::storage::StorageClass;
using s3sync::testing::create_temp_dir;
using s3sync::testing::read_file;

TEST(LocalObjectStoreTest, StandardObjectsGoToHotRoot) {
    const auto dir = create_temp_dir("s3sync_local_store");
    LocalObjectStore store(dir / "hot", dir / "cold");
    std::istringstream body("hello");

    ASSERT_TRUE(store.put("docs/a.txt", body, 5, StorageClass::Standard).is_ok());

    EXPECT_EQ(read_file(dir / "hot" / "docs" / "a.txt"), "hello");
    EXPECT_FALSE(fs::exists(dir / "cold" / "docs" / "a.txt"));
    EXPECT_FALSE(fs::exists(dir / "hot" / "docs" / "a.txt.upload"));
}

TEST(LocalObjectStoreTest, DeepArchiveObjectsGoToColdRoot) {
    const auto dir = create_temp_dir("s3sync_local_store");
    LocalObjectStore store(dir / "hot", dir / "cold");
    std::istringstream body("frozen");

    ASSERT_TRUE(store.put("b.bin", body, 6, StorageClass::DeepArchive).is_ok());

    EXPECT_EQ(store.object_path("b.bin", StorageClass::DeepArchive), dir / "cold" / "b.bin");
    EXPECT_EQ(read_file(dir / "cold" / "b.bin"), "frozen");
}

TEST(LocalObjectStoreTest, OverwritesExistingObject) {
    const auto dir = create_temp_dir("s3sync_local_store");
    LocalObjectStore store(dir / "hot", dir / "cold");
    std::istringstream first("old contents");
    std::istringstream second("new");

    ASSERT_TRUE(store.put("a.txt", first, 12, StorageClass::Standard).is_ok());
    ASSERT_TRUE(store.put("a.txt", second, 3, StorageClass::Standard).is_ok());

    EXPECT_EQ(read_file(dir / "hot" / "a.txt"), "new");
}

TEST(LocalObjectStoreTest, ShortBodyIsTransportError) {
    const auto dir = create_temp_dir("s3sync_local_store");
    LocalObjectStore store(dir / "hot", dir / "cold");
    std::istringstream body("abc");

    auto result = store.put("a.txt", body, 10, StorageClass::Standard);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::Transport);
    EXPECT_FALSE(fs::exists(dir / "hot" / "a.txt"));
}

TEST(LocalObjectStoreTest, EmptyKeyIsRejected) {
    const auto dir = create_temp_dir("s3sync_local_store");
    LocalObjectStore store(dir / "hot", dir / "cold");
    std::istringstream body("");

    EXPECT_TRUE(store.put("", body, 0, StorageClass::Standard).is_error());
}
