#include <gtest/gtest.h>

#include "sift/digest_cache.h"
#include "test_support.h"

using namespace sift;
using sift::testing::ScratchDirTest;
namespace fs = std::filesystem;

class DigestCacheTest : public ScratchDirTest {};

TEST_F(DigestCacheTest, CreatesDatabaseAndParents) {
    auto cache = DigestCache::Open(root_ / "state/nested/digests.sqlite3");
    ASSERT_NE(cache, nullptr);
    EXPECT_TRUE(fs::exists(root_ / "state/nested/digests.sqlite3"));
    EXPECT_EQ(cache->size(), 0u);
}

TEST_F(DigestCacheTest, HitsOnlyWhenSizeAndMtimeMatch) {
    auto cache = DigestCache::Open(root_ / "digests.sqlite3");
    ASSERT_NE(cache, nullptr);
    const fs::path file = "/data/a.bin";
    const auto mtime = fs::file_time_type::clock::now();

    EXPECT_FALSE(cache->Lookup(file, DigestAlgorithm::Md5, 10, mtime).has_value());
    cache->Store(file, DigestAlgorithm::Md5, 10, mtime, "abc123");

    EXPECT_EQ(cache->Lookup(file, DigestAlgorithm::Md5, 10, mtime), "abc123");
    EXPECT_FALSE(cache->Lookup(file, DigestAlgorithm::Md5, 11, mtime).has_value());
    EXPECT_FALSE(cache->Lookup(file, DigestAlgorithm::Md5, 10, mtime + std::chrono::seconds(1)).has_value());
    EXPECT_FALSE(cache->Lookup(file, DigestAlgorithm::Sha1, 10, mtime).has_value());
}

TEST_F(DigestCacheTest, StoreReplacesAndPersists) {
    const auto mtime = fs::file_time_type::clock::now();
    {
        auto cache = DigestCache::Open(root_ / "digests.sqlite3");
        ASSERT_NE(cache, nullptr);
        cache->Store("/x", DigestAlgorithm::Md5, 1, mtime, "old");
        cache->Store("/x", DigestAlgorithm::Md5, 2, mtime, "new");
        cache->Store("/x", DigestAlgorithm::Sha256, 2, mtime, "other");
        EXPECT_EQ(cache->size(), 2u);
    }
    auto reopened = DigestCache::Open(root_ / "digests.sqlite3");
    ASSERT_NE(reopened, nullptr);
    EXPECT_EQ(reopened->Lookup("/x", DigestAlgorithm::Md5, 2, mtime), "new");
}

TEST_F(DigestCacheTest, UnopenablePathGivesNullptr) {
    WriteFile("blocker", "x");
    EXPECT_EQ(DigestCache::Open(root_ / "blocker/digests.sqlite3"), nullptr);
}
