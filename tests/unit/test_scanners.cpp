#include <gtest/gtest.h>

#include "sift/scanners.h"
#include "test_support.h"

#include <limits>

using namespace sift;
using sift::testing::Days;
using sift::testing::ScratchDirTest;

class ScannersTest : public ScratchDirTest {
protected:
    static constexpr std::uintmax_t kMiB = 1024 * 1024;
};

TEST_F(ScannersTest, OnlyFilesAboveThresholdAreLarge) {
    MakeSizedFile("medium.bin", 50 * kMiB);
    auto big = MakeSizedFile("big.bin", 150 * kMiB);

    auto results = FindLargeFiles(root_, 100 * kMiB);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].path, big);
    EXPECT_EQ(results[0].size, 150 * kMiB);
}

TEST_F(ScannersTest, LargeFilesAreSortedAndLimited) {
    MakeSizedFile("a.bin", 3 * kMiB);
    MakeSizedFile("sub/b.bin", 5 * kMiB);
    MakeSizedFile("c.bin", 4 * kMiB);
    MakeSizedFile("tiny.bin", 10);
    MakeDir("some_dir");

    auto all = FindLargeFiles(root_, kMiB);
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].name, "b.bin");
    EXPECT_EQ(all[1].name, "c.bin");
    EXPECT_EQ(all[2].name, "a.bin");

    auto top = FindLargeFiles(root_, kMiB, 2);
    ASSERT_EQ(top.size(), 2u);
    EXPECT_EQ(top[0].name, "b.bin");
}

TEST_F(ScannersTest, OldFilesAreOldestFirst) {
    auto ancient = WriteFile("ancient.txt", "x");
    auto old = WriteFile("sub/old.txt", "x");
    WriteFile("fresh.txt", "x");
    SetAge(ancient, Days(800));
    SetAge(old, Days(400));

    auto results = FindOldFiles(root_, 365);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].path, ancient);
    EXPECT_EQ(results[1].path, old);

    EXPECT_EQ(FindOldFiles(root_, 365, 1).size(), 1u);
    EXPECT_EQ(FindOldFiles(root_, 500).size(), 1u);
}

TEST_F(ScannersTest, HugeAgeFindsNothing) {
    auto ancient = WriteFile("ancient.txt", "x");
    SetAge(ancient, Days(3000));

    EXPECT_TRUE(FindOldFiles(root_, 200000).empty());
    EXPECT_TRUE(FindOldFiles(root_, std::numeric_limits<unsigned>::max()).empty());
}

TEST(AgeCutoffTest, ClampsToClockRange) {
    const auto now = std::filesystem::file_time_type::clock::now();
    EXPECT_EQ(AgeCutoff(0, now), now);
    EXPECT_EQ(AgeCutoff(1, now), now - std::chrono::days(1));
    EXPECT_EQ(AgeCutoff(200000, now), std::filesystem::file_time_type::min());
    EXPECT_EQ(AgeCutoff(std::numeric_limits<unsigned>::max(), now),
              std::filesystem::file_time_type::min());
    EXPECT_LE(AgeCutoff(200000, now), now);
}

TEST_F(ScannersTest, OldScanIgnoresDirectories) {
    auto dir = MakeDir("stale_dir");
    SetAge(dir, Days(1000));
    EXPECT_TRUE(FindOldFiles(root_, 30).empty());
}

TEST_F(ScannersTest, MissingRootGivesNoResults) {
    EXPECT_TRUE(FindLargeFiles(root_ / "nope", 0).empty());
    EXPECT_TRUE(FindOldFiles(root_ / "nope", 0).empty());
}
