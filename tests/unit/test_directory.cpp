#include <gtest/gtest.h>

#include "sift/directory.h"
#include "test_support.h"

#include <unistd.h>

using namespace sift;
using sift::testing::ScratchDirTest;
namespace fs = std::filesystem;

class DirectoryTest : public ScratchDirTest {};

TEST_F(DirectoryTest, DirectoriesFirstThenNameIgnoringCase) {
    MakeDir("B");
    MakeDir("a");
    WriteFile("c.txt", "c");

    Listing listing = ListDirectory(root_);
    ASSERT_TRUE(listing.ok());
    ASSERT_EQ(listing.items.size(), 3u);
    EXPECT_EQ(listing.items[0].name, "a");
    EXPECT_EQ(listing.items[1].name, "B");
    EXPECT_EQ(listing.items[2].name, "c.txt");
    EXPECT_TRUE(listing.items[0].is_directory);
    EXPECT_FALSE(listing.items[2].is_directory);
}

TEST_F(DirectoryTest, FilesSortAfterDirectoriesRegardlessOfName) {
    WriteFile("A.txt", "a");
    MakeDir("z");
    WriteFile("b.txt", "b");

    Listing listing = ListDirectory(root_);
    ASSERT_TRUE(listing.ok());
    ASSERT_EQ(listing.items.size(), 3u);
    EXPECT_EQ(listing.items[0].name, "z");
    EXPECT_EQ(listing.items[1].name, "A.txt");
    EXPECT_EQ(listing.items[2].name, "b.txt");
}

TEST_F(DirectoryTest, EmptyDirectoryIsOk) {
    Listing listing = ListDirectory(MakeDir("empty"));
    EXPECT_TRUE(listing.ok());
    EXPECT_TRUE(listing.items.empty());
}

TEST_F(DirectoryTest, ReportsMissingAndNonDirectoryPaths) {
    Listing missing = ListDirectory(root_ / "missing");
    ASSERT_FALSE(missing.ok());
    EXPECT_EQ(missing.error->kind, ErrorKind::NotFound);
    EXPECT_TRUE(missing.items.empty());

    Listing file = ListDirectory(WriteFile("plain.txt", "x"));
    ASSERT_FALSE(file.ok());
    EXPECT_EQ(file.error->kind, ErrorKind::NotADirectory);
}

TEST_F(DirectoryTest, ReportsUnreadableDirectory) {
    if (::geteuid() == 0) {
        GTEST_SKIP() << "permission checks do not apply to root";
    }
    auto locked = MakeDir("locked");
    fs::permissions(locked, fs::perms::owner_read, fs::perm_options::remove);
    Listing listing = ListDirectory(locked);
    fs::permissions(locked, fs::perms::owner_read, fs::perm_options::add);

    ASSERT_FALSE(listing.ok());
    EXPECT_EQ(listing.error->kind, ErrorKind::PermissionDenied);
}

TEST_F(DirectoryTest, DanglingSymlinksAreSkipped) {
    WriteFile("real.txt", "x");
    fs::create_symlink(root_ / "nowhere", root_ / "broken");
    Listing listing = ListDirectory(root_);
    ASSERT_TRUE(listing.ok());
    ASSERT_EQ(listing.items.size(), 1u);
    EXPECT_EQ(listing.items[0].name, "real.txt");
}
