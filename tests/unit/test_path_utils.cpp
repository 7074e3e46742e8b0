#include <gtest/gtest.h>

#include "sift/path_utils.h"

#include <filesystem>

using namespace sift;
namespace fs = std::filesystem;

TEST(PathUtilsTest, NormalizeStripsDotsAndTrailingSeparator) {
    EXPECT_EQ(PathUtils::Normalize("/a/b/../c/./d/"), fs::path("/a/c/d"));
    EXPECT_EQ(PathUtils::Normalize("/"), fs::path("/"));
    EXPECT_TRUE(PathUtils::Normalize("").empty());
}

TEST(PathUtilsTest, RelativePathsBecomeAbsolute) {
    fs::path normal = PathUtils::Normalize("some/dir");
    EXPECT_TRUE(normal.is_absolute());
    EXPECT_EQ(normal, (fs::current_path() / "some/dir").lexically_normal());
}

TEST(PathUtilsTest, ParentOfRootIsRoot) {
    EXPECT_TRUE(PathUtils::IsRoot("/"));
    EXPECT_FALSE(PathUtils::IsRoot("/usr"));
    EXPECT_EQ(PathUtils::ParentOf("/"), fs::path("/"));
    EXPECT_EQ(PathUtils::ParentOf("/usr/lib/"), fs::path("/usr"));
}
