#include <gtest/gtest.h>

#include "sift/categories.h"
#include "sift/metadata.h"
#include "test_support.h"

using namespace sift;
using sift::testing::ScratchDirTest;
namespace fs = std::filesystem;

TEST(CategoriesTest, ClassifiesByExtensionIgnoringCase) {
    EXPECT_EQ(CategoryFor("report.PDF", false), Category::Document);
    EXPECT_EQ(CategoryFor("photo.jpeg", false), Category::Image);
    EXPECT_EQ(CategoryFor("song.flac", false), Category::Audio);
    EXPECT_EQ(CategoryFor("clip.mkv", false), Category::Video);
    EXPECT_EQ(CategoryFor("setup.exe", false), Category::Executable);
    EXPECT_EQ(CategoryFor("main.cpp", false), Category::Source);
    EXPECT_EQ(CategoryFor("debug.log", false), Category::Temporary);
    EXPECT_EQ(CategoryFor("backup.tar.gz", false), Category::Archive);
    EXPECT_EQ(CategoryFor("README", false), Category::Other);
    EXPECT_EQ(CategoryFor(".bashrc", false), Category::Other);
}

TEST(CategoriesTest, DirectoriesAlwaysMapToDirectory) {
    EXPECT_EQ(CategoryFor("photos.jpg", true), Category::Directory);
}

TEST(CategoriesTest, ExtensionOfIsLowercaseWithoutDot) {
    EXPECT_EQ(ExtensionOf("Notes.TXT"), "txt");
    EXPECT_EQ(ExtensionOf("archive.tar.gz"), "gz");
    EXPECT_EQ(ExtensionOf(".hidden"), "");
    EXPECT_EQ(ExtensionOf("plain"), "");
    EXPECT_EQ(ExtensionOf("trailing."), "");
}

TEST(CategoriesTest, TagsRoundTrip) {
    for (Category category : kAllCategories) {
        auto parsed = ParseCategory(ToString(category));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, category);
        EXPECT_FALSE(IconFor(category).empty());
    }
    EXPECT_FALSE(ParseCategory("spreadsheet").has_value());
}

class MetadataTest : public ScratchDirTest {};

TEST_F(MetadataTest, ResolvesFileDescriptor) {
    auto file = WriteFile("notes.txt", std::string(500, 'x'));
    auto item = Resolve(file);
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(item->path, file);
    EXPECT_EQ(item->name, "notes.txt");
    EXPECT_FALSE(item->is_directory);
    EXPECT_EQ(item->size, 500u);
    EXPECT_EQ(item->category, Category::Document);
    ASSERT_TRUE(item->FormattedSize().has_value());
    EXPECT_EQ(*item->FormattedSize(), "500 B");
}

TEST_F(MetadataTest, DirectoriesHaveNoFormattedSize) {
    auto dir = MakeDir("photos");
    auto item = Resolve(dir);
    ASSERT_TRUE(item.has_value());
    EXPECT_TRUE(item->is_directory);
    EXPECT_EQ(item->size, 0u);
    EXPECT_EQ(item->category, Category::Directory);
    EXPECT_FALSE(item->FormattedSize().has_value());
}

TEST_F(MetadataTest, MissingPathResolvesToNothing) {
    EXPECT_FALSE(Resolve(root_ / "missing.txt").has_value());
    EXPECT_FALSE(Resolve({}).has_value());
}

TEST_F(MetadataTest, FollowsSymlinks) {
    auto target = WriteFile("target.png", "abc");
    fs::create_symlink(target, root_ / "link");
    auto item = Resolve(root_ / "link");
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(item->name, "link");
    EXPECT_EQ(item->size, 3u);

    fs::create_symlink(root_ / "gone", root_ / "dangling");
    EXPECT_FALSE(Resolve(root_ / "dangling").has_value());
}

TEST_F(MetadataTest, CategorizeKeepsInputOrderWithinGroups) {
    std::vector<FileDescriptor> items;
    for (const char* name : {"b.txt", "a.png", "c.txt"}) {
        auto item = Resolve(WriteFile(name, "x"));
        ASSERT_TRUE(item.has_value());
        items.push_back(*item);
    }
    CategoryGroups groups = CategorizeItems(items);
    ASSERT_EQ(groups.size(), 2u);
    ASSERT_EQ(groups[Category::Document].size(), 2u);
    EXPECT_EQ(groups[Category::Document][0].name, "b.txt");
    EXPECT_EQ(groups[Category::Document][1].name, "c.txt");
    EXPECT_EQ(groups[Category::Image].front().name, "a.png");
}
