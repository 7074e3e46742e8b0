#include <gtest/gtest.h>

#include "sift/suggestions.h"
#include "test_support.h"

using namespace sift;
using sift::testing::ScratchDirTest;
namespace fs = std::filesystem;

class SuggestionsTest : public ScratchDirTest {
protected:
    void SetUp() override {
        ScratchDirTest::SetUp();
        work_ = MakeDir("work");
        docs_ = MakeDir("work/docs");
        src_ = MakeDir("work/src");
        music_ = MakeDir("music");
        photos_ = MakeDir("photos");
    }

    fs::path work_, docs_, src_, music_, photos_;
};

TEST_F(SuggestionsTest, ChildDirectoriesMustBeCountedDirectories) {
    auto file = WriteFile("work/readme.txt", "x");
    HistorySnapshot history;
    history.frequency_counts = {{docs_, 2}, {src_, 1}, {file, 9}, {music_, 3}};

    auto children = FrequentChildDirectories(history, work_);
    EXPECT_EQ(children, (std::vector<fs::path>{docs_, src_}));
}

TEST_F(SuggestionsTest, SiblingsExcludeCurrent) {
    HistorySnapshot history;
    history.frequency_counts = {{work_, 4}, {music_, 3}, {photos_, 1}, {docs_, 2}};

    auto siblings = FrequentSiblingDirectories(history, work_);
    EXPECT_EQ(siblings, (std::vector<fs::path>{music_, photos_}));
    EXPECT_TRUE(FrequentSiblingDirectories(history, "/").empty());
}

TEST_F(SuggestionsTest, ExtensionPeersFollowTheDominantRecentExtension) {
    auto a = WriteFile("work/a.md", "a");
    auto b = WriteFile("work/b.md", "b");
    auto c = WriteFile("work/c.md", "c");
    auto d = WriteFile("work/d.txt", "d");
    auto elsewhere = WriteFile("music/e.txt", "e");

    HistorySnapshot history;
    history.recent_paths = {d, a, b, elsewhere, root_ / "work/gone.txt"};

    EXPECT_EQ(RecentExtensionPeers(history, work_), (std::vector<fs::path>{a, b, c}));
}

TEST_F(SuggestionsTest, ExtensionTieGoesToMostRecent) {
    auto a = WriteFile("work/a.md", "a");
    auto d = WriteFile("work/d.txt", "d");
    WriteFile("work/e.txt", "e");

    HistorySnapshot history;
    history.recent_paths = {a, d};
    EXPECT_EQ(RecentExtensionPeers(history, work_), (std::vector<fs::path>{a}));
}

TEST_F(SuggestionsTest, NoRecentFilesMeansNoPeers) {
    HistorySnapshot history;
    history.recent_paths = {docs_};
    EXPECT_TRUE(RecentExtensionPeers(history, work_).empty());
}

TEST_F(SuggestionsTest, RankingDeduplicatesSortsAndTruncates) {
    HistorySnapshot history;
    history.frequency_counts = {{docs_, 1}, {src_, 5}, {music_, 3}};

    auto ranked = RankSuggestions(history, {{docs_, src_}, {docs_, photos_}, {music_}}, 10);
    EXPECT_EQ(ranked, (std::vector<fs::path>{src_, music_, docs_, photos_}));

    auto top = RankSuggestions(history, {{docs_, src_}, {music_}}, 2);
    EXPECT_EQ(top, (std::vector<fs::path>{src_, music_}));
}

TEST_F(SuggestionsTest, ContextualSuggestionsCombineAllSources) {
    auto notes = WriteFile("work/notes.md", "n");
    auto todo = WriteFile("work/todo.md", "t");

    HistorySnapshot history;
    history.recent_paths = {notes};
    history.frequency_counts = {{docs_, 3}, {music_, 7}, {notes, 1}};

    auto items = ContextualSuggestions(history, work_);
    std::vector<fs::path> paths;
    for (const auto& item : items) {
        paths.push_back(item.path);
    }
    EXPECT_EQ(paths, (std::vector<fs::path>{music_, docs_, notes, todo}));

    EXPECT_EQ(ContextualSuggestions(history, work_, 1).size(), 1u);
}
