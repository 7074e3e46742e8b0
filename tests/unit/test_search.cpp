#include <gtest/gtest.h>

#include "sift/search.h"
#include "test_support.h"

#include <algorithm>
#include <set>

using namespace sift;
using sift::testing::Days;
using sift::testing::ScratchDirTest;

class SearchTest : public ScratchDirTest {
protected:
    void SetUp() override {
        ScratchDirTest::SetUp();
        WriteFile("Report.TXT", "quarterly numbers\nTODO: revenue");
        WriteFile("notes.md", "meeting notes about revenue");
        WriteFile("sub/report_draft.docx", "binary-ish revenue");
        WriteFile("sub/data.csv", "id,value\n1,2");
        WriteFile("sub/image.png", std::string(2048, 'p'));
        MakeDir("reports");
    }

    std::set<std::string> Names(const SearchCriteria& criteria) {
        std::set<std::string> names;
        for (const auto& item : Search(root_, criteria)) {
            names.insert(item.name);
        }
        return names;
    }
};

TEST_F(SearchTest, NameModeIsCaseInsensitiveByDefault) {
    SearchCriteria criteria;
    criteria.keyword = "report";
    EXPECT_EQ(Names(criteria), (std::set<std::string>{"Report.TXT", "report_draft.docx", "reports"}));

    criteria.case_sensitive = true;
    EXPECT_EQ(Names(criteria), (std::set<std::string>{"report_draft.docx", "reports"}));
}

TEST_F(SearchTest, ExtensionModeAcceptsKeywordWithOrWithoutDot) {
    SearchCriteria criteria;
    criteria.mode = SearchMode::Extension;
    criteria.keyword = "txt";
    EXPECT_EQ(Names(criteria), (std::set<std::string>{"Report.TXT"}));

    criteria.keyword = ".csv";
    EXPECT_EQ(Names(criteria), (std::set<std::string>{"data.csv"}));
}

TEST_F(SearchTest, ContentModeReadsOnlyTextFiles) {
    SearchCriteria criteria;
    criteria.mode = SearchMode::Content;
    criteria.keyword = "REVENUE";
    EXPECT_EQ(Names(criteria), (std::set<std::string>{"Report.TXT", "notes.md"}));

    criteria.case_sensitive = true;
    EXPECT_TRUE(Names(criteria).empty());
}

TEST_F(SearchTest, SizeLimitsApplyToFilesOnly) {
    SearchCriteria criteria;
    criteria.keyword = "";
    criteria.min_size = 1024;
    EXPECT_EQ(Names(criteria), (std::set<std::string>{"image.png", "sub", "reports"}));

    criteria.min_size = 0;
    criteria.max_size = 16;
    auto names = Names(criteria);
    EXPECT_TRUE(names.count("data.csv"));
    EXPECT_FALSE(names.count("image.png"));
    EXPECT_TRUE(names.count("reports"));
}

TEST_F(SearchTest, AgeLimitKeepsOlderFiles) {
    SetAge(root_ / "notes.md", Days(40));
    SearchCriteria criteria;
    criteria.mode = SearchMode::Extension;
    criteria.keyword = "md";
    criteria.min_age_days = 30;
    EXPECT_EQ(Names(criteria), (std::set<std::string>{"notes.md"}));

    criteria.min_age_days = 60;
    EXPECT_TRUE(Names(criteria).empty());
}

TEST_F(SearchTest, AgeBeyondClockRangeMatchesNothing) {
    SetAge(root_ / "notes.md", Days(4000));
    SearchCriteria criteria;
    criteria.mode = SearchMode::Extension;
    criteria.keyword = "md";
    criteria.min_age_days = 200000;
    EXPECT_TRUE(Names(criteria).empty());
}

TEST_F(SearchTest, ParsesModeNames) {
    EXPECT_EQ(ParseSearchMode("Name"), SearchMode::Name);
    EXPECT_EQ(ParseSearchMode("ext"), SearchMode::Extension);
    EXPECT_EQ(ParseSearchMode("content"), SearchMode::Content);
    EXPECT_FALSE(ParseSearchMode("regex").has_value());
    EXPECT_EQ(ToString(SearchMode::Extension), "extension");
}

TEST_F(SearchTest, FileContainsFindsMatchesAcrossChunks) {
    std::string content(70 * 1024, 'a');
    content.replace(64 * 1024 - 3, 6, "needle");
    auto file = WriteFile("big.log", content);
    EXPECT_TRUE(FileContains(file, "needle", true));
    EXPECT_TRUE(FileContains(file, "NEEDLE", false));
    EXPECT_FALSE(FileContains(file, "haystack", false));
    EXPECT_FALSE(FileContains(root_ / "missing.log", "x", false));
}

TEST(SearchableTest, TextExtensions) {
    EXPECT_TRUE(IsContentSearchable("a.TXT"));
    EXPECT_TRUE(IsContentSearchable("script.py"));
    EXPECT_FALSE(IsContentSearchable("movie.mp4"));
    EXPECT_FALSE(IsContentSearchable("txt"));
}
