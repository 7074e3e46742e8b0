#include <gtest/gtest.h>

#include "sift/history_store.h"
#include "test_support.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <set>
#include <thread>

using namespace sift;
using sift::testing::ScratchDirTest;
namespace fs = std::filesystem;

class HistoryStoreTest : public ScratchDirTest {
protected:
    fs::path HistoryFile() const { return root_ / "state/history.json"; }

    static std::vector<fs::path> PathsOf(const std::vector<FileDescriptor>& items) {
        std::vector<fs::path> paths;
        for (const auto& item : items) {
            paths.push_back(item.path);
        }
        return paths;
    }
};

TEST_F(HistoryStoreTest, MissingFileStartsEmpty) {
    HistoryStore store(HistoryFile());
    EXPECT_TRUE(store.Load());
    EXPECT_TRUE(store.RecentItems().empty());
    EXPECT_TRUE(store.FrequentItems().empty());
}

TEST_F(HistoryStoreTest, ReaccessMovesToFrontWithoutDuplicates) {
    auto a = WriteFile("a.txt", "a");
    auto b = WriteFile("b.txt", "b");
    HistoryStore store(HistoryFile());
    store.RecordAccess(a);
    store.RecordAccess(b);
    store.RecordAccess(a);

    EXPECT_EQ(PathsOf(store.RecentItems()), (std::vector<fs::path>{a, b}));
    EXPECT_EQ(store.Snapshot().CountOf(a), 2u);
    EXPECT_EQ(store.Snapshot().CountOf(b), 1u);
}

TEST_F(HistoryStoreTest, RecentListIsCapped) {
    HistoryStore store(HistoryFile());
    std::vector<fs::path> files;
    for (std::size_t i = 0; i < HistoryStore::kMaxRecent + 5; ++i) {
        files.push_back(WriteFile("f" + std::to_string(i), "x"));
        store.RecordAccess(files.back());
    }
    auto recent = store.RecentItems();
    ASSERT_EQ(recent.size(), HistoryStore::kMaxRecent);
    EXPECT_EQ(recent.front().path, files.back());
    // Counts survive eviction from the recent list.
    EXPECT_EQ(store.Snapshot().frequency_counts.size(), files.size());
}

TEST_F(HistoryStoreTest, MissingPathIsIgnored) {
    auto a = WriteFile("a.txt", "a");
    HistoryStore store(HistoryFile());
    store.RecordAccess(a);
    const auto before = PathsOf(store.RecentItems());

    store.RecordAccess(root_ / "ghost.txt");
    EXPECT_EQ(PathsOf(store.RecentItems()), before);
    EXPECT_EQ(store.Snapshot().CountOf(root_ / "ghost.txt"), 0u);
}

TEST_F(HistoryStoreTest, FrequentItemsAreOrderedByCount) {
    auto a = WriteFile("a.txt", "a");
    auto b = WriteFile("b.txt", "b");
    auto c = MakeDir("c");
    HistoryStore store(HistoryFile());
    for (int i = 0; i < 3; ++i) store.RecordAccess(b);
    for (int i = 0; i < 5; ++i) store.RecordAccess(c);
    store.RecordAccess(a);

    EXPECT_EQ(PathsOf(store.FrequentItems()), (std::vector<fs::path>{c, b, a}));
    EXPECT_EQ(PathsOf(store.FrequentItems(2)), (std::vector<fs::path>{c, b}));
    EXPECT_TRUE(store.FrequentItems(0).empty());
}

TEST_F(HistoryStoreTest, SaveAndReloadRoundTrip) {
    auto a = WriteFile("a.txt", "a");
    auto b = MakeDir("b");
    {
        HistoryStore store(HistoryFile());
        store.RecordAccess(a);
        store.RecordAccess(b);
        store.RecordAccess(b);
    }
    EXPECT_TRUE(fs::exists(HistoryFile()));

    HistoryStore reloaded(HistoryFile());
    ASSERT_TRUE(reloaded.Load());
    HistorySnapshot snapshot = reloaded.Snapshot();
    EXPECT_EQ(snapshot.recent_paths, (std::vector<fs::path>{b, a}));
    EXPECT_EQ(snapshot.CountOf(a), 1u);
    EXPECT_EQ(snapshot.CountOf(b), 2u);
}

TEST_F(HistoryStoreTest, DeletedPathsArePruned) {
    auto a = WriteFile("a.txt", "a");
    auto b = WriteFile("b.txt", "b");
    HistoryStore store(HistoryFile());
    store.RecordAccess(a);
    store.RecordAccess(b);
    fs::remove(a);

    EXPECT_EQ(PathsOf(store.RecentItems()), (std::vector<fs::path>{b}));
    EXPECT_EQ(store.Snapshot().CountOf(a), 0u);
}

TEST_F(HistoryStoreTest, CorruptFileResetsToEmpty) {
    WriteFile("state/history.json", "{ this is not json");
    HistoryStore store(HistoryFile());
    EXPECT_FALSE(store.Load());
    EXPECT_TRUE(store.RecentItems().empty());

    auto a = WriteFile("a.txt", "a");
    store.RecordAccess(a);
    HistoryStore reloaded(HistoryFile());
    EXPECT_TRUE(reloaded.Load());
    EXPECT_EQ(reloaded.Snapshot().recent_paths, (std::vector<fs::path>{a}));
}

TEST_F(HistoryStoreTest, ReadsLegacyKeys) {
    auto a = WriteFile("a.txt", "a");
    auto b = WriteFile("b.txt", "b");
    nlohmann::json legacy;
    legacy["recent_files"] = {a.string(), b.string(), a.string()};
    legacy["frequent_items"] = {{a.string(), 4}, {b.string(), 1}};
    WriteFile("state/history.json", legacy.dump());

    HistoryStore store(HistoryFile());
    ASSERT_TRUE(store.Load());
    HistorySnapshot snapshot = store.Snapshot();
    EXPECT_EQ(snapshot.recent_paths, (std::vector<fs::path>{a, b}));
    EXPECT_EQ(snapshot.CountOf(a), 4u);
}

TEST_F(HistoryStoreTest, WritesCurrentKeys) {
    auto a = WriteFile("a.txt", "a");
    HistoryStore store(HistoryFile());
    store.RecordAccess(a);

    std::ifstream in(HistoryFile());
    nlohmann::json document = nlohmann::json::parse(in);
    ASSERT_TRUE(document.contains("recent_paths"));
    ASSERT_TRUE(document.contains("frequency_counts"));
    EXPECT_EQ(document["recent_paths"][0].get<std::string>(), a.string());
    EXPECT_EQ(document["frequency_counts"][a.string()].get<int>(), 1);
}

TEST_F(HistoryStoreTest, NonUtf8NameDoesNotBreakPersistence) {
    const fs::path latin1 = WriteFile(std::string("caf\xe9.txt"), "x");
    if (!fs::exists(latin1)) {
        GTEST_SKIP() << "filesystem rejects non-UTF-8 names";
    }
    auto plain = WriteFile("plain.txt", "p");

    HistoryStore store(HistoryFile());
    EXPECT_NO_THROW(store.RecordAccess(latin1));
    EXPECT_NO_THROW(store.RecordAccess(plain));
    EXPECT_EQ(store.Snapshot().CountOf(latin1), 1u);
    EXPECT_TRUE(store.Save().ok());

    std::ifstream in(HistoryFile());
    nlohmann::json document = nlohmann::json::parse(in, nullptr, false);
    ASSERT_FALSE(document.is_discarded());

    HistoryStore reloaded(HistoryFile());
    ASSERT_TRUE(reloaded.Load());
    HistorySnapshot snapshot = reloaded.Snapshot();
    ASSERT_FALSE(snapshot.recent_paths.empty());
    EXPECT_EQ(snapshot.recent_paths.front(), plain);
    EXPECT_EQ(snapshot.CountOf(plain), 1u);
}

TEST_F(HistoryStoreTest, ConcurrentAccessesAreAllPersisted) {
    constexpr int kThreads = 4;
    constexpr int kFilesPerThread = 10;
    constexpr int kRepeats = 3;

    std::vector<std::vector<fs::path>> files(kThreads);
    for (int t = 0; t < kThreads; ++t) {
        for (int i = 0; i < kFilesPerThread; ++i) {
            files[t].push_back(WriteFile("t" + std::to_string(t) + "_" + std::to_string(i), "x"));
        }
    }

    {
        HistoryStore store(HistoryFile());
        std::vector<std::thread> threads;
        for (int t = 0; t < kThreads; ++t) {
            threads.emplace_back([&store, &files, t]() {
                for (int r = 0; r < kRepeats; ++r) {
                    for (const auto& path : files[t]) {
                        store.RecordAccess(path);
                    }
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
    }

    std::ifstream in(HistoryFile());
    ASSERT_FALSE(nlohmann::json::parse(in, nullptr, false).is_discarded());

    HistoryStore reloaded(HistoryFile());
    ASSERT_TRUE(reloaded.Load());
    HistorySnapshot snapshot = reloaded.Snapshot();

    std::uint64_t total = 0;
    for (const auto& [path, count] : snapshot.frequency_counts) {
        EXPECT_EQ(count, static_cast<std::uint64_t>(kRepeats)) << path.string();
        total += count;
    }
    EXPECT_EQ(snapshot.frequency_counts.size(), static_cast<std::size_t>(kThreads * kFilesPerThread));
    EXPECT_EQ(total, static_cast<std::uint64_t>(kThreads * kFilesPerThread * kRepeats));

    std::set<fs::path> unique(snapshot.recent_paths.begin(), snapshot.recent_paths.end());
    EXPECT_EQ(unique.size(), snapshot.recent_paths.size());
    EXPECT_EQ(snapshot.recent_paths.size(), static_cast<std::size_t>(kThreads * kFilesPerThread));

    for (const auto& entry : fs::directory_iterator(HistoryFile().parent_path())) {
        EXPECT_NE(entry.path().extension(), ".tmp") << entry.path().string();
    }
}
