#pragma once

#include "sift/error.h"
#include "sift/file_descriptor.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace sift {

// Copy of the access history handed to the suggestion engine.
struct HistorySnapshot {
    std::vector<std::filesystem::path> recent_paths;
    std::map<std::filesystem::path, std::uint64_t> frequency_counts;

    [[nodiscard]] std::uint64_t CountOf(const std::filesystem::path& path) const;
};

// Recently and frequently accessed paths, persisted as one JSON document:
//
//   {"recent_paths": ["/a", ...], "frequency_counts": {"/a": 3, ...}}
//
// Every mutation rewrites the document through a temporary file and a
// rename. Paths that no longer exist are pruned from memory whenever the
// history is loaded or read. All members are safe to call concurrently.
class HistoryStore {
public:
    static constexpr std::size_t kMaxRecent = 50;
    static constexpr std::size_t kDefaultFrequentLimit = 20;

    explicit HistoryStore(std::filesystem::path file);

    // Replaces the in-memory state with the file's contents. A missing file
    // gives an empty history; a corrupt one is logged and also gives an
    // empty history. Returns false only for the corrupt case.
    bool Load();
    Status Save();

    // No-op for paths that do not exist. Otherwise moves the normalized path
    // to the front of the recent list, bumps its count and saves.
    void RecordAccess(const std::filesystem::path& path);

    std::vector<FileDescriptor> RecentItems();
    std::vector<FileDescriptor> FrequentItems(std::size_t limit = kDefaultFrequentLimit);
    HistorySnapshot Snapshot();

    [[nodiscard]] const std::filesystem::path& file() const noexcept { return file_; }

private:
    void PruneLocked();
    Status SaveLocked() const;
    std::string SerializeLocked() const;

    std::filesystem::path file_;
    std::mutex mutex_;
    std::vector<std::filesystem::path> recent_;
    std::map<std::filesystem::path, std::uint64_t> frequency_;
};

} // namespace sift
