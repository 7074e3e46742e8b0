#pragma once

#include "sift/file_descriptor.h"
#include "sift/history_store.h"

#include <cstddef>
#include <filesystem>
#include <vector>

namespace sift {

inline constexpr std::size_t kDefaultSuggestionLimit = 10;

// Counted directories whose parent is `current`.
std::vector<std::filesystem::path> FrequentChildDirectories(
    const HistorySnapshot& history, const std::filesystem::path& current);

// Files in `current` sharing the extension most common among the recent
// files directly in `current`. Ties go to the extension seen first in
// recency order.
std::vector<std::filesystem::path> RecentExtensionPeers(
    const HistorySnapshot& history, const std::filesystem::path& current);

// Counted directories sharing `current`'s parent, excluding `current`.
// Empty when `current` is a filesystem root.
std::vector<std::filesystem::path> FrequentSiblingDirectories(
    const HistorySnapshot& history, const std::filesystem::path& current);

// Deduplicates (first occurrence wins), stable-sorts by access count
// descending and truncates to `limit`.
std::vector<std::filesystem::path> RankSuggestions(
    const HistorySnapshot& history,
    const std::vector<std::vector<std::filesystem::path>>& candidates,
    std::size_t limit);

// Best-effort ranking combining the three generators above.
std::vector<FileDescriptor> ContextualSuggestions(const HistorySnapshot& history,
                                                  const std::filesystem::path& current,
                                                  std::size_t limit = kDefaultSuggestionLimit);

} // namespace sift
