#include "sift/suggestions.h"

#include "sift/categories.h"
#include "sift/directory.h"
#include "sift/logger.h"
#include "sift/metadata.h"
#include "sift/path_utils.h"

#include <algorithm>
#include <set>
#include <string>
#include <system_error>
#include <unordered_map>
#include <utility>

namespace sift {

namespace fs = std::filesystem;

namespace {

bool IsDirectory(const fs::path& path) {
    std::error_code ec;
    return fs::is_directory(path, ec) && !ec;
}

bool IsRegularFile(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec) && !ec;
}

std::vector<fs::path> CountedDirectoriesIn(const HistorySnapshot& history,
                                           const fs::path& parent,
                                           const fs::path& exclude) {
    std::vector<fs::path> matches;
    for (const auto& [path, count] : history.frequency_counts) {
        if (path == exclude) continue;
        if (path.parent_path() == parent && IsDirectory(path)) {
            matches.push_back(path);
        }
    }
    return matches;
}

}  // namespace

std::vector<fs::path> FrequentChildDirectories(const HistorySnapshot& history,
                                               const fs::path& current) {
    const fs::path dir = PathUtils::Normalize(current);
    return CountedDirectoriesIn(history, dir, dir);
}

std::vector<fs::path> RecentExtensionPeers(const HistorySnapshot& history,
                                           const fs::path& current) {
    const fs::path dir = PathUtils::Normalize(current);

    std::vector<std::string> order;
    std::unordered_map<std::string, std::size_t> counts;
    for (const auto& path : history.recent_paths) {
        if (path.parent_path() != dir || !IsRegularFile(path)) continue;
        std::string ext = ExtensionOf(path.filename().string());
        if (counts[ext]++ == 0) {
            order.push_back(std::move(ext));
        }
    }
    if (order.empty()) {
        return {};
    }

    // max_element keeps the first of equal counts, i.e. the most recent.
    const std::string& best = *std::max_element(order.begin(), order.end(),
        [&](const std::string& a, const std::string& b) { return counts[a] < counts[b]; });

    std::vector<fs::path> peers;
    Listing listing = ListDirectory(dir);
    if (!listing.ok()) {
        Logger::instance().debug("suggest: {}", listing.error->message);
        return peers;
    }
    for (const auto& item : listing.items) {
        if (!item.is_directory && ExtensionOf(item.name) == best) {
            peers.push_back(item.path);
        }
    }
    return peers;
}

std::vector<fs::path> FrequentSiblingDirectories(const HistorySnapshot& history,
                                                 const fs::path& current) {
    const fs::path dir = PathUtils::Normalize(current);
    if (PathUtils::IsRoot(dir)) {
        return {};
    }
    return CountedDirectoriesIn(history, dir.parent_path(), dir);
}

std::vector<fs::path> RankSuggestions(const HistorySnapshot& history,
                                      const std::vector<std::vector<fs::path>>& candidates,
                                      std::size_t limit) {
    std::vector<fs::path> merged;
    std::set<fs::path> seen;
    for (const auto& group : candidates) {
        for (const auto& path : group) {
            if (seen.insert(path).second) {
                merged.push_back(path);
            }
        }
    }
    std::stable_sort(merged.begin(), merged.end(), [&](const fs::path& a, const fs::path& b) {
        return history.CountOf(a) > history.CountOf(b);
    });
    if (merged.size() > limit) {
        merged.resize(limit);
    }
    return merged;
}

std::vector<FileDescriptor> ContextualSuggestions(const HistorySnapshot& history,
                                                  const fs::path& current,
                                                  std::size_t limit) {
    const auto ranked = RankSuggestions(history,
        {FrequentChildDirectories(history, current),
         RecentExtensionPeers(history, current),
         FrequentSiblingDirectories(history, current)},
        limit);

    std::vector<FileDescriptor> items;
    items.reserve(ranked.size());
    for (const auto& path : ranked) {
        if (auto item = Resolve(path)) {
            items.push_back(std::move(*item));
        }
    }
    return items;
}

} // namespace sift
