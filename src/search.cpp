#include "sift/search.h"

#include "sift/logger.h"
#include "sift/metadata.h"
#include "sift/perf.h"
#include "sift/scanners.h"
#include "sift/string_utils.h"
#include "sift/tree_walker.h"

#include <array>
#include <chrono>
#include <fstream>
#include <vector>

namespace sift {

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kContentChunk = 64 * 1024;

constexpr std::array<std::string_view, 10> kTextExtensions{
    ".txt", ".log", ".csv", ".json", ".xml", ".py", ".html", ".css", ".js", ".md"};

std::string Fold(std::string_view text, bool case_sensitive) {
    return case_sensitive ? std::string(text) : StringUtils::ToLower(text);
}

// Last extension including the dot, "" for dotfiles and bare names.
std::string_view DottedExtension(std::string_view name) {
    auto pos = name.rfind('.');
    if (pos == std::string_view::npos || pos == 0) return {};
    return name.substr(pos);
}

bool MatchesName(const FileDescriptor& item, const SearchCriteria& criteria,
                 const std::string& keyword) {
    switch (criteria.mode) {
    case SearchMode::Name:
        return Fold(item.name, criteria.case_sensitive).find(keyword) != std::string::npos;
    case SearchMode::Extension: {
        std::string_view ext = DottedExtension(item.name);
        return !ext.empty() && Fold(ext, criteria.case_sensitive) == keyword;
    }
    case SearchMode::Content:
        break;
    }
    return true;
}

bool MatchesLimits(const FileDescriptor& item, const SearchCriteria& criteria,
                   fs::file_time_type cutoff) {
    if (item.is_directory) return true;
    if (criteria.min_size > 0 && item.size < criteria.min_size) return false;
    if (criteria.max_size > 0 && item.size > criteria.max_size) return false;
    if (criteria.min_age_days > 0 && item.modified > cutoff) return false;
    return true;
}

}  // namespace

std::string_view ToString(SearchMode mode) noexcept {
    switch (mode) {
    case SearchMode::Name:
        return "name";
    case SearchMode::Extension:
        return "extension";
    case SearchMode::Content:
        break;
    }
    return "content";
}

std::optional<SearchMode> ParseSearchMode(std::string_view name) {
    const std::string lowered = StringUtils::ToLower(name);
    if (lowered == "name") return SearchMode::Name;
    if (lowered == "extension" || lowered == "ext") return SearchMode::Extension;
    if (lowered == "content") return SearchMode::Content;
    return std::nullopt;
}

bool IsContentSearchable(std::string_view name) {
    const std::string lowered = StringUtils::ToLower(name);
    for (std::string_view ext : kTextExtensions) {
        if (StringUtils::EndsWith(lowered, ext)) return true;
    }
    return false;
}

bool FileContains(const fs::path& path, std::string_view needle, bool case_sensitive,
                  std::stop_token stop) {
    if (needle.empty()) return true;
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        Logger::instance().debug("search: cannot open {}", path.string());
        return false;
    }

    const std::string folded_needle = Fold(needle, case_sensitive);
    const std::size_t overlap = folded_needle.size() - 1;
    std::vector<char> buffer(kContentChunk);
    std::string window;
    while (input) {
        if (stop.stop_requested()) return false;
        input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const std::streamsize got = input.gcount();
        if (got <= 0) break;
        window.append(buffer.data(), static_cast<std::size_t>(got));
        if (!case_sensitive) {
            window = StringUtils::ToLower(window);
        }
        if (window.find(folded_needle) != std::string::npos) {
            return true;
        }
        // Keep enough of the tail to catch a match straddling two chunks.
        if (window.size() > overlap) {
            window.erase(0, window.size() - overlap);
        }
    }
    if (input.bad()) {
        Logger::instance().debug("search: read error on {}", path.string());
    }
    return false;
}

std::vector<FileDescriptor> Search(const fs::path& root,
                                   const SearchCriteria& criteria,
                                   std::stop_token stop) {
    perf::Timer timer("search::run");
    std::vector<FileDescriptor> results;

    std::string keyword = Fold(criteria.keyword, criteria.case_sensitive);
    if (criteria.mode == SearchMode::Extension && !keyword.empty() && keyword.front() != '.') {
        keyword.insert(keyword.begin(), '.');
    }
    const fs::file_time_type cutoff = AgeCutoff(criteria.min_age_days, fs::file_time_type::clock::now());

    for (const fs::path& path : TreeWalker(root, stop)) {
        auto item = Resolve(path);
        if (!item) continue;
        if (!MatchesName(*item, criteria, keyword)) continue;
        if (!MatchesLimits(*item, criteria, cutoff)) continue;
        if (criteria.mode == SearchMode::Content) {
            if (item->is_directory || !IsContentSearchable(item->name)) continue;
            if (!FileContains(item->path, criteria.keyword, criteria.case_sensitive, stop)) continue;
        }
        results.push_back(std::move(*item));
    }

    Logger::instance().info("search: {} matches for '{}' ({}) under {}",
                            results.size(), criteria.keyword, ToString(criteria.mode), root.string());
    perf::Manager::Instance().IncrementCounter("search::matches", results.size());
    return results;
}

} // namespace sift
