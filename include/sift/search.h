#pragma once

#include "sift/file_descriptor.h"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace sift {

enum class SearchMode {
    Name,
    Extension,
    Content
};

// Zero values mean "no constraint". Size and age limits apply to files only.
struct SearchCriteria {
    std::string keyword;
    SearchMode mode = SearchMode::Name;
    bool case_sensitive = false;
    std::uintmax_t min_size = 0;
    std::uintmax_t max_size = 0;
    unsigned min_age_days = 0;
};

std::string_view ToString(SearchMode mode) noexcept;
std::optional<SearchMode> ParseSearchMode(std::string_view name);

// Walks `root` and returns matching entries in traversal order.
//  Name: keyword is a substring of the entry name.
//  Extension: the name's last extension equals the keyword (leading dot optional).
//  Content: text files whose contents contain the keyword; directories never match.
std::vector<FileDescriptor> Search(const std::filesystem::path& root,
                                   const SearchCriteria& criteria,
                                   std::stop_token stop = {});

// Whether content search reads files with this name.
bool IsContentSearchable(std::string_view name);

// Streams the file looking for `needle`. False on any read failure.
bool FileContains(const std::filesystem::path& path,
                  std::string_view needle,
                  bool case_sensitive,
                  std::stop_token stop = {});

} // namespace sift
