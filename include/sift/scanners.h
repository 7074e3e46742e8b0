#pragma once

#include "sift/file_descriptor.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <stop_token>
#include <vector>

namespace sift {

inline constexpr std::uintmax_t kDefaultLargeFileSize = 100ull * 1024 * 1024;
inline constexpr unsigned kDefaultOldFileDays = 365;
inline constexpr std::size_t kDefaultScanLimit = 50;

// Modification time `min_age_days` before `now`. Ages that reach past the
// clock's range clamp to file_time_type::min(), so nothing counts as that old.
std::filesystem::file_time_type AgeCutoff(unsigned min_age_days,
                                          std::filesystem::file_time_type now);

// Regular files of at least `min_size` bytes, largest first (ties keep
// traversal order), at most `limit` entries.
std::vector<FileDescriptor> FindLargeFiles(const std::filesystem::path& root,
                                           std::uintmax_t min_size = kDefaultLargeFileSize,
                                           std::size_t limit = kDefaultScanLimit,
                                           std::stop_token stop = {});

// Regular files last modified strictly before now - `min_age_days`, oldest
// first, at most `limit` entries. "Now" is sampled once at scan start.
// Access times are never consulted.
std::vector<FileDescriptor> FindOldFiles(const std::filesystem::path& root,
                                         unsigned min_age_days = kDefaultOldFileDays,
                                         std::size_t limit = kDefaultScanLimit,
                                         std::stop_token stop = {});

} // namespace sift
