#pragma once

#include "sift/digest.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace sift {

class DigestCache;

struct DuplicateGroup {
    std::string digest;
    std::uintmax_t size = 0;
    // Traversal order, at least two entries.
    std::vector<std::filesystem::path> paths;

    // Bytes reclaimable by keeping a single copy.
    [[nodiscard]] std::uintmax_t WastedBytes() const noexcept {
        return paths.empty() ? 0 : size * (paths.size() - 1);
    }
};

struct DuplicateOptions {
    DigestAlgorithm algorithm = DigestAlgorithm::Md5;
    std::uintmax_t min_size = 1024 * 1024;
    // Digest worker threads; 0 uses the hardware concurrency.
    unsigned jobs = 0;
    std::size_t chunk_size = kDefaultChunkSize;
    // Optional, not owned.
    DigestCache* cache = nullptr;
};

// Digest of one duplicate candidate that was bucketed at `expected_size`.
// Empty when the file can no longer be read or its size has changed since
// it was bucketed, before or during hashing. Uses `options.cache` if set.
std::optional<std::string> DigestCandidate(const std::filesystem::path& path,
                                           std::uintmax_t expected_size,
                                           const DuplicateOptions& options,
                                           std::stop_token stop = {});

// Finds regular files under `root` with identical size and content.
//
// Files are first bucketed by exact size (only sizes >= min_size), and only
// buckets with two or more members are digested. Groups come out in
// first-seen bucket order, then first-seen digest order; members keep
// traversal order. Files that cannot be digested are left out. The result
// does not depend on `jobs`. A stop request yields an empty result.
std::vector<DuplicateGroup> FindDuplicates(const std::filesystem::path& root,
                                           const DuplicateOptions& options = {},
                                           std::stop_token stop = {});

std::uintmax_t TotalWastedBytes(const std::vector<DuplicateGroup>& groups) noexcept;

} // namespace sift
