#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace sift {

enum class DigestAlgorithm {
    Md5,
    Sha1,
    Sha256
};

inline constexpr std::size_t kDefaultChunkSize = 64 * 1024;

std::string_view ToString(DigestAlgorithm algorithm) noexcept;

// Accepts "md5", "sha1", "sha256" in any case.
std::optional<DigestAlgorithm> ParseAlgorithm(std::string_view name);

// Lowercase hex digest of a regular file, streamed `chunk_size` bytes at a
// time (0 selects kDefaultChunkSize). std::nullopt on any I/O failure or
// when a stop is requested before the file is fully read.
std::optional<std::string> Digest(const std::filesystem::path& path,
                                  DigestAlgorithm algorithm = DigestAlgorithm::Md5,
                                  std::size_t chunk_size = kDefaultChunkSize,
                                  std::stop_token stop = {});

// Digest of an in-memory buffer.
std::string DigestBytes(std::string_view data, DigestAlgorithm algorithm);

} // namespace sift
