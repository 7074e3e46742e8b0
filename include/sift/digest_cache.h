#pragma once

#include "sift/digest.h"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

struct sqlite3;

namespace sift {

// SQLite-backed memo of file digests keyed by (path, algorithm). An entry
// only hits while the file's size and modification time are unchanged.
// Failures are logged and reported as misses. Safe to share between threads.
class DigestCache {
public:
    // nullptr when the database cannot be opened or initialised.
    static std::unique_ptr<DigestCache> Open(const std::filesystem::path& path);

    ~DigestCache();
    DigestCache(const DigestCache&) = delete;
    DigestCache& operator=(const DigestCache&) = delete;

    std::optional<std::string> Lookup(const std::filesystem::path& path,
                                      DigestAlgorithm algorithm,
                                      std::uintmax_t size,
                                      std::filesystem::file_time_type mtime);

    void Store(const std::filesystem::path& path,
               DigestAlgorithm algorithm,
               std::uintmax_t size,
               std::filesystem::file_time_type mtime,
               const std::string& digest);

    // Number of cached rows, or 0 on error.
    std::uint64_t size();

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    DigestCache(sqlite3* db, std::filesystem::path path);

    bool Execute(std::string_view sql);

    sqlite3* db_;
    std::filesystem::path path_;
    std::mutex mutex_;
};

} // namespace sift
