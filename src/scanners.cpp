#include "sift/scanners.h"

#include "sift/logger.h"
#include "sift/metadata.h"
#include "sift/perf.h"
#include "sift/tree_walker.h"

#include <algorithm>
#include <functional>
#include <system_error>

namespace sift {

namespace fs = std::filesystem;

namespace {

// Resolved regular files under root that satisfy `keep`.
std::vector<FileDescriptor> CollectFiles(const fs::path& root,
                                         std::stop_token stop,
                                         const std::function<bool(const FileDescriptor&)>& keep)
{
    std::vector<FileDescriptor> matches;
    for (const fs::path& path : TreeWalker(root, stop)) {
        std::error_code ec;
        if (!fs::is_regular_file(fs::symlink_status(path, ec)) || ec) {
            continue;
        }
        auto descriptor = Resolve(path);
        if (!descriptor) {
            continue;
        }
        if (keep(*descriptor)) {
            matches.push_back(std::move(*descriptor));
        }
    }
    return matches;
}

void Truncate(std::vector<FileDescriptor>& items, std::size_t limit)
{
    if (items.size() > limit) {
        items.resize(limit);
    }
}

}  // namespace

fs::file_time_type AgeCutoff(unsigned min_age_days, fs::file_time_type now)
{
    using Duration = fs::file_time_type::duration;
    const auto max_days = std::chrono::duration_cast<std::chrono::days>(Duration::max()).count();
    if (static_cast<std::uintmax_t>(min_age_days) > static_cast<std::uintmax_t>(max_days)) {
        return fs::file_time_type::min();
    }
    const Duration age = std::chrono::duration_cast<Duration>(std::chrono::days(min_age_days));
    if (now.time_since_epoch() < Duration::min() + age) {
        return fs::file_time_type::min();
    }
    return now - age;
}

std::vector<FileDescriptor> FindLargeFiles(const fs::path& root,
                                           std::uintmax_t min_size,
                                           std::size_t limit,
                                           std::stop_token stop)
{
    perf::Timer timer("scanners::large");
    auto matches = CollectFiles(root, stop, [min_size](const FileDescriptor& item) {
        return item.size >= min_size;
    });
    std::stable_sort(matches.begin(), matches.end(),
        [](const FileDescriptor& a, const FileDescriptor& b) { return a.size > b.size; });
    Logger::instance().info("large: {} files of at least {} bytes under {}",
                            matches.size(), min_size, root.string());
    Truncate(matches, limit);
    return matches;
}

std::vector<FileDescriptor> FindOldFiles(const fs::path& root,
                                         unsigned min_age_days,
                                         std::size_t limit,
                                         std::stop_token stop)
{
    perf::Timer timer("scanners::old");
    const fs::file_time_type cutoff = AgeCutoff(min_age_days, fs::file_time_type::clock::now());
    auto matches = CollectFiles(root, stop, [cutoff](const FileDescriptor& item) {
        return item.modified < cutoff;
    });
    std::stable_sort(matches.begin(), matches.end(),
        [](const FileDescriptor& a, const FileDescriptor& b) { return a.modified < b.modified; });
    Logger::instance().info("old: {} files older than {} days under {}",
                            matches.size(), min_age_days, root.string());
    Truncate(matches, limit);
    return matches;
}

} // namespace sift
