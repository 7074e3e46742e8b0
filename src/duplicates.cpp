#include "sift/duplicates.h"

#include "sift/digest_cache.h"
#include "sift/logger.h"
#include "sift/perf.h"
#include "sift/tree_walker.h"

#include <algorithm>
#include <atomic>
#include <optional>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <utility>

namespace sift {

namespace fs = std::filesystem;

namespace {

struct SizeBucket {
    std::uintmax_t size = 0;
    std::vector<fs::path> paths;
};

struct DigestTask {
    std::size_t bucket = 0;
    std::uintmax_t size = 0;
    const fs::path* path = nullptr;
};

std::vector<SizeBucket> BucketBySize(const fs::path& root,
                                     std::uintmax_t min_size,
                                     std::stop_token stop)
{
    perf::Timer timer("duplicates::bucket");
    std::vector<SizeBucket> buckets;
    std::unordered_map<std::uintmax_t, std::size_t> index_by_size;

    for (const fs::path& path : TreeWalker(root, stop)) {
        std::error_code ec;
        fs::file_status status = fs::symlink_status(path, ec);
        if (ec || !fs::is_regular_file(status)) {
            continue;
        }
        const std::uintmax_t size = fs::file_size(path, ec);
        if (ec) {
            Logger::instance().debug("duplicates: cannot size {}: {}", path.string(), ec.message());
            continue;
        }
        if (size < min_size) {
            continue;
        }
        auto [it, inserted] = index_by_size.try_emplace(size, buckets.size());
        if (inserted) {
            buckets.push_back(SizeBucket{size, {}});
        }
        buckets[it->second].paths.push_back(path);
    }
    return buckets;
}

std::vector<std::optional<std::string>> DigestAll(const std::vector<DigestTask>& tasks,
                                                  const DuplicateOptions& options,
                                                  std::stop_token stop)
{
    perf::Timer timer("duplicates::digest");
    std::vector<std::optional<std::string>> results(tasks.size());
    std::atomic<std::size_t> next{0};

    auto worker = [&]() {
        for (;;) {
            const std::size_t i = next.fetch_add(1, std::memory_order_relaxed);
            if (i >= tasks.size() || stop.stop_requested()) {
                return;
            }
            results[i] = DigestCandidate(*tasks[i].path, tasks[i].size, options, stop);
        }
    };

    unsigned jobs = options.jobs;
    if (jobs == 0) {
        jobs = std::max(1u, std::thread::hardware_concurrency());
    }
    jobs = static_cast<unsigned>(std::min<std::size_t>(jobs, tasks.size()));

    if (jobs <= 1) {
        worker();
        return results;
    }

    Logger::instance().debug("duplicates: digesting {} files on {} threads", tasks.size(), jobs);
    {
        std::vector<std::jthread> pool;
        pool.reserve(jobs);
        for (unsigned t = 0; t < jobs; ++t) {
            pool.emplace_back(worker);
        }
    }
    return results;
}

}  // namespace

std::optional<std::string> DigestCandidate(const fs::path& path,
                                           std::uintmax_t expected_size,
                                           const DuplicateOptions& options,
                                           std::stop_token stop)
{
    std::error_code size_ec;
    std::error_code time_ec;
    const std::uintmax_t size = fs::file_size(path, size_ec);
    const fs::file_time_type mtime = fs::last_write_time(path, time_ec);
    if (size_ec) {
        Logger::instance().debug("duplicates: cannot size {}: {}", path.string(), size_ec.message());
        return std::nullopt;
    }
    if (size != expected_size) {
        Logger::instance().debug("duplicates: {} changed size during the scan", path.string());
        perf::Manager::Instance().IncrementCounter("duplicates::resized");
        return std::nullopt;
    }

    const bool cacheable = options.cache != nullptr && !time_ec;
    if (cacheable) {
        if (auto cached = options.cache->Lookup(path, options.algorithm, size, mtime)) {
            return cached;
        }
    }
    auto digest = Digest(path, options.algorithm, options.chunk_size, stop);
    if (!digest) {
        return std::nullopt;
    }

    std::error_code after_ec;
    if (fs::file_size(path, after_ec) != expected_size || after_ec) {
        Logger::instance().debug("duplicates: {} changed size while hashing", path.string());
        perf::Manager::Instance().IncrementCounter("duplicates::resized");
        return std::nullopt;
    }
    if (cacheable) {
        options.cache->Store(path, options.algorithm, size, mtime, *digest);
    }
    return digest;
}

std::vector<DuplicateGroup> FindDuplicates(const fs::path& root,
                                           const DuplicateOptions& options,
                                           std::stop_token stop)
{
    perf::Timer timer("duplicates::find");
    auto& logger = Logger::instance();
    logger.info("duplicates: scanning {} (min size {} bytes, {})",
                root.string(), options.min_size, ToString(options.algorithm));

    const std::vector<SizeBucket> buckets = BucketBySize(root, options.min_size, stop);

    std::vector<DigestTask> tasks;
    for (std::size_t b = 0; b < buckets.size(); ++b) {
        if (buckets[b].paths.size() < 2) continue;
        for (const auto& path : buckets[b].paths) {
            tasks.push_back(DigestTask{b, buckets[b].size, &path});
        }
    }
    perf::Manager::Instance().IncrementCounter("duplicates::candidates", tasks.size());

    const auto digests = DigestAll(tasks, options, stop);
    if (stop.stop_requested()) {
        logger.info("duplicates: scan of {} cancelled", root.string());
        return {};
    }

    std::vector<DuplicateGroup> groups;
    std::size_t t = 0;
    while (t < tasks.size()) {
        const std::size_t bucket = tasks[t].bucket;
        std::vector<DuplicateGroup> local;
        std::unordered_map<std::string, std::size_t> index_by_digest;
        for (; t < tasks.size() && tasks[t].bucket == bucket; ++t) {
            if (!digests[t]) continue;
            auto [it, inserted] = index_by_digest.try_emplace(*digests[t], local.size());
            if (inserted) {
                local.push_back(DuplicateGroup{*digests[t], buckets[bucket].size, {}});
            }
            local[it->second].paths.push_back(*tasks[t].path);
        }
        for (auto& group : local) {
            if (group.paths.size() >= 2) {
                groups.push_back(std::move(group));
            }
        }
    }

    logger.info("duplicates: {} groups under {}", groups.size(), root.string());
    perf::Manager::Instance().IncrementCounter("duplicates::groups", groups.size());
    return groups;
}

std::uintmax_t TotalWastedBytes(const std::vector<DuplicateGroup>& groups) noexcept
{
    std::uintmax_t total = 0;
    for (const auto& group : groups) {
        total += group.WastedBytes();
    }
    return total;
}

} // namespace sift
