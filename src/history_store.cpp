#include "sift/history_store.h"

#include "sift/logger.h"
#include "sift/metadata.h"
#include "sift/path_utils.h"
#include "sift/perf.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace sift {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr const char* kRecentKey = "recent_paths";
constexpr const char* kFrequencyKey = "frequency_counts";
constexpr const char* kLegacyRecentKey = "recent_files";
constexpr const char* kLegacyFrequencyKey = "frequent_items";

bool PathExists(const fs::path& path) {
    std::error_code ec;
    return fs::exists(path, ec) && !ec;
}

const json* FindEither(const json& document, const char* key, const char* legacy_key) {
    if (auto it = document.find(key); it != document.end()) return &*it;
    if (auto it = document.find(legacy_key); it != document.end()) return &*it;
    return nullptr;
}

}  // namespace

std::uint64_t HistorySnapshot::CountOf(const fs::path& path) const {
    auto it = frequency_counts.find(path);
    return it == frequency_counts.end() ? 0 : it->second;
}

HistoryStore::HistoryStore(fs::path file)
    : file_(std::move(file)) {}

bool HistoryStore::Load() {
    perf::Timer timer("history::load");
    std::lock_guard<std::mutex> lock(mutex_);
    auto& logger = Logger::instance();
    recent_.clear();
    frequency_.clear();

    std::ifstream input(file_);
    if (!input.is_open()) {
        logger.debug("history: {} not found, starting empty", file_.string());
        return true;
    }

    json document = json::parse(input, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        logger.warn("history: {} is corrupt, starting with an empty history", file_.string());
        return false;
    }

    if (const json* recent = FindEither(document, kRecentKey, kLegacyRecentKey);
        recent != nullptr && recent->is_array()) {
        for (const auto& entry : *recent) {
            if (!entry.is_string()) continue;
            fs::path path = PathUtils::Normalize(entry.get<std::string>());
            if (path.empty()) continue;
            if (std::find(recent_.begin(), recent_.end(), path) != recent_.end()) continue;
            recent_.push_back(std::move(path));
            if (recent_.size() == kMaxRecent) break;
        }
    }

    if (const json* counts = FindEither(document, kFrequencyKey, kLegacyFrequencyKey);
        counts != nullptr && counts->is_object()) {
        for (const auto& [key, value] : counts->items()) {
            if (!value.is_number_integer() || value.get<std::int64_t>() <= 0) continue;
            fs::path path = PathUtils::Normalize(key);
            if (path.empty()) continue;
            frequency_[path] += value.get<std::uint64_t>();
        }
    }

    PruneLocked();
    logger.debug("history: loaded {} recent and {} counted paths from {}",
                 recent_.size(), frequency_.size(), file_.string());
    return true;
}

Status HistoryStore::Save() {
    std::lock_guard<std::mutex> lock(mutex_);
    return SaveLocked();
}

void HistoryStore::RecordAccess(const fs::path& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!PathExists(path)) {
        Logger::instance().debug("history: ignoring missing path {}", path.string());
        return;
    }
    fs::path normalized = PathUtils::Normalize(path);

    recent_.erase(std::remove(recent_.begin(), recent_.end(), normalized), recent_.end());
    recent_.insert(recent_.begin(), normalized);
    if (recent_.size() > kMaxRecent) {
        recent_.resize(kMaxRecent);
    }
    frequency_[normalized] += 1;

    if (Status status = SaveLocked(); !status.ok()) {
        Logger::instance().warn("history: {}", status.message());
    }
}

std::vector<FileDescriptor> HistoryStore::RecentItems() {
    std::lock_guard<std::mutex> lock(mutex_);
    PruneLocked();
    std::vector<FileDescriptor> items;
    items.reserve(recent_.size());
    for (const auto& path : recent_) {
        if (auto item = Resolve(path)) {
            items.push_back(std::move(*item));
        }
    }
    return items;
}

std::vector<FileDescriptor> HistoryStore::FrequentItems(std::size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    PruneLocked();
    std::vector<std::pair<fs::path, std::uint64_t>> ranked(frequency_.begin(), frequency_.end());
    std::stable_sort(ranked.begin(), ranked.end(),
        [](const auto& a, const auto& b) { return a.second > b.second; });

    std::vector<FileDescriptor> items;
    for (const auto& [path, count] : ranked) {
        if (items.size() >= limit) break;
        if (auto item = Resolve(path)) {
            items.push_back(std::move(*item));
        }
    }
    return items;
}

HistorySnapshot HistoryStore::Snapshot() {
    std::lock_guard<std::mutex> lock(mutex_);
    PruneLocked();
    return HistorySnapshot{recent_, frequency_};
}

void HistoryStore::PruneLocked() {
    const std::size_t before = recent_.size() + frequency_.size();
    std::erase_if(recent_, [](const fs::path& path) { return !PathExists(path); });
    std::erase_if(frequency_, [](const auto& entry) { return !PathExists(entry.first); });
    const std::size_t pruned = before - (recent_.size() + frequency_.size());
    if (pruned > 0) {
        Logger::instance().debug("history: pruned {} stale entries", pruned);
        perf::Manager::Instance().IncrementCounter("history::pruned", pruned);
    }
}

std::string HistoryStore::SerializeLocked() const {
    json recent = json::array();
    for (const auto& path : recent_) {
        recent.push_back(path.string());
    }
    json counts = json::object();
    for (const auto& [path, count] : frequency_) {
        counts[path.string()] = count;
    }
    json document = json::object();
    document[kRecentKey] = std::move(recent);
    document[kFrequencyKey] = std::move(counts);
    // Paths are raw bytes; invalid UTF-8 is written as U+FFFD instead of throwing.
    return document.dump(4, ' ', false, json::error_handler_t::replace);
}

Status HistoryStore::SaveLocked() const {
    perf::Timer timer("history::save");
    std::error_code ec;
    if (file_.has_parent_path()) {
        fs::create_directories(file_.parent_path(), ec);
        if (ec) {
            return MakeError(file_.parent_path(), ec);
        }
    }

    std::string payload;
    try {
        payload = SerializeLocked();
    } catch (const json::exception& e) {
        return MakeError(ErrorKind::IOFailure, file_, e.what());
    }

    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path temp = file_;
    temp += "." + std::to_string(stamp) + ".tmp";

    {
        std::ofstream output(temp, std::ios::trunc);
        if (!output.is_open()) {
            return MakeError(ErrorKind::IOFailure, temp, "cannot open temporary file");
        }
        output << payload << '\n';
        output.flush();
        if (output.fail()) {
            output.close();
            fs::remove(temp, ec);
            return MakeError(ErrorKind::IOFailure, temp, "write failed");
        }
    }

    fs::rename(temp, file_, ec);
    if (ec) {
        Status status = MakeError(file_, ec);
        std::error_code cleanup;
        fs::remove(temp, cleanup);
        return status;
    }
    return Status::Ok();
}

} // namespace sift
