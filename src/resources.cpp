#include "sift/resources.h"

#include "sift/perf.h"
#include "sift/platform.h"

#include <algorithm>
#include <cstdlib>
#include <mutex>
#include <optional>
#include <system_error>

namespace sift {
namespace {
constexpr const char* kConfigFilename = "sift.yaml";
constexpr const char* kHistoryFilename = "history.json";
constexpr const char* kCacheFilename = "digests.sqlite3";

std::optional<std::filesystem::path> env_path(const char* name) {
    if (const char* value = std::getenv(name)) {
        if (value[0] != '\0') return std::filesystem::path(value);
    }
    return std::nullopt;
}
}

class ResourceManager::Impl {
public:
    void initPaths() {
        std::lock_guard<std::mutex> lock(mutex_);
        initLocked();
    }

    [[nodiscard]] Path find(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        ensureLocked();
        perf::Timer timer("resources::find");
        auto& perf_manager = perf::Manager::Instance();
        perf_manager.IncrementCounter("resources::find_calls");

        for (const auto& dir : directories_) {
            Path candidate = dir / name;
            std::error_code ec;
            if (std::filesystem::is_regular_file(candidate, ec) && !ec) {
                perf_manager.IncrementCounter("resources::find_hits");
                return candidate;
            }
        }
        perf_manager.IncrementCounter("resources::find_misses");
        return {};
    }

    [[nodiscard]] std::vector<Path> configCandidates() {
        std::lock_guard<std::mutex> lock(mutex_);
        ensureLocked();
        std::vector<Path> candidates;
        candidates.reserve(directories_.size());
        for (const auto& dir : directories_) {
            candidates.push_back(dir / kConfigFilename);
        }
        return candidates;
    }

    Path userConfigDir() {
        std::lock_guard<std::mutex> lock(mutex_);
        ensureLocked();
        return user_config_dir_;
    }

    Path userDataDir() {
        std::lock_guard<std::mutex> lock(mutex_);
        ensureLocked();
        return user_data_dir_;
    }

    Path envOverrideDir() {
        std::lock_guard<std::mutex> lock(mutex_);
        ensureLocked();
        return env_override_dir_;
    }

private:
    void ensureLocked() {
        if (!initialized_) initLocked();
    }

    void initLocked() {
        perf::Timer timer("resources::init_paths");
        initialized_ = true;
        directories_.clear();
        user_config_dir_.clear();
        user_data_dir_.clear();
        env_override_dir_.clear();

        if (auto env = env_path("SIFT_CONFIG_DIR")) {
            env_override_dir_ = normalize(*env);
            addNormalizedDir(env_override_dir_);
        }

        Path home = Platform::homeDirectory();
        if (auto xdg = env_path("XDG_CONFIG_HOME")) {
            user_config_dir_ = normalize(*xdg / "sift");
        } else if (!home.empty()) {
            user_config_dir_ = normalize(home / ".config" / "sift");
        }
        addNormalizedDir(user_config_dir_);

#ifndef _WIN32
        addNormalizedDir(Path("/etc/sift"));
#endif

        if (auto xdg = env_path("XDG_DATA_HOME")) {
            user_data_dir_ = normalize(*xdg / "sift");
        } else if (!home.empty()) {
            user_data_dir_ = normalize(home / ".local" / "share" / "sift");
        } else {
            std::error_code ec;
            user_data_dir_ = std::filesystem::current_path(ec);
        }

        perf::Manager::Instance().IncrementCounter("resources::directories_registered",
                                                   directories_.size());
    }

    static Path normalize(const Path& dir) {
        if (dir.empty()) return {};
        std::error_code ec;
        Path normalized = std::filesystem::weakly_canonical(dir, ec);
        if (ec) {
            normalized = dir.lexically_normal();
        }
        return normalized;
    }

    void addNormalizedDir(const Path& normalized) {
        if (normalized.empty()) return;
        if (std::find(directories_.begin(), directories_.end(), normalized) != directories_.end()) {
            return;
        }
        directories_.push_back(normalized);
    }

    std::mutex mutex_;
    std::vector<Path> directories_{};
    bool initialized_ = false;
    Path user_config_dir_{};
    Path user_data_dir_{};
    Path env_override_dir_{};
};

ResourceManager::Impl& ResourceManager::instance() {
    static Impl impl;
    return impl;
}

void ResourceManager::initPaths() {
    instance().initPaths();
}

std::filesystem::path ResourceManager::find(const std::string& name) {
    return instance().find(name);
}

std::filesystem::path ResourceManager::findConfig() {
    return instance().find(kConfigFilename);
}

std::vector<std::filesystem::path> ResourceManager::configCandidates() {
    return instance().configCandidates();
}

std::filesystem::path ResourceManager::userConfigDir() {
    return instance().userConfigDir();
}

std::filesystem::path ResourceManager::userDataDir() {
    return instance().userDataDir();
}

std::filesystem::path ResourceManager::envOverrideDir() {
    return instance().envOverrideDir();
}

std::filesystem::path ResourceManager::defaultHistoryPath() {
    return userDataDir() / kHistoryFilename;
}

std::filesystem::path ResourceManager::defaultCachePath() {
    return userDataDir() / kCacheFilename;
}

} // namespace sift
