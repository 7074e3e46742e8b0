#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace sift {

// Locates the configuration file and the per-user state directories.
//
// Config search order: $SIFT_CONFIG_DIR, $XDG_CONFIG_HOME/sift,
// ~/.config/sift, then /etc/sift. Data (history, digest cache) lives under
// $XDG_DATA_HOME/sift or ~/.local/share/sift.
class ResourceManager {
public:
    using Path = std::filesystem::path;

    // Rebuilds the search paths from the current environment.
    static void initPaths();

    // First existing file called `name` in the search directories, or empty.
    static Path find(const std::string& name);
    static Path findConfig();
    static std::vector<Path> configCandidates();

    static Path userConfigDir();
    static Path userDataDir();
    static Path envOverrideDir();

    static Path defaultHistoryPath();
    static Path defaultCachePath();

private:
    class Impl;
    static Impl& instance();
};

} // namespace sift
