#pragma once

#include <filesystem>

namespace sift {

class Platform {
public:
    static bool enableVirtualTerminal();
    static bool isOutputTerminal();
    static int terminalWidth();

    // Permission probes for the effective user. A directory is traversable
    // when it can be both listed and searched.
    static bool canTraverse(const std::filesystem::path& dir);
    static bool canRead(const std::filesystem::path& path);
    static bool canWrite(const std::filesystem::path& path);

    static std::filesystem::path homeDirectory();
};

}  // namespace sift
