#pragma once

#include <filesystem>

namespace sift {

class PathUtils {
public:
    // Absolute, lexically normal, without a trailing separator. Does not
    // resolve symlinks and does not require the path to exist.
    static std::filesystem::path Normalize(const std::filesystem::path& path);

    // Parent of the normalized path; a root is its own parent.
    static std::filesystem::path ParentOf(const std::filesystem::path& path);

    static bool IsRoot(const std::filesystem::path& path);
};

} // namespace sift
