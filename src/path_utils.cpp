#include "sift/path_utils.h"

#include <system_error>

namespace sift {

namespace fs = std::filesystem;

fs::path PathUtils::Normalize(const fs::path& path) {
    if (path.empty()) return {};
    std::error_code ec;
    fs::path absolute = fs::absolute(path, ec);
    if (ec) {
        absolute = path;
    }
    fs::path normal = absolute.lexically_normal();
    // "/a/b/" normalizes to "/a/b/"; drop the empty trailing element.
    if (!normal.has_filename() && normal != normal.root_path()) {
        normal = normal.parent_path();
    }
    return normal;
}

fs::path PathUtils::ParentOf(const fs::path& path) {
    fs::path normal = Normalize(path);
    if (IsRoot(normal)) return normal;
    return normal.parent_path();
}

bool PathUtils::IsRoot(const fs::path& path) {
    fs::path normal = Normalize(path);
    return !normal.empty() && normal == normal.root_path();
}

} // namespace sift
