#include "sift/directory.h"

#include "sift/logger.h"
#include "sift/metadata.h"
#include "sift/path_utils.h"
#include "sift/perf.h"
#include "sift/platform.h"
#include "sift/string_utils.h"

#include <algorithm>
#include <system_error>

namespace sift {

namespace fs = std::filesystem;

bool ListingOrder(const FileDescriptor& lhs, const FileDescriptor& rhs) noexcept {
    if (lhs.is_directory != rhs.is_directory) {
        return lhs.is_directory;
    }
    return StringUtils::LessIgnoreCase(lhs.name, rhs.name);
}

Listing ListDirectory(const fs::path& path) {
    perf::Timer timer("directory::list");
    Listing listing;
    const fs::path target = PathUtils::Normalize(path);

    std::error_code ec;
    fs::file_status status = fs::status(target, ec);
    if (ec || !fs::exists(status)) {
        listing.error = ec && ec != std::errc::no_such_file_or_directory
                            ? MakeError(target, ec)
                            : MakeError(ErrorKind::NotFound, target, "path does not exist");
        return listing;
    }
    if (!fs::is_directory(status)) {
        listing.error = MakeError(ErrorKind::NotADirectory, target, "path is not a directory");
        return listing;
    }
    if (!Platform::canRead(target)) {
        listing.error = MakeError(ErrorKind::PermissionDenied, target, "directory is not readable");
        return listing;
    }

    fs::directory_iterator it(target, ec);
    if (ec) {
        listing.error = MakeError(target, ec);
        return listing;
    }
    for (const fs::directory_iterator end; it != end; it.increment(ec)) {
        if (auto item = Resolve(it->path())) {
            listing.items.push_back(std::move(*item));
        } else {
            Logger::instance().debug("list: skipped {}", it->path().string());
        }
    }
    if (ec) {
        listing.items.clear();
        listing.error = MakeError(target, ec);
        return listing;
    }

    std::stable_sort(listing.items.begin(), listing.items.end(), ListingOrder);
    return listing;
}

} // namespace sift
