#include "sift/metadata.h"

#include "sift/logger.h"
#include "sift/path_utils.h"
#include "sift/size_formatter.h"

#include <system_error>

namespace sift {

namespace fs = std::filesystem;

std::optional<std::string> FileDescriptor::FormattedSize() const {
    if (is_directory) return std::nullopt;
    return SizeFormatter::FormatHumanReadable(size);
}

std::optional<FileDescriptor> Resolve(const fs::path& path) {
    if (path.empty()) return std::nullopt;

    std::error_code ec;
    fs::file_status status = fs::status(path, ec);
    if (ec || !fs::exists(status)) {
        if (ec && ec != std::errc::no_such_file_or_directory) {
            Logger::instance().debug("resolve: cannot stat {}: {}", path.string(), ec.message());
        }
        return std::nullopt;
    }

    FileDescriptor descriptor;
    descriptor.path = PathUtils::Normalize(path);
    descriptor.name = descriptor.path.filename().string();
    if (descriptor.name.empty()) {
        descriptor.name = descriptor.path.string();
    }
    descriptor.is_directory = fs::is_directory(status);

    if (fs::is_regular_file(status)) {
        descriptor.size = fs::file_size(path, ec);
        if (ec) {
            Logger::instance().debug("resolve: cannot size {}: {}", path.string(), ec.message());
            return std::nullopt;
        }
    }

    descriptor.modified = fs::last_write_time(path, ec);
    if (ec) {
        Logger::instance().debug("resolve: cannot read mtime of {}: {}", path.string(), ec.message());
        return std::nullopt;
    }

    descriptor.category = CategoryFor(descriptor.name, descriptor.is_directory);
    return descriptor;
}

CategoryGroups CategorizeItems(const std::vector<FileDescriptor>& items) {
    CategoryGroups groups;
    for (const auto& item : items) {
        groups[item.category].push_back(item);
    }
    return groups;
}

} // namespace sift
