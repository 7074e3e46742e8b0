#include "sift/file_operations.h"

#include "sift/logger.h"
#include "sift/path_utils.h"
#include "sift/perf.h"
#include "sift/platform.h"

#include <system_error>

namespace sift {

namespace fs = std::filesystem;

namespace {

bool Exists(const fs::path& path) {
    std::error_code ec;
    return fs::exists(fs::symlink_status(path, ec)) && !ec;
}

bool IsValidName(std::string_view name) {
    if (name.empty() || name == "." || name == "..") return false;
    return name.find('/') == std::string_view::npos
#ifdef _WIN32
           && name.find('\\') == std::string_view::npos
#endif
        ;
}

// True when `inner` equals `outer` or lies below it.
bool IsWithin(const fs::path& inner, const fs::path& outer) {
    auto rel = PathUtils::Normalize(inner).lexically_relative(PathUtils::Normalize(outer));
    return !rel.empty() && *rel.begin() != "..";
}

Status CheckDestinationDir(const fs::path& destination_dir) {
    std::error_code ec;
    if (!fs::is_directory(destination_dir, ec)) {
        return MakeError(ErrorKind::NotADirectory, destination_dir, "destination is not a directory");
    }
    if (!Platform::canWrite(destination_dir)) {
        return MakeError(ErrorKind::PermissionDenied, destination_dir, "destination is not writable");
    }
    return Status::Ok();
}

Status CopyTree(const fs::path& source, const fs::path& target) {
    std::error_code ec;
    if (fs::is_directory(fs::symlink_status(source, ec))) {
        fs::copy(source, target, fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
        if (ec) return MakeError(source, ec);
        return Status::Ok();
    }

    fs::copy(source, target, fs::copy_options::copy_symlinks, ec);
    if (ec) return MakeError(source, ec);

    // Keep the modification time like cp -p.
    if (fs::is_regular_file(fs::symlink_status(source, ec))) {
        auto mtime = fs::last_write_time(source, ec);
        if (!ec) fs::last_write_time(target, mtime, ec);
        if (ec) {
            Logger::instance().debug("copy: cannot preserve mtime on {}: {}",
                                     target.string(), ec.message());
        }
    }
    return Status::Ok();
}

}  // namespace

Status CopyItem(const fs::path& source, const fs::path& destination_dir) {
    perf::Timer timer("file_operations::copy");
    if (!Exists(source)) {
        return MakeError(ErrorKind::NotFound, source, "source does not exist");
    }
    if (Status status = CheckDestinationDir(destination_dir); !status.ok()) {
        return status;
    }
    if (IsWithin(destination_dir, source)) {
        return MakeError(ErrorKind::InvalidTarget, destination_dir, "cannot copy a directory into itself");
    }

    const fs::path target = destination_dir / PathUtils::Normalize(source).filename();
    if (Exists(target)) {
        return MakeError(ErrorKind::AlreadyExists, target, "an item with this name already exists");
    }
    Status status = CopyTree(source, target);
    if (status.ok()) {
        Logger::instance().info("copied {} to {}", source.string(), target.string());
    }
    return status;
}

Status MoveItem(const fs::path& source, const fs::path& destination_dir) {
    perf::Timer timer("file_operations::move");
    if (!Exists(source)) {
        return MakeError(ErrorKind::NotFound, source, "source does not exist");
    }
    if (Status status = CheckDestinationDir(destination_dir); !status.ok()) {
        return status;
    }
    const fs::path normalized = PathUtils::Normalize(source);
    if (!Platform::canWrite(normalized.parent_path())) {
        return MakeError(ErrorKind::PermissionDenied, source, "source directory is not writable");
    }
    if (IsWithin(destination_dir, source)) {
        return MakeError(ErrorKind::InvalidTarget, destination_dir, "cannot move a directory into itself");
    }

    const fs::path target = destination_dir / normalized.filename();
    if (Exists(target)) {
        return MakeError(ErrorKind::AlreadyExists, target, "an item with this name already exists");
    }

    std::error_code ec;
    fs::rename(source, target, ec);
    if (ec == std::errc::cross_device_link) {
        Logger::instance().debug("move: {} crosses devices, copying", source.string());
        if (Status status = CopyTree(source, target); !status.ok()) {
            return status;
        }
        fs::remove_all(source, ec);
    }
    if (ec) {
        return MakeError(source, ec);
    }
    Logger::instance().info("moved {} to {}", source.string(), target.string());
    return Status::Ok();
}

Status DeleteItem(const fs::path& path) {
    perf::Timer timer("file_operations::delete");
    if (!Exists(path)) {
        return MakeError(ErrorKind::NotFound, path, "item does not exist");
    }
    const fs::path normalized = PathUtils::Normalize(path);
    if (PathUtils::IsRoot(normalized)) {
        return MakeError(ErrorKind::InvalidTarget, path, "refusing to delete a filesystem root");
    }
    if (!Platform::canWrite(normalized.parent_path())) {
        return MakeError(ErrorKind::PermissionDenied, path, "parent directory is not writable");
    }

    std::error_code ec;
    fs::remove_all(normalized, ec);
    if (ec) {
        return MakeError(path, ec);
    }
    Logger::instance().info("deleted {}", normalized.string());
    return Status::Ok();
}

Status CreateFolder(const fs::path& parent_dir, std::string_view name) {
    if (!IsValidName(name)) {
        return MakeError(ErrorKind::InvalidTarget, parent_dir, "invalid folder name");
    }
    std::error_code ec;
    if (!fs::is_directory(parent_dir, ec)) {
        return MakeError(ErrorKind::NotADirectory, parent_dir, "parent is not a directory");
    }
    if (!Platform::canWrite(parent_dir)) {
        return MakeError(ErrorKind::PermissionDenied, parent_dir, "parent directory is not writable");
    }

    const fs::path target = parent_dir / fs::path(name);
    if (Exists(target)) {
        return MakeError(ErrorKind::AlreadyExists, target, "an item with this name already exists");
    }
    fs::create_directory(target, ec);
    if (ec) {
        return MakeError(target, ec);
    }
    return Status::Ok();
}

Status RenameItem(const fs::path& path, std::string_view new_name) {
    if (!Exists(path)) {
        return MakeError(ErrorKind::NotFound, path, "item does not exist");
    }
    if (!IsValidName(new_name)) {
        return MakeError(ErrorKind::InvalidTarget, path, "invalid new name");
    }
    const fs::path parent = PathUtils::Normalize(path).parent_path();
    if (!Platform::canWrite(parent)) {
        return MakeError(ErrorKind::PermissionDenied, path, "parent directory is not writable");
    }

    const fs::path target = parent / fs::path(new_name);
    if (Exists(target)) {
        return MakeError(ErrorKind::AlreadyExists, target, "an item with this name already exists");
    }
    std::error_code ec;
    fs::rename(path, target, ec);
    if (ec) {
        return MakeError(path, ec);
    }
    return Status::Ok();
}

std::optional<SpaceInfo> QuerySpace(const fs::path& path) {
    std::error_code ec;
    fs::space_info info = fs::space(path, ec);
    if (ec) {
        Logger::instance().debug("space: cannot query {}: {}", path.string(), ec.message());
        return std::nullopt;
    }
    return SpaceInfo{info.capacity, info.free, info.available};
}

} // namespace sift
