#pragma once

#include "sift/error.h"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>

namespace sift {

// Single-target operations. None of them throw for expected conditions
// (missing path, permissions, collisions); the Status carries the reason.

// Copies a file or directory tree into `destination_dir`, keeping its name.
Status CopyItem(const std::filesystem::path& source,
                const std::filesystem::path& destination_dir);

// Moves into `destination_dir`; falls back to copy + delete across devices.
Status MoveItem(const std::filesystem::path& source,
                const std::filesystem::path& destination_dir);

// Removes a file, symlink or whole directory tree.
Status DeleteItem(const std::filesystem::path& path);

Status CreateFolder(const std::filesystem::path& parent_dir, std::string_view name);

// Renames within the same parent directory.
Status RenameItem(const std::filesystem::path& path, std::string_view new_name);

struct SpaceInfo {
    std::uintmax_t capacity = 0;
    std::uintmax_t free = 0;
    std::uintmax_t available = 0;
};

// Space of the filesystem holding `path`; std::nullopt if it cannot be queried.
std::optional<SpaceInfo> QuerySpace(const std::filesystem::path& path);

} // namespace sift
