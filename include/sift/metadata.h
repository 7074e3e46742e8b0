#pragma once

#include "sift/categories.h"
#include "sift/file_descriptor.h"

#include <filesystem>
#include <map>
#include <optional>
#include <vector>

namespace sift {

// Stats `path` (following symlinks). std::nullopt when it does not exist or
// cannot be statted.
std::optional<FileDescriptor> Resolve(const std::filesystem::path& path);

using CategoryGroups = std::map<Category, std::vector<FileDescriptor>>;

// Groups by category; input order is kept within each group.
CategoryGroups CategorizeItems(const std::vector<FileDescriptor>& items);

} // namespace sift
