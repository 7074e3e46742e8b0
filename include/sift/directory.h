#pragma once

#include "sift/error.h"
#include "sift/file_descriptor.h"

#include <filesystem>
#include <optional>
#include <vector>

namespace sift {

struct Listing {
    std::vector<FileDescriptor> items;
    std::optional<Error> error;

    [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }
};

// Immediate children of `path`: directories first, then by name ignoring
// case. Relative paths resolve against the working directory. On failure
// `items` is empty and `error` says why.
Listing ListDirectory(const std::filesystem::path& path);

// Shared ordering used by listings.
bool ListingOrder(const FileDescriptor& lhs, const FileDescriptor& rhs) noexcept;

} // namespace sift
