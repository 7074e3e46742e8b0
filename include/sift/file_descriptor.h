#pragma once

#include "sift/categories.h"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace sift {

// Point-in-time snapshot of one filesystem entry. The entry may have changed
// or vanished since; re-check before acting on it.
struct FileDescriptor {
    std::filesystem::path path;
    std::string name;
    bool is_directory = false;
    std::uintmax_t size = 0;
    std::filesystem::file_time_type modified{};
    Category category = Category::Other;

    // Human-readable size; std::nullopt for directories.
    [[nodiscard]] std::optional<std::string> FormattedSize() const;

    [[nodiscard]] std::string_view icon() const noexcept { return IconFor(category); }

    bool operator==(const FileDescriptor&) const = default;
};

} // namespace sift
