#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace sift {

enum class Category {
    Directory,
    Document,
    Image,
    Audio,
    Video,
    Archive,
    Executable,
    Source,
    Temporary,
    Other
};

inline constexpr std::array<Category, 10> kAllCategories{
    Category::Directory, Category::Document, Category::Image, Category::Audio,
    Category::Video, Category::Archive, Category::Executable, Category::Source,
    Category::Temporary, Category::Other};

// Lowercase tag, e.g. "document".
std::string_view ToString(Category category) noexcept;
std::optional<Category> ParseCategory(std::string_view tag);

// Classification by extension (case-insensitive). Directories always map
// to Category::Directory.
Category CategoryFor(std::string_view name, bool is_directory);

// Lowercased extension without the dot; empty for dotfiles and bare names.
std::string ExtensionOf(std::string_view name);

// Nerd Font glyph for the category.
std::string_view IconFor(Category category) noexcept;

} // namespace sift
