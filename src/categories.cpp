#include "sift/categories.h"

#include "sift/string_utils.h"

#include <unordered_map>

namespace sift {
namespace {

const std::unordered_map<std::string, Category>& extension_table() {
    static const std::unordered_map<std::string, Category> table = [] {
        std::unordered_map<std::string, Category> map;
        auto add = [&](Category category, std::initializer_list<const char*> extensions) {
            for (const char* ext : extensions) map.emplace(ext, category);
        };
        add(Category::Document, {"txt", "doc", "docx", "pdf", "odt", "rtf", "xls", "xlsx",
                                 "ppt", "pptx", "csv", "md"});
        add(Category::Image, {"jpg", "jpeg", "png", "gif", "bmp", "svg", "ico", "webp"});
        add(Category::Audio, {"mp3", "wav", "flac", "aac", "ogg", "wma"});
        add(Category::Video, {"mp4", "avi", "mkv", "mov", "wmv", "flv", "webm"});
        add(Category::Archive, {"zip", "rar", "7z", "tar", "gz", "iso"});
        add(Category::Executable, {"exe", "msi", "bat", "cmd", "ps1", "vbs", "dll", "sys"});
        add(Category::Source, {"py", "js", "html", "css", "json", "xml", "java", "c", "cpp",
                               "cs", "php", "go", "rb", "swift"});
        add(Category::Temporary, {"log", "tmp", "bak"});
        return map;
    }();
    return table;
}

}  // namespace

std::string_view ToString(Category category) noexcept {
    switch (category) {
    case Category::Directory: return "directory";
    case Category::Document: return "document";
    case Category::Image: return "image";
    case Category::Audio: return "audio";
    case Category::Video: return "video";
    case Category::Archive: return "archive";
    case Category::Executable: return "executable";
    case Category::Source: return "source";
    case Category::Temporary: return "temporary";
    case Category::Other: break;
    }
    return "other";
}

std::optional<Category> ParseCategory(std::string_view tag) {
    std::string lowered = StringUtils::ToLower(tag);
    for (Category category : kAllCategories) {
        if (ToString(category) == lowered) return category;
    }
    return std::nullopt;
}

std::string ExtensionOf(std::string_view name) {
    auto pos = name.rfind('.');
    if (pos == std::string_view::npos || pos == 0 || pos + 1 == name.size()) return {};
    return StringUtils::ToLower(name.substr(pos + 1));
}

Category CategoryFor(std::string_view name, bool is_directory) {
    if (is_directory) return Category::Directory;
    if (StringUtils::EndsWith(StringUtils::ToLower(name), ".tar.gz")) {
        return Category::Archive;
    }
    const auto& table = extension_table();
    auto it = table.find(ExtensionOf(name));
    if (it != table.end()) return it->second;
    return Category::Other;
}

std::string_view IconFor(Category category) noexcept {
    switch (category) {
    case Category::Directory: return "\uf07b";   // nf-fa-folder
    case Category::Document: return "\uf15c";    // nf-fa-file_text_o
    case Category::Image: return "\uf1c5";       // nf-fa-file_image_o
    case Category::Audio: return "\uf1c7";       // nf-fa-file_audio_o
    case Category::Video: return "\uf1c8";       // nf-fa-file_video_o
    case Category::Archive: return "\uf1c6";     // nf-fa-file_archive_o
    case Category::Executable: return "\uf489";  // nf-oct-terminal
    case Category::Source: return "\uf1c9";      // nf-fa-file_code_o
    case Category::Temporary: return "\uf017";   // nf-fa-clock_o
    case Category::Other: break;
    }
    return "\uf15b";
}

} // namespace sift
