#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace sift {

// Reads flat "key: value" documents. Nested mappings, lists and anchors are
// not supported; such lines are skipped.
class YamlLoader {
public:
    using Map = std::unordered_map<std::string, std::string>;

    // std::nullopt when the file cannot be opened.
    static std::optional<Map> LoadSimpleMap(
        const std::filesystem::path& path,
        bool lowercase_keys = true);

    static Map ParseSimpleMap(std::string_view text, bool lowercase_keys = true);

private:
    static std::string StripComments(std::string_view line);
    static std::string Unquote(const std::string& value);
    static std::string DecodeEscapes(std::string_view text);
    static void AppendUtf8(char32_t codepoint, std::string& out);
    static int HexValue(char ch) noexcept;
};

} // namespace sift
