#pragma once

#include <string>
#include <string_view>

namespace sift {

class StringUtils {
public:
    static std::string ToLower(std::string_view value);
    static std::string Trim(std::string_view value);

    static bool EndsWith(std::string_view value, std::string_view suffix) noexcept;

    // Case-insensitive ordering used for listing names.
    static bool LessIgnoreCase(std::string_view lhs, std::string_view rhs) noexcept;

private:
    static constexpr unsigned char ascii_to_lower(unsigned char ch) noexcept
    {
        return (ch >= 'A' && ch <= 'Z') ? static_cast<unsigned char>(ch - 'A' + 'a') : ch;
    }
};

} // namespace sift
