#include "sift/string_utils.h"

#include <algorithm>
#include <cctype>
#include <string_view>

namespace sift {

std::string StringUtils::ToLower(std::string_view value)
{
    std::string result(value);
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char ch) {
        return static_cast<char>(StringUtils::ascii_to_lower(ch));
    });
    return result;
}

std::string StringUtils::Trim(std::string_view value)
{
    auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
    auto begin = std::find_if_not(value.begin(), value.end(), [&](char ch) {
        return is_space(static_cast<unsigned char>(ch));
    });
    auto end = std::find_if_not(value.rbegin(), value.rend(), [&](char ch) {
        return is_space(static_cast<unsigned char>(ch));
    }).base();
    if (begin >= end) {
        return {};
    }
    return std::string(begin, end);
}

bool StringUtils::EndsWith(std::string_view value, std::string_view suffix) noexcept
{
    return value.size() >= suffix.size()
        && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool StringUtils::LessIgnoreCase(std::string_view lhs, std::string_view rhs) noexcept
{
    return std::lexicographical_compare(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(),
        [](char a, char b) {
            return ascii_to_lower(static_cast<unsigned char>(a)) <
                   ascii_to_lower(static_cast<unsigned char>(b));
        });
}

} // namespace sift
