#include "sift/size_formatter.h"

#include <array>
#include <format>
#include <string_view>

namespace sift {
namespace {

constexpr std::array<std::string_view, 5> kBinaryUnits{"B", "KB", "MB", "GB", "TB"};

}  // namespace

SizeFormatter::SizeFormatter(Options options)
    : options_(options) {}

std::string SizeFormatter::FormatSize(std::uintmax_t size) const {
    if (options_.bytes) {
        return std::to_string(size);
    }
    return FormatHumanReadable(size);
}

std::string SizeFormatter::FormatHumanReadable(std::uintmax_t bytes) {
    if (bytes < 1024) {
        return std::format("{} B", bytes);
    }
    double value = static_cast<double>(bytes);
    size_t unit_index = 0;
    while (value >= 1024.0 && unit_index + 1 < kBinaryUnits.size()) {
        value /= 1024.0;
        ++unit_index;
    }
    return std::format("{:.2f} {}", value, kBinaryUnits[unit_index]);
}

}  // namespace sift
