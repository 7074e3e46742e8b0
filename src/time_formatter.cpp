#include "sift/time_formatter.h"

#include "sift/string_utils.h"

#include <optional>
#include <string_view>

namespace sift {
namespace {

constexpr std::string_view kLongIso = "%Y-%m-%d %H:%M";

std::optional<std::string> resolve_style(const std::string& style) {
    if (style.empty()) {
        return std::string(kLongIso);
    }
    if (style.front() == '+') {
        if (style.size() == 1) return std::nullopt;
        return style.substr(1);
    }
    std::string normalized = StringUtils::ToLower(style);
    if (normalized == "long-iso" || normalized == "default") {
        return std::string(kLongIso);
    }
    if (normalized == "full-iso") {
        return std::string("%Y-%m-%d %H:%M:%S %z");
    }
    if (normalized == "iso" || normalized == "iso8601") {
        return std::string("%Y-%m-%d");
    }
    return std::nullopt;
}

}  // namespace

TimeFormatter::TimeFormatter()
    : TimeFormatter(Options{}) {}

TimeFormatter::TimeFormatter(Options options)
    : format_spec_(resolve_style(options.style).value_or(std::string(kLongIso))) {}

bool TimeFormatter::IsValidStyle(const std::string& style) {
    return resolve_style(style).has_value();
}

std::chrono::system_clock::time_point TimeFormatter::ToSystemTime(
    const std::filesystem::file_time_type& timestamp) {
    using namespace std::chrono;
    return time_point_cast<system_clock::duration>(
        timestamp - std::filesystem::file_time_type::clock::now() + system_clock::now());
}

std::tm TimeFormatter::ToLocalTime(std::chrono::system_clock::time_point time) {
    const std::time_t time_value = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &time_value);
#else
    localtime_r(&time_value, &tm);
#endif
    return tm;
}

std::string TimeFormatter::Format(const std::filesystem::file_time_type& timestamp) const {
    std::tm tm = ToLocalTime(ToSystemTime(timestamp));
    char buffer[256]{};
    if (std::strftime(buffer, sizeof(buffer), format_spec_.c_str(), &tm) == 0) {
        if (std::strftime(buffer, sizeof(buffer), kLongIso.data(), &tm) == 0) {
            return {};
        }
    }
    return std::string(buffer);
}

}  // namespace sift
