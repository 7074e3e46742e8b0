#pragma once

#include <chrono>
#include <ctime>
#include <filesystem>
#include <string>

namespace sift {

class TimeFormatter {
public:
    // Style names: "long-iso" (default, %Y-%m-%d %H:%M), "full-iso", "iso",
    // or "+FORMAT" for a strftime(3) format.
    struct Options {
        std::string style;
    };

    TimeFormatter();
    explicit TimeFormatter(Options options);

    std::string Format(const std::filesystem::file_time_type& timestamp) const;

    [[nodiscard]] const std::string& format_spec() const noexcept { return format_spec_; }

    static bool IsValidStyle(const std::string& style);

    static std::chrono::system_clock::time_point ToSystemTime(
        const std::filesystem::file_time_type& timestamp);
    static std::tm ToLocalTime(std::chrono::system_clock::time_point time);

private:
    std::string format_spec_;
};

} // namespace sift
