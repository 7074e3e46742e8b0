#pragma once

#include <cstdint>
#include <string>

namespace sift {

class SizeFormatter {
public:
    struct Options {
        bool bytes = false;
    };

    SizeFormatter() = default;
    explicit SizeFormatter(Options options);

    std::string FormatSize(std::uintmax_t size) const;

    // Binary units: "512 B", "1.50 KB", "3.00 MB" ... up to TB.
    static std::string FormatHumanReadable(std::uintmax_t bytes);

private:
    Options options_{};
};

}  // namespace sift
