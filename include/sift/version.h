#pragma once

#include <string>
#include <string_view>

#ifndef SIFT_VERSION_STRING
#define SIFT_VERSION_STRING "1.0.0"
#endif

namespace sift {

class Version {
public:
    static constexpr std::string_view String() noexcept { return std::string_view{SIFT_VERSION_STRING}; }

    static std::string FullString()
    {
        return "sift " + std::string{String()};
    }
};

}  // namespace sift
