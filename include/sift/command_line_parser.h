#pragma once

#include "sift/config.h"
#include "sift/yaml_loader.h"

#include <cstdint>
#include <optional>
#include <string>

namespace sift {

class CommandLineParser {
public:
    struct SizeSpec {
        std::uintmax_t value = 0;
        std::string suffix;
    };

    // Parses argv into Config::Instance(), with defaults taken from the
    // sift.yaml found by ResourceManager. Exits the process on --help,
    // --version and invalid arguments.
    Config& Parse(int argc, char** argv);

    // Integer with an optional unit: K,M,G,T,P,E (powers of 1024), KB,MB,...
    // (powers of 1000), KiB,MiB,... (powers of 1024). "10K" is 10240.
    static std::optional<SizeSpec> ParseSizeSpec(const std::string& text);

private:
    static bool MultiplyWithOverflow(std::uintmax_t a, std::uintmax_t b, std::uintmax_t& result);
    static bool PowWithOverflow(std::uintmax_t base, unsigned exponent, std::uintmax_t& result);
};

} // namespace sift
