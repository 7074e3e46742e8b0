#pragma once

#include <algorithm>
#include <type_traits>

namespace sift {

// Process exit status, ls style.
enum class VisitResult {
    Ok = 0,
    Minor = 1,
    Serious = 2,
};

class VisitResultAggregator {
public:
    [[nodiscard]] static constexpr VisitResult Combine(VisitResult a, VisitResult b) noexcept {
        using Underlying = std::underlying_type_t<VisitResult>;
        const auto lhs = static_cast<Underlying>(a);
        const auto rhs = static_cast<Underlying>(b);
        return static_cast<VisitResult>(std::max(lhs, rhs));
    }
};

} // namespace sift
