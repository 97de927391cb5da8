// ==============================================================================
// Layer 0: Core Utility - Interpolation
// ==============================================================================
// Piecewise-linear interpolation over tables and uniform resampling of a
// curve onto a pixel strip.
//
// No allocation, noexcept.
// ==============================================================================

#pragma once

#include <algorithm>
#include <cstddef>
#include <span>

namespace Lumina {
namespace DSP {
namespace Interpolation {

// =============================================================================
// Scalar
// =============================================================================

/// @brief Linear interpolation between two values.
/// @param t Fractional position in [0, 1] (extrapolates outside)
[[nodiscard]] constexpr float linearInterpolate(float y0, float y1, float t) noexcept {
    return y0 + t * (y1 - y0);
}

// =============================================================================
// Table lookup
// =============================================================================

/// @brief Evaluate a piecewise-linear function at x.
///
/// xs must be non-decreasing. Queries left of xs.front() return ys.front(),
/// right of xs.back() return ys.back(). Empty tables return 0.
///
/// @param xs Sample positions (non-decreasing)
/// @param ys Sample values (same length as xs)
/// @param x  Query position
[[nodiscard]] inline float interpolateTable(std::span<const float> xs,
                                            std::span<const float> ys,
                                            float x) noexcept {
    const size_t n = std::min(xs.size(), ys.size());
    if (n == 0) return 0.0f;
    if (x <= xs[0]) return ys[0];
    if (x >= xs[n - 1]) return ys[n - 1];

    const auto it = std::upper_bound(xs.begin(), xs.begin() + static_cast<std::ptrdiff_t>(n), x);
    const size_t hi = static_cast<size_t>(it - xs.begin());
    const size_t lo = hi - 1;
    const float span = xs[hi] - xs[lo];
    if (span <= 0.0f) return ys[hi];
    return linearInterpolate(ys[lo], ys[hi], (x - xs[lo]) / span);
}

// =============================================================================
// Uniform resampling
// =============================================================================

/// @brief Stretch a curve over a destination of a different length.
///
/// Source and destination both span the unit interval with endpoints
/// included, so dst.front() == src.front() and dst.back() == src.back().
///
/// @example
/// @code
/// std::array<float, 3> src{0.0f, 1.0f, 0.0f};
/// std::array<float, 5> dst{};
/// resampleLinear(src, dst);   // {0, 0.5, 1, 0.5, 0}
/// @endcode
inline void resampleLinear(std::span<const float> src, std::span<float> dst) noexcept {
    if (dst.empty()) return;
    if (src.empty()) {
        std::fill(dst.begin(), dst.end(), 0.0f);
        return;
    }
    if (src.size() == 1) {
        std::fill(dst.begin(), dst.end(), src[0]);
        return;
    }
    if (dst.size() == 1) {
        dst[0] = src[0];
        return;
    }

    const double scale = static_cast<double>(src.size() - 1) / static_cast<double>(dst.size() - 1);
    for (size_t i = 0; i < dst.size(); ++i) {
        const double pos = static_cast<double>(i) * scale;
        const size_t idx = std::min(static_cast<size_t>(pos), src.size() - 2);
        const float frac = static_cast<float>(pos - static_cast<double>(idx));
        dst[i] = linearInterpolate(src[idx], src[idx + 1], std::min(frac, 1.0f));
    }
}

} // namespace Interpolation
} // namespace DSP
} // namespace Lumina
