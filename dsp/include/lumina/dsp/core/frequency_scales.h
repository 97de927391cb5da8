// ==============================================================================
// Layer 0: Core Utility - Perceptual Frequency Scales
// ==============================================================================
// Hz <-> mel and Hz <-> bark conversions plus helpers that generate a set of
// frequencies equally spaced on a chosen scale.
//
// Bark uses Traunmueller's approximation:
//   z = 26.81 f / (1960 + f) - 0.53
//   f = 1960 (z + 0.53) / (26.28 - z)
// Mel uses the HTK formula: m = 2595 log10(1 + f / 700).
// ==============================================================================

#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <span>

namespace Lumina {
namespace DSP {

/// Frequency axis used when resampling a spectrum.
enum class FrequencyScale : uint8_t {
    Linear = 0,
    Mel,
    Bark
};

// =============================================================================
// Conversions
// =============================================================================

[[nodiscard]] inline double hzToMel(double hz) noexcept {
    return 2595.0 * std::log10(1.0 + hz / 700.0);
}

[[nodiscard]] inline double melToHz(double mel) noexcept {
    return 700.0 * (std::pow(10.0, mel / 2595.0) - 1.0);
}

[[nodiscard]] inline double hzToBark(double hz) noexcept {
    return 26.81 * hz / (1960.0 + hz) - 0.53;
}

[[nodiscard]] inline double barkToHz(double bark) noexcept {
    // The inverse has a pole at 26.28 bark; stay just below it.
    const double z = std::min(bark, 26.27);
    return 1960.0 * (z + 0.53) / (26.28 - z);
}

/// Map Hz onto the given scale.
[[nodiscard]] inline double warpFrequency(double hz, FrequencyScale scale) noexcept {
    switch (scale) {
        case FrequencyScale::Mel:  return hzToMel(hz);
        case FrequencyScale::Bark: return hzToBark(hz);
        case FrequencyScale::Linear:
        default:                   return hz;
    }
}

/// Map a value on the given scale back to Hz.
[[nodiscard]] inline double unwarpFrequency(double value, FrequencyScale scale) noexcept {
    switch (scale) {
        case FrequencyScale::Mel:  return melToHz(value);
        case FrequencyScale::Bark: return barkToHz(value);
        case FrequencyScale::Linear:
        default:                   return value;
    }
}

// =============================================================================
// Axis generation
// =============================================================================

/// @brief Fill out with frequencies (Hz) equally spaced on the scale between
/// fLow and fHigh, both endpoints included.
///
/// The result is non-decreasing. fHigh below fLow is treated as fLow.
/// A single output bin receives fLow.
inline void warpedFrequencyAxis(float fLow, float fHigh, FrequencyScale scale,
                                std::span<float> out) noexcept {
    if (out.empty()) return;
    const double lo = std::max(0.0, static_cast<double>(fLow));
    const double hi = std::max(lo, static_cast<double>(fHigh));
    if (out.size() == 1) {
        out[0] = static_cast<float>(lo);
        return;
    }

    const double wLo = warpFrequency(lo, scale);
    const double wHi = warpFrequency(hi, scale);
    const double step = (wHi - wLo) / static_cast<double>(out.size() - 1);
    float previous = static_cast<float>(lo);
    for (size_t i = 0; i < out.size(); ++i) {
        const double hz = (i + 1 == out.size())
            ? hi : unwarpFrequency(wLo + step * static_cast<double>(i), scale);
        // Guard against round-trip rounding breaking monotonicity
        const float value = std::max(previous, static_cast<float>(hz));
        out[i] = value;
        previous = value;
    }
}

} // namespace DSP
} // namespace Lumina
