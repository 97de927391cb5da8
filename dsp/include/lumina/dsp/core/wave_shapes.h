// ==============================================================================
// Layer 0: Core Utility - Periodic Wave Shapes
// ==============================================================================
// Naive (non band-limited) periodic shapes evaluated at a phase in radians.
// They drive spatial brightness profiles, not audio, so aliasing is not a
// concern.
// ==============================================================================

#pragma once

#include <lumina/dsp/core/math_constants.h>

#include <cmath>
#include <cstdint>

namespace Lumina {
namespace DSP {

enum class WaveShape : uint8_t {
    Sine = 0,
    Sawtooth,           ///< Rises from -1 to 1 each period
    SawtoothReversed,   ///< Falls from 1 to -1 each period
    Square              ///< +1 for the first half period, -1 for the second
};

namespace detail {

/// Phase wrapped into [0, 2 pi).
[[nodiscard]] inline double wrapPhase(double phase) noexcept {
    constexpr double kTwoPiD = 2.0 * kPiD;
    double p = std::fmod(phase, kTwoPiD);
    if (p < 0.0) p += kTwoPiD;
    return p;
}

} // namespace detail

/// @brief Evaluate a wave shape.
/// @param phase Phase in radians (any value)
/// @return Value in [-1, 1]
[[nodiscard]] inline float waveShapeValue(WaveShape shape, double phase) noexcept {
    switch (shape) {
        case WaveShape::Sawtooth:
            return static_cast<float>(-1.0 + detail::wrapPhase(phase) / kPiD);
        case WaveShape::SawtoothReversed:
            return static_cast<float>(1.0 - detail::wrapPhase(phase) / kPiD);
        case WaveShape::Square:
            return detail::wrapPhase(phase) < kPiD ? 1.0f : -1.0f;
        case WaveShape::Sine:
        default:
            return static_cast<float>(std::sin(phase));
    }
}

} // namespace DSP
} // namespace Lumina
