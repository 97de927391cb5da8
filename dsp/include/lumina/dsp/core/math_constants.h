// ==============================================================================
// Layer 0: Core Utility - Math Constants
// ==============================================================================
// Mathematical and pixel-range constants shared by every layer.
//
// Constants are inline constexpr so there is a single definition across
// translation units.
// ==============================================================================

#pragma once

#include <cstddef>

namespace Lumina {
namespace DSP {

// =============================================================================
// Mathematical Constants
// =============================================================================

/// Pi in single precision
inline constexpr float kPi = 3.14159265358979323846f;

/// Two times Pi (full circle in radians)
inline constexpr float kTwoPi = 2.0f * kPi;

/// Half Pi
inline constexpr float kHalfPi = kPi / 2.0f;

/// Pi in double precision, used by filter design
inline constexpr double kPiD = 3.14159265358979323846;

// =============================================================================
// Pixel Constants
// =============================================================================

/// Number of colour channels per pixel (R, G, B)
inline constexpr size_t kNumColorChannels = 3;

/// Upper bound of a colour channel value
inline constexpr float kMaxPixelValue = 255.0f;

} // namespace DSP
} // namespace Lumina
