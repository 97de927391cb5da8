// ==============================================================================
// Layer 0: Core Utility - Colour Helpers
// ==============================================================================
// RGB triples in the 0..255 float domain, HSV conversion and per-channel
// blend operators.
// ==============================================================================

#pragma once

#include <lumina/dsp/core/math_constants.h>

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace Lumina {
namespace DSP {

/// One pixel, channels in [0, 255].
struct Rgb {
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;

    [[nodiscard]] constexpr Rgb scaled(float gain) const noexcept {
        return {r * gain, g * gain, b * gain};
    }

    [[nodiscard]] constexpr float brightness() const noexcept {
        return r + g + b;
    }

    [[nodiscard]] constexpr bool operator==(const Rgb&) const noexcept = default;
};

namespace Colors {
inline constexpr Rgb kBlack{0.0f, 0.0f, 0.0f};
inline constexpr Rgb kWhite{255.0f, 255.0f, 255.0f};
inline constexpr Rgb kRed{255.0f, 0.0f, 0.0f};
inline constexpr Rgb kGreen{0.0f, 255.0f, 0.0f};
inline constexpr Rgb kBlue{0.0f, 0.0f, 255.0f};
} // namespace Colors

/// @brief HSV to RGB.
/// @param hue        Hue in [0, 1) (wrapped)
/// @param saturation Saturation in [0, 1]
/// @param value      Value in [0, 1]
/// @return Colour scaled to [0, 255]
[[nodiscard]] inline Rgb hsvToRgb(float hue, float saturation, float value) noexcept {
    hue = hue - std::floor(hue);
    saturation = std::clamp(saturation, 0.0f, 1.0f);
    value = std::clamp(value, 0.0f, 1.0f);

    const float h6 = hue * 6.0f;
    const int sector = static_cast<int>(h6) % 6;
    const float f = h6 - std::floor(h6);
    const float p = value * (1.0f - saturation);
    const float q = value * (1.0f - saturation * f);
    const float t = value * (1.0f - saturation * (1.0f - f));

    Rgb c;
    switch (sector) {
        case 0:  c = {value, t, p}; break;
        case 1:  c = {q, value, p}; break;
        case 2:  c = {p, value, t}; break;
        case 3:  c = {p, q, value}; break;
        case 4:  c = {t, p, value}; break;
        default: c = {value, p, q}; break;
    }
    return c.scaled(kMaxPixelValue);
}

// =============================================================================
// Blend modes
// =============================================================================

/// Per-channel combination of two layers.
enum class BlendMode : uint8_t {
    Lightest = 0,   ///< max(a, b)
    Darkest,        ///< min(a, b)
    Addition,       ///< a + b
    Multiply,       ///< a * b / 255
    Screen          ///< 255 - (255 - a)(255 - b) / 255
};

[[nodiscard]] constexpr float blendChannel(float a, float b, BlendMode mode) noexcept {
    switch (mode) {
        case BlendMode::Darkest:  return std::min(a, b);
        case BlendMode::Addition: return a + b;
        case BlendMode::Multiply: return a * b / kMaxPixelValue;
        case BlendMode::Screen:
            return kMaxPixelValue - (kMaxPixelValue - a) * (kMaxPixelValue - b) / kMaxPixelValue;
        case BlendMode::Lightest:
        default:                  return std::max(a, b);
    }
}

} // namespace DSP
} // namespace Lumina
