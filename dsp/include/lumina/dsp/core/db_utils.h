// ==============================================================================
// Layer 0: Core Utilities
// db_utils.h - Decibel conversion and numeric sanitizing
// ==============================================================================
// Real-time safe: no allocation, no exceptions, no I/O.
//
// NaN/Inf detection works on the IEEE-754 bit pattern so it stays correct
// when the library is compiled with -ffast-math.
// ==============================================================================

#pragma once

#include <bit>
#include <cmath>
#include <cstdint>

namespace Lumina {
namespace DSP {

// =============================================================================
// Constants
// =============================================================================

/// Floor applied before taking a logarithm of an energy or amplitude.
inline constexpr double kMinLogInput = 1e-16;

/// dB value of kMinLogInput (20 * log10(1e-16))
inline constexpr float kSilenceFloorDb = -320.0f;

// =============================================================================
// Bit-level classification
// =============================================================================

namespace detail {

/// Check for NaN using the bit pattern (exponent all ones, mantissa non-zero).
[[nodiscard]] constexpr bool isNaN(float x) noexcept {
    const auto bits = std::bit_cast<uint32_t>(x);
    return ((bits & 0x7F800000u) == 0x7F800000u) && ((bits & 0x007FFFFFu) != 0);
}

/// Check for +/- infinity using the bit pattern.
[[nodiscard]] constexpr bool isInf(float x) noexcept {
    const auto bits = std::bit_cast<uint32_t>(x);
    return (bits & 0x7FFFFFFFu) == 0x7F800000u;
}

/// True when x is neither NaN nor infinity.
[[nodiscard]] constexpr bool isFinite(float x) noexcept {
    return (std::bit_cast<uint32_t>(x) & 0x7F800000u) != 0x7F800000u;
}

/// Double precision variant of isFinite.
[[nodiscard]] constexpr bool isFinite(double x) noexcept {
    return (std::bit_cast<uint64_t>(x) & 0x7FF0000000000000ull) != 0x7FF0000000000000ull;
}

} // namespace detail

// =============================================================================
// Sanitizing
// =============================================================================

/// Replace NaN and infinities with zero.
[[nodiscard]] constexpr float sanitize(float x) noexcept {
    return detail::isFinite(x) ? x : 0.0f;
}

/// Replace NaN and infinities with zero (double precision).
[[nodiscard]] constexpr double sanitize(double x) noexcept {
    return detail::isFinite(x) ? x : 0.0;
}

/// Power that never yields a non-finite result.
///
/// A negative base under a fractional exponent, or a zero base under a
/// negative exponent, produces NaN/Inf in std::pow. Those cases return 0.
[[nodiscard]] inline float safePow(float base, float exponent) noexcept {
    return sanitize(std::pow(base, exponent));
}

// =============================================================================
// Decibel conversion
// =============================================================================

/// Convert a linear amplitude to dB, flooring the input at kMinLogInput.
///
/// @param linear Linear amplitude (zero and negatives are floored)
/// @return Level in dB, never below kSilenceFloorDb
[[nodiscard]] inline float linearToDb(double linear) noexcept {
    const double floored = (detail::isFinite(linear) && linear > kMinLogInput)
        ? linear : kMinLogInput;
    return static_cast<float>(20.0 * std::log10(floored));
}

/// Convert dB to linear amplitude.
[[nodiscard]] inline float dbToLinear(float db) noexcept {
    return sanitize(std::pow(10.0f, db / 20.0f));
}

} // namespace DSP
} // namespace Lumina
