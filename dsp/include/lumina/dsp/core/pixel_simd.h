// ==============================================================================
// Layer 0: Core Utility - SIMD-Accelerated Bulk Math
// ==============================================================================
// Pixel sanitizing/clamping, scaled accumulation and pffft power spectra
// using Google Highway for runtime SIMD dispatch (SSE2/AVX2/AVX-512/NEON).
//
// Real-time safe: noexcept, no allocations.
// ==============================================================================

#pragma once

#include <cstddef>

namespace Lumina {
namespace DSP {

/// @brief Replace non-finite values with 0 and clamp the rest to [lo, hi]
/// @param data  Array modified in place
/// @param count Number of floats
/// @note SIMD-accelerated with runtime ISA dispatch
void sanitizeAndClamp(float* data, std::size_t count, float lo, float hi) noexcept;

/// @brief acc[i] += src[i] * gain
/// @param acc   Accumulator (modified in place)
/// @param src   Values to add (must not alias acc)
/// @param count Number of floats
/// @note SIMD-accelerated with runtime ISA dispatch
void accumulateScaled(float* acc, const float* src, std::size_t count, float gain) noexcept;

/// @brief In-place power spectrum for pffft ordered real-FFT output
///
/// Input layout: [DC, Nyquist, Re(1), Im(1), Re(2), Im(2), ...]
/// After: DC^2, Nyquist^2, and each complex bin becomes [Re^2+Im^2, 0].
///
/// @param spectrum pffft ordered spectrum buffer (modified in-place)
/// @param fftSize  FFT size (number of floats in the buffer)
/// @note SIMD-accelerated with runtime ISA dispatch
void computePowerSpectrumPffft(float* spectrum, std::size_t fftSize) noexcept;

} // namespace DSP
} // namespace Lumina
