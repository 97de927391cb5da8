// ==============================================================================
// Layer 0: Core Utility - Window Functions and 1-D Kernels
// ==============================================================================
// Hann/Hamming windows, same-length convolution and a reflect-mode gaussian
// blur. Window generators allocate and are meant for prepare() time; the
// convolution and blur helpers take caller-owned scratch space.
// ==============================================================================

#pragma once

#include <lumina/dsp/core/math_constants.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <span>
#include <vector>

namespace Lumina {
namespace DSP {
namespace Window {

// =============================================================================
// Constants
// =============================================================================

/// Length of the smoothing kernel applied to rendered spectrum lines
inline constexpr size_t kSmoothingKernelLength = 8;

/// Gaussian kernels extend this many standard deviations each side
inline constexpr float kGaussianTruncate = 4.0f;

// =============================================================================
// Generators
// =============================================================================

/// @brief Periodic Hann window, suited to spectral analysis segments.
/// w[n] = 0.5 - 0.5 cos(2 pi n / N)
[[nodiscard]] inline std::vector<float> hann(size_t size) {
    std::vector<float> w(size, 1.0f);
    if (size < 2) return w;
    const double n = static_cast<double>(size);
    for (size_t i = 0; i < size; ++i) {
        w[i] = static_cast<float>(0.5 - 0.5 * std::cos(2.0 * kPiD * static_cast<double>(i) / n));
    }
    return w;
}

/// @brief Symmetric Hamming window.
/// w[n] = 0.54 - 0.46 cos(2 pi n / (N - 1))
[[nodiscard]] inline std::vector<float> hamming(size_t size) {
    std::vector<float> w(size, 1.0f);
    if (size < 2) return w;
    const double denom = static_cast<double>(size - 1);
    for (size_t i = 0; i < size; ++i) {
        w[i] = static_cast<float>(0.54 - 0.46 * std::cos(2.0 * kPiD * static_cast<double>(i) / denom));
    }
    return w;
}

// =============================================================================
// Convolution
// =============================================================================

/// @brief Linear convolution cropped to the input length, centred.
///
/// out[k] = sum_j data[j] * kernel[k + (M-1)/2 - j], zero outside data.
/// out must have data.size() elements and must not alias data.
inline void convolveSame(std::span<const float> data, std::span<const float> kernel,
                         std::span<float> out) noexcept {
    const size_t n = std::min(data.size(), out.size());
    const size_t m = kernel.size();
    std::fill(out.begin(), out.end(), 0.0f);
    if (n == 0 || m == 0) return;

    const std::ptrdiff_t offset = static_cast<std::ptrdiff_t>((m - 1) / 2);
    for (size_t k = 0; k < n; ++k) {
        const std::ptrdiff_t fullIndex = static_cast<std::ptrdiff_t>(k) + offset;
        float acc = 0.0f;
        for (size_t j = 0; j < m; ++j) {
            const std::ptrdiff_t src = fullIndex - static_cast<std::ptrdiff_t>(j);
            if (src >= 0 && src < static_cast<std::ptrdiff_t>(n)) {
                acc += data[static_cast<size_t>(src)] * kernel[j];
            }
        }
        out[k] = acc;
    }
}

// =============================================================================
// Gaussian blur
// =============================================================================

namespace detail {

/// Map an out-of-range index back into [0, n) by half-sample reflection
/// (d c b a | a b c d | d c b a).
[[nodiscard]] inline size_t reflectIndex(std::ptrdiff_t i, size_t n) noexcept {
    const auto len = static_cast<std::ptrdiff_t>(n);
    const std::ptrdiff_t period = 2 * len;
    i %= period;
    if (i < 0) i += period;
    if (i >= len) i = period - 1 - i;
    return static_cast<size_t>(i);
}

} // namespace detail

/// @brief Normalised gaussian taps, radius = int(truncate * sigma + 0.5).
[[nodiscard]] inline std::vector<float> gaussianKernel(float sigma) {
    if (!(sigma > 0.0f)) return {1.0f};
    const auto radius = static_cast<std::ptrdiff_t>(kGaussianTruncate * sigma + 0.5f);
    std::vector<float> taps(static_cast<size_t>(2 * radius + 1));
    double sum = 0.0;
    for (std::ptrdiff_t x = -radius; x <= radius; ++x) {
        const double v = std::exp(-0.5 * static_cast<double>(x * x) / (static_cast<double>(sigma) * sigma));
        taps[static_cast<size_t>(x + radius)] = static_cast<float>(v);
        sum += v;
    }
    for (auto& t : taps) t = static_cast<float>(t / sum);
    return taps;
}

/// @brief Blur a row in place with precomputed gaussian taps, reflect edges.
///
/// @param data    Row to blur (modified in place)
/// @param taps    Odd-length normalised kernel from gaussianKernel()
/// @param scratch Reused copy buffer (grown when needed)
inline void gaussianBlur(std::span<float> data, std::span<const float> taps,
                         std::vector<float>& scratch) {
    const size_t n = data.size();
    if (n == 0 || taps.size() < 2) return;

    scratch.assign(data.begin(), data.end());
    const auto radius = static_cast<std::ptrdiff_t>(taps.size() / 2);
    for (size_t i = 0; i < n; ++i) {
        float acc = 0.0f;
        for (std::ptrdiff_t k = -radius; k <= radius; ++k) {
            const size_t src = detail::reflectIndex(static_cast<std::ptrdiff_t>(i) + k, n);
            acc += scratch[src] * taps[static_cast<size_t>(k + radius)];
        }
        data[i] = acc;
    }
}

} // namespace Window
} // namespace DSP
} // namespace Lumina
