// ==============================================================================
// Layer 1: DSP Primitive - Real Forward FFT
// ==============================================================================
// SIMD-accelerated real-to-complex FFT via pffft, with a power-spectrum path
// that squares bins using the Highway kernel in pixel_simd.
//
// Allocation only in prepare(); transforms are noexcept.
// Backend: pffft (BSD license)
// ==============================================================================

#pragma once

#include <lumina/dsp/core/pixel_simd.h>

#include <algorithm>
#include <bit>
#include <cmath>
#include <cstddef>
#include <memory>

#include <pffft.h>

namespace Lumina {
namespace DSP {

// =============================================================================
// Constants
// =============================================================================

/// Minimum supported FFT size (pffft real transforms need multiples of 32)
inline constexpr size_t kMinFFTSize = 32;

/// Maximum supported FFT size
inline constexpr size_t kMaxFFTSize = 16384;

// =============================================================================
// Complex Number (POD)
// =============================================================================

/// @brief Complex bin value
struct Complex {
    float real = 0.0f;
    float imag = 0.0f;

    /// |z|^2
    [[nodiscard]] constexpr float power() const noexcept {
        return real * real + imag * imag;
    }

    [[nodiscard]] float magnitude() const noexcept {
        return std::sqrt(power());
    }
};

// =============================================================================
// RAII Helpers for pffft Resources
// =============================================================================

namespace detail {

struct PffftSetupDeleter {
    void operator()(PFFFT_Setup* s) const noexcept {
        if (s) pffft_destroy_setup(s);
    }
};

struct PffftAlignedDeleter {
    void operator()(void* p) const noexcept {
        if (p) pffft_aligned_free(p);
    }
};

/// Allocate a SIMD-aligned float buffer via pffft
inline std::unique_ptr<float, PffftAlignedDeleter> makeAlignedBuffer(size_t numFloats) {
    return {static_cast<float*>(pffft_aligned_malloc(numFloats * sizeof(float))),
            PffftAlignedDeleter{}};
}

} // namespace detail

/// Smallest supported FFT size that holds at least `length` samples.
[[nodiscard]] inline size_t fftSizeFor(size_t length) noexcept {
    return std::clamp(std::bit_ceil(std::max(length, size_t{1})), kMinFFTSize, kMaxFFTSize);
}

// =============================================================================
// FFT Class
// =============================================================================

/// @brief Real forward FFT (pffft backend)
///
/// @example
/// @code
/// FFT fft;
/// fft.prepare(256);
/// std::vector<float> power(fft.numBins());
/// fft.forwardPower(segment.data(), power.data());
/// @endcode
class FFT {
public:
    FFT() noexcept = default;
    ~FFT() noexcept = default;

    FFT(const FFT&) = delete;
    FFT& operator=(const FFT&) = delete;
    FFT(FFT&&) noexcept = default;
    FFT& operator=(FFT&&) noexcept = default;

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    /// @brief Allocate the pffft setup and aligned buffers
    /// @param fftSize Power of 2 in [kMinFFTSize, kMaxFFTSize]; anything else
    ///        leaves the FFT unprepared
    void prepare(size_t fftSize) noexcept {
        size_ = 0;
        setup_.reset();
        if (fftSize < kMinFFTSize || fftSize > kMaxFFTSize || !std::has_single_bit(fftSize)) {
            return;
        }

        setup_.reset(pffft_new_setup(static_cast<int>(fftSize), PFFFT_REAL));
        if (!setup_) return;

        input_ = detail::makeAlignedBuffer(fftSize);
        output_ = detail::makeAlignedBuffer(fftSize);
        work_ = detail::makeAlignedBuffer(fftSize);
        if (!input_ || !output_ || !work_) {
            setup_.reset();
            return;
        }
        size_ = fftSize;
    }

    // -------------------------------------------------------------------------
    // Processing
    // -------------------------------------------------------------------------

    /// @brief Forward FFT
    /// @param input  size() real samples
    /// @param output numBins() complex bins (DC to Nyquist)
    void forward(const float* input, Complex* output) noexcept {
        if (!transform(input) || output == nullptr) return;

        const size_t n = size_;
        const float* spec = output_.get();
        output[0] = {spec[0], 0.0f};
        output[n / 2] = {spec[1], 0.0f};
        for (size_t k = 1; k < n / 2; ++k) {
            output[k] = {spec[2 * k], spec[2 * k + 1]};
        }
    }

    /// @brief Forward FFT followed by |X(k)|^2
    /// @param input  size() real samples
    /// @param power  numBins() non-negative values (DC to Nyquist)
    void forwardPower(const float* input, float* power) noexcept {
        if (!transform(input) || power == nullptr) return;

        const size_t n = size_;
        float* spec = output_.get();
        computePowerSpectrumPffft(spec, n);
        power[0] = spec[0];
        power[n / 2] = spec[1];
        for (size_t k = 1; k < n / 2; ++k) {
            power[k] = spec[2 * k];
        }
    }

    // -------------------------------------------------------------------------
    // Query
    // -------------------------------------------------------------------------

    [[nodiscard]] size_t size() const noexcept { return size_; }

    /// @return size() / 2 + 1
    [[nodiscard]] size_t numBins() const noexcept { return size_ == 0 ? 0 : size_ / 2 + 1; }

    [[nodiscard]] bool isPrepared() const noexcept { return size_ > 0; }

private:
    bool transform(const float* input) noexcept {
        if (!isPrepared() || input == nullptr) return false;
        std::copy_n(input, size_, input_.get());
        pffft_transform_ordered(setup_.get(), input_.get(), output_.get(),
                                work_.get(), PFFFT_FORWARD);
        return true;
    }

    size_t size_ = 0;
    std::unique_ptr<PFFFT_Setup, detail::PffftSetupDeleter> setup_;
    std::unique_ptr<float, detail::PffftAlignedDeleter> input_;
    std::unique_ptr<float, detail::PffftAlignedDeleter> output_;
    std::unique_ptr<float, detail::PffftAlignedDeleter> work_;
};

} // namespace DSP
} // namespace Lumina
