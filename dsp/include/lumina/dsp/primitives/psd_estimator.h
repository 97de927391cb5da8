// ==============================================================================
// Layer 1: DSP Primitive - Welch Power Spectral Density
// ==============================================================================
// Averaged periodogram (Welch): Hann-windowed segments with 50 % overlap,
// per-segment mean removal, one-sided density scaling (units^2 / Hz).
// The result can be resampled at frequencies equally spaced on a perceptual
// scale, giving a SpectralFrame.
//
// Buffers grow in prepare() or when a longer segment is first needed;
// repeated estimates of the same shape do not allocate.
// ==============================================================================

#pragma once

#include <lumina/dsp/core/frequency_scales.h>
#include <lumina/dsp/core/interpolation.h>
#include <lumina/dsp/core/pixel_simd.h>
#include <lumina/dsp/core/window_functions.h>
#include <lumina/dsp/primitives/fft.h>

#include <algorithm>
#include <cstddef>
#include <numeric>
#include <span>
#include <vector>

namespace Lumina {
namespace DSP {

// =============================================================================
// SpectralFrame
// =============================================================================

/// @brief Energy sampled at a set of frequencies.
///
/// Invariant: energy.size() == frequencies.size(); frequencies are
/// non-decreasing; energy is non-negative.
struct SpectralFrame {
    std::vector<float> energy;
    std::vector<float> frequencies;

    [[nodiscard]] size_t size() const noexcept { return energy.size(); }
    [[nodiscard]] bool empty() const noexcept { return energy.empty(); }

    void resize(size_t binCount) {
        energy.resize(binCount, 0.0f);
        frequencies.resize(binCount, 0.0f);
    }
};

// =============================================================================
// PsdEstimator
// =============================================================================

/// @brief Welch PSD estimator on the pffft backend.
///
/// @example
/// @code
/// PsdEstimator psd;
/// psd.prepare();
/// SpectralFrame bass;
/// psd.warped(window, 14700.0, 64, 32.7f, 261.0f, FrequencyScale::Bark, bass);
/// @endcode
class PsdEstimator {
public:
    /// Default Welch segment length in samples
    static constexpr size_t kDefaultSegmentLength = 256;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// @brief Set the nominal segment length. Signals shorter than this use a
    ///        single zero-padded segment of the signal's length.
    void prepare(size_t segmentLength = kDefaultSegmentLength) {
        segmentLength_ = std::clamp(segmentLength, size_t{2}, kMaxFFTSize);
        configure(segmentLength_);
    }

    // =========================================================================
    // Estimation
    // =========================================================================

    /// @brief Welch PSD of signal.
    /// @return Number of one-sided bins written to psd(), 0 for an empty
    ///         signal or a non-positive sample rate
    size_t estimate(std::span<const float> signal, double sampleRate) {
        psd_.clear();
        binFrequencies_.clear();
        if (signal.empty() || !(sampleRate > 0.0)) return 0;

        const size_t perSegment = std::min(segmentLength_, signal.size());
        configure(perSegment);
        if (!fft_.isPrepared()) return 0;

        const size_t nfft = fft_.size();
        const size_t numBins = fft_.numBins();
        const size_t step = perSegment - perSegment / 2;
        const size_t numSegments = (signal.size() - perSegment) / step + 1;

        psd_.assign(numBins, 0.0f);
        binFrequencies_.resize(numBins);
        for (size_t k = 0; k < numBins; ++k) {
            binFrequencies_[k] = static_cast<float>(static_cast<double>(k) * sampleRate / static_cast<double>(nfft));
        }

        const double windowPower = std::inner_product(window_.begin(), window_.end(),
                                                      window_.begin(), 0.0);
        const float gain = static_cast<float>(
            1.0 / (sampleRate * windowPower * static_cast<double>(numSegments)));

        for (size_t s = 0; s < numSegments; ++s) {
            const float* seg = signal.data() + s * step;
            double sum = 0.0;
            for (size_t i = 0; i < perSegment; ++i) sum += seg[i];
            const float mean = static_cast<float>(sum / static_cast<double>(perSegment));

            std::fill(segment_.begin(), segment_.end(), 0.0f);
            for (size_t i = 0; i < perSegment; ++i) {
                segment_[i] = (seg[i] - mean) * window_[i];
            }
            fft_.forwardPower(segment_.data(), power_.data());
            accumulateScaled(psd_.data(), power_.data(), numBins, gain);
        }

        // One-sided: fold negative frequencies onto positive (not DC/Nyquist)
        for (size_t k = 1; k + 1 < numBins; ++k) psd_[k] *= 2.0f;
        return numBins;
    }

    /// @brief PSD resampled at binCount frequencies equally spaced on scale
    ///        between fLow and fHigh.
    ///
    /// An empty signal yields an all-zero frame that still carries the axis.
    void warped(std::span<const float> signal, double sampleRate, size_t binCount,
                float fLow, float fHigh, FrequencyScale scale, SpectralFrame& frame) {
        frame.resize(binCount);
        warpedFrequencyAxis(fLow, fHigh, scale, frame.frequencies);

        if (estimate(signal, sampleRate) == 0) {
            std::fill(frame.energy.begin(), frame.energy.end(), 0.0f);
            return;
        }
        for (size_t i = 0; i < binCount; ++i) {
            const float e = Interpolation::interpolateTable(binFrequencies_, psd_, frame.frequencies[i]);
            frame.energy[i] = std::max(0.0f, e);
        }
    }

    // =========================================================================
    // Query
    // =========================================================================

    [[nodiscard]] std::span<const float> psd() const noexcept { return psd_; }
    [[nodiscard]] std::span<const float> binFrequencies() const noexcept { return binFrequencies_; }
    [[nodiscard]] size_t segmentLength() const noexcept { return segmentLength_; }

private:
    void configure(size_t perSegment) {
        if (perSegment == window_.size() && fft_.isPrepared()) return;
        window_ = Window::hann(perSegment);
        const size_t nfft = fftSizeFor(perSegment);
        if (fft_.size() != nfft) fft_.prepare(nfft);
        segment_.assign(nfft, 0.0f);
        power_.assign(nfft / 2 + 1, 0.0f);
    }

    size_t segmentLength_ = kDefaultSegmentLength;
    FFT fft_;
    std::vector<float> window_;
    std::vector<float> segment_;
    std::vector<float> power_;
    std::vector<float> psd_;
    std::vector<float> binFrequencies_;
};

} // namespace DSP
} // namespace Lumina
