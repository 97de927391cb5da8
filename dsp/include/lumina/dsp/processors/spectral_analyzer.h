// ==============================================================================
// Layer 2: DSP Processor - ChunkedSpectralAnalyzer
// ==============================================================================
// Streaming front end for spectrum effects:
//
//   chunk -> replay slot -> decimator -> overlap window -> Welch PSD
//                                                       -> warped frame
//
// The analysis window is the last overlapCount + 1 decimated chunks. When no
// new chunk arrived since the previous update() the last chunk is fed again,
// so the display keeps moving without waiting on capture.
// ==============================================================================

#pragma once

#include <lumina/dsp/core/frequency_scales.h>
#include <lumina/dsp/core/interpolation.h>
#include <lumina/dsp/core/window_functions.h>
#include <lumina/dsp/primitives/chunk_replay_slot.h>
#include <lumina/dsp/primitives/decimator.h>
#include <lumina/dsp/primitives/overlap_window.h>
#include <lumina/dsp/primitives/psd_estimator.h>

#include <algorithm>
#include <cstddef>
#include <span>
#include <vector>

namespace Lumina {
namespace DSP {

class ChunkedSpectralAnalyzer {
public:
    /// Highest analysed frequency by default (Hz)
    static constexpr float kDefaultFmax = 6000.0f;

    /// Chunks shared between consecutive windows by default
    static constexpr size_t kDefaultOverlapCount = 4;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// @brief Configure decimation and window length.
    /// @param sampleRate   Capture rate in Hz
    /// @param fmax         Highest frequency of interest; the decimation factor
    ///                     is max(1, floor(sampleRate / (2 fmax)))
    /// @param overlapCount Window length in chunks minus one
    /// @return Downsampled rate, 0 if the arguments are not usable
    double prepare(double sampleRate, float fmax = kDefaultFmax,
                   size_t overlapCount = kDefaultOverlapCount) {
        const double rate = decimator_.prepare(sampleRate, fmax);
        overlap_.prepare(overlapCount + 1);
        overlap_.reset();
        psd_.prepare();
        return rate;
    }

    /// Forget buffered audio but keep the configuration.
    void reset() {
        decimator_.reset();
        overlap_.reset();
        replay_.clear();
    }

    // =========================================================================
    // Streaming
    // =========================================================================

    /// Hand over the newest capture chunk (copied).
    void pushChunk(std::span<const float> chunk) { replay_.store(chunk); }

    /// @brief Advance the analysis window by one chunk.
    /// @return false when unprepared or before the first chunk arrived
    [[nodiscard]] bool update() {
        if (!isPrepared() || !replay_.hasChunk()) return false;
        const auto chunk = replay_.take();
        decimator_.process(chunk, decimated_);
        overlap_.push(decimated_);
        return true;
    }

    // =========================================================================
    // Analysis
    // =========================================================================

    /// @brief Warped PSD of the current window.
    void warpedPsd(size_t binCount, float fLow, float fHigh, FrequencyScale scale,
                   SpectralFrame& frame) {
        psd_.warped(overlap_.window(), decimator_.outputRate(), binCount, fLow, fHigh, scale, frame);
    }

    /// @brief Warped PSD of an arbitrary signal.
    void warpedPsd(std::span<const float> window, size_t binCount, double sampleRate,
                   float fLow, float fHigh, FrequencyScale scale, SpectralFrame& frame) {
        psd_.warped(window, sampleRate, binCount, fLow, fHigh, scale, frame);
    }

    // =========================================================================
    // Query
    // =========================================================================

    /// Continuous downsampled stream (oldest sample first)
    [[nodiscard]] std::span<const float> window() const noexcept { return overlap_.window(); }

    [[nodiscard]] double downsampledRate() const noexcept { return decimator_.outputRate(); }
    [[nodiscard]] size_t decimationFactor() const noexcept { return decimator_.factor(); }
    [[nodiscard]] size_t overlapCount() const noexcept { return overlap_.capacity() - 1; }
    [[nodiscard]] bool isPrepared() const noexcept { return decimator_.isPrepared(); }
    [[nodiscard]] size_t replayCount() const noexcept { return replay_.replayCount(); }

private:
    Decimator decimator_;
    OverlapWindow overlap_;
    ChunkReplaySlot replay_;
    PsdEstimator psd_;
    std::vector<float> decimated_;
};

// =============================================================================
// Line rendering helpers
// =============================================================================

/// @brief Stretch a bin-resolution line over the pixel strip.
inline void resampleToPixels(std::span<const float> bins, std::span<float> pixels) noexcept {
    Interpolation::resampleLinear(bins, pixels);
}

/// @brief Same-length convolution with a symmetric Hamming kernel.
///
/// @param line    Values to smooth
/// @param kernel  Taps from Window::hamming()
/// @param out     Smoothed values (same length as line, must not alias)
inline void smoothSymmetric(std::span<const float> line, std::span<const float> kernel,
                            std::span<float> out) noexcept {
    Window::convolveSame(line, kernel, out);
}

} // namespace DSP
} // namespace Lumina
