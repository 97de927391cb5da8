// ==============================================================================
// Layer 1: DSP Primitive - DecayingShiftBuffer
// ==============================================================================
// A pixel strip that travels away from index 0 and fades over time: new light
// is injected at the origin, older light is shifted outward, dimmed and
// softened with a small gaussian blur each frame.
// ==============================================================================

#pragma once

#include <lumina/dsp/core/color_utils.h>
#include <lumina/dsp/core/window_functions.h>
#include <lumina/dsp/primitives/pixel_buffer.h>

#include <algorithm>
#include <cstddef>
#include <span>
#include <vector>

namespace Lumina {
namespace DSP {

class DecayingShiftBuffer {
public:
    /// Standard deviation (pixels) of the softening blur
    static constexpr float kBlurSigma = 0.5f;

    DecayingShiftBuffer()
        : taps_(Window::gaussianKernel(kBlurSigma)) {}

    /// Resize the strip. Changing the length clears it.
    void resize(size_t numPixels) { pixels_.resize(numPixels); }

    void clear() noexcept { pixels_.fill(0.0f); }

    // =========================================================================
    // Frame operations
    // =========================================================================

    /// @brief Move every pixel `shift` positions away from the origin.
    ///
    /// The vacated head repeats the colour that now sits at index `shift`
    /// and the seam region [0, 2 * shift) is blurred. shift is clamped to
    /// [1, N - 1]; strips shorter than 2 pixels are left unchanged.
    void shift(size_t shift) {
        const size_t n = pixels_.numPixels();
        if (n < 2 || shift == 0) return;
        shift = std::clamp<size_t>(shift, 1, n - 1);

        for (Channel c : kAllChannels) {
            auto r = pixels_.row(c);
            std::copy_backward(r.begin(), r.end() - static_cast<std::ptrdiff_t>(shift), r.end());
            std::fill_n(r.begin(), shift, r[shift]);
            const size_t seam = std::min(2 * shift, n);
            Window::gaussianBlur(r.first(seam), taps_, scratch_);
        }
    }

    /// Multiply every value by max(0, factor).
    void decay(float factor) noexcept {
        pixels_.scale(std::max(0.0f, factor));
    }

    /// Blur the whole strip `passes` times.
    void blur(int passes) {
        for (int p = 0; p < passes; ++p) {
            for (Channel c : kAllChannels) {
                Window::gaussianBlur(pixels_.row(c), taps_, scratch_);
            }
        }
    }

    /// Overwrite the origin pixel.
    void inject(Rgb color) noexcept {
        if (!pixels_.empty()) pixels_.setPixel(0, color);
    }

    void sanitizeAndClamp() noexcept { pixels_.sanitizeAndClamp(); }

    // =========================================================================
    // Query
    // =========================================================================

    [[nodiscard]] const PixelBuffer& pixels() const noexcept { return pixels_; }
    [[nodiscard]] size_t numPixels() const noexcept { return pixels_.numPixels(); }

private:
    PixelBuffer pixels_;
    std::vector<float> taps_;
    std::vector<float> scratch_;
};

} // namespace DSP
} // namespace Lumina
