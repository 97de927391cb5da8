// ==============================================================================
// Layer 1: DSP Primitive - BubbleSorter
// ==============================================================================
// Bubble sort of a pixel strip, advanced one outer pass per call so the
// sorting itself can be watched frame by frame.
// ==============================================================================

#pragma once

#include <lumina/dsp/core/random.h>
#include <lumina/dsp/primitives/pixel_buffer.h>

#include <cstddef>
#include <cstdint>

namespace Lumina {
namespace DSP {

/// Pixel property the strip is ordered by.
enum class SortKey : uint8_t {
    Red = 0,
    Green,
    Blue,
    Brightness   ///< r + g + b
};

inline constexpr size_t kNumSortKeys = 4;

/// Sort key of pixel i.
[[nodiscard]] inline float sortKeyOf(const PixelBuffer& pixels, size_t i, SortKey key) noexcept {
    switch (key) {
        case SortKey::Red:   return pixels.at(Channel::Red, i);
        case SortKey::Green: return pixels.at(Channel::Green, i);
        case SortKey::Blue:  return pixels.at(Channel::Blue, i);
        case SortKey::Brightness:
        default:             return pixels.pixel(i).brightness();
    }
}

/// @brief Incremental bubble sort over a PixelBuffer.
///
/// Each step() performs one pass over the unsorted prefix, whose length
/// shrinks by one per pass. A pass without swaps, or N - 1 completed
/// passes, marks the strip sorted.
///
/// @example
/// @code
/// BubbleSorter sorter;
/// sorter.shuffle(60, rng);
/// while (!sorter.isSorted()) sorter.step();
/// @endcode
class BubbleSorter {
public:
    /// Fill the strip with random integer colours in [0, 255] and restart.
    void shuffle(size_t numPixels, Xorshift32& rng) {
        pixels_.resize(numPixels);
        for (Channel c : kAllChannels) {
            for (auto& v : pixels_.row(c)) v = static_cast<float>(rng.nextBelow(256));
        }
        restart();
    }

    /// Sort an existing buffer from scratch.
    void assign(const PixelBuffer& pixels) {
        pixels_ = pixels;
        restart();
    }

    void setKey(SortKey key) noexcept { key_ = key; }
    void setReversed(bool reversed) noexcept { reversed_ = reversed; }

    /// Reset the pass bookkeeping so the current contents are sorted again.
    void restart() noexcept {
        const size_t n = pixels_.numPixels();
        passLimit_ = n > 0 ? n - 1 : 0;
        passes_ = 0;
        sorted_ = passLimit_ == 0;
    }

    /// @brief One outer pass.
    /// @return Number of swaps performed
    size_t step() noexcept {
        if (sorted_) return 0;

        size_t swaps = 0;
        for (size_t i = 0; i < passLimit_; ++i) {
            const float a = sortKeyOf(pixels_, i, key_);
            const float b = sortKeyOf(pixels_, i + 1, key_);
            const bool outOfOrder = reversed_ ? (a < b) : (a > b);
            if (outOfOrder) {
                const Rgb tmp = pixels_.pixel(i);
                pixels_.setPixel(i, pixels_.pixel(i + 1));
                pixels_.setPixel(i + 1, tmp);
                ++swaps;
            }
        }

        ++passes_;
        --passLimit_;
        if (swaps == 0 || passLimit_ == 0) sorted_ = true;
        return swaps;
    }

    /// True when the strip is ordered by the current key and direction.
    [[nodiscard]] bool isOrdered() const noexcept {
        for (size_t i = 0; i + 1 < pixels_.numPixels(); ++i) {
            const float a = sortKeyOf(pixels_, i, key_);
            const float b = sortKeyOf(pixels_, i + 1, key_);
            if (reversed_ ? (a < b) : (a > b)) return false;
        }
        return true;
    }

    [[nodiscard]] bool isSorted() const noexcept { return sorted_; }
    [[nodiscard]] size_t passes() const noexcept { return passes_; }
    [[nodiscard]] SortKey key() const noexcept { return key_; }
    [[nodiscard]] bool reversed() const noexcept { return reversed_; }
    [[nodiscard]] const PixelBuffer& pixels() const noexcept { return pixels_; }

private:
    PixelBuffer pixels_;
    SortKey key_ = SortKey::Red;
    bool reversed_ = false;
    size_t passLimit_ = 0;
    size_t passes_ = 0;
    bool sorted_ = true;
};

} // namespace DSP
} // namespace Lumina
