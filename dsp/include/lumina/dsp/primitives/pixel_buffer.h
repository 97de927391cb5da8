// ==============================================================================
// Layer 1: DSP Primitive - PixelBuffer
// ==============================================================================
// Three rows (red, green, blue) of N floats: the universal data type that
// flows between effect nodes. Values are nominally in [0, 255]; the final
// clamp happens once per frame through sanitizeAndClamp().
//
// Storage is one contiguous row-major block so the SIMD clamp sees all
// 3 * N values at once.
// ==============================================================================

#pragma once

#include <lumina/dsp/core/color_utils.h>
#include <lumina/dsp/core/db_utils.h>
#include <lumina/dsp/core/math_constants.h>
#include <lumina/dsp/core/pixel_simd.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace Lumina {
namespace DSP {

/// Row selector
enum class Channel : uint8_t {
    Red = 0,
    Green = 1,
    Blue = 2
};

inline constexpr Channel kAllChannels[] = {Channel::Red, Channel::Green, Channel::Blue};

/// @brief 3 x N colour buffer.
///
/// @example
/// @code
/// PixelBuffer strip(60);
/// strip.setPixel(0, Colors::kRed);
/// strip.sanitizeAndClamp();
/// auto bytes = strip.toBytes();   // 180 bytes, rows R then G then B
/// @endcode
class PixelBuffer {
public:
    PixelBuffer() noexcept = default;

    explicit PixelBuffer(size_t numPixels, float value = 0.0f)
        : numPixels_(numPixels)
        , data_(numPixels * kNumColorChannels, value) {}

    /// Buffer with every pixel set to one colour.
    [[nodiscard]] static PixelBuffer solid(size_t numPixels, Rgb color) {
        PixelBuffer buffer(numPixels);
        buffer.fill(color);
        return buffer;
    }

    // =========================================================================
    // Shape
    // =========================================================================

    /// Change the pixel count. Contents are reset to value when N changes.
    void resize(size_t numPixels, float value = 0.0f) {
        if (numPixels == numPixels_) return;
        numPixels_ = numPixels;
        data_.assign(numPixels * kNumColorChannels, value);
    }

    [[nodiscard]] size_t numPixels() const noexcept { return numPixels_; }
    [[nodiscard]] bool empty() const noexcept { return numPixels_ == 0; }

    // =========================================================================
    // Access
    // =========================================================================

    [[nodiscard]] std::span<float> row(Channel c) noexcept {
        return {data_.data() + rowOffset(c), numPixels_};
    }

    [[nodiscard]] std::span<const float> row(Channel c) const noexcept {
        return {data_.data() + rowOffset(c), numPixels_};
    }

    [[nodiscard]] float& at(Channel c, size_t index) noexcept {
        return data_[rowOffset(c) + index];
    }

    [[nodiscard]] float at(Channel c, size_t index) const noexcept {
        return data_[rowOffset(c) + index];
    }

    [[nodiscard]] Rgb pixel(size_t index) const noexcept {
        return {at(Channel::Red, index), at(Channel::Green, index), at(Channel::Blue, index)};
    }

    void setPixel(size_t index, Rgb color) noexcept {
        at(Channel::Red, index) = color.r;
        at(Channel::Green, index) = color.g;
        at(Channel::Blue, index) = color.b;
    }

    void addPixel(size_t index, Rgb color) noexcept {
        at(Channel::Red, index) += color.r;
        at(Channel::Green, index) += color.g;
        at(Channel::Blue, index) += color.b;
    }

    /// All 3 * N values, row-major.
    [[nodiscard]] std::span<float> data() noexcept { return data_; }
    [[nodiscard]] std::span<const float> data() const noexcept { return data_; }

    // =========================================================================
    // Bulk operations
    // =========================================================================

    void fill(float value) noexcept { std::fill(data_.begin(), data_.end(), value); }

    void fill(Rgb color) noexcept {
        std::fill_n(row(Channel::Red).begin(), numPixels_, color.r);
        std::fill_n(row(Channel::Green).begin(), numPixels_, color.g);
        std::fill_n(row(Channel::Blue).begin(), numPixels_, color.b);
    }

    void scale(float gain) noexcept {
        for (auto& v : data_) v *= gain;
    }

    /// Multiply every channel of pixel i by mask[i].
    void multiplyByMask(std::span<const float> mask) noexcept {
        const size_t n = std::min(mask.size(), numPixels_);
        for (Channel c : kAllChannels) {
            auto r = row(c);
            for (size_t i = 0; i < n; ++i) r[i] *= mask[i];
        }
    }

    /// Copy colour * mask into this buffer (resized to mask.size()).
    void assignMasked(const PixelBuffer& color, std::span<const float> mask, float gain = 1.0f) {
        resize(mask.size());
        const size_t n = std::min(color.numPixels(), numPixels_);
        for (Channel c : kAllChannels) {
            auto dst = row(c);
            auto src = color.row(c);
            for (size_t i = 0; i < n; ++i) dst[i] = src[i] * mask[i] * gain;
            for (size_t i = n; i < numPixels_; ++i) dst[i] = 0.0f;
        }
    }

    /// Replace non-finite values with 0 and clamp to [0, 255].
    void sanitizeAndClamp() noexcept {
        if (data_.empty()) return;
        Lumina::DSP::sanitizeAndClamp(data_.data(), data_.size(), 0.0f, kMaxPixelValue);
    }

    [[nodiscard]] float maxValue() const noexcept {
        return data_.empty() ? 0.0f : *std::max_element(data_.begin(), data_.end());
    }

    [[nodiscard]] float minValue() const noexcept {
        return data_.empty() ? 0.0f : *std::min_element(data_.begin(), data_.end());
    }

    // =========================================================================
    // Hardware boundary
    // =========================================================================

    /// @brief 3 x N bytes, rows R, G, B; column index = strip position.
    ///
    /// Values are clamped to [0, 255] and truncated toward zero. Non-finite
    /// values become 0.
    [[nodiscard]] std::vector<uint8_t> toBytes() const {
        std::vector<uint8_t> bytes(data_.size());
        for (size_t i = 0; i < data_.size(); ++i) {
            const float v = data_[i];
            const float clamped = detail::isFinite(v) ? std::clamp(v, 0.0f, kMaxPixelValue) : 0.0f;
            bytes[i] = static_cast<uint8_t>(clamped);
        }
        return bytes;
    }

private:
    [[nodiscard]] size_t rowOffset(Channel c) const noexcept {
        return static_cast<size_t>(c) * numPixels_;
    }

    size_t numPixels_ = 0;
    std::vector<float> data_;
};

/// @brief Per-channel blend of two buffers of equal length into out.
/// Pixels beyond the shorter input are taken from the longer one.
inline void blend(const PixelBuffer& a, const PixelBuffer& b, BlendMode mode, PixelBuffer& out) {
    const size_t n = std::max(a.numPixels(), b.numPixels());
    out.resize(n);
    for (Channel c : kAllChannels) {
        auto dst = out.row(c);
        auto ra = a.row(c);
        auto rb = b.row(c);
        for (size_t i = 0; i < n; ++i) {
            if (i < ra.size() && i < rb.size()) {
                dst[i] = blendChannel(ra[i], rb[i], mode);
            } else {
                dst[i] = (i < ra.size()) ? ra[i] : rb[i];
            }
        }
    }
}

} // namespace DSP
} // namespace Lumina
