// ==============================================================================
// Layer 0: Core Utility - FrameContext
// ==============================================================================
// Per-frame rendering context handed to every effect node at prepare() time.
// ==============================================================================

#pragma once

#include <cstddef>
#include <optional>

namespace Lumina {
namespace DSP {

/// @brief Rendering context for effect nodes.
///
/// The capture sample rate is unknown until a capture source starts, which
/// is a valid state: nodes that need it stay idle until it appears.
///
/// @example
/// @code
/// FrameContext ctx;
/// ctx.numPixels = 60;
/// node.prepare(ctx);           // generative nodes start rendering
/// ctx.sampleRate = 44100.0;
/// node.prepare(ctx);           // audio nodes design their filters
/// @endcode
struct FrameContext {
    std::optional<double> sampleRate;   ///< Capture rate in Hz, nullopt if unknown
    size_t numPixels = 0;               ///< Strip length

    [[nodiscard]] bool hasSampleRate() const noexcept {
        return sampleRate.has_value() && *sampleRate > 0.0;
    }

    [[nodiscard]] bool hasPixels() const noexcept {
        return numPixels > 0;
    }

    /// @return Nyquist frequency, 0 when the sample rate is unknown
    [[nodiscard]] double nyquist() const noexcept {
        return hasSampleRate() ? *sampleRate * 0.5 : 0.0;
    }

    [[nodiscard]] bool operator==(const FrameContext&) const noexcept = default;
};

} // namespace DSP
} // namespace Lumina
