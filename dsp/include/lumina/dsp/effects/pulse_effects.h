// ==============================================================================
// Layer 3: Effects - Global Pulses
// ==============================================================================
// Whole-strip brightness modulations of a colour input.
//
// Breathing: 0.5 sin(2 pi t / cycle) + 0.5
// Heartbeat: |sin(s t)^63 * sin(s t + 1.5) * 8|, a sharp double beat
// ==============================================================================

#pragma once

#include <lumina/dsp/core/color_utils.h>
#include <lumina/dsp/core/math_constants.h>
#include <lumina/dsp/effects/effect_node.h>

#include <array>
#include <cmath>
#include <span>
#include <string_view>

namespace Lumina {
namespace DSP {

/// Breathing brightness at time t for a cycle length in seconds.
[[nodiscard]] inline float breathingBrightness(double t, double cycle) noexcept {
    return static_cast<float>(0.5 * std::sin(2.0 * kPiD / cycle * t) + 0.5);
}

/// Heartbeat brightness at time t for a beat speed (radians per second).
[[nodiscard]] inline float heartbeatBrightness(double t, double speed) noexcept {
    const double phase = speed * t;
    return static_cast<float>(std::abs(std::pow(std::sin(phase), 63.0) * std::sin(phase + 1.5) * 8.0));
}

// =============================================================================
// Breathing
// =============================================================================

/// Inputs: 0 colour (White). Outputs: 1.
class Breathing final : public EffectNode {
public:
    Breathing() {
        params().bindNumeric("cycle", cycle_, 0.1, 10.0, 0.1, "Length of one breath in seconds.");
    }

    [[nodiscard]] std::string_view name() const noexcept override { return "Breathing"; }

    [[nodiscard]] std::span<const InputPortSpec> inputPorts() const noexcept override {
        return kPorts;
    }

protected:
    bool render(const FrameInputs& in, FrameOutputs& out) override {
        PixelBuffer& dst = outputBuffer(out, 0);
        dst = *in.pixels(0);
        dst.scale(breathingBrightness(time(), cycle_));
        return true;
    }

private:
    static constexpr std::array<InputPortSpec, 1> kPorts{{
        {"color", PortKind::Pixels, AbsentPolicy::White}
    }};

    float cycle_ = 5.0f;
};

// =============================================================================
// Heartbeat
// =============================================================================

/// Inputs: 0 colour (Optional -> red). Outputs: 1.
class Heartbeat final : public EffectNode {
public:
    Heartbeat() {
        params().bindNumeric("speed", speed_, 0.1, 100.0, 0.1, "Speed of the heartbeat.");
    }

    [[nodiscard]] std::string_view name() const noexcept override { return "Heartbeat"; }

    [[nodiscard]] std::span<const InputPortSpec> inputPorts() const noexcept override {
        return kPorts;
    }

protected:
    bool render(const FrameInputs& in, FrameOutputs& out) override {
        PixelBuffer& dst = outputBuffer(out, 0);
        if (const PixelBuffer* color = in.pixels(0)) {
            dst = *color;
        } else {
            dst.fill(Colors::kRed);
        }
        dst.scale(heartbeatBrightness(time(), speed_));
        return true;
    }

private:
    static constexpr std::array<InputPortSpec, 1> kPorts{{
        {"color", PortKind::Pixels, AbsentPolicy::Optional}
    }};

    float speed_ = 1.0f;
};

} // namespace DSP
} // namespace Lumina
