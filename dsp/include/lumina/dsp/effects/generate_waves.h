// ==============================================================================
// Layer 3: Effect - GenerateWaves
// ==============================================================================
// Static spatial wave profile multiplied onto a colour input. The profile
// is rebuilt whenever the pixel count or a parameter changes.
//
// profile[i] = 0.5 scale - shape(x_i * pi / period) * 0.5 scale
//
// Inputs:  0 colour (White)
// Outputs: 1
// ==============================================================================

#pragma once

#include <lumina/dsp/core/math_constants.h>
#include <lumina/dsp/core/wave_shapes.h>
#include <lumina/dsp/effects/effect_node.h>
#include <lumina/dsp/effects/parameter_mappings.h>

#include <array>
#include <cstddef>
#include <span>
#include <string_view>
#include <vector>

namespace Lumina {
namespace DSP {

/// @brief Fill profile with the wave shape over the strip.
///
/// The sine profile samples integer pixel positions; the other shapes
/// stretch positions so the last pixel sits at x = N.
inline void buildWaveProfile(WaveShape shape, float period, float scale, std::vector<float>& profile) {
    const size_t n = profile.size();
    const double half = 0.5 * static_cast<double>(scale);
    const double omega = kPiD / static_cast<double>(period);
    const double stretch = (shape == WaveShape::Sine || n < 2)
        ? 1.0 : static_cast<double>(n) / static_cast<double>(n - 1);
    for (size_t i = 0; i < n; ++i) {
        const double x = static_cast<double>(i) * stretch;
        profile[i] = static_cast<float>(half - waveShapeValue(shape, x * omega) * half);
    }
}

class GenerateWaves final : public EffectNode {
public:
    GenerateWaves() {
        auto& p = params();
        p.bindNumeric("period", period_, 1.0, 300.0, 1.0, "Period of the wave in pixels.");
        p.bindNumeric("scale", scale_, 0.01, 1.0, 0.01, "Amplitude of the wave.");
        p.bindChoice("wavemode", shape_, kWaveShapeChoices, "Shape of the wave.");
    }

    [[nodiscard]] std::string_view name() const noexcept override { return "GenerateWaves"; }

    [[nodiscard]] std::span<const InputPortSpec> inputPorts() const noexcept override {
        return kPorts;
    }

    [[nodiscard]] std::span<const float> profile() const noexcept { return profile_; }

protected:
    void onUpdate(double /*dt*/) override {
        if (dirty_ || profile_.size() != numPixels()) {
            profile_.resize(numPixels());
            buildWaveProfile(shape_, period_, scale_, profile_);
            dirty_ = false;
        }
    }

    void onParameterChanged(std::string_view /*param*/) override { dirty_ = true; }

    bool render(const FrameInputs& in, FrameOutputs& out) override {
        if (dirty_ || profile_.size() != numPixels()) onUpdate(0.0);
        outputBuffer(out, 0).assignMasked(*in.pixels(0), profile_);
        return true;
    }

private:
    static constexpr std::array<InputPortSpec, 1> kPorts{{
        {"color", PortKind::Pixels, AbsentPolicy::White}
    }};

    float period_ = 20.0f;
    float scale_ = 1.0f;
    WaveShape shape_ = WaveShape::Sine;

    std::vector<float> profile_;
    bool dirty_ = true;
};

} // namespace DSP
} // namespace Lumina
