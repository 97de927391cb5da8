// ==============================================================================
// Layer 3: Effect - Bonfire
// ==============================================================================
// Audio-reactive colour split: the red row of the pixel input is shifted
// towards the origin and the blue row away from it, both by spread * peak
// pixels, wrapping around the strip.
//
// Inputs:  0 audio (SkipFrame), 1 pixels (White)
// Outputs: 1
// ==============================================================================

#pragma once

#include <lumina/dsp/core/db_utils.h>
#include <lumina/dsp/core/interpolation.h>
#include <lumina/dsp/effects/effect_node.h>
#include <lumina/dsp/primitives/streaming_filter.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <span>
#include <string_view>

namespace Lumina {
namespace DSP {

/// @brief out[i] = in[i - offset] with wrap-around and linear interpolation
///        for fractional offsets. in and out must not alias.
inline void shiftWrapped(std::span<const float> in, double offset, std::span<float> out) noexcept {
    const size_t n = std::min(in.size(), out.size());
    if (n == 0) return;
    const double len = static_cast<double>(n);
    for (size_t i = 0; i < n; ++i) {
        double pos = std::fmod(static_cast<double>(i) - offset, len);
        if (pos < 0.0) pos += len;
        const size_t i0 = static_cast<size_t>(pos) % n;
        const size_t i1 = (i0 + 1) % n;
        const float frac = static_cast<float>(pos - std::floor(pos));
        out[i] = Interpolation::linearInterpolate(in[i0], in[i1], frac);
    }
}

class Bonfire final : public EffectNode {
public:
    Bonfire() {
        auto& p = params();
        p.bindNumeric("spread", spread_, 0.0, 100.0, 1.0, "Amount of color splitting per audio peak.");
        p.bindNumeric("lowcut_hz", lowcut_, 0.0, 8000.0, 1.0, "Lowcut frequency of the audio input.");
        p.bindNumeric("highcut_hz", highcut_, 0.0, 8000.0, 1.0, "Highcut frequency of the audio input.");
        filter_.setCutoffs(lowcut_, highcut_);
    }

    [[nodiscard]] std::string_view name() const noexcept override { return "Bonfire"; }

    [[nodiscard]] std::span<const InputPortSpec> inputPorts() const noexcept override {
        return kPorts;
    }

protected:
    void onPrepare(const FrameContext& previous) override {
        if (context().sampleRate != previous.sampleRate) {
            filter_.prepare(context().hasSampleRate() ? *context().sampleRate : 0.0);
        }
    }

    void onParameterChanged(std::string_view param) override {
        if (param == "lowcut_hz" || param == "highcut_hz") {
            filter_.setCutoffs(lowcut_, highcut_);
        }
    }

    bool render(const FrameInputs& in, FrameOutputs& out) override {
        if (!filter_.isPrepared()) return false;

        const float peak = sanitize(filter_.processPeak(in.audio(0)));
        const double offset = static_cast<double>(spread_) * peak;
        const PixelBuffer& src = *in.pixels(1);

        PixelBuffer& dst = outputBuffer(out, 0);
        shiftWrapped(src.row(Channel::Red), -offset, dst.row(Channel::Red));
        const auto green = src.row(Channel::Green);
        std::copy(green.begin(), green.end(), dst.row(Channel::Green).begin());
        shiftWrapped(src.row(Channel::Blue), offset, dst.row(Channel::Blue));
        return true;
    }

private:
    static constexpr std::array<InputPortSpec, 2> kPorts{{
        {"audio", PortKind::Audio, AbsentPolicy::SkipFrame},
        {"pixels", PortKind::Pixels, AbsentPolicy::White}
    }};

    float spread_ = 100.0f;
    float lowcut_ = 50.0f;
    float highcut_ = 200.0f;
    StreamingFilter filter_;
};

} // namespace DSP
} // namespace Lumina
