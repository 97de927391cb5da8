// ==============================================================================
// Layer 3: Effect - MovingLight
// ==============================================================================
// Audio-reactive travelling light. The band-filtered audio peak is injected
// at the strip origin and the whole strip moves outward at `speed` pixels
// per second while fading over `dim_time` seconds.
//
// Inputs:  0 audio (SkipFrame), 1 colour (White)
// Outputs: 1
// ==============================================================================

#pragma once

#include <lumina/dsp/core/db_utils.h>
#include <lumina/dsp/core/math_constants.h>
#include <lumina/dsp/effects/effect_node.h>
#include <lumina/dsp/primitives/decaying_shift_buffer.h>
#include <lumina/dsp/primitives/streaming_filter.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <span>
#include <string_view>

namespace Lumina {
namespace DSP {

class MovingLight final : public EffectNode {
public:
    MovingLight() {
        auto& p = params();
        p.bindNumeric("speed", speed_, 1.0, 200.0, 1.0, "Speed of the moving peak.");
        p.bindNumeric("dim_time", dimTime_, 0.01, 10.0, 0.01,
                      "Amount of time for the afterglow of the moving peak.");
        p.bindNumeric("lowcut_hz", lowcut_, 0.0, 8000.0, 1.0, "Lowcut frequency of the audio input.");
        p.bindNumeric("highcut_hz", highcut_, 0.0, 8000.0, 1.0, "Highcut frequency of the audio input.");
        p.bindNumeric("peak_filter", peakFilter_, 0.0, 10.0, 0.01,
                      "Filters the audio peaks. Increase to turn only high peaks into light.");
        p.bindNumeric("peak_scale", peakScale_, 0.0, 5.0, 0.01, "Scales the visual peak after the filter.");
        p.bindNumeric("highlight", highlight_, 0.0, 1.0, 0.01, "Amount of white light added to the audio peak.");
        filter_.setCutoffs(lowcut_, highcut_);
    }

    [[nodiscard]] std::string_view name() const noexcept override { return "MovingLight"; }

    [[nodiscard]] std::span<const InputPortSpec> inputPorts() const noexcept override {
        return kPorts;
    }

    /// Current light trail (for inspection).
    [[nodiscard]] const PixelBuffer& trail() const noexcept { return trail_.pixels(); }

protected:
    void onPrepare(const FrameContext& previous) override {
        if (context().sampleRate != previous.sampleRate) {
            filter_.prepare(context().hasSampleRate() ? *context().sampleRate : 0.0);
        }
    }

    void onUpdate(double /*dt*/) override {
        if (trail_.numPixels() != numPixels()) trail_.resize(numPixels());
    }

    void onParameterChanged(std::string_view param) override {
        if (param == "lowcut_hz" || param == "highcut_hz") {
            filter_.setCutoffs(lowcut_, highcut_);
        }
    }

    bool render(const FrameInputs& in, FrameOutputs& out) override {
        if (!filter_.isPrepared()) return false;
        if (trail_.numPixels() != numPixels()) trail_.resize(numPixels());

        const float rawPeak = filter_.processPeak(in.audio(0));
        const double now = time();

        // Move once at least one pixel of travel has accumulated
        const double travelled = (now - lastMoveTime_) * speed_;
        if (travelled > 1.0) {
            trail_.shift(static_cast<size_t>(travelled));
            lastMoveTime_ = now;
        }

        const double dt = now - lastTime_;
        lastTime_ = now;
        trail_.decay(static_cast<float>(1.0 - dt / dimTime_));
        trail_.blur(2);

        const float peak = safePow(rawPeak, peakFilter_) * peakScale_;
        const Rgb origin = in.pixels(1)->pixel(0);
        const float white = highlight_ * peak * kMaxPixelValue;
        trail_.inject({origin.r * peak + white, origin.g * peak + white, origin.b * peak + white});
        trail_.sanitizeAndClamp();

        outputBuffer(out, 0) = trail_.pixels();
        return true;
    }

private:
    static constexpr std::array<InputPortSpec, 2> kPorts{{
        {"audio", PortKind::Audio, AbsentPolicy::SkipFrame},
        {"color", PortKind::Pixels, AbsentPolicy::White}
    }};

    float speed_ = 100.0f;
    float dimTime_ = 2.5f;
    float lowcut_ = 50.0f;
    float highcut_ = 300.0f;
    float peakFilter_ = 2.6f;
    float peakScale_ = 4.0f;
    float highlight_ = 0.6f;

    StreamingFilter filter_;
    DecayingShiftBuffer trail_;
    double lastTime_ = 0.0;
    double lastMoveTime_ = 0.0;
};

} // namespace DSP
} // namespace Lumina
