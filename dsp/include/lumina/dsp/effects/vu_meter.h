// ==============================================================================
// Layer 3: Effects - VU Meters
// ==============================================================================
// Bar-graph level meters. The level of the newest chunk is combined with the
// previous n_overlaps levels (RMS of RMS values, or maximum of peaks),
// converted to dB and mapped onto the strip over db_range decibels.
//
// Inputs:  0 audio (SkipFrame), 1 colour (Optional -> meter gradient)
// Outputs: 1
// ==============================================================================

#pragma once

#include <lumina/dsp/core/color_utils.h>
#include <lumina/dsp/core/db_utils.h>
#include <lumina/dsp/effects/effect_node.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <span>
#include <string_view>

namespace Lumina {
namespace DSP {

/// Level detector of a meter.
enum class MeterBallistics : uint8_t {
    Rms = 0,
    Peak
};

/// @brief Shared implementation of VuMeterRms and VuMeterPeak.
class VuMeter : public EffectNode {
public:
    /// Level (dB) where the default gradient leaves pure green
    static constexpr float kGradientStartDb = -24.0f;

    /// Maximum number of held levels (n_overlaps upper bound plus one)
    static constexpr size_t kMaxHold = 21;

    explicit VuMeter(MeterBallistics ballistics) : ballistics_(ballistics) {
        auto& p = params();
        p.bindNumeric("db_range", dbRange_, 20.0, 100.0, 1.0, "Range of the VU Meter in decibels.");
        p.bindNumeric("n_overlaps", overlapCount_, 0.0, 20.0, 1.0,
                      "Number of overlapping chunks in time. This smoothes the VU Meter.");
    }

    [[nodiscard]] std::span<const InputPortSpec> inputPorts() const noexcept override {
        return kPorts;
    }

    /// Level of the last rendered frame in dB.
    [[nodiscard]] float levelDb() const noexcept { return levelDb_; }

    /// Number of lit pixels in the last rendered frame.
    [[nodiscard]] size_t barLength() const noexcept { return barLength_; }

    /// @brief Green up to kGradientStartDb, then a hue ramp to red.
    static void buildGradient(size_t numPixels, float dbRange, PixelBuffer& out) {
        out.resize(numPixels);
        const float scal = (dbRange + kGradientStartDb) / dbRange;
        const size_t greenEnd = std::min(numPixels,
            static_cast<size_t>(std::max(0.0f, static_cast<float>(numPixels) * scal)));
        for (size_t i = 0; i < greenEnd; ++i) out.setPixel(i, Colors::kGreen);

        const size_t rampLength = numPixels - greenEnd;
        constexpr float kGreenHue = 1.0f / 3.0f;
        for (size_t i = 0; i < rampLength; ++i) {
            const float t = rampLength > 1 ? static_cast<float>(i) / static_cast<float>(rampLength - 1) : 0.0f;
            out.setPixel(greenEnd + i, hsvToRgb(kGreenHue * (1.0f - t), 1.0f, 1.0f));
        }
    }

protected:
    void onUpdate(double /*dt*/) override {
        if (gradient_.numPixels() != numPixels() || gradientRange_ != dbRange_) {
            buildGradient(numPixels(), dbRange_, gradient_);
            gradientRange_ = dbRange_;
        }
    }

    bool render(const FrameInputs& in, FrameOutputs& out) override {
        const auto audio = in.audio(0);
        holdValues_.push_front(chunkLevel(audio));
        const size_t holdSize = std::min(kMaxHold, static_cast<size_t>(std::max(0, overlapCount_)) + 1);
        while (holdValues_.size() > holdSize) holdValues_.pop_back();

        levelDb_ = linearToDb(heldLevel());
        const size_t n = numPixels();
        const float scal = (dbRange_ + levelDb_) / dbRange_;
        const double raw = std::floor(static_cast<double>(n) * static_cast<double>(scal));
        barLength_ = static_cast<size_t>(std::clamp(raw, 0.0, static_cast<double>(n - 1)));

        if (gradient_.numPixels() != n) buildGradient(n, dbRange_, gradient_);
        const PixelBuffer* color = in.pixels(1);
        const PixelBuffer& source = color != nullptr ? *color : gradient_;

        PixelBuffer& bar = outputBuffer(out, 0);
        bar.fill(0.0f);
        for (size_t i = 0; i < barLength_; ++i) bar.setPixel(i, source.pixel(i));
        return true;
    }

private:
    [[nodiscard]] double chunkLevel(std::span<const float> audio) const noexcept {
        if (audio.empty()) return 0.0;
        if (ballistics_ == MeterBallistics::Peak) {
            return sanitize(static_cast<double>(*std::max_element(audio.begin(), audio.end())));
        }
        double sum = 0.0;
        for (float s : audio) sum += static_cast<double>(sanitize(s)) * sanitize(s);
        return std::sqrt(sum / static_cast<double>(audio.size()));
    }

    [[nodiscard]] double heldLevel() const noexcept {
        if (ballistics_ == MeterBallistics::Peak) {
            return *std::max_element(holdValues_.begin(), holdValues_.end());
        }
        double sum = 0.0;
        for (double v : holdValues_) sum += v * v;
        return std::sqrt(sum / static_cast<double>(holdValues_.size()));
    }

    static constexpr std::array<InputPortSpec, 2> kPorts{{
        {"audio", PortKind::Audio, AbsentPolicy::SkipFrame},
        {"color", PortKind::Pixels, AbsentPolicy::Optional}
    }};

    MeterBallistics ballistics_;
    float dbRange_ = 60.0f;
    int overlapCount_ = 1;

    std::deque<double> holdValues_;
    PixelBuffer gradient_;
    float gradientRange_ = 0.0f;
    float levelDb_ = kSilenceFloorDb;
    size_t barLength_ = 0;
};

/// RMS meter.
class VuMeterRms final : public VuMeter {
public:
    VuMeterRms() : VuMeter(MeterBallistics::Rms) {}
    [[nodiscard]] std::string_view name() const noexcept override { return "VuMeterRms"; }
};

/// Peak meter.
class VuMeterPeak final : public VuMeter {
public:
    VuMeterPeak() : VuMeter(MeterBallistics::Peak) {}
    [[nodiscard]] std::string_view name() const noexcept override { return "VuMeterPeak"; }
};

} // namespace DSP
} // namespace Lumina
