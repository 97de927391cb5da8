// ==============================================================================
// Layer 3: Effect - Spectrum
// ==============================================================================
// Perceptually warped spectrum display. The analysis window is split into a
// bass band and a melody band, each stretched over the strip, smoothed and
// used as a brightness mask for its colour input. The two layers are then
// blended.
//
// A frame without a new chunk replays the last one, so the display keeps
// running once the stream has started.
//
// Inputs:  0 audio (Optional), 1 melody colour (White), 2 bass colour (White)
// Outputs: 1
// ==============================================================================

#pragma once

#include <lumina/dsp/core/color_utils.h>
#include <lumina/dsp/core/frequency_scales.h>
#include <lumina/dsp/core/math_constants.h>
#include <lumina/dsp/core/window_functions.h>
#include <lumina/dsp/effects/effect_node.h>
#include <lumina/dsp/effects/parameter_mappings.h>
#include <lumina/dsp/processors/spectral_analyzer.h>

#include <array>
#include <cstddef>
#include <span>
#include <string_view>
#include <vector>

namespace Lumina {
namespace DSP {

class Spectrum final : public EffectNode {
public:
    /// Bass band (C1 to middle C), Hz
    static constexpr float kBassLowHz = 32.7f;
    static constexpr float kBassHighHz = 261.0f;

    Spectrum()
        : smoothing_(Window::hamming(Window::kSmoothingKernelLength)) {
        auto& p = params();
        p.bindNumeric("n_overlaps", overlapCount_, 0.0, 20.0, 1.0,
                      "Number of overlapping chunks in time. This smoothes the FFT.");
        p.bindNumeric("fft_bins", binCount_, 32.0, 128.0, 1.0,
                      "Number of bins of the FFT. Increase for a more detailed FFT.");
        p.bindNumeric("fmax", fmax_, 1000.0, 12000.0, 100.0, "Highest displayed frequency.");
        p.bindChoice("col_blend", blendMode_, kBlendModeChoices,
                     "Color blend mode for combining bass and melody FFT.");
        p.bindChoice("frequency_scale", scale_, kFrequencyScaleChoices,
                     "Frequency axis of the display.");
    }

    [[nodiscard]] std::string_view name() const noexcept override { return "Spectrum"; }

    [[nodiscard]] std::span<const InputPortSpec> inputPorts() const noexcept override {
        return kPorts;
    }

    [[nodiscard]] const ChunkedSpectralAnalyzer& analyzer() const noexcept { return analyzer_; }
    [[nodiscard]] const SpectralFrame& bassFrame() const noexcept { return bass_; }
    [[nodiscard]] const SpectralFrame& melodyFrame() const noexcept { return melody_; }

protected:
    void onPrepare(const FrameContext& previous) override {
        if (context().sampleRate != previous.sampleRate) configureAnalyzer();
    }

    void onParameterChanged(std::string_view param) override {
        if (param == "n_overlaps" || param == "fmax") configureAnalyzer();
    }

    bool render(const FrameInputs& in, FrameOutputs& out) override {
        if (!analyzer_.isPrepared()) return false;

        if (in.has(0)) analyzer_.pushChunk(in.audio(0));
        if (!analyzer_.update()) return false;

        const auto bins = static_cast<size_t>(binCount_);
        analyzer_.warpedPsd(bins, kBassLowHz, kBassHighHz, scale_, bass_);
        analyzer_.warpedPsd(bins, kBassHighHz, fmax_, scale_, melody_);

        renderLine(bass_.energy, bassLine_);
        renderLine(melody_.energy, melodyLine_);

        // Each line is scaled by 255 and the colour by 1/255, so they cancel
        bassLayer_.assignMasked(*in.pixels(2), bassLine_);
        melodyLayer_.assignMasked(*in.pixels(1), melodyLine_);
        blend(bassLayer_, melodyLayer_, blendMode_, outputBuffer(out, 0));
        return true;
    }

private:
    void configureAnalyzer() {
        if (context().hasSampleRate()) {
            (void)analyzer_.prepare(*context().sampleRate, fmax_, static_cast<size_t>(overlapCount_));
        } else {
            analyzer_ = ChunkedSpectralAnalyzer{};
        }
    }

    /// Bin-resolution energy -> smoothed pixel-resolution line.
    void renderLine(std::span<const float> energy, std::vector<float>& line) {
        stretched_.resize(numPixels());
        line.resize(numPixels());
        resampleToPixels(energy, stretched_);
        smoothSymmetric(stretched_, smoothing_, line);
    }

    static constexpr std::array<InputPortSpec, 3> kPorts{{
        {"audio", PortKind::Audio, AbsentPolicy::Optional},
        {"melody_color", PortKind::Pixels, AbsentPolicy::White},
        {"bass_color", PortKind::Pixels, AbsentPolicy::White}
    }};

    int overlapCount_ = static_cast<int>(ChunkedSpectralAnalyzer::kDefaultOverlapCount);
    int binCount_ = 64;
    float fmax_ = ChunkedSpectralAnalyzer::kDefaultFmax;
    BlendMode blendMode_ = BlendMode::Lightest;
    FrequencyScale scale_ = FrequencyScale::Bark;

    ChunkedSpectralAnalyzer analyzer_;
    std::vector<float> smoothing_;
    SpectralFrame bass_;
    SpectralFrame melody_;
    std::vector<float> stretched_;
    std::vector<float> bassLine_;
    std::vector<float> melodyLine_;
    PixelBuffer bassLayer_;
    PixelBuffer melodyLayer_;
};

} // namespace DSP
} // namespace Lumina
