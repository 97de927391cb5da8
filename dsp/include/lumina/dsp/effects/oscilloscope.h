// ==============================================================================
// Layer 3: Effect - Oscilloscope
// ==============================================================================
// Draws the band-filtered waveform of each chunk on a strip folded into a
// rows x columns matrix. Pixel (row, col) is at index row * cols + col, with
// cols = N / rows; pixels past rows * cols stay dark.
//
// The chunk is box-averaged down to 2 * cols points and then resampled to
// cols, so one lit pixel per column tracks the waveform without jumping
// between rows on single samples.
//
// Inputs:  0 audio (SkipFrame), 1 colour (White, read per column)
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
#include <vector>

namespace Lumina {
namespace DSP {

class Oscilloscope final : public EffectNode {
public:
    Oscilloscope() {
        auto& p = params();
        p.bindNumeric("lowcut_hz", lowcut_, 1.0, 8000.0, 1.0, "Lowcut frequency of the audio input.");
        p.bindNumeric("highcut_hz", highcut_, 0.0, 22000.0, 1.0, "Highcut frequency of the audio input.");
        p.bindNumeric("rows", rows_, 1.0, 64.0, 1.0, "Number of rows the strip is folded into.");
        updateCutoffs();
    }

    [[nodiscard]] std::string_view name() const noexcept override { return "Oscilloscope"; }

    [[nodiscard]] std::span<const InputPortSpec> inputPorts() const noexcept override {
        return kPorts;
    }

    /// Columns of the current layout, 0 when the strip is shorter than rows.
    [[nodiscard]] size_t columns() const noexcept {
        return numPixels() / static_cast<size_t>(std::max(1, rows_));
    }

    /// Row lit in column col on the last rendered frame.
    [[nodiscard]] size_t litRow(size_t col) const noexcept {
        return col < litRows_.size() ? litRows_[col] : 0;
    }

protected:
    void onPrepare(const FrameContext& previous) override {
        if (context().sampleRate != previous.sampleRate) {
            filter_.prepare(context().hasSampleRate() ? *context().sampleRate : 0.0);
        }
    }

    void onParameterChanged(std::string_view param) override {
        if (param == "lowcut_hz" || param == "highcut_hz") updateCutoffs();
    }

    bool render(const FrameInputs& in, FrameOutputs& out) override {
        if (!filter_.isPrepared()) return false;

        const auto audio = in.audio(0);
        filtered_.resize(audio.size());
        filter_.process(audio, filtered_);

        auto& buffer = outputBuffer(out, 0);
        buffer.fill(0.0f);

        const size_t rows = static_cast<size_t>(std::max(1, rows_));
        const size_t cols = columns();
        litRows_.assign(cols, 0);
        if (cols == 0 || filtered_.empty()) return true;

        boxAverage(filtered_, std::min(2 * cols, filtered_.size()), averaged_);
        trace_.resize(cols);
        Interpolation::resampleLinear(averaged_, trace_);

        const PixelBuffer& color = *in.pixels(1);
        const double half = static_cast<double>(rows) * 0.5;
        for (size_t col = 0; col < cols; ++col) {
            const double v = sanitize(trace_[col]);
            const double pos = std::clamp(half + v * half, 0.0, static_cast<double>(rows - 1));
            const size_t row = static_cast<size_t>(pos);
            litRows_[col] = row;
            if (col < color.numPixels()) buffer.setPixel(row * cols + col, color.pixel(col));
        }
        return true;
    }

private:
    void updateCutoffs() {
        filter_.setCutoffs(lowcut_, std::max(highcut_, lowcut_));
    }

    /// Mean of count equal-width segments of x (the last one takes the rest).
    static void boxAverage(std::span<const float> x, size_t count, std::vector<float>& out) {
        out.assign(count, 0.0f);
        const size_t width = x.size() / count;
        for (size_t k = 0; k < count; ++k) {
            const size_t begin = k * width;
            const size_t end = (k + 1 == count) ? x.size() : begin + width;
            double sum = 0.0;
            for (size_t i = begin; i < end; ++i) sum += x[i];
            out[k] = static_cast<float>(sum / static_cast<double>(end - begin));
        }
    }

    static constexpr std::array<InputPortSpec, 2> kPorts{{
        {"audio", PortKind::Audio, AbsentPolicy::SkipFrame},
        {"color", PortKind::Pixels, AbsentPolicy::White}
    }};

    float lowcut_ = 1.0f;
    float highcut_ = 22000.0f;
    int rows_ = 8;

    StreamingFilter filter_;
    std::vector<float> filtered_;
    std::vector<float> averaged_;
    std::vector<float> trace_;
    std::vector<size_t> litRows_;
};

} // namespace DSP
} // namespace Lumina
