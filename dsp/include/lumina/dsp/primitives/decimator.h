// ==============================================================================
// Layer 1: DSP Primitive - Decimator
// ==============================================================================
// Integer-factor downsampler: Butterworth anti-alias lowpass followed by
// keeping every factor-th sample. Filter state and sample phase carry
// across chunks, so chunked decimation equals one-shot decimation.
// ==============================================================================

#pragma once

#include <lumina/dsp/primitives/streaming_filter.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <span>
#include <vector>

namespace Lumina {
namespace DSP {

class Decimator {
public:
    /// Anti-alias lowpass order
    static constexpr int kAntiAliasOrder = 6;

    /// Anti-alias cutoff as a fraction of the output Nyquist frequency
    static constexpr double kAntiAliasRatio = 0.8;

    /// @brief Pick the factor max(1, floor(fs / (2 fmax))) and design the
    ///        anti-alias stage.
    /// @return Output sample rate, 0 when sampleRate or fmax is not positive
    double prepare(double sampleRate, double fmax) {
        factor_ = 1;
        outputRate_ = 0.0;
        phase_ = 0;
        antiAlias_ = FilterState{};
        if (!(sampleRate > 0.0) || !(fmax > 0.0)) return 0.0;

        factor_ = std::max<size_t>(1, static_cast<size_t>(std::floor(sampleRate / (2.0 * fmax))));
        outputRate_ = sampleRate / static_cast<double>(factor_);
        if (factor_ > 1) {
            antiAlias_ = designLowpass(kAntiAliasRatio * outputRate_ * 0.5, sampleRate, kAntiAliasOrder);
        }
        return outputRate_;
    }

    /// @brief Decimate a chunk into out (resized to the produced length).
    void process(std::span<const float> in, std::vector<float>& out) {
        out.clear();
        if (outputRate_ <= 0.0) return;
        if (factor_ == 1) {
            out.assign(in.begin(), in.end());
            return;
        }

        filtered_.resize(in.size());
        applyFilter(antiAlias_, in, filtered_);
        out.reserve(in.size() / factor_ + 1);
        for (size_t i = 0; i < filtered_.size(); ++i) {
            if (phase_ == 0) out.push_back(filtered_[i]);
            phase_ = (phase_ + 1) % factor_;
        }
    }

    void reset() noexcept {
        antiAlias_.resetState();
        phase_ = 0;
    }

    [[nodiscard]] size_t factor() const noexcept { return factor_; }
    [[nodiscard]] double outputRate() const noexcept { return outputRate_; }
    [[nodiscard]] bool isPrepared() const noexcept { return outputRate_ > 0.0; }

private:
    size_t factor_ = 1;
    double outputRate_ = 0.0;
    size_t phase_ = 0;
    FilterState antiAlias_;
    std::vector<float> filtered_;
};

} // namespace DSP
} // namespace Lumina
