// ==============================================================================
// Layer 1: DSP Primitive - Streaming Butterworth Filter
// ==============================================================================
// Digital Butterworth design (analog prototype -> zpk band transform ->
// bilinear transform -> transfer function) and a transposed direct form II
// runner that carries its delay state from one chunk to the next.
//
// Coefficients and state are double precision: a 3rd order bandpass is a
// 6th order polynomial whose low band edges sit close to z = 1.
//
// Design allocates (prepare/parameter change only). process() is noexcept
// and allocation-free.
// ==============================================================================

#pragma once

#include <lumina/dsp/core/db_utils.h>
#include <lumina/dsp/core/math_constants.h>

#include <algorithm>
#include <cmath>
#include <complex>
#include <cstddef>
#include <span>
#include <vector>

namespace Lumina {
namespace DSP {

// =============================================================================
// Constants
// =============================================================================

/// Minimum filter frequency in Hz
inline constexpr float kMinFilterFrequency = 1.0f;

/// Maximum filter frequency as a ratio of sample rate (just below Nyquist)
inline constexpr float kMaxFrequencyRatio = 0.495f;

/// A bandpass whose highcut is not above its lowcut is widened to this
inline constexpr float kMinBandwidthHz = 1.0f;

/// Supported Butterworth order range (poles of the lowpass prototype)
inline constexpr int kMinFilterOrder = 1;
inline constexpr int kMaxFilterOrder = 8;

/// Order used by the audio-reactive effects
inline constexpr int kDefaultFilterOrder = 3;

// =============================================================================
// FilterState
// =============================================================================

/// @brief IIR coefficients plus the delay line carried between chunks.
///
/// Invariant: a[0] == 1, a.size() == b.size(), zi.size() == a.size() - 1.
struct FilterState {
    std::vector<double> b;    ///< Numerator, highest power of z^-1 last
    std::vector<double> a;    ///< Denominator, a[0] == 1
    std::vector<double> zi;   ///< Transposed direct form II delays

    /// Number of delay elements (the filter's polynomial order)
    [[nodiscard]] size_t order() const noexcept { return zi.size(); }

    [[nodiscard]] bool isValid() const noexcept {
        return !a.empty() && a.size() == b.size() && zi.size() + 1 == a.size() && a[0] == 1.0;
    }

    /// Zero the delay line, keeping the coefficients.
    void resetState() noexcept { std::fill(zi.begin(), zi.end(), 0.0); }
};

// =============================================================================
// Design internals
// =============================================================================

namespace detail {

using ComplexD = std::complex<double>;

/// Sample rate of the normalised design domain (frequencies relative to Nyquist)
inline constexpr double kDesignFs = 2.0;

/// Poles of the normalised analog Butterworth lowpass (unit cutoff, gain 1).
[[nodiscard]] inline std::vector<ComplexD> butterworthPrototypePoles(int order) {
    std::vector<ComplexD> poles;
    poles.reserve(static_cast<size_t>(order));
    for (int m = -order + 1; m < order; m += 2) {
        const double theta = kPiD * static_cast<double>(m) / (2.0 * order);
        poles.push_back(-std::exp(ComplexD(0.0, theta)));
    }
    return poles;
}

/// Prewarp a normalised digital frequency (0..1 of Nyquist) for the bilinear map.
[[nodiscard]] inline double prewarp(double normalized) noexcept {
    return 2.0 * kDesignFs * std::tan(kPiD * normalized / kDesignFs);
}

/// Polynomial coefficients (highest power first) with the given roots, real part.
[[nodiscard]] inline std::vector<double> polyFromRoots(const std::vector<ComplexD>& roots) {
    std::vector<ComplexD> c{ComplexD(1.0, 0.0)};
    c.reserve(roots.size() + 1);
    for (const auto& r : roots) {
        c.emplace_back(0.0, 0.0);
        for (size_t j = c.size() - 1; j > 0; --j) {
            c[j] -= r * c[j - 1];
        }
    }
    std::vector<double> out(c.size());
    for (size_t i = 0; i < c.size(); ++i) out[i] = c[i].real();
    return out;
}

/// Bilinear transform of an analog zpk design into a digital transfer function.
/// Zeros missing relative to the pole count are placed at z = -1.
[[nodiscard]] inline FilterState bilinearToTransfer(const std::vector<ComplexD>& zeros,
                                                    const std::vector<ComplexD>& poles,
                                                    double gain) {
    const double fs2 = 2.0 * kDesignFs;
    std::vector<ComplexD> zd;
    std::vector<ComplexD> pd;
    zd.reserve(poles.size());
    pd.reserve(poles.size());

    ComplexD num(1.0, 0.0);
    ComplexD den(1.0, 0.0);
    for (const auto& z : zeros) {
        zd.push_back((fs2 + z) / (fs2 - z));
        num *= (fs2 - z);
    }
    for (const auto& p : poles) {
        pd.push_back((fs2 + p) / (fs2 - p));
        den *= (fs2 - p);
    }
    while (zd.size() < pd.size()) zd.emplace_back(-1.0, 0.0);

    const double k = gain * (num / den).real();

    FilterState state;
    state.b = polyFromRoots(zd);
    for (auto& coeff : state.b) coeff *= k;
    state.a = polyFromRoots(pd);

    // Normalise so a[0] == 1 and both vectors share a length
    const size_t len = std::max(state.a.size(), state.b.size());
    state.a.resize(len, 0.0);
    state.b.resize(len, 0.0);
    const double a0 = state.a[0];
    if (a0 != 0.0 && a0 != 1.0) {
        for (auto& v : state.a) v /= a0;
        for (auto& v : state.b) v /= a0;
    }
    state.a[0] = 1.0;
    state.zi.assign(len - 1, 0.0);
    return state;
}

/// Clamp a frequency into [kMinFilterFrequency, kMaxFrequencyRatio * fs].
[[nodiscard]] inline double clampFrequency(double freq, double sampleRate) noexcept {
    const double maxFreq = sampleRate * kMaxFrequencyRatio;
    if (!isFinite(freq)) freq = kMinFilterFrequency;
    if (maxFreq < kMinFilterFrequency) return maxFreq;
    return std::clamp(freq, static_cast<double>(kMinFilterFrequency), maxFreq);
}

[[nodiscard]] inline int clampOrder(int order) noexcept {
    return std::clamp(order, kMinFilterOrder, kMaxFilterOrder);
}

} // namespace detail

// =============================================================================
// Design API
// =============================================================================

/// @brief Digital Butterworth bandpass.
///
/// Band edges are clamped into (0, Nyquist). A highcut not above the lowcut
/// is raised to lowcut + kMinBandwidthHz.
///
/// @param lowcutHz   Lower -3 dB edge
/// @param highcutHz  Upper -3 dB edge
/// @param sampleRate Sample rate in Hz (must be > 0)
/// @param order      Prototype order, clamped to [1, 8]; the result has
///                   2 * order poles
/// @return Designed filter with zeroed state, or an empty state when the
///         sample rate is not positive
[[nodiscard]] inline FilterState designBandpass(double lowcutHz, double highcutHz,
                                                double sampleRate, int order) {
    if (!(sampleRate > 0.0)) return {};
    order = detail::clampOrder(order);

    const double maxFreq = sampleRate * kMaxFrequencyRatio;
    double low = detail::clampFrequency(lowcutHz, sampleRate);
    double high = detail::isFinite(highcutHz) ? highcutHz : low;
    if (high <= low) high = low + kMinBandwidthHz;
    if (high > maxFreq) {
        high = maxFreq;
        low = std::min(low, high - kMinBandwidthHz);
    }

    const double nyquist = sampleRate * 0.5;
    const double w1 = detail::prewarp(low / nyquist);
    const double w2 = detail::prewarp(high / nyquist);
    const double bw = w2 - w1;
    const double wo = std::sqrt(w1 * w2);

    // Lowpass prototype -> bandpass (each pole splits in two, order zeros at 0)
    const auto prototype = detail::butterworthPrototypePoles(order);
    std::vector<detail::ComplexD> poles;
    poles.reserve(prototype.size() * 2);
    std::vector<detail::ComplexD> splitPartner;
    splitPartner.reserve(prototype.size());
    for (const auto& p : prototype) {
        const detail::ComplexD pl = p * (bw / 2.0);
        const detail::ComplexD root = std::sqrt(pl * pl - wo * wo);
        poles.push_back(pl + root);
        splitPartner.push_back(pl - root);
    }
    poles.insert(poles.end(), splitPartner.begin(), splitPartner.end());
    const std::vector<detail::ComplexD> zeros(static_cast<size_t>(order), detail::ComplexD(0.0, 0.0));
    const double gain = std::pow(bw, order);

    return detail::bilinearToTransfer(zeros, poles, gain);
}

/// @brief Digital Butterworth lowpass.
/// @param cutoffHz   -3 dB frequency, clamped into (0, Nyquist)
/// @param sampleRate Sample rate in Hz (must be > 0)
/// @param order      Filter order, clamped to [1, 8]
[[nodiscard]] inline FilterState designLowpass(double cutoffHz, double sampleRate, int order) {
    if (!(sampleRate > 0.0)) return {};
    order = detail::clampOrder(order);

    const double cutoff = detail::clampFrequency(cutoffHz, sampleRate);
    const double warped = detail::prewarp(cutoff / (sampleRate * 0.5));

    auto poles = detail::butterworthPrototypePoles(order);
    for (auto& p : poles) p *= warped;
    const double gain = std::pow(warped, order);

    return detail::bilinearToTransfer({}, poles, gain);
}

/// @brief Run input through the filter, carrying state.zi across calls.
///
/// Transposed direct form II:
///   y = b0 x + z0
///   z(i) = b(i+1) x + z(i+1) - a(i+1) y
///
/// Non-finite input samples are treated as 0. input and output may alias.
/// An invalid state writes zeros.
inline void applyFilter(FilterState& state, std::span<const float> input,
                        std::span<float> output) noexcept {
    const size_t count = std::min(input.size(), output.size());
    if (!state.isValid()) {
        std::fill_n(output.begin(), count, 0.0f);
        return;
    }

    const size_t n = state.zi.size();
    const double* b = state.b.data();
    const double* a = state.a.data();
    double* z = state.zi.data();

    for (size_t s = 0; s < count; ++s) {
        const float raw = input[s];
        const double x = detail::isFinite(raw) ? static_cast<double>(raw) : 0.0;
        const double y = b[0] * x + (n > 0 ? z[0] : 0.0);
        for (size_t i = 1; i < n; ++i) {
            z[i - 1] = b[i] * x + z[i] - a[i] * y;
        }
        if (n > 0) z[n - 1] = b[n] * x - a[n] * y;
        output[s] = static_cast<float>(y);
    }
}

// =============================================================================
// StreamingFilter
// =============================================================================

/// @brief Butterworth bandpass that keeps its state across audio chunks.
///
/// Filtering a signal chunk by chunk produces the same output as filtering
/// it in one call. Any parameter or sample-rate change re-designs the filter
/// and zeroes its state.
///
/// @example
/// @code
/// StreamingFilter filter;
/// filter.setCutoffs(50.0f, 300.0f);
/// filter.prepare(44100.0);
/// const float peak = filter.processPeak(chunk);
/// @endcode
class StreamingFilter {
public:
    StreamingFilter() noexcept = default;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// @brief Design for the given sample rate. A non-positive rate leaves the
    ///        filter unprepared (process() then writes zeros).
    void prepare(double sampleRate) {
        sampleRate_ = (sampleRate > 0.0 && detail::isFinite(sampleRate)) ? sampleRate : 0.0;
        redesign();
    }

    /// @brief Zero the delay line
    void reset() noexcept { state_.resetState(); }

    // =========================================================================
    // Parameters
    // =========================================================================

    void setCutoffs(float lowcutHz, float highcutHz) {
        lowcut_ = lowcutHz;
        highcut_ = highcutHz;
        redesign();
    }

    void setOrder(int order) {
        order_ = detail::clampOrder(order);
        redesign();
    }

    // =========================================================================
    // Processing
    // =========================================================================

    /// @brief Filter a chunk. out must hold at least in.size() samples.
    void process(std::span<const float> in, std::span<float> out) noexcept {
        applyFilter(state_, in, out);
    }

    void processInPlace(std::span<float> buffer) noexcept {
        applyFilter(state_, buffer, buffer);
    }

    /// @brief Filter a chunk into the internal scratch buffer and return the
    ///        maximum filtered sample (which may be negative).
    /// @return 0 for an empty chunk or when unprepared
    [[nodiscard]] float processPeak(std::span<const float> in) {
        if (in.empty() || !isPrepared()) return 0.0f;
        if (scratch_.size() < in.size()) {
            // Grows only when a chunk is longer than any seen before
            scratch_.resize(in.size());
        }
        std::span<float> out(scratch_.data(), in.size());
        applyFilter(state_, in, out);
        return *std::max_element(out.begin(), out.end());
    }

    // =========================================================================
    // Query
    // =========================================================================

    [[nodiscard]] bool isPrepared() const noexcept { return state_.isValid(); }
    [[nodiscard]] double sampleRate() const noexcept { return sampleRate_; }
    [[nodiscard]] float lowcut() const noexcept { return lowcut_; }
    [[nodiscard]] float highcut() const noexcept { return highcut_; }
    [[nodiscard]] int order() const noexcept { return order_; }
    [[nodiscard]] const FilterState& state() const noexcept { return state_; }

private:
    void redesign() {
        if (sampleRate_ <= 0.0) {
            state_ = FilterState{};
            return;
        }
        state_ = designBandpass(lowcut_, highcut_, sampleRate_, order_);
    }

    double sampleRate_ = 0.0;
    float lowcut_ = 50.0f;
    float highcut_ = 300.0f;
    int order_ = kDefaultFilterOrder;
    FilterState state_;
    std::vector<float> scratch_;
};

} // namespace DSP
} // namespace Lumina
