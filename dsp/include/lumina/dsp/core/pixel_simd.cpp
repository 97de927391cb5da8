// ==============================================================================
// Layer 0: Core Utility - SIMD-Accelerated Bulk Math
// ==============================================================================
// Highway self-inclusion: foreach_target.h re-includes this file once per ISA
// target. HWY_EXPORT/HWY_DYNAMIC_DISPATCH (inside #if HWY_ONCE) pick the best
// kernel at runtime.
// ==============================================================================

#undef HWY_TARGET_INCLUDE
#define HWY_TARGET_INCLUDE "lumina/dsp/core/pixel_simd.cpp"
#include "hwy/foreach_target.h"  // NOLINT(misc-header-include-cycle) Highway self-inclusion
#include "hwy/highway.h"

#include <algorithm>
#include <cmath>
#include <cstddef>

// =============================================================================
// Per-Target SIMD Kernels (compiled once per ISA target)
// =============================================================================

HWY_BEFORE_NAMESPACE();

// NOLINTNEXTLINE(modernize-concat-nested-namespaces) HWY_NAMESPACE is a macro
namespace Lumina {
namespace DSP {
namespace HWY_NAMESPACE {

namespace hn = hwy::HWY_NAMESPACE;

// -----------------------------------------------------------------------------
// SanitizeAndClampImpl: non-finite -> 0, then clamp to [lo, hi]
// -----------------------------------------------------------------------------

// NOLINTNEXTLINE(misc-use-internal-linkage) exported via HWY_EXPORT
void SanitizeAndClampImpl(float* HWY_RESTRICT data, size_t count, float lo, float hi) {
    const hn::ScalableTag<float> d;
    const size_t N = hn::Lanes(d);
    const auto vLo = hn::Set(d, lo);
    const auto vHi = hn::Set(d, hi);

    size_t k = 0;
    for (; k + N <= count; k += N) {
        auto v = hn::LoadU(d, data + k);
        v = hn::IfThenElseZero(hn::IsFinite(v), v);
        v = hn::Min(hn::Max(v, vLo), vHi);
        hn::StoreU(v, d, data + k);
    }
    // Scalar tail
    for (; k < count; ++k) {
        const float v = std::isfinite(data[k]) ? data[k] : 0.0f;
        data[k] = std::clamp(v, lo, hi);
    }
}

// -----------------------------------------------------------------------------
// AccumulateScaledImpl: acc += src * gain
// -----------------------------------------------------------------------------

// NOLINTNEXTLINE(misc-use-internal-linkage) exported via HWY_EXPORT
void AccumulateScaledImpl(float* HWY_RESTRICT acc, const float* HWY_RESTRICT src,
                          size_t count, float gain) {
    const hn::ScalableTag<float> d;
    const size_t N = hn::Lanes(d);
    const auto vGain = hn::Set(d, gain);

    size_t k = 0;
    for (; k + N <= count; k += N) {
        const auto s = hn::LoadU(d, src + k);
        const auto a = hn::LoadU(d, acc + k);
        hn::StoreU(hn::MulAdd(s, vGain, a), d, acc + k);
    }
    for (; k < count; ++k) {
        acc[k] += src[k] * gain;
    }
}

// -----------------------------------------------------------------------------
// ComputePowerSpectrumPffftImpl: in-place |X(k)|^2 for pffft ordered format
// -----------------------------------------------------------------------------

// NOLINTNEXTLINE(misc-use-internal-linkage) exported via HWY_EXPORT
void ComputePowerSpectrumPffftImpl(float* HWY_RESTRICT spectrum, size_t fftSize) {
    // DC and Nyquist are real-only
    spectrum[0] = spectrum[0] * spectrum[0];
    spectrum[1] = spectrum[1] * spectrum[1];

    const size_t numComplexBins = fftSize / 2 - 1;
    float* complexStart = spectrum + 2;

    const hn::ScalableTag<float> d;
    const size_t N = hn::Lanes(d);
    const auto zero = hn::Zero(d);

    size_t k = 0;
    for (; k + N <= numComplexBins; k += N) {
        hn::Vec<decltype(d)> re;
        hn::Vec<decltype(d)> im;
        hn::LoadInterleaved2(d, complexStart + k * 2, re, im);
        const auto power = hn::MulAdd(im, im, hn::Mul(re, re));
        hn::StoreInterleaved2(power, zero, d, complexStart + k * 2);
    }
    for (; k < numComplexBins; ++k) {
        const float re = complexStart[k * 2];
        const float im = complexStart[k * 2 + 1];
        complexStart[k * 2] = re * re + im * im;
        complexStart[k * 2 + 1] = 0.0f;
    }
}

}  // namespace HWY_NAMESPACE
}  // namespace DSP
}  // namespace Lumina

HWY_AFTER_NAMESPACE();

// =============================================================================
// Dispatch Table + Wrapper Functions (compiled once)
// =============================================================================

#if HWY_ONCE

#include "lumina/dsp/core/pixel_simd.h"

// NOLINTNEXTLINE(modernize-concat-nested-namespaces) HWY_NAMESPACE dispatch section
namespace Lumina {
namespace DSP {

HWY_EXPORT(SanitizeAndClampImpl);
HWY_EXPORT(AccumulateScaledImpl);
HWY_EXPORT(ComputePowerSpectrumPffftImpl);

void sanitizeAndClamp(float* data, std::size_t count, float lo, float hi) noexcept {
    HWY_DYNAMIC_DISPATCH(SanitizeAndClampImpl)(data, count, lo, hi);
}

void accumulateScaled(float* acc, const float* src, std::size_t count, float gain) noexcept {
    HWY_DYNAMIC_DISPATCH(AccumulateScaledImpl)(acc, src, count, gain);
}

void computePowerSpectrumPffft(float* spectrum, std::size_t fftSize) noexcept {
    HWY_DYNAMIC_DISPATCH(ComputePowerSpectrumPffftImpl)(spectrum, fftSize);
}

}  // namespace DSP
}  // namespace Lumina

#endif  // HWY_ONCE
