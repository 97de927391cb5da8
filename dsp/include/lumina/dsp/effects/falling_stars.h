// ==============================================================================
// Layer 3: Effects - Star Fields
// ==============================================================================
// FallingStars:  audio-reactive; every frame up to max_spawns Bernoulli
//                trials with probability min(1, probability + peak) spawn
//                stars that fade exponentially.
// IntervalStars: generative; one star every spawn_time seconds, scheduled
//                by a time accumulator.
//
// Both render a ParticlePool as a brightness mask applied to the colour
// input.
// ==============================================================================

#pragma once

#include <lumina/dsp/core/db_utils.h>
#include <lumina/dsp/core/random.h>
#include <lumina/dsp/effects/effect_node.h>
#include <lumina/dsp/primitives/particle_pool.h>
#include <lumina/dsp/primitives/streaming_filter.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace Lumina {
namespace DSP {

// =============================================================================
// FallingStars
// =============================================================================

/// Inputs: 0 audio (SkipFrame), 1 colour (White). Outputs: 1.
class FallingStars final : public EffectNode {
public:
    explicit FallingStars(uint32_t seed = 1) : rng_(seed) {
        auto& p = params();
        p.bindNumeric("lowcut_hz", lowcut_, 0.0, 8000.0, 1.0, "Lowcut frequency of the audio input.");
        p.bindNumeric("highcut_hz", highcut_, 0.0, 8000.0, 1.0, "Highcut frequency of the audio input.");
        p.bindNumeric("peak_filter", peakFilter_, 0.0, 10.0, 0.01,
                      "Filters the audio peaks. Increase to turn only high peaks into stars.");
        p.bindNumeric("peak_scale", peakScale_, 0.0, 10.0, 0.01, "Scales the visual peak after the filter.");
        p.bindNumeric("dim_speed", dimSpeed_, 1.0, 1000.0, 1.0, "Time to fade out one star.");
        p.bindNumeric("thickness", thickness_, 1.0, 300.0, 1.0, "Thickness of one star in pixels.");
        p.bindNumeric("probability", probability_, 0.0, 1.0, 0.01,
                      "Probability of spawning a new star even without an audio peak.");
        p.bindNumeric("min_brightness", minBrightness_, 0.0, 1.0, 0.01, "Minimum brightness of stars.");
        p.bindNumeric("max_spawns", maxSpawns_, 1.0, 10.0, 1.0, "Maximum number of stars spawned per frame.");
        filter_.setCutoffs(lowcut_, highcut_);
    }

    [[nodiscard]] std::string_view name() const noexcept override { return "FallingStars"; }

    [[nodiscard]] std::span<const InputPortSpec> inputPorts() const noexcept override {
        return kPorts;
    }

    [[nodiscard]] const ParticlePool& stars() const noexcept { return pool_; }

protected:
    void onPrepare(const FrameContext& previous) override {
        if (context().sampleRate != previous.sampleRate) {
            filter_.prepare(context().hasSampleRate() ? *context().sampleRate : 0.0);
        }
        if (context().numPixels != previous.numPixels) pool_.clear();
    }

    void onParameterChanged(std::string_view param) override {
        if (param == "lowcut_hz" || param == "highcut_hz") {
            filter_.setCutoffs(lowcut_, highcut_);
        }
    }

    bool render(const FrameInputs& in, FrameOutputs& out) override {
        if (!filter_.isPrepared()) return false;

        const size_t n = numPixels();
        const double now = time();
        const ParticleDecay decay{dimSpeed_, minBrightness_};
        pool_.prune(now, decay);

        const float peak = safePow(filter_.processPeak(in.audio(0)), peakFilter_);
        const float probability = std::min(1.0f, probability_ + peak);
        const size_t thickness = static_cast<size_t>(std::max(1, thickness_));
        const size_t lastStart = n > thickness ? n - thickness : 0;
        for (int i = 0; i < maxSpawns_; ++i) {
            if (rng_.chance(probability)) {
                pool_.spawn({now, rng_.nextInRange(0, lastStart), thickness, peak});
            }
        }

        mask_.resize(n);
        pool_.render(now, decay, mask_);
        outputBuffer(out, 0).assignMasked(*in.pixels(1), mask_, peakScale_);
        return true;
    }

private:
    static constexpr std::array<InputPortSpec, 2> kPorts{{
        {"audio", PortKind::Audio, AbsentPolicy::SkipFrame},
        {"color", PortKind::Pixels, AbsentPolicy::White}
    }};

    float lowcut_ = 50.0f;
    float highcut_ = 300.0f;
    float peakFilter_ = 1.0f;
    float peakScale_ = 1.0f;
    float dimSpeed_ = 100.0f;
    int thickness_ = 1;
    float probability_ = 0.1f;
    float minBrightness_ = 0.1f;
    int maxSpawns_ = 10;

    Xorshift32 rng_;
    StreamingFilter filter_;
    ParticlePool pool_;
    std::vector<float> mask_;
};

// =============================================================================
// IntervalStars
// =============================================================================

/// Inputs: 0 colour (White). Outputs: 1.
class IntervalStars final : public EffectNode {
public:
    explicit IntervalStars(uint32_t seed = 1) : rng_(seed) {
        auto& p = params();
        p.bindNumeric("dim_speed", dimSpeed_, 1.0, 1000.0, 1.0, "Time to fade out one star.");
        p.bindNumeric("thickness", thickness_, 1.0, 300.0, 1.0, "Thickness of one star in pixels.");
        p.bindNumeric("spawntime", spawnInterval_, 0.01, 10.0, 0.01, "Seconds between two stars.");
        p.bindNumeric("max_brightness", maxBrightness_, 0.0, 1.0, 0.01, "Brightness of a new star.");
    }

    [[nodiscard]] std::string_view name() const noexcept override { return "IntervalStars"; }

    [[nodiscard]] std::span<const InputPortSpec> inputPorts() const noexcept override {
        return kPorts;
    }

    [[nodiscard]] const ParticlePool& stars() const noexcept { return pool_; }

protected:
    void onPrepare(const FrameContext& previous) override {
        if (context().numPixels != previous.numPixels) pool_.clear();
    }

    void onUpdate(double dt) override { elapsed_ += dt; }

    bool render(const FrameInputs& in, FrameOutputs& out) override {
        const size_t n = numPixels();
        const double now = time();
        const ParticleDecay decay{dimSpeed_, 0.0f};
        pool_.prune(now, decay);

        // First star immediately, then at most one per elapsed interval
        const double interval = std::max(0.01f, spawnInterval_);
        if (!started_ || elapsed_ >= interval) {
            spawn(now, n);
            elapsed_ = started_ ? std::fmod(elapsed_, interval) : 0.0;
            started_ = true;
        }

        mask_.resize(n);
        pool_.render(now, decay, mask_);
        outputBuffer(out, 0).assignMasked(*in.pixels(0), mask_, maxBrightness_);
        return true;
    }

private:
    void spawn(double now, size_t n) noexcept {
        const size_t thickness = static_cast<size_t>(std::max(1, thickness_));
        const size_t lastStart = n > thickness ? n - thickness : 0;
        pool_.spawn({now, rng_.nextInRange(0, lastStart), thickness, 1.0f});
    }

    static constexpr std::array<InputPortSpec, 1> kPorts{{
        {"color", PortKind::Pixels, AbsentPolicy::White}
    }};

    float dimSpeed_ = 100.0f;
    int thickness_ = 1;
    float spawnInterval_ = 0.1f;
    float maxBrightness_ = 1.0f;

    Xorshift32 rng_;
    ParticlePool pool_;
    std::vector<float> mask_;
    double elapsed_ = 0.0;
    bool started_ = false;
};

} // namespace DSP
} // namespace Lumina
