// Tests for the generative effects: Sorting, GenerateWaves, KeyboardEnvelope,
// Breathing and Heartbeat
// Layer 3: Effects

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <lumina/dsp/effects/generate_waves.h>
#include <lumina/dsp/effects/keyboard_envelope.h>
#include <lumina/dsp/effects/pulse_effects.h>
#include <lumina/dsp/effects/sorting.h>

#include <cmath>
#include <vector>

using Catch::Approx;
using namespace Lumina::DSP;

namespace {

constexpr size_t kNumPixels = 60;
const FrameContext kContext{std::nullopt, kNumPixels};

FrameOutputs tick(EffectNode& node, double dt = 1.0 / 60.0) {
    node.update(dt);
    FrameOutputs out;
    node.process({}, out);
    return out;
}

} // anonymous namespace

// =============================================================================
// Sorting
// =============================================================================

TEST_CASE("Sorting rejects an unknown sort key", "[sorting][effects]") {
    Sorting sorting;
    REQUIRE(sorting.setParameter("sortby", "purple") == ParamStatus::InvalidChoice);
    REQUIRE(sorting.key() == SortKey::Red);
    REQUIRE(sorting.setParameter("sortby", "brightness") == ParamStatus::Ok);
    REQUIRE(sorting.key() == SortKey::Brightness);
    REQUIRE(sorting.setParameter("reversed", 1.0) == ParamStatus::TypeMismatch);
}

TEST_CASE("Sorting finishes within N-1 frames and holds", "[sorting][effects]") {
    Sorting sorting(21);
    REQUIRE(sorting.setParameter("looping", false) == ParamStatus::Ok);
    REQUIRE(sorting.setParameter("sortby", "green") == ParamStatus::Ok);
    REQUIRE(sorting.setParameter("reversed", true) == ParamStatus::Ok);
    sorting.prepare(kContext);

    FrameOutputs out;
    for (size_t frame = 0; frame < kNumPixels - 1; ++frame) out = tick(sorting);
    REQUIRE(sorting.sorter().isSorted());
    REQUIRE(sorting.sorter().isOrdered());
    REQUIRE(out[0]->at(Channel::Green, 0) >= out[0]->at(Channel::Green, kNumPixels - 1));

    const auto held = tick(sorting);
    REQUIRE(held[0]->toBytes() == out[0]->toBytes());
}

TEST_CASE("looping Sorting restarts once sorted", "[sorting][effects]") {
    Sorting sorting(4);
    sorting.prepare(kContext);

    bool restarted = false;
    size_t lastPasses = 0;
    for (size_t frame = 0; frame < 2 * kNumPixels; ++frame) {
        const auto out = tick(sorting);
        REQUIRE(out[0]->numPixels() == kNumPixels);
        if (sorting.sorter().passes() < lastPasses) restarted = true;
        lastPasses = sorting.sorter().passes();
    }
    REQUIRE(restarted);
}

TEST_CASE("Sorting reshuffles when the strip length changes", "[sorting][effects]") {
    Sorting sorting;
    sorting.prepare(kContext);
    auto out = tick(sorting);
    REQUIRE(out[0]->numPixels() == kNumPixels);
    sorting.prepare(FrameContext{std::nullopt, 10});
    out = tick(sorting);
    REQUIRE(out[0]->numPixels() == 10);
    REQUIRE(sorting.sorter().pixels().numPixels() == 10);
}

// =============================================================================
// GenerateWaves
// =============================================================================

TEST_CASE("sine wave profile", "[generate_waves][effects]") {
    std::vector<float> profile(60);
    buildWaveProfile(WaveShape::Sine, 20.0f, 1.0f, profile);
    REQUIRE(profile[0] == Approx(0.5f));
    REQUIRE(profile[10] == Approx(0.0f).margin(1e-6f));
    REQUIRE(profile[30] == Approx(1.0f));
}

TEST_CASE("square wave profile is two-level", "[generate_waves][effects]") {
    std::vector<float> profile(61);
    buildWaveProfile(WaveShape::Square, 10.0f, 0.5f, profile);
    for (float v : profile) {
        REQUIRE((v == Approx(0.0f).margin(1e-6f) || v == Approx(0.5f)));
    }
}

TEST_CASE("GenerateWaves multiplies the colour by the profile", "[generate_waves][effects]") {
    GenerateWaves waves;
    waves.prepare(kContext);
    const auto out = tick(waves);
    REQUIRE(out[0].has_value());
    REQUIRE(out[0]->pixel(30).r == Approx(255.0f));
    REQUIRE(out[0]->pixel(10).g == Approx(0.0f).margin(1e-3f));
    REQUIRE(waves.profile().size() == kNumPixels);
}

TEST_CASE("GenerateWaves rebuilds on parameter change", "[generate_waves][effects]") {
    GenerateWaves waves;
    waves.prepare(kContext);
    (void)tick(waves);
    REQUIRE(waves.setParameter("scale", 0.5) == ParamStatus::Ok);
    const auto out = tick(waves);
    REQUIRE(out[0]->pixel(30).r == Approx(127.5f));
    REQUIRE(waves.setParameter("wavemode", "triangle") == ParamStatus::InvalidChoice);
    REQUIRE(waves.setParameter("wavemode", "sawtooth") == ParamStatus::Ok);
}

// =============================================================================
// KeyboardEnvelope
// =============================================================================

TEST_CASE("KeyboardEnvelope follows attack to full velocity", "[keyboard_envelope][effects]") {
    KeyboardEnvelope keys;
    REQUIRE(keys.setParameter("attack", 0.5) == ParamStatus::Ok);
    keys.prepare(kContext);

    keys.noteOn(127, 127);
    auto out = tick(keys, 0.0);
    REQUIRE(keys.notes().size() == 1);
    REQUIRE(keys.notes().notes()[0].value == Approx(0.0f));
    REQUIRE(out[0]->maxValue() == 0.0f);

    out = tick(keys, 0.5);
    REQUIRE(keys.notes().notes()[0].value == Approx(127.0f));
    REQUIRE(out[0]->pixel(kNumPixels - 1) == Colors::kWhite);
}

TEST_CASE("KeyboardEnvelope releases notes", "[keyboard_envelope][effects]") {
    KeyboardEnvelope keys;
    REQUIRE(keys.setParameter("release", 0.2) == ParamStatus::Ok);
    keys.prepare(kContext);

    keys.noteOn(0, 100);
    (void)tick(keys);
    keys.noteOff(0);
    (void)tick(keys, 0.1);
    REQUIRE(keys.notes().size() == 1);
    (void)tick(keys, 0.25);
    REQUIRE(keys.notes().size() == 0);
}

TEST_CASE("KeyboardEnvelope velocity zero is a note-off", "[keyboard_envelope][effects][edge]") {
    KeyboardEnvelope keys;
    keys.prepare(kContext);
    keys.noteOn(60, 90);
    (void)tick(keys);
    keys.noteOn(60, 0);
    (void)tick(keys);
    REQUIRE(keys.notes().size() == 0);
}

// =============================================================================
// Breathing / Heartbeat
// =============================================================================

TEST_CASE("breathing and heartbeat curves", "[pulse_effects][effects]") {
    REQUIRE(breathingBrightness(0.0, 5.0) == Approx(0.5f));
    REQUIRE(breathingBrightness(1.25, 5.0) == Approx(1.0f));
    REQUIRE(breathingBrightness(3.75, 5.0) == Approx(0.0f).margin(1e-6f));

    REQUIRE(heartbeatBrightness(0.0, 1.0) == Approx(0.0f).margin(1e-9f));
    REQUIRE(heartbeatBrightness(kPiD / 2.0, 1.0) == Approx(8.0 * std::cos(1.5)).epsilon(1e-5));
}

TEST_CASE("Breathing scales the colour input", "[pulse_effects][effects]") {
    Breathing breathing;
    breathing.prepare(kContext);
    const auto out = tick(breathing, 1.25);
    REQUIRE(out[0]->pixel(0).r == Approx(255.0f));
    REQUIRE(out[0]->pixel(0).b == Approx(255.0f));
}

TEST_CASE("Heartbeat defaults to red", "[pulse_effects][effects]") {
    Heartbeat heart;
    heart.prepare(kContext);
    const auto out = tick(heart, kPiD / 2.0);
    const Rgb px = out[0]->pixel(0);
    REQUIRE(px.r == Approx(255.0f * 8.0f * std::cos(1.5f)).epsilon(1e-4));
    REQUIRE(px.g == 0.0f);
    REQUIRE(px.b == 0.0f);
}
