// Tests for the Oscilloscope effect
// Layer 3: Effects

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <lumina/dsp/effects/oscilloscope.h>
#include <lumina/dsp/core/math_constants.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <vector>

using Catch::Approx;
using namespace Lumina::DSP;

namespace {

constexpr double kSampleRate = 44100.0;
constexpr size_t kNumPixels = 60;
constexpr size_t kChunkSize = 735;

FrameOutputs tick(Oscilloscope& node, std::span<const float> audio, const PixelBuffer* color = nullptr) {
    node.update(1.0 / 60.0);
    const std::array<InputSlot, 2> slots{InputSlot::audio(audio),
                                         color != nullptr ? InputSlot::pixels(*color) : InputSlot::absent()};
    FrameOutputs out;
    node.process(slots, out);
    return out;
}

/// 60 Hz: exactly one period per 735-sample chunk.
std::vector<float> slowSine(size_t index, float amplitude) {
    std::vector<float> out(kChunkSize);
    for (size_t i = 0; i < kChunkSize; ++i) {
        const double t = static_cast<double>(index * kChunkSize + i) / kSampleRate;
        out[i] = amplitude * static_cast<float>(std::sin(2.0 * kPiD * 60.0 * t));
    }
    return out;
}

} // anonymous namespace

TEST_CASE("Oscilloscope draws silence on the middle row", "[oscilloscope][effects]") {
    Oscilloscope scope;
    scope.prepare(FrameContext{kSampleRate, kNumPixels});
    REQUIRE(scope.columns() == 7);

    const std::vector<float> silence(kChunkSize, 0.0f);
    const auto out = tick(scope, silence);
    REQUIRE(out[0].has_value());
    REQUIRE(out[0]->numPixels() == kNumPixels);

    size_t lit = 0;
    for (size_t i = 0; i < kNumPixels; ++i) {
        const bool onMiddleRow = i >= 4 * 7 && i < 5 * 7;
        if (onMiddleRow) {
            REQUIRE(out[0]->pixel(i).r == 255.0f);
            ++lit;
        } else {
            REQUIRE(out[0]->pixel(i).brightness() == 0.0f);
        }
    }
    REQUIRE(lit == 7);
}

TEST_CASE("Oscilloscope follows the waveform across rows", "[oscilloscope][effects]") {
    Oscilloscope scope;
    scope.prepare(FrameContext{kSampleRate, kNumPixels});

    FrameOutputs out;
    for (size_t frame = 0; frame < 10; ++frame) out = tick(scope, slowSine(frame, 0.9f));
    REQUIRE(out[0].has_value());

    size_t highest = 0;
    size_t lowest = 7;
    for (size_t col = 0; col < scope.columns(); ++col) {
        const size_t row = scope.litRow(col);
        highest = std::max(highest, row);
        lowest = std::min(lowest, row);
        REQUIRE(out[0]->pixel(row * scope.columns() + col).brightness() > 0.0f);
    }
    REQUIRE(highest > 4);
    REQUIRE(lowest < 4);
}

TEST_CASE("Oscilloscope clamps loud audio to the outer rows", "[oscilloscope][effects][edge]") {
    Oscilloscope scope;
    scope.prepare(FrameContext{kSampleRate, kNumPixels});

    FrameOutputs out;
    for (size_t frame = 0; frame < 10; ++frame) out = tick(scope, slowSine(frame, 1e6f));
    for (size_t col = 0; col < scope.columns(); ++col) {
        REQUIRE(scope.litRow(col) <= 7);
    }
    REQUIRE(out[0]->maxValue() <= 255.0f);
}

TEST_CASE("Oscilloscope reads the colour input per column", "[oscilloscope][effects]") {
    Oscilloscope scope;
    REQUIRE(scope.setParameter("rows", 2) == ParamStatus::Ok);
    scope.prepare(FrameContext{kSampleRate, 10});
    REQUIRE(scope.columns() == 5);

    PixelBuffer color(10);
    for (size_t i = 0; i < 10; ++i) color.setPixel(i, {static_cast<float>(10 * i), 0.0f, 100.0f});

    const std::vector<float> silence(kChunkSize, 0.0f);
    const auto out = tick(scope, silence, &color);
    // Middle of two rows is row 1
    for (size_t col = 0; col < 5; ++col) {
        REQUIRE(out[0]->pixel(5 + col).r == Approx(10.0f * static_cast<float>(col)));
        REQUIRE(out[0]->pixel(5 + col).b == Approx(100.0f));
        REQUIRE(out[0]->pixel(col).b == 0.0f);
    }
}

TEST_CASE("Oscilloscope with more rows than pixels stays dark", "[oscilloscope][effects][edge]") {
    Oscilloscope scope;
    REQUIRE(scope.setParameter("rows", 64) == ParamStatus::Ok);
    REQUIRE(scope.setParameter("rows", 100) == ParamStatus::OutOfRange);
    scope.prepare(FrameContext{kSampleRate, 30});
    REQUIRE(scope.columns() == 0);

    const auto out = tick(scope, slowSine(0, 0.5f));
    REQUIRE(out[0].has_value());
    REQUIRE(out[0]->numPixels() == 30);
    REQUIRE(out[0]->maxValue() == 0.0f);
}

TEST_CASE("Oscilloscope needs audio and a sample rate", "[oscilloscope][effects][edge]") {
    Oscilloscope scope;
    scope.prepare(FrameContext{std::nullopt, kNumPixels});
    REQUIRE_FALSE(tick(scope, slowSine(0, 0.5f))[0].has_value());

    scope.prepare(FrameContext{kSampleRate, kNumPixels});
    scope.update(1.0 / 60.0);
    const std::array<InputSlot, 2> slots{InputSlot::absent(), InputSlot::absent()};
    FrameOutputs out;
    scope.process(slots, out);
    REQUIRE_FALSE(out[0].has_value());
}

TEST_CASE("Oscilloscope handles an empty chunk", "[oscilloscope][effects][edge]") {
    Oscilloscope scope;
    scope.prepare(FrameContext{kSampleRate, kNumPixels});
    const auto out = tick(scope, std::span<const float>{});
    REQUIRE(out[0].has_value());
    REQUIRE(out[0]->maxValue() == 0.0f);
}
