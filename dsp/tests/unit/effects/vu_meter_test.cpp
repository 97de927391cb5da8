// Tests for the RMS and peak VU meters
// Layer 3: Effects

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <lumina/dsp/effects/vu_meter.h>

#include <array>
#include <vector>

using Catch::Approx;
using namespace Lumina::DSP;

namespace {

constexpr size_t kNumPixels = 60;
const FrameContext kContext{44100.0, kNumPixels};

FrameOutputs tick(EffectNode& node, std::span<const float> audio, const PixelBuffer* color = nullptr) {
    node.update(1.0 / 60.0);
    const std::array<InputSlot, 2> slots{
        InputSlot::audio(audio),
        color != nullptr ? InputSlot::pixels(*color) : InputSlot::absent()};
    FrameOutputs out;
    node.process(slots, out);
    return out;
}

} // anonymous namespace

TEST_CASE("full-scale DC fills the RMS meter", "[vu_meter][effects]") {
    VuMeterRms meter;
    meter.prepare(kContext);
    const std::vector<float> full(735, 1.0f);
    const auto out = tick(meter, full);
    REQUIRE(meter.levelDb() == Approx(0.0f).margin(1e-4f));
    REQUIRE(meter.barLength() == kNumPixels - 1);
    REQUIRE(out[0]->pixel(kNumPixels - 1) == Colors::kBlack);
}

TEST_CASE("peak meter maps -6 dB onto the bar", "[vu_meter][effects]") {
    VuMeterPeak meter;
    meter.prepare(kContext);
    std::vector<float> half(735, 0.0f);
    half[100] = 0.5f;
    (void)tick(meter, half);
    REQUIRE(meter.levelDb() == Approx(-6.0206f).margin(1e-3f));
    REQUIRE(meter.barLength() == 53);
}

TEST_CASE("silence gives an empty bar", "[vu_meter][effects]") {
    VuMeterRms meter;
    meter.prepare(kContext);
    const std::vector<float> silence(735, 0.0f);
    const auto out = tick(meter, silence);
    REQUIRE(meter.barLength() == 0);
    REQUIRE(meter.levelDb() == Approx(kSilenceFloorDb));
    REQUIRE(out[0]->maxValue() == 0.0f);
}

TEST_CASE("meter holds the loudest recent peak", "[vu_meter][effects]") {
    VuMeterPeak meter;
    REQUIRE(meter.setParameter("n_overlaps", 2) == ParamStatus::Ok);
    meter.prepare(kContext);
    const std::vector<float> loud(735, 1.0f);
    const std::vector<float> silence(735, 0.0f);

    (void)tick(meter, loud);
    (void)tick(meter, silence);
    (void)tick(meter, silence);
    REQUIRE(meter.levelDb() == Approx(0.0f).margin(1e-4f));
    (void)tick(meter, silence);
    REQUIRE(meter.barLength() == 0);
}

TEST_CASE("RMS meter averages held levels", "[vu_meter][effects]") {
    VuMeterRms meter;
    meter.prepare(kContext);
    const std::vector<float> loud(735, 1.0f);
    const std::vector<float> silence(735, 0.0f);
    (void)tick(meter, loud);
    (void)tick(meter, silence);
    // sqrt((1 + 0) / 2)
    REQUIRE(meter.levelDb() == Approx(-3.0103f).margin(1e-3f));
}

TEST_CASE("meter colours come from the gradient or the colour input", "[vu_meter][effects]") {
    VuMeterRms meter;
    meter.prepare(kContext);
    const std::vector<float> full(735, 1.0f);

    auto out = tick(meter, full);
    REQUIRE(out[0]->pixel(0) == Colors::kGreen);
    REQUIRE(out[0]->pixel(kNumPixels - 2).r > out[0]->pixel(kNumPixels - 2).g);

    const auto blue = PixelBuffer::solid(kNumPixels, Colors::kBlue);
    out = tick(meter, full, &blue);
    REQUIRE(out[0]->pixel(0) == Colors::kBlue);
}

TEST_CASE("gradient is green then ramps to red", "[vu_meter][effects]") {
    PixelBuffer gradient;
    VuMeter::buildGradient(60, 60.0f, gradient);
    REQUIRE(gradient.numPixels() == 60);
    // Green until -24 dB of a 60 dB range: 60 * 36 / 60 = 36 pixels
    REQUIRE(gradient.pixel(35) == Colors::kGreen);
    REQUIRE(gradient.pixel(59).r == Approx(255.0f));
    REQUIRE(gradient.pixel(59).g == Approx(0.0f).margin(1e-3f));
}

TEST_CASE("meter without audio emits nothing", "[vu_meter][effects][edge]") {
    VuMeterPeak meter;
    meter.prepare(kContext);
    meter.update(1.0 / 60.0);
    FrameOutputs out;
    meter.process({}, out);
    REQUIRE_FALSE(out[0].has_value());
}
