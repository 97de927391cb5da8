// Tests for the planar pixel buffer
// Layer 1: DSP Primitives

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <lumina/dsp/primitives/pixel_buffer.h>

#include <array>
#include <limits>
#include <vector>

using Catch::Approx;
using namespace Lumina::DSP;

TEST_CASE("PixelBuffer layout is three contiguous rows", "[pixel_buffer][primitives]") {
    PixelBuffer buf(4);
    buf.setPixel(1, Rgb{10.0f, 20.0f, 30.0f});
    const auto data = buf.data();
    REQUIRE(data.size() == 12);
    REQUIRE(data[1] == 10.0f);
    REQUIRE(data[4 + 1] == 20.0f);
    REQUIRE(data[8 + 1] == 30.0f);
    REQUIRE(buf.pixel(1) == Rgb{10.0f, 20.0f, 30.0f});
}

TEST_CASE("PixelBuffer solid and fill", "[pixel_buffer][primitives]") {
    auto buf = PixelBuffer::solid(5, Colors::kBlue);
    for (size_t i = 0; i < 5; ++i) REQUIRE(buf.pixel(i) == Colors::kBlue);
    buf.fill(7.0f);
    REQUIRE(buf.minValue() == 7.0f);
    REQUIRE(buf.maxValue() == 7.0f);
}

TEST_CASE("PixelBuffer resize resets contents only on change", "[pixel_buffer][primitives]") {
    PixelBuffer buf(3, 5.0f);
    buf.resize(3);
    REQUIRE(buf.at(Channel::Green, 2) == 5.0f);
    buf.resize(6);
    REQUIRE(buf.numPixels() == 6);
    REQUIRE(buf.maxValue() == 0.0f);
}

TEST_CASE("sanitizeAndClamp bounds values and removes NaN", "[pixel_buffer][primitives]") {
    PixelBuffer buf(40);
    auto red = buf.row(Channel::Red);
    red[0] = -10.0f;
    red[1] = 300.0f;
    red[2] = std::numeric_limits<float>::quiet_NaN();
    red[3] = std::numeric_limits<float>::infinity();
    red[39] = 128.5f;
    buf.sanitizeAndClamp();
    REQUIRE(red[0] == 0.0f);
    REQUIRE(red[1] == 255.0f);
    REQUIRE(red[2] == 0.0f);
    REQUIRE(red[3] == 0.0f);
    REQUIRE(red[39] == 128.5f);
}

TEST_CASE("toBytes truncates and clamps", "[pixel_buffer][primitives]") {
    PixelBuffer buf(2);
    buf.setPixel(0, Rgb{254.9f, -3.0f, 400.0f});
    buf.setPixel(1, Rgb{std::numeric_limits<float>::quiet_NaN(), 1.5f, 0.0f});
    const auto bytes = buf.toBytes();
    REQUIRE(bytes.size() == 6);
    REQUIRE(bytes[0] == 254);
    REQUIRE(bytes[1] == 0);
    REQUIRE(bytes[2] == 0);
    REQUIRE(bytes[3] == 1);
    REQUIRE(bytes[4] == 255);
    REQUIRE(bytes[5] == 0);
}

TEST_CASE("assignMasked scales colour by the mask", "[pixel_buffer][primitives]") {
    const auto color = PixelBuffer::solid(3, Rgb{100.0f, 50.0f, 200.0f});
    const std::array<float, 3> mask{0.0f, 0.5f, 1.0f};
    PixelBuffer out;
    out.assignMasked(color, mask, 2.0f);
    REQUIRE(out.numPixels() == 3);
    REQUIRE(out.pixel(0) == Colors::kBlack);
    REQUIRE(out.pixel(1) == Rgb{100.0f, 50.0f, 200.0f});
    REQUIRE(out.pixel(2) == Rgb{200.0f, 100.0f, 400.0f});
}

TEST_CASE("multiplyByMask and addPixel", "[pixel_buffer][primitives]") {
    auto buf = PixelBuffer::solid(2, Colors::kWhite);
    const std::array<float, 2> mask{0.5f, 0.0f};
    buf.multiplyByMask(mask);
    REQUIRE(buf.at(Channel::Red, 0) == Approx(127.5f));
    REQUIRE(buf.at(Channel::Blue, 1) == 0.0f);
    buf.addPixel(1, Rgb{1.0f, 2.0f, 3.0f});
    REQUIRE(buf.pixel(1) == Rgb{1.0f, 2.0f, 3.0f});
}

TEST_CASE("blend combines channels per mode", "[pixel_buffer][primitives]") {
    const auto a = PixelBuffer::solid(2, Rgb{100.0f, 0.0f, 255.0f});
    const auto b = PixelBuffer::solid(2, Rgb{50.0f, 200.0f, 255.0f});
    PixelBuffer out;

    blend(a, b, BlendMode::Lightest, out);
    REQUIRE(out.pixel(0) == Rgb{100.0f, 200.0f, 255.0f});

    blend(a, b, BlendMode::Darkest, out);
    REQUIRE(out.pixel(1) == Rgb{50.0f, 0.0f, 255.0f});

    blend(a, b, BlendMode::Addition, out);
    REQUIRE(out.pixel(0).r == 150.0f);
    REQUIRE(out.pixel(0).b == 510.0f);
}

TEST_CASE("empty PixelBuffer queries are safe", "[pixel_buffer][primitives][edge]") {
    PixelBuffer buf;
    REQUIRE(buf.empty());
    REQUIRE(buf.maxValue() == 0.0f);
    REQUIRE(buf.toBytes().empty());
    buf.sanitizeAndClamp();
    REQUIRE(buf.numPixels() == 0);
}
