// Tests for table interpolation and linear resampling
// Layer 0: Core Utilities

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <lumina/dsp/core/interpolation.h>

#include <array>
#include <vector>

using Catch::Approx;
using namespace Lumina::DSP;

TEST_CASE("linearInterpolate endpoints and midpoint", "[interpolation][core]") {
    REQUIRE(Interpolation::linearInterpolate(2.0f, 4.0f, 0.0f) == Approx(2.0f));
    REQUIRE(Interpolation::linearInterpolate(2.0f, 4.0f, 1.0f) == Approx(4.0f));
    REQUIRE(Interpolation::linearInterpolate(2.0f, 4.0f, 0.5f) == Approx(3.0f));
}

TEST_CASE("interpolateTable clamps outside the table", "[interpolation][core]") {
    const std::array<float, 3> xs{10.0f, 20.0f, 40.0f};
    const std::array<float, 3> ys{1.0f, 3.0f, -1.0f};

    REQUIRE(Interpolation::interpolateTable(xs, ys, 0.0f) == Approx(1.0f));
    REQUIRE(Interpolation::interpolateTable(xs, ys, 100.0f) == Approx(-1.0f));
    REQUIRE(Interpolation::interpolateTable(xs, ys, 15.0f) == Approx(2.0f));
    REQUIRE(Interpolation::interpolateTable(xs, ys, 30.0f) == Approx(1.0f));
    REQUIRE(Interpolation::interpolateTable(xs, ys, 20.0f) == Approx(3.0f));
}

TEST_CASE("interpolateTable empty table returns zero", "[interpolation][core][edge]") {
    const std::vector<float> none;
    REQUIRE(Interpolation::interpolateTable(none, none, 5.0f) == 0.0f);
}

TEST_CASE("resampleLinear stretches a triangle", "[interpolation][core]") {
    const std::array<float, 3> src{0.0f, 1.0f, 0.0f};
    std::array<float, 5> dst{};
    Interpolation::resampleLinear(src, dst);
    REQUIRE(dst[0] == Approx(0.0f));
    REQUIRE(dst[1] == Approx(0.5f));
    REQUIRE(dst[2] == Approx(1.0f));
    REQUIRE(dst[3] == Approx(0.5f));
    REQUIRE(dst[4] == Approx(0.0f));
}

TEST_CASE("resampleLinear shrinking keeps the endpoints", "[interpolation][core]") {
    std::vector<float> src(64);
    for (size_t i = 0; i < src.size(); ++i) src[i] = static_cast<float>(i);
    std::array<float, 8> dst{};
    Interpolation::resampleLinear(src, dst);
    REQUIRE(dst.front() == Approx(0.0f));
    REQUIRE(dst.back() == Approx(63.0f));
    REQUIRE(dst[1] == Approx(9.0f));
}

TEST_CASE("resampleLinear degenerate sizes", "[interpolation][core][edge]") {
    SECTION("empty source zero-fills") {
        std::vector<float> src;
        std::array<float, 4> dst{1, 1, 1, 1};
        Interpolation::resampleLinear(src, dst);
        for (float v : dst) REQUIRE(v == 0.0f);
    }
    SECTION("single source sample is replicated") {
        const std::array<float, 1> src{7.0f};
        std::array<float, 4> dst{};
        Interpolation::resampleLinear(src, dst);
        for (float v : dst) REQUIRE(v == 7.0f);
    }
    SECTION("single destination takes the first sample") {
        const std::array<float, 3> src{2.0f, 5.0f, 9.0f};
        std::array<float, 1> dst{};
        Interpolation::resampleLinear(src, dst);
        REQUIRE(dst[0] == 2.0f);
    }
}
