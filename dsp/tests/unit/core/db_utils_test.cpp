// Tests for decibel conversion and sanitizing helpers
// Layer 0: Core Utilities

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <lumina/dsp/core/db_utils.h>

#include <cmath>
#include <limits>

using Catch::Approx;
using namespace Lumina::DSP;

TEST_CASE("linearToDb converts unity and half amplitude", "[db_utils][core]") {
    REQUIRE(linearToDb(1.0) == Approx(0.0f).margin(1e-6f));
    REQUIRE(linearToDb(0.5) == Approx(-6.0206f).margin(1e-3f));
    REQUIRE(linearToDb(10.0) == Approx(20.0f).margin(1e-4f));
}

TEST_CASE("linearToDb floors silence instead of returning -inf", "[db_utils][core][edge]") {
    REQUIRE(linearToDb(0.0) == Approx(kSilenceFloorDb));
    REQUIRE(linearToDb(-1.0) == Approx(kSilenceFloorDb));
    REQUIRE(linearToDb(std::numeric_limits<double>::quiet_NaN()) == Approx(kSilenceFloorDb));
    REQUIRE(std::isfinite(linearToDb(1e-300)));
}

TEST_CASE("dbToLinear inverts linearToDb", "[db_utils][core]") {
    for (float db : {-60.0f, -24.0f, -6.0f, 0.0f, 6.0f}) {
        REQUIRE(linearToDb(dbToLinear(db)) == Approx(db).margin(1e-3f));
    }
}

TEST_CASE("sanitize replaces non-finite values with zero", "[db_utils][core][edge]") {
    REQUIRE(sanitize(std::numeric_limits<float>::quiet_NaN()) == 0.0f);
    REQUIRE(sanitize(std::numeric_limits<float>::infinity()) == 0.0f);
    REQUIRE(sanitize(-std::numeric_limits<float>::infinity()) == 0.0f);
    REQUIRE(sanitize(std::numeric_limits<double>::quiet_NaN()) == 0.0);
    REQUIRE(sanitize(1.5f) == 1.5f);
    REQUIRE(sanitize(-2.0) == -2.0);
}

TEST_CASE("bit-level classification matches std", "[db_utils][core]") {
    const float values[] = {0.0f, -0.0f, 1.0f, 1e-40f, std::numeric_limits<float>::max(),
                            std::numeric_limits<float>::infinity(),
                            std::numeric_limits<float>::quiet_NaN()};
    for (float v : values) {
        CHECK(detail::isNaN(v) == std::isnan(v));
        CHECK(detail::isInf(v) == std::isinf(v));
        CHECK(detail::isFinite(v) == std::isfinite(v));
    }
}

TEST_CASE("safePow never produces NaN or Inf", "[db_utils][core][edge]") {
    REQUIRE(safePow(-2.0f, 0.5f) == 0.0f);
    REQUIRE(safePow(0.0f, -1.0f) == 0.0f);
    REQUIRE(safePow(2.0f, 3.0f) == Approx(8.0f));
}
