// Tests for the Welch PSD estimator and warped spectral frames
// Layer 1: DSP Primitives

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <lumina/dsp/primitives/psd_estimator.h>
#include <lumina/dsp/core/math_constants.h>

#include <algorithm>
#include <cmath>
#include <vector>

using Catch::Approx;
using namespace Lumina::DSP;

namespace {

std::vector<float> makeSine(double freqHz, size_t numSamples, double sampleRate, float amplitude = 1.0f) {
    std::vector<float> out(numSamples);
    for (size_t i = 0; i < numSamples; ++i) {
        out[i] = amplitude * static_cast<float>(
            std::sin(2.0 * kPiD * freqHz * static_cast<double>(i) / sampleRate));
    }
    return out;
}

} // anonymous namespace

TEST_CASE("fftSizeFor rounds up to a supported power of two", "[fft][primitives]") {
    REQUIRE(fftSizeFor(1) == kMinFFTSize);
    REQUIRE(fftSizeFor(256) == 256);
    REQUIRE(fftSizeFor(257) == 512);
    REQUIRE(fftSizeFor(1u << 20) == kMaxFFTSize);
}

TEST_CASE("PSD peaks at the tone frequency", "[psd_estimator][primitives]") {
    constexpr double kFs = 8000.0;
    const auto signal = makeSine(1000.0, 4096, kFs);

    PsdEstimator psd;
    psd.prepare(256);
    const size_t bins = psd.estimate(signal, kFs);
    REQUIRE(bins == 129);

    const auto p = psd.psd();
    const auto f = psd.binFrequencies();
    const auto peak = std::max_element(p.begin(), p.end()) - p.begin();
    REQUIRE(f[static_cast<size_t>(peak)] == Approx(1000.0f));
}

TEST_CASE("PSD integrates to the signal power", "[psd_estimator][primitives]") {
    constexpr double kFs = 8000.0;
    const auto signal = makeSine(1000.0, 8192, kFs, 2.0f);

    PsdEstimator psd;
    psd.prepare(256);
    const size_t bins = psd.estimate(signal, kFs);
    const double df = kFs / 256.0;
    double total = 0.0;
    for (size_t k = 0; k < bins; ++k) total += psd.psd()[k] * df;
    // Sine of amplitude A has power A^2 / 2
    REQUIRE(total == Approx(2.0).epsilon(0.05));
}

TEST_CASE("PSD removes the mean of each segment", "[psd_estimator][primitives]") {
    std::vector<float> dc(1024, 3.0f);
    PsdEstimator psd;
    psd.prepare();
    REQUIRE(psd.estimate(dc, 1000.0) > 0);
    for (float v : psd.psd()) REQUIRE(v == Approx(0.0f).margin(1e-6f));
}

TEST_CASE("short signals use a single shorter segment", "[psd_estimator][primitives][edge]") {
    const auto signal = makeSine(100.0, 100, 1000.0);
    PsdEstimator psd;
    psd.prepare(256);
    const size_t bins = psd.estimate(signal, 1000.0);
    REQUIRE(bins == fftSizeFor(100) / 2 + 1);
}

TEST_CASE("empty signal or bad rate yields no bins", "[psd_estimator][primitives][edge]") {
    PsdEstimator psd;
    psd.prepare();
    REQUIRE(psd.estimate({}, 1000.0) == 0);
    const auto signal = makeSine(100.0, 512, 1000.0);
    REQUIRE(psd.estimate(signal, 0.0) == 0);
}

TEST_CASE("warped frame frequencies are monotonic and energy non-negative",
          "[psd_estimator][primitives]") {
    constexpr double kFs = 14700.0;
    const auto signal = makeSine(440.0, 735 * 5 / 3, kFs);

    PsdEstimator psd;
    psd.prepare();
    SpectralFrame frame;
    psd.warped(signal, kFs, 64, 261.0f, 6000.0f, FrequencyScale::Bark, frame);

    REQUIRE(frame.size() == 64);
    REQUIRE(frame.frequencies.front() == Approx(261.0f).epsilon(1e-4));
    REQUIRE(frame.frequencies.back() == Approx(6000.0f));
    for (size_t i = 1; i < frame.size(); ++i) {
        REQUIRE(frame.frequencies[i] >= frame.frequencies[i - 1]);
    }
    for (float e : frame.energy) REQUIRE(e >= 0.0f);

    const auto peak = std::max_element(frame.energy.begin(), frame.energy.end()) - frame.energy.begin();
    REQUIRE(frame.frequencies[static_cast<size_t>(peak)] == Approx(440.0f).margin(120.0f));
}

TEST_CASE("warped frame of silence is all zero but keeps its axis", "[psd_estimator][primitives][edge]") {
    PsdEstimator psd;
    psd.prepare();
    SpectralFrame frame;
    psd.warped({}, 14700.0, 32, 32.7f, 261.0f, FrequencyScale::Mel, frame);
    REQUIRE(frame.size() == 32);
    REQUIRE(frame.frequencies.back() == Approx(261.0f));
    for (float e : frame.energy) REQUIRE(e == 0.0f);
}

TEST_CASE("FFT of an impulse is flat", "[fft][primitives]") {
    FFT fft;
    fft.prepare(64);
    REQUIRE(fft.isPrepared());
    REQUIRE(fft.numBins() == 33);

    std::vector<float> impulse(64, 0.0f);
    impulse[0] = 1.0f;
    std::vector<Complex> bins(fft.numBins());
    fft.forward(impulse.data(), bins.data());
    for (const auto& bin : bins) {
        REQUIRE(bin.magnitude() == Approx(1.0f));
        REQUIRE(bin.power() == Approx(1.0f));
    }
}

TEST_CASE("FFT power matches squared magnitude", "[fft][primitives]") {
    FFT fft;
    fft.prepare(128);
    const auto signal = makeSine(1000.0, 128, 8000.0);
    std::vector<Complex> bins(fft.numBins());
    std::vector<float> power(fft.numBins());
    fft.forward(signal.data(), bins.data());
    fft.forwardPower(signal.data(), power.data());
    for (size_t k = 0; k < bins.size(); ++k) {
        REQUIRE(power[k] == Approx(bins[k].power()).margin(1e-3f));
    }
    // 1000 Hz at 8 kHz / 128 = bin 16, amplitude N/2
    REQUIRE(bins[16].magnitude() == Approx(64.0f).epsilon(1e-3));
}

TEST_CASE("FFT rejects unsupported sizes", "[fft][primitives][edge]") {
    FFT fft;
    fft.prepare(100);
    REQUIRE_FALSE(fft.isPrepared());
    fft.prepare(16);
    REQUIRE_FALSE(fft.isPrepared());
    REQUIRE(fft.numBins() == 0);
}
