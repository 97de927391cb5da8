// Tests for the fixed-capacity particle pool
// Layer 1: DSP Primitives

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <lumina/dsp/primitives/particle_pool.h>

#include <cmath>
#include <vector>

using Catch::Approx;
using namespace Lumina::DSP;

TEST_CASE("ParticlePool never exceeds its capacity", "[particle_pool][primitives]") {
    ParticlePool pool;
    for (size_t i = 0; i < 250; ++i) {
        pool.spawn(Particle{static_cast<double>(i), i % 60, 1, 1.0f});
        REQUIRE(pool.size() <= ParticlePool::kMaxParticles);
    }
    REQUIRE(pool.size() == ParticlePool::kMaxParticles);
}

TEST_CASE("ParticlePool evicts oldest first", "[particle_pool][primitives]") {
    ParticlePool pool;
    for (size_t i = 0; i < ParticlePool::kMaxParticles + 5; ++i) {
        pool.spawn(Particle{static_cast<double>(i), 0, 1, 1.0f});
    }
    REQUIRE(pool.oldest().spawnTime == Approx(5.0));
    REQUIRE(pool.newest().spawnTime == Approx(104.0));
    for (size_t i = 1; i < pool.size(); ++i) {
        REQUIRE(pool[i - 1].spawnTime < pool[i].spawnTime);
    }
}

TEST_CASE("particle brightness decays exponentially", "[particle_pool][primitives]") {
    const ParticleDecay decay{100.0f, 0.0f};
    const Particle p{0.0, 0, 1, 0.8f};
    REQUIRE(ParticlePool::brightness(p, 0.0, decay) == Approx(0.8f));
    REQUIRE(ParticlePool::brightness(p, 1.0, decay) == Approx(0.8f * std::exp(-1.0f)));
}

TEST_CASE("minBrightness floors the captured peak", "[particle_pool][primitives]") {
    const ParticleDecay decay{100.0f, 0.3f};
    const Particle quiet{0.0, 0, 1, 0.01f};
    REQUIRE(ParticlePool::brightness(quiet, 0.0, decay) == Approx(0.3f));
}

TEST_CASE("prune drops faded particles and keeps order", "[particle_pool][primitives]") {
    ParticlePool pool;
    const ParticleDecay decay{100.0f, 0.0f};
    pool.spawn(Particle{0.0, 0, 1, 1.0f});
    pool.spawn(Particle{50.0, 1, 1, 1.0f});
    pool.spawn(Particle{51.0, 2, 1, 1.0f});
    pool.prune(51.0, decay);
    REQUIRE(pool.size() == 2);
    REQUIRE(pool.oldest().position == 1);
    REQUIRE(pool.newest().position == 2);
}

TEST_CASE("render sums overlapping particles and clips to the strip", "[particle_pool][primitives]") {
    ParticlePool pool;
    const ParticleDecay decay{100.0f, 0.0f};
    pool.spawn(Particle{0.0, 2, 3, 0.5f});
    pool.spawn(Particle{0.0, 3, 10, 0.25f});
    std::vector<float> mask(6, 9.0f);
    pool.render(0.0, decay, mask);
    REQUIRE(mask[0] == 0.0f);
    REQUIRE(mask[2] == Approx(0.5f));
    REQUIRE(mask[3] == Approx(0.75f));
    REQUIRE(mask[4] == Approx(0.75f));
    REQUIRE(mask[5] == Approx(0.25f));
}

TEST_CASE("clear empties the pool", "[particle_pool][primitives]") {
    ParticlePool pool;
    pool.spawn(Particle{});
    pool.clear();
    REQUIRE(pool.empty());
}
