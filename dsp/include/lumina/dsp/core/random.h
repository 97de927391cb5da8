// ==============================================================================
// Layer 0: Core Utility - Seeded Pseudo-Random Numbers
// ==============================================================================
// Allocation-free xorshift generator used for particle spawns and colour
// shuffles.
// ==============================================================================

#pragma once

#include <cstddef>
#include <cstdint>

namespace Lumina {
namespace DSP {

// ==============================================================================
// Xorshift32 PRNG
// ==============================================================================

/// Fast 32-bit pseudo-random number generator (Marsaglia xorshift 13/17/5).
///
/// Drives spawn decisions, spawn positions and colour shuffles. Every effect
/// owns its own generator so a fixed seed reproduces a render exactly.
///
/// @note NOT cryptographically secure
///
/// @example
///     Xorshift32 rng(12345);
///     if (rng.chance(0.25f)) { size_t pos = rng.nextBelow(60); }
///
class Xorshift32 {
public:
    /// @param seedValue Initial seed (0 is replaced with a fixed non-zero seed)
    explicit constexpr Xorshift32(uint32_t seedValue = 1) noexcept
        : state_(seedValue != 0 ? seedValue : kDefaultSeed) {}

    /// @return Random uint32_t in range [1, 2^32-1]
    [[nodiscard]] constexpr uint32_t next() noexcept {
        state_ ^= state_ << 13;
        state_ ^= state_ >> 17;
        state_ ^= state_ << 5;
        return state_;
    }

    /// @return Random float in range [0.0, 1.0]
    [[nodiscard]] constexpr float nextUnipolar() noexcept {
        return static_cast<float>(next()) * kToFloat;
    }

    /// @return Random float in range [-1.0, 1.0]
    [[nodiscard]] constexpr float nextBipolar() noexcept {
        return nextUnipolar() * 2.0f - 1.0f;
    }

    /// Uniform integer in [0, bound). Returns 0 when bound is 0.
    [[nodiscard]] constexpr size_t nextBelow(size_t bound) noexcept {
        if (bound == 0) return 0;
        return static_cast<size_t>(next() % static_cast<uint64_t>(bound));
    }

    /// Uniform integer in the closed range [lo, hi]. Returns lo when hi < lo.
    [[nodiscard]] constexpr size_t nextInRange(size_t lo, size_t hi) noexcept {
        if (hi <= lo) return lo;
        return lo + nextBelow(hi - lo + 1);
    }

    /// Bernoulli trial: true with the given probability.
    /// Probabilities at or above 1 always succeed, at or below 0 never do.
    [[nodiscard]] constexpr bool chance(float probability) noexcept {
        if (probability >= 1.0f) return true;
        if (!(probability > 0.0f)) return false;
        return nextUnipolar() < probability;
    }

    /// Reseed the generator (0 is replaced with the default seed).
    constexpr void seed(uint32_t seedValue) noexcept {
        state_ = (seedValue != 0) ? seedValue : kDefaultSeed;
    }

    [[nodiscard]] constexpr uint32_t state() const noexcept {
        return state_;
    }

private:
    static constexpr uint32_t kDefaultSeed = 2463534242u;

    /// 1.0 / (2^32 - 1)
    static constexpr float kToFloat = 2.3283064370807974e-10f;

    uint32_t state_;
};

} // namespace DSP
} // namespace Lumina
