// ==============================================================================
// Layer 1: DSP Primitive - ParticlePool
// ==============================================================================
// Fixed-capacity pool of decaying light particles ("stars"). Spawning into a
// full pool evicts the oldest particle. Brightness decays exponentially from
// the spawn instant; overlapping particles add up.
//
// No allocation: storage is a ring buffer of kMaxParticles slots.
// ==============================================================================

#pragma once

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <span>

namespace Lumina {
namespace DSP {

/// One spawned light.
struct Particle {
    double spawnTime = 0.0;   ///< Node time of the spawn (seconds)
    size_t position = 0;      ///< First pixel covered
    size_t thickness = 1;     ///< Pixels covered from position
    float peak = 1.0f;        ///< Audio peak captured at spawn
};

/// Parameters of the brightness curve.
struct ParticleDecay {
    float dimSpeed = 100.0f;        ///< Larger values fade more slowly
    float minBrightness = 0.0f;     ///< Floor applied to the captured peak
};

class ParticlePool {
public:
    /// Hard capacity
    static constexpr size_t kMaxParticles = 100;

    /// Numerator of the decay rate: rate = kDecayScale / dimSpeed per second
    static constexpr float kDecayScale = 100.0f;

    /// Particles dimmer than this are pruned
    static constexpr float kNegligibleBrightness = 1e-4f;

    // =========================================================================
    // Population
    // =========================================================================

    /// Add a particle, evicting the oldest when the pool is full.
    void spawn(const Particle& p) noexcept {
        if (count_ == kMaxParticles) {
            slots_[head_] = p;
            head_ = (head_ + 1) % kMaxParticles;
            return;
        }
        slots_[(head_ + count_) % kMaxParticles] = p;
        ++count_;
    }

    void clear() noexcept {
        head_ = 0;
        count_ = 0;
    }

    /// @brief Remove particles whose brightness has become negligible,
    ///        preserving spawn order.
    void prune(double now, const ParticleDecay& decay) noexcept {
        size_t kept = 0;
        for (size_t i = 0; i < count_; ++i) {
            const Particle p = (*this)[i];
            if (brightness(p, now, decay) >= kNegligibleBrightness) {
                slots_[(head_ + kept) % kMaxParticles] = p;
                ++kept;
            }
        }
        count_ = kept;
    }

    // =========================================================================
    // Rendering
    // =========================================================================

    /// exp(-kDecayScale / dimSpeed * (now - t0)) * max(minBrightness, peak)
    [[nodiscard]] static float brightness(const Particle& p, double now,
                                          const ParticleDecay& decay) noexcept {
        const double dimSpeed = std::max(1e-3, static_cast<double>(decay.dimSpeed));
        const double age = std::max(0.0, now - p.spawnTime);
        const double envelope = std::exp(-static_cast<double>(kDecayScale) / dimSpeed * age);
        return static_cast<float>(envelope) * std::max(decay.minBrightness, p.peak);
    }

    /// @brief Sum the brightness of every particle into mask (zeroed first).
    void render(double now, const ParticleDecay& decay, std::span<float> mask) const noexcept {
        std::fill(mask.begin(), mask.end(), 0.0f);
        for (size_t i = 0; i < count_; ++i) {
            const Particle& p = (*this)[i];
            const float b = brightness(p, now, decay);
            const size_t end = std::min(mask.size(), p.position + p.thickness);
            for (size_t j = p.position; j < end; ++j) mask[j] += b;
        }
    }

    // =========================================================================
    // Query
    // =========================================================================

    [[nodiscard]] size_t size() const noexcept { return count_; }
    [[nodiscard]] bool empty() const noexcept { return count_ == 0; }

    /// i-th particle in spawn order (0 = oldest).
    [[nodiscard]] const Particle& operator[](size_t i) const noexcept {
        return slots_[(head_ + i) % kMaxParticles];
    }

    [[nodiscard]] const Particle& oldest() const noexcept { return (*this)[0]; }
    [[nodiscard]] const Particle& newest() const noexcept { return (*this)[count_ - 1]; }

private:
    std::array<Particle, kMaxParticles> slots_{};
    size_t head_ = 0;
    size_t count_ = 0;
};

} // namespace DSP
} // namespace Lumina
