// ==============================================================================
// Layer 1: DSP Primitive - NoteEnvelopeBank
// ==============================================================================
// Linear attack/decay/sustain/release envelopes for a set of held notes,
// evaluated against absolute node time rather than per sample.
// ==============================================================================

#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace Lumina {
namespace DSP {

/// ADSR timing. Times in seconds; sustain is a level in [0, 1].
struct EnvelopeTimes {
    float attack = 0.0f;
    float decay = 0.0f;
    float sustain = 1.0f;
    float release = 0.0f;
};

/// One sounding note.
struct Note {
    uint8_t number = 0;
    float velocity = 0.0f;      ///< Peak level reached at the end of attack
    double spawnTime = 0.0;
    double releaseTime = 0.0;
    bool active = true;         ///< False after note-off
    float value = 0.0f;         ///< Envelope value at the last advance()
};

/// @brief Envelope value of a note at time now.
///
/// Attack ramps 0 -> velocity, decay ramps velocity -> velocity * sustain,
/// sustain holds, and after note-off the release ramps velocity * sustain -> 0.
/// Zero-length phases are skipped.
///
/// @param finished Set to true once the release has completed
[[nodiscard]] inline float envelopeValue(const Note& note, const EnvelopeTimes& times,
                                         double now, bool& finished) noexcept {
    finished = false;
    const float sustainLevel = note.velocity * times.sustain;

    if (!note.active) {
        const double sinceRelease = now - note.releaseTime;
        if (times.release <= 0.0f || sinceRelease >= times.release) {
            finished = true;
            return 0.0f;
        }
        const double frac = std::max(0.0, sinceRelease) / times.release;
        return static_cast<float>(sustainLevel * (1.0 - frac));
    }

    const double age = std::max(0.0, now - note.spawnTime);
    if (times.attack > 0.0f && age < times.attack) {
        return static_cast<float>(note.velocity * age / times.attack);
    }
    const double sinceDecay = age - std::max(0.0f, times.attack);
    if (times.decay > 0.0f && sinceDecay < times.decay) {
        const double frac = sinceDecay / times.decay;
        return static_cast<float>(note.velocity + (sustainLevel - note.velocity) * frac);
    }
    return sustainLevel;
}

class NoteEnvelopeBank {
public:
    /// Maximum simultaneous notes; the oldest is dropped beyond this
    static constexpr size_t kMaxNotes = 128;

    NoteEnvelopeBank() { notes_.reserve(kMaxNotes); }

    void noteOn(uint8_t number, float velocity, double now) {
        if (notes_.size() == kMaxNotes) notes_.erase(notes_.begin());
        Note n;
        n.number = number;
        n.velocity = velocity;
        n.spawnTime = now;
        notes_.push_back(n);
    }

    /// Release every active note with this number.
    void noteOff(uint8_t number, double now) noexcept {
        for (auto& n : notes_) {
            if (n.active && n.number == number) {
                n.active = false;
                n.releaseTime = now;
            }
        }
    }

    /// Recompute every note's value and drop notes whose release ended.
    void advance(double now, const EnvelopeTimes& times) {
        std::erase_if(notes_, [&](Note& n) {
            bool finished = false;
            n.value = envelopeValue(n, times, now, finished);
            return finished;
        });
    }

    void clear() noexcept { notes_.clear(); }

    [[nodiscard]] std::span<const Note> notes() const noexcept { return notes_; }
    [[nodiscard]] size_t size() const noexcept { return notes_.size(); }

private:
    std::vector<Note> notes_;
};

} // namespace DSP
} // namespace Lumina
