// ==============================================================================
// Layer 3: Effect - KeyboardEnvelope
// ==============================================================================
// Lights one pixel per sounding note, position proportional to the note
// number, brightness following a linear ADSR envelope. Note events are
// injected through noteOn()/noteOff() and take effect at the next update().
//
// Inputs:  0 colour (White)
// Outputs: 1
// ==============================================================================

#pragma once

#include <lumina/dsp/effects/effect_node.h>
#include <lumina/dsp/primitives/note_envelope.h>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace Lumina {
namespace DSP {

/// Highest MIDI note number and velocity
inline constexpr float kMaxMidiValue = 127.0f;

class KeyboardEnvelope final : public EffectNode {
public:
    KeyboardEnvelope() {
        auto& p = params();
        p.bindNumeric("attack", times_.attack, 0.0, 5.0, 0.01, "Attack time in seconds.");
        p.bindNumeric("decay", times_.decay, 0.0, 5.0, 0.01, "Decay time in seconds.");
        p.bindNumeric("sustain", times_.sustain, 0.0, 1.0, 0.01, "Sustain level.");
        p.bindNumeric("release", times_.release, 0.0, 5.0, 0.01, "Release time in seconds.");
        pending_.reserve(NoteEnvelopeBank::kMaxNotes);
    }

    [[nodiscard]] std::string_view name() const noexcept override { return "KeyboardEnvelope"; }

    [[nodiscard]] std::span<const InputPortSpec> inputPorts() const noexcept override {
        return kPorts;
    }

    /// Queue a note-on (velocity 0..127). Velocity 0 counts as note-off.
    void noteOn(uint8_t note, uint8_t velocity) {
        pending_.push_back({note, velocity, velocity > 0});
    }

    void noteOff(uint8_t note) {
        pending_.push_back({note, 0, false});
    }

    [[nodiscard]] const NoteEnvelopeBank& notes() const noexcept { return bank_; }

protected:
    void onUpdate(double /*dt*/) override {
        const double now = time();
        for (const auto& e : pending_) {
            if (e.on) {
                bank_.noteOn(e.note, static_cast<float>(e.velocity), now);
            } else {
                bank_.noteOff(e.note, now);
            }
        }
        pending_.clear();
        bank_.advance(now, times_);
    }

    bool render(const FrameInputs& in, FrameOutputs& out) override {
        const size_t n = numPixels();
        positions_.assign(n, 0.0f);
        for (const auto& note : bank_.notes()) {
            const float scaled = static_cast<float>(note.number) / kMaxMidiValue * static_cast<float>(n);
            const size_t index = std::min(n - 1, static_cast<size_t>(std::max(0.0f, scaled)));
            positions_[index] += note.value / kMaxMidiValue;
        }
        outputBuffer(out, 0).assignMasked(*in.pixels(0), positions_);
        return true;
    }

private:
    struct NoteEvent {
        uint8_t note;
        uint8_t velocity;
        bool on;
    };

    static constexpr std::array<InputPortSpec, 1> kPorts{{
        {"color", PortKind::Pixels, AbsentPolicy::White}
    }};

    EnvelopeTimes times_;
    NoteEnvelopeBank bank_;
    std::vector<NoteEvent> pending_;
    std::vector<float> positions_;
};

} // namespace DSP
} // namespace Lumina
