// ==============================================================================
// Layer 3: Effect Support - EffectNode
// ==============================================================================
// Base class of every effect in the graph. A node declares its input ports
// and output count; the base class owns the frame protocol:
//
//   prepare(context)  - pixel count and (possibly unknown) sample rate
//   update(dt)        - advance node time, rebuild stale caches
//   process(in, out)  - resolve absent inputs, render, sanitize and clamp
//
// Subclasses implement render() and the optional hooks only.
// ==============================================================================

#pragma once

#include <lumina/dsp/core/color_utils.h>
#include <lumina/dsp/core/db_utils.h>
#include <lumina/dsp/core/frame_context.h>
#include <lumina/dsp/effects/parameter_schema.h>
#include <lumina/dsp/primitives/pixel_buffer.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace Lumina {
namespace DSP {

// =============================================================================
// Port declaration
// =============================================================================

enum class PortKind : uint8_t {
    Audio = 0,
    Pixels
};

/// What happens when a port has no data this frame.
enum class AbsentPolicy : uint8_t {
    SkipFrame = 0,   ///< Node emits no data this frame
    White,           ///< Solid white buffer substituted
    Black,           ///< Solid black buffer substituted
    Optional         ///< Delivered absent; the node picks its own default
};

struct InputPortSpec {
    std::string_view name;
    PortKind kind = PortKind::Pixels;
    AbsentPolicy whenAbsent = AbsentPolicy::White;
};

// =============================================================================
// InputSlot
// =============================================================================

/// @brief One input value with explicit presence. Borrowed for one process().
class InputSlot {
public:
    [[nodiscard]] static InputSlot absent() noexcept { return {}; }

    [[nodiscard]] static InputSlot audio(std::span<const float> samples) noexcept {
        InputSlot slot;
        slot.kind_ = PortKind::Audio;
        slot.audio_ = samples;
        slot.present_ = true;
        return slot;
    }

    [[nodiscard]] static InputSlot pixels(const PixelBuffer& buffer) noexcept {
        InputSlot slot;
        slot.kind_ = PortKind::Pixels;
        slot.pixels_ = &buffer;
        slot.present_ = true;
        return slot;
    }

    [[nodiscard]] bool isPresent() const noexcept { return present_; }
    [[nodiscard]] PortKind kind() const noexcept { return kind_; }

    /// Samples, empty unless this is a present audio slot.
    [[nodiscard]] std::span<const float> audio() const noexcept {
        return (present_ && kind_ == PortKind::Audio) ? audio_ : std::span<const float>{};
    }

    /// Buffer, nullptr unless this is a present pixel slot.
    [[nodiscard]] const PixelBuffer* pixels() const noexcept {
        return (present_ && kind_ == PortKind::Pixels) ? pixels_ : nullptr;
    }

private:
    std::span<const float> audio_;
    const PixelBuffer* pixels_ = nullptr;
    PortKind kind_ = PortKind::Pixels;
    bool present_ = false;
};

/// Outputs of one node; nullopt means "no data" downstream.
using FrameOutputs = std::vector<std::optional<PixelBuffer>>;

// =============================================================================
// FrameInputs
// =============================================================================

/// @brief Inputs after absent-policy resolution, as seen by render().
class FrameInputs {
public:
    [[nodiscard]] bool has(size_t port) const noexcept {
        return port < slots_.size() && slots_[port].isPresent();
    }

    [[nodiscard]] std::span<const float> audio(size_t port) const noexcept {
        return port < slots_.size() ? slots_[port].audio() : std::span<const float>{};
    }

    /// Pixel input, nullptr when absent (only possible for Optional ports).
    [[nodiscard]] const PixelBuffer* pixels(size_t port) const noexcept {
        return port < slots_.size() ? slots_[port].pixels() : nullptr;
    }

private:
    friend class EffectNode;
    std::vector<InputSlot> slots_;
};

// =============================================================================
// EffectNode
// =============================================================================

/// @brief Abstract effect node.
///
/// Non-copyable and non-movable: parameter bindings refer to members.
class EffectNode {
public:
    EffectNode() = default;
    virtual ~EffectNode() = default;

    EffectNode(const EffectNode&) = delete;
    EffectNode& operator=(const EffectNode&) = delete;
    EffectNode(EffectNode&&) = delete;
    EffectNode& operator=(EffectNode&&) = delete;

    // =========================================================================
    // Declaration
    // =========================================================================

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
    [[nodiscard]] virtual std::span<const InputPortSpec> inputPorts() const noexcept = 0;
    [[nodiscard]] virtual size_t numOutputChannels() const noexcept { return 1; }

    [[nodiscard]] size_t numInputChannels() const noexcept { return inputPorts().size(); }

    // =========================================================================
    // Frame protocol
    // =========================================================================

    /// @brief Adopt a new context. Subclasses see the previous one in onPrepare().
    void prepare(const FrameContext& context) {
        const FrameContext previous = context_;
        context_ = context;
        onPrepare(previous);
    }

    /// @brief Advance node time by dt seconds.
    void update(double dt) {
        const double step = (detail::isFinite(dt) && dt > 0.0) ? dt : 0.0;
        time_ += step;
        onUpdate(step);
    }

    /// @brief Produce this frame's outputs.
    ///
    /// Missing entries of inputs count as absent. outputs is resized to
    /// numOutputChannels().
    void process(std::span<const InputSlot> inputs, FrameOutputs& outputs) {
        outputs.resize(numOutputChannels());
        if (!isPrepared() || !resolveInputs(inputs)) {
            clearOutputs(outputs);
            return;
        }

        if (!render(resolved_, outputs)) {
            clearOutputs(outputs);
            return;
        }

        for (auto& out : outputs) {
            if (!out) continue;
            if (out->numPixels() != numPixels()) out->resize(numPixels());
            out->sanitizeAndClamp();
        }
    }

    // =========================================================================
    // Parameters
    // =========================================================================

    [[nodiscard]] std::vector<ParameterSpec> parameters() const { return params_.specs(); }

    [[nodiscard]] ParamStatus setParameter(std::string_view param, double value) {
        return notify(param, params_.set(param, value));
    }

    [[nodiscard]] ParamStatus setParameter(std::string_view param, int value) {
        return setParameter(param, static_cast<double>(value));
    }

    [[nodiscard]] ParamStatus setParameter(std::string_view param, std::string_view value) {
        return notify(param, params_.set(param, value));
    }

    [[nodiscard]] ParamStatus setParameter(std::string_view param, const char* value) {
        return setParameter(param, std::string_view(value));
    }

    [[nodiscard]] ParamStatus setParameter(std::string_view param, bool value) {
        return notify(param, params_.set(param, value));
    }

    // =========================================================================
    // Query
    // =========================================================================

    [[nodiscard]] double time() const noexcept { return time_; }
    [[nodiscard]] const FrameContext& context() const noexcept { return context_; }
    [[nodiscard]] size_t numPixels() const noexcept { return context_.numPixels; }
    [[nodiscard]] bool isPrepared() const noexcept { return context_.hasPixels(); }

protected:
    // =========================================================================
    // Hooks
    // =========================================================================

    /// Context changed (previous is the old one).
    virtual void onPrepare(const FrameContext& /*previous*/) {}

    /// Called from update() after time() advanced.
    virtual void onUpdate(double /*dt*/) {}

    /// A parameter was applied.
    virtual void onParameterChanged(std::string_view /*param*/) {}

    /// @brief Write every declared output.
    /// @return false to emit "no data" on all outputs this frame
    virtual bool render(const FrameInputs& in, FrameOutputs& out) = 0;

    // =========================================================================
    // Helpers
    // =========================================================================

    [[nodiscard]] ParameterSet& params() noexcept { return params_; }

    /// Output buffer for channel ch, created or resized to numPixels().
    [[nodiscard]] PixelBuffer& outputBuffer(FrameOutputs& out, size_t ch) {
        auto& slot = out[ch];
        if (!slot) {
            slot.emplace(numPixels());
        } else {
            slot->resize(numPixels());
        }
        return *slot;
    }

private:
    ParamStatus notify(std::string_view param, ParamStatus status) {
        if (isApplied(status)) onParameterChanged(param);
        return status;
    }

    static void clearOutputs(FrameOutputs& outputs) noexcept {
        for (auto& out : outputs) out.reset();
    }

    /// @return false when a SkipFrame port is absent
    bool resolveInputs(std::span<const InputSlot> inputs) {
        const auto ports = inputPorts();
        const size_t n = numPixels();
        resolved_.slots_.resize(ports.size());
        substitutes_.resize(ports.size());

        for (size_t p = 0; p < ports.size(); ++p) {
            const InputSlot slot = p < inputs.size() ? inputs[p] : InputSlot::absent();
            bool usable = slot.isPresent() && slot.kind() == ports[p].kind;
            if (usable && ports[p].kind == PortKind::Pixels) {
                usable = slot.pixels() != nullptr && slot.pixels()->numPixels() == n;
            }
            if (usable) {
                resolved_.slots_[p] = slot;
                continue;
            }

            switch (ports[p].whenAbsent) {
                case AbsentPolicy::SkipFrame:
                    return false;
                case AbsentPolicy::White:
                case AbsentPolicy::Black: {
                    const Rgb fill = ports[p].whenAbsent == AbsentPolicy::White
                        ? Colors::kWhite : Colors::kBlack;
                    auto& sub = substitutes_[p];
                    if (sub.numPixels() != n) sub.resize(n);
                    sub.fill(fill);
                    resolved_.slots_[p] = InputSlot::pixels(sub);
                    break;
                }
                case AbsentPolicy::Optional:
                default:
                    resolved_.slots_[p] = InputSlot::absent();
                    break;
            }
        }
        return true;
    }

    FrameContext context_;
    double time_ = 0.0;
    ParameterSet params_;
    FrameInputs resolved_;
    std::vector<PixelBuffer> substitutes_;
};

} // namespace DSP
} // namespace Lumina
