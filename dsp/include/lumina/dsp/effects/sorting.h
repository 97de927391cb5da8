// ==============================================================================
// Layer 3: Effect - Sorting
// ==============================================================================
// Shuffles the strip with random colours and bubble-sorts it one pass per
// frame. When looping, a finished sort restarts with a random key and
// direction; otherwise the sorted strip is held until the pixel count
// changes.
//
// Inputs:  none
// Outputs: 1
// ==============================================================================

#pragma once

#include <lumina/dsp/core/random.h>
#include <lumina/dsp/effects/effect_node.h>
#include <lumina/dsp/effects/parameter_mappings.h>
#include <lumina/dsp/primitives/bubble_sorter.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace Lumina {
namespace DSP {

class Sorting final : public EffectNode {
public:
    explicit Sorting(uint32_t seed = 1) : rng_(seed) {
        auto& p = params();
        p.bindChoice("sortby", key_, kSortKeyChoices, "Pixel property to sort by.");
        p.bindToggle("reversed", reversed_, "Sort from high to low.");
        p.bindToggle("looping", looping_, "Start over with a random key once sorted.");
    }

    [[nodiscard]] std::string_view name() const noexcept override { return "Sorting"; }

    [[nodiscard]] std::span<const InputPortSpec> inputPorts() const noexcept override {
        return {};
    }

    [[nodiscard]] const BubbleSorter& sorter() const noexcept { return sorter_; }
    [[nodiscard]] SortKey key() const noexcept { return key_; }
    [[nodiscard]] bool reversed() const noexcept { return reversed_; }

protected:
    void onUpdate(double /*dt*/) override {
        if (sorter_.pixels().numPixels() != numPixels()) {
            sorter_.shuffle(numPixels(), rng_);
            applyOrder();
        }
    }

    void onParameterChanged(std::string_view /*param*/) override {
        applyOrder();
    }

    bool render(const FrameInputs& /*in*/, FrameOutputs& out) override {
        if (sorter_.pixels().numPixels() != numPixels()) {
            sorter_.shuffle(numPixels(), rng_);
            applyOrder();
        }

        if (!sorter_.isSorted()) {
            sorter_.step();
            if (sorter_.isSorted() && looping_) {
                key_ = sortKeyFromIndex(rng_.nextBelow(kNumSortKeys));
                reversed_ = rng_.chance(0.5f);
                applyOrder();
            }
        }

        outputBuffer(out, 0) = sorter_.pixels();
        return true;
    }

private:
    void applyOrder() noexcept {
        sorter_.setKey(key_);
        sorter_.setReversed(reversed_);
        sorter_.restart();
    }

    SortKey key_ = SortKey::Red;
    bool reversed_ = false;
    bool looping_ = true;

    Xorshift32 rng_;
    BubbleSorter sorter_;
};

} // namespace DSP
} // namespace Lumina
