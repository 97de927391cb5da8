// ==============================================================================
// Layer 3: Effect Support - Choice Parameter Mappings
// ==============================================================================
// Explicit string <-> enum tables for every choice parameter. Order is the
// order presented to a parameter UI; the first entry is the safe default.
// ==============================================================================

#pragma once

#include <lumina/dsp/core/color_utils.h>
#include <lumina/dsp/core/frequency_scales.h>
#include <lumina/dsp/core/wave_shapes.h>
#include <lumina/dsp/effects/parameter_schema.h>
#include <lumina/dsp/primitives/bubble_sorter.h>

#include <array>
#include <optional>
#include <string_view>

namespace Lumina {
namespace DSP {

// =============================================================================
// Tables
// =============================================================================

inline constexpr std::array<ChoiceEntry<SortKey>, kNumSortKeys> kSortKeyChoices{{
    {"red", SortKey::Red},
    {"green", SortKey::Green},
    {"blue", SortKey::Blue},
    {"brightness", SortKey::Brightness}
}};

inline constexpr std::array<ChoiceEntry<WaveShape>, 4> kWaveShapeChoices{{
    {"sin", WaveShape::Sine},
    {"sawtooth", WaveShape::Sawtooth},
    {"sawtooth_reversed", WaveShape::SawtoothReversed},
    {"square", WaveShape::Square}
}};

inline constexpr std::array<ChoiceEntry<BlendMode>, 5> kBlendModeChoices{{
    {"lightest", BlendMode::Lightest},
    {"darkest", BlendMode::Darkest},
    {"addition", BlendMode::Addition},
    {"multiply", BlendMode::Multiply},
    {"screen", BlendMode::Screen}
}};

inline constexpr std::array<ChoiceEntry<FrequencyScale>, 3> kFrequencyScaleChoices{{
    {"bark", FrequencyScale::Bark},
    {"mel", FrequencyScale::Mel},
    {"linear", FrequencyScale::Linear}
}};

// =============================================================================
// Lookup
// =============================================================================

/// @brief Enum value for a name, nullopt when the name is not in the table.
template <typename E, size_t N>
[[nodiscard]] constexpr std::optional<E> parseChoice(const std::array<ChoiceEntry<E>, N>& table,
                                                     std::string_view name) noexcept {
    for (const auto& entry : table) {
        if (entry.name == name) return entry.value;
    }
    return std::nullopt;
}

/// @brief Name of an enum value; the first entry's name if the value is missing.
template <typename E, size_t N>
[[nodiscard]] constexpr std::string_view choiceName(const std::array<ChoiceEntry<E>, N>& table,
                                                    E value) noexcept {
    for (const auto& entry : table) {
        if (entry.value == value) return entry.name;
    }
    return table[0].name;
}

/// Sort key by index with a safe default for out-of-range indices.
[[nodiscard]] constexpr SortKey sortKeyFromIndex(size_t index) noexcept {
    return index < kSortKeyChoices.size() ? kSortKeyChoices[index].value : SortKey::Red;
}

} // namespace DSP
} // namespace Lumina
