// ==============================================================================
// Layer 3: Effect Support - Parameter Schema
// ==============================================================================
// Named, typed parameter bindings for effect nodes. An effect binds its
// member variables once in its constructor; the schema then answers
// "what can be set" (specs()) and applies typed updates with a status
// result instead of throwing.
//
// Numeric values are clamped into range (OutOfRange still applies the
// clamped value). Unknown choice strings leave state unchanged.
// ==============================================================================

#pragma once

#include <lumina/dsp/core/db_utils.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace Lumina {
namespace DSP {

// =============================================================================
// Schema description
// =============================================================================

/// Numeric parameter: current value and its legal range.
struct NumericParameter {
    double value = 0.0;
    double min = 0.0;
    double max = 1.0;
    double step = 0.01;
};

/// Choice parameter: allowed values, current value first.
struct ChoiceParameter {
    std::vector<std::string> values;
};

/// On/off parameter.
struct ToggleParameter {
    bool value = false;
};

/// One entry of an effect's parameter list.
struct ParameterSpec {
    std::string name;
    std::variant<NumericParameter, ChoiceParameter, ToggleParameter> kind;
    std::string help;

    [[nodiscard]] const NumericParameter* numeric() const noexcept {
        return std::get_if<NumericParameter>(&kind);
    }
    [[nodiscard]] const ChoiceParameter* choice() const noexcept {
        return std::get_if<ChoiceParameter>(&kind);
    }
    [[nodiscard]] const ToggleParameter* toggle() const noexcept {
        return std::get_if<ToggleParameter>(&kind);
    }
};

/// Result of a parameter update.
enum class ParamStatus : uint8_t {
    Ok = 0,
    UnknownParameter,   ///< No parameter with that name
    OutOfRange,         ///< Value clamped into range, then applied
    InvalidChoice,      ///< String not among the allowed values; nothing changed
    TypeMismatch        ///< Wrong value type (or a non-finite number); nothing changed
};

/// True when the update changed (or re-asserted) the parameter.
[[nodiscard]] constexpr bool isApplied(ParamStatus status) noexcept {
    return status == ParamStatus::Ok || status == ParamStatus::OutOfRange;
}

/// Name/value pair of a choice table.
template <typename E>
struct ChoiceEntry {
    std::string_view name;
    E value;
};

// =============================================================================
// ParameterSet
// =============================================================================

/// @brief Bindings from parameter names to effect members.
///
/// Bindings hold references to the owner's members; the owner must not be
/// copied or moved after binding.
///
/// @example
/// @code
/// params_.bindNumeric("speed", speed_, 1.0, 200.0, 1.0, "Speed of the moving peak.");
/// params_.bindChoice("sortby", sortKey_, kSortKeyChoices);
/// params_.bindToggle("looping", looping_);
/// @endcode
class ParameterSet {
public:
    // =========================================================================
    // Binding
    // =========================================================================

    /// Bind a float, double or integer member. Integers round to nearest.
    template <typename T>
    void bindNumeric(std::string name, T& target, double min, double max, double step,
                     std::string help = {}) {
        static_assert(std::is_arithmetic_v<T> && !std::is_same_v<T, bool>);
        Binding b;
        b.name = std::move(name);
        b.help = std::move(help);
        b.type = Type::Numeric;
        b.min = min;
        b.max = max;
        b.step = step;
        b.getNumber = [&target] { return static_cast<double>(target); };
        b.setNumber = [&target](double v) {
            if constexpr (std::is_integral_v<T>) {
                target = static_cast<T>(std::lround(v));
            } else {
                target = static_cast<T>(v);
            }
        };
        bindings_.push_back(std::move(b));
    }

    /// Bind an enum member to a name table with static storage duration.
    template <typename E, size_t N>
    void bindChoice(std::string name, E& target, const std::array<ChoiceEntry<E>, N>& entries,
                    std::string help = {}) {
        static_assert(N > 0);
        const std::span<const ChoiceEntry<E>> table(entries);
        Binding b;
        b.name = std::move(name);
        b.help = std::move(help);
        b.type = Type::Choice;
        for (const auto& entry : table) b.choices.emplace_back(entry.name);
        b.getChoice = [&target, table]() -> size_t {
            for (size_t i = 0; i < table.size(); ++i) {
                if (table[i].value == target) return i;
            }
            return 0;
        };
        b.setChoice = [&target, table](size_t index) { target = table[index].value; };
        bindings_.push_back(std::move(b));
    }

    void bindToggle(std::string name, bool& target, std::string help = {}) {
        Binding b;
        b.name = std::move(name);
        b.help = std::move(help);
        b.type = Type::Toggle;
        b.getToggle = [&target] { return target; };
        b.setToggle = [&target](bool v) { target = v; };
        bindings_.push_back(std::move(b));
    }

    // =========================================================================
    // Schema
    // =========================================================================

    /// Parameters in binding order, with current values.
    [[nodiscard]] std::vector<ParameterSpec> specs() const {
        std::vector<ParameterSpec> out;
        out.reserve(bindings_.size());
        for (const auto& b : bindings_) {
            ParameterSpec spec;
            spec.name = b.name;
            spec.help = b.help;
            switch (b.type) {
                case Type::Numeric:
                    spec.kind = NumericParameter{b.getNumber(), b.min, b.max, b.step};
                    break;
                case Type::Choice: {
                    ChoiceParameter choice;
                    const size_t current = b.getChoice();
                    choice.values.push_back(b.choices[current]);
                    for (size_t i = 0; i < b.choices.size(); ++i) {
                        if (i != current) choice.values.push_back(b.choices[i]);
                    }
                    spec.kind = std::move(choice);
                    break;
                }
                case Type::Toggle:
                    spec.kind = ToggleParameter{b.getToggle()};
                    break;
            }
            out.push_back(std::move(spec));
        }
        return out;
    }

    [[nodiscard]] bool contains(std::string_view name) const noexcept {
        return find(name) != nullptr;
    }

    [[nodiscard]] size_t size() const noexcept { return bindings_.size(); }

    // =========================================================================
    // Updates
    // =========================================================================

    [[nodiscard]] ParamStatus set(std::string_view name, double value) {
        const Binding* b = find(name);
        if (b == nullptr) return ParamStatus::UnknownParameter;
        if (b->type != Type::Numeric || !detail::isFinite(value)) return ParamStatus::TypeMismatch;

        const double clamped = std::clamp(value, b->min, b->max);
        b->setNumber(clamped);
        return clamped == value ? ParamStatus::Ok : ParamStatus::OutOfRange;
    }

    [[nodiscard]] ParamStatus set(std::string_view name, std::string_view value) {
        const Binding* b = find(name);
        if (b == nullptr) return ParamStatus::UnknownParameter;
        if (b->type != Type::Choice) return ParamStatus::TypeMismatch;

        for (size_t i = 0; i < b->choices.size(); ++i) {
            if (b->choices[i] == value) {
                b->setChoice(i);
                return ParamStatus::Ok;
            }
        }
        return ParamStatus::InvalidChoice;
    }

    [[nodiscard]] ParamStatus set(std::string_view name, bool value) {
        const Binding* b = find(name);
        if (b == nullptr) return ParamStatus::UnknownParameter;
        if (b->type != Type::Toggle) return ParamStatus::TypeMismatch;
        b->setToggle(value);
        return ParamStatus::Ok;
    }

private:
    enum class Type : uint8_t { Numeric, Choice, Toggle };

    struct Binding {
        std::string name;
        std::string help;
        Type type = Type::Numeric;
        double min = 0.0;
        double max = 1.0;
        double step = 0.01;
        std::vector<std::string> choices;
        std::function<double()> getNumber;
        std::function<void(double)> setNumber;
        std::function<size_t()> getChoice;
        std::function<void(size_t)> setChoice;
        std::function<bool()> getToggle;
        std::function<void(bool)> setToggle;
    };

    [[nodiscard]] const Binding* find(std::string_view name) const noexcept {
        for (const auto& b : bindings_) {
            if (b.name == name) return &b;
        }
        return nullptr;
    }

    std::vector<Binding> bindings_;
};

} // namespace DSP
} // namespace Lumina
