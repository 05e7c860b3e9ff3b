#pragma once
/*
===============================================================================
ENUM UTILS — Compile-time enumeration helpers for the meal-plan engine
===============================================================================

OVERVIEW
--------
Small set of zero-overhead helpers for strongly-typed enumerations that carry
a trailing COUNT sentinel. The engine uses them for every closed vocabulary it
owns: nutrients, meal types, Gurobi variable/constraint registries, planner
states. Fixed-size, enum-indexed storage (EnumArray) replaces ad-hoc maps
keyed by strings.

KEY COMPONENTS
--------------
• MEALPLAN_DECLARE_ENUM_WITH_COUNT: enum class + <Name>_COUNT constant
• enum_size<E>:   number of user enumerators
• enumIndex(e):   enumerator → std::size_t
• forEachEnum<E>: visit every enumerator in declaration order
• EnumArray<E,T>: std::array<T, COUNT> indexed by the enum itself

USAGE EXAMPLES
--------------
    MEALPLAN_DECLARE_ENUM_WITH_COUNT(Macro, Calories, Protein);

    EnumArray<Macro, double> totals{};
    totals[Macro::Protein] += 25.0;

    forEachEnum<Macro>([&](Macro m) {
        std::cout << enumIndex(m) << " = " << totals[m] << "\n";
    });

THREAD SAFETY
-------------
• No shared state; EnumArray has value semantics like std::array

EXCEPTION SAFETY
----------------
• EnumArray::at() throws std::out_of_range for the COUNT sentinel
• Everything else is noexcept

===============================================================================
*/

#include <array>
#include <cstddef>
#include <format>
#include <stdexcept>

/**
 * @macro MEALPLAN_DECLARE_ENUM_WITH_COUNT
 * @brief Declares an enum class with a trailing COUNT sentinel and a
 *        matching <Name>_COUNT constant
 *
 * @example
 *     MEALPLAN_DECLARE_ENUM_WITH_COUNT(MealVars, Assign, Repeat);
 *     // enum class MealVars { Assign, Repeat, COUNT };
 *     // static constexpr std::size_t MealVars_COUNT = 2;
 */
#define MEALPLAN_DECLARE_ENUM_WITH_COUNT(Name, ...)                       \
    enum class Name { __VA_ARGS__, COUNT };                               \
    static constexpr std::size_t Name##_COUNT =                           \
        static_cast<std::size_t>(Name::COUNT)

namespace mealplan {

    /// @brief Number of user enumerators (COUNT excluded)
    template<typename Enum>
    struct enum_size {
        static constexpr std::size_t value = static_cast<std::size_t>(Enum::COUNT);
    };

    template<typename Enum>
    inline constexpr std::size_t enum_size_v = enum_size<Enum>::value;

    /// @brief Position of an enumerator in declaration order
    template<typename Enum>
    [[nodiscard]] constexpr std::size_t enumIndex(Enum value) noexcept {
        return static_cast<std::size_t>(value);
    }

    /// @brief True for user enumerators, false for COUNT and anything past it
    template<typename Enum>
    [[nodiscard]] constexpr bool isValidEnumValue(Enum value) noexcept {
        return enumIndex(value) < enum_size_v<Enum>;
    }

    /**
     * @brief Invoke fn(e) for every enumerator in declaration order
     * @tparam Enum Enumeration declared with MEALPLAN_DECLARE_ENUM_WITH_COUNT
     */
    template<typename Enum, typename Fn>
    constexpr void forEachEnum(Fn&& fn) {
        for (std::size_t i = 0; i < enum_size_v<Enum>; ++i) {
            fn(static_cast<Enum>(i));
        }
    }

    /**
     * @class EnumArray
     * @brief Fixed-size array indexed directly by enumerators
     *
     * @details Aggregate wrapper over std::array so brace-initialization in
     *          declaration order works:
     *
     *              EnumArray<Nutrient, double> v{ 500.0, 30.0 };
     *
     *          Missing trailing elements are value-initialized.
     */
    template<typename Enum, typename T>
    struct EnumArray {
        std::array<T, enum_size_v<Enum>> values{};

        constexpr T& operator[](Enum key) noexcept { return values[enumIndex(key)]; }
        constexpr const T& operator[](Enum key) const noexcept { return values[enumIndex(key)]; }

        /// @throws std::out_of_range if key is not a user enumerator
        T& at(Enum key) {
            if (!isValidEnumValue(key)) {
                throw std::out_of_range(
                    std::format("EnumArray::at: index {} >= {}", enumIndex(key), enum_size_v<Enum>));
            }
            return values[enumIndex(key)];
        }

        const T& at(Enum key) const {
            return const_cast<EnumArray*>(this)->at(key);
        }

        constexpr auto begin() noexcept { return values.begin(); }
        constexpr auto end() noexcept { return values.end(); }
        constexpr auto begin() const noexcept { return values.begin(); }
        constexpr auto end() const noexcept { return values.end(); }

        [[nodiscard]] static constexpr std::size_t size() noexcept { return enum_size_v<Enum>; }

        friend constexpr bool operator==(const EnumArray&, const EnumArray&) = default;
    };

} // namespace mealplan
