#pragma once
/*
===============================================================================
NAMING — Symbolic names for solver variables and constraints
===============================================================================

OVERVIEW
--------
Gurobi accepts an optional name per variable and constraint. Names make LP
exports, IIS reports and solver logs readable but cost memory and time on
large models, so they are produced only in debug builds by default.

KEY COMPONENTS
--------------
• namingEnabled()      — compile-time switch (MEALPLAN_DEBUG or _DEBUG)
• force_name::         — always produces a name (diagnostics, tests)
• make_name::          — same functions, empty string in release builds

CONVENTIONS
-----------
    x[r12,d3,lunch]        recipe 12 fills lunch on day 3
    y[r12,d3,lunch]        recipe 12 fills lunch on days 2 and 3
    fill[d3,lunch]         slot-fill row
    min_protein_g[d3]      daily nutrient lower bound
    max_calories[d3]       daily nutrient upper bound
    cap[r12]               horizon-wide repeat cap
    and[r12,d3,lunch,1]    second row of a repeat linearization triple

THREAD SAFETY
-------------
• All functions are pure and safe for concurrent calls

===============================================================================
*/

#include <format>
#include <string>
#include <string_view>

#include "formulation.h"
#include "recipe.h"

#if defined(MEALPLAN_DEBUG) || defined(_DEBUG)
inline constexpr bool MEALPLAN_DEBUG_NAMES = true;
#else
inline constexpr bool MEALPLAN_DEBUG_NAMES = false;
#endif

namespace mealplan {

    /// @brief True in debug builds (MEALPLAN_DEBUG or _DEBUG defined)
    [[nodiscard]] constexpr bool namingEnabled() noexcept {
        return MEALPLAN_DEBUG_NAMES;
    }

    namespace force_name {

        /// @brief "x[r12,d3,lunch]" or "y[...]" for a variable spec
        inline std::string variable(const VariableSpec& spec) {
            const char* base = spec.kind == VarKind::Assignment ? "x" : "y";
            return std::format("{}[r{},d{},{}]", base, spec.key.recipe, spec.key.day,
                mealTypeName(slotMealType(spec.key.slot)));
        }

        /// @brief Row name following the conventions above
        inline std::string row(const LinearRow& r) {
            switch (r.kind) {
                case RowKind::SlotFill:
                    return std::format("fill[d{},{}]", r.day, mealTypeName(slotMealType(r.slot)));
                case RowKind::NutrientMin:
                    return std::format("min_{}[d{}]", nutrientName(r.nutrient), r.day);
                case RowKind::NutrientMax:
                    return std::format("max_{}[d{}]", nutrientName(r.nutrient), r.day);
                case RowKind::RepeatCap:
                    return std::format("cap[r{}]", r.recipe);
                case RowKind::RepeatAnd:
                    return std::format("and[r{},d{},{},{}]", r.recipe, r.day,
                        mealTypeName(slotMealType(r.slot)), r.part);
                case RowKind::COUNT:
                    break;
            }
            return "row";
        }

    } // namespace force_name

    namespace make_name {

        inline std::string variable(const VariableSpec& spec) {
            if (!namingEnabled()) return {};
            return force_name::variable(spec);
        }

        inline std::string row(const LinearRow& r) {
            if (!namingEnabled()) return {};
            return force_name::row(r);
        }

    } // namespace make_name

} // namespace mealplan
