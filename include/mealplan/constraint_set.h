#pragma once
/*
===============================================================================
CONSTRAINT SET — Feasibility envelope of a meal plan
===============================================================================

OVERVIEW
--------
Declarative description of what a plan must satisfy: per-day nutrient
bounds, slots per day, the horizon-wide repeat cap, a preparation-time
ceiling and tag-based exclusions. Also holds the objective weights, which
share the same validation pass.

KEY COMPONENTS
--------------
• Bound            — closed interval [min, max] on a daily nutrient total
• ConstraintSet    — bounds, slot count, repeat cap, time ceiling, tag rules
• ObjectiveWeights — macro deviation / inventory / variety / goal weights
• validate(c, w)   — full configuration check, throws ConfigurationError

ELIGIBILITY VS ADMISSIBILITY
----------------------------
A recipe is *admissible* when it passes the recipe-level rules (time
ceiling, excluded tags, required dietary tags); inadmissible recipes are
removed from the pool before any model is built. An admissible recipe is
*eligible* for a slot when its meal-time tags contain the slot's meal type.

    auto pool = constraints.admissible(rawPool);
    auto lunches = constraints.eligibleRecipes(pool, MealType::Lunch);

DEFAULTS
--------
Every nutrient starts unconstrained ([0, +inf)). Three meals per day and a
repeat cap of two match the defaults of the product's request schema.

===============================================================================
*/

#include <algorithm>
#include <cmath>
#include <format>
#include <limits>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "enum_utils.h"
#include "errors.h"
#include "recipe.h"

namespace mealplan {

    inline constexpr double kUnbounded = std::numeric_limits<double>::infinity();

    /**
     * @struct Bound
     * @brief Closed interval on a daily nutrient total
     */
    struct Bound {
        double min = 0.0;
        double max = kUnbounded;

        /// @brief True when the lower end actually restricts anything
        [[nodiscard]] bool hasMin() const noexcept { return min > 0.0; }

        /// @brief True when the upper end is finite
        [[nodiscard]] bool hasMax() const noexcept { return std::isfinite(max); }

        /// @brief Relative slack accepted at either end, Gurobi's default IntFeasTol
        static constexpr double kRelativeTolerance = 1e-5;

        /// @brief Absolute slack at an end of magnitude `end`
        [[nodiscard]] static double tolerance(double end) noexcept {
            return kRelativeTolerance * std::max(std::abs(end), 1.0);
        }

        [[nodiscard]] bool contains(double value) const noexcept {
            return value >= min - tolerance(min)
                && (!hasMax() || value <= max + tolerance(max));
        }

        /// @brief Distance outside the interval, 0 when inside
        [[nodiscard]] double violation(double value) const noexcept {
            if (value < min) return min - value;
            if (value > max) return value - max;
            return 0.0;
        }

        /// @brief violation() divided by the bound it crosses
        [[nodiscard]] double relativeViolation(double value) const noexcept {
            if (value < min) return (min - value) / std::max(min, 1.0);
            if (value > max) return (value - max) / std::max(max, 1.0);
            return 0.0;
        }
    };

    // ========================================================================
    // OBJECTIVE WEIGHTS
    // ========================================================================

    /**
     * @struct ObjectiveWeights
     * @brief Relative importance of the soft objective terms
     *
     * @details Weights bias search and ranking only. They never relax a hard
     *          constraint. They must be non-negative and sum to 1 within
     *          kSumTolerance.
     */
    struct ObjectiveWeights {
        static constexpr double kSumTolerance = 0.01;

        double macroDeviation = 0.4;
        double inventoryUsage = 0.3;
        double variety = 0.2;
        double goalAlignment = 0.1;

        [[nodiscard]] double sum() const noexcept {
            return macroDeviation + inventoryUsage + variety + goalAlignment;
        }

        /// @throws ConfigurationError on negative weights or a bad sum
        void validate() const {
            if (macroDeviation < 0.0 || inventoryUsage < 0.0 || variety < 0.0 || goalAlignment < 0.0) {
                throw ConfigurationError("objective weights must be non-negative");
            }
            if (std::abs(sum() - 1.0) > kSumTolerance) {
                throw ConfigurationError(std::format(
                    "objective weights must sum to 1.0 (got {:.4f})", sum()));
            }
        }
    };

    // ========================================================================
    // CONSTRAINT SET
    // ========================================================================

    /**
     * @struct ConstraintSet
     * @brief Hard constraints of one optimization call
     */
    struct ConstraintSet {
        EnumArray<Nutrient, Bound> daily{};
        int mealsPerDay = 3;
        int maxRecipeRepeats = 2;                      ///< across the whole horizon
        std::optional<int> maxTotalTimeMinutes;        ///< prep + cook ceiling
        std::set<std::string> excludedTags;            ///< dietary or allergen
        std::set<std::string> requiredDietaryTags;

        /// @brief Fluent setter for one nutrient's daily bound
        ConstraintSet& bound(Nutrient n, double min, double max = kUnbounded) {
            daily[n] = Bound{ min, max };
            return *this;
        }

        /**
         * @brief Check bounds, slot count and repeat cap
         * @throws ConfigurationError describing the first problem found
         */
        void validate() const {
            forEachEnum<Nutrient>([&](Nutrient n) {
                const Bound& b = daily[n];
                if (!std::isfinite(b.min)) {
                    throw ConfigurationError(std::format(
                        "{} minimum must be finite (got {})", nutrientName(n), b.min));
                }
                if (std::isnan(b.max)) {
                    throw ConfigurationError(std::format("{} maximum is NaN", nutrientName(n)));
                }
                if (b.min < 0.0) {
                    throw ConfigurationError(std::format(
                        "{} minimum must be >= 0 (got {})", nutrientName(n), b.min));
                }
                if (b.max < b.min) {
                    throw ConfigurationError(std::format(
                        "{} maximum {} is below minimum {}", nutrientName(n), b.max, b.min));
                }
            });
            if (mealsPerDay < 1 || mealsPerDay > kMaxMealsPerDay) {
                throw ConfigurationError(std::format(
                    "meals per day must be in [1, {}] (got {})", kMaxMealsPerDay, mealsPerDay));
            }
            if (maxRecipeRepeats < 1) {
                throw ConfigurationError(std::format(
                    "max recipe repeats must be >= 1 (got {})", maxRecipeRepeats));
            }
            if (maxTotalTimeMinutes && *maxTotalTimeMinutes < 0) {
                throw ConfigurationError("preparation time ceiling must be >= 0");
            }
        }

        /// @brief Meal types of the configured slots, in slot order
        [[nodiscard]] std::vector<MealType> slotTypes() const {
            std::vector<MealType> types;
            types.reserve(static_cast<std::size_t>(mealsPerDay));
            for (int s = 0; s < mealsPerDay; ++s) {
                types.push_back(slotMealType(s));
            }
            return types;
        }

        /// @brief Recipe-level rules: time ceiling, excluded and required tags
        [[nodiscard]] bool admits(const Recipe& recipe) const {
            if (maxTotalTimeMinutes && recipe.totalTimeMinutes() > *maxTotalTimeMinutes) {
                return false;
            }
            for (const auto& tag : excludedTags) {
                if (recipe.dietaryTags.contains(tag) || recipe.allergenTags.contains(tag)) {
                    return false;
                }
            }
            for (const auto& tag : requiredDietaryTags) {
                if (!recipe.dietaryTags.contains(tag)) {
                    return false;
                }
            }
            return true;
        }

        /// @brief Admissible subsequence of the pool
        [[nodiscard]] CandidatePool admissible(const CandidatePool& pool) const {
            return pool.filtered([this](const Recipe& r) { return admits(r); });
        }

        /**
         * @brief Recipes whose meal-time tags contain mealType
         * @return Pointers into pool, in pool order
         * @note Pointers are valid as long as pool is alive
         */
        [[nodiscard]] std::vector<const Recipe*> eligibleRecipes(
            const CandidatePool& pool, MealType mealType) const
        {
            std::vector<const Recipe*> out;
            for (const Recipe& r : pool) {
                if (r.eligibleFor(mealType)) {
                    out.push_back(&r);
                }
            }
            return out;
        }
    };

    /**
     * @brief Full configuration check performed before any solve
     * @throws ConfigurationError
     */
    inline void validate(const ConstraintSet& constraints, const ObjectiveWeights& weights) {
        constraints.validate();
        weights.validate();
    }

} // namespace mealplan
