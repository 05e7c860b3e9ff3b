#pragma once
/*
===============================================================================
PLAN ASSEMBLER — From raw optimizer output to a checked MealPlan
===============================================================================

OVERVIEW
--------
Both optimizers hand back a [day][slot] grid of recipe ids. The assembler
turns it into the MealPlan returned to callers: meals keyed by meal type,
daily totals recomputed from the recipes (never trusted from a solver),
per-recipe counts, consecutive repeats and a conformance report.

CONFORMANCE REPORT
------------------
• nutrient bound violations  (day, nutrient, realized value, bound)
• repeat-cap violations      (recipe, count, cap)
• consecutive repeats        (recipe, day, slot) — informational
• ineligible assignments     (recipe, day, slot)

An empty slot is not reported: it is a StructuralInfeasibility. An id not
in the pool is an internal error (std::invalid_argument).

ROUNDING
--------
Values are kept at full precision. roundForDisplay() rounds to one decimal
for reporting only.

===============================================================================
*/

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <format>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "constraint_set.h"
#include "errors.h"
#include "problem.h"
#include "recipe.h"

namespace mealplan {

    enum class Strategy { Exact, Fallback };

    inline std::string_view strategyName(Strategy s) noexcept {
        return s == Strategy::Exact ? "milp" : "genetic";
    }

    /// @brief One-decimal rounding used when presenting values
    inline double roundForDisplay(double v) noexcept {
        return std::round(v * 10.0) / 10.0;
    }

    // ========================================================================
    // CONFORMANCE REPORT
    // ========================================================================

    struct NutrientViolation {
        int day = 0;
        Nutrient nutrient = Nutrient::Calories;
        double realized = 0.0;
        Bound bound;

        [[nodiscard]] double relative() const noexcept { return bound.relativeViolation(realized); }
        [[nodiscard]] bool belowMin() const noexcept { return realized < bound.min; }
    };

    struct RepeatCapViolation {
        RecipeId recipe = 0;
        int count = 0;
        int cap = 0;
    };

    struct SlotRef {
        RecipeId recipe = 0;
        int day = 0;
        int slot = 0;
    };

    struct ConformanceReport {
        std::vector<NutrientViolation> nutrients;
        std::vector<RepeatCapViolation> repeatCaps;
        std::vector<SlotRef> consecutiveRepeats;
        std::vector<SlotRef> ineligible;

        /// @brief No hard constraint is violated
        [[nodiscard]] bool conforms() const noexcept {
            return nutrients.empty() && repeatCaps.empty() && ineligible.empty();
        }

        /// @brief Largest relative nutrient violation, 0 when none
        [[nodiscard]] double worstRelativeViolation() const noexcept {
            double worst = 0.0;
            for (const auto& v : nutrients) worst = std::max(worst, v.relative());
            return worst;
        }
    };

    // ========================================================================
    // MEAL PLAN
    // ========================================================================

    struct DayPlan {
        int day = 0;
        std::map<MealType, RecipeId> meals;
        NutrientVector totals{};
    };

    /**
     * @struct MealPlan
     * @brief Final plan with recomputed totals and its conformance report
     */
    struct MealPlan {
        Strategy strategy = Strategy::Exact;
        int mealsPerDay = 0;
        std::vector<DayPlan> days;
        std::map<RecipeId, int> recipeCounts;
        int consecutiveRepeats = 0;
        ConformanceReport report;
        std::vector<std::string> warnings;

        [[nodiscard]] int horizonDays() const noexcept { return static_cast<int>(days.size()); }

        /// @throws std::out_of_range
        [[nodiscard]] RecipeId recipeAt(int day, MealType meal) const {
            return days.at(static_cast<std::size_t>(day)).meals.at(meal);
        }

        [[nodiscard]] int distinctRecipes() const noexcept { return static_cast<int>(recipeCounts.size()); }
    };

    // ========================================================================
    // ASSEMBLER
    // ========================================================================

    /**
     * @class PlanAssembler
     * @brief Normalizes and checks an optimizer's assignment grid
     */
    class PlanAssembler {
    public:
        explicit PlanAssembler(const PlanningProblem& problem)
            : problem_(problem)
        {
        }

        /**
         * @throws StructuralInfeasibility on an empty slot
         * @throws std::invalid_argument   on a malformed grid or unknown recipe id
         */
        [[nodiscard]] MealPlan assemble(const RawAssignment& raw, Strategy strategy) const {
            checkShape(raw);

            const auto& pool = problem_.pool();
            const auto& constraints = problem_.constraints();

            MealPlan plan;
            plan.strategy = strategy;
            plan.mealsPerDay = problem_.mealsPerDay();

            for (int d = 0; d < problem_.horizonDays(); ++d) {
                DayPlan day;
                day.day = d;
                for (int s = 0; s < problem_.mealsPerDay(); ++s) {
                    const auto& cell = raw[static_cast<std::size_t>(d)][static_cast<std::size_t>(s)];
                    MealType type = problem_.slotType(s);
                    if (!cell) {
                        throw StructuralInfeasibility(d, s, mealTypeName(type));
                    }
                    const Recipe* r = pool.find(*cell);
                    if (!r) {
                        throw std::invalid_argument(std::format(
                            "PlanAssembler: recipe {} at day {} slot {} is not in the pool", *cell, d, s));
                    }
                    if (!r->eligibleFor(type)) {
                        plan.report.ineligible.push_back({ r->id, d, s });
                    }
                    day.meals[type] = r->id;
                    day.totals += r->perServing;
                    plan.recipeCounts[r->id] += 1;

                    if (d > 0 && raw[static_cast<std::size_t>(d - 1)][static_cast<std::size_t>(s)] == cell) {
                        plan.report.consecutiveRepeats.push_back({ r->id, d, s });
                    }
                }

                forEachEnum<Nutrient>([&](Nutrient n) {
                    const Bound& b = constraints.daily[n];
                    if (!b.contains(day.totals[n])) {
                        plan.report.nutrients.push_back({ d, n, day.totals[n], b });
                    }
                });
                plan.days.push_back(std::move(day));
            }

            for (const auto& [id, count] : plan.recipeCounts) {
                if (count > constraints.maxRecipeRepeats) {
                    plan.report.repeatCaps.push_back({ id, count, constraints.maxRecipeRepeats });
                }
            }
            plan.consecutiveRepeats = static_cast<int>(plan.report.consecutiveRepeats.size());
            plan.warnings = describe(plan.report);
            return plan;
        }

        /// @brief One human-readable line per hard-constraint violation
        [[nodiscard]] static std::vector<std::string> describe(const ConformanceReport& report) {
            std::vector<std::string> out;
            for (const auto& v : report.nutrients) {
                out.push_back(std::format("day {}: {} {} {} {} {}",
                    v.day, nutrientName(v.nutrient), roundForDisplay(v.realized),
                    v.belowMin() ? "below" : "above",
                    v.belowMin() ? "minimum" : "maximum",
                    roundForDisplay(v.belowMin() ? v.bound.min : v.bound.max)));
            }
            for (const auto& v : report.repeatCaps) {
                out.push_back(std::format("recipe {} used {} times (cap {})", v.recipe, v.count, v.cap));
            }
            for (const auto& v : report.ineligible) {
                out.push_back(std::format("recipe {} is not a {} recipe (day {})",
                    v.recipe, mealTypeName(slotMealType(v.slot)), v.day));
            }
            return out;
        }

    private:
        void checkShape(const RawAssignment& raw) const {
            if (raw.size() != static_cast<std::size_t>(problem_.horizonDays())) {
                throw std::invalid_argument(std::format(
                    "PlanAssembler: {} days in assignment, expected {}", raw.size(), problem_.horizonDays()));
            }
            for (std::size_t d = 0; d < raw.size(); ++d) {
                if (raw[d].size() != static_cast<std::size_t>(problem_.mealsPerDay())) {
                    throw std::invalid_argument(std::format(
                        "PlanAssembler: day {} has {} slots, expected {}", d, raw[d].size(), problem_.mealsPerDay()));
                }
            }
        }

        const PlanningProblem& problem_;
    };

} // namespace mealplan
