#pragma once
/*
===============================================================================
OBJECTIVE — Soft objective terms shared by both optimizers
===============================================================================

OVERVIEW
--------
The exact optimizer minimizes consecutive-day repeats first. The weighted
preference terms ride along with a small scale factor so they only break
ties between plans with the same number of repeats. The genetic optimizer
uses the very same per-assignment costs, so both paths rank plans alike.

Per-assignment cost of recipe r (each term in [0, 1]):

    macro     |cal(r) - target| / target, target = mid(calories) / mealsPerDay
    inventory 1 - |ingredients(r) ∩ inventory| / |ingredients(r)|
    goal      0 if r carries the user's goal tag, else 1

    cost(r) = w.macro * macro + w.inventory * inventory + w.goal * goal

Plan-level variety (genetic path only; on the exact path the repeat cap and
repeat penalty play that role):

    variety = w.variety * (1 - distinct recipes / assigned slots)

A term whose input is missing (no calorie bound, empty inventory, no goal)
contributes 0.

===============================================================================
*/

#include <algorithm>
#include <cmath>
#include <set>
#include <string>

#include "constraint_set.h"
#include "errors.h"
#include "recipe.h"

namespace mealplan {

    /**
     * @struct PreferenceProfile
     * @brief User context feeding the goal and inventory terms
     */
    struct PreferenceProfile {
        std::string goal;               ///< e.g. "muscle_gain"; empty disables the term
        std::set<int> inventoryItems;   ///< item ids currently in stock
    };

    /**
     * @struct ObjectiveSettings
     * @brief Scales of the objective terms
     */
    struct ObjectiveSettings {
        double consecutiveDayPenalty = 1.0;   ///< per (recipe, slot, day) repeat
        double preferenceScale = 0.01;        ///< multiplier on weighted preference terms
        PreferenceProfile preferences;

        /// @throws ConfigurationError on negative or non-finite scales
        void validate() const {
            if (!std::isfinite(consecutiveDayPenalty) || consecutiveDayPenalty < 0.0) {
                throw ConfigurationError("consecutive-day penalty must be finite and >= 0");
            }
            if (!std::isfinite(preferenceScale) || preferenceScale < 0.0) {
                throw ConfigurationError("preference scale must be finite and >= 0");
            }
        }
    };

    /**
     * @class ObjectiveModel
     * @brief Evaluates the soft terms for recipes and plans
     */
    class ObjectiveModel {
    public:
        ObjectiveModel(const ConstraintSet& constraints,
            const ObjectiveWeights& weights,
            const ObjectiveSettings& settings)
            : weights_(weights), settings_(settings)
        {
            const Bound& cal = constraints.daily[Nutrient::Calories];
            double daily = cal.hasMax() ? 0.5 * (cal.min + cal.max) : cal.min;
            calorieTargetPerMeal_ = daily / static_cast<double>(std::max(constraints.mealsPerDay, 1));
        }

        [[nodiscard]] double calorieTargetPerMeal() const noexcept { return calorieTargetPerMeal_; }

        [[nodiscard]] double macroDeviation(const Recipe& r) const noexcept {
            if (calorieTargetPerMeal_ <= 0.0) return 0.0;
            double dev = std::abs(r.nutrient(Nutrient::Calories) - calorieTargetPerMeal_) / calorieTargetPerMeal_;
            return std::min(dev, 1.0);
        }

        [[nodiscard]] double inventoryUsage(const Recipe& r) const {
            const auto& stock = settings_.preferences.inventoryItems;
            if (stock.empty()) return 0.0;
            if (r.ingredientIds.empty()) return 1.0;
            auto covered = std::count_if(r.ingredientIds.begin(), r.ingredientIds.end(),
                [&](int item) { return stock.contains(item); });
            return 1.0 - static_cast<double>(covered) / static_cast<double>(r.ingredientIds.size());
        }

        [[nodiscard]] double goalAlignment(const Recipe& r) const {
            const auto& goal = settings_.preferences.goal;
            if (goal.empty()) return 0.0;
            return r.goalTags.contains(goal) ? 0.0 : 1.0;
        }

        /// @brief Weighted preference cost of assigning r to any slot, in [0, 1]
        [[nodiscard]] double assignmentCost(const Recipe& r) const {
            return weights_.macroDeviation * macroDeviation(r)
                + weights_.inventoryUsage * inventoryUsage(r)
                + weights_.goalAlignment * goalAlignment(r);
        }

        /// @brief assignmentCost() as it enters the objective (scaled)
        [[nodiscard]] double scaledAssignmentCost(const Recipe& r) const {
            return settings_.preferenceScale * assignmentCost(r);
        }

        /// @brief Plan-level variety term, in [0, w.variety]
        [[nodiscard]] double varietyCost(std::size_t distinct, std::size_t assigned) const noexcept {
            if (assigned == 0) return 0.0;
            return weights_.variety * (1.0 - static_cast<double>(distinct) / static_cast<double>(assigned));
        }

        [[nodiscard]] double consecutiveDayPenalty() const noexcept { return settings_.consecutiveDayPenalty; }
        [[nodiscard]] double preferenceScale() const noexcept { return settings_.preferenceScale; }
        [[nodiscard]] const ObjectiveWeights& weights() const noexcept { return weights_; }

    private:
        ObjectiveWeights weights_;
        ObjectiveSettings settings_;
        double calorieTargetPerMeal_ = 0.0;
    };

} // namespace mealplan
