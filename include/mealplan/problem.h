#pragma once
/*
===============================================================================
PROBLEM — Validated, immutable input of one optimization call
===============================================================================

OVERVIEW
--------
PlanRequest is what a caller fills in. PlanningProblem::create() validates it
(horizon, constraints, weights, objective scales), drops inadmissible recipes
and precomputes the eligible recipe list of every slot. Both optimizers and
the assembler read the same PlanningProblem and never modify it.

    PlanRequest req;
    req.horizonDays = 7;
    req.recipes = catalog;
    req.constraints.bound(Nutrient::Calories, 1800, 2200);

    auto problem = PlanningProblem::create(req);   // may throw ConfigurationError
    problem.requireFillable();                     // may throw StructuralInfeasibility

Eligibility depends on the slot's meal type only, so it is stored per slot
and shared by every day of the horizon.

===============================================================================
*/

#include <cstddef>
#include <format>
#include <optional>
#include <utility>
#include <vector>

#include "constraint_set.h"
#include "errors.h"
#include "objective.h"
#include "recipe.h"

namespace mealplan {

    inline constexpr int kMaxHorizonDays = 14;

    /// @brief Optimizer output: [day][slot] → recipe id, nullopt for an unfilled slot
    using RawAssignment = std::vector<std::vector<std::optional<RecipeId>>>;

    /**
     * @struct PlanRequest
     * @brief Caller-supplied inputs, unvalidated
     */
    struct PlanRequest {
        int horizonDays = 7;
        std::vector<Recipe> recipes;
        ConstraintSet constraints;
        ObjectiveWeights weights;
        ObjectiveSettings objective;
    };

    /**
     * @class PlanningProblem
     * @brief Validated request with the admissible pool and eligibility lists
     */
    class PlanningProblem {
    public:
        /**
         * @brief Validate a request and build the problem
         * @throws ConfigurationError
         */
        static PlanningProblem create(const PlanRequest& request) {
            if (request.horizonDays < 1 || request.horizonDays > kMaxHorizonDays) {
                throw ConfigurationError(std::format(
                    "horizon must be in [1, {}] days (got {})", kMaxHorizonDays, request.horizonDays));
            }
            validate(request.constraints, request.weights);
            request.objective.validate();

            CandidatePool raw(request.recipes);
            return PlanningProblem(request, request.constraints.admissible(raw));
        }

        [[nodiscard]] int horizonDays() const noexcept { return horizonDays_; }
        [[nodiscard]] int mealsPerDay() const noexcept { return constraints_.mealsPerDay; }
        [[nodiscard]] int slotCount() const noexcept { return horizonDays_ * constraints_.mealsPerDay; }
        [[nodiscard]] MealType slotType(int slot) const { return slotMealType(slot); }

        [[nodiscard]] const CandidatePool& pool() const noexcept { return pool_; }
        [[nodiscard]] const ConstraintSet& constraints() const noexcept { return constraints_; }
        [[nodiscard]] const ObjectiveModel& objective() const noexcept { return objective_; }

        /// @brief Pool indices of the recipes eligible for a slot, pool order
        [[nodiscard]] const std::vector<std::size_t>& eligible(int slot) const {
            return eligible_.at(static_cast<std::size_t>(slot));
        }

        /// @brief horizon × mealsPerDay grid of unfilled slots
        [[nodiscard]] RawAssignment emptyAssignment() const {
            return RawAssignment(static_cast<std::size_t>(horizonDays_),
                std::vector<std::optional<RecipeId>>(static_cast<std::size_t>(mealsPerDay())));
        }

        /**
         * @brief Throw for the first (day, slot) no recipe can fill
         * @throws StructuralInfeasibility
         */
        void requireFillable() const {
            for (int s = 0; s < mealsPerDay(); ++s) {
                if (eligible(s).empty()) {
                    throw StructuralInfeasibility(0, s, mealTypeName(slotType(s)));
                }
            }
        }

    private:
        PlanningProblem(const PlanRequest& request, CandidatePool pool)
            : horizonDays_(request.horizonDays),
            constraints_(request.constraints),
            pool_(std::move(pool)),
            objective_(request.constraints, request.weights, request.objective)
        {
            const Recipe* base = pool_.empty() ? nullptr : &pool_[0];
            for (MealType type : constraints_.slotTypes()) {
                std::vector<std::size_t> indices;
                for (const Recipe* r : constraints_.eligibleRecipes(pool_, type)) {
                    indices.push_back(static_cast<std::size_t>(r - base));
                }
                eligible_.push_back(std::move(indices));
            }
        }

        int horizonDays_;
        ConstraintSet constraints_;
        CandidatePool pool_;
        ObjectiveModel objective_;
        std::vector<std::vector<std::size_t>> eligible_;
    };

} // namespace mealplan
