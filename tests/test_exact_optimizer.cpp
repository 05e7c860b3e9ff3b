/*
===============================================================================
TEST EXACT OPTIMIZER — Tests for exact_optimizer.h
===============================================================================

OVERVIEW
--------
Solves the weekly reference problem with Gurobi and checks the plan against
the hard constraints recomputed from the recipes, then exercises the
outcomes that send the planner to the fallback: infeasible, too large and
solver errors.

TEST ORGANIZATION
-----------------
• Section A: Weekly reference problem
• Section B: Determinism
• Section C: Unsuccessful outcomes
• Section D: Settings

TEST STRATEGY
-------------
• Weekly problem: 12 recipes, calories 300 + 50i, protein 20 + 5i,
  calories [1800, 2200], protein [120, 160], 3 meals, 7 days, cap 2,
  consecutive-day penalty 1.0. A plan without consecutive repeats exists,
  so the optimum has none
• Totals are recomputed from recipes, never read from the solver

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• exact_optimizer.h - System under test
• Gurobi C++ API - Solver backend

===============================================================================
*/

#include <cstddef>
#include <map>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <mealplan/exact_optimizer.h>
#include <mealplan/logging.h>

#include "fixtures.h"

using namespace mealplan;
using namespace mealplan::testing;

// ============================================================================
// TEST UTILITIES
// ============================================================================

namespace {

    SolverSettings quickSettings() {
        SolverSettings s;
        s.timeLimitSeconds = 20.0;
        s.threads = 1;
        return s;
    }

    int countConsecutive(const RawAssignment& plan) {
        int n = 0;
        for (std::size_t d = 1; d < plan.size(); ++d)
            for (std::size_t s = 0; s < plan[d].size(); ++s)
                if (plan[d][s] == plan[d - 1][s]) ++n;
        return n;
    }

} // namespace

// ============================================================================
// SECTION A: WEEKLY REFERENCE PROBLEM
// ============================================================================

/**
 * @test ExactOptimizer::WeeklyPlanWithinBounds
 * @brief End-to-end solve of the reference week
 *
 * @scenario The MILP is feasible and small
 * @given weeklyRequest()
 * @when Solving exactly
 * @then Every slot is filled, daily calories and protein are within bounds,
 *       no recipe exceeds the cap and no recipe repeats on consecutive days
 *
 * @covers ExactOptimizer::solve()
 */
TEST_CASE("A1: ExactOptimizer::WeeklyPlanWithinBounds", "[exact][integration]")
{
    auto problem = PlanningProblem::create(weeklyRequest());
    Logger log = Logger::silent();
    ExactResult r = ExactOptimizer(quickSettings(), log).solve(problem);

    REQUIRE(r.solved());
    REQUIRE(r.statusName() == "OPTIMAL");
    REQUIRE(r.variables == 468);
    REQUIRE(r.constraints == 709);
    REQUIRE(r.assignment.size() == 7);

    std::map<RecipeId, int> counts;
    for (const auto& day : r.assignment) {
        REQUIRE(day.size() == 3);
        double cal = 0.0, protein = 0.0;
        for (const auto& slot : day) {
            REQUIRE(slot.has_value());
            const Recipe& rec = problem.pool().at(*slot);
            cal += rec.nutrient(Nutrient::Calories);
            protein += rec.nutrient(Nutrient::ProteinG);
            counts[*slot] += 1;
        }
        REQUIRE(cal >= 1800.0 - 1e-6);
        REQUIRE(cal <= 2200.0 + 1e-6);
        REQUIRE(protein >= 120.0 - 1e-6);
        REQUIRE(protein <= 160.0 + 1e-6);
    }
    for (const auto& [id, n] : counts) {
        REQUIRE(n <= 2);
    }
    REQUIRE(counts == r.recipeCounts);
    REQUIRE(countConsecutive(r.assignment) == 0);
}

/**
 * @test ExactOptimizer::RepeatIndicatorsMatchPlan
 * @brief Σ y equals the consecutive repeats counted from the plan
 *
 * @details A single recipe per slot type and cap 7 forces six repeats in
 *          each of the three slots.
 */
TEST_CASE("A2: ExactOptimizer::RepeatIndicatorsMatchPlan", "[exact][repeats]")
{
    PlanRequest req;
    req.horizonDays = 7;
    req.recipes = { makeRecipe(1, 500, 30, { MealType::Breakfast }),
                    makeRecipe(2, 700, 40, { MealType::Lunch }),
                    makeRecipe(3, 800, 50, { MealType::Dinner }),
                    makeRecipe(4, 650, 45, { MealType::Lunch }) };
    req.constraints.maxRecipeRepeats = 7;
    auto problem = PlanningProblem::create(req);

    Logger log = Logger::silent();
    ExactResult r = ExactOptimizer(quickSettings(), log).solve(problem);

    REQUIRE(r.solved());
    int repeats = countConsecutive(r.assignment);
    REQUIRE(r.repeatIndicatorSum == Catch::Approx(static_cast<double>(repeats)));
    // breakfast and dinner repeat every day; lunch alternates
    REQUIRE(repeats == 12);
    REQUIRE(r.objective == Catch::Approx(12.0).margin(0.1));
}

// ============================================================================
// SECTION B: DETERMINISM
// ============================================================================

/**
 * @test ExactOptimizer::RepeatableSolve
 * @brief Identical inputs give identical plans, or two valid ones
 */
TEST_CASE("B1: ExactOptimizer::RepeatableSolve", "[exact][determinism]")
{
    auto problem = PlanningProblem::create(weeklyRequest());
    Logger log = Logger::silent();
    ExactOptimizer opt(quickSettings(), log);

    ExactResult a = opt.solve(problem);
    ExactResult b = opt.solve(problem);

    REQUIRE(a.solved());
    REQUIRE(b.solved());
    REQUIRE(a.objective == Catch::Approx(b.objective));
    if (a.assignment != b.assignment) {
        REQUIRE(countConsecutive(a.assignment) == countConsecutive(b.assignment));
    }
}

// ============================================================================
// SECTION C: UNSUCCESSFUL OUTCOMES
// ============================================================================

/**
 * @test ExactOptimizer::InfeasibleProtein
 * @brief 245 g protein a day is above the 240 g any three recipes give
 */
TEST_CASE("C1: ExactOptimizer::InfeasibleProtein", "[exact][infeasible]")
{
    auto problem = PlanningProblem::create(unreachableProteinRequest(245.0));
    Logger log = Logger::silent();
    SolverSettings s = quickSettings();
    s.explainInfeasibility = true;

    ExactResult r = ExactOptimizer(s, log).solve(problem);

    REQUIRE(r.outcome == SolveOutcome::Infeasible);
    REQUIRE_FALSE(r.solved());
    REQUIRE(r.assignment.empty());
    REQUIRE_FALSE(r.conflict.empty());
}

/**
 * @test ExactOptimizer::TooLargeIsNotAttempted
 */
TEST_CASE("C2: ExactOptimizer::TooLargeIsNotAttempted", "[exact][limits]")
{
    auto problem = PlanningProblem::create(weeklyRequest());
    Logger log = Logger::silent();
    SolverSettings s = quickSettings();
    s.maxVariables = 10;

    ExactResult r = ExactOptimizer(s, log).solve(problem);

    REQUIRE(r.outcome == SolveOutcome::TooLarge);
    REQUIRE(r.status == -1);
    REQUIRE(r.statusName() == "NONE");
    REQUIRE(r.variables == 468);
}

/**
 * @test ExactOptimizer::SolverErrorIsRecorded
 * @brief A parameter Gurobi rejects surfaces as an Error outcome, not a throw
 */
TEST_CASE("C3: ExactOptimizer::SolverErrorIsRecorded", "[exact][errors]")
{
    auto problem = PlanningProblem::create(weeklyRequest());
    Logger log = Logger::silent();
    SolverSettings s = quickSettings();
    s.threads = 100000;

    ExactResult r;
    REQUIRE_NOTHROW(r = ExactOptimizer(s, log).solve(problem));
    REQUIRE(r.outcome == SolveOutcome::Error);
    REQUIRE_FALSE(r.error.empty());
    REQUIRE(r.assignment.empty());
}

/**
 * @test ExactOptimizer::StructuralInfeasibility
 */
TEST_CASE("C4: ExactOptimizer::StructuralInfeasibility", "[exact][infeasible]")
{
    PlanRequest req;
    req.horizonDays = 3;
    req.recipes = { makeRecipe(1, 500, 30, { MealType::Breakfast, MealType::Lunch }) };
    auto problem = PlanningProblem::create(req);
    Logger log = Logger::silent();

    REQUIRE_THROWS_AS(ExactOptimizer(quickSettings(), log).solve(problem), StructuralInfeasibility);
}

// ============================================================================
// SECTION D: SETTINGS
// ============================================================================

/**
 * @test ExactOptimizer::RejectsMissingTimeLimit
 */
TEST_CASE("D1: ExactOptimizer::RejectsMissingTimeLimit", "[exact][settings]")
{
    auto problem = PlanningProblem::create(weeklyRequest());
    Logger log = Logger::silent();
    SolverSettings s;
    s.timeLimitSeconds = -1.0;

    REQUIRE_THROWS_AS(ExactOptimizer(s, log).solve(problem), ConfigurationError);
}
