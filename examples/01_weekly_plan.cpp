/*
================================================================================
EXAMPLE 01: WEEKLY PLAN - Exact meal planning
================================================================================
DIFFICULTY: Beginner
PROBLEM TYPE: Mixed-Integer Linear Programming (MILP)

PROBLEM DESCRIPTION
-------------------
Twelve recipes, each tagged for breakfast, lunch and/or dinner. Plan seven
days of three meals so that every day lands between 1800 and 2200 kcal and
between 120 and 160 g of protein, no recipe is served more than twice in the
week, and the same recipe is not served in the same slot on two consecutive
days unless nothing else works.

MATHEMATICAL MODEL
------------------
Sets:
    R                   Admissible recipes
    D = {0..6}          Days
    S = {0, 1, 2}       Slots (breakfast, lunch, dinner)

Variables:
    x[r,d,s] in {0,1}   Recipe r fills slot s on day d (eligible pairs only)
    y[r,d,s] in {0,1}   x[r,d-1,s] AND x[r,d,s]

Objective:
    min  penalty * sum y  +  scale * sum cost[r] * x[r,d,s]

Constraints:
    Fill[d,s]:     sum_r x[r,d,s] = 1
    Nutrient[d,n]: min[n] <= sum_{r,s} value[r,n] * x[r,d,s] <= max[n]
    Cap[r]:        sum_{d,s} x[r,d,s] <= 2
    And:           y >= x' + x - 1,  y <= x',  y <= x

FEATURES DEMONSTRATED
---------------------
- PlanRequest / ConstraintSet    Declarative input
- MealPlanner::plan()            Exact solve with genetic fallback
- PlanResult, PlanDiagnostics    Plan, state trace and solver status
- Logger                         Engine log on std::clog

================================================================================
*/

#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include <mealplan/mealplan.h>

using namespace mealplan;

// ============================================================================
// CATALOG
// ============================================================================
static std::vector<Recipe> catalog() {
    const std::vector<std::string> names = {
        "Oat porridge", "Greek yogurt bowl", "Veggie omelette", "Turkey wrap",
        "Lentil soup", "Chicken salad", "Tofu stir-fry", "Tuna pasta",
        "Bean chili", "Beef rice bowl", "Salmon quinoa", "Steak & potatoes"
    };

    std::vector<Recipe> out;
    for (int i = 1; i <= 12; ++i) {
        Recipe r;
        r.id = i;
        r.title = names[i - 1];
        r.perServing[Nutrient::Calories] = 300.0 + 50.0 * i;
        r.perServing[Nutrient::ProteinG] = 20.0 + 5.0 * i;
        r.perServing[Nutrient::CarbsG] = 40.0 + 3.0 * i;
        r.perServing[Nutrient::FatG] = 10.0 + 1.5 * i;
        r.mealTimes = { MealType::Breakfast, MealType::Lunch, MealType::Dinner };
        r.prepTimeMinutes = 10;
        r.cookTimeMinutes = 15 + i;
        out.push_back(r);
    }
    return out;
}

// ============================================================================
// MAIN
// ============================================================================
int main() {
    std::cout << "================================================================\n";
    std::cout << "EXAMPLE 01: WEEKLY PLAN\n";
    std::cout << "================================================================\n\n";

    try {
        PlanRequest req;
        req.horizonDays = 7;
        req.recipes = catalog();
        req.constraints.mealsPerDay = 3;
        req.constraints.maxRecipeRepeats = 2;
        req.constraints
            .bound(Nutrient::Calories, 1800, 2200)
            .bound(Nutrient::ProteinG, 120, 160);
        req.objective.consecutiveDayPenalty = 1.0;

        PlannerConfig cfg;
        cfg.solver.timeLimitSeconds = 30.0;

        MealPlanner planner(cfg, Logger(std::clog, LogLevel::Info));
        PlanResult result = planner.plan(req);

        if (!result.ok()) {
            std::cerr << failureKindName(result.failure->kind) << ": "
                      << result.failure->message << "\n";
            return 1;
        }

        const MealPlan& plan = *result.plan;
        const CandidatePool pool(req.recipes);

        std::cout << "Strategy: " << strategyName(plan.strategy)
                  << "   Exact status: " << result.diagnostics.exactStatus
                  << "   Runtime: " << std::fixed << std::setprecision(2)
                  << result.diagnostics.exactRuntimeSeconds << "s\n\n";

        std::cout << std::setprecision(1);
        for (const auto& day : plan.days) {
            std::cout << "Day " << day.day + 1 << "  ("
                      << roundForDisplay(day.totals[Nutrient::Calories]) << " kcal, "
                      << roundForDisplay(day.totals[Nutrient::ProteinG]) << " g protein)\n";
            for (const auto& [meal, id] : day.meals) {
                std::cout << "  " << std::setw(10) << std::left << mealTypeName(meal)
                          << std::right << pool.at(id).title << "\n";
            }
        }

        std::cout << "\nDistinct recipes:    " << plan.distinctRecipes() << "\n";
        std::cout << "Consecutive repeats: " << plan.consecutiveRepeats << "\n";
        for (const auto& w : plan.warnings) {
            std::cout << "Warning: " << w << "\n";
        }

    } catch (GRBException& e) {
        std::cerr << "Gurobi Error " << e.getErrorCode() << ": " << e.getMessage() << "\n";
        return 1;
    } catch (std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\n================================================================\n";
    return 0;
}
