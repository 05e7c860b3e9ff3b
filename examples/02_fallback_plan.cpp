/*
================================================================================
EXAMPLE 02: FALLBACK PLAN - When the exact model has no answer
================================================================================
DIFFICULTY: Intermediate
PROBLEM TYPE: MILP + Genetic Algorithm

PROBLEM DESCRIPTION
-------------------
A high-protein weekend: 2 days, 3 meals, at least 245 g of protein a day.
The best three recipes only reach 240 g, so the MILP is infeasible. The
planner falls back to the seeded genetic search, which always fills every
slot and reports how far each day misses its bounds.

Run twice with the same seed and the plans are identical.

FEATURES DEMONSTRATED
---------------------
- SolverSettings::explainInfeasibility   IIS of the infeasible model
- ExactOptimizer                         Exact path used directly
- GeneticSettings                        Population, generations, seed
- ConformanceReport                      Violations behind each warning
- MealPlanner::complete()                Fallback from a caller-run exact path
- PlanDiagnostics::trace                 Visited planner states

================================================================================
*/

#include <iomanip>
#include <iostream>
#include <string>

#include <mealplan/mealplan.h>

using namespace mealplan;

int main() {
    std::cout << "================================================================\n";
    std::cout << "EXAMPLE 02: FALLBACK PLAN\n";
    std::cout << "================================================================\n\n";

    try {
        PlanRequest req;
        req.horizonDays = 2;
        for (int i = 1; i <= 12; ++i) {
            Recipe r;
            r.id = i;
            r.title = "recipe " + std::to_string(i);
            r.perServing[Nutrient::Calories] = 300.0 + 50.0 * i;
            r.perServing[Nutrient::ProteinG] = 20.0 + 5.0 * i;
            r.mealTimes = { MealType::Breakfast, MealType::Lunch, MealType::Dinner };
            req.recipes.push_back(r);
        }
        req.constraints.bound(Nutrient::ProteinG, 245.0);

        // Exact path alone, with an IIS of the failing rows
        Logger log(std::clog, LogLevel::Warn);
        SolverSettings solver;
        solver.timeLimitSeconds = 10.0;
        solver.explainInfeasibility = true;

        auto problem = PlanningProblem::create(req);
        ExactResult exact = ExactOptimizer(solver, log).solve(problem);
        std::cout << "Exact outcome: " << solveOutcomeName(exact.outcome)
                  << " (" << exact.statusName() << "), "
                  << exact.conflict.size() << " rows in the infeasible subsystem\n\n";

        // Hand the exact result to the planner for the fallback
        PlannerConfig cfg;
        cfg.solver = solver;
        cfg.genetic.populationSize = 60;
        cfg.genetic.generations = 150;
        cfg.genetic.seed = 7;

        PlanResult result = MealPlanner(cfg, log).complete(problem, exact);

        std::cout << "Trace:";
        for (PlannerState s : result.diagnostics.trace) {
            std::cout << " " << plannerStateName(s);
        }
        std::cout << "\n";

        if (!result.ok()) {
            std::cerr << failureKindName(result.failure->kind) << ": "
                      << result.failure->message << "\n";
            return 1;
        }

        const MealPlan& plan = *result.plan;
        std::cout << "Strategy: " << strategyName(plan.strategy)
                  << " after " << result.diagnostics.geneticGenerations.value_or(0)
                  << " generations\n\n";

        std::cout << std::fixed << std::setprecision(1);
        for (const auto& day : plan.days) {
            std::cout << "Day " << day.day + 1 << ":";
            for (const auto& [meal, id] : day.meals) {
                std::cout << " " << mealTypeName(meal) << "=" << id;
            }
            std::cout << "  protein " << roundForDisplay(day.totals[Nutrient::ProteinG]) << " g\n";
        }

        std::cout << "\nWorst relative violation: "
                  << 100.0 * plan.report.worstRelativeViolation() << "%\n";
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
