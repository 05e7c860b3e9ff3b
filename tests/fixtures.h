#pragma once
/*
===============================================================================
FIXTURES — Shared recipe catalogs and requests for the test suite
===============================================================================

OVERVIEW
--------
• ladderCatalog()   — 12 recipes, calories 300 + 50i, protein 20 + 5i,
                      all eligible for breakfast, lunch and dinner
• weeklyRequest()   — 7 days x 3 meals, calories [1800, 2200],
                      protein [120, 160], repeat cap 2, penalty 1.0
• makeRecipe()      — single recipe with explicit meal times

===============================================================================
*/

#include <initializer_list>
#include <set>
#include <string>
#include <vector>

#include <mealplan/problem.h>
#include <mealplan/recipe.h>

namespace mealplan::testing {

inline Recipe makeRecipe(RecipeId id, double calories, double protein,
    std::initializer_list<MealType> mealTimes)
{
    Recipe r;
    r.id = id;
    r.title = "recipe " + std::to_string(id);
    r.perServing[Nutrient::Calories] = calories;
    r.perServing[Nutrient::ProteinG] = protein;
    r.perServing[Nutrient::CarbsG] = calories * 0.1;
    r.perServing[Nutrient::FatG] = calories * 0.03;
    r.mealTimes = std::set<MealType>(mealTimes);
    r.prepTimeMinutes = 10;
    r.cookTimeMinutes = 20;
    return r;
}

inline std::vector<Recipe> ladderCatalog(int n = 12) {
    std::vector<Recipe> out;
    for (int i = 1; i <= n; ++i) {
        out.push_back(makeRecipe(i, 300.0 + 50.0 * i, 20.0 + 5.0 * i,
            { MealType::Breakfast, MealType::Lunch, MealType::Dinner }));
    }
    return out;
}

inline PlanRequest weeklyRequest() {
    PlanRequest req;
    req.horizonDays = 7;
    req.recipes = ladderCatalog();
    req.constraints.mealsPerDay = 3;
    req.constraints.maxRecipeRepeats = 2;
    req.constraints
        .bound(Nutrient::Calories, 1800.0, 2200.0)
        .bound(Nutrient::ProteinG, 120.0, 160.0);
    req.objective.consecutiveDayPenalty = 1.0;
    return req;
}

/// @brief Two days whose protein minimum is just out of reach (max 240/day)
inline PlanRequest unreachableProteinRequest(double proteinMin) {
    PlanRequest req;
    req.horizonDays = 2;
    req.recipes = ladderCatalog();
    req.constraints.mealsPerDay = 3;
    req.constraints.maxRecipeRepeats = 2;
    req.constraints.bound(Nutrient::ProteinG, proteinMin);
    return req;
}

} // namespace mealplan::testing
