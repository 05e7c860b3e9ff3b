/*
===============================================================================
TEST CONSTRAINT SET — Tests for recipe.h, constraint_set.h, objective.h, problem.h
===============================================================================

OVERVIEW
--------
Validates the solver-independent input layer: candidate pool integrity,
configuration validation, admissibility and eligibility filtering, the
per-assignment objective terms and the validated PlanningProblem.

TEST ORGANIZATION
-----------------
• Section A: CandidatePool
• Section B: ConstraintSet and ObjectiveWeights validation
• Section C: Admissibility and eligibility
• Section D: ObjectiveModel
• Section E: PlanningProblem

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• constraint_set.h, objective.h, problem.h - System under test
• No solver required

===============================================================================
*/

#include <cmath>
#include <limits>
#include <stdexcept>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <mealplan/constraint_set.h>
#include <mealplan/objective.h>
#include <mealplan/problem.h>

#include "fixtures.h"

using namespace mealplan;
using namespace mealplan::testing;

// ============================================================================
// SECTION A: CANDIDATE POOL
// ============================================================================

/**
 * @test CandidatePool::PreservesInputOrder
 * @brief Iteration order equals input order; lookup by id works
 */
TEST_CASE("A1: CandidatePool::PreservesInputOrder", "[pool]")
{
    CandidatePool pool({ makeRecipe(7, 400, 30, { MealType::Lunch }),
                         makeRecipe(3, 500, 40, { MealType::Dinner }) });

    REQUIRE(pool.size() == 2);
    REQUIRE(pool[0].id == 7);
    REQUIRE(pool[1].id == 3);
    REQUIRE(pool.find(3) == &pool[1]);
    REQUIRE(pool.find(99) == nullptr);
    REQUIRE_THROWS_AS(pool.at(99), std::out_of_range);
}

/**
 * @test CandidatePool::RejectsBadRecipes
 * @brief Duplicate ids and negative nutrients are configuration errors
 */
TEST_CASE("A2: CandidatePool::RejectsBadRecipes", "[pool]")
{
    SECTION("duplicate id") {
        REQUIRE_THROWS_AS(CandidatePool({ makeRecipe(1, 400, 30, { MealType::Lunch }),
                                          makeRecipe(1, 500, 40, { MealType::Lunch }) }),
            ConfigurationError);
    }
    SECTION("negative nutrient") {
        REQUIRE_THROWS_AS(CandidatePool({ makeRecipe(1, -5, 30, { MealType::Lunch }) }),
            ConfigurationError);
    }
}

// ============================================================================
// SECTION B: VALIDATION
// ============================================================================

/**
 * @test ConstraintSet::DefaultsAreValid
 */
TEST_CASE("B1: ConstraintSet::DefaultsAreValid", "[constraints][validate]")
{
    ConstraintSet c;
    ObjectiveWeights w;
    REQUIRE(c.mealsPerDay == 3);
    REQUIRE(c.maxRecipeRepeats == 2);
    REQUIRE_NOTHROW(validate(c, w));
}

/**
 * @test ConstraintSet::RejectsMalformedBounds
 * @brief max < min, negative or infinite min and NaN are rejected
 */
TEST_CASE("B2: ConstraintSet::RejectsMalformedBounds", "[constraints][validate]")
{
    ConstraintSet c;

    SECTION("max below min") {
        c.bound(Nutrient::Calories, 2200, 1800);
        REQUIRE_THROWS_AS(c.validate(), ConfigurationError);
    }
    SECTION("negative min") {
        c.bound(Nutrient::ProteinG, -1, 100);
        REQUIRE_THROWS_AS(c.validate(), ConfigurationError);
    }
    SECTION("NaN") {
        c.bound(Nutrient::FatG, std::nan(""), 10);
        REQUIRE_THROWS_AS(c.validate(), ConfigurationError);
    }
    SECTION("infinite min") {
        c.bound(Nutrient::FiberG, std::numeric_limits<double>::infinity());
        REQUIRE_THROWS_AS(c.validate(), ConfigurationError);
    }
}

/**
 * @test ConstraintSet::MealsPerDayRange
 * @brief Slots per day must be in [1, 6]
 */
TEST_CASE("B3: ConstraintSet::MealsPerDayRange", "[constraints][validate]")
{
    ConstraintSet c;
    c.mealsPerDay = 0;
    REQUIRE_THROWS_AS(c.validate(), ConfigurationError);
    c.mealsPerDay = 7;
    REQUIRE_THROWS_AS(c.validate(), ConfigurationError);
    c.mealsPerDay = 6;
    REQUIRE_NOTHROW(c.validate());
    REQUIRE(c.slotTypes().back() == MealType::Meal5);
}

/**
 * @test ConstraintSet::RepeatCapAtLeastOne
 */
TEST_CASE("B4: ConstraintSet::RepeatCapAtLeastOne", "[constraints][validate]")
{
    ConstraintSet c;
    c.maxRecipeRepeats = 0;
    REQUIRE_THROWS_AS(c.validate(), ConfigurationError);
}

/**
 * @test ObjectiveWeights::SumTolerance
 * @brief Weights must sum to 1 within 0.01 and be non-negative
 */
TEST_CASE("B5: ObjectiveWeights::SumTolerance", "[weights][validate]")
{
    ObjectiveWeights w;

    SECTION("within tolerance") {
        w.macroDeviation = 0.405;
        REQUIRE_NOTHROW(w.validate());
    }
    SECTION("outside tolerance") {
        w.macroDeviation = 0.5;
        REQUIRE_THROWS_AS(w.validate(), ConfigurationError);
    }
    SECTION("negative weight") {
        w.macroDeviation = -0.1;
        w.inventoryUsage = 0.8;
        REQUIRE_THROWS_AS(w.validate(), ConfigurationError);
    }
}

/**
 * @test Bound::ToleranceScalesWithMagnitude
 * @brief Slack at each end is relative to that end, at least 1e-5 absolute
 */
TEST_CASE("B6: Bound::ToleranceScalesWithMagnitude", "[constraints][bound]")
{
    Bound cal{ 1800.0, 2200.0 };
    REQUIRE(cal.contains(1800.0 - 0.01));
    REQUIRE(cal.contains(2200.0 + 0.02));
    REQUIRE_FALSE(cal.contains(1800.0 - 0.05));
    REQUIRE_FALSE(cal.contains(2200.0 + 0.05));

    Bound fiber{ 0.5, 2.0 };
    REQUIRE(fiber.contains(0.5 - 5e-6));
    REQUIRE_FALSE(fiber.contains(0.5 - 1e-4));

    Bound open{ 100.0 };
    REQUIRE(open.contains(1e12));
    REQUIRE(open.relativeViolation(50.0) == Catch::Approx(0.5));
}

/**
 * @test PlanningProblem::RejectsInfiniteMinimum
 * @brief An unbounded minimum never reaches an optimizer
 */
TEST_CASE("B7: PlanningProblem::RejectsInfiniteMinimum", "[constraints][validate]")
{
    PlanRequest req = weeklyRequest();
    req.constraints.bound(Nutrient::FiberG, std::numeric_limits<double>::infinity());
    REQUIRE_THROWS_AS(PlanningProblem::create(req), ConfigurationError);
}

// ============================================================================
// SECTION C: ADMISSIBILITY AND ELIGIBILITY
// ============================================================================

/**
 * @test ConstraintSet::EligibleRecipesInPoolOrder
 * @brief Only recipes tagged for the meal type, in input order
 */
TEST_CASE("C1: ConstraintSet::EligibleRecipesInPoolOrder", "[constraints][eligibility]")
{
    CandidatePool pool({ makeRecipe(5, 400, 30, { MealType::Breakfast, MealType::Lunch }),
                         makeRecipe(2, 500, 40, { MealType::Dinner }),
                         makeRecipe(9, 600, 50, { MealType::Lunch }) });
    ConstraintSet c;

    auto lunch = c.eligibleRecipes(pool, MealType::Lunch);
    REQUIRE(lunch.size() == 2);
    REQUIRE(lunch[0]->id == 5);
    REQUIRE(lunch[1]->id == 9);

    REQUIRE(c.eligibleRecipes(pool, MealType::Snack).empty());
}

/**
 * @test ConstraintSet::AdmitsByTimeAndTags
 * @brief Time ceiling, excluded tags and required tags filter recipes
 */
TEST_CASE("C2: ConstraintSet::AdmitsByTimeAndTags", "[constraints][admissibility]")
{
    Recipe r = makeRecipe(1, 400, 30, { MealType::Lunch });   // 30 minutes total
    r.dietaryTags = { "vegetarian" };
    r.allergenTags = { "nuts" };

    ConstraintSet c;
    REQUIRE(c.admits(r));

    SECTION("time ceiling") {
        c.maxTotalTimeMinutes = 25;
        REQUIRE_FALSE(c.admits(r));
        c.maxTotalTimeMinutes = 30;
        REQUIRE(c.admits(r));
    }
    SECTION("excluded allergen") {
        c.excludedTags = { "nuts" };
        REQUIRE_FALSE(c.admits(r));
    }
    SECTION("required dietary tag") {
        c.requiredDietaryTags = { "vegan" };
        REQUIRE_FALSE(c.admits(r));
        c.requiredDietaryTags = { "vegetarian" };
        REQUIRE(c.admits(r));
    }
}

// ============================================================================
// SECTION D: OBJECTIVE MODEL
// ============================================================================

/**
 * @test ObjectiveModel::CalorieTargetFromBounds
 * @brief Per-meal target is the midpoint of the daily range over the slot count
 */
TEST_CASE("D1: ObjectiveModel::CalorieTargetFromBounds", "[objective]")
{
    ConstraintSet c;
    c.bound(Nutrient::Calories, 1800, 2200);
    ObjectiveModel obj(c, ObjectiveWeights{}, ObjectiveSettings{});

    REQUIRE(obj.calorieTargetPerMeal() == Catch::Approx(2000.0 / 3.0));

    Recipe onTarget = makeRecipe(1, 2000.0 / 3.0, 30, { MealType::Lunch });
    REQUIRE(obj.macroDeviation(onTarget) == Catch::Approx(0.0).margin(1e-12));

    Recipe huge = makeRecipe(2, 5000, 30, { MealType::Lunch });
    REQUIRE(obj.macroDeviation(huge) == Catch::Approx(1.0));
}

/**
 * @test ObjectiveModel::InventoryAndGoalTerms
 */
TEST_CASE("D2: ObjectiveModel::InventoryAndGoalTerms", "[objective]")
{
    ObjectiveSettings s;
    s.preferences.goal = "muscle_gain";
    s.preferences.inventoryItems = { 1, 2 };
    ObjectiveModel obj(ConstraintSet{}, ObjectiveWeights{}, s);

    Recipe r = makeRecipe(1, 500, 40, { MealType::Lunch });
    r.ingredientIds = { 1, 2, 3, 4 };
    r.goalTags = { "muscle_gain" };

    REQUIRE(obj.inventoryUsage(r) == Catch::Approx(0.5));
    REQUIRE(obj.goalAlignment(r) == Catch::Approx(0.0));
    // no calorie bound: macro term is 0
    REQUIRE(obj.assignmentCost(r) == Catch::Approx(0.3 * 0.5));
    REQUIRE(obj.scaledAssignmentCost(r) == Catch::Approx(0.01 * 0.3 * 0.5));
}

/**
 * @test ObjectiveModel::VarietyCost
 */
TEST_CASE("D3: ObjectiveModel::VarietyCost", "[objective]")
{
    ObjectiveModel obj(ConstraintSet{}, ObjectiveWeights{}, ObjectiveSettings{});
    REQUIRE(obj.varietyCost(21, 21) == Catch::Approx(0.0));
    REQUIRE(obj.varietyCost(1, 4) == Catch::Approx(0.2 * 0.75));
    REQUIRE(obj.varietyCost(0, 0) == 0.0);
}

// ============================================================================
// SECTION E: PLANNING PROBLEM
// ============================================================================

/**
 * @test PlanningProblem::HorizonRange
 */
TEST_CASE("E1: PlanningProblem::HorizonRange", "[problem]")
{
    PlanRequest req = weeklyRequest();

    req.horizonDays = 0;
    REQUIRE_THROWS_AS(PlanningProblem::create(req), ConfigurationError);
    req.horizonDays = 15;
    REQUIRE_THROWS_AS(PlanningProblem::create(req), ConfigurationError);
    req.horizonDays = 14;
    REQUIRE_NOTHROW(PlanningProblem::create(req));
}

/**
 * @test PlanningProblem::FiltersInadmissibleRecipes
 */
TEST_CASE("E2: PlanningProblem::FiltersInadmissibleRecipes", "[problem]")
{
    PlanRequest req = weeklyRequest();
    req.recipes[0].allergenTags = { "shellfish" };
    req.constraints.excludedTags = { "shellfish" };

    auto problem = PlanningProblem::create(req);
    REQUIRE(problem.pool().size() == 11);
    REQUIRE(problem.pool().find(1) == nullptr);
    REQUIRE(problem.eligible(0).size() == 11);
    REQUIRE(problem.slotCount() == 21);
}

/**
 * @test PlanningProblem::RequireFillableNamesSlot
 * @brief A slot type with no eligible recipe is reported with its slot
 */
TEST_CASE("E3: PlanningProblem::RequireFillableNamesSlot", "[problem][infeasibility]")
{
    PlanRequest req;
    req.horizonDays = 3;
    req.recipes = { makeRecipe(1, 500, 30, { MealType::Breakfast }),
                    makeRecipe(2, 600, 40, { MealType::Lunch }) };
    req.constraints.mealsPerDay = 3;

    auto problem = PlanningProblem::create(req);
    try {
        problem.requireFillable();
        FAIL("expected StructuralInfeasibility");
    } catch (const StructuralInfeasibility& e) {
        REQUIRE(e.slot() == 2);
        REQUIRE(e.day() == 0);
        REQUIRE(e.mealType() == "dinner");
        REQUIRE(e.kind() == FailureKind::StructuralInfeasibility);
    }
}
