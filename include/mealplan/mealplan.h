#pragma once
/*
===============================================================================
MEALPLAN — Unified Include Header
===============================================================================

OVERVIEW
--------
Single include for the meal-plan optimization engine: a multi-day menu
chosen from a candidate recipe pool under daily nutrient bounds, a repeat
cap and a consecutive-day variety objective. The exact path is a Gurobi
MILP; a seeded genetic algorithm takes over when it yields no plan.

WHAT'S INCLUDED
---------------
Core (no solver dependency)
• enum_utils.h       — MEALPLAN_DECLARE_ENUM_WITH_COUNT, EnumArray
• errors.h           — PlanningError hierarchy, FailureKind
• logging.h          — Logger
• recipe.h           — Nutrient, MealType, Recipe, CandidatePool
• constraint_set.h   — Bound, ConstraintSet, ObjectiveWeights
• objective.h        — ObjectiveSettings, ObjectiveModel
• problem.h          — PlanRequest, PlanningProblem
• formulation.h      — AssignmentKey, LinearRow, booleanAnd, Formulation
• genetic_optimizer.h— GeneticSettings, GeneticOptimizer
• plan_assembler.h   — MealPlan, ConformanceReport, PlanAssembler
• naming.h           — debug names of variables and rows

Gurobi layer
• variables.h        — KeyedVariableSet, VariableFactory, VariableTable
• constraints.h      — ConstraintTable, ConstraintFactory
• model_builder.h    — SolverSettings, ModelBuilder<VarEnum, ConEnum>
• callbacks.h        — MIPCallback, SolveLogger
• diagnostics.h      — statusString, classifyStatus, modelSummary
• exact_optimizer.h  — MealPlanModel, ExactOptimizer
• meal_planner.h     — PlannerConfig, MealPlanner, PlanResult

QUICK START
-----------
    #include <mealplan/mealplan.h>

    mealplan::PlanRequest req;
    req.horizonDays = 7;
    req.recipes = loadCatalog();
    req.constraints.bound(mealplan::Nutrient::Calories, 1800, 2200)
                   .bound(mealplan::Nutrient::ProteinG, 120, 160);

    mealplan::MealPlanner planner(mealplan::PlannerConfig{});
    auto result = planner.plan(req);

REQUIREMENTS
------------
• C++20 compiler with <format>
• Gurobi Optimizer 10.0+ with C++ API

CONFIGURATION
-------------
• MEALPLAN_DEBUG or _DEBUG: human-readable Gurobi variable and row names

===============================================================================
*/

#include "enum_utils.h"
#include "errors.h"
#include "logging.h"
#include "recipe.h"
#include "constraint_set.h"
#include "objective.h"
#include "problem.h"
#include "formulation.h"
#include "genetic_optimizer.h"
#include "plan_assembler.h"
#include "naming.h"

#include "variables.h"
#include "constraints.h"
#include "model_builder.h"
#include "callbacks.h"
#include "diagnostics.h"
#include "exact_optimizer.h"
#include "meal_planner.h"
