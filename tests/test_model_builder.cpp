/*
===============================================================================
TEST MODEL BUILDER — Tests for model_builder.h, variables.h, constraints.h
===============================================================================

OVERVIEW
--------
Validates the ModelBuilder lifecycle and the containers it fills: hook
order, lazy initialization, named parameter setters with tracking,
SolverSettings validation, keyed variable and constraint registries and the
status helpers after a solve.

TEST ORGANIZATION
-----------------
• Section A: Orchestration and lifecycle
• Section B: Lazy initialization
• Section C: Parameters and SolverSettings
• Section D: Variable and constraint registries
• Section E: Solution diagnostics

TEST STRATEGY
-------------
• A one-day, three-slot formulation is loaded by a minimal builder that
  counts hook invocations and sets an explicit objective
• Gurobi output is silenced in configureEnvironment()

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• model_builder.h - System under test
• formulation.h - Formulation loaded into the builder
• Gurobi C++ API - Solver backend

===============================================================================
*/

#include <limits>
#include <stdexcept>
#include <utility>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <mealplan/formulation.h>
#include <mealplan/model_builder.h>

#include "fixtures.h"

using namespace mealplan;
using namespace mealplan::testing;

// ============================================================================
// TEST UTILITIES AND FIXTURES
// ============================================================================

MEALPLAN_DECLARE_ENUM_WITH_COUNT(TinyVars, Assign);

namespace {

    /// @brief One day: recipes 1 and 2 for breakfast, 3 for lunch, 4 for dinner
    PlanningProblem tinyProblem() {
        PlanRequest req;
        req.horizonDays = 1;
        req.recipes = { makeRecipe(1, 400, 20, { MealType::Breakfast }),
                        makeRecipe(2, 450, 25, { MealType::Breakfast }),
                        makeRecipe(3, 600, 40, { MealType::Lunch }),
                        makeRecipe(4, 700, 45, { MealType::Dinner }) };
        return PlanningProblem::create(req);
    }

} // namespace

/**
 * @class TinyBuilder
 * @brief Loads a Formulation and tracks hook invocations
 *
 * @details Objective 2·x1 + x2 + x3 + x4, so breakfast picks recipe 2 and
 *          the optimum is 3.
 */
class TinyBuilder : public ModelBuilder<TinyVars, RowKind>
{
public:
    explicit TinyBuilder(const Formulation& f) : f_(f) {}

    std::vector<int> order;

    void configureEnvironment(GRBEnv& env) override
    {
        order.push_back(0);
        env.set(GRB_IntParam_OutputFlag, 0);
    }

    void addVariables() override
    {
        order.push_back(1);
        variables().set(TinyVars::Assign,
            VariableFactory::addBinaries(model(), f_, VarKind::Assignment));
        byIndex_.resize(f_.variables().size());
        for (const auto& e : variables().get(TinyVars::Assign)) byIndex_[e.index] = e.var;
    }

    void addConstraints() override
    {
        order.push_back(2);
        ConstraintFactory::addAll(model(), f_, byIndex_, constraints());
    }

    void addParameters() override
    {
        order.push_back(3);
        threads(1);
        timeLimit(10.0);
    }

    void addObjective() override
    {
        order.push_back(4);
        const auto& X = variables().get(TinyVars::Assign);
        minimize(2.0 * X({ 1, 0, 0 }) + X({ 2, 0, 0 }) + X({ 3, 0, 1 }) + X({ 4, 0, 2 }));
    }

    void beforeOptimize() override { order.push_back(5); }
    void afterOptimize() override { order.push_back(6); }

private:
    const Formulation& f_;
    std::vector<GRBVar> byIndex_;
};

// ============================================================================
// SECTION A: ORCHESTRATION
// ============================================================================

/**
 * @test OrchestrationOrder::HookInvocation
 * @brief Verifies template method hooks are called in the documented order
 *
 * @scenario optimize() drives a fresh builder
 * @given A TinyBuilder recording each hook
 * @when Calling optimize()
 * @then Environment, variables, constraints, parameters, objective,
 *       beforeOptimize and afterOptimize run once each, in that order
 *
 * @covers ModelBuilder::optimize()
 */
TEST_CASE("A1: OrchestrationOrder::HookInvocation", "[ModelBuilder][orchestration]")
{
    auto problem = tinyProblem();
    Formulation f = FormulationBuilder(problem).build();
    TinyBuilder b(f);

    b.optimize();

    REQUIRE(b.order == std::vector<int>{ 0, 1, 2, 3, 4, 5, 6 });
}

// ============================================================================
// SECTION B: LAZY INITIALIZATION
// ============================================================================

/**
 * @test LazyInitialization::ModelAccessTriggersInit
 */
TEST_CASE("B1: LazyInitialization::ModelAccessTriggersInit", "[ModelBuilder][initialization]")
{
    auto problem = tinyProblem();
    Formulation f = FormulationBuilder(problem).build();
    TinyBuilder b(f);

    REQUIRE_FALSE(b.initialized());
    const TinyBuilder& cb = b;
    REQUIRE_THROWS_AS(cb.model(), std::logic_error);

    (void)b.model();
    REQUIRE(b.initialized());
    REQUIRE_NOTHROW(cb.model());

    // second initialize() is a no-op
    b.initialize();
    REQUIRE(b.order == std::vector<int>{ 0 });
}

// ============================================================================
// SECTION C: PARAMETERS
// ============================================================================

/**
 * @test ParameterTracking::NamedSetters
 */
TEST_CASE("C1: ParameterTracking::NamedSetters", "[ModelBuilder][params]")
{
    auto problem = tinyProblem();
    Formulation f = FormulationBuilder(problem).build();
    TinyBuilder b(f);

    b.timeLimit(12.5);
    b.mipGapLimit(0.02);
    b.seed(7);
    b.quiet();

    const auto& p = b.parameters();
    REQUIRE(p.at("TimeLimit") == 12.5);
    REQUIRE(p.at("MIPGap") == 0.02);
    REQUIRE(p.at("Seed") == 7.0);
    REQUIRE(p.at("OutputFlag") == 0.0);
    REQUIRE(b.model().get(GRB_DoubleParam_TimeLimit) == Catch::Approx(12.5));
    REQUIRE(b.model().get(GRB_IntParam_Seed) == 7);
}

/**
 * @test ParameterTracking::ApplySettings
 */
TEST_CASE("C2: ParameterTracking::ApplySettings", "[ModelBuilder][params]")
{
    auto problem = tinyProblem();
    Formulation f = FormulationBuilder(problem).build();
    TinyBuilder b(f);

    SolverSettings s;
    s.timeLimitSeconds = 5.0;
    s.threads = 2;
    s.mipGap = 0.01;
    b.apply(s);

    const auto& p = b.parameters();
    REQUIRE(p.at("TimeLimit") == 5.0);
    REQUIRE(p.at("Threads") == 2.0);
    REQUIRE(p.at("MIPGap") == 0.01);
    REQUIRE(p.at("OutputFlag") == 0.0);
    REQUIRE(b.model().get(GRB_IntParam_Threads) == 2);
}

/**
 * @test SolverSettings::Validation
 * @brief The time limit is mandatory and must be finite and positive
 */
TEST_CASE("C3: SolverSettings::Validation", "[ModelBuilder][settings]")
{
    SolverSettings s;
    REQUIRE(s.timeLimitSeconds == 30.0);
    REQUIRE_NOTHROW(s.validate());

    SECTION("zero time limit") {
        s.timeLimitSeconds = 0.0;
        REQUIRE_THROWS_AS(s.validate(), ConfigurationError);
    }
    SECTION("infinite time limit") {
        s.timeLimitSeconds = std::numeric_limits<double>::infinity();
        REQUIRE_THROWS_AS(s.validate(), ConfigurationError);
    }
    SECTION("negative threads") {
        s.threads = -1;
        REQUIRE_THROWS_AS(s.validate(), ConfigurationError);
    }
    SECTION("negative gap") {
        s.mipGap = -0.1;
        REQUIRE_THROWS_AS(s.validate(), ConfigurationError);
    }
    SECTION("no variables allowed") {
        s.maxVariables = 0;
        REQUIRE_THROWS_AS(s.validate(), ConfigurationError);
    }
}

// ============================================================================
// SECTION D: REGISTRIES
// ============================================================================

/**
 * @test Registries::VariablesAndConstraintsByKind
 */
TEST_CASE("D1: Registries::VariablesAndConstraintsByKind", "[ModelBuilder][variables][constraints]")
{
    auto problem = tinyProblem();
    Formulation f = FormulationBuilder(problem).build();
    TinyBuilder b(f);
    b.optimize();

    const auto& X = b.variables().get(TinyVars::Assign);
    REQUIRE(X.size() == 4);
    REQUIRE(X.contains({ 2, 0, 0 }));
    REQUIRE_FALSE(X.contains({ 2, 0, 1 }));
    REQUIRE(X.tryGet({ 3, 0, 2 }) == nullptr);
    REQUIRE_THROWS_AS(X.at({ 9, 0, 0 }), std::out_of_range);
    REQUIRE(X({ 2, 0, 0 }).sameAs(X.at({ 2, 0, 0 })));
    REQUIRE(b.variables().var(TinyVars::Assign, { 2, 0, 0 }).sameAs(X.at({ 2, 0, 0 })));
    REQUIRE_THROWS_AS(b.variables().var(TinyVars::Assign, { 9, 0, 0 }), std::out_of_range);
    REQUIRE(b.variables().size() == 4);

    REQUIRE(b.constraints().get(RowKind::SlotFill).size() == 3);
    REQUIRE(b.constraints().get(RowKind::RepeatCap).size() == 4);
    REQUIRE(b.constraints().get(RowKind::RepeatAnd).empty());
    REQUIRE(b.constraints().size() == f.rows().size());
    REQUIRE(b.constraints().get(RowKind::SlotFill).rows[0] == 0);
}

/**
 * @test KeyedVariableSet::DuplicateKey
 */
TEST_CASE("D2: KeyedVariableSet::DuplicateKey", "[variables]")
{
    GRBEnv env(true);
    env.set(GRB_IntParam_OutputFlag, 0);
    env.start();
    GRBModel m(env);

    AssignmentVarSet set;
    set.add({ 1, 0, 0 }, m.addVar(0, 1, 0, GRB_BINARY), 0);
    REQUIRE_THROWS_AS(set.add({ 1, 0, 0 }, m.addVar(0, 1, 0, GRB_BINARY), 1), std::invalid_argument);

    int visited = 0;
    set.forEach([&](const GRBVar&, const AssignmentKey& k) {
        REQUIRE(k.recipe == 1);
        ++visited;
    });
    REQUIRE(visited == 1);
}

/**
 * @test ConstraintFactory::RejectsUnknownVariable
 */
TEST_CASE("D3: ConstraintFactory::RejectsUnknownVariable", "[constraints]")
{
    LinearRow row;
    row.terms = { { 3, 1.0 } };
    std::vector<GRBVar> none;
    REQUIRE_THROWS_AS(ConstraintFactory::expression(row, none), std::out_of_range);
    REQUIRE(ConstraintFactory::sense(RowSense::GreaterEqual) == GRB_GREATER_EQUAL);
}

// ============================================================================
// SECTION E: SOLUTION DIAGNOSTICS
// ============================================================================

/**
 * @test Diagnostics::OptimalTinyModel
 */
TEST_CASE("E1: Diagnostics::OptimalTinyModel", "[ModelBuilder][diagnostics]")
{
    auto problem = tinyProblem();
    Formulation f = FormulationBuilder(problem).build();
    TinyBuilder b(f);
    b.optimize();

    REQUIRE(b.isOptimal());
    REQUIRE(b.hasSolution());
    REQUIRE_FALSE(b.isInfeasible());
    REQUIRE(b.objVal() == Catch::Approx(3.0));
    REQUIRE(b.solutionCount() >= 1);
    REQUIRE(b.mipGap() <= 1e-4);
    REQUIRE(b.runtime() >= 0.0);

    const auto& X = b.variables().get(TinyVars::Assign);
    REQUIRE(value(X({ 2, 0, 0 })) == Catch::Approx(1.0));
    REQUIRE(value(X({ 1, 0, 0 })) == Catch::Approx(0.0).margin(1e-9));
}
