#pragma once
/*
===============================================================================
MEAL PLANNER — One optimization call, exact first, genetic fallback
===============================================================================

OVERVIEW
--------
MealPlanner::plan() is the entry point of the engine. It validates the
request, runs the exact optimizer, falls back to the genetic optimizer when
the exact path yields nothing, assembles the plan and reports either a
MealPlan or a structured Failure. It never throws PlanningError; those are
converted into PlanResult::failure. MealPlanner::complete() picks up from an
ExactResult the caller obtained with ExactOptimizer.

With the fallback disabled, an unsolved exact path fails with SolverTimeout
(time limit, no incumbent) or SolverInfeasible (any other outcome).

STATE MACHINE
-------------
    Initialized ──► ExactAttempted ──► Assembled
         │                │
         │                └──► FallbackAttempted ──► Assembled
         │                                  └──────► Failed
         └──► Failed   (configuration or structural errors)

The visited states are recorded in PlanDiagnostics::trace.

FALLBACK ACCEPTANCE
-------------------
A genetic plan always fills every slot. Its nutrient violations become
warnings when the worst relative violation is within
PlannerConfig::fallbackViolationTolerance; beyond that the call fails with
FallbackExhausted and no partial plan is returned. Repeat-cap violations
are always warnings.

USAGE EXAMPLES
--------------
    PlannerConfig cfg;
    cfg.solver.timeLimitSeconds = 10.0;

    MealPlanner planner(cfg, Logger(std::cerr, LogLevel::Info));
    PlanResult r = planner.plan(request);
    if (r.ok()) {
        for (const auto& day : r.plan->days) { ... }
    } else {
        std::cerr << failureKindName(r.failure->kind) << ": " << r.failure->message;
    }

===============================================================================
*/

#include <cmath>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "diagnostics.h"
#include "errors.h"
#include "exact_optimizer.h"
#include "genetic_optimizer.h"
#include "logging.h"
#include "model_builder.h"
#include "plan_assembler.h"
#include "problem.h"

namespace mealplan {

    /**
     * @struct PlannerConfig
     * @brief Configuration of one planner instance
     */
    struct PlannerConfig {
        SolverSettings solver;
        GeneticSettings genetic;
        bool enableFallback = true;
        double fallbackViolationTolerance = 0.25;   ///< worst relative nutrient violation accepted

        /// @throws ConfigurationError
        void validate() const {
            solver.validate();
            genetic.validate();
            if (!std::isfinite(fallbackViolationTolerance) || fallbackViolationTolerance < 0.0) {
                throw ConfigurationError("fallback violation tolerance must be finite and >= 0");
            }
        }
    };

    enum class PlannerState { Initialized, ExactAttempted, FallbackAttempted, Assembled, Failed };

    inline std::string_view plannerStateName(PlannerState s) noexcept {
        switch (s) {
            case PlannerState::Initialized:       return "initialized";
            case PlannerState::ExactAttempted:    return "exact_attempted";
            case PlannerState::FallbackAttempted: return "fallback_attempted";
            case PlannerState::Assembled:         return "assembled";
            case PlannerState::Failed:            return "failed";
        }
        return "unknown";
    }

    /**
     * @struct Failure
     * @brief Why a call produced no plan
     */
    struct Failure {
        FailureKind kind = FailureKind::Configuration;
        std::string message;
        std::optional<int> day;
        std::optional<int> slot;
        std::optional<std::string> mealType;
    };

    struct PlanDiagnostics {
        std::vector<PlannerState> trace;
        SolveOutcome exactOutcome = SolveOutcome::NotAttempted;
        std::string exactStatus;                   ///< Gurobi status name, or "NONE"
        std::string exactError;
        double exactRuntimeSeconds = 0.0;
        double repeatIndicatorSum = 0.0;           ///< exact path only
        std::optional<int> geneticGenerations;
        std::optional<double> geneticBestCost;

        [[nodiscard]] PlannerState finalState() const noexcept {
            return trace.empty() ? PlannerState::Initialized : trace.back();
        }
    };

    /**
     * @struct PlanResult
     * @brief Either a plan or a failure, plus per-call diagnostics
     */
    struct PlanResult {
        std::optional<MealPlan> plan;
        std::optional<Failure> failure;
        PlanDiagnostics diagnostics;

        [[nodiscard]] bool ok() const noexcept { return plan.has_value(); }
    };

    /**
     * @brief Failure reported for an unsolved exact path when fallback is off
     * @note Only a timeout without incumbent maps to SolverTimeout
     */
    inline FailureKind exactFailureKind(SolveOutcome outcome) noexcept {
        return outcome == SolveOutcome::Timeout
            ? FailureKind::SolverTimeout
            : FailureKind::SolverInfeasible;
    }

    /**
     * @class MealPlanner
     * @brief Orchestrates validation, exact solve, fallback and assembly
     */
    class MealPlanner {
    public:
        explicit MealPlanner(PlannerConfig config, Logger log = Logger())
            : config_(std::move(config)), log_(log)
        {
        }

        [[nodiscard]] const PlannerConfig& config() const noexcept { return config_; }
        [[nodiscard]] const Logger& logger() const noexcept { return log_; }

        [[nodiscard]] PlanResult plan(const PlanRequest& request) const {
            return run([&](PlanResult& result) {
                PlanningProblem problem = PlanningProblem::create(request);
                problem.requireFillable();
                log_.info("planning {} days x {} meals over {} admissible recipes",
                    problem.horizonDays(), problem.mealsPerDay(), problem.pool().size());

                ExactResult exact = ExactOptimizer(config_.solver, log_).solve(problem);
                afterExact(problem, exact, result);
            });
        }

        /**
         * @brief Finish a call whose exact attempt was run by the caller
         *
         * @details Same fallback policy and result as plan(), for callers that
         *          drive ExactOptimizer themselves (e.g. to inspect the IIS).
         */
        [[nodiscard]] PlanResult complete(const PlanningProblem& problem, const ExactResult& exact) const {
            return run([&](PlanResult& result) {
                problem.requireFillable();
                afterExact(problem, exact, result);
            });
        }

    private:
        template <typename Body>
        PlanResult run(Body&& body) const {
            PlanResult result;
            auto& diag = result.diagnostics;
            diag.trace.push_back(PlannerState::Initialized);

            try {
                config_.validate();
                body(result);
            } catch (const StructuralInfeasibility& e) {
                result.failure = Failure{ e.kind(), e.what(), e.day(), e.slot(), e.mealType() };
                fail(result, diag);
            } catch (const PlanningError& e) {
                result.failure = Failure{ e.kind(), e.what(), std::nullopt, std::nullopt, std::nullopt };
                fail(result, diag);
            }
            return result;
        }

        void afterExact(const PlanningProblem& problem, const ExactResult& exact, PlanResult& result) const {
            auto& diag = result.diagnostics;
            transition(diag, PlannerState::ExactAttempted);
            diag.exactOutcome = exact.outcome;
            diag.exactStatus = exact.statusName();
            diag.exactError = exact.error;
            diag.exactRuntimeSeconds = exact.runtimeSeconds;

            PlanAssembler assembler(problem);
            if (exact.solved()) {
                diag.repeatIndicatorSum = exact.repeatIndicatorSum;
                result.plan = assembler.assemble(exact.assignment, Strategy::Exact);
                transition(diag, PlannerState::Assembled);
                return;
            }

            if (!config_.enableFallback) {
                std::string msg = std::format("exact optimizer: {} ({})",
                    solveOutcomeName(exact.outcome), exact.statusName());
                if (!exact.error.empty()) msg += ": " + exact.error;
                throw PlanningError(exactFailureKind(exact.outcome), msg);
            }

            log_.warn("exact path {} ({}), running genetic fallback",
                solveOutcomeName(exact.outcome), exact.statusName());
            GeneticResult ga = GeneticOptimizer(config_.genetic, log_).solve(problem);
            transition(diag, PlannerState::FallbackAttempted);
            diag.geneticGenerations = ga.generations;
            diag.geneticBestCost = ga.best.cost;

            MealPlan plan = assembler.assemble(ga.assignment, Strategy::Fallback);
            double worst = plan.report.worstRelativeViolation();
            if (worst > config_.fallbackViolationTolerance) {
                throw FallbackExhausted(std::format(
                    "best fallback plan misses a nutrient bound by {:.1f}% (tolerance {:.1f}%)",
                    100.0 * worst, 100.0 * config_.fallbackViolationTolerance));
            }
            for (const auto& w : plan.warnings) {
                log_.warn("fallback plan: {}", w);
            }
            result.plan = std::move(plan);
            transition(diag, PlannerState::Assembled);
        }

        void transition(PlanDiagnostics& diag, PlannerState next) const {
            log_.debug("state {} -> {}", plannerStateName(diag.finalState()), plannerStateName(next));
            diag.trace.push_back(next);
        }

        void fail(PlanResult& result, PlanDiagnostics& diag) const {
            result.plan.reset();
            log_.error("planning failed ({}): {}",
                failureKindName(result.failure->kind), result.failure->message);
            transition(diag, PlannerState::Failed);
        }

        PlannerConfig config_;
        Logger log_;
    };

} // namespace mealplan
