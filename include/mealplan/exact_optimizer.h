#pragma once
/*
===============================================================================
EXACT OPTIMIZER — Gurobi solve of the meal-plan MILP
===============================================================================

OVERVIEW
--------
Builds the Formulation (formulation.h), loads it into a MealPlanModel and
solves it under a mandatory time limit. The result carries the assignment
grid when the solve produced an incumbent, and otherwise only the outcome
that tells the planner why the fallback is needed.

    ExactOptimizer exact(settings, logger);
    ExactResult r = exact.solve(problem);      // may throw StructuralInfeasibility
    if (r.solved()) { use(r.assignment); }

OUTCOMES
--------
• Solved      optimal, or feasible when the limit hit with an incumbent
• Infeasible  Gurobi proved infeasibility
• Timeout     time limit without incumbent
• TooLarge    formulation above SolverSettings::maxVariables, not attempted
• Error       GRBException (license, memory, numerics) or unexpected status

GRBException never escapes solve(); it is recorded in ExactResult::error.

===============================================================================
*/

#include <cstddef>
#include <format>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "gurobi_c++.h"

#include "callbacks.h"
#include "diagnostics.h"
#include "enum_utils.h"
#include "formulation.h"
#include "logging.h"
#include "model_builder.h"
#include "problem.h"

namespace mealplan {

    MEALPLAN_DECLARE_ENUM_WITH_COUNT(MealVars, Assign, Repeat);

    /**
     * @struct ExactResult
     * @brief Outcome of one exact solve
     */
    struct ExactResult {
        SolveOutcome outcome = SolveOutcome::NotAttempted;
        int status = -1;                         ///< Gurobi status, -1 if never optimized
        RawAssignment assignment;                ///< filled only when solved()
        std::map<RecipeId, int> recipeCounts;    ///< slots per recipe over the horizon
        double repeatIndicatorSum = 0.0;         ///< Σ y at the incumbent
        double objective = 0.0;
        double mipGap = 0.0;
        double runtimeSeconds = 0.0;
        std::size_t variables = 0;
        std::size_t constraints = 0;
        int incumbents = 0;
        std::string error;                       ///< GRBException text for Error
        std::vector<std::string> conflict;       ///< IIS row names when requested

        [[nodiscard]] bool solved() const noexcept { return outcome == SolveOutcome::Solved; }

        [[nodiscard]] std::string statusName() const {
            return status < 0 ? std::string("NONE") : statusString(status);
        }
    };

    /**
     * @class MealPlanModel
     * @brief ModelBuilder that loads a Formulation
     */
    class MealPlanModel : public ModelBuilder<MealVars, RowKind> {
    public:
        MealPlanModel(const Formulation& formulation, const SolverSettings& settings, const Logger& log)
            : formulation_(formulation), settings_(settings), progress_(log, settings.progressIntervalSeconds)
        {
        }

        /// @brief Solution vector indexed by VarIndex
        [[nodiscard]] std::vector<double> solution() const {
            return values(formulation_.variables().size(),
                { vars_.get(MealVars::Assign), vars_.get(MealVars::Repeat) });
        }

        [[nodiscard]] const SolveLogger& progress() const noexcept { return progress_; }

    protected:
        void configureEnvironment(GRBEnv& env) override {
            env.set(GRB_IntParam_OutputFlag, settings_.logToConsole ? 1 : 0);
        }

        void addVariables() override {
            auto& m = model();
            vars_.set(MealVars::Assign, VariableFactory::addBinaries(m, formulation_, VarKind::Assignment));
            vars_.set(MealVars::Repeat, VariableFactory::addBinaries(m, formulation_, VarKind::Repeat));

            byIndex_.resize(formulation_.variables().size());
            for (const auto& e : vars_.get(MealVars::Assign)) byIndex_[e.index] = e.var;
            for (const auto& e : vars_.get(MealVars::Repeat)) byIndex_[e.index] = e.var;
        }

        void addConstraints() override {
            ConstraintFactory::addAll(model(), formulation_, byIndex_, cons_);
        }

        void addParameters() override {
            apply(settings_);
        }

        void addObjective() override {
            minimizeLinearObjective();
        }

        void beforeOptimize() override {
            model().setCallback(&progress_);
        }

    private:
        const Formulation& formulation_;
        const SolverSettings& settings_;
        std::vector<GRBVar> byIndex_;
        SolveLogger progress_;
    };

    /**
     * @class ExactOptimizer
     * @brief Formulation → Gurobi → assignment grid
     */
    class ExactOptimizer {
    public:
        ExactOptimizer(SolverSettings settings, Logger log)
            : settings_(std::move(settings)), log_(log)
        {
        }

        [[nodiscard]] const SolverSettings& settings() const noexcept { return settings_; }

        /**
         * @brief Solve the problem exactly
         *
         * @throws ConfigurationError      invalid SolverSettings
         * @throws StructuralInfeasibility a slot has no eligible recipe
         */
        [[nodiscard]] ExactResult solve(const PlanningProblem& problem) const {
            settings_.validate();
            Formulation f = FormulationBuilder(problem).build();
            return solve(problem, f);
        }

        /// @brief Solve a prebuilt formulation of problem
        [[nodiscard]] ExactResult solve(const PlanningProblem& problem, const Formulation& f) const {
            settings_.validate();

            ExactResult result;
            result.variables = f.variables().size();
            result.constraints = f.rows().size();

            if (result.variables > settings_.maxVariables) {
                result.outcome = SolveOutcome::TooLarge;
                log_.warn("exact model too large: {} variables (limit {})",
                    result.variables, settings_.maxVariables);
                return result;
            }

            try {
                MealPlanModel m(f, settings_, log_);
                m.optimize();

                result.status = m.status();
                result.runtimeSeconds = m.runtime();
                result.incumbents = m.progress().incumbents();
                result.outcome = classifyStatus(result.status, m.solutionCount());
                log_.info("exact solve: {} in {:.2f}s ({})",
                    result.statusName(), result.runtimeSeconds, modelSummary(m.model()));

                if (result.solved()) {
                    result.objective = m.objVal();
                    result.mipGap = m.mipGap();
                    extract(problem, f, m.solution(), result);
                } else if (result.outcome == SolveOutcome::Infeasible && settings_.explainInfeasibility) {
                    result.conflict = explainInfeasibility(m.model());
                    log_.info("infeasible subsystem: {} rows", result.conflict.size());
                }
            } catch (GRBException& e) {
                result.outcome = SolveOutcome::Error;
                result.assignment.clear();
                result.recipeCounts.clear();
                result.error = std::format("Gurobi error {}: {}", e.getErrorCode(), e.getMessage());
                log_.error("exact solve failed: {}", result.error);
            }
            return result;
        }

    private:
        static void extract(const PlanningProblem& problem, const Formulation& f,
            const std::vector<double>& x, ExactResult& result)
        {
            result.assignment = problem.emptyAssignment();
            const auto& specs = f.variables();
            for (VarIndex i = 0; i < specs.size(); ++i) {
                if (x[i] <= 0.5) continue;
                const VariableSpec& spec = specs[i];
                if (spec.kind == VarKind::Repeat) {
                    result.repeatIndicatorSum += 1.0;
                    continue;
                }
                auto& cell = result.assignment.at(static_cast<std::size_t>(spec.key.day))
                                              .at(static_cast<std::size_t>(spec.key.slot));
                cell = spec.key.recipe;
                result.recipeCounts[spec.key.recipe] += 1;
            }
        }

        SolverSettings settings_;
        Logger log_;
    };

} // namespace mealplan
