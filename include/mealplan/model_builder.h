#pragma once
/*
===============================================================================
MODEL BUILDER — Lifecycle of one Gurobi solve
===============================================================================

Overview
--------
ModelBuilder owns the environment and model of exactly one optimization
call and drives it through a fixed sequence of hooks:

    optimize() {
        initialize();          // GRBEnv (deferred start) + GRBModel
        addVariables();
        addConstraints();
        addParameters();
        addObjective();
        beforeOptimize();
        model.optimize();
        afterOptimize();
    }

Derived builders override the hooks they need. The meal-plan model
(exact_optimizer.h) loads a Formulation in addVariables()/addConstraints()
and installs its progress callback in beforeOptimize().

Key Features
------------
1. Lazy initialization: the constructor touches no solver state; the
   environment is created and started on first use.
2. Typed registries: variables and constraints are stored in a
   VariableTable<VarEnum> and ConstraintTable<ConEnum>.
3. Named parameter setters: timeLimit(), mipGapLimit(), threads(), seed(),
   quiet(), logFile(). Every value set through them is recorded in
   parameters() for diagnostics.
4. Status helpers: status(), hasSolution(), isInfeasible(), objVal(),
   runtime(), solutionCount(), mipGap().

Configuration
-------------
SolverSettings gathers the knobs of the exact path. A solve always runs
with a finite time limit; validate() rejects anything else.

    SolverSettings s;
    s.timeLimitSeconds = 30.0;
    s.threads = 0;            // Gurobi decides
    s.logToConsole = false;
    builder.apply(s);

Design Notes
------------
* Each builder owns its own GRBEnv; builders share no state.
* initialize() runs once; optimize() can always be called directly.

===============================================================================
*/

#include <cmath>
#include <cstddef>
#include <format>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "gurobi_c++.h"

#include "constraints.h"
#include "errors.h"
#include "variables.h"

namespace mealplan {

    /**
     * @struct SolverSettings
     * @brief Configuration of the exact optimizer
     */
    struct SolverSettings {
        double timeLimitSeconds = 30.0;            ///< wall-clock bound, mandatory
        int threads = 0;                           ///< 0 = automatic
        std::optional<double> mipGap;              ///< relative gap; Gurobi default if unset
        int seed = 0;                              ///< GRB_IntParam_Seed
        bool logToConsole = false;                 ///< Gurobi's own log on stdout
        std::string logFile;                       ///< Gurobi log file, empty = none
        std::size_t maxVariables = 200000;         ///< larger models are not attempted
        bool explainInfeasibility = false;         ///< compute an IIS when infeasible
        double progressIntervalSeconds = 5.0;      ///< throttle of progress log lines

        /// @throws ConfigurationError
        void validate() const {
            if (!std::isfinite(timeLimitSeconds) || timeLimitSeconds <= 0.0) {
                throw ConfigurationError(std::format(
                    "solver time limit must be positive and finite (got {})", timeLimitSeconds));
            }
            if (threads < 0) {
                throw ConfigurationError(std::format("solver threads must be >= 0 (got {})", threads));
            }
            if (mipGap && (!std::isfinite(*mipGap) || *mipGap < 0.0)) {
                throw ConfigurationError("MIP gap must be finite and >= 0");
            }
            if (maxVariables == 0) {
                throw ConfigurationError("maxVariables must be > 0");
            }
        }
    };

    /*
    ===============================================================================
    MODEL BUILDER TEMPLATE
    ===============================================================================
    */
    template <typename VarEnum, typename ConEnum>
    class ModelBuilder {
    public:
        using VarTable = VariableTable<VarEnum>;
        using ConTable = ConstraintTable<ConEnum>;

    private:
        std::unique_ptr<GRBEnv>   env_;
        std::unique_ptr<GRBModel> model_;
        bool initialized_ = false;

    protected:
        VarTable vars_;
        ConTable cons_;
        std::map<std::string, double> params_;

    public:
        ModelBuilder() = default;
        virtual ~ModelBuilder() = default;

        ModelBuilder(const ModelBuilder&) = delete;
        ModelBuilder& operator=(const ModelBuilder&) = delete;

        // -------------------------------------------------------------------------
        // Initialization
        // -------------------------------------------------------------------------
        /**
         * @brief Create and start the environment, then the model
         *
         * @throws GRBException (e.g. no license)
         */
        void initialize()
        {
            if (initialized_)
                return;

            env_ = std::make_unique<GRBEnv>(true);  // defer license check and load
            configureEnvironment(*env_);
            env_->start();
            model_ = std::make_unique<GRBModel>(*env_);

            initialized_ = true;
        }

        // -------------------------------------------------------------------------
        // Accessors
        // -------------------------------------------------------------------------
        GRBModel& model()
        {
            if (!initialized_)
                initialize();
            return *model_;
        }

        /// @throws std::logic_error before initialize()
        const GRBModel& model() const
        {
            if (!initialized_)
                throw std::logic_error("ModelBuilder::model: not initialized");
            return *model_;
        }

        [[nodiscard]] bool initialized() const noexcept { return initialized_; }

        VarTable& variables() noexcept { return vars_; }
        const VarTable& variables() const noexcept { return vars_; }

        ConTable& constraints() noexcept { return cons_; }
        const ConTable& constraints() const noexcept { return cons_; }

        /// @brief Parameters set through the named setters, by Gurobi name
        const std::map<std::string, double>& parameters() const noexcept { return params_; }

        // -------------------------------------------------------------------------
        // Parameter Configuration
        // -------------------------------------------------------------------------

        template <typename Param, typename Val>
        void setParam(Param p, Val value)
        {
            model().set(p, value);
        }

        /// @brief Set optimization time limit in seconds
        void timeLimit(double seconds) {
            setParam(GRB_DoubleParam_TimeLimit, seconds);
            params_["TimeLimit"] = seconds;
        }

        /// @brief Set relative MIP optimality gap tolerance
        void mipGapLimit(double gap) {
            setParam(GRB_DoubleParam_MIPGap, gap);
            params_["MIPGap"] = gap;
        }

        /// @brief Set number of threads (0 = automatic)
        void threads(int n) {
            setParam(GRB_IntParam_Threads, n);
            params_["Threads"] = n;
        }

        /// @brief Set the random seed of the solver
        void seed(int s) {
            setParam(GRB_IntParam_Seed, s);
            params_["Seed"] = s;
        }

        /// @brief Suppress solver output
        void quiet() {
            setParam(GRB_IntParam_OutputFlag, 0);
            params_["OutputFlag"] = 0;
        }

        /// @brief Enable solver output
        void verbose() {
            setParam(GRB_IntParam_OutputFlag, 1);
            params_["OutputFlag"] = 1;
        }

        /// @brief Write Gurobi's log to a file
        void logFile(const std::string& path) {
            setParam(GRB_StringParam_LogFile, path);
        }

        /**
         * @brief Apply a full SolverSettings block
         * @throws ConfigurationError if the settings are invalid
         */
        void apply(const SolverSettings& s) {
            s.validate();
            if (s.logToConsole) verbose(); else quiet();
            if (!s.logFile.empty()) logFile(s.logFile);
            timeLimit(s.timeLimitSeconds);
            threads(s.threads);
            seed(s.seed);
            if (s.mipGap) mipGapLimit(*s.mipGap);
        }

        // -------------------------------------------------------------------------
        // Objective Helpers
        // -------------------------------------------------------------------------
        void minimize(const GRBLinExpr& expr) {
            model().setObjective(expr, GRB_MINIMIZE);
        }

        /// @brief Minimize the objective held in the variables' Obj attributes
        void minimizeLinearObjective() {
            model().set(GRB_IntAttr_ModelSense, GRB_MINIMIZE);
        }

        // -------------------------------------------------------------------------
        // Solution Diagnostics
        // -------------------------------------------------------------------------

        int status() const {
            return model().get(GRB_IntAttr_Status);
        }

        bool isOptimal() const {
            return status() == GRB_OPTIMAL;
        }

        /**
         * @brief Returns true if a feasible solution exists
         * @note True for OPTIMAL, SUBOPTIMAL, SOLUTION_LIMIT and limit statuses
         *       that still carry an incumbent
         */
        bool hasSolution() const {
            int s = status();
            return s == GRB_OPTIMAL ||
                   s == GRB_SUBOPTIMAL ||
                   s == GRB_SOLUTION_LIMIT ||
                   (s == GRB_TIME_LIMIT && solutionCount() > 0) ||
                   (s == GRB_NODE_LIMIT && solutionCount() > 0) ||
                   (s == GRB_INTERRUPTED && solutionCount() > 0);
        }

        bool isInfeasible() const {
            int s = status();
            return s == GRB_INFEASIBLE || s == GRB_INF_OR_UNBD;
        }

        /// @throws GRBException if no solution available
        double objVal() const {
            return model().get(GRB_DoubleAttr_ObjVal);
        }

        double mipGap() const {
            return model().get(GRB_DoubleAttr_MIPGap);
        }

        double runtime() const {
            return model().get(GRB_DoubleAttr_Runtime);
        }

        int solutionCount() const {
            return model().get(GRB_IntAttr_SolCount);
        }

        // -------------------------------------------------------------------------
        // Template-method hooks for derived classes
        // -------------------------------------------------------------------------

        /// @brief Configure environment before it starts (output, license)
        virtual void configureEnvironment(GRBEnv& env) {}

        virtual void addParameters() {}
        virtual void addVariables() {}
        virtual void addConstraints() {}
        virtual void addObjective() {}

        /// @brief Optional pre-optimization hook (warm starts, callbacks)
        virtual void beforeOptimize() {}

        /// @brief Optional post-optimization hook (solution extraction)
        virtual void afterOptimize() {}

        // -------------------------------------------------------------------------
        // Main orchestration
        // -------------------------------------------------------------------------

        GRBModel& optimize()
        {
            initialize();

            addVariables();
            addConstraints();
            addParameters();
            addObjective();

            beforeOptimize();
            model().optimize();
            afterOptimize();

            return model();
        }
    };

} // namespace mealplan
