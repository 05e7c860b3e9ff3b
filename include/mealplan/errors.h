#pragma once
/*
===============================================================================
ERRORS — Failure taxonomy of the meal-plan engine
===============================================================================

OVERVIEW
--------
Every failure the engine can report belongs to one FailureKind. Caller
mistakes are thrown as exceptions derived from PlanningError; the planner
(meal_planner.h) converts them into a structured failure so that callers
never receive a partial plan.

    Kind                     Raised by                 Recovery
    ----------------------   -----------------------   -------------------
    Configuration            validate(), settings      none, caller error
    StructuralInfeasibility  FormulationBuilder,       none, caller error
                             PlanAssembler
    SolverInfeasible         ExactOptimizer            fallback to GA
    SolverTimeout            ExactOptimizer            fallback to GA
    FallbackExhausted        MealPlanner               terminal

Solver-level outcomes are not thrown: ExactOptimizer returns them as values
and the planner routes them to the fallback.

EXCEPTION SAFETY
----------------
• Constructors may throw std::bad_alloc while formatting the message only

===============================================================================
*/

#include <format>
#include <stdexcept>
#include <string>
#include <string_view>

namespace mealplan {

    enum class FailureKind {
        Configuration,
        StructuralInfeasibility,
        SolverInfeasible,
        SolverTimeout,
        FallbackExhausted
    };

    inline std::string_view failureKindName(FailureKind kind) noexcept {
        switch (kind) {
            case FailureKind::Configuration:           return "ConfigurationError";
            case FailureKind::StructuralInfeasibility: return "StructuralInfeasibility";
            case FailureKind::SolverInfeasible:        return "SolverInfeasible";
            case FailureKind::SolverTimeout:           return "SolverTimeout";
            case FailureKind::FallbackExhausted:       return "FallbackExhausted";
        }
        return "Unknown";
    }

    /**
     * @class PlanningError
     * @brief Base of all engine exceptions; carries the FailureKind
     */
    class PlanningError : public std::runtime_error {
    public:
        PlanningError(FailureKind kind, const std::string& what)
            : std::runtime_error(what), kind_(kind)
        {
        }

        [[nodiscard]] FailureKind kind() const noexcept { return kind_; }

    private:
        FailureKind kind_;
    };

    /// @brief Malformed constraints, weights, settings or candidate data
    class ConfigurationError : public PlanningError {
    public:
        explicit ConfigurationError(const std::string& what)
            : PlanningError(FailureKind::Configuration, what)
        {
        }
    };

    /**
     * @class StructuralInfeasibility
     * @brief A (day, slot) pair that no candidate recipe can fill
     */
    class StructuralInfeasibility : public PlanningError {
    public:
        StructuralInfeasibility(int day, int slot, std::string_view mealType)
            : PlanningError(FailureKind::StructuralInfeasibility,
                std::format("no eligible recipe for day {} slot {} ({})", day, slot, mealType)),
            day_(day), slot_(slot), mealType_(mealType)
        {
        }

        [[nodiscard]] int day() const noexcept { return day_; }
        [[nodiscard]] int slot() const noexcept { return slot_; }
        [[nodiscard]] const std::string& mealType() const noexcept { return mealType_; }

    private:
        int day_;
        int slot_;
        std::string mealType_;
    };

    /// @brief The fallback produced nothing acceptable
    class FallbackExhausted : public PlanningError {
    public:
        explicit FallbackExhausted(const std::string& what)
            : PlanningError(FailureKind::FallbackExhausted, what)
        {
        }
    };

} // namespace mealplan
