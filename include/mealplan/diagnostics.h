#pragma once
/*
===============================================================================
DIAGNOSTICS — Status classification and model introspection
===============================================================================

OVERVIEW
--------
Translates Gurobi's status codes into the outcomes the planner acts on and
summarizes model size for the log.

KEY COMPONENTS
--------------
• statusString(code)        — "OPTIMAL", "TIME_LIMIT", ...
• SolveOutcome              — Solved / Infeasible / Timeout / TooLarge / Error
• classifyStatus(code, n)   — status + solution count → SolveOutcome
• ModelStatistics           — variable / constraint / non-zero counts
• modelSummary(model)       — "84 vars (84 bin), 61 constrs"
• explainInfeasibility()    — names of the rows in an IIS

OUTCOME TABLE
-------------
| Gurobi status                      | incumbent | outcome    |
|------------------------------------|-----------|------------|
| OPTIMAL                            | any       | Solved     |
| SUBOPTIMAL, SOLUTION_LIMIT         | any       | Solved     |
| TIME_LIMIT, NODE_LIMIT, INTERRUPTED| yes       | Solved     |
| TIME_LIMIT                         | no        | Timeout    |
| INFEASIBLE, INF_OR_UNBD            | -         | Infeasible |
| everything else                    | -         | Error      |

===============================================================================
*/

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "gurobi_c++.h"

namespace mealplan {

// =============================================================================
// STATUS STRING CONVERSION
// =============================================================================

/**
 * @brief Convert Gurobi status code to human-readable string
 *
 * @example
 *     log.info("status {}", statusString(model.get(GRB_IntAttr_Status)));
 */
inline std::string statusString(int status) {
    switch (status) {
        case GRB_LOADED:          return "LOADED";
        case GRB_OPTIMAL:         return "OPTIMAL";
        case GRB_INFEASIBLE:      return "INFEASIBLE";
        case GRB_INF_OR_UNBD:     return "INF_OR_UNBD";
        case GRB_UNBOUNDED:       return "UNBOUNDED";
        case GRB_CUTOFF:          return "CUTOFF";
        case GRB_ITERATION_LIMIT: return "ITERATION_LIMIT";
        case GRB_NODE_LIMIT:      return "NODE_LIMIT";
        case GRB_TIME_LIMIT:      return "TIME_LIMIT";
        case GRB_SOLUTION_LIMIT:  return "SOLUTION_LIMIT";
        case GRB_INTERRUPTED:     return "INTERRUPTED";
        case GRB_NUMERIC:         return "NUMERIC";
        case GRB_SUBOPTIMAL:      return "SUBOPTIMAL";
        case GRB_INPROGRESS:      return "INPROGRESS";
        case GRB_USER_OBJ_LIMIT:  return "USER_OBJ_LIMIT";
        default:                  return "UNKNOWN(" + std::to_string(status) + ")";
    }
}

// =============================================================================
// OUTCOME CLASSIFICATION
// =============================================================================

enum class SolveOutcome {
    NotAttempted,   ///< exact path skipped or not reached
    Solved,         ///< optimal, or feasible with an incumbent
    Infeasible,
    Timeout,        ///< time limit without incumbent
    TooLarge,       ///< variable count above SolverSettings::maxVariables
    Error           ///< GRBException or an unexpected status
};

inline std::string_view solveOutcomeName(SolveOutcome o) noexcept {
    switch (o) {
        case SolveOutcome::NotAttempted: return "not_attempted";
        case SolveOutcome::Solved:       return "solved";
        case SolveOutcome::Infeasible:   return "infeasible";
        case SolveOutcome::Timeout:      return "timeout";
        case SolveOutcome::TooLarge:     return "too_large";
        case SolveOutcome::Error:        return "error";
    }
    return "unknown";
}

/**
 * @brief Map a final Gurobi status to a planner outcome
 * @param status        GRB_IntAttr_Status after optimize()
 * @param solutionCount GRB_IntAttr_SolCount after optimize()
 */
inline SolveOutcome classifyStatus(int status, int solutionCount) noexcept {
    switch (status) {
        case GRB_OPTIMAL:
        case GRB_SUBOPTIMAL:
        case GRB_SOLUTION_LIMIT:
            return SolveOutcome::Solved;
        case GRB_TIME_LIMIT:
            return solutionCount > 0 ? SolveOutcome::Solved : SolveOutcome::Timeout;
        case GRB_NODE_LIMIT:
        case GRB_INTERRUPTED:
            return solutionCount > 0 ? SolveOutcome::Solved : SolveOutcome::Error;
        case GRB_INFEASIBLE:
        case GRB_INF_OR_UNBD:
            return SolveOutcome::Infeasible;
        default:
            return SolveOutcome::Error;
    }
}

// =============================================================================
// MODEL STATISTICS
// =============================================================================

struct ModelStatistics {
    int numVars = 0;
    int numConstrs = 0;
    int numBinary = 0;
    int numNonZeros = 0;
};

inline ModelStatistics computeStatistics(const GRBModel& model) {
    ModelStatistics stats;
    stats.numVars = model.get(GRB_IntAttr_NumVars);
    stats.numConstrs = model.get(GRB_IntAttr_NumConstrs);
    stats.numBinary = model.get(GRB_IntAttr_NumBinVars);
    stats.numNonZeros = model.get(GRB_IntAttr_NumNZs);
    return stats;
}

/// @brief Summary string like "84 vars (84 bin), 61 constrs, 420 nz"
inline std::string modelSummary(const GRBModel& model) {
    auto stats = computeStatistics(model);
    std::string result = std::to_string(stats.numVars) + " vars";
    if (stats.numBinary > 0) {
        result += " (" + std::to_string(stats.numBinary) + " bin)";
    }
    result += ", " + std::to_string(stats.numConstrs) + " constrs";
    result += ", " + std::to_string(stats.numNonZeros) + " nz";
    return result;
}

// =============================================================================
// IIS (IRREDUCIBLE INCONSISTENT SUBSYSTEM)
// =============================================================================

/**
 * @brief Names of the constraints in an IIS of an infeasible model
 *
 * @note Only meaningful when constraints carry names (MEALPLAN_DEBUG builds);
 *       unnamed constraints are reported as "R<index>"
 * @note Potentially expensive; the model must be INFEASIBLE
 */
inline std::vector<std::string> explainInfeasibility(GRBModel& model) {
    model.computeIIS();

    std::vector<std::string> names;
    int numConstrs = model.get(GRB_IntAttr_NumConstrs);
    std::unique_ptr<GRBConstr[]> constrs(model.getConstrs());
    for (int i = 0; i < numConstrs; ++i) {
        if (constrs[i].get(GRB_IntAttr_IISConstr) > 0) {
            std::string name = constrs[i].get(GRB_StringAttr_ConstrName);
            names.push_back(name.empty() ? "R" + std::to_string(i) : name);
        }
    }
    return names;
}

} // namespace mealplan
