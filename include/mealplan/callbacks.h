#pragma once
/*
===============================================================================
CALLBACKS — MIP progress reporting during the exact solve
===============================================================================

Overview
--------
Gurobi calls back into user code while branch-and-bound runs. MIPCallback
turns the `where`-based dispatch into named virtual methods; the planner's
SolveLogger forwards new incumbents and periodic progress to a Logger.

Key Components
--------------
• Progress     — runtime, incumbent, bound, gap, node and solution counts
• MIPCallback  — base class: onIncumbent(), onProgress()
• SolveLogger  — logs each incumbent and, at most every N seconds, progress

Typical Usage
-------------
    SolveLogger cb(logger, 5.0);
    model.setCallback(&cb);
    model.optimize();
    std::cout << cb.incumbents() << " incumbents\n";

Thread Safety
-------------
Gurobi invokes the callback from the thread that called optimize().

Exception Safety
----------------
A std::exception escaping a handler is rethrown as GRBException with
GRB_ERROR_CALLBACK, which aborts the solve and surfaces from optimize().

===============================================================================
*/

#include <cmath>
#include <exception>
#include <string>

#include "gurobi_c++.h"

#include "logging.h"

namespace mealplan {

// =============================================================================
// PROGRESS STRUCT
// =============================================================================

struct Progress {
    double runtime = 0.0;
    double bestObj = GRB_INFINITY;
    double bestBound = -GRB_INFINITY;
    double gap = GRB_INFINITY;         ///< relative MIP gap, 0 = proven optimal
    int nodeCount = 0;
    int solutionCount = 0;

    bool hasSolution() const noexcept {
        return solutionCount > 0;
    }
};

// =============================================================================
// MIP CALLBACK BASE CLASS
// =============================================================================

class MIPCallback : public GRBCallback {
public:
    virtual ~MIPCallback() = default;

protected:
    /// @brief New incumbent found (GRB_CB_MIPSOL)
    virtual void onIncumbent(const Progress& p) {}

    /// @brief Periodic MIP progress (GRB_CB_MIP)
    virtual void onProgress(const Progress& p) {}

private:
    Progress mipProgress() {
        Progress p;
        p.runtime = getDoubleInfo(GRB_CB_RUNTIME);
        p.bestObj = getDoubleInfo(GRB_CB_MIP_OBJBST);
        p.bestBound = getDoubleInfo(GRB_CB_MIP_OBJBND);
        p.nodeCount = static_cast<int>(getDoubleInfo(GRB_CB_MIP_NODCNT));
        p.solutionCount = getIntInfo(GRB_CB_MIP_SOLCNT);
        fillGap(p);
        return p;
    }

    Progress incumbentProgress() {
        Progress p;
        p.runtime = getDoubleInfo(GRB_CB_RUNTIME);
        p.bestObj = getDoubleInfo(GRB_CB_MIPSOL_OBJBST);
        p.bestBound = getDoubleInfo(GRB_CB_MIPSOL_OBJBND);
        p.nodeCount = static_cast<int>(getDoubleInfo(GRB_CB_MIPSOL_NODCNT));
        p.solutionCount = getIntInfo(GRB_CB_MIPSOL_SOLCNT);
        fillGap(p);
        return p;
    }

    static void fillGap(Progress& p) noexcept {
        if (p.solutionCount > 0 && std::abs(p.bestObj) > 1e-10) {
            p.gap = std::abs(p.bestObj - p.bestBound) / std::abs(p.bestObj);
        } else if (p.solutionCount > 0 && std::abs(p.bestObj - p.bestBound) <= 1e-10) {
            p.gap = 0.0;
        }
    }

    void callback() override {
        try {
            switch (where) {
                case GRB_CB_MIPSOL:
                    onIncumbent(incumbentProgress());
                    break;
                case GRB_CB_MIP:
                    onProgress(mipProgress());
                    break;
                default:
                    break;
            }
        } catch (GRBException&) {
            throw;
        } catch (std::exception& e) {
            throw GRBException(e.what(), GRB_ERROR_CALLBACK);
        }
    }
};

// =============================================================================
// SOLVE LOGGER
// =============================================================================

/**
 * @brief Forwards solver progress to a Logger
 *
 * @details Every incumbent is logged at Info. Progress lines are logged at
 *          Debug and throttled to one per interval seconds.
 */
class SolveLogger : public MIPCallback {
public:
    SolveLogger(Logger log, double intervalSeconds)
        : log_(log), interval_(intervalSeconds)
    {
    }

    int incumbents() const noexcept { return incumbents_; }
    const Progress& last() const noexcept { return last_; }

protected:
    void onIncumbent(const Progress& p) override {
        ++incumbents_;
        last_ = p;
        log_.info("incumbent #{}: obj {:.4f}, bound {:.4f}, {:.2f}s",
            incumbents_, p.bestObj, p.bestBound, p.runtime);
    }

    void onProgress(const Progress& p) override {
        last_ = p;
        if (p.runtime < nextReport_) return;
        nextReport_ = p.runtime + interval_;
        if (p.hasSolution()) {
            log_.debug("progress: {} nodes, gap {:.2f}%, {:.2f}s", p.nodeCount, 100.0 * p.gap, p.runtime);
        } else {
            log_.debug("progress: {} nodes, no incumbent, {:.2f}s", p.nodeCount, p.runtime);
        }
    }

private:
    Logger log_;
    double interval_;
    double nextReport_ = 0.0;
    int incumbents_ = 0;
    Progress last_;
};

} // namespace mealplan
