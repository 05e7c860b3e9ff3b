#pragma once
/*
===============================================================================
FORMULATION — Solver-independent MILP of the weekly meal plan
===============================================================================

OVERVIEW
--------
The integer program is first accumulated into an immutable value object and
only then handed to a solver back end (exact_optimizer.h). If construction
fails halfway, for example on a slot nobody can fill, nothing has touched a
solver model yet.

MATHEMATICAL MODEL
------------------
Sets:
    D = {0, ..., horizon-1}         days
    S = {0, ..., mealsPerDay-1}     slots, slot s has meal type type(s)
    E(s) ⊆ R                        recipes eligible for type(s)

Variables:
    x[r,d,s] ∈ {0,1}   r ∈ E(s)           recipe r fills slot s of day d
    y[r,d,s] ∈ {0,1}   r ∈ E(s), d ≥ 1    r fills s on both d-1 and d

Objective:
    min  Σ penalty * y[r,d,s]  +  Σ pref(r) * x[r,d,s]

Constraints:
    SlotFill[d,s]:      Σ_r x[r,d,s] = 1
    NutrientMin[d,n]:   Σ_{r,s} n(r) * x[r,d,s] >= min(n)
    NutrientMax[d,n]:   Σ_{r,s} n(r) * x[r,d,s] <= max(n)
    RepeatCap[r]:       Σ_{d,s} x[r,d,s] <= maxRepeats
    RepeatAnd[r,d,s]:   y >= x[r,d-1,s] + x[r,d,s] - 1,  y <= x[r,d-1,s],  y <= x[r,d,s]

Variables exist only for eligible (recipe, slot) pairs, so an ineligible
recipe can never be chosen. They are addressed by a structured
AssignmentKey {recipe, day, slot}; names are a debugging aid only
(naming.h).

DETERMINISM
-----------
Variables are created day → slot → pool order, repeat indicators recipe →
slot → day. Identical problems produce identical formulations.

===============================================================================
*/

#include <array>
#include <compare>
#include <cstddef>
#include <functional>
#include <optional>
#include <unordered_map>
#include <vector>

#include "enum_utils.h"
#include "errors.h"
#include "problem.h"
#include "recipe.h"

namespace mealplan {

    // ========================================================================
    // KEYS AND INDICES
    // ========================================================================

    /**
     * @struct AssignmentKey
     * @brief (recipe, day, slot) triple addressing a decision or repeat variable
     */
    struct AssignmentKey {
        RecipeId recipe = 0;
        int day = 0;
        int slot = 0;

        friend auto operator<=>(const AssignmentKey&, const AssignmentKey&) = default;
    };

    struct AssignmentKeyHash {
        std::size_t operator()(const AssignmentKey& k) const noexcept {
            std::size_t h = std::hash<int>{}(k.recipe);
            h ^= std::hash<int>{}(k.day) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
            h ^= std::hash<int>{}(k.slot) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
            return h;
        }
    };

    enum class VarKind { Assignment, Repeat };

    using VarIndex = std::size_t;

    struct VariableSpec {
        VarKind kind = VarKind::Assignment;
        AssignmentKey key;
        double objective = 0.0;
    };

    // ========================================================================
    // LINEAR ROWS
    // ========================================================================

    enum class RowSense { LessEqual, GreaterEqual, Equal };

    MEALPLAN_DECLARE_ENUM_WITH_COUNT(RowKind,
        SlotFill, NutrientMin, NutrientMax, RepeatCap, RepeatAnd);

    struct LinearTerm {
        VarIndex var = 0;
        double coeff = 0.0;
    };

    /**
     * @struct LinearRow
     * @brief Σ coeff * x[var]  (sense)  rhs, plus the context it was built for
     *
     * @details day / slot / recipe / nutrient / part are only meaningful for
     *          the row kinds that use them; they feed constraint names and
     *          diagnostics.
     */
    struct LinearRow {
        RowKind kind = RowKind::SlotFill;
        std::vector<LinearTerm> terms;
        RowSense sense = RowSense::LessEqual;
        double rhs = 0.0;

        int day = -1;
        int slot = -1;
        RecipeId recipe = 0;
        Nutrient nutrient = Nutrient::Calories;
        int part = 0;   ///< 0..2 within a RepeatAnd triple

        /// @brief Left-hand side evaluated at x (indexed by VarIndex)
        [[nodiscard]] double activity(const std::vector<double>& x) const {
            double lhs = 0.0;
            for (const auto& t : terms) {
                lhs += t.coeff * x.at(t.var);
            }
            return lhs;
        }

        [[nodiscard]] bool satisfiedBy(const std::vector<double>& x, double tol = 1e-6) const {
            double lhs = activity(x);
            switch (sense) {
                case RowSense::LessEqual:    return lhs <= rhs + tol;
                case RowSense::GreaterEqual: return lhs >= rhs - tol;
                case RowSense::Equal:        return lhs >= rhs - tol && lhs <= rhs + tol;
            }
            return false;
        }
    };

    /**
     * @brief Linearization of c = a AND b over binary variables
     *
     * @return The three rows
     *             c - a - b >= -1
     *             c - a     <=  0
     *             c - b     <=  0
     *
     * @details For binary a, b, c the rows admit exactly c = a·b: if both are
     *          1 the first row forces c = 1, otherwise one of the upper rows
     *          forces c = 0.
     */
    [[nodiscard]] inline std::array<LinearRow, 3> booleanAnd(VarIndex a, VarIndex b, VarIndex c) {
        std::array<LinearRow, 3> rows;

        rows[0].terms = { {c, 1.0}, {a, -1.0}, {b, -1.0} };
        rows[0].sense = RowSense::GreaterEqual;
        rows[0].rhs = -1.0;

        rows[1].terms = { {c, 1.0}, {a, -1.0} };
        rows[1].sense = RowSense::LessEqual;
        rows[1].rhs = 0.0;

        rows[2].terms = { {c, 1.0}, {b, -1.0} };
        rows[2].sense = RowSense::LessEqual;
        rows[2].rhs = 0.0;

        for (int p = 0; p < 3; ++p) {
            rows[static_cast<std::size_t>(p)].kind = RowKind::RepeatAnd;
            rows[static_cast<std::size_t>(p)].part = p;
        }
        return rows;
    }

    // ========================================================================
    // FORMULATION
    // ========================================================================

    class FormulationBuilder;

    /**
     * @class Formulation
     * @brief Completed, read-only MILP: variables, rows and key lookup
     */
    class Formulation {
    public:
        [[nodiscard]] int horizonDays() const noexcept { return horizonDays_; }
        [[nodiscard]] int mealsPerDay() const noexcept { return mealsPerDay_; }

        [[nodiscard]] const std::vector<VariableSpec>& variables() const noexcept { return variables_; }
        [[nodiscard]] const std::vector<LinearRow>& rows() const noexcept { return rows_; }

        [[nodiscard]] std::optional<VarIndex> assignment(const AssignmentKey& key) const {
            auto it = assignIndex_.find(key);
            if (it == assignIndex_.end()) return std::nullopt;
            return it->second;
        }

        [[nodiscard]] std::optional<VarIndex> repeat(const AssignmentKey& key) const {
            auto it = repeatIndex_.find(key);
            if (it == repeatIndex_.end()) return std::nullopt;
            return it->second;
        }

        [[nodiscard]] std::size_t variableCount(VarKind kind) const noexcept {
            return kind == VarKind::Assignment ? assignIndex_.size() : repeatIndex_.size();
        }

        [[nodiscard]] std::size_t rowCount(RowKind kind) const noexcept {
            return rowCounts_[kind];
        }

        /// @brief Objective evaluated at x
        [[nodiscard]] double objectiveValue(const std::vector<double>& x) const {
            double obj = 0.0;
            for (std::size_t i = 0; i < variables_.size(); ++i) {
                obj += variables_[i].objective * x.at(i);
            }
            return obj;
        }

        /// @brief True when every row holds at x
        [[nodiscard]] bool feasible(const std::vector<double>& x, double tol = 1e-6) const {
            for (const auto& row : rows_) {
                if (!row.satisfiedBy(x, tol)) return false;
            }
            return true;
        }

    private:
        friend class FormulationBuilder;

        int horizonDays_ = 0;
        int mealsPerDay_ = 0;
        std::vector<VariableSpec> variables_;
        std::vector<LinearRow> rows_;
        std::unordered_map<AssignmentKey, VarIndex, AssignmentKeyHash> assignIndex_;
        std::unordered_map<AssignmentKey, VarIndex, AssignmentKeyHash> repeatIndex_;
        EnumArray<RowKind, std::size_t> rowCounts_{};
    };

    /**
     * @class FormulationBuilder
     * @brief Builds the Formulation of a PlanningProblem
     *
     * @example
     *     auto problem = PlanningProblem::create(request);
     *     Formulation f = FormulationBuilder(problem).build();
     *     std::cout << f.variableCount(VarKind::Assignment) << " x-variables\n";
     */
    class FormulationBuilder {
    public:
        explicit FormulationBuilder(const PlanningProblem& problem)
            : problem_(problem)
        {
        }

        /**
         * @brief Assemble variables and rows
         * @throws StructuralInfeasibility if a slot has no eligible recipe
         */
        [[nodiscard]] Formulation build() const {
            problem_.requireFillable();

            Formulation f;
            f.horizonDays_ = problem_.horizonDays();
            f.mealsPerDay_ = problem_.mealsPerDay();

            addAssignmentVariables(f);
            addSlotFillRows(f);
            addNutrientRows(f);
            addRepeatCapRows(f);
            addRepeatIndicators(f);

            return f;
        }

    private:
        void addAssignmentVariables(Formulation& f) const {
            const auto& pool = problem_.pool();
            for (int d = 0; d < problem_.horizonDays(); ++d) {
                for (int s = 0; s < problem_.mealsPerDay(); ++s) {
                    for (std::size_t idx : problem_.eligible(s)) {
                        const Recipe& r = pool[idx];
                        AssignmentKey key{ r.id, d, s };
                        f.assignIndex_.emplace(key, f.variables_.size());
                        f.variables_.push_back(VariableSpec{
                            VarKind::Assignment, key, problem_.objective().scaledAssignmentCost(r) });
                    }
                }
            }
        }

        void addSlotFillRows(Formulation& f) const {
            const auto& pool = problem_.pool();
            for (int d = 0; d < problem_.horizonDays(); ++d) {
                for (int s = 0; s < problem_.mealsPerDay(); ++s) {
                    LinearRow row;
                    row.kind = RowKind::SlotFill;
                    row.sense = RowSense::Equal;
                    row.rhs = 1.0;
                    row.day = d;
                    row.slot = s;
                    for (std::size_t idx : problem_.eligible(s)) {
                        row.terms.push_back({ *f.assignment({ pool[idx].id, d, s }), 1.0 });
                    }
                    push(f, std::move(row));
                }
            }
        }

        void addNutrientRows(Formulation& f) const {
            const auto& pool = problem_.pool();
            const auto& bounds = problem_.constraints().daily;

            for (int d = 0; d < problem_.horizonDays(); ++d) {
                forEachEnum<Nutrient>([&](Nutrient n) {
                    const Bound& b = bounds[n];
                    if (!b.hasMin() && !b.hasMax()) return;

                    std::vector<LinearTerm> terms;
                    for (int s = 0; s < problem_.mealsPerDay(); ++s) {
                        for (std::size_t idx : problem_.eligible(s)) {
                            const Recipe& r = pool[idx];
                            if (r.nutrient(n) != 0.0) {
                                terms.push_back({ *f.assignment({ r.id, d, s }), r.nutrient(n) });
                            }
                        }
                    }

                    if (b.hasMin()) {
                        push(f, nutrientRow(RowKind::NutrientMin, terms, RowSense::GreaterEqual, b.min, d, n));
                    }
                    if (b.hasMax()) {
                        push(f, nutrientRow(RowKind::NutrientMax, terms, RowSense::LessEqual, b.max, d, n));
                    }
                });
            }
        }

        void addRepeatCapRows(Formulation& f) const {
            const double cap = static_cast<double>(problem_.constraints().maxRecipeRepeats);
            for (const Recipe& r : problem_.pool()) {
                LinearRow row;
                row.kind = RowKind::RepeatCap;
                row.sense = RowSense::LessEqual;
                row.rhs = cap;
                row.recipe = r.id;
                forEachAssignment(f, r.id, [&](VarIndex v) { row.terms.push_back({ v, 1.0 }); });
                if (!row.terms.empty()) {
                    push(f, std::move(row));
                }
            }
        }

        void addRepeatIndicators(Formulation& f) const {
            const double penalty = problem_.objective().consecutiveDayPenalty();
            for (const Recipe& r : problem_.pool()) {
                for (int s = 0; s < problem_.mealsPerDay(); ++s) {
                    for (int d = 1; d < problem_.horizonDays(); ++d) {
                        auto prev = f.assignment({ r.id, d - 1, s });
                        auto curr = f.assignment({ r.id, d, s });
                        if (!prev || !curr) continue;

                        AssignmentKey key{ r.id, d, s };
                        VarIndex rep = f.variables_.size();
                        f.repeatIndex_.emplace(key, rep);
                        f.variables_.push_back(VariableSpec{ VarKind::Repeat, key, penalty });

                        for (LinearRow& row : booleanAnd(*prev, *curr, rep)) {
                            row.day = d;
                            row.slot = s;
                            row.recipe = r.id;
                            push(f, std::move(row));
                        }
                    }
                }
            }
        }

        template<typename Fn>
        void forEachAssignment(const Formulation& f, RecipeId id, Fn&& fn) const {
            for (int d = 0; d < problem_.horizonDays(); ++d) {
                for (int s = 0; s < problem_.mealsPerDay(); ++s) {
                    if (auto v = f.assignment({ id, d, s })) fn(*v);
                }
            }
        }

        static LinearRow nutrientRow(RowKind kind, const std::vector<LinearTerm>& terms,
            RowSense sense, double rhs, int day, Nutrient n)
        {
            LinearRow row;
            row.kind = kind;
            row.terms = terms;
            row.sense = sense;
            row.rhs = rhs;
            row.day = day;
            row.nutrient = n;
            return row;
        }

        static void push(Formulation& f, LinearRow&& row) {
            f.rowCounts_[row.kind] += 1;
            f.rows_.push_back(std::move(row));
        }

        const PlanningProblem& problem_;
    };

} // namespace mealplan
