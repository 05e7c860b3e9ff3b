#pragma once
/*
===============================================================================
CONSTRAINTS — Loading formulation rows into Gurobi
===============================================================================

OVERVIEW
--------
Each LinearRow of a Formulation becomes one GRBConstr. Constraints are
grouped by RowKind in a ConstraintTable so that diagnostics and tests can
ask for "the repeat-cap rows" or "the nutrient lower bounds" directly.

KEY COMPONENTS
--------------
• ConstraintList           — GRBConstrs of one kind plus their row indices
• ConstraintFactory::add   — LinearRow → GRBLinExpr → GRBConstr
• ConstraintTable<Enum>    — enum-keyed registry of ConstraintLists

USAGE EXAMPLES
--------------
    std::vector<GRBVar> byIndex = ...;   // VarIndex → GRBVar
    ConstraintTable<RowKind> cons;
    ConstraintFactory::addAll(model, formulation, byIndex, cons);
    std::cout << cons.get(RowKind::RepeatCap).size() << " cap rows\n";

EXCEPTION SAFETY
----------------
• Unknown VarIndex in a row throws std::out_of_range before the row is added
• Gurobi errors propagate as GRBException

===============================================================================
*/

#include <array>
#include <cstddef>
#include <format>
#include <stdexcept>
#include <utility>
#include <vector>

#include "gurobi_c++.h"

#include "enum_utils.h"
#include "formulation.h"
#include "naming.h"

namespace mealplan {

    /**
     * @struct ConstraintList
     * @brief Constraints of one kind in creation order
     */
    struct ConstraintList {
        std::vector<GRBConstr> constrs;
        std::vector<std::size_t> rows;   ///< index into Formulation::rows()

        [[nodiscard]] std::size_t size() const noexcept { return constrs.size(); }
        [[nodiscard]] bool empty() const noexcept { return constrs.empty(); }
    };

    /**
     * @class ConstraintTable
     * @brief Enum-keyed registry of constraint lists
     *
     * @tparam EnumT Enum class with COUNT sentinel
     */
    template<
        typename EnumT,
        std::size_t MAX = static_cast<std::size_t>(EnumT::COUNT)>
    class ConstraintTable {
    public:
        /// @throws std::out_of_range if key >= MAX
        void append(EnumT key, GRBConstr c, std::size_t row) {
            auto& list = table_[checked(key, "append")];
            list.constrs.push_back(std::move(c));
            list.rows.push_back(row);
        }

        /// @throws std::out_of_range if key >= MAX
        const ConstraintList& get(EnumT key) const {
            return table_[checked(key, "get")];
        }

        /// @brief Total constraint count across all entries
        [[nodiscard]] std::size_t size() const noexcept {
            std::size_t n = 0;
            for (const auto& t : table_) n += t.size();
            return n;
        }

    private:
        static std::size_t checked(EnumT key, const char* op) {
            std::size_t idx = static_cast<std::size_t>(key);
            if (idx >= MAX) {
                throw std::out_of_range(std::format("ConstraintTable::{}: key {} >= {}", op, idx, MAX));
            }
            return idx;
        }

        std::array<ConstraintList, MAX> table_;
    };

    /**
     * @class ConstraintFactory
     * @brief Creates Gurobi constraints from formulation rows
     */
    class ConstraintFactory {
    public:
        /**
         * @brief Build the linear expression of a row
         * @throws std::out_of_range if a term refers to an unknown variable
         */
        static GRBLinExpr expression(const LinearRow& row, const std::vector<GRBVar>& byIndex) {
            GRBLinExpr expr;
            for (const auto& t : row.terms) {
                if (t.var >= byIndex.size()) {
                    throw std::out_of_range(std::format(
                        "ConstraintFactory: variable {} outside [0, {})", t.var, byIndex.size()));
                }
                expr += t.coeff * byIndex[t.var];
            }
            return expr;
        }

        static GRBConstr add(GRBModel& model, const LinearRow& row, const std::vector<GRBVar>& byIndex) {
            GRBLinExpr lhs = expression(row, byIndex);
            return model.addConstr(lhs, sense(row.sense), row.rhs, make_name::row(row));
        }

        /// @brief Add every row of f and register it under its RowKind
        template<typename Table>
        static void addAll(GRBModel& model, const Formulation& f,
            const std::vector<GRBVar>& byIndex, Table& table)
        {
            const auto& rows = f.rows();
            for (std::size_t i = 0; i < rows.size(); ++i) {
                table.append(rows[i].kind, add(model, rows[i], byIndex), i);
            }
        }

        static char sense(RowSense s) noexcept {
            switch (s) {
                case RowSense::LessEqual:    return GRB_LESS_EQUAL;
                case RowSense::GreaterEqual: return GRB_GREATER_EQUAL;
                case RowSense::Equal:        return GRB_EQUAL;
            }
            return GRB_EQUAL;
        }
    };

} // namespace mealplan
