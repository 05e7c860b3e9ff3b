#pragma once
/*
===============================================================================
VARIABLES — Gurobi variable containers keyed by AssignmentKey
===============================================================================

OVERVIEW
--------
Loads the variables of a Formulation into a GRBModel and keeps them
addressable by their structured key. A variable exists only for an eligible
(recipe, day, slot), so the container is sparse: a flat entry list in
creation order plus a hash index.

KEY COMPONENTS
--------------
• KeyedVariableSet<Key>  — sparse GRBVar container with O(1) keyed lookup
• VariableFactory        — creates binaries from a Formulation
• VariableTable<Enum>    — enum-keyed registry of KeyedVariableSets
• value / values         — solution read-back helpers

USAGE EXAMPLES
--------------
    auto X = VariableFactory::addBinaries(model, formulation, VarKind::Assignment);
    model.optimize();
    if (value(X.at({ 12, 3, 1 })) > 0.5) { ... }

    // Creation order matches Formulation::variables() order
    for (const auto& e : X) { std::cout << e.key.recipe << " "; }

EXCEPTION SAFETY
----------------
• at() throws std::out_of_range for unknown keys
• add() throws std::invalid_argument on duplicate keys
• Gurobi errors propagate as GRBException

===============================================================================
*/

#include <array>
#include <cstddef>
#include <format>
#include <functional>
#include <initializer_list>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

#include "gurobi_c++.h"

#include "formulation.h"
#include "naming.h"

namespace mealplan {

    // ============================================================================
    // KEYED VARIABLE SET
    // ============================================================================
    /**
     * @class KeyedVariableSet
     * @brief Variables indexed by a hashable key, iteration in creation order
     *
     * @tparam Key  Key type (AssignmentKey for all meal-plan variables)
     * @tparam Hash Hash functor for Key
     */
    template<typename Key = AssignmentKey, typename Hash = AssignmentKeyHash>
    class KeyedVariableSet {
    public:
        struct Entry {
            GRBVar var;
            Key key;
            VarIndex index = 0;   ///< position in Formulation::variables()
        };

        using const_iterator = typename std::vector<Entry>::const_iterator;

        KeyedVariableSet() = default;

        /// @throws std::invalid_argument if key is already present
        void add(const Key& key, GRBVar var, VarIndex index) {
            if (!lookup_.emplace(key, entries_.size()).second) {
                throw std::invalid_argument("KeyedVariableSet::add: duplicate key");
            }
            entries_.push_back(Entry{ std::move(var), key, index });
        }

        [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
        [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

        const_iterator begin() const noexcept { return entries_.begin(); }
        const_iterator end() const noexcept { return entries_.end(); }
        const std::vector<Entry>& all() const noexcept { return entries_; }

        [[nodiscard]] bool contains(const Key& key) const {
            return lookup_.contains(key);
        }

        /// @throws std::out_of_range if key is absent
        const GRBVar& at(const Key& key) const {
            const GRBVar* v = tryGet(key);
            if (!v) {
                throw std::out_of_range("KeyedVariableSet::at: key not found");
            }
            return *v;
        }

        const GRBVar& operator()(const Key& key) const { return at(key); }

        [[nodiscard]] const GRBVar* tryGet(const Key& key) const noexcept {
            auto it = lookup_.find(key);
            return it == lookup_.end() ? nullptr : &entries_[it->second].var;
        }

        /// @brief Apply fn(var, key) to each entry in creation order
        template<typename Fn>
        void forEach(Fn&& fn) const {
            for (const auto& e : entries_) {
                fn(e.var, e.key);
            }
        }

    private:
        std::vector<Entry> entries_;
        std::unordered_map<Key, std::size_t, Hash> lookup_;
    };

    using AssignmentVarSet = KeyedVariableSet<AssignmentKey, AssignmentKeyHash>;

    // ============================================================================
    // VARIABLE FACTORY
    // ============================================================================
    /**
     * @class VariableFactory
     * @brief Creates Gurobi variables from a Formulation
     */
    class VariableFactory {
    public:
        /**
         * @brief Add one binary per formulation variable of the given kind
         *
         * @details Objective coefficients are attached to the variables
         *          (GRB_DoubleAttr_Obj); names follow naming.h and are empty
         *          in release builds.
         */
        static AssignmentVarSet addBinaries(GRBModel& model, const Formulation& f, VarKind kind) {
            AssignmentVarSet out;
            const auto& specs = f.variables();
            for (VarIndex i = 0; i < specs.size(); ++i) {
                const VariableSpec& spec = specs[i];
                if (spec.kind != kind) continue;
                GRBVar v = model.addVar(0.0, 1.0, spec.objective, GRB_BINARY, make_name::variable(spec));
                out.add(spec.key, std::move(v), i);
            }
            return out;
        }
    };

    // ============================================================================
    // VARIABLE TABLE
    // ============================================================================
    /**
     * @class VariableTable
     * @brief Enum-keyed registry of variable sets
     *
     * @tparam EnumT Enum class with COUNT sentinel
     *
     * @example
     *     MEALPLAN_DECLARE_ENUM_WITH_COUNT(MealVars, Assign, Repeat);
     *     VariableTable<MealVars> vt;
     *     vt.set(MealVars::Assign, VariableFactory::addBinaries(m, f, VarKind::Assignment));
     *     const GRBVar& x = vt.var(MealVars::Assign, { 12, 3, 1 });
     */
    template<
        typename EnumT,
        std::size_t MAX = static_cast<std::size_t>(EnumT::COUNT)>
    class VariableTable {
    public:
        /// @throws std::out_of_range if key >= MAX
        void set(EnumT key, AssignmentVarSet&& vars) {
            table_[checked(key, "set")] = std::move(vars);
        }

        /// @throws std::out_of_range if key >= MAX
        const AssignmentVarSet& get(EnumT key) const {
            return table_[checked(key, "get")];
        }

        /// @throws std::out_of_range if key >= MAX or the entry lacks k
        const GRBVar& var(EnumT key, const AssignmentKey& k) const {
            return get(key).at(k);
        }

        /// @brief Total variable count across all entries
        [[nodiscard]] std::size_t size() const noexcept {
            std::size_t n = 0;
            for (const auto& t : table_) n += t.size();
            return n;
        }

    private:
        static std::size_t checked(EnumT key, const char* op) {
            std::size_t idx = static_cast<std::size_t>(key);
            if (idx >= MAX) {
                throw std::out_of_range(std::format("VariableTable::{}: key {} >= {}", op, idx, MAX));
            }
            return idx;
        }

        std::array<AssignmentVarSet, MAX> table_;
    };

    // ============================================================================
    // SOLUTION HELPERS
    // ============================================================================

    /**
     * @brief Solution value of a variable
     * @throws GRBException if no solution is available
     */
    inline double value(const GRBVar& v) {
        return v.get(GRB_DoubleAttr_X);
    }

    /**
     * @brief Solution vector indexed by VarIndex, covering every set given
     *
     * @param size Formulation::variables().size()
     */
    inline std::vector<double> values(std::size_t size,
        std::initializer_list<std::reference_wrapper<const AssignmentVarSet>> sets)
    {
        std::vector<double> x(size, 0.0);
        for (const AssignmentVarSet& s : sets) {
            for (const auto& e : s) {
                x.at(e.index) = value(e.var);
            }
        }
        return x;
    }

} // namespace mealplan
