#pragma once
/*
===============================================================================
RECIPE — Candidate recipes and the pool adapter
===============================================================================

OVERVIEW
--------
Recipes arrive from the catalog collaborator as a pre-fetched list. This
header defines the in-memory shape the engine works with and the pool that
owns them for the duration of one optimization call.

KEY COMPONENTS
--------------
• Nutrient       — tracked macro-nutrients (calories … sodium_mg)
• NutrientVector — EnumArray<Nutrient, double>, per serving or per day
• MealType       — breakfast, lunch, dinner, snack, meal_4, meal_5
• Recipe         — immutable record (id, macros, meal-time tags, tags, times)
• CandidatePool  — ordered, id-indexed, validated recipe list

ORDERING
--------
The pool preserves input order. Every consumer (eligibility lists, variable
creation, genetic encoding) iterates in this order, which is what makes two
runs over identical inputs build identical models.

EXCEPTION SAFETY
----------------
• CandidatePool constructor throws ConfigurationError on duplicate ids or
  negative nutrient values (strong guarantee)
• CandidatePool::at() throws std::out_of_range for unknown ids

===============================================================================
*/

#include <algorithm>
#include <cstddef>
#include <format>
#include <iterator>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "enum_utils.h"
#include "errors.h"

namespace mealplan {

    // ========================================================================
    // NUTRIENTS
    // ========================================================================

    MEALPLAN_DECLARE_ENUM_WITH_COUNT(Nutrient,
        Calories, ProteinG, CarbsG, FatG, FiberG, SodiumMg);

    using NutrientVector = EnumArray<Nutrient, double>;

    inline std::string_view nutrientName(Nutrient n) noexcept {
        switch (n) {
            case Nutrient::Calories: return "calories";
            case Nutrient::ProteinG: return "protein_g";
            case Nutrient::CarbsG:   return "carbs_g";
            case Nutrient::FatG:     return "fat_g";
            case Nutrient::FiberG:   return "fiber_g";
            case Nutrient::SodiumMg: return "sodium_mg";
            case Nutrient::COUNT:    break;
        }
        return "unknown";
    }

    inline NutrientVector& operator+=(NutrientVector& lhs, const NutrientVector& rhs) noexcept {
        forEachEnum<Nutrient>([&](Nutrient n) { lhs[n] += rhs[n]; });
        return lhs;
    }

    // ========================================================================
    // MEAL TYPES
    // ========================================================================

    MEALPLAN_DECLARE_ENUM_WITH_COUNT(MealType,
        Breakfast, Lunch, Dinner, Snack, Meal4, Meal5);

    /// @brief Largest number of slots per day the engine supports
    inline constexpr int kMaxMealsPerDay = static_cast<int>(MealType_COUNT);

    inline std::string_view mealTypeName(MealType m) noexcept {
        switch (m) {
            case MealType::Breakfast: return "breakfast";
            case MealType::Lunch:     return "lunch";
            case MealType::Dinner:    return "dinner";
            case MealType::Snack:     return "snack";
            case MealType::Meal4:     return "meal_4";
            case MealType::Meal5:     return "meal_5";
            case MealType::COUNT:     break;
        }
        return "unknown";
    }

    inline std::optional<MealType> parseMealType(std::string_view name) noexcept {
        std::optional<MealType> found;
        forEachEnum<MealType>([&](MealType m) {
            if (mealTypeName(m) == name) found = m;
        });
        return found;
    }

    /**
     * @brief Meal type bound to a slot position within a day
     *
     * Slot s of a day with k meals is the s-th entry of
     * [breakfast, lunch, dinner, snack, meal_4, meal_5].
     *
     * @throws std::out_of_range if slot is outside [0, kMaxMealsPerDay)
     */
    inline MealType slotMealType(int slot) {
        if (slot < 0 || slot >= kMaxMealsPerDay) {
            throw std::out_of_range(std::format("slotMealType: slot {} outside [0, {})", slot, kMaxMealsPerDay));
        }
        return static_cast<MealType>(slot);
    }

    // ========================================================================
    // RECIPE
    // ========================================================================

    using RecipeId = int;

    /**
     * @struct Recipe
     * @brief One catalog recipe, per-serving values
     *
     * @note A recipe with an empty mealTimes set is kept in the pool but can
     *       never be assigned: no slot lists it as eligible.
     */
    struct Recipe {
        RecipeId id = 0;
        std::string title;
        NutrientVector perServing{};
        std::set<MealType> mealTimes;
        int prepTimeMinutes = 0;
        int cookTimeMinutes = 0;
        std::set<std::string> dietaryTags;
        std::set<std::string> allergenTags;
        std::set<std::string> goalTags;       ///< e.g. "muscle_gain", "fat_loss"
        std::vector<int> ingredientIds;       ///< inventory item ids

        [[nodiscard]] bool eligibleFor(MealType m) const {
            return mealTimes.contains(m);
        }

        [[nodiscard]] int totalTimeMinutes() const noexcept {
            return prepTimeMinutes + cookTimeMinutes;
        }

        [[nodiscard]] double nutrient(Nutrient n) const noexcept {
            return perServing[n];
        }
    };

    // ========================================================================
    // CANDIDATE POOL
    // ========================================================================

    /**
     * @class CandidatePool
     * @brief Immutable, ordered recipe list with O(1) lookup by id
     *
     * @example
     *     CandidatePool pool({ breakfastOats, chickenBowl, salmonRice });
     *     const Recipe* r = pool.find(42);
     *     for (const Recipe& recipe : pool) { ... }
     */
    class CandidatePool {
    public:
        using const_iterator = std::vector<Recipe>::const_iterator;

        CandidatePool() = default;

        /**
         * @throws ConfigurationError on duplicate id or negative nutrient
         */
        explicit CandidatePool(std::vector<Recipe> recipes)
            : recipes_(std::move(recipes))
        {
            byId_.reserve(recipes_.size());
            for (std::size_t i = 0; i < recipes_.size(); ++i) {
                const Recipe& r = recipes_[i];
                if (!byId_.emplace(r.id, i).second) {
                    throw ConfigurationError(std::format("duplicate recipe id {}", r.id));
                }
                forEachEnum<Nutrient>([&](Nutrient n) {
                    if (r.perServing[n] < 0.0) {
                        throw ConfigurationError(std::format(
                            "recipe {} has negative {} ({})", r.id, nutrientName(n), r.perServing[n]));
                    }
                });
                if (r.prepTimeMinutes < 0 || r.cookTimeMinutes < 0) {
                    throw ConfigurationError(std::format("recipe {} has negative preparation time", r.id));
                }
            }
        }

        [[nodiscard]] std::size_t size() const noexcept { return recipes_.size(); }
        [[nodiscard]] bool empty() const noexcept { return recipes_.empty(); }

        const_iterator begin() const noexcept { return recipes_.begin(); }
        const_iterator end() const noexcept { return recipes_.end(); }

        const Recipe& operator[](std::size_t i) const noexcept { return recipes_[i]; }
        const std::vector<Recipe>& all() const noexcept { return recipes_; }

        /// @brief Recipe by id, or nullptr
        [[nodiscard]] const Recipe* find(RecipeId id) const noexcept {
            auto it = byId_.find(id);
            return it == byId_.end() ? nullptr : &recipes_[it->second];
        }

        /// @throws std::out_of_range if id is not in the pool
        const Recipe& at(RecipeId id) const {
            const Recipe* r = find(id);
            if (!r) {
                throw std::out_of_range(std::format("CandidatePool::at: recipe {} not found", id));
            }
            return *r;
        }

        /// @brief Subsequence of recipes satisfying pred, input order kept
        template<typename Pred>
        [[nodiscard]] CandidatePool filtered(Pred&& pred) const {
            std::vector<Recipe> kept;
            std::copy_if(recipes_.begin(), recipes_.end(), std::back_inserter(kept), pred);
            return CandidatePool(std::move(kept));
        }

    private:
        std::vector<Recipe> recipes_;
        std::unordered_map<RecipeId, std::size_t> byId_;
    };

} // namespace mealplan
