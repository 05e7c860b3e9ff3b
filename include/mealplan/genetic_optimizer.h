#pragma once
/*
===============================================================================
GENETIC OPTIMIZER — Metaheuristic fallback for the weekly plan
===============================================================================

OVERVIEW
--------
Used when the exact path yields no plan. Searches the same space (one
eligible recipe per day and slot) with a seeded genetic algorithm and
always returns a complete plan, possibly violating soft-evaluated bounds.
Violations are reported, never hidden.

ENCODING
--------
A chromosome is a flat vector of pool indices, gene g = day * mealsPerDay +
slot. Every gene is drawn from the slot's eligible list, so ineligible
assignments cannot arise.

COST (minimized)
----------------
    violationWeight * Σ_day Σ_nutrient relativeViolation(total)
  + repeatCapPenalty * Σ_recipe max(0, count - cap)
  + consecutiveDayPenalty * (#consecutive same-slot repeats)
  + Σ scaled assignment cost                       (objective.h)
  + preferenceScale * variety cost

ALGORITHM
---------
    population = { greedy } ∪ random
    repeat for at most `generations`:
        keep the elite fraction
        tournament-select parents, one-point crossover at a day boundary,
        per-gene mutation resampling from the slot's eligible list
    stop early after `plateauGenerations` without improvement, or when
    the population has converged (best / mean ≥ convergenceRatio)

DETERMINISM
-----------
All randomness comes from one std::mt19937_64 seeded by
GeneticSettings::seed. Ties are broken by position.

===============================================================================
*/

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <format>
#include <limits>
#include <map>
#include <numeric>
#include <optional>
#include <random>
#include <stdexcept>
#include <vector>

#include "errors.h"
#include "logging.h"
#include "problem.h"

namespace mealplan {

    /**
     * @struct GeneticSettings
     * @brief Parameters of the genetic search
     */
    struct GeneticSettings {
        int populationSize = 50;
        int generations = 100;
        double mutationRate = 0.1;
        double crossoverRate = 0.7;
        double eliteFraction = 0.1;
        int tournamentSize = 3;
        int plateauGenerations = 25;
        double convergenceRatio = 0.95;
        std::uint64_t seed = 42;
        double violationWeight = 10.0;     ///< per unit of relative nutrient violation
        double repeatCapPenalty = 5.0;     ///< per assignment above the repeat cap

        /// @throws ConfigurationError
        void validate() const {
            if (populationSize < 2) {
                throw ConfigurationError(std::format("population size must be >= 2 (got {})", populationSize));
            }
            if (generations < 1) {
                throw ConfigurationError(std::format("generations must be >= 1 (got {})", generations));
            }
            auto rate = [](double r, const char* what) {
                if (!(r >= 0.0 && r <= 1.0)) {
                    throw ConfigurationError(std::format("{} must be in [0, 1] (got {})", what, r));
                }
            };
            rate(mutationRate, "mutation rate");
            rate(crossoverRate, "crossover rate");
            rate(eliteFraction, "elite fraction");
            rate(convergenceRatio, "convergence ratio");
            if (tournamentSize < 1 || tournamentSize > populationSize) {
                throw ConfigurationError(std::format(
                    "tournament size must be in [1, {}] (got {})", populationSize, tournamentSize));
            }
            if (plateauGenerations < 1) {
                throw ConfigurationError("plateau generations must be >= 1");
            }
            if (!std::isfinite(violationWeight) || violationWeight < 0.0
                || !std::isfinite(repeatCapPenalty) || repeatCapPenalty < 0.0) {
                throw ConfigurationError("genetic penalty weights must be finite and >= 0");
            }
        }
    };

    /**
     * @struct Evaluation
     * @brief Cost of one chromosome and its components
     */
    struct Evaluation {
        double cost = std::numeric_limits<double>::infinity();
        double nutrientViolation = 0.0;    ///< Σ relative violations
        int repeatCapExcess = 0;
        int consecutiveRepeats = 0;
        double preference = 0.0;           ///< scaled assignment costs
        double variety = 0.0;              ///< scaled variety cost

        [[nodiscard]] bool feasible(double tol = 1e-9) const noexcept {
            return nutrientViolation <= tol && repeatCapExcess == 0;
        }
    };

    enum class StopReason { GenerationLimit, Plateau, Converged };

    inline const char* stopReasonName(StopReason r) noexcept {
        switch (r) {
            case StopReason::GenerationLimit: return "generation_limit";
            case StopReason::Plateau:         return "plateau";
            case StopReason::Converged:       return "converged";
        }
        return "unknown";
    }

    /**
     * @struct GeneticResult
     * @brief Best plan found and search statistics
     */
    struct GeneticResult {
        RawAssignment assignment;
        Evaluation best;
        int generations = 0;                 ///< generations actually run
        StopReason stop = StopReason::GenerationLimit;
        std::vector<double> bestCostHistory; ///< best cost after each generation
    };

    /**
     * @class GeneticOptimizer
     * @brief Seeded genetic search over complete plans
     */
    class GeneticOptimizer {
    public:
        using Chromosome = std::vector<std::size_t>;

        GeneticOptimizer(GeneticSettings settings, Logger log)
            : settings_(settings), log_(log)
        {
        }

        [[nodiscard]] const GeneticSettings& settings() const noexcept { return settings_; }

        /**
         * @brief Run the search
         *
         * @throws ConfigurationError      invalid GeneticSettings
         * @throws StructuralInfeasibility a slot has no eligible recipe
         */
        [[nodiscard]] GeneticResult solve(const PlanningProblem& problem) const {
            settings_.validate();
            problem.requireFillable();

            std::mt19937_64 rng(settings_.seed);
            const auto popSize = static_cast<std::size_t>(settings_.populationSize);

            std::vector<Chromosome> population;
            population.reserve(popSize);
            population.push_back(greedy(problem));
            while (population.size() < popSize) {
                population.push_back(random(problem, rng));
            }

            std::vector<Evaluation> scores = evaluateAll(problem, population);
            std::size_t bestIdx = argmin(scores);
            Chromosome best = population[bestIdx];
            Evaluation bestEval = scores[bestIdx];

            GeneticResult result;
            int plateau = 0;
            const std::size_t elites = std::max<std::size_t>(1,
                static_cast<std::size_t>(std::floor(settings_.eliteFraction * static_cast<double>(popSize))));

            for (int gen = 0; gen < settings_.generations; ++gen) {
                std::vector<std::size_t> order = rank(scores);

                std::vector<Chromosome> next;
                next.reserve(popSize);
                for (std::size_t e = 0; e < elites && e < order.size(); ++e) {
                    next.push_back(population[order[e]]);
                }

                std::uniform_real_distribution<double> coin(0.0, 1.0);
                while (next.size() < popSize) {
                    Chromosome a = population[tournament(scores, rng)];
                    Chromosome b = population[tournament(scores, rng)];
                    if (coin(rng) < settings_.crossoverRate) {
                        crossover(problem, a, b, rng);
                    }
                    mutate(problem, a, rng);
                    mutate(problem, b, rng);
                    next.push_back(std::move(a));
                    if (next.size() < popSize) next.push_back(std::move(b));
                }

                population = std::move(next);
                scores = evaluateAll(problem, population);
                result.generations = gen + 1;

                std::size_t genBest = argmin(scores);
                if (scores[genBest].cost < bestEval.cost - 1e-12) {
                    best = population[genBest];
                    bestEval = scores[genBest];
                    plateau = 0;
                } else {
                    ++plateau;
                }
                result.bestCostHistory.push_back(bestEval.cost);

                if (plateau >= settings_.plateauGenerations) {
                    result.stop = StopReason::Plateau;
                    break;
                }
                if (converged(scores)) {
                    result.stop = StopReason::Converged;
                    break;
                }
            }

            log_.info("genetic search: {} generations ({}), best cost {:.4f}, violation {:.4f}, cap excess {}, repeats {}",
                result.generations, stopReasonName(result.stop), bestEval.cost,
                bestEval.nutrientViolation, bestEval.repeatCapExcess, bestEval.consecutiveRepeats);

            result.assignment = decode(problem, best);
            result.best = bestEval;
            return result;
        }

        /**
         * @brief Cost of a chromosome
         * @throws std::invalid_argument if the chromosome has the wrong length
         */
        [[nodiscard]] Evaluation evaluate(const PlanningProblem& problem, const Chromosome& c) const {
            const int days = problem.horizonDays();
            const int meals = problem.mealsPerDay();
            if (c.size() != static_cast<std::size_t>(days * meals)) {
                throw std::invalid_argument(std::format(
                    "GeneticOptimizer::evaluate: chromosome length {} != {}", c.size(), days * meals));
            }

            const auto& pool = problem.pool();
            const auto& obj = problem.objective();
            const auto& bounds = problem.constraints().daily;
            Evaluation ev;

            std::map<std::size_t, int> counts;
            for (int d = 0; d < days; ++d) {
                NutrientVector totals{};
                for (int s = 0; s < meals; ++s) {
                    std::size_t r = c[gene(problem, d, s)];
                    totals += pool[r].perServing;
                    counts[r] += 1;
                    ev.preference += obj.scaledAssignmentCost(pool[r]);
                    if (d > 0 && c[gene(problem, d - 1, s)] == r) {
                        ev.consecutiveRepeats += 1;
                    }
                }
                forEachEnum<Nutrient>([&](Nutrient n) {
                    ev.nutrientViolation += bounds[n].relativeViolation(totals[n]);
                });
            }

            const int cap = problem.constraints().maxRecipeRepeats;
            for (const auto& [r, n] : counts) {
                ev.repeatCapExcess += std::max(0, n - cap);
            }
            ev.variety = obj.preferenceScale() * obj.varietyCost(counts.size(), c.size());

            ev.cost = settings_.violationWeight * ev.nutrientViolation
                + settings_.repeatCapPenalty * static_cast<double>(ev.repeatCapExcess)
                + obj.consecutiveDayPenalty() * static_cast<double>(ev.consecutiveRepeats)
                + ev.preference
                + ev.variety;
            return ev;
        }

        /**
         * @brief Constructive plan used to seed the population
         *
         * @details Day by day, each slot takes the eligible recipe whose
         *          calories are closest to the calories still missing for
         *          the day divided by the slots left. Recipes at the repeat
         *          cap and the previous day's pick for the slot are avoided
         *          while alternatives exist.
         */
        [[nodiscard]] Chromosome greedy(const PlanningProblem& problem) const {
            const int days = problem.horizonDays();
            const int meals = problem.mealsPerDay();
            const auto& pool = problem.pool();
            const int cap = problem.constraints().maxRecipeRepeats;
            const double dailyTarget = problem.objective().calorieTargetPerMeal() * meals;

            Chromosome c(static_cast<std::size_t>(days * meals), 0);
            std::map<std::size_t, int> counts;

            for (int d = 0; d < days; ++d) {
                double remaining = dailyTarget;
                for (int s = 0; s < meals; ++s) {
                    const auto& eligible = problem.eligible(s);
                    double want = remaining / static_cast<double>(meals - s);
                    std::size_t prev = d > 0 ? c[gene(problem, d - 1, s)] : pool.size();

                    auto pick = [&](bool strict) -> std::optional<std::size_t> {
                        std::optional<std::size_t> chosen;
                        double bestDist = std::numeric_limits<double>::infinity();
                        for (std::size_t r : eligible) {
                            if (strict && (r == prev || counts[r] >= cap)) continue;
                            double dist = std::abs(pool[r].nutrient(Nutrient::Calories) - want);
                            if (dist < bestDist) {
                                bestDist = dist;
                                chosen = r;
                            }
                        }
                        return chosen;
                    };

                    std::size_t r = pick(true).value_or(*pick(false));
                    c[gene(problem, d, s)] = r;
                    counts[r] += 1;
                    remaining -= pool[r].nutrient(Nutrient::Calories);
                }
            }
            return c;
        }

        /// @brief Chromosome → [day][slot] recipe ids
        [[nodiscard]] static RawAssignment decode(const PlanningProblem& problem, const Chromosome& c) {
            RawAssignment out = problem.emptyAssignment();
            for (int d = 0; d < problem.horizonDays(); ++d) {
                for (int s = 0; s < problem.mealsPerDay(); ++s) {
                    out[static_cast<std::size_t>(d)][static_cast<std::size_t>(s)] =
                        problem.pool()[c.at(gene(problem, d, s))].id;
                }
            }
            return out;
        }

    private:
        static std::size_t gene(const PlanningProblem& problem, int day, int slot) noexcept {
            return static_cast<std::size_t>(day * problem.mealsPerDay() + slot);
        }

        template<typename Rng>
        static std::size_t sample(const std::vector<std::size_t>& from, Rng& rng) {
            std::uniform_int_distribution<std::size_t> pick(0, from.size() - 1);
            return from[pick(rng)];
        }

        template<typename Rng>
        Chromosome random(const PlanningProblem& problem, Rng& rng) const {
            Chromosome c(static_cast<std::size_t>(problem.slotCount()));
            for (int d = 0; d < problem.horizonDays(); ++d) {
                for (int s = 0; s < problem.mealsPerDay(); ++s) {
                    c[gene(problem, d, s)] = sample(problem.eligible(s), rng);
                }
            }
            return c;
        }

        /// @brief Swap the tails of a and b after a random day boundary
        template<typename Rng>
        static void crossover(const PlanningProblem& problem, Chromosome& a, Chromosome& b, Rng& rng) {
            if (problem.horizonDays() < 2) return;
            std::uniform_int_distribution<int> cut(1, problem.horizonDays() - 1);
            std::size_t from = gene(problem, cut(rng), 0);
            std::swap_ranges(a.begin() + static_cast<std::ptrdiff_t>(from), a.end(),
                b.begin() + static_cast<std::ptrdiff_t>(from));
        }

        template<typename Rng>
        void mutate(const PlanningProblem& problem, Chromosome& c, Rng& rng) const {
            std::uniform_real_distribution<double> coin(0.0, 1.0);
            for (int d = 0; d < problem.horizonDays(); ++d) {
                for (int s = 0; s < problem.mealsPerDay(); ++s) {
                    if (coin(rng) < settings_.mutationRate) {
                        c[gene(problem, d, s)] = sample(problem.eligible(s), rng);
                    }
                }
            }
        }

        template<typename Rng>
        std::size_t tournament(const std::vector<Evaluation>& scores, Rng& rng) const {
            std::uniform_int_distribution<std::size_t> pick(0, scores.size() - 1);
            std::size_t winner = pick(rng);
            for (int k = 1; k < settings_.tournamentSize; ++k) {
                std::size_t challenger = pick(rng);
                if (scores[challenger].cost < scores[winner].cost
                    || (scores[challenger].cost == scores[winner].cost && challenger < winner)) {
                    winner = challenger;
                }
            }
            return winner;
        }

        std::vector<Evaluation> evaluateAll(const PlanningProblem& problem,
            const std::vector<Chromosome>& population) const
        {
            std::vector<Evaluation> out;
            out.reserve(population.size());
            for (const auto& c : population) {
                out.push_back(evaluate(problem, c));
            }
            return out;
        }

        static std::vector<std::size_t> rank(const std::vector<Evaluation>& scores) {
            std::vector<std::size_t> order(scores.size());
            std::iota(order.begin(), order.end(), std::size_t{ 0 });
            std::stable_sort(order.begin(), order.end(), [&](std::size_t i, std::size_t j) {
                return scores[i].cost < scores[j].cost;
            });
            return order;
        }

        static std::size_t argmin(const std::vector<Evaluation>& scores) {
            std::size_t best = 0;
            for (std::size_t i = 1; i < scores.size(); ++i) {
                if (scores[i].cost < scores[best].cost) best = i;
            }
            return best;
        }

        /// @brief best / mean cost ≥ convergenceRatio over a non-trivial population
        bool converged(const std::vector<Evaluation>& scores) const {
            double sum = 0.0;
            double best = std::numeric_limits<double>::infinity();
            for (const auto& e : scores) {
                sum += e.cost;
                best = std::min(best, e.cost);
            }
            double mean = sum / static_cast<double>(scores.size());
            if (mean <= 1e-12) return true;
            return best / mean >= settings_.convergenceRatio;
        }

        GeneticSettings settings_;
        Logger log_;
    };

} // namespace mealplan
