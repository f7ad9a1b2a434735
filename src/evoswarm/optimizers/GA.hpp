// GA.hpp
#pragma once
#include "optimizer.hpp"
#include "../rng/rng_factory.hpp"

#include <cstddef>
#include <utility>
#include <vector>

namespace evoswarm::optim {

    /**
     * @brief Configuration parameters specific to the Genetic Algorithm.
     * Real-coded GA for continuous optimization.
     */
    struct GAConfig {
        std::size_t population_size = 100;    // must be even
        std::size_t vector_length = 2;

        // Selection
        std::size_t tournament_size = 2;      // challengers per tournament, drawn with replacement

        // Variation operators, used by step()
        Real mutation_rate  = 0.3;            // Probability to mutate a child (all of its genes)
        Real mutation_scale = 1.0;            // Stddev of the Gaussian noise added to each gene
        bool mutate = true;

        // Initial genomes are uniform in [init_lower, init_upper]; empty means [0,1]^D
        Coordinates init_lower;
        Coordinates init_upper;
    };

    /**
     * @brief Generational Genetic Algorithm.
     *
     * Each generation replaces the whole population with children produced by
     * tournament selection, two-point crossover and (optional) Gaussian
     * mutation. There is no elitism: the best individual of a generation only
     * survives if it is selected and left intact by chance, so the best fitness
     * of the population is not monotone.
     */
    class GA : public Optimizer {
    public:
        struct Individual {
            Coordinates genome;   // Candidate solution (same as params)
            Real fitness;         // Objective value
        };

        explicit GA(FitnessPtr fitness, const GAConfig& config = GAConfig{});

        // Same, drawing every random number from the given engine
        GA(FitnessPtr fitness, const GAConfig& config, rng::Engine engine);

        /**
         * @brief Replace the population with the next generation.
         * Pair i of parents yields child A at slot i and child B at slot i + size/2.
         * @param mutation_rate Probability in [0,1] to mutate each child.
         * @param mutation_scale Standard deviation (>= 0) of the mutation noise.
         * @param mutate_enabled When false no mutation draw happens at all.
         * @throws ConfigurationError on invalid mutation parameters, before any change.
         * @throws EvaluationError from the fitness function, with no change to the population.
         */
        void advanceGeneration(Real mutation_rate, Real mutation_scale, bool mutate_enabled);

        void step() override;
        void reset() override;
        [[nodiscard]] Solution getBestSolution() const override;

        [[nodiscard]] const std::vector<Individual>& getPopulation() const {
            return m_population;
        }

        // Fittest individual of the current population (a copy, not a slot reference)
        [[nodiscard]] const Individual& getCurrentBest() const { return m_current_best; }

        [[nodiscard]] const GAConfig& getConfig() const { return m_config; }
        [[nodiscard]] const fitness::FitnessFunction& getFitness() const { return *m_fitness; }

        // --- Operators ---

        // Tournament with replacement over the current population; lowest fitness wins
        const Individual& tournamentSelect();

        // Two-point crossover with random cuts (see crossoverSegment)
        std::pair<Coordinates, Coordinates> crossover(const Coordinates& parent_a,
                                                      const Coordinates& parent_b);

        /**
         * @brief Swap the segment [cut_a, cut_b) between two parents.
         * Cuts are ordered first; equal cuts are widened to a one-gene window.
         * @return (A outside + B inside, B outside + A inside)
         */
        static std::pair<Coordinates, Coordinates> crossoverSegment(const Coordinates& parent_a,
                                                                    const Coordinates& parent_b,
                                                                    std::size_t cut_a,
                                                                    std::size_t cut_b);

        // With probability rate, add N(0, scale) to every gene of the child
        void mutate(Coordinates& child, Real rate, Real scale);

    private:
        void initialize();
        static void validateMutation(Real rate, Real scale);

        // Index of the fittest individual (first one on ties)
        static std::size_t fittestIndex(const std::vector<Individual>& population);

        GAConfig m_config;
        FitnessPtr m_fitness;
        rng::Engine m_rng;

        std::vector<Individual> m_population;
        Individual m_current_best;
    };

} // namespace evoswarm::optim
