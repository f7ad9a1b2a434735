#pragma once
#include "optimizer.hpp"
#include "../rng/rng_factory.hpp"

#include <cstddef>
#include <vector>

namespace evoswarm::optim {

    /**
     * @brief Coefficients of one PSO update.
     * Each follow_* weight w is the upper end of a uniform draw U(0, w) taken
     * once per particle and per term, except follow_current which multiplies
     * the previous velocity as is.
     */
    struct PSOWeights {
        Real follow_current = 0.7;        // inertia on the previous velocity
        Real follow_personal_best = 2.0;  // pull towards the particle's own best
        Real follow_social_best = 0.9;    // pull towards the fittest informant's best
        Real follow_global_best = 0.0;    // pull towards the swarm's best
        Real scale_update_step = 0.7;     // fraction of the velocity applied to the position
    };

    /**
     * @brief Configuration parameters specific to the PSO algorithm.
     */
    struct PSOConfig {
        std::size_t swarm_size = 25;
        std::size_t vector_length = 2;
        std::size_t num_informants = 6;   // random informants drawn per particle and step

        PSOWeights weights;               // used by step()

        // Initial positions are uniform in [init_lower, init_upper]; empty means [0,1]^D
        Coordinates init_lower;
        Coordinates init_upper;
    };

    /**
     * @brief Particle Swarm Optimization with random informants.
     *
     * Every iteration each particle picks num_informants random particles
     * (itself always included), moves along its previous velocity and then
     * recomputes the velocity from its personal best, the best informant and
     * the global fittest particle. Positions are not clamped to any domain.
     */
    class PSO : public Optimizer {
    public:
        struct Particle {
            std::size_t id;              // index in the swarm, stable for the whole run
            Coordinates position;
            Coordinates velocity;

            Coordinates best_position;   // Personal Best (pBest) location
            Real best_fitness;           // fitness at best_position
            Real previous_fitness;       // fitness at position, as of the last evaluation
        };

        explicit PSO(FitnessPtr fitness, const PSOConfig& config = PSOConfig{});

        // Same, drawing every random number from the given engine
        PSO(FitnessPtr fitness, const PSOConfig& config, rng::Engine engine);

        /**
         * @brief Move every particle once.
         * All particles read the swarm as it was before the call (informant bests,
         * global fittest); the new swarm replaces the old one only once every
         * particle has been updated and evaluated.
         * @throws ConfigurationError on invalid weights, before any change.
         * @throws EvaluationError from the fitness function, with no change to the swarm.
         */
        void stepSwarm(const PSOWeights& weights);

        /**
         * @brief Point global fittest at the particle with the lowest personal best,
         * if that is strictly better than the current one.
         * @return true if the global fittest changed.
         */
        bool refreshGlobalBest();

        // One full iteration: stepSwarm() followed by refreshGlobalBest()
        void improve(const PSOWeights& weights);

        void step() override;
        void reset() override;
        [[nodiscard]] Solution getBestSolution() const override;

        [[nodiscard]] const std::vector<Particle>& getParticles() const {
            return m_swarm;
        }

        [[nodiscard]] const Particle& getGlobalFittest() const {
            return m_swarm[m_global_fittest];
        }

        [[nodiscard]] std::size_t getGlobalFittestIndex() const { return m_global_fittest; }

        [[nodiscard]] const PSOConfig& getConfig() const { return m_config; }

        [[nodiscard]] const fitness::FitnessFunction& getFitness() const { return *m_fitness; }

    private:
        void initialize();
        static void validateWeights(const PSOWeights& w);

        // Random informant indices for particle `self`, self appended if not drawn
        std::vector<std::size_t> drawInformants(std::size_t self);

        // Informant with the lowest personal-best fitness (first one on ties)
        std::size_t fittestInformant(const std::vector<std::size_t>& informants) const;

        Real uniform(Real upper);

        PSOConfig m_config;
        FitnessPtr m_fitness;
        rng::Engine m_rng;

        std::vector<Particle> m_swarm;
        std::size_t m_global_fittest = 0;
    };

} // namespace evoswarm::optim
