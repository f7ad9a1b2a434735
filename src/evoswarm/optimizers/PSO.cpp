/**
 * @file PSO.cpp
 * @brief Particle Swarm Optimization implementation
 */

#include "PSO.hpp"
#include "../errors.hpp"

#include <cmath>
#include <random>
#include <utility>

namespace evoswarm{
namespace optim{

    PSO::PSO(FitnessPtr fitness, const PSOConfig& config)
        : PSO(std::move(fitness), config, rng::make_engine(rng::PSO_STREAM))
    {}

    PSO::PSO(FitnessPtr fitness, const PSOConfig& config, rng::Engine engine)
        : m_config(config),
          m_fitness(std::move(fitness)),
          m_rng(std::move(engine))
    {
        requireFitness(m_fitness, m_config.vector_length);
        if (m_config.swarm_size == 0) throw ConfigurationError("Swarm size must be > 0.");
        validateWeights(m_config.weights);
        resolveBounds(m_config.init_lower, m_config.init_upper, m_config.vector_length);

        initialize();
    }

    void PSO::validateWeights(const PSOWeights& w) {
        const Real values[] = {w.follow_current, w.follow_personal_best, w.follow_social_best,
                               w.follow_global_best, w.scale_update_step};
        for (Real v : values) {
            if (!std::isfinite(v) || v < 0.0) {
                throw ConfigurationError("PSO weights must be finite and non-negative.");
            }
        }
    }

    void PSO::initialize() {
        const std::size_t dim = m_config.vector_length;
        std::vector<Particle> swarm(m_config.swarm_size);

        for (std::size_t idx = 0; idx < swarm.size(); ++idx) {
            auto& p = swarm[idx];
            p.id = idx;
            p.position.resize(dim);
            p.velocity.assign(dim, 0.0);

            for (std::size_t i = 0; i < dim; ++i) {
                std::uniform_real_distribution<Real> dist(m_config.init_lower[i], m_config.init_upper[i]);
                p.position[i] = dist(m_rng);
            }

            p.previous_fitness = m_fitness->evaluate(p.position);
            p.best_position = p.position;
            p.best_fitness = p.previous_fitness;
        }

        // Random placeholder until the first refresh
        std::uniform_int_distribution<std::size_t> pick(0, swarm.size() - 1);
        m_global_fittest = pick(m_rng);

        m_swarm = std::move(swarm);
        m_current_iter = 0;
    }

    void PSO::reset() {
        initialize();
    }

    Real PSO::uniform(Real upper) {
        std::uniform_real_distribution<Real> dist(0.0, upper);
        return dist(m_rng);
    }

    std::vector<std::size_t> PSO::drawInformants(std::size_t self) {
        std::uniform_int_distribution<std::size_t> pick(0, m_swarm.size() - 1);

        std::vector<std::size_t> informants;
        informants.reserve(m_config.num_informants + 1);
        bool has_self = false;
        for (std::size_t k = 0; k < m_config.num_informants; ++k) {
            const std::size_t idx = pick(m_rng);
            has_self = has_self || idx == self;
            informants.push_back(idx);
        }
        if (!has_self) informants.push_back(self);
        return informants;
    }

    std::size_t PSO::fittestInformant(const std::vector<std::size_t>& informants) const {
        std::size_t best = informants.front();
        for (std::size_t idx : informants) {
            if (m_swarm[idx].best_fitness < m_swarm[best].best_fitness) {
                best = idx;
            }
        }
        return best;
    }

    void PSO::stepSwarm(const PSOWeights& w) {
        validateWeights(w);

        const std::size_t dim = m_config.vector_length;
        const Particle& global = m_swarm[m_global_fittest];

        // Next swarm is built aside; m_swarm stays the pre-step snapshot
        std::vector<Particle> next;
        next.reserve(m_swarm.size());

        for (const auto& current : m_swarm) {
            const Particle& informant = m_swarm[fittestInformant(drawInformants(current.id))];
            Particle p = current;

            // Move along the previous velocity first
            for (std::size_t i = 0; i < dim; ++i) {
                p.position[i] += p.velocity[i] * w.scale_update_step;
            }

            const Real cognitive = uniform(w.follow_personal_best);
            const Real social = uniform(w.follow_social_best);
            const Real glob = uniform(w.follow_global_best);

            for (std::size_t i = 0; i < dim; ++i) {
                p.velocity[i] = w.follow_current * p.velocity[i]
                              + cognitive * (p.best_position[i] - p.position[i])
                              + social * (informant.best_position[i] - p.position[i])
                              + glob * (global.best_position[i] - p.position[i]);
            }

            const Real fitness = m_fitness->evaluate(p.position);
            if (fitness < p.best_fitness) {
                p.best_position = p.position;
                p.best_fitness = fitness;
            }
            p.previous_fitness = fitness;

            next.push_back(std::move(p));
        }

        m_swarm = std::move(next);
        ++m_current_iter;
    }

    bool PSO::refreshGlobalBest() {
        std::size_t fittest = 0;
        for (std::size_t idx = 1; idx < m_swarm.size(); ++idx) {
            if (m_swarm[idx].best_fitness < m_swarm[fittest].best_fitness) {
                fittest = idx;
            }
        }

        if (m_swarm[fittest].best_fitness < m_swarm[m_global_fittest].best_fitness) {
            m_global_fittest = fittest;
            return true;
        }
        return false;
    }

    void PSO::improve(const PSOWeights& weights) {
        stepSwarm(weights);
        refreshGlobalBest();
    }

    void PSO::step() {
        improve(m_config.weights);
    }

    Solution PSO::getBestSolution() const {
        const Particle& g = m_swarm[m_global_fittest];
        return Solution{g.best_position, g.best_fitness};
    }

} //namespace optim
} //namespace evoswarm
