// GA.cpp
#include "GA.hpp"
#include "../errors.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <utility>

namespace evoswarm{
namespace optim{

    GA::GA(FitnessPtr fitness, const GAConfig& config)
        : GA(std::move(fitness), config, rng::make_engine(rng::GA_STREAM))
    {}

    GA::GA(FitnessPtr fitness, const GAConfig& config, rng::Engine engine)
        : m_config(config),
          m_fitness(std::move(fitness)),
          m_rng(std::move(engine))
    {
        requireFitness(m_fitness, m_config.vector_length);
        if (m_config.population_size == 0) throw ConfigurationError("Population size must be > 0.");
        if (m_config.population_size % 2 != 0) throw ConfigurationError("Population size must be even.");
        if (m_config.tournament_size == 0) throw ConfigurationError("Tournament size must be > 0.");
        validateMutation(m_config.mutation_rate, m_config.mutation_scale);
        resolveBounds(m_config.init_lower, m_config.init_upper, m_config.vector_length);

        initialize();
    }

    void GA::validateMutation(Real rate, Real scale) {
        if (!(rate >= 0.0 && rate <= 1.0)) throw ConfigurationError("Mutation rate must be in [0, 1].");
        if (!std::isfinite(scale) || scale < 0.0) throw ConfigurationError("Mutation scale must be >= 0.");
    }

    std::size_t GA::fittestIndex(const std::vector<Individual>& population) {
        std::size_t best = 0;
        for (std::size_t i = 1; i < population.size(); ++i) {
            if (population[i].fitness < population[best].fitness) best = i;
        }
        return best;
    }

    void GA::initialize() {
        const std::size_t dim = m_config.vector_length;
        std::vector<Individual> population(m_config.population_size);

        for (auto& ind : population) {
            ind.genome.resize(dim);
            for (std::size_t i = 0; i < dim; ++i) {
                std::uniform_real_distribution<Real> dist(m_config.init_lower[i], m_config.init_upper[i]);
                ind.genome[i] = dist(m_rng);
            }
        }

        for (auto& ind : population) {
            ind.fitness = m_fitness->evaluate(ind.genome);
        }

        m_current_best = population[fittestIndex(population)];
        m_population = std::move(population);
        m_current_iter = 0;
    }

    void GA::reset() {
        initialize();
    }

    const GA::Individual& GA::tournamentSelect() {
        std::uniform_int_distribution<std::size_t> pick(0, m_population.size() - 1);

        const Individual* best = nullptr;
        for (std::size_t i = 0; i < m_config.tournament_size; ++i) {
            const Individual& cand = m_population[pick(m_rng)];
            if (!best || cand.fitness < best->fitness) {
                best = &cand;
            }
        }
        return *best;
    }

    std::pair<Coordinates, Coordinates> GA::crossoverSegment(const Coordinates& parent_a,
                                                             const Coordinates& parent_b,
                                                             std::size_t cut_a,
                                                             std::size_t cut_b) {
        const std::size_t len = parent_a.size();
        if (parent_b.size() != len) {
            throw ConfigurationError("Crossover parents must have the same length.");
        }
        if (len == 0) return {parent_a, parent_b};

        std::size_t c = std::min(cut_a, len);
        std::size_t d = std::min(cut_b, len);
        if (c > d) std::swap(c, d);
        if (c == d) {
            if (d < len) ++d;
            else --c;
        }

        Coordinates child_a = parent_a;
        Coordinates child_b = parent_b;
        for (std::size_t i = c; i < d; ++i) {
            child_a[i] = parent_b[i];
            child_b[i] = parent_a[i];
        }
        return {std::move(child_a), std::move(child_b)};
    }

    std::pair<Coordinates, Coordinates> GA::crossover(const Coordinates& parent_a,
                                                      const Coordinates& parent_b) {
        std::uniform_int_distribution<std::size_t> cut(0, parent_a.size());
        const std::size_t c = cut(m_rng);
        const std::size_t d = cut(m_rng);
        return crossoverSegment(parent_a, parent_b, c, d);
    }

    void GA::mutate(Coordinates& child, Real rate, Real scale) {
        std::uniform_real_distribution<Real> u01(0.0, 1.0);
        if (u01(m_rng) >= rate) return;
        if (scale == 0.0) return;

        std::normal_distribution<Real> noise(0.0, scale);
        for (auto& gene : child) {
            gene += noise(m_rng);
        }
    }

    void GA::advanceGeneration(Real mutation_rate, Real mutation_scale, bool mutate_enabled) {
        validateMutation(mutation_rate, mutation_scale);

        const std::size_t size = m_population.size();
        const std::size_t half = size / 2;

        std::vector<Individual> next(size);

        // Selection + variation (m_population is read only until the swap below)
        for (std::size_t i = 0; i < half; ++i) {
            const Individual& parent_a = tournamentSelect();
            const Individual& parent_b = tournamentSelect();

            auto children = crossover(parent_a.genome, parent_b.genome);

            if (mutate_enabled) {
                mutate(children.first, mutation_rate, mutation_scale);
                mutate(children.second, mutation_rate, mutation_scale);
            }

            next[i].genome = std::move(children.first);
            next[i + half].genome = std::move(children.second);
        }

        for (auto& ind : next) {
            ind.fitness = m_fitness->evaluate(ind.genome);
        }

        m_current_best = next[fittestIndex(next)];
        m_population = std::move(next);
        ++m_current_iter;
    }

    void GA::step() {
        advanceGeneration(m_config.mutation_rate, m_config.mutation_scale, m_config.mutate);
    }

    Solution GA::getBestSolution() const {
        return Solution{m_current_best.genome, m_current_best.fitness};
    }

} //namespace optim
} //namespace evoswarm
