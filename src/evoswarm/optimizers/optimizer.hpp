#pragma once
#include "../types.hpp"
#include "../fitness/fitness_function.hpp"

#include <cstddef>
#include <memory>

namespace evoswarm::optim {

    using FitnessPtr = std::shared_ptr<const fitness::FitnessFunction>;

    /**
     * @brief Interface shared by the step-driven optimizers.
     *
     * An optimizer never loops on its own: the caller advances it with step()
     * (or optimize() for a fixed number of steps) and reads the state back in
     * between. Nothing here depends on timing or threads.
     */
    class Optimizer {
    public:
        virtual ~Optimizer() = default;

        // Advance by one unit (one swarm iteration / one generation) with the configured parameters
        virtual void step() = 0;

        // Rebuild the swarm/population from scratch and restart the iteration count
        virtual void reset() = 0;

        [[nodiscard]] virtual Solution getBestSolution() const = 0;

        void setCallback(StepCallback cb);

        /**
         * @brief Run step() a fixed number of times.
         * The callback, if any, fires after each step with the best solution.
         * @return Best solution after the last step.
         */
        Solution optimize(std::size_t iterations);

        // Number of completed steps since construction or the last reset()
        [[nodiscard]] std::size_t iteration() const { return m_current_iter; }

    protected:
        // Fills empty bounds with [0,1]^dim and checks them; throws ConfigurationError
        static void resolveBounds(Coordinates& lower, Coordinates& upper, std::size_t dim);

        // Throws ConfigurationError unless the fitness exists and accepts vectors of length dim
        static void requireFitness(const FitnessPtr& fitness, std::size_t dim);

        std::size_t m_current_iter = 0;
        StepCallback m_callback;
    };

} // namespace evoswarm::optim
