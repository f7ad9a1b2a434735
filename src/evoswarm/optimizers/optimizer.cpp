#include "optimizer.hpp"
#include "../errors.hpp"

#include <cmath>
#include <string>
#include <utility>

namespace evoswarm{
namespace optim{

    void Optimizer::setCallback(StepCallback cb) {
        m_callback = std::move(cb);
    }

    Solution Optimizer::optimize(std::size_t iterations) {
        for (std::size_t i = 0; i < iterations; ++i) {
            step();
            if (m_callback) {
                m_callback(getBestSolution(), i);
            }
        }
        return getBestSolution();
    }

    void Optimizer::resolveBounds(Coordinates& lower, Coordinates& upper, std::size_t dim) {
        if (lower.empty() && upper.empty()) {
            lower.assign(dim, 0.0);
            upper.assign(dim, 1.0);
            return;
        }
        if (lower.size() != dim || upper.size() != dim) {
            throw ConfigurationError("Lower and Upper bounds must have the same dimension as the vectors ("
                                     + std::to_string(dim) + ").");
        }
        for (std::size_t i = 0; i < dim; ++i) {
            if (!std::isfinite(lower[i]) || !std::isfinite(upper[i]) || lower[i] > upper[i]) {
                throw ConfigurationError("Invalid bounds on dimension " + std::to_string(i) + ".");
            }
        }
    }

    void Optimizer::requireFitness(const FitnessPtr& fitness, std::size_t dim) {
        if (!fitness) throw ConfigurationError("Fitness function not set.");
        if (dim == 0) throw ConfigurationError("Vector length must be > 0.");
        if (fitness->dimension() != dim) {
            throw ConfigurationError("Vector length " + std::to_string(dim) + " does not match " +
                                     fitness->name() + " dimension " +
                                     std::to_string(fitness->dimension()) + ".");
        }
    }

} //namespace optim
} //namespace evoswarm
