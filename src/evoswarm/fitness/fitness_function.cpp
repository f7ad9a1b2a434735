#include "fitness_function.hpp"
#include "../errors.hpp"

#include <string>

namespace evoswarm{
namespace fitness{

    Coordinates lowerBounds(const Domain& d, std::size_t dim) {
        Coordinates lower(dim);
        for (std::size_t i = 0; i < dim; ++i) {
            lower[i] = (i % 2 == 0) ? d.min_x : d.min_y;
        }
        return lower;
    }

    Coordinates upperBounds(const Domain& d, std::size_t dim) {
        Coordinates upper(dim);
        for (std::size_t i = 0; i < dim; ++i) {
            upper[i] = (i % 2 == 0) ? d.max_x : d.max_y;
        }
        return upper;
    }

    void FitnessFunction::checkDimension(const Coordinates& point) const {
        if (point.size() != dimension()) {
            throw EvaluationError(name() + ": expected a point of dimension " +
                                  std::to_string(dimension()) + ", got " +
                                  std::to_string(point.size()));
        }
    }

} //namespace fitness
} //namespace evoswarm
