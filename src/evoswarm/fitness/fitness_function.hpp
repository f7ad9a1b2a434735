/**
 * @file fitness_function.hpp
 * @brief Common interface of every objective the optimizers minimize.
 */

#ifndef EVOSWARM_FITNESS_FUNCTION_HPP
#define EVOSWARM_FITNESS_FUNCTION_HPP

#include "../types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace evoswarm::fitness {

    /**
     * @brief Axis-aligned 2D bounds of the interesting part of a landscape.
     */
    struct Domain {
        Real min_x = 0.0;
        Real min_y = 0.0;
        Real max_x = 1.0;
        Real max_y = 1.0;
    };

    // Per-dimension bounds from a 2D domain: even indices take the x range, odd ones the y range
    Coordinates lowerBounds(const Domain& d, std::size_t dim);
    Coordinates upperBounds(const Domain& d, std::size_t dim);

    /**
     * @class FitnessFunction
     * @brief Scalar function to minimize over fixed-length real vectors.
     *
     * @details Implementations are immutable once built: evaluate() depends only
     * on its argument and on the configuration given to the constructor.
     * Points outside domain() are evaluated like any other point.
     */
    class FitnessFunction {
    public:
        virtual ~FitnessFunction() = default;

        /**
         * @brief Fitness of a point (lower is better).
         * @throws EvaluationError if the point cannot be scored (e.g. wrong length).
         */
        virtual Real evaluate(const Coordinates& point) const = 0;

        // Known global minimizers, for validation and plotting only
        virtual std::vector<Coordinates> minima() const = 0;

        virtual Domain domain() const = 0;

        // Length of the vectors evaluate() accepts
        virtual std::size_t dimension() const = 0;

        virtual std::string name() const = 0;

        Real operator()(const Coordinates& point) const { return evaluate(point); }

    protected:
        // Throws EvaluationError unless point.size() == dimension()
        void checkDimension(const Coordinates& point) const;
    };

} // namespace evoswarm::fitness

#endif // EVOSWARM_FITNESS_FUNCTION_HPP
