/**
 * @file benchmark_functions.hpp
 * @brief Closed-form test landscapes with known global minima.
 *
 * All of them have a global minimum value of 0:
 *   - MeanSquaredErrorToTarget: mean((x - t)^2), minimum at the target t.
 *   - Sphere:     sum(x_i^2).
 *   - Rastrigin:  A*n + sum(x_i^2 - A*cos(2*pi*x_i)), highly multimodal.
 *   - Ackley:     -20*exp(-0.2*sqrt(mean(x^2))) - exp(mean(cos(2*pi*x))) + 20 + e.
 *   - Rosenbrock: sum(100*(x_{i+1} - x_i^2)^2 + (1 - x_i)^2), narrow curved valley.
 *   - Himmelblau: (x^2 + y - 11)^2 + (x + y^2 - 7)^2, four global minima.
 */

#ifndef EVOSWARM_BENCHMARK_FUNCTIONS_HPP
#define EVOSWARM_BENCHMARK_FUNCTIONS_HPP

#include "fitness_function.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace evoswarm::fitness {

    /**
     * @brief Mean squared error between the point and a fixed target.
     * The target is fixed for the lifetime of the object; moving it means
     * building a new function.
     */
    class MeanSquaredErrorToTarget : public FitnessFunction {
    public:
        explicit MeanSquaredErrorToTarget(Coordinates target, Domain d = Domain{});

        Real evaluate(const Coordinates& point) const override;
        std::vector<Coordinates> minima() const override;
        Domain domain() const override { return m_domain; }
        std::size_t dimension() const override { return m_target.size(); }
        std::string name() const override { return "MeanSquaredErrorToTarget"; }

        [[nodiscard]] const Coordinates& target() const { return m_target; }

    private:
        const Coordinates m_target;
        const Domain m_domain;
    };

    class Sphere : public FitnessFunction {
    public:
        explicit Sphere(std::size_t dim = 2);

        Real evaluate(const Coordinates& point) const override;
        std::vector<Coordinates> minima() const override;
        Domain domain() const override { return Domain{-5.0, -5.0, 5.0, 5.0}; }
        std::size_t dimension() const override { return m_dim; }
        std::string name() const override { return "Sphere"; }

    private:
        const std::size_t m_dim;
    };

    class Rastrigin : public FitnessFunction {
    public:
        explicit Rastrigin(std::size_t dim = 2, Real A = 10.0);

        Real evaluate(const Coordinates& point) const override;
        std::vector<Coordinates> minima() const override;
        Domain domain() const override { return Domain{-5.12, -5.12, 5.12, 5.12}; }
        std::size_t dimension() const override { return m_dim; }
        std::string name() const override { return "Rastrigin"; }

    private:
        const std::size_t m_dim;
        const Real m_A;
    };

    class Ackley : public FitnessFunction {
    public:
        explicit Ackley(std::size_t dim = 2);

        Real evaluate(const Coordinates& point) const override;
        std::vector<Coordinates> minima() const override;
        Domain domain() const override { return Domain{-5.0, -5.0, 5.0, 5.0}; }
        std::size_t dimension() const override { return m_dim; }
        std::string name() const override { return "Ackley"; }

    private:
        const std::size_t m_dim;
    };

    class Rosenbrock : public FitnessFunction {
    public:
        // dim must be at least 2
        explicit Rosenbrock(std::size_t dim = 2);

        Real evaluate(const Coordinates& point) const override;
        std::vector<Coordinates> minima() const override;
        Domain domain() const override { return Domain{-2.0, -1.0, 2.0, 3.0}; }
        std::size_t dimension() const override { return m_dim; }
        std::string name() const override { return "Rosenbrock"; }

    private:
        const std::size_t m_dim;
    };

    // Two-dimensional only
    class Himmelblau : public FitnessFunction {
    public:
        Real evaluate(const Coordinates& point) const override;
        std::vector<Coordinates> minima() const override;
        Domain domain() const override { return Domain{-5.0, -5.0, 5.0, 5.0}; }
        std::size_t dimension() const override { return 2; }
        std::string name() const override { return "Himmelblau"; }
    };

} // namespace evoswarm::fitness

#endif // EVOSWARM_BENCHMARK_FUNCTIONS_HPP
