#include "benchmark_functions.hpp"
#include "../errors.hpp"

#include <cmath>
#include <utility>

namespace evoswarm{
namespace fitness{

    namespace {
        constexpr Real PI = 3.14159265358979323846;
        constexpr Real E  = 2.71828182845904523536;

        void requirePositiveDimension(std::size_t dim, const char* who) {
            if (dim == 0) {
                throw ConfigurationError(std::string(who) + ": dimension must be > 0.");
            }
        }
    }

    // --- MeanSquaredErrorToTarget ---

    MeanSquaredErrorToTarget::MeanSquaredErrorToTarget(Coordinates target, Domain d)
        : m_target(std::move(target)), m_domain(d)
    {
        requirePositiveDimension(m_target.size(), "MeanSquaredErrorToTarget");
    }

    Real MeanSquaredErrorToTarget::evaluate(const Coordinates& point) const {
        checkDimension(point);
        Real sum = 0.0;
        for (std::size_t i = 0; i < point.size(); ++i) {
            const Real diff = point[i] - m_target[i];
            sum += diff * diff;
        }
        return sum / static_cast<Real>(point.size());
    }

    std::vector<Coordinates> MeanSquaredErrorToTarget::minima() const {
        return {m_target};
    }

    // --- Sphere ---

    Sphere::Sphere(std::size_t dim) : m_dim(dim) {
        requirePositiveDimension(dim, "Sphere");
    }

    Real Sphere::evaluate(const Coordinates& point) const {
        checkDimension(point);
        Real sum = 0.0;
        for (auto val : point) sum += val * val;
        return sum;
    }

    std::vector<Coordinates> Sphere::minima() const {
        return {Coordinates(m_dim, 0.0)};
    }

    // --- Rastrigin ---

    Rastrigin::Rastrigin(std::size_t dim, Real A) : m_dim(dim), m_A(A) {
        requirePositiveDimension(dim, "Rastrigin");
    }

    Real Rastrigin::evaluate(const Coordinates& point) const {
        checkDimension(point);
        Real sum = 0.0;
        for (auto x : point) sum += (x * x) - (m_A * std::cos(2.0 * PI * x));
        return m_A * static_cast<Real>(m_dim) + sum;
    }

    std::vector<Coordinates> Rastrigin::minima() const {
        return {Coordinates(m_dim, 0.0)};
    }

    // --- Ackley ---

    Ackley::Ackley(std::size_t dim) : m_dim(dim) {
        requirePositiveDimension(dim, "Ackley");
    }

    Real Ackley::evaluate(const Coordinates& point) const {
        checkDimension(point);
        const Real n = static_cast<Real>(point.size());
        Real sum_sq = 0.0;
        Real sum_cos = 0.0;
        for (auto x : point) {
            sum_sq += x * x;
            sum_cos += std::cos(2.0 * PI * x);
        }
        return -20.0 * std::exp(-0.2 * std::sqrt(sum_sq / n))
               - std::exp(sum_cos / n) + 20.0 + E;
    }

    std::vector<Coordinates> Ackley::minima() const {
        return {Coordinates(m_dim, 0.0)};
    }

    // --- Rosenbrock ---

    Rosenbrock::Rosenbrock(std::size_t dim) : m_dim(dim) {
        if (dim < 2) {
            throw ConfigurationError("Rosenbrock: dimension must be >= 2.");
        }
    }

    Real Rosenbrock::evaluate(const Coordinates& point) const {
        checkDimension(point);
        Real sum = 0.0;
        for (std::size_t i = 0; i + 1 < point.size(); ++i) {
            const Real a = point[i + 1] - point[i] * point[i];
            const Real b = 1.0 - point[i];
            sum += 100.0 * a * a + b * b;
        }
        return sum;
    }

    std::vector<Coordinates> Rosenbrock::minima() const {
        return {Coordinates(m_dim, 1.0)};
    }

    // --- Himmelblau ---

    Real Himmelblau::evaluate(const Coordinates& point) const {
        checkDimension(point);
        const Real x = point[0];
        const Real y = point[1];
        const Real a = x * x + y - 11.0;
        const Real b = x + y * y - 7.0;
        return a * a + b * b;
    }

    std::vector<Coordinates> Himmelblau::minima() const {
        return {
            { 3.0,                2.0              },
            {-2.805118086952745,  3.131312518250573},
            {-3.779310253377747, -3.283185991286170},
            { 3.584428340330492, -1.848126526964404}
        };
    }

} //namespace fitness
} //namespace evoswarm
