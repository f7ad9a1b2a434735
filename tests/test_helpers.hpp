#ifndef EVOSWARM_TEST_HELPERS_HPP
#define EVOSWARM_TEST_HELPERS_HPP

#include <evoswarm/errors.hpp>
#include <evoswarm/fitness/benchmark_functions.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace evoswarm::test {

    // Sphere that starts failing after a given number of evaluations
    class FailingFitness : public fitness::FitnessFunction {
    public:
        explicit FailingFitness(std::size_t calls_before_failure)
            : m_remaining(calls_before_failure) {}

        Real evaluate(const Coordinates& point) const override {
            if (m_remaining == 0) throw EvaluationError("point rejected");
            --m_remaining;
            return m_sphere.evaluate(point);
        }

        std::vector<Coordinates> minima() const override { return m_sphere.minima(); }
        fitness::Domain domain() const override { return m_sphere.domain(); }
        std::size_t dimension() const override { return 2; }
        std::string name() const override { return "FailingFitness"; }

        void allow(std::size_t calls) { m_remaining = calls; }

    private:
        fitness::Sphere m_sphere{2};
        mutable std::size_t m_remaining;
    };

    inline std::shared_ptr<const fitness::FitnessFunction> targetHalf() {
        return std::make_shared<fitness::MeanSquaredErrorToTarget>(Coordinates{0.5, 0.5});
    }

} // namespace evoswarm::test

#endif // EVOSWARM_TEST_HELPERS_HPP
