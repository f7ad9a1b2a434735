#include <catch2/catch.hpp>

#include "test_helpers.hpp"

#include <evoswarm/errors.hpp>
#include <evoswarm/fitness/benchmark_functions.hpp>
#include <evoswarm/optimizers/PSO.hpp>

#include <algorithm>
#include <limits>
#include <memory>
#include <random>
#include <vector>

using namespace evoswarm;
using evoswarm::optim::PSO;
using evoswarm::optim::PSOConfig;
using evoswarm::optim::PSOWeights;

namespace {

    std::vector<Coordinates> positionsOf(const PSO& pso) {
        std::vector<Coordinates> out;
        for (const auto& p : pso.getParticles()) out.push_back(p.position);
        return out;
    }

    // v == k * (target - from) for some k >= 0 (2D)
    void checkPullsTowards(const Coordinates& v, const Coordinates& target, const Coordinates& from) {
        const Real dx = target[0] - from[0];
        const Real dy = target[1] - from[1];
        CHECK(v[0] * dy - v[1] * dx == Approx(0.0).margin(1e-9));
        CHECK(v[0] * dx + v[1] * dy >= -1e-12);
    }

}

TEST_CASE("A new swarm starts still, inside the unit cube, with evaluated personal bests", "[pso]") {
    auto fitness = test::targetHalf();
    PSOConfig config;
    config.swarm_size = 10;

    PSO pso(fitness, config, std::mt19937(7));

    REQUIRE(pso.getParticles().size() == 10);
    CHECK(pso.getGlobalFittestIndex() < 10);
    CHECK(pso.iteration() == 0);

    for (std::size_t i = 0; i < pso.getParticles().size(); ++i) {
        const auto& p = pso.getParticles()[i];
        CHECK(p.id == i);
        REQUIRE(p.position.size() == 2);
        CHECK(p.velocity == Coordinates{0.0, 0.0});
        for (auto x : p.position) {
            CHECK(x >= 0.0);
            CHECK(x <= 1.0);
        }
        CHECK(p.best_position == p.position);
        CHECK(p.best_fitness == fitness->evaluate(p.position));
        CHECK(p.previous_fitness == p.best_fitness);
    }
}

TEST_CASE("Initial positions follow the configured bounds", "[pso]") {
    PSOConfig config;
    config.swarm_size = 30;
    config.init_lower = {-5.0, 10.0};
    config.init_upper = {-4.0, 12.0};

    PSO pso(std::make_shared<fitness::Sphere>(2), config, std::mt19937(3));
    CHECK(pso.getConfig().swarm_size == 30);
    CHECK(pso.getConfig().init_lower == Coordinates{-5.0, 10.0});

    for (const auto& p : pso.getParticles()) {
        CHECK(p.position[0] >= -5.0);
        CHECK(p.position[0] <= -4.0);
        CHECK(p.position[1] >= 10.0);
        CHECK(p.position[1] <= 12.0);
    }
}

TEST_CASE("Invalid PSO configurations are rejected at construction", "[pso]") {
    auto fitness = test::targetHalf();

    SECTION("missing fitness") {
        CHECK_THROWS_AS(PSO(nullptr, PSOConfig{}), ConfigurationError);
    }
    SECTION("empty swarm") {
        PSOConfig config;
        config.swarm_size = 0;
        CHECK_THROWS_AS(PSO(fitness, config), ConfigurationError);
    }
    SECTION("zero vector length") {
        PSOConfig config;
        config.vector_length = 0;
        CHECK_THROWS_AS(PSO(fitness, config), ConfigurationError);
    }
    SECTION("vector length differs from the fitness dimension") {
        PSOConfig config;
        config.vector_length = 3;
        CHECK_THROWS_AS(PSO(fitness, config), ConfigurationError);
    }
    SECTION("negative weight") {
        PSOConfig config;
        config.weights.follow_social_best = -0.1;
        CHECK_THROWS_AS(PSO(fitness, config), ConfigurationError);
    }
    SECTION("bounds of the wrong length or reversed") {
        PSOConfig config;
        config.init_lower = {0.0};
        config.init_upper = {1.0};
        CHECK_THROWS_AS(PSO(fitness, config), ConfigurationError);

        config.init_lower = {1.0, 0.0};
        config.init_upper = {0.0, 1.0};
        CHECK_THROWS_AS(PSO(fitness, config), ConfigurationError);
    }
}

TEST_CASE("Invalid weights are rejected before the swarm moves", "[pso]") {
    PSO pso(test::targetHalf(), PSOConfig{}, std::mt19937(1));
    const auto before = positionsOf(pso);

    PSOWeights w;
    w.scale_update_step = std::numeric_limits<Real>::quiet_NaN();
    CHECK_THROWS_AS(pso.improve(w), ConfigurationError);
    CHECK(positionsOf(pso) == before);
    CHECK(pso.iteration() == 0);
}

TEST_CASE("Displacement uses the velocity from before the step", "[pso]") {
    PSO pso(test::targetHalf(), PSOConfig{}, std::mt19937(11));
    const auto initial = positionsOf(pso);

    // Velocities start at zero, so the first step cannot move anything
    pso.stepSwarm(PSOWeights{});
    CHECK(positionsOf(pso) == initial);

    bool any_velocity = false;
    for (const auto& p : pso.getParticles()) {
        for (auto v : p.velocity) any_velocity = any_velocity || v != 0.0;
    }
    CHECK(any_velocity);

    // The second step moves each particle by exactly velocity * scale
    const auto particles = pso.getParticles();
    PSOWeights w;
    w.scale_update_step = 0.5;
    pso.stepSwarm(w);
    for (std::size_t i = 0; i < particles.size(); ++i) {
        for (std::size_t d = 0; d < 2; ++d) {
            CHECK(pso.getParticles()[i].position[d] ==
                  Approx(particles[i].position[d] + particles[i].velocity[d] * 0.5));
        }
    }
}

TEST_CASE("Every particle follows the bests as they were before the step", "[pso]") {
    SECTION("fittest informant") {
        PSOConfig config;
        config.swarm_size = 2;
        config.num_informants = 50;   // both particles are drawn
        PSO pso(std::make_shared<fitness::Sphere>(2), config, std::mt19937(13));

        // Get the particles moving so that personal bests change during the checked step
        for (int i = 0; i < 3; ++i) pso.stepSwarm(PSOWeights{});

        const auto& before = pso.getParticles();
        const std::size_t fitter = before[0].best_fitness <= before[1].best_fitness ? 0 : 1;
        const Coordinates informant_best = before[fitter].best_position;

        pso.stepSwarm(PSOWeights{0.0, 0.0, 0.9, 0.0, 1.0});

        for (const auto& p : pso.getParticles()) {
            checkPullsTowards(p.velocity, informant_best, p.position);
        }
    }
    SECTION("global fittest") {
        PSOConfig config;
        config.swarm_size = 6;
        PSO pso(std::make_shared<fitness::Sphere>(2), config, std::mt19937(29));

        for (int i = 0; i < 3; ++i) pso.improve(PSOWeights{});

        const Coordinates global_best = pso.getGlobalFittest().best_position;

        pso.stepSwarm(PSOWeights{0.0, 0.0, 0.0, 1.5, 1.0});

        for (const auto& p : pso.getParticles()) {
            checkPullsTowards(p.velocity, global_best, p.position);
        }
    }
}

TEST_CASE("Zero weights keep the swarm frozen", "[pso]") {
    PSO pso(test::targetHalf(), PSOConfig{}, std::mt19937(5));
    const auto initial = positionsOf(pso);

    const PSOWeights frozen{0.0, 0.0, 0.0, 0.0, 1.0};
    for (int i = 0; i < 5; ++i) pso.improve(frozen);

    CHECK(positionsOf(pso) == initial);
    for (const auto& p : pso.getParticles()) {
        CHECK(p.velocity == Coordinates{0.0, 0.0});
    }
}

TEST_CASE("Personal best fitness never increases", "[pso]") {
    PSOConfig config;
    config.swarm_size = 20;
    PSO pso(std::make_shared<fitness::Rastrigin>(2), config, std::mt19937(21));

    std::vector<Real> previous;
    for (const auto& p : pso.getParticles()) previous.push_back(p.best_fitness);

    // Large steps so that many moves are worse than the personal best
    const PSOWeights wild{0.9, 3.0, 3.0, 1.0, 1.0};
    for (int step = 0; step < 40; ++step) {
        pso.stepSwarm(wild);
        for (std::size_t i = 0; i < previous.size(); ++i) {
            const auto& p = pso.getParticles()[i];
            CHECK(p.best_fitness <= previous[i]);
            CHECK(p.best_fitness == pso.getFitness().evaluate(p.best_position));
            CHECK(p.previous_fitness == pso.getFitness().evaluate(p.position));
            previous[i] = p.best_fitness;
        }
    }
}

TEST_CASE("After a refresh the global fittest has the lowest personal best", "[pso]") {
    PSOConfig config;
    config.swarm_size = 15;
    PSO pso(std::make_shared<fitness::Himmelblau>(), config, std::mt19937(99));

    for (int step = 0; step < 30; ++step) {
        pso.stepSwarm(config.weights);
        pso.refreshGlobalBest();

        const Real global = pso.getGlobalFittest().best_fitness;
        for (const auto& p : pso.getParticles()) {
            CHECK(global <= p.best_fitness);
        }
        CHECK(pso.getBestSolution().value == global);
        CHECK(pso.getBestSolution().params == pso.getGlobalFittest().best_position);
    }

    // Nothing better left to find without moving
    CHECK_FALSE(pso.refreshGlobalBest());
}

TEST_CASE("Without random informants each particle is its own informant", "[pso]") {
    PSOConfig config;
    config.num_informants = 0;
    PSO pso(test::targetHalf(), config, std::mt19937(8));

    Real initial_best = std::numeric_limits<Real>::infinity();
    for (const auto& p : pso.getParticles()) initial_best = std::min(initial_best, p.best_fitness);

    // Personal bests start at the positions, so only the informant term could move a particle
    pso.stepSwarm(PSOWeights{0.7, 2.0, 0.9, 0.0, 0.7});
    pso.stepSwarm(PSOWeights{0.7, 2.0, 0.9, 0.0, 0.7});
    for (const auto& p : pso.getParticles()) {
        CHECK(p.velocity == Coordinates{0.0, 0.0});
    }

    REQUIRE_NOTHROW(pso.optimize(50));
    CHECK(pso.iteration() == 52);
    CHECK(pso.getBestSolution().value <= initial_best);
}

TEST_CASE("PSO converges on the mean squared error to (0.5, 0.5)", "[pso][convergence]") {
    PSOConfig config;
    config.swarm_size = 25;
    const PSOWeights standard{0.7, 2.0, 0.9, 0.0, 0.7};

    PSO pso(test::targetHalf(), config, std::mt19937(42));
    for (int i = 0; i < 200; ++i) pso.improve(standard);

    CHECK(pso.getGlobalFittest().best_fitness < 1e-4);
    CHECK(pso.getBestSolution().params[0] == Approx(0.5).margin(0.02));
    CHECK(pso.getBestSolution().params[1] == Approx(0.5).margin(0.02));
}

TEST_CASE("Same engine seed gives the same run", "[pso]") {
    PSO a(test::targetHalf(), PSOConfig{}, std::mt19937(1234));
    PSO b(test::targetHalf(), PSOConfig{}, std::mt19937(1234));

    a.optimize(25);
    b.optimize(25);

    CHECK(positionsOf(a) == positionsOf(b));
    CHECK(a.getGlobalFittestIndex() == b.getGlobalFittestIndex());
    CHECK(a.getBestSolution().value == b.getBestSolution().value);
}

TEST_CASE("A failing evaluation leaves the swarm as it was", "[pso]") {
    auto fitness = std::make_shared<test::FailingFitness>(1000);
    PSOConfig config;
    config.swarm_size = 10;
    PSO pso(fitness, config, std::mt19937(17));

    pso.optimize(3);
    const auto positions = positionsOf(pso);
    const auto global = pso.getGlobalFittestIndex();

    // Fail halfway through the sweep
    fitness->allow(5);
    CHECK_THROWS_AS(pso.step(), EvaluationError);

    CHECK(positionsOf(pso) == positions);
    CHECK(pso.getGlobalFittestIndex() == global);
    CHECK(pso.iteration() == 3);
}

TEST_CASE("optimize reports every step and reset starts over", "[pso]") {
    PSO pso(test::targetHalf(), PSOConfig{}, std::mt19937(2));

    std::vector<std::size_t> seen;
    Real last = std::numeric_limits<Real>::infinity();
    pso.setCallback([&](const Solution& best, std::size_t iter) {
        seen.push_back(iter);
        CHECK(best.value <= last);
        last = best.value;
    });

    const Solution best = pso.optimize(10);
    CHECK(seen == std::vector<std::size_t>{0, 1, 2, 3, 4, 5, 6, 7, 8, 9});
    CHECK(best.value == last);
    CHECK(pso.iteration() == 10);

    const auto before = positionsOf(pso);
    pso.reset();
    CHECK(pso.iteration() == 0);
    CHECK(positionsOf(pso) != before);
    for (const auto& p : pso.getParticles()) {
        CHECK(p.velocity == Coordinates{0.0, 0.0});
    }
}
