#include <catch2/catch.hpp>

#include <evoswarm/errors.hpp>
#include <evoswarm/fitness/benchmark_functions.hpp>
#include <evoswarm/fitness/expression_fitness.hpp>
#include <evoswarm/optimizers/PSO.hpp>

#include <memory>
#include <random>

using namespace evoswarm;
using evoswarm::fitness::ExpressionFitness;

TEST_CASE("A parsed Himmelblau matches the built-in one", "[expression]") {
    ExpressionFitness parsed("(x^2 + y - 11)^2 + (x + y^2 - 7)^2");
    fitness::Himmelblau builtin;

    CHECK(parsed.dimension() == 2);
    CHECK(parsed.expression() == "(x^2 + y - 11)^2 + (x + y^2 - 7)^2");
    for (const Coordinates& p : {Coordinates{0.0, 0.0}, Coordinates{3.0, 2.0},
                                 Coordinates{-1.5, 4.25}, Coordinates{2.5, -3.0}}) {
        CHECK(parsed.evaluate(p) == Approx(builtin.evaluate(p)));
    }
}

TEST_CASE("Variables can be named by index", "[expression]") {
    ExpressionFitness parsed("x0 * x1 + x2", 3);

    CHECK(parsed.dimension() == 3);
    CHECK(parsed.evaluate({2.0, 3.0, 4.0}) == Approx(10.0));
    // Same point twice gives the same value
    CHECK(parsed.evaluate({2.0, 3.0, 4.0}) == parsed({2.0, 3.0, 4.0}));
}

TEST_CASE("Malformed expressions are configuration errors", "[expression]") {
    CHECK_THROWS_AS(ExpressionFitness("x + * y"), ConfigurationError);
    CHECK_THROWS_AS(ExpressionFitness("x + 1", 0), ConfigurationError);
}

TEST_CASE("Points of the wrong length are evaluation errors", "[expression]") {
    ExpressionFitness parsed("x^2 + y^2");
    CHECK_THROWS_AS(parsed.evaluate({1.0}), EvaluationError);
    CHECK_THROWS_AS(parsed.evaluate({1.0, 2.0, 3.0}), EvaluationError);
}

TEST_CASE("PSO minimizes a parsed paraboloid", "[expression][convergence]") {
    auto parsed = std::make_shared<ExpressionFitness>("(x-1)^2 + (y+2)^2");

    optim::PSOConfig config;
    config.swarm_size = 40;
    config.init_lower = fitness::lowerBounds(parsed->domain(), 2);
    config.init_upper = fitness::upperBounds(parsed->domain(), 2);

    optim::PSO pso(parsed, config, std::mt19937(42));
    const Solution best = pso.optimize(200);

    CHECK(best.value < 1e-3);
    CHECK(best.params[0] == Approx(1.0).margin(0.05));
    CHECK(best.params[1] == Approx(-2.0).margin(0.05));
}
