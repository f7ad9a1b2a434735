//
// Repeated independent runs of one optimizer, spread over threads with OpenMP.
// Every run owns its optimizer, its fitness function and its engine, so the
// optimizers themselves stay single-threaded.
//

#include "apps/benchmarks.hpp"
#include <evoswarm/rng/rngManager.hpp>
#include <algorithm>
#include <chrono>
#include <numeric>
#include <utility>
#include <stdexcept>
#include <vector>

#ifdef _OPENMP
  #include <omp.h>
#endif

namespace opt = evoswarm::optim;

namespace {

    // Best value reached by one run; for the GA the best generation seen, since it has no elitism
    double runOnce(Algorithm algorithm, const opt::FitnessPtr& fitness,
                   std::size_t iterations, evoswarm::rng::Engine engine) {
        const std::size_t dim = fitness->dimension();
        const evoswarm::fitness::Domain d = fitness->domain();

        if (algorithm == Algorithm::PSO) {
            opt::PSOConfig config;
            config.vector_length = dim;
            config.init_lower = evoswarm::fitness::lowerBounds(d, dim);
            config.init_upper = evoswarm::fitness::upperBounds(d, dim);

            opt::PSO pso(fitness, config, std::move(engine));
            return pso.optimize(iterations).value;
        }

        opt::GAConfig config;
        config.vector_length = dim;
        config.init_lower = evoswarm::fitness::lowerBounds(d, dim);
        config.init_upper = evoswarm::fitness::upperBounds(d, dim);

        opt::GA ga(fitness, config, std::move(engine));
        double best = ga.getBestSolution().value;
        ga.setCallback([&best](const evoswarm::Solution& s, std::size_t) {
            best = std::min(best, s.value);
        });
        ga.optimize(iterations);
        return best;
    }

}

TrialStats runTrials(Algorithm algorithm,
                     const FitnessFactory& makeFitness,
                     std::size_t trials,
                     std::size_t iterations,
                     std::uint64_t seed) {
    if (trials == 0) throw std::invalid_argument("Number of trials must be > 0.");

    const evoswarm::rng::RngManager manager(seed);
    std::vector<double> results(trials, 0.0);
    std::vector<std::string> errors(trials);

    std::cout << "Running " << trials << " independent "
              << (algorithm == Algorithm::PSO ? "PSO" : "GA") << " runs of "
              << iterations << " steps";
#ifdef _OPENMP
    std::cout << " on up to " << omp_get_max_threads() << " threads";
#endif
    std::cout << "..." << std::endl;

    auto start = std::chrono::high_resolution_clock::now();

    // Engines depend on the run index only, so results do not depend on the thread count
    #ifdef _OPENMP
    #pragma omp parallel for schedule(dynamic)
    #endif
    for (int t = 0; t < static_cast<int>(trials); ++t) {
        const auto idx = static_cast<std::size_t>(t);
        try {
            results[idx] = runOnce(algorithm, makeFitness(), iterations, manager.make_rng(0, t));
        } catch (const std::exception& e) {
            // Exceptions must not leave the parallel region; rethrown below
            errors[idx] = e.what();
        }
    }

    for (std::size_t i = 0; i < trials; ++i) {
        if (!errors[i].empty()) {
            throw std::runtime_error("Run " + std::to_string(i) + " failed: " + errors[i]);
        }
    }

    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double, std::milli> duration = end - start;

    TrialStats stats;
    stats.trials = trials;
    stats.min = *std::min_element(results.begin(), results.end());
    stats.max = *std::max_element(results.begin(), results.end());
    stats.mean = std::accumulate(results.begin(), results.end(), 0.0) / static_cast<double>(trials);

    std::cout << "Completed in " << duration.count() << " ms." << std::endl;
    std::cout << std::scientific << std::setprecision(4)
              << "Best value  min: " << stats.min
              << "  mean: " << stats.mean
              << "  max: " << stats.max << std::defaultfloat << std::endl;
    return stats;
}
