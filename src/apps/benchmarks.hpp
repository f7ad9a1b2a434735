//
// Console drivers for the optimizers.
//

#ifndef EVOSWARM_APPS_BENCHMARKS_HPP
#define EVOSWARM_APPS_BENCHMARKS_HPP

#include <evoswarm/fitness/fitness_factory.hpp>
#include <evoswarm/fitness/fitness_function.hpp>
#include <evoswarm/optimizers/PSO.hpp>
#include <evoswarm/optimizers/GA.hpp>
#include <evoswarm/rng/rng_factory.hpp>
#include <evoswarm/utils/plotter.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iostream>
#include <iomanip>
#include <string>

// Builds one fitness function per optimizer run (parsed functions are not shareable across threads)
using FitnessFactory = std::function<evoswarm::optim::FitnessPtr()>;

enum class Algorithm { PSO, GA };

// Summary of repeated independent runs
struct TrialStats {
    std::size_t trials = 0;
    double min = 0.0;
    double mean = 0.0;
    double max = 0.0;
};

void printSolution(const std::string& label, const evoswarm::Solution& sol);

// --- PSO demo ---
// (Implemented in benchmarks/pso_benchmarks.cpp)
evoswarm::Solution runPSODemo(const evoswarm::optim::FitnessPtr& fitness,
                              const evoswarm::optim::PSOConfig& config,
                              std::size_t iterations,
                              bool useGnuplot);

// --- GA demo ---
// (Implemented in benchmarks/ga_benchmarks.cpp)
evoswarm::Solution runGADemo(const evoswarm::optim::FitnessPtr& fitness,
                             const evoswarm::optim::GAConfig& config,
                             std::size_t generations,
                             bool useGnuplot);

// --- Repeated trials ---
// (Implemented in benchmarks/trials.cpp)
TrialStats runTrials(Algorithm algorithm,
                     const FitnessFactory& makeFitness,
                     std::size_t trials,
                     std::size_t iterations,
                     std::uint64_t seed);

#endif // EVOSWARM_APPS_BENCHMARKS_HPP
