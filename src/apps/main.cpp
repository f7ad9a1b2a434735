#include <algorithm>
#include <cctype>
#include <iostream>
#include <string>
#include <limits>
#include <vector>
#include <stdexcept>
#include <sstream>

#include "apps/benchmarks.hpp"

namespace opt = evoswarm::optim;
namespace fit = evoswarm::fitness;

// Steps run by the single-run modes
constexpr std::size_t PSO_ITERATIONS = 200;
constexpr std::size_t GA_GENERATIONS = 50;
constexpr std::size_t N_TRIALS = 32;


// --- FUNCTION PROTOTYPES ---
std::string askFunctionName();
evoswarm::Coordinates askTarget();
opt::FitnessPtr buildFitness(const std::string& name, const evoswarm::Coordinates& target);


// --- MAIN ---

int main() {
    std::cout << "===========================================" << std::endl;
    std::cout << "   evoswarm: PSO and GA playground" << std::endl;
    std::cout << "===========================================" << std::endl;

    // Mode choice
    std::cout << "Select mode:" << std::endl;
    std::cout << "1. Particle Swarm Optimization (" << PSO_ITERATIONS << " iterations)" << std::endl;
    std::cout << "2. Genetic Algorithm (" << GA_GENERATIONS << " generations)" << std::endl;
    std::cout << "3. Repeated trials of both (" << N_TRIALS << " runs each)" << std::endl;
    std::cout << "Choice: ";

    int choice;
    if (!(std::cin >> choice) || choice < 1 || choice > 3) {
        std::cerr << "Invalid choice selected." << std::endl;
        return 1;
    }
    // Clears buffer until next line
    std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');

    try {
        const std::string name = askFunctionName();
        const evoswarm::Coordinates target = (name == "mse") ? askTarget() : evoswarm::Coordinates{};
        const opt::FitnessPtr fitness = buildFitness(name, target);

        std::cout << "Seed (integer, default " << evoswarm::rng::get_global_seed() << "): ";
        std::string seedLine;
        std::getline(std::cin, seedLine);
        if (!seedLine.empty()) {
            evoswarm::rng::set_global_seed(static_cast<std::uint32_t>(std::stoul(seedLine)));
        }

        if (choice == 3) {
            FitnessFactory factory = [name, target]() { return buildFitness(name, target); };
            std::cout << "\n--- PSO ---" << std::endl;
            runTrials(Algorithm::PSO, factory, N_TRIALS, PSO_ITERATIONS, evoswarm::rng::get_global_seed());
            std::cout << "\n--- GA ---" << std::endl;
            runTrials(Algorithm::GA, factory, N_TRIALS, GA_GENERATIONS, evoswarm::rng::get_global_seed());
            return 0;
        }

        // Choice of visualizing with gnuPlot
        std::cout << "Enable Gnuplot animation? (y/n): ";
        char gpChoice = 'n';
        std::cin >> gpChoice;
        bool useGnuplot = (gpChoice == 'y' || gpChoice == 'Y');
        if (useGnuplot) evoswarm::plot::closeGnuplotWindows();

        const std::size_t dim = fitness->dimension();
        const fit::Domain domain = fitness->domain();

        if (choice == 1) {
            opt::PSOConfig config;
            config.vector_length = dim;
            config.init_lower = fit::lowerBounds(domain, dim);
            config.init_upper = fit::upperBounds(domain, dim);
            runPSODemo(fitness, config, PSO_ITERATIONS, useGnuplot);
        } else {
            opt::GAConfig config;
            config.vector_length = dim;
            config.init_lower = fit::lowerBounds(domain, dim);
            config.init_upper = fit::upperBounds(domain, dim);
            runGADemo(fitness, config, GA_GENERATIONS, useGnuplot);
        }

        std::cout << "Known minima of " << fitness->name() << ":" << std::endl;
        for (const auto& m : fitness->minima()) {
            printSolution("  f(min) =", evoswarm::Solution{m, fitness->evaluate(m)});
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}

// --- FUNCTION IMPLEMENTATIONS ---

std::string askFunctionName() {
    std::cout << "Fitness function [";
    const auto names = fit::availableFunctions();
    for (std::size_t i = 0; i < names.size(); ++i) {
        std::cout << names[i] << (i + 1 < names.size() ? ", " : "");
    }
    std::cout << "] (default mse): ";

    std::string name;
    std::getline(std::cin, name);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return name.empty() ? "mse" : name;
}

evoswarm::Coordinates askTarget() {
    std::cout << "Target x y (default 0.5 0.5): ";
    std::string line;
    std::getline(std::cin, line);
    if (line.empty()) return {0.5, 0.5};

    std::istringstream in(line);
    double x = 0.0, y = 0.0;
    if (!(in >> x >> y)) {
        throw std::runtime_error("Invalid target: " + line);
    }
    return {x, y};
}

opt::FitnessPtr buildFitness(const std::string& name, const evoswarm::Coordinates& target) {
    return fit::makeFitness(name, 2, target);
}
