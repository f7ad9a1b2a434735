//
// GA (Genetic Algorithm) console demo
//

#include "apps/benchmarks.hpp"
#include <chrono>
#include <filesystem>

namespace opt = evoswarm::optim;

evoswarm::Solution runGADemo(const opt::FitnessPtr& fitness,
                             const opt::GAConfig& config,
                             std::size_t generations,
                             bool useGnuplot) {
    std::cout << "=========================================" << std::endl;
    std::cout << "   Genetic Algorithm (GA)" << std::endl;
    std::cout << "=========================================" << std::endl;
    std::cout << "Function: " << fitness->name() << " (" << fitness->dimension() << "D)" << std::endl;

    opt::GA ga(fitness, config);

    const opt::GAConfig& cfg = ga.getConfig();
    std::cout << "Population: " << cfg.population_size
              << ", tournament: " << cfg.tournament_size
              << ", mutation: " << (cfg.mutate ? "on" : "off")
              << " (rate=" << cfg.mutation_rate << ", scale=" << cfg.mutation_scale << ")" << std::endl;

    const bool plot = useGnuplot && fitness->dimension() == 2;
    const std::string dir = "./ga_frames";
    const std::string baseName = dir + "/ga_vis";
    const std::string gridFile = dir + "/ga_grid.dat";
    const std::string minimaFile = dir + "/ga_minima.dat";

    auto genome = [](const opt::GA::Individual& ind) -> const evoswarm::Coordinates& { return ind.genome; };

    if (plot) {
        std::filesystem::create_directories(dir);
        std::cout << "Generating background grid (heatmap)..." << std::endl;
        evoswarm::plot::saveFunctionGrid(gridFile, *fitness);
        evoswarm::plot::saveMinima(minimaFile, *fitness);
        evoswarm::plot::saveFrame(baseName, 0, ga.getPopulation(), genome);
    }

    // No elitism: the generation best can get worse, so the best ever seen is tracked here
    evoswarm::Solution best_seen = ga.getBestSolution();

    ga.setCallback([&](const evoswarm::Solution& current, std::size_t gen) {
        if (current.isBetterThan(best_seen)) best_seen = current;
        if (plot) {
            evoswarm::plot::saveFrame(baseName, gen + 1, ga.getPopulation(), genome);
        }
        if (gen % 10 == 0) {
            std::cout << "[GA | Generation " << std::setw(4) << gen << "] "
                      << "Current best: " << std::scientific << std::setprecision(5)
                      << current.value << std::defaultfloat << std::endl;
        }
    });

    auto start = std::chrono::high_resolution_clock::now();
    evoswarm::Solution last = ga.optimize(generations);
    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double, std::milli> duration = end - start;

    std::cout << "\nOptimization Completed in " << duration.count() << " ms." << std::endl;
    printSolution("Last generation best", last);
    printSolution("Best seen", best_seen);

    if (plot) {
        std::cout << "Launching Gnuplot animation..." << std::endl;
        evoswarm::plot::createAnimationScript("run_ga.gp", gridFile, minimaFile, baseName,
                                              generations + 1, "GA " + fitness->name(), fitness->domain());
    }
    return best_seen;
}
