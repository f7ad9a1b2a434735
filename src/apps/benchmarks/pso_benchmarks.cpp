//
// PSO (Particle Swarm Optimization) console demo
//

#include "apps/benchmarks.hpp"
#include <chrono>
#include <filesystem>

namespace opt = evoswarm::optim;

void printSolution(const std::string& label, const evoswarm::Solution& sol) {
    std::cout << label << " Value: " << std::scientific << std::setprecision(6)
              << sol.value << std::defaultfloat << std::endl;
    std::cout << label << " Position: [ ";
    for (auto val : sol.params) {
        std::cout << std::fixed << std::setprecision(5) << val << " ";
    }
    std::cout << "]" << std::defaultfloat << std::endl;
}

evoswarm::Solution runPSODemo(const opt::FitnessPtr& fitness,
                              const opt::PSOConfig& config,
                              std::size_t iterations,
                              bool useGnuplot) {
    std::cout << "===========================================" << std::endl;
    std::cout << "   Particle Swarm Optimization (PSO)" << std::endl;
    std::cout << "===========================================" << std::endl;
    std::cout << "Function: " << fitness->name() << " (" << fitness->dimension() << "D)" << std::endl;

    opt::PSO pso(fitness, config);

    const opt::PSOConfig& cfg = pso.getConfig();
    std::cout << "Swarm size: " << cfg.swarm_size
              << ", informants: " << cfg.num_informants << std::endl;
    std::cout << "Weights: current=" << cfg.weights.follow_current
              << " personal=" << cfg.weights.follow_personal_best
              << " social=" << cfg.weights.follow_social_best
              << " global=" << cfg.weights.follow_global_best
              << " step=" << cfg.weights.scale_update_step << std::endl;

    // Frames are only meaningful for 2D landscapes
    const bool plot = useGnuplot && fitness->dimension() == 2;
    const std::string dir = "./pso_frames";
    const std::string baseName = dir + "/pso_vis";
    const std::string gridFile = dir + "/pso_grid.dat";
    const std::string minimaFile = dir + "/pso_minima.dat";

    if (plot) {
        std::filesystem::create_directories(dir);
        std::cout << "Generating background grid (heatmap)..." << std::endl;
        evoswarm::plot::saveFunctionGrid(gridFile, *fitness);
        evoswarm::plot::saveMinima(minimaFile, *fitness);
        evoswarm::plot::saveFrame(baseName, 0, pso.getParticles(),
                                  [](const opt::PSO::Particle& p) -> const evoswarm::Coordinates& { return p.position; });
    }

    pso.setCallback([&](const evoswarm::Solution& best, std::size_t iter) {
        if (plot) {
            evoswarm::plot::saveFrame(baseName, iter + 1, pso.getParticles(),
                                      [](const opt::PSO::Particle& p) -> const evoswarm::Coordinates& { return p.position; });
        }
        if (iter % 10 == 0) {
            std::cout << "[PSO | Step " << std::setw(4) << iter << "] "
                      << "Global best: " << std::scientific << std::setprecision(5)
                      << best.value << std::defaultfloat << std::endl;
        }
    });

    auto start = std::chrono::high_resolution_clock::now();
    evoswarm::Solution best = pso.optimize(iterations);
    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double, std::milli> duration = end - start;

    std::cout << "\nOptimization Completed in " << duration.count() << " ms." << std::endl;
    printSolution("Best", best);

    if (plot) {
        std::cout << "Launching Gnuplot animation..." << std::endl;
        evoswarm::plot::createAnimationScript("run_pso.gp", gridFile, minimaFile, baseName,
                                              iterations + 1, "PSO " + fitness->name(), fitness->domain());
    }
    return best;
}
