#include <iostream>
#include <string>
#include <fstream>
#include <memory>
#include <stdexcept>

#include "apps/benchmarks.hpp"
#include <evoswarm/fitness/expression_fitness.hpp>

// Path to the file containing the function.
#define FUNCTION_FILE "../function.txt"

namespace opt = evoswarm::optim;
namespace fit = evoswarm::fitness;


// --- FUNCTION PROTOTYPES ---
std::string readFunctionFromFile(const std::string& filename);


// --- MAIN ---

// Usage: evoswarm_expr [function file] [--plot]
int main(int argc, char** argv) {
    std::string path = FUNCTION_FILE;
    bool useGnuplot = false;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--plot") useGnuplot = true;
        else path = arg;
    }

    try {
        const std::string expression = readFunctionFromFile(path);
        auto fitness = std::make_shared<const fit::ExpressionFitness>(expression);
        std::cout << "Loaded expression: " << fitness->expression() << std::endl;
        const std::size_t dim = fitness->dimension();
        const fit::Domain domain = fitness->domain();

        if (useGnuplot) evoswarm::plot::closeGnuplotWindows();

        opt::PSOConfig pso_config;
        pso_config.vector_length = dim;
        pso_config.init_lower = fit::lowerBounds(domain, dim);
        pso_config.init_upper = fit::upperBounds(domain, dim);
        runPSODemo(fitness, pso_config, 200, useGnuplot);

        std::cout << std::endl;

        opt::GAConfig ga_config;
        ga_config.vector_length = dim;
        ga_config.init_lower = fit::lowerBounds(domain, dim);
        ga_config.init_upper = fit::upperBounds(domain, dim);
        runGADemo(fitness, ga_config, 100, useGnuplot);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}

// --- FUNCTION IMPLEMENTATIONS ---

std::string readFunctionFromFile(const std::string& filename) {
    std::ifstream file(filename);

    if (!file.is_open()) {
        throw std::runtime_error("Could not open function file at: " + filename +
                                 "\nMake sure the file exists in the repository root.");
    }

    std::string expression;
    if (!std::getline(file, expression)) {
        throw std::runtime_error("File is empty: " + filename);
    }

    if (!expression.empty() && expression.back() == '\r') {
        expression.pop_back();
    }

    if (expression.empty()) {
        throw std::runtime_error("Expression in file is empty: " + filename);
    }

    return expression;
}
