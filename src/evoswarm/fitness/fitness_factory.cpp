#include "fitness_factory.hpp"
#include "benchmark_functions.hpp"
#include "../errors.hpp"

#include <algorithm>
#include <cctype>

namespace evoswarm{
namespace fitness{

    std::vector<std::string> availableFunctions() {
        return {"mse", "sphere", "rastrigin", "ackley", "rosenbrock", "himmelblau"};
    }

    std::shared_ptr<const FitnessFunction> makeFitness(const std::string& name,
                                                       std::size_t dim,
                                                       const Coordinates& target) {
        std::string key = name;
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (key == "mse") {
            Coordinates t = target.empty() ? Coordinates(dim, 0.5) : target;
            if (t.size() != dim) {
                throw ConfigurationError("mse: target has " + std::to_string(t.size()) +
                                         " coordinates, expected " + std::to_string(dim));
            }
            return std::make_shared<MeanSquaredErrorToTarget>(t);
        }
        if (key == "sphere")     return std::make_shared<Sphere>(dim);
        if (key == "rastrigin")  return std::make_shared<Rastrigin>(dim);
        if (key == "ackley")     return std::make_shared<Ackley>(dim);
        if (key == "rosenbrock") return std::make_shared<Rosenbrock>(dim);
        if (key == "himmelblau") {
            if (dim != 2) throw ConfigurationError("himmelblau is only defined in 2D.");
            return std::make_shared<Himmelblau>();
        }

        throw ConfigurationError("Unknown fitness function: " + name);
    }

} //namespace fitness
} //namespace evoswarm
