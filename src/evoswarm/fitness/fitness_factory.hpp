#ifndef EVOSWARM_FITNESS_FACTORY_HPP
#define EVOSWARM_FITNESS_FACTORY_HPP

#include "fitness_function.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace evoswarm::fitness {

    // Names accepted by makeFitness(), in catalogue order
    std::vector<std::string> availableFunctions();

    /**
     * @brief Build a benchmark function by (case-insensitive) name.
     * @param name One of availableFunctions().
     * @param dim Vector length (Himmelblau requires 2).
     * @param target Target of "mse"; defaults to 0.5 in every coordinate.
     * @throws ConfigurationError on unknown names or unsupported dimensions.
     */
    std::shared_ptr<const FitnessFunction> makeFitness(const std::string& name,
                                                       std::size_t dim = 2,
                                                       const Coordinates& target = {});

} // namespace evoswarm::fitness

#endif // EVOSWARM_FITNESS_FACTORY_HPP
