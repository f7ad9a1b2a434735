#ifndef EVOSWARM_TYPES_HPP
#define EVOSWARM_TYPES_HPP

#include <cstddef>
#include <functional>
#include <limits>
#include <vector>

namespace evoswarm {

    using Real = double;
    using Coordinates = std::vector<Real>;

    /**
     * @brief A candidate point together with its fitness value.
     */
    struct Solution {
        Coordinates params;
        Real value = std::numeric_limits<Real>::infinity();

        // Lower fitness is better
        [[nodiscard]] bool isBetterThan(const Solution& other) const {
            return value < other.value;
        }
    };

    // Called after every optimizer step with the best solution and the step index
    using StepCallback = std::function<void(const Solution&, std::size_t)>;

} // namespace evoswarm

#endif // EVOSWARM_TYPES_HPP
