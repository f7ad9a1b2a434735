#ifndef EVOSWARM_ERRORS_HPP
#define EVOSWARM_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace evoswarm {

    /**
     * @brief Invalid parameters given to a fitness function or optimizer.
     * Raised at construction or call time, before any state is touched.
     */
    class ConfigurationError : public std::invalid_argument {
    public:
        explicit ConfigurationError(const std::string& what)
            : std::invalid_argument(what) {}
    };

    /**
     * @brief A fitness function could not score a point.
     * Optimizers let it propagate; the step that triggered it is discarded.
     */
    class EvaluationError : public std::runtime_error {
    public:
        explicit EvaluationError(const std::string& what)
            : std::runtime_error(what) {}
    };

} // namespace evoswarm

#endif // EVOSWARM_ERRORS_HPP
