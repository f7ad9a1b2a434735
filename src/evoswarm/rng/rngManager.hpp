#ifndef EVOSWARM_RNGMANAGER_HPP
#define EVOSWARM_RNGMANAGER_HPP

#include "rng_factory.hpp"

#include <cstdint>
#include <random>

namespace evoswarm::rng {

    /**
     * @brief Hands out one engine per (thread, run) pair from a master seed.
     * Used by drivers that run several independent optimizations side by side.
     */
    class RngManager {
    public:
        explicit RngManager(std::uint64_t seed) : master_seed(seed) {}

        Engine make_rng(int thread_id, int run_id = 0) const {
            std::seed_seq seq{
                static_cast<std::uint32_t>(master_seed),
                static_cast<std::uint32_t>(thread_id),
                static_cast<std::uint32_t>(run_id)
            };
            return Engine(seq);
        }

    private:
        std::uint64_t master_seed;
    };

} // namespace evoswarm::rng

#endif // EVOSWARM_RNGMANAGER_HPP
