/**
 * @file rng_factory.hpp
 * @brief Builds independent, reproducible random engines.
 * @details Every engine is seeded from the process seed (rng_global.hpp) and a
 * stream id, so two optimizers built with different stream ids never share a
 * sequence while a whole run stays reproducible from a single seed.
 */

#ifndef EVOSWARM_RNG_FACTORY_HPP
#define EVOSWARM_RNG_FACTORY_HPP

#include "rng_global.hpp"

#include <cstdint>
#include <random>

namespace evoswarm::rng {

    using Engine = std::mt19937;

    // Well known stream ids of the library
    constexpr std::uint64_t PSO_STREAM = 1000;
    constexpr std::uint64_t GA_STREAM  = 100;

    inline Engine make_engine(std::uint64_t stream_id) {
        std::seed_seq seq{
            get_global_seed(),
            static_cast<std::uint32_t>(stream_id & 0xFFFFFFFFu),
            static_cast<std::uint32_t>(stream_id >> 32)
        };
        return Engine(seq);
    }

} // namespace evoswarm::rng

#endif // EVOSWARM_RNG_FACTORY_HPP
