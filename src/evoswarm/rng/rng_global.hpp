#ifndef EVOSWARM_RNG_GLOBAL_HPP
#define EVOSWARM_RNG_GLOBAL_HPP

#include <cstdint>

namespace evoswarm::rng {

    // Seed shared by every engine built through make_engine()
    inline std::uint32_t& global_seed_storage() {
        static std::uint32_t seed = 12345u;
        return seed;
    }

    inline void set_global_seed(std::uint32_t seed) {
        global_seed_storage() = seed;
    }

    inline std::uint32_t get_global_seed() {
        return global_seed_storage();
    }

} // namespace evoswarm::rng

#endif // EVOSWARM_RNG_GLOBAL_HPP
