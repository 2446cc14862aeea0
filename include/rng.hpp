#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <cstdint>
#include <random>


///////////////////////////
///       HELPERS       ///
///////////////////////////
/**
 * @brief Create the engine used by all randomized components.
 *
 * A zero seed means "non-reproducible": the engine is seeded from
 * std::random_device instead.
 */
inline std::mt19937 makeRng(std::uint64_t seed) {
    if (seed == 0) {
        std::random_device rd;
        return std::mt19937(rd());
    }
    std::seed_seq seq{(std::uint32_t)(seed & 0xFFFFFFFFu), (std::uint32_t)(seed >> 32)};
    return std::mt19937(seq);
}
