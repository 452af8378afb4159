#pragma once

#include <random>
#include <utility>

namespace pswarm {

using RandomEngine = std::mt19937_64;

/**
 * @brief Percent roll: true with probability chance/100
 *
 * Chances at or below 0 never pass, chances at or above 100 always pass.
 */
inline bool roll(double chance, RandomEngine& rng) {
    if (chance <= 0.0) return false;
    if (chance >= 100.0) return true;
    std::uniform_real_distribution<double> dist(0.0, 100.0);
    return dist(rng) < chance;
}

// Inclusive on both ends
inline int randomInt(int low, int high, RandomEngine& rng) {
    if (high < low) std::swap(low, high);
    std::uniform_int_distribution<int> dist(low, high);
    return dist(rng);
}

}
