#pragma once

/**
 * @file WeightedChoice.hpp
 * @brief Cumulative-weight sampling over a weight list
 *
 * Pure given the supplied engine, so seeding the engine makes the choice
 * reproducible.
 */

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <optional>
#include <random>
#include <vector>

namespace pswarm {

/**
 * @brief Pick an index with probability proportional to its weight
 *
 * Negative and NaN weights count as zero. Returns std::nullopt when the list
 * is empty or no entry carries positive finite weight.
 */
template <typename Engine>
std::optional<size_t> weightedIndex(const std::vector<double>& weights, Engine& rng) {
    std::vector<double> cumulative;
    cumulative.reserve(weights.size());

    double total = 0.0;
    std::optional<size_t> last_positive;
    for (size_t i = 0; i < weights.size(); ++i) {
        double w = weights[i];
        if (w > 0.0) {
            total += w;
            last_positive = i;
        }
        cumulative.push_back(total);
    }

    if (!last_positive || !std::isfinite(total)) {
        return std::nullopt;
    }

    std::uniform_real_distribution<double> dist(0.0, total);
    double r = dist(rng);

    // Zero-weight entries have an empty [previous, cumulative) span and are
    // skipped by upper_bound.
    auto it = std::upper_bound(cumulative.begin(), cumulative.end(), r);
    if (it == cumulative.end()) {
        return last_positive;
    }
    return static_cast<size_t>(std::distance(cumulative.begin(), it));
}

}
