#pragma once

#include <optional>
#include <string>
#include <vector>

#include "popswarm/geometry/Rect.hpp"
#include "popswarm/utils/Random.hpp"

namespace pswarm {

struct Monitor {
    std::string name;
    Rect bounds;
    bool primary{false};
};

/**
 * @brief Pick a monitor uniformly, skipping outputs named in @p disabled
 *
 * When every monitor is disabled the whole list is used instead, so a
 * popup always has somewhere to go.
 *
 * @return nullopt only when @p monitors is empty
 */
std::optional<Monitor> pickRandomMonitor(const std::vector<Monitor>& monitors,
                                         const std::vector<std::string>& disabled,
                                         RandomEngine& rng);

}
