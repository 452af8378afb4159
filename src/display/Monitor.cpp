#include "popswarm/display/Monitor.hpp"
#include <algorithm>

namespace pswarm {

std::optional<Monitor> pickRandomMonitor(const std::vector<Monitor>& monitors,
                                         const std::vector<std::string>& disabled,
                                         RandomEngine& rng) {
    if (monitors.empty()) {
        return std::nullopt;
    }

    std::vector<const Monitor*> candidates;
    for (const auto& monitor : monitors) {
        if (monitor.bounds.isEmpty()) continue;
        if (std::find(disabled.begin(), disabled.end(), monitor.name) != disabled.end()) continue;
        candidates.push_back(&monitor);
    }

    if (candidates.empty()) {
        for (const auto& monitor : monitors) {
            candidates.push_back(&monitor);
        }
    }

    int index = randomInt(0, static_cast<int>(candidates.size()) - 1, rng);
    return *candidates[index];
}

}
