#pragma once

#include "popswarm/geometry/Rect.hpp"
#include "popswarm/utils/Random.hpp"

namespace pswarm {

struct Velocity {
    int dx{0};
    int dy{0};
};

struct MotionStep {
    Rect rect;
    Velocity velocity;
    bool bounced_x{false};
    bool bounced_y{false};
};

/**
 * @brief Random velocity with both components in [-speed, speed], never (0, 0)
 *
 * Speeds below 1 are raised to 1 so a non-zero velocity always exists.
 */
Velocity randomVelocity(int speed, RandomEngine& rng);

/**
 * @brief Advance one step and bounce off the monitor edges
 *
 * A component reverses when the rectangle's edge touches or crosses the
 * monitor boundary on that axis; the rectangle is clamped back inside.
 */
MotionStep advanceWithinMonitor(const Rect& rect, const Velocity& velocity, const Rect& monitor);

}
