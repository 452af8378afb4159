#include "popswarm/placement/Motion.hpp"
#include <algorithm>

namespace pswarm {

Velocity randomVelocity(int speed, RandomEngine& rng) {
    speed = std::max(1, speed);

    Velocity velocity;
    while (velocity.dx == 0 && velocity.dy == 0) {
        velocity.dx = randomInt(-speed, speed, rng);
        velocity.dy = randomInt(-speed, speed, rng);
    }
    return velocity;
}

// Moves one axis; returns true when the edge was reached
static bool advanceAxis(int& position, int extent, int delta, int lower, int upper) {
    position += delta;

    // Popup wider than the monitor: pin to the lower edge
    int highest = std::max(lower, upper - extent);

    if (position <= lower) {
        position = lower;
        return true;
    }
    if (position + extent >= upper) {
        position = highest;
        return true;
    }
    return false;
}

MotionStep advanceWithinMonitor(const Rect& rect, const Velocity& velocity, const Rect& monitor) {
    MotionStep step;
    step.rect = rect;
    step.velocity = velocity;

    step.bounced_x = advanceAxis(step.rect.x, rect.width, velocity.dx,
                                 monitor.left(), monitor.right());
    step.bounced_y = advanceAxis(step.rect.y, rect.height, velocity.dy,
                                 monitor.top(), monitor.bottom());

    if (step.bounced_x) step.velocity.dx = -step.velocity.dx;
    if (step.bounced_y) step.velocity.dy = -step.velocity.dy;

    return step;
}

}
