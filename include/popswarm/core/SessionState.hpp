#pragma once

#include <atomic>

namespace pswarm {

/**
 * @brief Process-wide interaction state read by every popup
 */
class SessionState {
public:
    void setAltHeld(bool held) { alt_held_.store(held, std::memory_order_release); }
    bool isAltHeld() const { return alt_held_.load(std::memory_order_acquire); }

    void setPumpScare(bool active) { pump_scare_.store(active, std::memory_order_release); }
    bool isPumpScare() const { return pump_scare_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> alt_held_{false};
    std::atomic<bool> pump_scare_{false};
};

}
