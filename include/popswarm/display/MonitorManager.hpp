#pragma once

/**
 * @file MonitorManager.hpp
 * @brief Monitor enumeration through XRandR
 *
 * Falls back to a single monitor covering the default screen when XRandR is
 * missing or reports no active output.
 */

#include <X11/Xlib.h>
#include <X11/extensions/Xrandr.h>
#include <mutex>
#include <vector>

#include "popswarm/display/Monitor.hpp"

namespace pswarm {

class MonitorManager {
public:
    MonitorManager() = default;

    MonitorManager(const MonitorManager&) = delete;
    MonitorManager& operator=(const MonitorManager&) = delete;

    /**
     * @brief Detect XRandR, read the outputs and subscribe to changes
     * @return false only for a null display
     */
    bool initialize(Display* display);

    // Safe to call from any thread
    std::vector<Monitor> getMonitors() const;

    /**
     * @brief Re-read outputs after an XRandR screen change
     * @return true if the event belonged to XRandR
     */
    bool handleEvent(XEvent& event);

private:
    Display* display_{nullptr};
    Window root_{None};
    int randr_event_base_{-1};          // -1 without XRandR

    mutable std::mutex mutex_;
    std::vector<Monitor> monitors_;

    void reload();
    std::vector<Monitor> readOutputs() const;
    Monitor wholeScreen() const;
};

}
