#include "popswarm/display/MonitorManager.hpp"
#include <iostream>

namespace pswarm {

bool MonitorManager::initialize(Display* display) {
    if (!display) {
        std::cerr << "MonitorManager: Null display" << std::endl;
        return false;
    }

    display_ = display;
    root_ = DefaultRootWindow(display_);

    int event_base = 0, error_base = 0, major = 0, minor = 0;
    if (XRRQueryExtension(display_, &event_base, &error_base) &&
        XRRQueryVersion(display_, &major, &minor)) {
        randr_event_base_ = event_base;
        std::cout << "MonitorManager: XRandR " << major << "." << minor << std::endl;

        XRRSelectInput(display_, root_, RRScreenChangeNotifyMask | RROutputChangeNotifyMask);
    } else {
        std::cerr << "MonitorManager: XRandR unavailable, popups use the whole screen" << std::endl;
    }

    reload();
    return true;
}

std::vector<Monitor> MonitorManager::getMonitors() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return monitors_;
}

bool MonitorManager::handleEvent(XEvent& event) {
    if (randr_event_base_ < 0 || event.type != randr_event_base_ + RRScreenChangeNotify) {
        return false;
    }

    XRRUpdateConfiguration(&event);
    std::cout << "MonitorManager: Screen layout changed" << std::endl;
    reload();
    return true;
}

void MonitorManager::reload() {
    std::vector<Monitor> monitors;
    if (randr_event_base_ >= 0) {
        monitors = readOutputs();
    }
    if (monitors.empty()) {
        monitors.push_back(wholeScreen());
    }

    for (const auto& m : monitors) {
        std::cout << "MonitorManager: " << m.name << " " << m.bounds.width << "x" << m.bounds.height
                  << "+" << m.bounds.x << "+" << m.bounds.y << (m.primary ? " (primary)" : "")
                  << std::endl;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    monitors_ = std::move(monitors);
}

std::vector<Monitor> MonitorManager::readOutputs() const {
    std::vector<Monitor> monitors;

    XRRScreenResources* resources = XRRGetScreenResourcesCurrent(display_, root_);
    if (!resources) {
        return monitors;
    }

    const RROutput primary = XRRGetOutputPrimary(display_, root_);

    for (int i = 0; i < resources->noutput; ++i) {
        XRROutputInfo* info = XRRGetOutputInfo(display_, resources, resources->outputs[i]);
        if (!info) continue;

        // Only outputs that are lit can show a popup
        XRRCrtcInfo* crtc = (info->connection == RR_Connected && info->crtc != None)
            ? XRRGetCrtcInfo(display_, resources, info->crtc) : nullptr;

        if (crtc && crtc->width > 0 && crtc->height > 0) {
            Monitor monitor;
            monitor.name = info->name ? info->name : "";
            monitor.bounds = {crtc->x, crtc->y,
                              static_cast<int>(crtc->width), static_cast<int>(crtc->height)};
            monitor.primary = resources->outputs[i] == primary;
            monitors.push_back(std::move(monitor));
        }

        if (crtc) XRRFreeCrtcInfo(crtc);
        XRRFreeOutputInfo(info);
    }

    XRRFreeScreenResources(resources);
    return monitors;
}

Monitor MonitorManager::wholeScreen() const {
    const int screen = DefaultScreen(display_);

    Monitor monitor;
    monitor.name = "screen";
    monitor.bounds = {0, 0, DisplayWidth(display_, screen), DisplayHeight(display_, screen)};
    monitor.primary = true;
    return monitor;
}

}
