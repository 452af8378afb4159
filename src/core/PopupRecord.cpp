#include "popswarm/core/PopupRecord.hpp"
#include <algorithm>

namespace pswarm {

PopupRecord::PopupRecord(const Rect& monitor, int clicks_to_close, bool denial_active, double opacity)
    : monitor_(monitor),
      clicks_remaining_(std::max(1, clicks_to_close)),
      denial_active_(denial_active),
      opacity_(std::clamp(opacity, 0.0, 1.0)) {}

PopupId PopupRecord::getId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return id_;
}

void PopupRecord::assignId(PopupId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    id_ = id;
}

Rect PopupRecord::getRect() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rect_;
}

void PopupRecord::setRect(const Rect& rect) {
    std::lock_guard<std::mutex> lock(mutex_);
    rect_ = rect;
}

int PopupRecord::getClicksRemaining() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return clicks_remaining_;
}

int PopupRecord::consumeClick() {
    std::lock_guard<std::mutex> lock(mutex_);
    return --clicks_remaining_;
}

double PopupRecord::getOpacity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return opacity_;
}

void PopupRecord::setOpacity(double opacity) {
    std::lock_guard<std::mutex> lock(mutex_);
    opacity_ = std::clamp(opacity, 0.0, 1.0);
}

LifecycleState PopupRecord::getState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void PopupRecord::setState(LifecycleState state) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = state;
}

PopupSnapshot PopupRecord::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);

    PopupSnapshot snap;
    snap.id = id_;
    snap.rect = rect_;
    snap.monitor = monitor_;
    snap.clicks_remaining = clicks_remaining_;
    snap.denial_active = denial_active_;
    snap.opacity = opacity_;
    snap.state = state_;
    return snap;
}

}
