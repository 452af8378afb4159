#include "popswarm/window/PopupWindow.hpp"
#include <algorithm>

namespace pswarm {

PopupWindow::PopupWindow(PopupWindowHost& host, std::shared_ptr<PopupWindowState> state)
    : host_(host), state_(std::move(state)) {}

PopupWindow::~PopupWindow() {
    destroy();
}

bool PopupWindow::setGeometry(const Rect& rect) {
    if (!state_->alive.load()) {
        return false;
    }

    PopupWindowHost* host = &host_;
    std::shared_ptr<PopupWindowState> state = state_;
    host_.getDispatcher().post([host, state, rect]() {
        if (state->alive.load()) {
            host->applyGeometry(*state, rect);
        }
    });
    return true;
}

bool PopupWindow::setOpacity(double opacity) {
    if (!state_->alive.load()) {
        return false;
    }

    PopupWindowHost* host = &host_;
    std::shared_ptr<PopupWindowState> state = state_;
    double clamped = std::clamp(opacity, 0.0, 1.0);
    host_.getDispatcher().post([host, state, clamped]() {
        if (state->alive.load()) {
            host->applyOpacity(*state, clamped);
        }
    });
    return true;
}

void PopupWindow::destroy() {
    // First caller wins; later calls and the destructor are no-ops
    if (!state_->alive.exchange(false)) {
        return;
    }

    PopupWindowHost* host = &host_;
    std::shared_ptr<PopupWindowState> state = state_;
    host_.getDispatcher().post([host, state]() {
        host->destroyWindow(*state);
    });
}

bool PopupWindow::isAlive() const {
    return state_->alive.load();
}

void PopupWindow::setClickHandler(ClickHandler handler) {
    state_->on_click = std::move(handler);
}

}
