#pragma once

#include <memory>

#include "popswarm/core/PopupSurface.hpp"
#include "popswarm/window/PopupWindowHost.hpp"

namespace pswarm {

/**
 * @brief PopupSurface backed by an X11 window
 *
 * Safe to call from any thread: every X request is posted to the UI thread,
 * where it is skipped if the window was destroyed in the meantime.
 */
class PopupWindow : public PopupSurface {
public:
    PopupWindow(PopupWindowHost& host, std::shared_ptr<PopupWindowState> state);
    ~PopupWindow() override;

    PopupWindow(const PopupWindow&) = delete;
    PopupWindow& operator=(const PopupWindow&) = delete;

    bool setGeometry(const Rect& rect) override;
    bool setOpacity(double opacity) override;
    void destroy() override;
    bool isAlive() const override;
    void setClickHandler(ClickHandler handler) override;

    Window getWindow() const { return state_->window; }

private:
    PopupWindowHost& host_;
    std::shared_ptr<PopupWindowState> state_;
};

}
