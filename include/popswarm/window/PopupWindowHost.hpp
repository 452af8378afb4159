#pragma once

/**
 * @file PopupWindowHost.hpp
 * @brief X11 side of every popup window
 *
 * The host owns the display-facing half of each popup: the override-redirect
 * ARGB window, its cairo surfaces and its click routing. Every method here
 * runs on the UI thread; PopupWindow posts work to it through the
 * UiDispatcher when called from a lifecycle thread.
 */

#include <X11/Xlib.h>
#include <X11/Xutil.h>
#include <cairo/cairo.h>
#include <atomic>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <unordered_map>

#include "popswarm/core/PopupSurface.hpp"
#include "popswarm/core/SessionState.hpp"
#include "popswarm/utils/UiDispatcher.hpp"

namespace pswarm {

/**
 * @brief Shared between a PopupWindow and the tasks it posts
 *
 * Only `alive` is touched off the UI thread.
 */
struct PopupWindowState {
    Window window{None};
    Rect geometry;
    Rect close_button;          // window-relative, empty when there is none
    bool mapped{false};

    cairo_surface_t* artwork{nullptr};
    cairo_surface_t* surface{nullptr};

    PopupSurface::ClickHandler on_click;

    std::atomic<bool> alive{true};
};

class PopupWindowHost {
public:
    PopupWindowHost(Display* display, UiDispatcher& dispatcher, SessionState& session);
    ~PopupWindowHost();

    PopupWindowHost(const PopupWindowHost&) = delete;
    PopupWindowHost& operator=(const PopupWindowHost&) = delete;

    bool initialize();

    /**
     * @brief Create an unmapped popup window; it shows on its first geometry
     * @return nullptr if the window could not be created
     */
    std::unique_ptr<PopupSurface> createPopup(const SurfaceRequest& request);

    /**
     * @brief Route Expose and ButtonRelease events to popups
     * @return true if the event belonged to a popup
     */
    bool handleEvent(const XEvent& event);

    size_t getWindowCount() const { return windows_.size(); }

    UiDispatcher& getDispatcher() { return dispatcher_; }

    void applyGeometry(PopupWindowState& state, const Rect& rect);
    void applyOpacity(PopupWindowState& state, double opacity);
    void destroyWindow(PopupWindowState& state);

    /**
     * @brief Width and height of a PNG file, without keeping it loaded
     */
    static std::optional<Size> readPngSize(const std::filesystem::path& path);

private:
    Display* display_;
    UiDispatcher& dispatcher_;
    SessionState& session_;

    Window root_{None};
    int screen_{0};
    Visual* visual_{nullptr};
    Colormap colormap_{0};
    int depth_{0};
    bool has_argb_{false};
    bool has_shape_{false};

    Atom opacity_atom_{None};
    Atom window_type_atom_{None};
    Atom window_type_popup_{None};
    Atom state_atom_{None};
    Atom state_above_{None};

    std::unordered_map<Window, std::shared_ptr<PopupWindowState>> windows_;

    void selectVisual();
    void redraw(PopupWindowState& state);
    void handleClick(PopupWindowState& state, const XButtonEvent& event);

    cairo_surface_t* renderArtwork(const SurfaceRequest& request, Rect& close_button) const;
    void makeClickthrough(Window window);
};

}
