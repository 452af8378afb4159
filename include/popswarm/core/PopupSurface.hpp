#pragma once

#include <filesystem>
#include <functional>
#include <string>

#include "popswarm/geometry/Rect.hpp"
#include "popswarm/render/DenialFilter.hpp"
#include "popswarm/render/Theme.hpp"

namespace pswarm {

/**
 * @brief What a new popup window shows
 */
struct SurfaceRequest {
    std::filesystem::path media;
    Size size;
    double opacity{1.0};

    bool denial{false};             // blur the media and draw denial_text over it
    DenialFilter denial_filter;
    std::string denial_text;
    std::string caption;            // top-left, empty for none

    bool close_button{true};        // bottom-right
    bool clickthrough{false};       // empty input region, no button

    Theme theme;                    // caption, denial text and button
};

/**
 * @brief The window side of a popup, as seen by its lifecycle controller
 *
 * Every method may be called from a sub-behavior thread. Implementations
 * bound to a single-threaded window system marshal the work onto their UI
 * thread. Once destroy() has run, setGeometry() and setOpacity() do nothing
 * and return false: that is how sub-behaviors notice a concurrent close.
 */
class PopupSurface {
public:
    using ClickHandler = std::function<void()>;

    virtual ~PopupSurface() = default;

    virtual bool setGeometry(const Rect& rect) = 0;

    virtual bool setOpacity(double opacity) = 0;

    virtual void destroy() = 0;

    virtual bool isAlive() const = 0;

    virtual void setClickHandler(ClickHandler handler) = 0;
};

}
