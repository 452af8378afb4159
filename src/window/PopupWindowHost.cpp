#include "popswarm/window/PopupWindowHost.hpp"
#include "popswarm/window/PopupWindow.hpp"
#include <X11/Xatom.h>
#include <X11/extensions/shape.h>
#include <cairo/cairo-xlib.h>
#include <algorithm>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace pswarm {

namespace {

constexpr double DENIAL_FONT_SCALE = 1.5;
constexpr int LABEL_PADDING = 6;
constexpr int BUTTON_MARGIN = 10;
constexpr const char* CLOSE_LABEL = "Close";

void setSource(cairo_t* cr, const Color& color) {
    cairo_set_source_rgba(cr, color.r, color.g, color.b, color.a);
}

std::string fitText(cairo_t* cr, std::string text, double max_width) {
    cairo_text_extents_t extents;
    cairo_text_extents(cr, text.c_str(), &extents);
    while (extents.width > max_width && text.length() > 3) {
        text = text.substr(0, text.length() - 4) + "...";
        cairo_text_extents(cr, text.c_str(), &extents);
    }
    return text;
}

std::vector<std::string> wrapText(cairo_t* cr, const std::string& text, double max_width) {
    std::vector<std::string> lines;
    std::istringstream words(text);
    std::string word;
    std::string line;

    while (words >> word) {
        std::string candidate = line.empty() ? word : line + " " + word;

        cairo_text_extents_t extents;
        cairo_text_extents(cr, candidate.c_str(), &extents);
        if (extents.width > max_width && !line.empty()) {
            lines.push_back(line);
            line = word;
        } else {
            line = candidate;
        }
    }

    if (!line.empty()) {
        lines.push_back(line);
    }
    return lines;
}

// Text on a theme-colored box whose top-left corner is (x, y)
Rect drawLabel(cairo_t* cr, const Theme& theme, const std::string& text, int x, int y, int max_width) {
    cairo_select_font_face(cr, theme.font.c_str(), CAIRO_FONT_SLANT_NORMAL, CAIRO_FONT_WEIGHT_NORMAL);
    cairo_set_font_size(cr, theme.font_size);

    std::string shown = fitText(cr, text, std::max(1, max_width - 2 * LABEL_PADDING));

    cairo_font_extents_t font;
    cairo_font_extents(cr, &font);
    cairo_text_extents_t extents;
    cairo_text_extents(cr, shown.c_str(), &extents);

    Rect box{x, y,
             static_cast<int>(extents.x_advance) + 2 * LABEL_PADDING,
             static_cast<int>(font.height) + 2 * LABEL_PADDING};

    cairo_rectangle(cr, box.x, box.y, box.width, box.height);
    setSource(cr, theme.bg);
    cairo_fill(cr);

    setSource(cr, theme.fg);
    cairo_move_to(cr, box.x + LABEL_PADDING, box.y + LABEL_PADDING + font.ascent);
    cairo_show_text(cr, shown.c_str());

    return box;
}

// Paints @p image stretched over a width x height area of @p cr
void paintScaled(cairo_t* cr, cairo_surface_t* image, int width, int height) {
    int image_width = cairo_image_surface_get_width(image);
    int image_height = cairo_image_surface_get_height(image);
    if (image_width <= 0 || image_height <= 0) return;

    cairo_save(cr);
    cairo_scale(cr, static_cast<double>(width) / image_width, static_cast<double>(height) / image_height);
    cairo_set_source_surface(cr, image, 0, 0);
    cairo_pattern_set_filter(cairo_get_source(cr), CAIRO_FILTER_GOOD);
    cairo_paint(cr);
    cairo_restore(cr);
}

// Shrinks the artwork and stretches it back, losing the detail in between
void resizeBlur(cairo_surface_t* artwork, double shrink) {
    const int width = cairo_image_surface_get_width(artwork);
    const int height = cairo_image_surface_get_height(artwork);
    const int small_width = std::max(1, static_cast<int>(width / shrink));
    const int small_height = std::max(1, static_cast<int>(height / shrink));

    cairo_surface_t* small = cairo_image_surface_create(CAIRO_FORMAT_ARGB32, small_width, small_height);
    if (cairo_surface_status(small) != CAIRO_STATUS_SUCCESS) {
        cairo_surface_destroy(small);
        return;
    }

    cairo_t* down = cairo_create(small);
    paintScaled(down, artwork, small_width, small_height);
    cairo_destroy(down);

    cairo_t* up = cairo_create(artwork);
    cairo_set_operator(up, CAIRO_OPERATOR_SOURCE);
    paintScaled(up, small, width, height);
    cairo_destroy(up);

    cairo_surface_destroy(small);
}

void applyDenialFilter(cairo_surface_t* artwork, const DenialFilter& filter) {
    cairo_surface_flush(artwork);

    switch (filter.kind) {
        case DenialBlur::Gaussian:
            gaussianBlur(cairo_image_surface_get_data(artwork),
                         cairo_image_surface_get_width(artwork),
                         cairo_image_surface_get_height(artwork),
                         cairo_image_surface_get_stride(artwork), filter.sigma);
            cairo_surface_mark_dirty(artwork);
            break;
        case DenialBlur::Resize:
            resizeBlur(artwork, filter.shrink);
            break;
        case DenialBlur::None:
            break;
    }
}

}

PopupWindowHost::PopupWindowHost(Display* display, UiDispatcher& dispatcher, SessionState& session)
    : display_(display), dispatcher_(dispatcher), session_(session) {}

PopupWindowHost::~PopupWindowHost() {
    auto remaining = windows_;
    for (auto& [window, state] : remaining) {
        destroyWindow(*state);
    }

    if (has_argb_ && colormap_ != 0) {
        XFreeColormap(display_, colormap_);
    }
}

bool PopupWindowHost::initialize() {
    if (!display_) {
        std::cerr << "PopupWindowHost: Null display" << std::endl;
        return false;
    }

    screen_ = DefaultScreen(display_);
    root_ = RootWindow(display_, screen_);

    selectVisual();

    int shape_event, shape_error;
    has_shape_ = XShapeQueryExtension(display_, &shape_event, &shape_error);
    if (!has_shape_) {
        std::cerr << "PopupWindowHost: XShape not available, clickthrough disabled" << std::endl;
    }

    opacity_atom_ = XInternAtom(display_, "_NET_WM_WINDOW_OPACITY", False);
    window_type_atom_ = XInternAtom(display_, "_NET_WM_WINDOW_TYPE", False);
    window_type_popup_ = XInternAtom(display_, "_NET_WM_WINDOW_TYPE_NOTIFICATION", False);
    state_atom_ = XInternAtom(display_, "_NET_WM_STATE", False);
    state_above_ = XInternAtom(display_, "_NET_WM_STATE_ABOVE", False);

    std::cout << "PopupWindowHost: Using " << (has_argb_ ? "32-bit ARGB" : "default")
              << " visual" << std::endl;
    return true;
}

void PopupWindowHost::selectVisual() {
    XVisualInfo vinfo_template;
    vinfo_template.screen = screen_;
    vinfo_template.depth = 32;
    vinfo_template.c_class = TrueColor;

    int nitems = 0;
    XVisualInfo* vinfo = XGetVisualInfo(display_, VisualScreenMask | VisualDepthMask | VisualClassMask,
                                        &vinfo_template, &nitems);

    if (vinfo && nitems > 0) {
        visual_ = vinfo[0].visual;
        depth_ = 32;
        colormap_ = XCreateColormap(display_, root_, visual_, AllocNone);
        has_argb_ = true;
    } else {
        visual_ = DefaultVisual(display_, screen_);
        depth_ = DefaultDepth(display_, screen_);
        colormap_ = DefaultColormap(display_, screen_);
        has_argb_ = false;
    }

    if (vinfo) {
        XFree(vinfo);
    }
}

std::unique_ptr<PopupSurface> PopupWindowHost::createPopup(const SurfaceRequest& request) {
    const int width = std::max(1, request.size.width);
    const int height = std::max(1, request.size.height);

    Rect close_button;
    cairo_surface_t* artwork = renderArtwork(request, close_button);
    if (!artwork) {
        return nullptr;
    }

    XSetWindowAttributes attrs;
    attrs.override_redirect = True;
    attrs.background_pixel = 0;
    attrs.border_pixel = 0;
    attrs.colormap = colormap_;
    attrs.event_mask = ExposureMask | ButtonPressMask | ButtonReleaseMask;

    unsigned long attr_mask = CWOverrideRedirect | CWBackPixel | CWBorderPixel |
                              CWColormap | CWEventMask;

    Window window = XCreateWindow(
        display_, root_,
        0, 0,
        width, height,
        0,
        depth_,
        InputOutput,
        visual_,
        attr_mask,
        &attrs
    );

    if (window == None) {
        std::cerr << "PopupWindowHost: XCreateWindow failed" << std::endl;
        cairo_surface_destroy(artwork);
        return nullptr;
    }

    XChangeProperty(display_, window, window_type_atom_, XA_ATOM, 32,
                    PropModeReplace, reinterpret_cast<unsigned char*>(&window_type_popup_), 1);
    XChangeProperty(display_, window, state_atom_, XA_ATOM, 32,
                    PropModeReplace, reinterpret_cast<unsigned char*>(&state_above_), 1);

    XStoreName(display_, window, "popswarm");

    if (request.clickthrough) {
        makeClickthrough(window);
    }

    auto state = std::make_shared<PopupWindowState>();
    state->window = window;
    state->geometry = {0, 0, width, height};
    state->close_button = close_button;
    state->artwork = artwork;
    state->surface = cairo_xlib_surface_create(display_, window, visual_, width, height);

    windows_[window] = state;

    applyOpacity(*state, request.opacity);

    return std::make_unique<PopupWindow>(*this, std::move(state));
}

bool PopupWindowHost::handleEvent(const XEvent& event) {
    auto it = windows_.find(event.xany.window);
    if (it == windows_.end()) {
        return false;
    }

    // Keep the state alive even if a click handler ends up destroying it
    std::shared_ptr<PopupWindowState> state = it->second;

    switch (event.type) {
        case Expose:
            if (event.xexpose.count == 0) {
                redraw(*state);
            }
            break;

        case ButtonRelease:
            if (event.xbutton.button == Button1) {
                handleClick(*state, event.xbutton);
            }
            break;

        default:
            break;
    }

    return true;
}

void PopupWindowHost::applyGeometry(PopupWindowState& state, const Rect& rect) {
    if (state.window == None) return;

    if (rect.width != state.geometry.width || rect.height != state.geometry.height) {
        XMoveResizeWindow(display_, state.window, rect.x, rect.y,
                          std::max(1, rect.width), std::max(1, rect.height));
        cairo_xlib_surface_set_size(state.surface, std::max(1, rect.width), std::max(1, rect.height));
    } else {
        XMoveWindow(display_, state.window, rect.x, rect.y);
    }
    state.geometry = rect;

    if (!state.mapped) {
        XMapRaised(display_, state.window);
        state.mapped = true;
    }

    XFlush(display_);
}

void PopupWindowHost::applyOpacity(PopupWindowState& state, double opacity) {
    if (state.window == None) return;

    unsigned long value = static_cast<unsigned long>(std::clamp(opacity, 0.0, 1.0) * 0xffffffffUL);
    XChangeProperty(display_, state.window, opacity_atom_, XA_CARDINAL, 32,
                    PropModeReplace, reinterpret_cast<unsigned char*>(&value), 1);
    XFlush(display_);
}

void PopupWindowHost::destroyWindow(PopupWindowState& state) {
    state.alive.store(false);
    state.on_click = nullptr;

    if (state.window == None) return;

    windows_.erase(state.window);

    if (state.surface) {
        cairo_surface_destroy(state.surface);
        state.surface = nullptr;
    }
    if (state.artwork) {
        cairo_surface_destroy(state.artwork);
        state.artwork = nullptr;
    }

    XDestroyWindow(display_, state.window);
    XFlush(display_);
    state.window = None;
}

void PopupWindowHost::redraw(PopupWindowState& state) {
    if (!state.surface || !state.artwork) return;

    cairo_t* cr = cairo_create(state.surface);
    cairo_set_operator(cr, CAIRO_OPERATOR_SOURCE);

    int art_width = cairo_image_surface_get_width(state.artwork);
    int art_height = cairo_image_surface_get_height(state.artwork);
    if (art_width > 0 && art_height > 0 &&
        (art_width != state.geometry.width || art_height != state.geometry.height)) {
        cairo_scale(cr, static_cast<double>(state.geometry.width) / art_width,
                    static_cast<double>(state.geometry.height) / art_height);
    }

    cairo_set_source_surface(cr, state.artwork, 0, 0);
    cairo_paint(cr);
    cairo_destroy(cr);

    cairo_surface_flush(state.surface);
    XFlush(display_);
}

void PopupWindowHost::handleClick(PopupWindowState& state, const XButtonEvent& event) {
    session_.setAltHeld((event.state & Mod1Mask) != 0);

    if (!state.alive.load() || !state.on_click) return;

    // With a close button only the button counts; buttonless popups take any click
    if (!state.close_button.isEmpty()) {
        bool inside = event.x >= state.close_button.left() && event.x < state.close_button.right() &&
                      event.y >= state.close_button.top() && event.y < state.close_button.bottom();
        if (!inside) return;
    }

    auto handler = state.on_click;
    handler();
}

cairo_surface_t* PopupWindowHost::renderArtwork(const SurfaceRequest& request, Rect& close_button) const {
    const int width = std::max(1, request.size.width);
    const int height = std::max(1, request.size.height);

    cairo_surface_t* artwork = cairo_image_surface_create(CAIRO_FORMAT_ARGB32, width, height);
    if (cairo_surface_status(artwork) != CAIRO_STATUS_SUCCESS) {
        std::cerr << "PopupWindowHost: Cannot allocate " << width << "x" << height << " surface" << std::endl;
        cairo_surface_destroy(artwork);
        return nullptr;
    }

    cairo_t* cr = cairo_create(artwork);

    cairo_set_source_rgba(cr, 0.0, 0.0, 0.0, 1.0);
    cairo_paint(cr);

    cairo_surface_t* image = cairo_image_surface_create_from_png(request.media.c_str());
    if (cairo_surface_status(image) == CAIRO_STATUS_SUCCESS) {
        paintScaled(cr, image, width, height);
    } else {
        std::cerr << "PopupWindowHost: Cannot load " << request.media << ": "
                  << cairo_status_to_string(cairo_surface_status(image)) << std::endl;
    }
    cairo_surface_destroy(image);

    const Theme& theme = request.theme;

    if (request.denial) {
        applyDenialFilter(artwork, request.denial_filter);

        cairo_select_font_face(cr, theme.font.c_str(), CAIRO_FONT_SLANT_NORMAL, CAIRO_FONT_WEIGHT_BOLD);
        cairo_set_font_size(cr, theme.font_size * DENIAL_FONT_SCALE);

        cairo_font_extents_t font;
        cairo_font_extents(cr, &font);

        auto lines = wrapText(cr, request.denial_text, width - 4 * LABEL_PADDING);
        if (!lines.empty()) {
            double block_width = 0.0;
            for (const auto& line : lines) {
                cairo_text_extents_t extents;
                cairo_text_extents(cr, line.c_str(), &extents);
                block_width = std::max(block_width, extents.x_advance);
            }
            const double block_height = font.height * lines.size();

            cairo_rectangle(cr, (width - block_width) / 2.0 - LABEL_PADDING,
                            (height - block_height) / 2.0 - LABEL_PADDING,
                            block_width + 2 * LABEL_PADDING, block_height + 2 * LABEL_PADDING);
            setSource(cr, theme.bg);
            cairo_fill(cr);

            double y = (height - block_height) / 2.0 + font.ascent;
            setSource(cr, theme.fg);
            for (const auto& line : lines) {
                cairo_text_extents_t extents;
                cairo_text_extents(cr, line.c_str(), &extents);
                cairo_move_to(cr, (width - extents.x_advance) / 2.0, y);
                cairo_show_text(cr, line.c_str());
                y += font.height;
            }
        }
    }

    if (!request.caption.empty()) {
        drawLabel(cr, theme, request.caption, 5, 5, width - 10);
    }

    close_button = {};
    if (request.close_button && !request.clickthrough) {
        // Measure first, then draw anchored to the bottom-right corner
        cairo_select_font_face(cr, theme.font.c_str(), CAIRO_FONT_SLANT_NORMAL, CAIRO_FONT_WEIGHT_NORMAL);
        cairo_set_font_size(cr, theme.font_size);

        cairo_font_extents_t font;
        cairo_font_extents(cr, &font);
        cairo_text_extents_t extents;
        cairo_text_extents(cr, CLOSE_LABEL, &extents);

        int button_width = static_cast<int>(extents.x_advance) + 2 * LABEL_PADDING;
        int button_height = static_cast<int>(font.height) + 2 * LABEL_PADDING;
        int x = std::max(0, width - BUTTON_MARGIN - button_width);
        int y = std::max(0, height - BUTTON_MARGIN - button_height);

        close_button = drawLabel(cr, theme, CLOSE_LABEL, x, y, width);
    }

    cairo_destroy(cr);
    cairo_surface_flush(artwork);
    return artwork;
}

void PopupWindowHost::makeClickthrough(Window window) {
    if (!has_shape_) return;

    // Empty input region: pointer events fall through to whatever is below
    XShapeCombineRectangles(display_, window, ShapeInput, 0, 0, nullptr, 0, ShapeSet, Unsorted);
}

std::optional<Size> PopupWindowHost::readPngSize(const std::filesystem::path& path) {
    cairo_surface_t* image = cairo_image_surface_create_from_png(path.c_str());

    std::optional<Size> size;
    if (cairo_surface_status(image) == CAIRO_STATUS_SUCCESS) {
        size = Size{cairo_image_surface_get_width(image), cairo_image_surface_get_height(image)};
    }

    cairo_surface_destroy(image);
    return size;
}

}
