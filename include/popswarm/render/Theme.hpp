#pragma once

#include <optional>
#include <string>

namespace pswarm {

struct Color {
    double r{0.0};
    double g{0.0};
    double b{0.0};
    double a{1.0};

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }
};

/**
 * @brief Colours and font of every text label on a popup
 */
struct Theme {
    Color fg{1.0, 1.0, 1.0, 1.0};
    Color bg{0.15, 0.15, 0.15, 0.9};
    std::string font{"Sans"};
    double font_size{12.0};
};

/**
 * @brief Parse "#rgb", "#rrggbb" or "#rrggbbaa"
 * @return nullopt for anything else
 */
std::optional<Color> parseColor(const std::string& text);

}
