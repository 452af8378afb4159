#include "popswarm/render/Theme.hpp"
#include <cctype>

namespace pswarm {

namespace {

int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

}

std::optional<Color> parseColor(const std::string& text) {
    if (text.size() < 2 || text[0] != '#') {
        return std::nullopt;
    }

    std::string digits = text.substr(1);
    if (digits.size() == 3) {
        // #abc is #aabbcc
        digits = {digits[0], digits[0], digits[1], digits[1], digits[2], digits[2]};
    }
    if (digits.size() != 6 && digits.size() != 8) {
        return std::nullopt;
    }

    double channels[4] = {0.0, 0.0, 0.0, 1.0};
    for (size_t i = 0; i < digits.size() / 2; ++i) {
        int high = hexDigit(digits[2 * i]);
        int low = hexDigit(digits[2 * i + 1]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        channels[i] = (high * 16 + low) / 255.0;
    }

    return Color{channels[0], channels[1], channels[2], channels[3]};
}

}
