#pragma once

/**
 * @file DenialFilter.hpp
 * @brief Blur applied to the media of a denial popup
 *
 * A denial popup hides its media behind one of four blurs, drawn once per
 * popup:
 *
 *     gaussian sigma 5    weight 1
 *     gaussian sigma 10   weight 1
 *     gaussian sigma 20   weight 1
 *     resize blur         weight 3
 *
 * The gaussians are approximated by three box passes. The resize blur
 * shrinks the media by a random factor and scales it back up.
 *
 * Pixel routines work on 32-bit premultiplied ARGB rows (cairo's
 * CAIRO_FORMAT_ARGB32 layout) and never touch the window system.
 */

#include <array>
#include <cstdint>

#include "popswarm/utils/Random.hpp"

namespace pswarm {

enum class DenialBlur {
    None,
    Gaussian,
    Resize
};

struct DenialFilter {
    DenialBlur kind{DenialBlur::None};
    double sigma{0.0};          // Gaussian only, in pixels
    double shrink{1.0};         // Resize only, > 1
};

constexpr std::array<double, 3> DENIAL_GAUSSIAN_SIGMAS{5.0, 10.0, 20.0};
constexpr std::array<double, 4> DENIAL_FILTER_WEIGHTS{1.0, 1.0, 1.0, 3.0};
constexpr double RESIZE_BLUR_MIN_SHRINK = 4.0;
constexpr double RESIZE_BLUR_MAX_SHRINK = 10.0;

DenialFilter pickDenialFilter(RandomEngine& rng);

/**
 * @brief Box radii of three passes whose composition approximates a
 *        gaussian of standard deviation @p sigma
 */
std::array<int, 3> boxRadiiForSigma(double sigma);

// One horizontal and one vertical box pass, edges clamped
void boxBlur(uint8_t* pixels, int width, int height, int stride, int radius);

void gaussianBlur(uint8_t* pixels, int width, int height, int stride, double sigma);

}
