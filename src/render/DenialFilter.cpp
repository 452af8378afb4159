#include "popswarm/render/DenialFilter.hpp"
#include "popswarm/placement/WeightedChoice.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <vector>

namespace pswarm {

namespace {

constexpr int BYTES_PER_PIXEL = 4;

// Running-sum box average of @p count pixels from @p src into @p dst.
// @p step is the byte distance between neighbouring pixels of @p dst.
void blurLine(const uint8_t* src, uint8_t* dst, int count, int step, int radius) {
    const int window = 2 * radius + 1;
    const int last = count - 1;

    for (int channel = 0; channel < BYTES_PER_PIXEL; ++channel) {
        int sum = 0;
        for (int i = -radius; i <= radius; ++i) {
            sum += src[std::clamp(i, 0, last) * BYTES_PER_PIXEL + channel];
        }

        for (int i = 0; i < count; ++i) {
            dst[i * step + channel] = static_cast<uint8_t>((sum + window / 2) / window);

            int leaving = std::clamp(i - radius, 0, last);
            int entering = std::clamp(i + radius + 1, 0, last);
            sum += src[entering * BYTES_PER_PIXEL + channel] - src[leaving * BYTES_PER_PIXEL + channel];
        }
    }
}

}

DenialFilter pickDenialFilter(RandomEngine& rng) {
    std::vector<double> weights(DENIAL_FILTER_WEIGHTS.begin(), DENIAL_FILTER_WEIGHTS.end());
    size_t choice = weightedIndex(weights, rng).value_or(DENIAL_GAUSSIAN_SIGMAS.size());

    DenialFilter filter;
    if (choice < DENIAL_GAUSSIAN_SIGMAS.size()) {
        filter.kind = DenialBlur::Gaussian;
        filter.sigma = DENIAL_GAUSSIAN_SIGMAS[choice];
    } else {
        std::uniform_real_distribution<double> shrink(RESIZE_BLUR_MIN_SHRINK, RESIZE_BLUR_MAX_SHRINK);
        filter.kind = DenialBlur::Resize;
        filter.shrink = shrink(rng);
    }
    return filter;
}

std::array<int, 3> boxRadiiForSigma(double sigma) {
    std::array<int, 3> radii{0, 0, 0};
    if (!(sigma > 0.0)) {
        return radii;
    }

    // Widths wl and wl + 2 (both odd), m passes of the smaller one, so the
    // summed variance of the three boxes matches sigma^2
    constexpr int passes = 3;
    const double ideal = std::sqrt(12.0 * sigma * sigma / passes + 1.0);

    int lower = static_cast<int>(std::floor(ideal));
    if (lower % 2 == 0) --lower;
    lower = std::max(1, lower);
    const int upper = lower + 2;

    const double m_ideal = (12.0 * sigma * sigma - passes * lower * lower - 4.0 * passes * lower - 3.0 * passes) /
                           (-4.0 * lower - 4.0);
    const int m = std::clamp(static_cast<int>(std::lround(m_ideal)), 0, passes);

    for (int i = 0; i < passes; ++i) {
        int width = i < m ? lower : upper;
        radii[i] = (width - 1) / 2;
    }
    return radii;
}

void boxBlur(uint8_t* pixels, int width, int height, int stride, int radius) {
    if (!pixels || width <= 0 || height <= 0 || radius <= 0) {
        return;
    }

    std::vector<uint8_t> line(static_cast<size_t>(std::max(width, height)) * BYTES_PER_PIXEL);

    for (int y = 0; y < height; ++y) {
        uint8_t* row = pixels + static_cast<size_t>(y) * stride;
        std::memcpy(line.data(), row, static_cast<size_t>(width) * BYTES_PER_PIXEL);
        blurLine(line.data(), row, width, BYTES_PER_PIXEL, radius);
    }

    for (int x = 0; x < width; ++x) {
        uint8_t* column = pixels + static_cast<size_t>(x) * BYTES_PER_PIXEL;
        for (int y = 0; y < height; ++y) {
            std::memcpy(&line[static_cast<size_t>(y) * BYTES_PER_PIXEL],
                        column + static_cast<size_t>(y) * stride, BYTES_PER_PIXEL);
        }
        blurLine(line.data(), column, height, stride, radius);
    }
}

void gaussianBlur(uint8_t* pixels, int width, int height, int stride, double sigma) {
    for (int radius : boxRadiiForSigma(sigma)) {
        boxBlur(pixels, width, height, stride, radius);
    }
}

}
