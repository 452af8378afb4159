/**
 * @file PlacementEngine.cpp
 * @brief Popup sizing and grid-weighted placement
 */

#include "popswarm/placement/PlacementEngine.hpp"
#include "popswarm/placement/WeightedChoice.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace pswarm {

PlacementEngine::PlacementEngine(PlacementTuning tuning) : tuning_(tuning) {
    if (tuning_.cell_side < 1) {
        tuning_.cell_side = 1;
    }
}

Size PlacementEngine::computeSize(int source_width, int source_height,
                                  const Rect& monitor, bool lowkey_mode,
                                  RandomEngine& rng) const {
    source_width = std::max(1, source_width);
    source_height = std::max(1, source_height);
    int monitor_min = std::max(1, std::min(monitor.width, monitor.height));

    // How large the source is relative to the monitor's short side
    double source_size = static_cast<double>(std::max(source_width, source_height)) / monitor_min;

    int percent = lowkey_mode
        ? randomInt(tuning_.lowkey_min_percent, tuning_.lowkey_max_percent, rng)
        : randomInt(tuning_.normal_min_percent, tuning_.normal_max_percent, rng);
    double target_size = percent / 100.0;
    double scale = target_size / source_size;

    return {
        std::max(1, static_cast<int>(source_width * scale)),
        std::max(1, static_cast<int>(source_height * scale))
    };
}

Rect PlacementEngine::place(const Size& size, const Rect& monitor,
                            const std::vector<Rect>& siblings, size_t popup_index,
                            const PlacementOptions& options, RandomEngine& rng) const {
    if (options.lowkey_mode) {
        return placeInCorner(size, monitor, resolveCorner(options.lowkey_corner, rng));
    }
    return placeOnGrid(size, monitor, siblings, popup_index, rng);
}

LowkeyCorner PlacementEngine::resolveCorner(int corner, RandomEngine& rng) {
    if (corner < 0 || corner > 3) {
        corner = randomInt(0, 3, rng);
    }
    return static_cast<LowkeyCorner>(corner);
}

Rect PlacementEngine::placeInCorner(const Size& size, const Rect& monitor,
                                    LowkeyCorner corner) const {
    bool right = corner == LowkeyCorner::TopRight || corner == LowkeyCorner::BottomRight;
    bool bottom = corner == LowkeyCorner::BottomLeft || corner == LowkeyCorner::BottomRight;

    int free_width = std::max(0, monitor.width - size.width);
    int free_height = std::max(0, monitor.height - size.height);

    return {
        monitor.x + (right ? free_width : 0),
        monitor.y + (bottom ? free_height : 0),
        size.width,
        size.height
    };
}

double PlacementEngine::siblingWeight(const Rect& candidate, const Rect& sibling) const {
    double candidate_area = static_cast<double>(candidate.area());
    double nonoverlap = 1.0;
    if (candidate_area > 0.0) {
        nonoverlap = 1.0 - static_cast<double>(overlapArea(candidate, sibling)) / candidate_area;
    }

    return std::pow(tuning_.bias_base, tuning_.bias_scale * nonoverlap) +
           centerDistanceSquared(candidate, sibling);
}

double PlacementEngine::cellWeight(const Rect& candidate, const std::vector<Rect>& siblings) const {
    if (siblings.empty()) {
        return 1.0;
    }

    double weight = std::numeric_limits<double>::infinity();
    for (const auto& sibling : siblings) {
        weight = std::min(weight, siblingWeight(candidate, sibling));
    }
    return weight;
}

std::vector<GridCell> PlacementEngine::buildGrid(const Size& size, const Rect& monitor,
                                                 const std::vector<Rect>& siblings,
                                                 size_t popup_index) const {
    const int side = tuning_.cell_side;
    const int area_width = std::max(0, monitor.width - size.width);
    const int area_height = std::max(0, monitor.height - size.height);

    // Never less than one cell, even when the free area is thinner than a cell
    const int columns = std::max(1, area_width / side);
    const int rows = std::max(1, area_height / side);

    const bool uniform = popup_index <= 1 || siblings.empty();

    std::vector<GridCell> cells;
    cells.reserve(static_cast<size_t>(columns) * rows);

    for (int column = 0; column < columns; ++column) {
        for (int row = 0; row < rows; ++row) {
            GridCell cell;
            cell.offset_x = column * side;
            cell.offset_y = row * side;

            // The last cell on each axis absorbs the remainder
            cell.span_x = (column == columns - 1) ? area_width - cell.offset_x : side - 1;
            cell.span_y = (row == rows - 1) ? area_height - cell.offset_y : side - 1;

            if (uniform) {
                cell.weight = 1.0;
            } else {
                Rect candidate{monitor.x + cell.offset_x, monitor.y + cell.offset_y,
                               size.width, size.height};
                cell.weight = cellWeight(candidate, siblings);
            }

            cells.push_back(cell);
        }
    }

    return cells;
}

Rect PlacementEngine::placeOnGrid(const Size& size, const Rect& monitor,
                                  const std::vector<Rect>& siblings, size_t popup_index,
                                  RandomEngine& rng) const {
    auto cells = buildGrid(size, monitor, siblings, popup_index);

    std::vector<double> weights;
    weights.reserve(cells.size());
    for (const auto& cell : cells) {
        weights.push_back(cell.weight);
    }

    size_t chosen = 0;
    if (auto index = weightedIndex(weights, rng)) {
        chosen = *index;
    } else {
        chosen = static_cast<size_t>(randomInt(0, static_cast<int>(cells.size()) - 1, rng));
    }

    const GridCell& cell = cells[chosen];
    int x = cell.offset_x + randomInt(0, std::max(0, cell.span_x), rng);
    int y = cell.offset_y + randomInt(0, std::max(0, cell.span_y), rng);

    return {monitor.x + x, monitor.y + y, size.width, size.height};
}

}
