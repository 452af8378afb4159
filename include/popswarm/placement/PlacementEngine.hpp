#pragma once

/**
 * @file PlacementEngine.hpp
 * @brief Popup sizing and position selection
 *
 * Two placement styles:
 * - Lowkey: deterministic, anchored to one of the monitor's four corners
 * - Grid-weighted: the free area is split into square cells, every cell is
 *   scored against the live siblings and one is sampled by weight
 *
 * A cell's score is the minimum of its per-sibling scores, so a position is
 * only as good as its worst conflict.
 */

#include <cstddef>
#include <vector>

#include "popswarm/geometry/Rect.hpp"
#include "popswarm/utils/Random.hpp"

namespace pswarm {

enum class LowkeyCorner {
    TopLeft = 0,
    TopRight = 1,
    BottomLeft = 2,
    BottomRight = 3,
    Random = 4
};

struct PlacementOptions {
    bool lowkey_mode{false};
    int lowkey_corner{static_cast<int>(LowkeyCorner::Random)};
};

/**
 * @brief Tunables of the grid search
 *
 * A sibling contributes bias_base^(bias_scale * nonoverlap) + distance^2 to a
 * cell, where nonoverlap is the fraction of the candidate left uncovered by
 * that sibling.
 */
struct PlacementTuning {
    int cell_side{50};
    double bias_base{2.0};
    double bias_scale{32.0};

    int normal_min_percent{30};
    int normal_max_percent{70};
    int lowkey_min_percent{20};
    int lowkey_max_percent{50};
};

struct GridCell {
    int offset_x{0};        // relative to the monitor origin
    int offset_y{0};
    int span_x{0};          // inclusive extent of the cell along each axis
    int span_y{0};
    double weight{1.0};
};

class PlacementEngine {
public:
    explicit PlacementEngine(PlacementTuning tuning = {});

    Size computeSize(int source_width, int source_height, const Rect& monitor,
                     bool lowkey_mode, RandomEngine& rng) const;

    Rect place(const Size& size, const Rect& monitor,
               const std::vector<Rect>& siblings, size_t popup_index,
               const PlacementOptions& options, RandomEngine& rng) const;

    // Corner must already be resolved (0..3)
    Rect placeInCorner(const Size& size, const Rect& monitor, LowkeyCorner corner) const;

    std::vector<GridCell> buildGrid(const Size& size, const Rect& monitor,
                                    const std::vector<Rect>& siblings,
                                    size_t popup_index) const;

    double siblingWeight(const Rect& candidate, const Rect& sibling) const;

    double cellWeight(const Rect& candidate, const std::vector<Rect>& siblings) const;

    const PlacementTuning& getTuning() const { return tuning_; }

    static LowkeyCorner resolveCorner(int corner, RandomEngine& rng);

private:
    PlacementTuning tuning_;

    Rect placeOnGrid(const Size& size, const Rect& monitor,
                     const std::vector<Rect>& siblings, size_t popup_index,
                     RandomEngine& rng) const;
};

}
