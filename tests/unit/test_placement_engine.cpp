#include <gtest/gtest.h>
#include "popswarm/placement/PlacementEngine.hpp"
#include <algorithm>
#include <array>
#include <cmath>

using namespace pswarm;

class PlacementEngineTest : public ::testing::Test {
protected:
    PlacementEngine engine;
    RandomEngine rng{2024};
    Rect monitor{0, 0, 1920, 1080};
};

TEST_F(PlacementEngineTest, SizeKeepsAspectRatio) {
    for (int i = 0; i < 100; ++i) {
        Size size = engine.computeSize(1000, 500, monitor, false, rng);
        EXPECT_NEAR(size.width, size.height * 2, 2);
    }
}

TEST_F(PlacementEngineTest, NormalSizeRange) {
    // Long side lands between 30% and 70% of the monitor's short side
    for (int i = 0; i < 200; ++i) {
        Size size = engine.computeSize(1000, 500, monitor, false, rng);
        EXPECT_GE(size.width, 323);
        EXPECT_LE(size.width, 756);
    }
}

TEST_F(PlacementEngineTest, LowkeySizeRange) {
    for (int i = 0; i < 200; ++i) {
        Size size = engine.computeSize(400, 800, monitor, true, rng);
        EXPECT_GE(size.height, 215);
        EXPECT_LE(size.height, 540);
    }
}

TEST_F(PlacementEngineTest, DegenerateSourceStillHasSize) {
    Size size = engine.computeSize(0, 0, monitor, false, rng);
    EXPECT_GE(size.width, 1);
    EXPECT_GE(size.height, 1);
}

TEST_F(PlacementEngineTest, LowkeyTopRightCorner) {
    PlacementOptions options;
    options.lowkey_mode = true;
    options.lowkey_corner = 1;

    Rect rect = engine.place({300, 200}, monitor, {}, 1, options, rng);
    EXPECT_EQ(rect, (Rect{1620, 0, 300, 200}));
}

TEST_F(PlacementEngineTest, LowkeyCornersOnOffsetMonitor) {
    Rect second{1920, 0, 1280, 1024};
    Size size{200, 100};

    EXPECT_EQ(engine.placeInCorner(size, second, LowkeyCorner::TopLeft), (Rect{1920, 0, 200, 100}));
    EXPECT_EQ(engine.placeInCorner(size, second, LowkeyCorner::TopRight), (Rect{3000, 0, 200, 100}));
    EXPECT_EQ(engine.placeInCorner(size, second, LowkeyCorner::BottomLeft), (Rect{1920, 924, 200, 100}));
    EXPECT_EQ(engine.placeInCorner(size, second, LowkeyCorner::BottomRight), (Rect{3000, 924, 200, 100}));
}

TEST_F(PlacementEngineTest, LowkeyRandomCornerPicksOneOfFour) {
    PlacementOptions options;
    options.lowkey_mode = true;
    options.lowkey_corner = 4;

    std::array<Rect, 4> corners{
        Rect{0, 0, 300, 200}, Rect{1620, 0, 300, 200},
        Rect{0, 880, 300, 200}, Rect{1620, 880, 300, 200}
    };

    std::array<int, 4> hits{};
    for (int i = 0; i < 400; ++i) {
        Rect rect = engine.place({300, 200}, monitor, {}, 1, options, rng);
        auto it = std::find(corners.begin(), corners.end(), rect);
        ASSERT_NE(it, corners.end());
        ++hits[std::distance(corners.begin(), it)];
    }

    for (int count : hits) {
        EXPECT_GT(count, 0);
    }
}

TEST_F(PlacementEngineTest, PlacementStaysOnMonitor) {
    Rect offset_monitor{1920, 100, 1280, 1024};
    std::vector<Rect> siblings{{2000, 200, 300, 300}, {2500, 600, 400, 300}};

    for (int i = 0; i < 500; ++i) {
        Rect rect = engine.place({350, 250}, offset_monitor, siblings, 3, {}, rng);
        EXPECT_TRUE(offset_monitor.contains(rect))
            << rect.x << "," << rect.y << " " << rect.width << "x" << rect.height;
    }
}

TEST_F(PlacementEngineTest, PopupLargerThanMonitorPinsToOrigin) {
    Rect small{100, 50, 300, 200};
    Rect rect = engine.place({400, 300}, small, {}, 1, {}, rng);

    EXPECT_EQ(rect.x, 100);
    EXPECT_EQ(rect.y, 50);
    EXPECT_EQ(rect.width, 400);
    EXPECT_EQ(rect.height, 300);
}

TEST_F(PlacementEngineTest, GridCoversFreeArea) {
    auto cells = engine.buildGrid({500, 300}, Rect{0, 0, 1000, 600}, {}, 1);
    ASSERT_EQ(cells.size(), 60u);

    int max_x = 0;
    int max_y = 0;
    for (const auto& cell : cells) {
        EXPECT_DOUBLE_EQ(cell.weight, 1.0);
        max_x = std::max(max_x, cell.offset_x + cell.span_x);
        max_y = std::max(max_y, cell.offset_y + cell.span_y);
    }
    EXPECT_EQ(max_x, 500);
    EXPECT_EQ(max_y, 300);
}

TEST_F(PlacementEngineTest, ThinFreeAreaGivesOneCell) {
    auto cells = engine.buildGrid({990, 590}, Rect{0, 0, 1000, 600}, {}, 1);
    ASSERT_EQ(cells.size(), 1u);
    EXPECT_EQ(cells[0].span_x, 10);
    EXPECT_EQ(cells[0].span_y, 10);
}

TEST_F(PlacementEngineTest, FirstPopupIgnoresSiblings) {
    std::vector<Rect> siblings{{0, 0, 500, 300}};
    auto cells = engine.buildGrid({500, 300}, Rect{0, 0, 1000, 600}, siblings, 1);

    for (const auto& cell : cells) {
        EXPECT_DOUBLE_EQ(cell.weight, 1.0);
    }
}

TEST_F(PlacementEngineTest, SiblingWeightFullOverlap) {
    Rect rect{100, 100, 200, 200};
    EXPECT_DOUBLE_EQ(engine.siblingWeight(rect, rect), 1.0);
}

TEST_F(PlacementEngineTest, SiblingWeightHalfOverlap) {
    Rect candidate{0, 0, 100, 100};
    Rect sibling{50, 0, 100, 100};

    // 2^(32 * 0.5) + 50^2
    EXPECT_DOUBLE_EQ(engine.siblingWeight(candidate, sibling), 65536.0 + 2500.0);
}

TEST_F(PlacementEngineTest, WeightGrowsWithDistanceWhenOverlapIsEqual) {
    Rect sibling{0, 0, 100, 100};

    double previous = 0.0;
    for (int x = 200; x <= 2000; x += 200) {
        double weight = engine.siblingWeight(Rect{x, 0, 100, 100}, sibling);
        EXPECT_GT(weight, previous);
        previous = weight;
    }
}

TEST_F(PlacementEngineTest, WeightGrowsAlongDiagonalAwayFromSibling) {
    Rect sibling{250, 250, 500, 500};

    double previous = engine.siblingWeight(Rect{250, 250, 500, 500}, sibling);
    for (int offset = 25; offset <= 250; offset += 25) {
        double weight = engine.siblingWeight(Rect{250 + offset, 250 + offset, 500, 500}, sibling);
        EXPECT_GT(weight, previous) << "offset " << offset;
        previous = weight;
    }
}

TEST_F(PlacementEngineTest, CellWeightIsMinimumOverSiblings) {
    Rect candidate{0, 0, 100, 100};
    Rect near{50, 50, 100, 100};
    Rect far{800, 800, 100, 100};

    double expected = std::min(engine.siblingWeight(candidate, near),
                               engine.siblingWeight(candidate, far));
    EXPECT_DOUBLE_EQ(engine.cellWeight(candidate, {near, far}), expected);
    EXPECT_DOUBLE_EQ(engine.cellWeight(candidate, {far, near}), expected);
}

TEST_F(PlacementEngineTest, CellWeightWithoutSiblingsIsOne) {
    EXPECT_DOUBLE_EQ(engine.cellWeight(Rect{0, 0, 10, 10}, {}), 1.0);
}

TEST_F(PlacementEngineTest, PrefersFreeQuadrant) {
    std::vector<Rect> siblings{
        {0, 0, 960, 540},
        {960, 0, 960, 540},
        {0, 540, 960, 540}
    };
    Size size{400, 300};

    const int trials = 2000;
    std::array<int, 4> quadrants{};     // TL, TR, BL, BR by popup center
    for (int i = 0; i < trials; ++i) {
        Rect rect = engine.place(size, monitor, siblings, 4, {}, rng);
        bool right = rect.centerX() >= 960.0;
        bool bottom = rect.centerY() >= 540.0;
        ++quadrants[(bottom ? 2 : 0) + (right ? 1 : 0)];
    }

    EXPECT_GT(quadrants[3], trials * 9 / 10);
    for (int q = 0; q < 3; ++q) {
        EXPECT_GT(quadrants[3], quadrants[q] * 10);
    }
}

TEST_F(PlacementEngineTest, FirstPopupIsUniformOverCells) {
    RandomEngine seeded(4242);
    Rect area{0, 0, 1000, 600};
    Size size{500, 300};

    const int columns = 10;
    const int rows = 6;
    const int samples = 60000;
    std::vector<int> counts(columns * rows, 0);

    for (int i = 0; i < samples; ++i) {
        Rect rect = engine.place(size, area, {}, 1, {}, seeded);
        int column = std::min(columns - 1, rect.x / 50);
        int row = std::min(rows - 1, rect.y / 50);
        ++counts[column * rows + row];
    }

    double expected = static_cast<double>(samples) / counts.size();
    double chi_square = 0.0;
    for (int count : counts) {
        double diff = count - expected;
        chi_square += diff * diff / expected;
    }

    // 59 degrees of freedom; the 99.9% quantile is about 98
    EXPECT_LT(chi_square, 120.0);
}

TEST_F(PlacementEngineTest, SameSeedSamePlacement) {
    std::vector<Rect> siblings{{100, 100, 400, 300}, {900, 500, 400, 300}};
    RandomEngine a(77);
    RandomEngine b(77);

    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(engine.place({300, 200}, monitor, siblings, 3, {}, a),
                  engine.place({300, 200}, monitor, siblings, 3, {}, b));
    }
}

TEST(PlacementResolveCornerTest, OutOfRangeIsRandom) {
    RandomEngine rng(5);
    for (int i = 0; i < 50; ++i) {
        int corner = static_cast<int>(PlacementEngine::resolveCorner(7, rng));
        EXPECT_GE(corner, 0);
        EXPECT_LE(corner, 3);
    }
    EXPECT_EQ(PlacementEngine::resolveCorner(2, rng), LowkeyCorner::BottomLeft);
}
