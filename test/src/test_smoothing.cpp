#include "valnoise/smoothing.h"
#include "valnoise/random_source.h"
#include "valnoise/white_noise.h"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace valnoise;

namespace {

// base(h, w) = (4h + w + 1) / 32
Grid rampGrid4x4() {
    Grid base(4, 4);
    for (int h = 0; h < 4; ++h) {
        for (int w = 0; w < 4; ++w) {
            base(h, w) = (4.0 * h + w + 1.0) / 32.0;
        }
    }
    return base;
}

void expectAnchors(int index, int level, int extent, int lower, int upper, double blend) {
    const SampleAnchors anchors = computeAnchors(index, level, extent);
    EXPECT_EQ(anchors.lower, lower) << "index " << index << " level " << level;
    EXPECT_EQ(anchors.upper, upper) << "index " << index << " level " << level;
    EXPECT_EQ(anchors.blend, blend) << "index " << index << " level " << level;
}

} // namespace

TEST(AnchorTest, PeriodOneAdvancesToNextIndex) {
    expectAnchors(0, 0, 4, 0, 1, 0.0);
    expectAnchors(1, 0, 4, 1, 2, 0.0);
    expectAnchors(2, 0, 4, 2, 3, 0.0);
    expectAnchors(3, 0, 4, 3, 0, 0.0);
}

TEST(AnchorTest, FourByFourWrapAnchors) {
    // period 2
    expectAnchors(0, 1, 4, 0, 2, 0.0);
    expectAnchors(1, 1, 4, 0, 2, 0.5);
    expectAnchors(2, 1, 4, 2, 0, 0.0);
    expectAnchors(3, 1, 4, 2, 0, 0.5);
    // period 4 equals the grid size, both anchors collapse onto 0
    expectAnchors(0, 2, 4, 0, 0, 0.0);
    expectAnchors(1, 2, 4, 0, 0, 0.25);
    expectAnchors(2, 2, 4, 0, 0, 0.5);
    expectAnchors(3, 2, 4, 0, 0, 0.75);
    // period 8 is wider than the grid
    expectAnchors(3, 3, 4, 0, 0, 0.375);
}

TEST(AnchorTest, PeriodFoldsIntoNonPowerOfTwoAxis) {
    // 4 mod 3 == 1
    expectAnchors(0, 2, 3, 0, 1, 0.0);
    expectAnchors(2, 2, 3, 0, 1, 0.5);
    // 2^100 mod 5 == 1
    expectAnchors(4, 100, 5, 0, 1, 4.0 * 0x1p-100);
    // 2^40 mod 3 == 1
    expectAnchors(2, 40, 3, 0, 1, 2.0 * 0x1p-40);
}

TEST(AnchorTest, HugeLevelsStayFinite) {
    const SampleAnchors anchors = computeAnchors(6, 1 << 30, 7);
    EXPECT_EQ(anchors.lower, 0);
    EXPECT_GE(anchors.upper, 0);
    EXPECT_LT(anchors.upper, 7);
    EXPECT_EQ(anchors.blend, 0.0);
}

TEST(AnchorTest, SingleCellAxis) {
    for (int level = 0; level < 70; ++level) {
        expectAnchors(0, level, 1, 0, 0, 0.0);
    }
}

TEST(AnchorTest, RejectsInvalidArguments) {
    EXPECT_THROW(computeAnchors(0, -1, 4), std::invalid_argument);
    EXPECT_THROW(computeAnchors(4, 0, 4), std::out_of_range);
    EXPECT_THROW(computeAnchors(-1, 0, 4), std::out_of_range);
    EXPECT_THROW(computeAnchors(0, 0, 0), std::out_of_range);
}

TEST(SmoothNoiseTest, LevelZeroReproducesBase) {
    SeededRandomSource source(Seed("identity"));
    const Grid base = generateWhiteNoise(17, 11, source);
    EXPECT_EQ(smoothNoise(base, 0), base);
}

TEST(SmoothNoiseTest, HandComputedLevelOne) {
    const Grid base = rampGrid4x4();
    const Grid smooth = smoothNoise(base, 1);

    // (1, 1): rows 0/2 and columns 0/2, both blends 0.5
    // top = lerp(b00, b20) = 5/32, bottom = lerp(b22, b02) = 7/32
    EXPECT_DOUBLE_EQ(smooth(1, 1), 6.0 / 32.0);

    // (3, 3): rows 2/0 and columns 2/0 wrap around
    const double top = interpolate(base(2, 2), base(0, 2), 0.5);
    const double bottom = interpolate(base(0, 0), base(2, 0), 0.5);
    EXPECT_DOUBLE_EQ(smooth(3, 3), interpolate(top, bottom, 0.5));

    // anchor cells keep their value
    EXPECT_EQ(smooth(0, 0), base(0, 0));
    EXPECT_EQ(smooth(2, 2), base(2, 2));
}

TEST(SmoothNoiseTest, PeriodCoveringGridFlattensToFirstSample) {
    const Grid base = rampGrid4x4();
    for (int level = 2; level < 6; ++level) {
        const Grid smooth = smoothNoise(base, level);
        for (int h = 0; h < 4; ++h) {
            for (int w = 0; w < 4; ++w) {
                EXPECT_DOUBLE_EQ(smooth(h, w), base(0, 0));
            }
        }
    }
}

TEST(SmoothNoiseTest, KeepsShapeAndRange) {
    SeededRandomSource source(Seed(5));
    const Grid base = generateWhiteNoise(23, 9, source);
    for (int level = 0; level < 12; ++level) {
        const Grid smooth = smoothNoise(base, level);
        ASSERT_EQ(smooth.width(), 23);
        ASSERT_EQ(smooth.height(), 9);
        for (double value : smooth.samples()) {
            EXPECT_GE(value, 0.0);
            EXPECT_LE(value, 1.0);
        }
    }
}

TEST(SmoothNoiseTest, RejectsNegativeLevel) {
    EXPECT_THROW(smoothNoise(Grid(2, 2), -1), std::invalid_argument);
}
