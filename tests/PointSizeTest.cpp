#include <gtest/gtest.h>

#include "render/PointSize.hpp"

using render::MAX_POINT_RADIUS;

TEST(PointSize, ScalesWithDepth) {
    // 2.0 * 400 / 200 * 0.5
    EXPECT_EQ(render::particleRadius(2.0f, 200.0f), 2);
    // 2.0 * 300 / 100 * 0.5
    EXPECT_EQ(render::starRadius(2.0f, 100.0f), 3);
}

TEST(PointSize, FarPointsKeepMinimum) {
    EXPECT_EQ(render::particleRadius(1.0f, 1900.0f), 1);
    EXPECT_EQ(render::starRadius(0.5f, 1900.0f), 0);
}

TEST(PointSize, NearPlaneIsCapped) {
    // Particle sizes reach 4, the near plane is at 0.1
    EXPECT_EQ(render::particleRadius(4.0f, 0.1f), MAX_POINT_RADIUS);
    EXPECT_EQ(render::particleRadius(1e30f, 1e-30f), MAX_POINT_RADIUS);
    EXPECT_EQ(render::starRadius(3.0f, 0.1f), MAX_POINT_RADIUS);
}

TEST(PointSize, NonPositiveDepth) {
    EXPECT_EQ(render::particleRadius(2.0f, 0.0f), 1);
    EXPECT_EQ(render::starRadius(2.0f, -5.0f), 0);
}
