#include "gtest/gtest.h"
#include "vector2.hpp"
#include <cmath>
#include <limits>

TEST(Vector2Test, ArithmeticAndLength) {
    const Vector2 a{ 3.0, 4.0 };
    const Vector2 b{ 1.0, -2.0 };

    EXPECT_EQ(a + b, Vector2(4.0, 2.0));
    EXPECT_EQ(a - b, Vector2(2.0, 6.0));
    EXPECT_EQ(a * 2.0, Vector2(6.0, 8.0));
    EXPECT_DOUBLE_EQ(glm::length(a), 5.0);
}

TEST(Vector2Test, DirectionIsUnitLength) {
    const Vector2 d = directionOr(Vector2{ 3.0, 4.0 }, Vector2{ 1.0, 0.0 });
    EXPECT_DOUBLE_EQ(d.x, 0.6);
    EXPECT_DOUBLE_EQ(d.y, 0.8);
    EXPECT_NEAR(glm::length(d), 1.0, 1e-15);
}

TEST(Vector2Test, DirectionFallsBackForZeroAndNonFinite) {
    const Vector2 fallback{ 0.0, 1.0 };
    EXPECT_EQ(directionOr(Vector2{ 0.0 }, fallback), fallback);

    const double inf = std::numeric_limits<double>::infinity();
    EXPECT_EQ(directionOr(Vector2{ inf, 0.0 }, fallback), fallback);
}

TEST(Vector2Test, FiniteCheck) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();

    EXPECT_TRUE (isFinite(Vector2{ 1e300, -1e300 }));
    EXPECT_FALSE(isFinite(Vector2{ nan, 0.0 }));
    EXPECT_FALSE(isFinite(Vector2{ 0.0, -inf }));
}
