#include "gtest/gtest.h"
#include "force_model.hpp"
#include <cmath>
#include <random>

namespace {

/// Graph whose nodes sit at the given positions.
GraphState placedGraph(const std::vector<Vector2>& positions, const EdgeList& edges = {}) {
    return GraphState::place(positions, edges);
}

ForceParameters only(double repulsion, double spring, double gravity, bool gravityOn = false) {
    ForceParameters p;
    p.repulsion      = repulsion;
    p.spring         = spring;
    p.gravity        = gravity;
    p.gravityEnabled = gravityOn;
    return p;
}

} // namespace

TEST(ForceModelTest, RepulsionIsInverseSquareAndPushesApart) {
    const GraphState g = placedGraph({ { 0.0, 0.0 }, { 2.0, 0.0 } });
    const auto f = ForceModel::computeForces(g, only(8.0, 0.0, 0.0));

    ASSERT_EQ(f.size(), 2u);
    EXPECT_DOUBLE_EQ(f[0].x, -2.0);   // 8 / 2²
    EXPECT_DOUBLE_EQ(f[1].x,  2.0);
    EXPECT_DOUBLE_EQ(f[0].y,  0.0);
    EXPECT_DOUBLE_EQ(f[1].y,  0.0);
}

TEST(ForceModelTest, RepulsionUsesDistanceFloor) {
    ForceParameters p = only(1.0, 0.0, 0.0);
    p.minDistance = 0.5;

    const GraphState g = placedGraph({ { 0.0, 0.0 }, { 0.0, 0.01 } });
    const auto f = ForceModel::computeForces(g, p);

    EXPECT_NEAR(glm::length(f[0]), 4.0, 1e-12);   // 1 / 0.5²
    EXPECT_LT(f[0].y, 0.0);
    EXPECT_GT(f[1].y, 0.0);
}

TEST(ForceModelTest, CoincidentNodesGetFiniteOppositeForces) {
    ForceParameters p = only(1.0, 0.0, 0.0);
    p.minDistance = 0.1;

    const GraphState g = placedGraph({ { 1.0, 1.0 }, { 1.0, 1.0 } });
    const auto f = ForceModel::computeForces(g, p);

    ASSERT_TRUE(isFinite(f[0]));
    ASSERT_TRUE(isFinite(f[1]));
    EXPECT_NEAR(f[0].x,  100.0, 1e-9);
    EXPECT_NEAR(f[1].x, -100.0, 1e-9);
}

TEST(ForceModelTest, SpringPullsStretchedEdgeTogether) {
    ForceParameters p = only(0.0, 3.0, 0.0);
    p.restLength = 1.0;

    const GraphState g = placedGraph({ { 0.0, 0.0 }, { 0.0, 4.0 } }, { { 0, 1 } });
    const auto f = ForceModel::computeForces(g, p);

    EXPECT_DOUBLE_EQ(f[0].y,  9.0);   // 3 * (4 - 1)
    EXPECT_DOUBLE_EQ(f[1].y, -9.0);
}

TEST(ForceModelTest, SpringPushesCompressedEdgeApart) {
    ForceParameters p = only(0.0, 2.0, 0.0);
    p.restLength = 3.0;

    const GraphState g = placedGraph({ { 0.0, 0.0 }, { 1.0, 0.0 } }, { { 1, 0 } });
    const auto f = ForceModel::computeForces(g, p);

    EXPECT_DOUBLE_EQ(f[0].x, -4.0);   // 2 * (1 - 3)
    EXPECT_DOUBLE_EQ(f[1].x,  4.0);
}

TEST(ForceModelTest, SpringAtRestLengthIsZero) {
    ForceParameters p = only(0.0, 10.0, 0.0);
    p.restLength = 5.0;

    const GraphState g = placedGraph({ { 0.0, 0.0 }, { 3.0, 4.0 } }, { { 0, 1 } });
    const auto f = ForceModel::computeForces(g, p);

    EXPECT_NEAR(glm::length(f[0]), 0.0, 1e-12);
    EXPECT_NEAR(glm::length(f[1]), 0.0, 1e-12);
}

TEST(ForceModelTest, GravityOnlyWhenEnabled) {
    const GraphState g = placedGraph({ { 3.0, -4.0 } });

    const auto off = ForceModel::computeForces(g, only(0.0, 0.0, 2.0, false));
    EXPECT_EQ(off[0], Vector2(0.0));

    const auto on = ForceModel::computeForces(g, only(0.0, 0.0, 2.0, true));
    EXPECT_DOUBLE_EQ(on[0].x, -6.0);
    EXPECT_DOUBLE_EQ(on[0].y,  8.0);
}

TEST(ForceModelTest, GravityPullsTowardConfiguredCenter) {
    ForceParameters p = only(0.0, 0.0, 1.0, true);
    p.gravityCenter = { 10.0, 10.0 };

    const GraphState g = placedGraph({ { 10.0, 12.0 } });
    const auto f = ForceModel::computeForces(g, p);

    EXPECT_DOUBLE_EQ(f[0].x,  0.0);
    EXPECT_DOUBLE_EQ(f[0].y, -2.0);
}

TEST(ForceModelTest, NetForceIsSumOfTerms) {
    ForceParameters p;
    p.gravityEnabled = true;

    const GraphState g = placedGraph({ { 0.3, -1.0 }, { 1.7, 0.4 }, { -0.9, 1.1 } },
                                     { { 0, 1 }, { 1, 2 } });

    std::vector<Vector2> expected(3, Vector2{ 0.0 });
    ForceModel::addRepulsion(g, p, expected);
    ForceModel::addSprings  (g, p, expected);
    ForceModel::addGravity  (g, p, expected);

    const auto f = ForceModel::computeForces(g, p);
    for (std::size_t i = 0; i < 3; ++i) {
        EXPECT_DOUBLE_EQ(f[i].x, expected[i].x);
        EXPECT_DOUBLE_EQ(f[i].y, expected[i].y);
    }
}

TEST(ForceModelTest, InternalForcesCancel) {
    ForceParameters p;   // gravity disabled: only pairwise terms

    std::mt19937_64 rng{ 5 };
    const GraphState g = GraphState::create(12, EdgeList{ { 0, 1 }, { 1, 2 }, { 5, 9 }, { 11, 3 } },
                                            Bounds{}, rng);
    const auto f = ForceModel::computeForces(g, p);

    Vector2 sum{ 0.0 };
    double  scale = 0.0;
    for (const Vector2& v : f) {
        sum   += v;
        scale += glm::length(v);
    }
    EXPECT_LT(glm::length(sum), 1e-9 * scale);
}

TEST(ForceModelTest, SameInputSameOutput) {
    const ForceParameters p;
    std::mt19937_64 rng{ 77 };
    const GraphState g = GraphState::create(8, EdgeList{ { 0, 7 }, { 2, 3 } }, Bounds{}, rng);

    const auto a = ForceModel::computeForces(g, p);
    const auto b = ForceModel::computeForces(g, p);
    EXPECT_EQ(a, b);
}

TEST(ForceParametersTest, DefaultsAreValid) {
    EXPECT_NO_THROW(ForceParameters{}.validate());
}

TEST(ForceParametersTest, RejectsOutOfRangeFields) {
    auto expectInvalid = [](auto mutate) {
        ForceParameters p;
        mutate(p);
        EXPECT_THROW(p.validate(), std::domain_error);
    };
    expectInvalid([](ForceParameters& p) { p.damping     = 1.0;  });
    expectInvalid([](ForceParameters& p) { p.damping     = -0.1; });
    expectInvalid([](ForceParameters& p) { p.timeStep    = 0.0;  });
    expectInvalid([](ForceParameters& p) { p.minDistance = 0.0;  });
    expectInvalid([](ForceParameters& p) { p.repulsion   = -1.0; });
    expectInvalid([](ForceParameters& p) { p.spring      = std::nan(""); });
    expectInvalid([](ForceParameters& p) { p.restLength  = -2.0; });
}
