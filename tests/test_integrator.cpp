#include <gtest/gtest.h>
#include <declutter/integrator.hpp>
#include "test_helpers.hpp"
#include <cmath>

using namespace netdeclutter;

class IntegratorTest : public ::testing::Test {
protected:
    DeclutterParams params;
};

TEST_F(IntegratorTest, DampedVelocityUpdate) {
    NetworkGraph graph;
    NodeId id = test::add_node(graph, NodeCategory::Client, 0.5, 0.5);
    graph.node(id).velocity = Vec2(0.001, 0.0);
    graph.node(id).force = Vec2(0.01, 0.0);

    IntegrationStats stats = integrate_step(graph, params);

    double vx = 0.9 * 0.001 + 0.1 * 0.01;
    EXPECT_NEAR(graph.node(id).velocity.x, vx, 1e-15);
    EXPECT_NEAR(graph.node(id).position.x, 0.5 + vx, 1e-15);
    EXPECT_NEAR(stats.mean_speed, vx, 1e-15);
    EXPECT_EQ(stats.clamp_hits, 0);
}

TEST_F(IntegratorTest, SpeedClampedByMagnitude) {
    NetworkGraph graph;
    NodeId id = test::add_node(graph, NodeCategory::Client, 0.5, 0.5);
    graph.node(id).force = Vec2(1.0, 1.0);

    IntegrationStats stats = integrate_step(graph, params);

    const Vec2& v = graph.node(id).velocity;
    // Diagonal motion is not allowed to reach sqrt(2) * vmax
    EXPECT_NEAR(v.length(), params.vmax, 1e-12);
    EXPECT_NEAR(v.x, v.y, 1e-15);
    EXPECT_EQ(stats.clamp_hits, 1);
}

TEST_F(IntegratorTest, PositionClampedByVisualRadius) {
    NetworkGraph graph;
    NodeId right = test::add_node(graph, NodeCategory::Client, 0.99, 0.5, 0.05);
    NodeId bottom = test::add_node(graph, NodeCategory::Server, 0.5, 0.01, 0.05);
    graph.node(right).force = Vec2(1.0, 0.0);
    graph.node(bottom).force = Vec2(0.0, -1.0);

    integrate_step(graph, params);

    EXPECT_DOUBLE_EQ(graph.node(right).position.x, 0.95);
    EXPECT_DOUBLE_EQ(graph.node(bottom).position.y, 0.05);
    EXPECT_TRUE(test::within_bounds(graph));
}

TEST_F(IntegratorTest, ZeroRadiusClampsToUnitSquare) {
    NetworkGraph graph;
    NodeId id = test::add_node(graph, NodeCategory::Printer, 0.005, 0.995);
    graph.node(id).force = Vec2(-1.0, 1.0);

    integrate_step(graph, params);

    EXPECT_DOUBLE_EQ(graph.node(id).position.x, 0.0);
    EXPECT_DOUBLE_EQ(graph.node(id).position.y, 1.0);
}

TEST_F(IntegratorTest, NegativeRadiusTreatedAsZero) {
    NetworkGraph graph;
    NodeId id = test::add_node(graph, NodeCategory::Client, 0.005, 0.5, -0.1);
    graph.node(id).force = Vec2(-1.0, 0.0);

    integrate_step(graph, params);

    EXPECT_DOUBLE_EQ(graph.node(id).position.x, 0.0);
}

TEST_F(IntegratorTest, MeanSpeedAveragesNodes) {
    NetworkGraph graph;
    test::add_node(graph, NodeCategory::Client, 0.5, 0.5);
    test::add_node(graph, NodeCategory::Client, 0.3, 0.3);
    graph.node(0).force = Vec2(0.02, 0.0);   // v = 0.002
    graph.node(1).force = Vec2(0.0, 0.04);   // v = 0.004

    IntegrationStats stats = integrate_step(graph, params);

    EXPECT_NEAR(stats.mean_speed, 0.003, 1e-15);
}

TEST_F(IntegratorTest, MeasureVelocitiesCountsClampHits) {
    NetworkGraph graph;
    test::add_node(graph, NodeCategory::Client, 0.5, 0.5);
    test::add_node(graph, NodeCategory::Client, 0.3, 0.3);
    graph.node(0).velocity = Vec2(params.vmax, 0.0);
    graph.node(1).velocity = Vec2(0.0, 0.001);

    IntegrationStats stats = measure_velocities(graph, params);

    EXPECT_EQ(stats.clamp_hits, 1);
    EXPECT_NEAR(stats.mean_speed, (params.vmax + 0.001) / 2.0, 1e-15);
}

TEST_F(IntegratorTest, EmptyGraph) {
    NetworkGraph graph;
    IntegrationStats stats = integrate_step(graph, params);
    EXPECT_EQ(stats.mean_speed, 0.0);
    EXPECT_EQ(stats.clamp_hits, 0);
}
