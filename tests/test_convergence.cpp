#include <gtest/gtest.h>
#include <declutter/convergence.hpp>
#include <string>

using namespace netdeclutter;

TEST(Convergence, SettleVelocityTiedToRestLength) {
    DeclutterParams params;
    EXPECT_DOUBLE_EQ(params.settle_velocity(), 0.05 / 25.0);
}

TEST(Convergence, KeepsRunningBeforeMinSteps) {
    DeclutterParams params;
    // Perfectly still, but too early
    EXPECT_EQ(evaluate_convergence(10, 0.0, 0.0, params), StopReason::Running);
    EXPECT_EQ(evaluate_convergence(249, 0.0, 0.0, params), StopReason::Running);
}

TEST(Convergence, SettlesWhenSlowAndBalanced) {
    DeclutterParams params;
    EXPECT_EQ(evaluate_convergence(250, 0.001, 0.005, params), StopReason::Settled);
}

TEST(Convergence, NeedsBothThresholds) {
    DeclutterParams params;
    // Slow but unbalanced
    EXPECT_EQ(evaluate_convergence(300, 0.001, 0.5, params), StopReason::Running);
    // Balanced but fast
    EXPECT_EQ(evaluate_convergence(300, 0.01, 0.001, params), StopReason::Running);
}

TEST(Convergence, StopsAtStepLimit) {
    DeclutterParams params;
    EXPECT_EQ(evaluate_convergence(1999, 0.01, 1.0, params), StopReason::Running);
    EXPECT_EQ(evaluate_convergence(2000, 0.01, 1.0, params), StopReason::StepLimitReached);
}

TEST(Convergence, SettledWinsAtStepLimit) {
    DeclutterParams params;
    EXPECT_EQ(evaluate_convergence(2000, 0.0, 0.0, params), StopReason::Settled);
}

TEST(Convergence, StopReasonNames) {
    EXPECT_EQ(std::string(to_string(StopReason::Running)), "running");
    EXPECT_EQ(std::string(to_string(StopReason::Settled)), "settled");
    EXPECT_EQ(std::string(to_string(StopReason::Canceled)), "canceled");
    EXPECT_EQ(std::string(to_string(StopReason::StepLimitReached)), "step limit reached");

    EXPECT_FALSE(is_stopped(StopReason::Running));
    EXPECT_TRUE(is_stopped(StopReason::Canceled));
}
