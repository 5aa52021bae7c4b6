#include <gtest/gtest.h>
#include <declutter/declutter_solver.hpp>
#include <network/network_builder.hpp>
#include <vector>

using namespace netdeclutter;

TEST(DeclutterSolver, RunsToCompletion) {
    DeclutterSimulation sim(build_random_graph(4, 6, 0, 42));
    SimulationContext ctx;

    SolveResult result = DeclutterSolver::solve(sim, ctx);

    EXPECT_TRUE(is_stopped(result.stop_reason));
    EXPECT_NE(result.stop_reason, StopReason::Canceled);
    EXPECT_EQ(result.steps, sim.current_step());
    EXPECT_LE(result.steps, sim.params().max_steps);
    EXPECT_LT(result.final_energy, result.initial_energy);
    EXPECT_GE(ctx.step_count(), result.steps);
}

TEST(DeclutterSolver, FrameCallback) {
    DeclutterParams params;
    params.max_steps = 50;
    params.settle_force = 0.0;
    DeclutterSimulation sim(build_random_graph(4, 6, 0, 3), params);
    SimulationContext ctx;

    std::vector<int> frames;
    SolveConfig config;
    config.frame_interval = 10;
    config.frame_callback = [&frames](const DeclutterSimulation&, int step) {
        frames.push_back(step);
    };

    SolveResult result = DeclutterSolver::solve(sim, ctx, config);

    EXPECT_EQ(result.stop_reason, StopReason::StepLimitReached);
    EXPECT_EQ(result.steps, 50);
    // The final step stops the run and is not captured
    EXPECT_EQ(frames, (std::vector<int>{10, 20, 30, 40}));
}

TEST(DeclutterSolver, CanceledBeforeStart) {
    DeclutterSimulation sim(build_random_graph(4, 6, 0, 42));
    SimulationContext ctx;
    ctx.request_cancel();

    SolveResult result = DeclutterSolver::solve(sim, ctx);

    EXPECT_EQ(result.stop_reason, StopReason::Canceled);
    EXPECT_EQ(result.steps, 0);
    EXPECT_DOUBLE_EQ(result.final_energy, result.initial_energy);
}
