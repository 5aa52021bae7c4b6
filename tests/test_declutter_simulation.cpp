#include <gtest/gtest.h>
#include <declutter/declutter_simulation.hpp>
#include <declutter/declutter_forces.hpp>
#include <network/network_builder.hpp>
#include "test_helpers.hpp"
#include <cmath>
#include <cstdint>
#include <random>
#include <stdexcept>

using namespace netdeclutter;

class DeclutterSimulationTest : public ::testing::Test {
protected:
    test::RecordingEngine engine;
    SimulationContext ctx{engine.callbacks()};

    static NetworkGraph small_network() {
        return build_random_graph(4, 6, 0, 42);
    }
};

TEST_F(DeclutterSimulationTest, RejectsInvalidParams) {
    DeclutterParams params;
    params.damping = 1.5;
    EXPECT_THROW({ DeclutterSimulation sim(small_network(), params); }, std::invalid_argument);

    params = DeclutterParams{};
    params.vmax = 0.0;
    EXPECT_THROW({ DeclutterSimulation sim(small_network(), params); }, std::invalid_argument);

    params = DeclutterParams{};
    params.overlap_pad = -0.5;
    EXPECT_THROW({ DeclutterSimulation sim(small_network(), params); }, std::invalid_argument);

    params = DeclutterParams{};
    params.overlap_pad = 0.0;
    EXPECT_THROW({ DeclutterSimulation sim(small_network(), params); }, std::invalid_argument);

    params = DeclutterParams{};
    params.clamp_tolerance = -1e-9;
    EXPECT_THROW({ DeclutterSimulation sim(small_network(), params); }, std::invalid_argument);
}

TEST_F(DeclutterSimulationTest, InitAnnouncesRun) {
    DeclutterSimulation sim(small_network());
    sim.init(ctx);

    ASSERT_EQ(engine.messages.size(), 1u);
    EXPECT_EQ(engine.messages[0], "Network generated. Relaxing layout...");
    ASSERT_EQ(engine.progress.size(), 1u);
    EXPECT_TRUE(engine.progress[0].indeterminate);
    EXPECT_EQ(engine.refreshes, 1);
    EXPECT_EQ(sim.current_step(), 0);
    EXPECT_EQ(sim.stop_reason(), StopReason::Running);
}

TEST_F(DeclutterSimulationTest, FiftyStepsStayFiniteAndInBounds) {
    DeclutterSimulation sim(small_network());
    sim.graph().set_all_visual_radii(0.02);
    sim.init(ctx);

    for (int i = 0; i < 50; ++i) {
        ASSERT_TRUE(sim.step(ctx)) << "stopped early at step " << i + 1;
        ASSERT_TRUE(test::all_finite(sim.graph())) << "step " << i + 1;
        ASSERT_TRUE(test::within_bounds(sim.graph())) << "step " << i + 1;
        for (const auto& node : sim.graph().nodes()) {
            ASSERT_LE(node.velocity.length(), sim.params().vmax + 1e-12);
        }
    }
    EXPECT_EQ(sim.current_step(), 50);
    EXPECT_TRUE(std::isfinite(sim.last_rms_force()));
}

TEST_F(DeclutterSimulationTest, RelaxationLowersEnergy) {
    DeclutterSimulation sim(small_network());
    sim.init(ctx);

    double initial = sim.compute_energy().potential();
    for (int i = 0; i < 200 && sim.step(ctx); ++i) {
    }
    EXPECT_LT(sim.compute_energy().potential(), initial);
}

TEST_F(DeclutterSimulationTest, ReportingCadence) {
    DeclutterSimulation sim(small_network());
    sim.init(ctx);

    for (int i = 0; i < 20; ++i) {
        ASSERT_TRUE(sim.step(ctx));
    }

    // Diagnostics every 5 steps
    std::vector<DiagnosticsSample> samples = sim.diagnostics().drain();
    ASSERT_EQ(samples.size(), 4u);
    EXPECT_EQ(samples[0].step, 5);
    EXPECT_EQ(samples[3].step, 20);
    for (const auto& s : samples) {
        EXPECT_DOUBLE_EQ(s.total(), s.energy.spring + s.energy.repulsion +
                                    s.energy.center + s.energy.kinetic);
    }

    // Progress every 10 steps, after the indeterminate one from init
    ASSERT_EQ(engine.progress.size(), 3u);
    EXPECT_FALSE(engine.progress[1].indeterminate);
    EXPECT_EQ(engine.progress[1].label, "Relaxing... step 10");
    EXPECT_EQ(engine.progress[2].label, "Relaxing... step 20");
    EXPECT_GE(engine.progress[2].fraction, 0.0);
    EXPECT_LE(engine.progress[2].fraction, 1.0);

    // Refresh every 2 steps plus one from init
    EXPECT_EQ(engine.refreshes, 11);
}

TEST_F(DeclutterSimulationTest, TerminatesWithinStepLimit) {
    DeclutterSimulation sim(small_network());
    sim.init(ctx);

    int calls = 0;
    while (sim.step(ctx)) {
        ++calls;
        ASSERT_LE(calls, sim.params().max_steps);
    }

    EXPECT_LE(sim.current_step(), sim.params().max_steps);
    EXPECT_TRUE(sim.stop_reason() == StopReason::Settled ||
                sim.stop_reason() == StopReason::StepLimitReached);
}

TEST_F(DeclutterSimulationTest, TerminatesForEverySeedAtDefaultCounts) {
    NetworkCounts counts;  // 14 servers, 100 clients, 5 printers

    for (uint32_t seed = 0; seed < 6; ++seed) {
        std::mt19937 rng(seed);
        DeclutterSimulation sim(NetworkBuilder::random(counts, rng));
        sim.graph().set_all_visual_radii(0.01);

        SimulationContext bare;
        sim.init(bare);

        int calls = 0;
        while (sim.step(bare)) {
            ++calls;
            ASSERT_LT(calls, sim.params().max_steps) << "seed " << seed;
        }

        EXPECT_LE(sim.current_step(), sim.params().max_steps) << "seed " << seed;
        EXPECT_TRUE(sim.stop_reason() == StopReason::Settled ||
                    sim.stop_reason() == StopReason::StepLimitReached) << "seed " << seed;
        EXPECT_TRUE(test::all_finite(sim.graph())) << "seed " << seed;
        EXPECT_TRUE(test::within_bounds(sim.graph())) << "seed " << seed;
    }
}

TEST_F(DeclutterSimulationTest, SettlesWhenAtRest) {
    NetworkGraph graph;
    test::add_node(graph, NodeCategory::Client, 0.5, 0.5);

    DeclutterParams params;
    params.min_steps = 1;
    DeclutterSimulation sim(std::move(graph), params);
    sim.init(ctx);

    EXPECT_FALSE(sim.step(ctx));
    EXPECT_EQ(sim.stop_reason(), StopReason::Settled);
    EXPECT_EQ(sim.current_step(), 1);

    ASSERT_FALSE(engine.messages.empty());
    EXPECT_EQ(engine.messages.back(), "Settled.");
    EXPECT_FALSE(engine.progress.back().indeterminate);
    EXPECT_DOUBLE_EQ(engine.progress.back().fraction, 1.0);
}

TEST_F(DeclutterSimulationTest, StopsAtStepLimit) {
    DeclutterParams params;
    params.max_steps = 3;
    params.settle_force = 0.0;
    DeclutterSimulation sim(small_network(), params);
    sim.init(ctx);

    EXPECT_TRUE(sim.step(ctx));
    EXPECT_TRUE(sim.step(ctx));
    EXPECT_FALSE(sim.step(ctx));
    EXPECT_EQ(sim.stop_reason(), StopReason::StepLimitReached);
    EXPECT_EQ(engine.messages.back(), "Step limit reached.");

    // Further steps are no-ops
    EXPECT_FALSE(sim.step(ctx));
    EXPECT_EQ(sim.current_step(), 3);
}

TEST_F(DeclutterSimulationTest, CancelStopsWithoutMutation) {
    DeclutterSimulation sim(small_network());
    sim.init(ctx);
    ASSERT_TRUE(sim.step(ctx));

    std::vector<Vec2> before;
    for (const auto& node : sim.graph().nodes()) {
        before.push_back(node.position);
    }

    sim.cancel(ctx);
    EXPECT_EQ(engine.messages.back(), "Cancel requested.");
    EXPECT_TRUE(engine.progress.back().indeterminate);
    EXPECT_EQ(engine.progress.back().label, "Canceling...");

    EXPECT_FALSE(sim.step(ctx));
    EXPECT_EQ(sim.stop_reason(), StopReason::Canceled);
    EXPECT_EQ(sim.current_step(), 1);
    for (NodeId id = 0; id < sim.graph().node_count(); ++id) {
        EXPECT_EQ(sim.graph().node(id).position, before[id]);
    }
}

TEST_F(DeclutterSimulationTest, ContextCancelStopsRun) {
    DeclutterSimulation sim(small_network());
    sim.init(ctx);

    ctx.request_cancel();
    EXPECT_FALSE(sim.step(ctx));
    EXPECT_EQ(sim.stop_reason(), StopReason::Canceled);
    EXPECT_EQ(sim.current_step(), 0);
}

TEST_F(DeclutterSimulationTest, InitClearsPreviousStop) {
    DeclutterSimulation sim(small_network());
    sim.init(ctx);
    sim.cancel(ctx);
    EXPECT_FALSE(sim.step(ctx));

    sim.init(ctx);
    EXPECT_EQ(sim.stop_reason(), StopReason::Running);
    EXPECT_TRUE(sim.step(ctx));
}

TEST_F(DeclutterSimulationTest, WorksWithoutEngine) {
    SimulationContext bare;
    DeclutterSimulation sim(small_network());
    sim.init(bare);
    for (int i = 0; i < 10; ++i) {
        EXPECT_TRUE(sim.step(bare));
    }
}

TEST_F(DeclutterSimulationTest, DiagnosticsOfCurrentLayout) {
    DeclutterSimulation sim(small_network());
    sim.init(ctx);
    for (int i = 0; i < 7; ++i) {
        sim.step(ctx);
    }

    DiagnosticsSample sample = sim.compute_diagnostics();
    EXPECT_EQ(sample.step, 7);
    // Forces are re-measured at the integrated positions
    EXPECT_DOUBLE_EQ(sample.rms_force,
                     rms_net_force(sim.graph(), sim.params(), sim.params().multipliers()));
    EXPECT_NEAR(sample.mean_speed, sim.last_mean_speed(), 1e-15);
    EXPECT_DOUBLE_EQ(sample.total(), sim.compute_energy().total());
}

TEST_F(DeclutterSimulationTest, DiagnosticsBeforeFirstStep) {
    DeclutterSimulation sim(small_network());

    DiagnosticsSample sample = sim.compute_diagnostics();

    EXPECT_EQ(sample.step, 0);
    EXPECT_GT(sample.rms_force, 0.0);
    EXPECT_EQ(sample.mean_speed, 0.0);
    EXPECT_GT(sample.force_speed_ratio(), 0.0);
    EXPECT_EQ(sim.last_rms_force(), 0.0);
}
