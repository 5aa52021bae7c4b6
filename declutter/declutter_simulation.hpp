#ifndef NETDECLUTTER_DECLUTTER_SIMULATION_HPP
#define NETDECLUTTER_DECLUTTER_SIMULATION_HPP

#include "convergence.hpp"
#include "declutter_params.hpp"
#include "diagnostics.hpp"
#include "diagnostics_channel.hpp"
#include "simulation_context.hpp"
#include <network/network_graph.hpp>
#include <atomic>

namespace netdeclutter {

// Force-directed decluttering of a server/client/printer network in the
// unit square.
//
// Each step zeroes and refills the force accumulators from springs (edges),
// all-pairs repulsion and a weak pull toward the center, then integrates
// with damping and a speed clamp and keeps every icon fully inside the
// square. The loop stops on cancel, when the layout settles after
// min_steps, or at max_steps.
//
// The simulation owns its graph. The renderer may write visual radii
// through graph().set_visual_radius() from its own thread; everything else
// is mutated only by the thread calling step().
class DeclutterSimulation {
public:
    explicit DeclutterSimulation(NetworkGraph graph,
                                 const DeclutterParams& params = DeclutterParams{});

    DeclutterSimulation(const DeclutterSimulation&) = delete;
    DeclutterSimulation& operator=(const DeclutterSimulation&) = delete;

    // Reset counters and announce the run
    void init(SimulationContext& ctx);

    // One physics update. Returns true to keep going.
    bool step(SimulationContext& ctx);

    // Request a stop at the start of the next step
    void cancel(SimulationContext& ctx);

    NetworkGraph& graph() { return graph_; }
    const NetworkGraph& graph() const { return graph_; }
    const DeclutterParams& params() const { return params_; }

    int current_step() const { return step_; }
    StopReason stop_reason() const { return stop_reason_; }
    double last_rms_force() const { return last_rms_force_; }
    double last_mean_speed() const { return last_stats_.mean_speed; }

    // Samples pushed every diagnostics_interval steps
    DiagnosticsChannel& diagnostics() { return diagnostics_; }

    // Energy terms of the current layout
    EnergyBreakdown compute_energy() const;

    // Full sample of the current layout, forces and velocities re-measured
    DiagnosticsSample compute_diagnostics() const;

private:
    void finish(SimulationContext& ctx, StopReason reason);

    NetworkGraph graph_;
    DeclutterParams params_;
    CategoryMultiplierTable multipliers_;

    int step_ = 0;
    StopReason stop_reason_ = StopReason::Running;
    double last_rms_force_ = 0.0;
    IntegrationStats last_stats_;

    std::atomic<bool> canceled_{false};
    DiagnosticsChannel diagnostics_;
};

}  // namespace netdeclutter

#endif // NETDECLUTTER_DECLUTTER_SIMULATION_HPP
