#ifndef NETDECLUTTER_DECLUTTER_SOLVER_HPP
#define NETDECLUTTER_DECLUTTER_SOLVER_HPP

#include "declutter_simulation.hpp"
#include <functional>

namespace netdeclutter {

// Callback function for frame capture during solving
// Called with (simulation, step_number)
using FrameCallback = std::function<void(const DeclutterSimulation&, int)>;

// Configuration for the batch driver
struct SolveConfig {
    // Frame capture callback (optional) - called every frame_interval steps
    FrameCallback frame_callback = nullptr;
    int frame_interval = 100;
};

// Result of solving
struct SolveResult {
    StopReason stop_reason = StopReason::Running;
    int steps = 0;
    double initial_energy = 0.0;
    double final_energy = 0.0;
};

// Runs a simulation to completion on the calling thread
class DeclutterSolver {
public:
    static SolveResult solve(DeclutterSimulation& simulation,
                             SimulationContext& ctx,
                             const SolveConfig& config = SolveConfig{});
};

}  // namespace netdeclutter

#endif // NETDECLUTTER_DECLUTTER_SOLVER_HPP
