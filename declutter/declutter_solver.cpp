#include "declutter_solver.hpp"
#include "logging.hpp"

namespace netdeclutter {

SolveResult DeclutterSolver::solve(DeclutterSimulation& simulation,
                                   SimulationContext& ctx,
                                   const SolveConfig& config) {
    auto log = netdeclutter::logging::get_logger();

    SolveResult result;
    result.initial_energy = simulation.compute_energy().total();

    log->info("DeclutterSolver: starting with {} nodes, {} edges, initial energy = {}",
              simulation.graph().node_count(), simulation.graph().edge_count(),
              result.initial_energy);

    simulation.init(ctx);

    bool running = true;
    while (running) {
        running = simulation.step(ctx);
        ctx.increment_step();

        if (running && config.frame_callback && config.frame_interval > 0 &&
            simulation.current_step() % config.frame_interval == 0) {
            config.frame_callback(simulation, simulation.current_step());
        }
    }

    result.stop_reason = simulation.stop_reason();
    result.steps = simulation.current_step();
    result.final_energy = simulation.compute_energy().total();

    log->info("DeclutterSolver: {} after {} steps, final energy = {}",
              to_string(result.stop_reason), result.steps, result.final_energy);

    return result;
}

}  // namespace netdeclutter
