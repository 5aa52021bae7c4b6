#ifndef NETDECLUTTER_DECLUTTER_INTEGRATOR_HPP
#define NETDECLUTTER_DECLUTTER_INTEGRATOR_HPP

#include "declutter_params.hpp"
#include <network/network_graph.hpp>

namespace netdeclutter {

// Per-step statistics gathered while integrating
struct IntegrationStats {
    double mean_speed = 0.0;      // Mean |v| after clamping
    int clamp_hits = 0;           // Nodes whose speed ended at vmax
};

// Advance every node one step from its accumulated force:
//   v <- damping * v + dt * F
//   |v| clamped to vmax by rescaling the whole vector
//   x <- x + v, then each axis clamped into [radius, 1 - radius]
IntegrationStats integrate_step(NetworkGraph& graph, const DeclutterParams& params);

// Mean speed and clamp-hit count from the current velocities, for callers
// that did not keep the stats from integrate_step.
IntegrationStats measure_velocities(const NetworkGraph& graph, const DeclutterParams& params);

}  // namespace netdeclutter

#endif // NETDECLUTTER_DECLUTTER_INTEGRATOR_HPP
