#ifndef NETDECLUTTER_DECLUTTER_FORCES_HPP
#define NETDECLUTTER_DECLUTTER_FORCES_HPP

#include "declutter_params.hpp"
#include <network/network_graph.hpp>
#include <vector>

namespace netdeclutter {

// Effective spring constant and equilibrium length for one edge
struct SpringCoefficients {
    double stiffness = 0.0;
    double rest_length = 0.0;
};

SpringCoefficients spring_coefficients(NodeCategory a, NodeCategory b,
                                       const DeclutterParams& params,
                                       const CategoryMultiplierTable& table);

// Repulsion strength for one pair at softened squared distance r2.
// Starts at repulsion_c, takes the category factor, then overlap_boost
// when r2 is inside (radius_a + radius_b + overlap_pad)^2.
double pair_repulsion_strength(NodeCategory a, double radius_a,
                               NodeCategory b, double radius_b,
                               double r2,
                               const DeclutterParams& params,
                               const CategoryMultiplierTable& table);

// Compute all forces on the graph nodes. Zeroes the accumulators first.
// Returns the RMS net force magnitude over all nodes.
double compute_forces(NetworkGraph& graph,
                      const DeclutterParams& params,
                      const CategoryMultiplierTable& table);

// RMS net force of the current layout. The graph is left untouched; forces
// are accumulated in a scratch graph.
double rms_net_force(const NetworkGraph& graph,
                     const DeclutterParams& params,
                     const CategoryMultiplierTable& table);

// Individual force components (for testing and debugging)

// Spring force per edge: F = k' * (r - r0') along the edge
void compute_spring_forces(NetworkGraph& graph,
                           const DeclutterParams& params,
                           const CategoryMultiplierTable& table);

// Repulsion over all unordered pairs: F = strength / r^2
void compute_repulsion_forces(NetworkGraph& graph,
                              const std::vector<double>& radii,
                              const DeclutterParams& params,
                              const CategoryMultiplierTable& table);

// Centering toward (0.5, 0.5): F = -center_k * (p - center).
// Applied last, so it also returns the sum of squared net force magnitudes.
double compute_centering_forces(NetworkGraph& graph, double center_k);

}  // namespace netdeclutter

#endif // NETDECLUTTER_DECLUTTER_FORCES_HPP
