#ifndef NETDECLUTTER_DECLUTTER_DIAGNOSTICS_HPP
#define NETDECLUTTER_DECLUTTER_DIAGNOSTICS_HPP

#include "declutter_params.hpp"
#include "integrator.hpp"
#include <network/network_graph.hpp>
#include <optional>

namespace netdeclutter {

// Pseudo-energy decomposition of a layout. Damping, clamping and the
// piecewise multipliers make the dynamics non-conservative, so these only
// track convergence; they are not conserved.
struct EnergyBreakdown {
    double spring = 0.0;          // sum 1/2 k' (r - r0')^2 over edges
    double repulsion = 0.0;       // sum strength / r over pairs
    double center = 0.0;          // sum 1/2 center_k |p - center|^2
    double kinetic = 0.0;         // sum 1/2 |v|^2

    double potential() const { return spring + repulsion + center; }
    double total() const { return potential() + kinetic; }
};

// Immutable snapshot taken at one step
struct DiagnosticsSample {
    int step = 0;
    EnergyBreakdown energy;

    double mean_speed = 0.0;
    double rms_force = 0.0;
    double clamp_hit_fraction = 0.0;
    double min_pair_separation = 0.0;  // min over pairs of r / (r_a + r_b + pad)

    double potential() const { return energy.potential(); }
    double total() const { return energy.total(); }

    // Large when forces remain but nodes are pinned by the speed clamp
    double force_speed_ratio() const { return rms_force / (1.0e-12 + mean_speed); }
};

EnergyBreakdown compute_energy(const NetworkGraph& graph,
                               const DeclutterParams& params,
                               const CategoryMultiplierTable& table);

// +infinity for fewer than two nodes
double min_pairwise_separation(const NetworkGraph& graph, double overlap_pad);

// Build a sample. Without stats, mean speed and clamp hits are recomputed
// from the current velocities.
DiagnosticsSample compute_diagnostics(const NetworkGraph& graph,
                                      const DeclutterParams& params,
                                      const CategoryMultiplierTable& table,
                                      int step,
                                      double rms_force,
                                      std::optional<IntegrationStats> stats = std::nullopt);

}  // namespace netdeclutter

#endif // NETDECLUTTER_DECLUTTER_DIAGNOSTICS_HPP
