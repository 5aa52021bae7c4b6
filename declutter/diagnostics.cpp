#include "diagnostics.hpp"
#include "declutter_forces.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace netdeclutter {

EnergyBreakdown compute_energy(const NetworkGraph& graph,
                               const DeclutterParams& params,
                               const CategoryMultiplierTable& table) {
    EnergyBreakdown energy;
    const auto& nodes = graph.nodes();

    // Spring potential energy: 0.5 * k' * (r - r0')^2
    for (const auto& edge : graph.edges()) {
        const auto& a = nodes[edge.node_a];
        const auto& b = nodes[edge.node_b];
        double r = a.position.distance_to(b.position) + params.spring_eps;

        SpringCoefficients c = spring_coefficients(a.category, b.category, params, table);
        double dr = r - c.rest_length;
        energy.spring += 0.5 * c.stiffness * dr * dr;
    }

    // Repulsion potential: strength / r, whose gradient is the strength / r^2 force
    std::vector<double> radii = graph.visual_radii();
    for (size_t i = 0; i < nodes.size(); ++i) {
        for (size_t j = i + 1; j < nodes.size(); ++j) {
            double r2 = (nodes[i].position - nodes[j].position).length_squared() +
                        params.repulsion_eps;
            double strength = pair_repulsion_strength(nodes[i].category, radii[i],
                                                      nodes[j].category, radii[j],
                                                      r2, params, table);
            energy.repulsion += strength / std::sqrt(r2);
        }
    }

    const Vec2 center = vec2::center();
    for (const auto& node : nodes) {
        energy.center += 0.5 * params.center_k * (node.position - center).length_squared();
        energy.kinetic += 0.5 * node.velocity.length_squared();
    }

    return energy;
}

double min_pairwise_separation(const NetworkGraph& graph, double overlap_pad) {
    const auto& nodes = graph.nodes();
    std::vector<double> radii = graph.visual_radii();

    double min_sep = std::numeric_limits<double>::infinity();
    for (size_t i = 0; i < nodes.size(); ++i) {
        for (size_t j = i + 1; j < nodes.size(); ++j) {
            double r = nodes[i].position.distance_to(nodes[j].position);
            min_sep = std::min(min_sep, r / (radii[i] + radii[j] + overlap_pad));
        }
    }
    return min_sep;
}

DiagnosticsSample compute_diagnostics(const NetworkGraph& graph,
                                      const DeclutterParams& params,
                                      const CategoryMultiplierTable& table,
                                      int step,
                                      double rms_force,
                                      std::optional<IntegrationStats> stats) {
    if (!stats) {
        stats = measure_velocities(graph, params);
    }

    DiagnosticsSample sample;
    sample.step = step;
    sample.energy = compute_energy(graph, params, table);
    sample.mean_speed = stats->mean_speed;
    sample.rms_force = rms_force;
    sample.clamp_hit_fraction = static_cast<double>(stats->clamp_hits) /
                                static_cast<double>(std::max<size_t>(1, graph.node_count()));
    sample.min_pair_separation = min_pairwise_separation(graph, params.overlap_pad);
    return sample;
}

}  // namespace netdeclutter
