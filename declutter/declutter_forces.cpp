#include "declutter_forces.hpp"
#include <algorithm>
#include <cmath>

namespace netdeclutter {

SpringCoefficients spring_coefficients(NodeCategory a, NodeCategory b,
                                       const DeclutterParams& params,
                                       const CategoryMultiplierTable& table) {
    const PairMultipliers& m = table.lookup(a, b);
    return {params.spring_k * m.stiffness, params.rest_length * m.rest_length};
}

double pair_repulsion_strength(NodeCategory a, double radius_a,
                               NodeCategory b, double radius_b,
                               double r2,
                               const DeclutterParams& params,
                               const CategoryMultiplierTable& table) {
    double strength = params.repulsion_c * table.lookup(a, b).repulsion;

    double min_dist = radius_a + radius_b + params.overlap_pad;
    if (r2 < min_dist * min_dist) {
        strength *= params.overlap_boost;
    }
    return strength;
}

double compute_forces(NetworkGraph& graph,
                      const DeclutterParams& params,
                      const CategoryMultiplierTable& table) {
    // Clear all forces first
    graph.clear_all_forces();

    compute_spring_forces(graph, params, table);

    // One radius read per node per step; the renderer may update them meanwhile
    compute_repulsion_forces(graph, graph.visual_radii(), params, table);

    double force_sq_sum = compute_centering_forces(graph, params.center_k);

    size_t n = std::max<size_t>(1, graph.node_count());
    return std::sqrt(force_sq_sum / static_cast<double>(n));
}

double rms_net_force(const NetworkGraph& graph,
                     const DeclutterParams& params,
                     const CategoryMultiplierTable& table) {
    NetworkGraph scratch;
    for (const auto& node : graph.nodes()) {
        NetworkNode copy;
        copy.category = node.category;
        copy.position = node.position;
        copy.velocity = node.velocity;
        copy.visual_radius = graph.visual_radius(node.id);
        scratch.add_node(copy);
    }
    for (const auto& edge : graph.edges()) {
        scratch.add_edge(edge.node_a, edge.node_b, edge.kind);
    }
    return compute_forces(scratch, params, table);
}

void compute_spring_forces(NetworkGraph& graph,
                           const DeclutterParams& params,
                           const CategoryMultiplierTable& table) {
    auto& nodes = graph.nodes();

    for (const auto& edge : graph.edges()) {
        auto& a = nodes[edge.node_a];
        auto& b = nodes[edge.node_b];

        Vec2 delta = b.position - a.position;
        double length = delta.length() + params.spring_eps;

        SpringCoefficients c = spring_coefficients(a.category, b.category, params, table);

        // f > 0 pulls endpoints together, f < 0 pushes them apart
        double f = c.stiffness * (length - c.rest_length);
        Vec2 force = (delta / length) * f;

        a.add_force(force);
        b.add_force(-force);
    }
}

void compute_repulsion_forces(NetworkGraph& graph,
                              const std::vector<double>& radii,
                              const DeclutterParams& params,
                              const CategoryMultiplierTable& table) {
    auto& nodes = graph.nodes();
    const size_t n = nodes.size();

    for (size_t i = 0; i < n; ++i) {
        auto& a = nodes[i];
        for (size_t j = i + 1; j < n; ++j) {
            auto& b = nodes[j];

            Vec2 delta = a.position - b.position;
            double r2 = delta.length_squared() + params.repulsion_eps;
            double r = std::sqrt(r2);

            double strength = pair_repulsion_strength(a.category, radii[i],
                                                      b.category, radii[j],
                                                      r2, params, table);

            // Points from b to a
            Vec2 force = (delta / r) * (strength / r2);
            a.add_force(force);
            b.add_force(-force);
        }
    }
}

double compute_centering_forces(NetworkGraph& graph, double center_k) {
    const Vec2 center = vec2::center();
    double force_sq_sum = 0.0;

    for (auto& node : graph.nodes()) {
        node.add_force((node.position - center) * -center_k);
        force_sq_sum += node.force.length_squared();
    }
    return force_sq_sum;
}

}  // namespace netdeclutter
