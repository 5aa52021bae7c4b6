#include "integrator.hpp"
#include <algorithm>
#include <cmath>

namespace netdeclutter {

IntegrationStats integrate_step(NetworkGraph& graph, const DeclutterParams& params) {
    auto& nodes = graph.nodes();
    const double vmax2 = params.vmax * params.vmax;
    const double hit_speed = params.vmax - params.clamp_tolerance;

    IntegrationStats stats;
    double speed_sum = 0.0;

    for (auto& node : nodes) {
        node.velocity = node.velocity * params.damping + node.force * params.dt;

        // Clamp by magnitude. Clamping each axis separately lets diagonal
        // motion reach sqrt(2) * vmax.
        double v2 = node.velocity.length_squared();
        if (v2 > vmax2) {
            double s = params.vmax / std::sqrt(v2);
            node.velocity *= s;
        }

        node.position += node.velocity;

        double rad = std::max(0.0, graph.visual_radius(node.id));
        node.position.x = std::max(rad, std::min(1.0 - rad, node.position.x));
        node.position.y = std::max(rad, std::min(1.0 - rad, node.position.y));

        double speed = node.velocity.length();
        speed_sum += speed;
        if (speed >= hit_speed) {
            ++stats.clamp_hits;
        }
    }

    stats.mean_speed = speed_sum / static_cast<double>(std::max<size_t>(1, nodes.size()));
    return stats;
}

IntegrationStats measure_velocities(const NetworkGraph& graph, const DeclutterParams& params) {
    const double hit_speed = params.vmax - params.clamp_tolerance;

    IntegrationStats stats;
    double speed_sum = 0.0;
    for (const auto& node : graph.nodes()) {
        double v2 = node.velocity.length_squared();
        speed_sum += std::sqrt(v2);
        if (v2 >= hit_speed * hit_speed) {
            ++stats.clamp_hits;
        }
    }
    stats.mean_speed = speed_sum / static_cast<double>(std::max<size_t>(1, graph.node_count()));
    return stats;
}

}  // namespace netdeclutter
