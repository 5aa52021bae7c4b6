#ifndef NETDECLUTTER_TEST_HELPERS_HPP
#define NETDECLUTTER_TEST_HELPERS_HPP

#include <network/network_graph.hpp>
#include <declutter/simulation_context.hpp>
#include <cmath>
#include <string>
#include <vector>

namespace netdeclutter {
namespace test {

// Add a node at (x, y) with the given icon radius
inline NodeId add_node(NetworkGraph& graph, NodeCategory category,
                       double x, double y, double radius = 0.0) {
    NetworkNode node;
    node.category = category;
    node.position = Vec2(x, y);
    node.visual_radius = radius;
    return graph.add_node(node);
}

// True if every position and velocity is finite
inline bool all_finite(const NetworkGraph& graph) {
    for (const auto& node : graph.nodes()) {
        if (!node.position.is_finite() || !node.velocity.is_finite()) {
            return false;
        }
    }
    return true;
}

// True if every node satisfies radius <= x,y <= 1 - radius
inline bool within_bounds(const NetworkGraph& graph) {
    for (const auto& node : graph.nodes()) {
        double r = graph.visual_radius(node.id);
        if (node.position.x < r || node.position.x > 1.0 - r ||
            node.position.y < r || node.position.y > 1.0 - r) {
            return false;
        }
    }
    return true;
}

// Records everything the simulation posts to the engine
struct RecordingEngine {
    std::vector<std::string> messages;
    std::vector<ProgressInfo> progress;
    int refreshes = 0;

    EngineCallbacks callbacks() {
        EngineCallbacks cb;
        cb.post_message = [this](const std::string& text) { messages.push_back(text); };
        cb.post_progress = [this](const ProgressInfo& p) { progress.push_back(p); };
        cb.request_refresh = [this]() { ++refreshes; };
        return cb;
    }
};

}  // namespace test
}  // namespace netdeclutter

#endif // NETDECLUTTER_TEST_HELPERS_HPP
