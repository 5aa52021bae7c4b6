#ifndef NETDECLUTTER_NETWORK_NODE_HPP
#define NETDECLUTTER_NETWORK_NODE_HPP

#include <math/vec2.hpp>
#include <atomic>
#include <cstddef>
#include <cstdint>

namespace netdeclutter {

using NodeId = uint32_t;

// Closed set of node categories. The category selects force multipliers
// and is never changed after the node is created.
enum class NodeCategory : uint8_t {
    Server = 0,
    Client = 1,
    Printer = 2
};

constexpr size_t kNodeCategoryCount = 3;

constexpr size_t category_index(NodeCategory category) {
    return static_cast<size_t>(category);
}

constexpr const char* to_string(NodeCategory category) {
    switch (category) {
        case NodeCategory::Server:  return "Server";
        case NodeCategory::Client:  return "Client";
        case NodeCategory::Printer: return "Printer";
    }
    return "Unknown";
}

// A node of the network layout.
// Kinematic state (position, velocity, force) belongs to the simulation.
// visual_radius belongs to the renderer; go through
// NetworkGraph::visual_radius()/set_visual_radius() once a simulation runs.
struct NetworkNode {
    NodeId id = 0;
    NodeCategory category = NodeCategory::Client;

    Vec2 position;                // World position in [0,1]^2
    Vec2 velocity;                // World units per step
    Vec2 force;                   // Accumulated force, refilled every step

    // Icon radius in world units (0 when unset)
    alignas(std::atomic_ref<double>::required_alignment) double visual_radius = 0.0;

    // Reset forces for a new step
    void clear_force() {
        force = Vec2::zero();
    }

    void add_force(const Vec2& f) {
        force += f;
    }
};

}  // namespace netdeclutter

#endif // NETDECLUTTER_NETWORK_NODE_HPP
