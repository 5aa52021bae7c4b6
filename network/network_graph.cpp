#include "network_graph.hpp"
#include <atomic>
#include <stdexcept>

namespace netdeclutter {

NodeId NetworkGraph::add_node(const NetworkNode& node) {
    NodeId id = static_cast<NodeId>(nodes_.size());
    NetworkNode new_node = node;
    new_node.id = id;
    nodes_.push_back(new_node);

    switch (new_node.category) {
        case NodeCategory::Server:
            servers_.push_back(id);
            break;
        case NodeCategory::Client:
            clients_.push_back(id);
            break;
        case NodeCategory::Printer:
            printers_.push_back(id);
            break;
    }
    return id;
}

NetworkNode& NetworkGraph::node(NodeId id) {
    if (id >= nodes_.size()) {
        throw std::out_of_range("NetworkGraph::node: invalid node id");
    }
    return nodes_[id];
}

const NetworkNode& NetworkGraph::node(NodeId id) const {
    if (id >= nodes_.size()) {
        throw std::out_of_range("NetworkGraph::node: invalid node id");
    }
    return nodes_[id];
}

EdgeId NetworkGraph::add_edge(NodeId a, NodeId b, EdgeKind kind) {
    if (a >= nodes_.size() || b >= nodes_.size()) {
        throw std::out_of_range("NetworkGraph::add_edge: invalid node id");
    }
    NetworkEdge new_edge;
    new_edge.id = static_cast<EdgeId>(edges_.size());
    new_edge.node_a = a;
    new_edge.node_b = b;
    new_edge.kind = kind;
    edges_.push_back(new_edge);
    return new_edge.id;
}

NetworkEdge& NetworkGraph::edge(EdgeId id) {
    if (id >= edges_.size()) {
        throw std::out_of_range("NetworkGraph::edge: invalid edge id");
    }
    return edges_[id];
}

const NetworkEdge& NetworkGraph::edge(EdgeId id) const {
    if (id >= edges_.size()) {
        throw std::out_of_range("NetworkGraph::edge: invalid edge id");
    }
    return edges_[id];
}

NetworkCounts NetworkGraph::counts() const {
    NetworkCounts result;
    result.server_count = static_cast<int>(servers_.size());
    result.client_count = static_cast<int>(clients_.size());
    result.printer_count = static_cast<int>(printers_.size());
    return result;
}

std::vector<EdgeId> NetworkGraph::edges_for_node(NodeId node_id) const {
    std::vector<EdgeId> result;
    for (const auto& edge : edges_) {
        if (edge.node_a == node_id || edge.node_b == node_id) {
            result.push_back(edge.id);
        }
    }
    return result;
}

double NetworkGraph::visual_radius(NodeId id) const {
    // atomic_ref needs a non-const referent; the load does not modify it
    auto& radius = const_cast<double&>(node(id).visual_radius);
    return std::atomic_ref<double>(radius).load(std::memory_order_relaxed);
}

void NetworkGraph::set_visual_radius(NodeId id, double radius) {
    std::atomic_ref<double>(node(id).visual_radius).store(radius, std::memory_order_relaxed);
}

void NetworkGraph::set_all_visual_radii(double radius) {
    for (auto& n : nodes_) {
        std::atomic_ref<double>(n.visual_radius).store(radius, std::memory_order_relaxed);
    }
}

std::vector<double> NetworkGraph::visual_radii() const {
    std::vector<double> radii;
    radii.reserve(nodes_.size());
    for (NodeId id = 0; id < nodes_.size(); ++id) {
        radii.push_back(visual_radius(id));
    }
    return radii;
}

void NetworkGraph::clear_all_forces() {
    for (auto& n : nodes_) {
        n.clear_force();
    }
}

}  // namespace netdeclutter
