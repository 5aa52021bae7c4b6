#ifndef NETDECLUTTER_NETWORK_GRAPH_HPP
#define NETDECLUTTER_NETWORK_GRAPH_HPP

#include "network_node.hpp"
#include "network_edge.hpp"
#include <vector>

namespace netdeclutter {

// Number of nodes of each category in a network.
struct NetworkCounts {
    int server_count = 14;
    int client_count = 100;
    int printer_count = 5;

    int total() const { return server_count + client_count + printer_count; }
};

// Container for the network being decluttered.
// Nodes are stored contiguously and addressed by NodeId; the category
// lists hold ids into the same array. Edges refer to nodes by id.
class NetworkGraph {
public:
    NetworkGraph() = default;

    // Node management
    NodeId add_node(const NetworkNode& node);
    NetworkNode& node(NodeId id);
    const NetworkNode& node(NodeId id) const;
    size_t node_count() const { return nodes_.size(); }
    std::vector<NetworkNode>& nodes() { return nodes_; }
    const std::vector<NetworkNode>& nodes() const { return nodes_; }

    // Edge management
    EdgeId add_edge(NodeId a, NodeId b, EdgeKind kind);
    NetworkEdge& edge(EdgeId id);
    const NetworkEdge& edge(EdgeId id) const;
    size_t edge_count() const { return edges_.size(); }
    const std::vector<NetworkEdge>& edges() const { return edges_; }

    // Category views (ids in insertion order)
    const std::vector<NodeId>& servers() const { return servers_; }
    const std::vector<NodeId>& clients() const { return clients_; }
    const std::vector<NodeId>& printers() const { return printers_; }
    NetworkCounts counts() const;

    // Get edges connected to a node
    std::vector<EdgeId> edges_for_node(NodeId node_id) const;

    // Renderer-facing radius access. Safe to call from another thread
    // while a simulation step is running.
    double visual_radius(NodeId id) const;
    void set_visual_radius(NodeId id, double radius);
    void set_all_visual_radii(double radius);

    // Snapshot of every node's radius, indexed by NodeId
    std::vector<double> visual_radii() const;

    // Clear all forces on all nodes
    void clear_all_forces();

private:
    std::vector<NetworkNode> nodes_;
    std::vector<NetworkEdge> edges_;

    std::vector<NodeId> servers_;
    std::vector<NodeId> clients_;
    std::vector<NodeId> printers_;
};

}  // namespace netdeclutter

#endif // NETDECLUTTER_NETWORK_GRAPH_HPP
