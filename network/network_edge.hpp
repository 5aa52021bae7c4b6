#ifndef NETDECLUTTER_NETWORK_EDGE_HPP
#define NETDECLUTTER_NETWORK_EDGE_HPP

#include "network_node.hpp"
#include <cstdint>

namespace netdeclutter {

using EdgeId = uint32_t;

// Where the connection came from. The physics treats both kinds
// symmetrically; the multipliers are chosen from the endpoint categories.
enum class EdgeKind {
    ClientServer,
    ClientPrinter
};

// Undirected spring connection between two nodes, stored by index.
struct NetworkEdge {
    EdgeId id = 0;
    NodeId node_a = 0;
    NodeId node_b = 0;

    EdgeKind kind = EdgeKind::ClientServer;
};

}  // namespace netdeclutter

#endif // NETDECLUTTER_NETWORK_EDGE_HPP
