#ifndef NETDECLUTTER_SERIALIZATION_NETWORK_GRAPH_JSON_HPP
#define NETDECLUTTER_SERIALIZATION_NETWORK_GRAPH_JSON_HPP

#include <nlohmann/json.hpp>
#include <network/network_graph.hpp>
#include <network/network_node.hpp>
#include <network/network_edge.hpp>
#include "config_json.hpp"
#include <stdexcept>
#include <string>

namespace netdeclutter {

// NodeCategory enum serialization
NLOHMANN_JSON_SERIALIZE_ENUM(NodeCategory, {
    {NodeCategory::Server, "Server"},
    {NodeCategory::Client, "Client"},
    {NodeCategory::Printer, "Printer"},
})

// EdgeKind enum serialization
NLOHMANN_JSON_SERIALIZE_ENUM(EdgeKind, {
    {EdgeKind::ClientServer, "ClientServer"},
    {EdgeKind::ClientPrinter, "ClientPrinter"},
})

// NetworkNode serialization (forces are transient and not written)
inline void to_json(nlohmann::json& j, const NetworkNode& node) {
    j["id"] = node.id;
    j["category"] = node.category;
    j["position"] = node.position;
    j["velocity"] = node.velocity;
    j["visual_radius"] = node.visual_radius;
}

inline void from_json(const nlohmann::json& j, NetworkNode& node) {
    node.id = j.at("id").get<NodeId>();
    node.category = j.at("category").get<NodeCategory>();
    node.position = j.at("position").get<Vec2>();
    node.velocity = j.value("velocity", Vec2::zero());
    node.visual_radius = j.value("visual_radius", 0.0);
}

// NetworkEdge serialization
inline void to_json(nlohmann::json& j, const NetworkEdge& edge) {
    j["id"] = edge.id;
    j["node_a"] = edge.node_a;
    j["node_b"] = edge.node_b;
    j["kind"] = edge.kind;
}

inline void from_json(const nlohmann::json& j, NetworkEdge& edge) {
    edge.id = j.at("id").get<EdgeId>();
    edge.node_a = j.at("node_a").get<NodeId>();
    edge.node_b = j.at("node_b").get<NodeId>();
    edge.kind = j.value("kind", EdgeKind::ClientServer);
}

// Serialize a complete NetworkGraph
inline nlohmann::json network_graph_to_json(const NetworkGraph& graph) {
    nlohmann::json j;
    j["counts"] = graph.counts();

    nlohmann::json nodes = nlohmann::json::array();
    for (const auto& node : graph.nodes()) {
        nodes.push_back(node);
    }
    j["nodes"] = nodes;

    nlohmann::json edges = nlohmann::json::array();
    for (const auto& edge : graph.edges()) {
        edges.push_back(edge);
    }
    j["edges"] = edges;

    return j;
}

// Deserialize a NetworkGraph. Node ids must be dense and in order.
inline NetworkGraph network_graph_from_json(const nlohmann::json& j) {
    NetworkGraph graph;

    for (const auto& node_json : j.at("nodes")) {
        NetworkNode node = node_json.get<NetworkNode>();
        NodeId expected = static_cast<NodeId>(graph.node_count());
        if (node.id != expected) {
            throw std::runtime_error("network_graph_from_json: node ids must be dense, expected " +
                                     std::to_string(expected) + " got " + std::to_string(node.id));
        }
        graph.add_node(node);
    }

    for (const auto& edge_json : j.at("edges")) {
        NetworkEdge edge = edge_json.get<NetworkEdge>();
        graph.add_edge(edge.node_a, edge.node_b, edge.kind);
    }

    return graph;
}

}  // namespace netdeclutter

#endif // NETDECLUTTER_SERIALIZATION_NETWORK_GRAPH_JSON_HPP
