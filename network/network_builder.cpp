#include "network_builder.hpp"
#include "logging.hpp"
#include <set>
#include <stdexcept>
#include <string>

namespace netdeclutter {

NetworkGraph NetworkBuilder::random(const NetworkCounts& counts, std::mt19937& rng) {
    validate(counts);

    NetworkBuilder builder(counts, rng);
    builder.create_servers();
    builder.create_clients();
    builder.create_printers();

    auto log = netdeclutter::logging::get_logger();
    log->info("NetworkBuilder: created network with {} servers, {} clients, {} printers, {} edges",
              builder.graph_.servers().size(),
              builder.graph_.clients().size(),
              builder.graph_.printers().size(),
              builder.graph_.edge_count());

    return std::move(builder.graph_);
}

NetworkGraph NetworkBuilder::from_config(const NetworkBuildConfig& config) {
    std::mt19937 rng(config.random_seed);
    return random(config.counts, rng);
}

void NetworkBuilder::validate(const NetworkCounts& counts) {
    if (counts.server_count < kMinServers) {
        throw std::invalid_argument("serverCount must be >= " + std::to_string(kMinServers) +
                                    ", got " + std::to_string(counts.server_count));
    }
    if (counts.client_count < kMinClients) {
        throw std::invalid_argument("clientCount must be >= " + std::to_string(kMinClients) +
                                    ", got " + std::to_string(counts.client_count));
    }
    if (counts.printer_count < kMinPrinters) {
        throw std::invalid_argument("printerCount must be >= " + std::to_string(kMinPrinters) +
                                    ", got " + std::to_string(counts.printer_count));
    }
}

NetworkBuilder::NetworkBuilder(const NetworkCounts& counts, std::mt19937& rng)
    : counts_(counts), rng_(rng) {
}

void NetworkBuilder::create_servers() {
    for (int i = 0; i < counts_.server_count; ++i) {
        NetworkNode node;
        node.category = NodeCategory::Server;
        node.position = random_position();
        graph_.add_node(node);
    }
}

void NetworkBuilder::create_clients() {
    auto log = netdeclutter::logging::get_logger();

    for (int i = 0; i < counts_.client_count; ++i) {
        NetworkNode node;
        node.category = NodeCategory::Client;
        node.position = random_position();
        NodeId client = graph_.add_node(node);

        // Servers are drawn with replacement; one server may host many clients
        NodeId server = random_member(graph_.servers());
        graph_.add_edge(client, server, EdgeKind::ClientServer);
    }

    log->debug("NetworkBuilder: connected {} clients", counts_.client_count);
}

void NetworkBuilder::create_printers() {
    std::uniform_int_distribution<int> connection_count(1, kMaxPrinterConnections);

    for (int i = 0; i < counts_.printer_count; ++i) {
        NetworkNode node;
        node.category = NodeCategory::Printer;
        node.position = random_position();
        NodeId printer = graph_.add_node(node);

        // Rejection sampling until m distinct clients are chosen for this
        // printer. Terminates because client_count >= kMinClients > m.
        int m = connection_count(rng_);
        std::set<NodeId> assigned;
        while (static_cast<int>(assigned.size()) < m) {
            NodeId client = random_member(graph_.clients());
            if (assigned.insert(client).second) {
                graph_.add_edge(client, printer, EdgeKind::ClientPrinter);
            }
        }
    }
}

Vec2 NetworkBuilder::random_position() {
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    double x = unit(rng_);
    double y = unit(rng_);
    return {x, y};
}

NodeId NetworkBuilder::random_member(const std::vector<NodeId>& ids) {
    std::uniform_int_distribution<size_t> pick(0, ids.size() - 1);
    return ids[pick(rng_)];
}

NetworkGraph build_random_graph(int server_count, int client_count,
                                int printer_count, uint32_t seed) {
    NetworkBuildConfig config;
    config.counts.server_count = server_count;
    config.counts.client_count = client_count;
    config.counts.printer_count = printer_count;
    config.random_seed = seed;
    return NetworkBuilder::from_config(config);
}

}  // namespace netdeclutter
