#ifndef NETDECLUTTER_NETWORK_BUILDER_HPP
#define NETDECLUTTER_NETWORK_BUILDER_HPP

#include "network_graph.hpp"
#include <cstdint>
#include <random>

namespace netdeclutter {

// Configuration for building a random network
struct NetworkBuildConfig {
    NetworkCounts counts;

    // Random seed for positions and connections
    uint32_t random_seed = 42;
};

// Builds randomized server/client/printer networks.
// The result is a pure function of the counts and the generator state.
class NetworkBuilder {
public:
    static constexpr int kMinServers = 4;
    static constexpr int kMinClients = 6;
    static constexpr int kMinPrinters = 0;
    static constexpr int kMaxPrinterConnections = 4;

    // Build a network drawing from the given generator
    static NetworkGraph random(const NetworkCounts& counts, std::mt19937& rng);

    // Build a network from a seeded configuration
    static NetworkGraph from_config(const NetworkBuildConfig& config);

    // Throws std::invalid_argument if a count is out of range
    static void validate(const NetworkCounts& counts);

private:
    NetworkBuilder(const NetworkCounts& counts, std::mt19937& rng);

    void create_servers();
    void create_clients();
    void create_printers();

    Vec2 random_position();
    NodeId random_member(const std::vector<NodeId>& ids);

    NetworkCounts counts_;
    std::mt19937& rng_;
    NetworkGraph graph_;
};

// Convenience wrapper: validate, seed a generator and build
NetworkGraph build_random_graph(int server_count, int client_count,
                                int printer_count, uint32_t seed);

}  // namespace netdeclutter

#endif // NETDECLUTTER_NETWORK_BUILDER_HPP
