#ifndef NETDECLUTTER_DECLUTTER_SESSION_HPP
#define NETDECLUTTER_DECLUTTER_SESSION_HPP

#include "declutter_simulation.hpp"
#include <network/network_builder.hpp>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <vector>

namespace netdeclutter {

// Called after a reset with the freshly built simulation, so holders of
// references to the old one can rebind.
using AfterSwapHook = std::function<void(DeclutterSimulation&)>;

// Owns the current graph+simulation pair for a driving engine.
// A reset replaces the pair wholesale; it waits for an in-flight step and
// is never interleaved with one. Radius writes from a renderer run
// concurrently with steps.
class DeclutterSession {
public:
    explicit DeclutterSession(const NetworkBuildConfig& build_config,
                              const DeclutterParams& params = DeclutterParams{});

    // Engine entry points, forwarded to the current simulation
    void init(SimulationContext& ctx);
    bool step(SimulationContext& ctx);
    void cancel(SimulationContext& ctx);

    // Build a new network and simulation, swap them in, then call the hook
    void reset(const NetworkCounts& counts, uint32_t seed,
               const AfterSwapHook& after_swap = nullptr);

    // Renderer write path
    void set_visual_radius(NodeId id, double radius);

    // Observer read path: all samples of the current run, oldest first
    std::vector<DiagnosticsSample> drain_diagnostics();

    // Unguarded. The reference dangles after the next reset, so callers
    // that outlive one rebind through the after-swap hook.
    DeclutterSimulation& simulation();
    const NetworkBuildConfig& build_config() const { return build_config_; }

private:
    mutable std::shared_mutex swap_mutex_;
    NetworkBuildConfig build_config_;
    DeclutterParams params_;
    std::unique_ptr<DeclutterSimulation> simulation_;
};

}  // namespace netdeclutter

#endif // NETDECLUTTER_DECLUTTER_SESSION_HPP
