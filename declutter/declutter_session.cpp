#include "declutter_session.hpp"
#include "logging.hpp"
#include <mutex>

namespace netdeclutter {

DeclutterSession::DeclutterSession(const NetworkBuildConfig& build_config,
                                   const DeclutterParams& params)
    : build_config_(build_config),
      params_(params),
      simulation_(std::make_unique<DeclutterSimulation>(
          NetworkBuilder::from_config(build_config), params)) {
}

void DeclutterSession::init(SimulationContext& ctx) {
    std::shared_lock<std::shared_mutex> lock(swap_mutex_);
    simulation_->init(ctx);
}

bool DeclutterSession::step(SimulationContext& ctx) {
    std::shared_lock<std::shared_mutex> lock(swap_mutex_);
    return simulation_->step(ctx);
}

void DeclutterSession::cancel(SimulationContext& ctx) {
    std::shared_lock<std::shared_mutex> lock(swap_mutex_);
    simulation_->cancel(ctx);
}

void DeclutterSession::reset(const NetworkCounts& counts, uint32_t seed,
                             const AfterSwapHook& after_swap) {
    auto log = netdeclutter::logging::get_logger();

    NetworkBuildConfig config;
    config.counts = counts;
    config.random_seed = seed;

    // Build outside the lock; a bad count throws before anything changes
    auto fresh = std::make_unique<DeclutterSimulation>(NetworkBuilder::from_config(config), params_);

    DeclutterSimulation* current = nullptr;
    {
        std::unique_lock<std::shared_mutex> lock(swap_mutex_);
        simulation_ = std::move(fresh);
        build_config_ = config;
        current = simulation_.get();
    }

    log->info("DeclutterSession: reset to {} servers, {} clients, {} printers (seed {})",
              counts.server_count, counts.client_count, counts.printer_count, seed);

    if (after_swap) {
        after_swap(*current);
    }
}

void DeclutterSession::set_visual_radius(NodeId id, double radius) {
    std::shared_lock<std::shared_mutex> lock(swap_mutex_);
    simulation_->graph().set_visual_radius(id, radius);
}

std::vector<DiagnosticsSample> DeclutterSession::drain_diagnostics() {
    std::shared_lock<std::shared_mutex> lock(swap_mutex_);
    return simulation_->diagnostics().drain();
}

DeclutterSimulation& DeclutterSession::simulation() {
    return *simulation_;
}

}  // namespace netdeclutter
