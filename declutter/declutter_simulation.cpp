#include "declutter_simulation.hpp"
#include "declutter_forces.hpp"
#include "integrator.hpp"
#include "logging.hpp"
#include <algorithm>
#include <string>

namespace netdeclutter {

DeclutterSimulation::DeclutterSimulation(NetworkGraph graph, const DeclutterParams& params)
    : graph_(std::move(graph)), params_(params) {
    params_.validate();
    multipliers_ = params_.multipliers();
}

void DeclutterSimulation::init(SimulationContext& ctx) {
    step_ = 0;
    stop_reason_ = StopReason::Running;
    last_rms_force_ = 0.0;
    last_stats_ = IntegrationStats{};
    canceled_.store(false);

    auto log = netdeclutter::logging::get_logger();
    log->debug("DeclutterSimulation: init with {} nodes, {} edges",
               graph_.node_count(), graph_.edge_count());

    ctx.post_message("Network generated. Relaxing layout...");
    ctx.post_progress(ProgressInfo::indeterminate_progress("Relaxing..."));
    ctx.request_refresh();
}

bool DeclutterSimulation::step(SimulationContext& ctx) {
    if (is_stopped(stop_reason_)) {
        return false;
    }
    if (canceled_.load() || ctx.is_cancel_requested()) {
        finish(ctx, StopReason::Canceled);
        return false;
    }

    ++step_;

    // 1. Springs, repulsion, centering
    last_rms_force_ = compute_forces(graph_, params_, multipliers_);

    // 2. Damped, clamped integration
    last_stats_ = integrate_step(graph_, params_);

    // 3. Periodic diagnostics and engine notifications
    if (step_ % params_.diagnostics_interval == 0) {
        DiagnosticsSample sample = netdeclutter::compute_diagnostics(
            graph_, params_, multipliers_, step_, last_rms_force_, last_stats_);
        diagnostics_.push(sample);

        auto log = netdeclutter::logging::get_logger();
        log->debug("DeclutterSimulation: step {}, energy = {} (spring {}, repulsion {}, center {}, "
                   "kinetic {}), mean speed = {}, rms force = {}",
                   step_, sample.total(), sample.energy.spring, sample.energy.repulsion,
                   sample.energy.center, sample.energy.kinetic,
                   sample.mean_speed, sample.rms_force);
    }

    if (step_ % params_.progress_interval == 0) {
        double fraction = 1.0 - std::min(1.0, last_stats_.mean_speed /
                                                  (5.0 * params_.settle_velocity()));
        ctx.post_progress(ProgressInfo::determinate(
            fraction, "Relaxing... step " + std::to_string(step_)));
    }

    if (step_ % params_.refresh_interval == 0) {
        ctx.request_refresh();
    }

    // 4. Termination policy
    StopReason reason = evaluate_convergence(step_, last_stats_.mean_speed,
                                             last_rms_force_, params_);
    if (is_stopped(reason)) {
        finish(ctx, reason);
        return false;
    }
    return true;
}

void DeclutterSimulation::cancel(SimulationContext& ctx) {
    canceled_.store(true);
    ctx.post_message("Cancel requested.");
    ctx.post_progress(ProgressInfo::indeterminate_progress("Canceling..."));
}

EnergyBreakdown DeclutterSimulation::compute_energy() const {
    return netdeclutter::compute_energy(graph_, params_, multipliers_);
}

DiagnosticsSample DeclutterSimulation::compute_diagnostics() const {
    return netdeclutter::compute_diagnostics(graph_, params_, multipliers_, step_,
                                             rms_net_force(graph_, params_, multipliers_));
}

void DeclutterSimulation::finish(SimulationContext& ctx, StopReason reason) {
    stop_reason_ = reason;

    auto log = netdeclutter::logging::get_logger();
    switch (reason) {
        case StopReason::Settled:
            log->info("DeclutterSimulation: settled at step {}, mean speed = {}, rms force = {}",
                      step_, last_stats_.mean_speed, last_rms_force_);
            ctx.post_message("Settled.");
            ctx.post_progress(ProgressInfo::determinate(1.0, "Settled"));
            ctx.request_refresh();
            break;
        case StopReason::StepLimitReached:
            log->warn("DeclutterSimulation: did not settle after {} steps, mean speed = {}, "
                      "rms force = {}", step_, last_stats_.mean_speed, last_rms_force_);
            ctx.post_message("Step limit reached.");
            ctx.request_refresh();
            break;
        case StopReason::Canceled:
            log->info("DeclutterSimulation: canceled at step {}", step_);
            break;
        case StopReason::Running:
            break;
    }
}

}  // namespace netdeclutter
