#include "convergence.hpp"

namespace netdeclutter {

const char* to_string(StopReason reason) {
    switch (reason) {
        case StopReason::Running:          return "running";
        case StopReason::Settled:          return "settled";
        case StopReason::Canceled:         return "canceled";
        case StopReason::StepLimitReached: return "step limit reached";
    }
    return "unknown";
}

StopReason evaluate_convergence(int step, double mean_speed, double rms_force,
                                const DeclutterParams& params) {
    if (step >= params.min_steps &&
        mean_speed < params.settle_velocity() &&
        rms_force < params.settle_force) {
        return StopReason::Settled;
    }
    if (step >= params.max_steps) {
        return StopReason::StepLimitReached;
    }
    return StopReason::Running;
}

}  // namespace netdeclutter
