#ifndef NETDECLUTTER_DECLUTTER_CONVERGENCE_HPP
#define NETDECLUTTER_DECLUTTER_CONVERGENCE_HPP

#include "declutter_params.hpp"

namespace netdeclutter {

// Outcome of the step loop. Everything but Running is terminal.
enum class StopReason {
    Running,
    Settled,
    Canceled,
    StepLimitReached
};

const char* to_string(StopReason reason);

inline bool is_stopped(StopReason reason) {
    return reason != StopReason::Running;
}

// Evaluated at the end of a step. Cancellation is handled before the step
// starts and never reported from here.
//   settled    : step >= min_steps, mean_speed < settle_velocity, rms < settle_force
//   step limit : step >= max_steps
StopReason evaluate_convergence(int step, double mean_speed, double rms_force,
                                const DeclutterParams& params);

}  // namespace netdeclutter

#endif // NETDECLUTTER_DECLUTTER_CONVERGENCE_HPP
