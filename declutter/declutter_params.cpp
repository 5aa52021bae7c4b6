#include "declutter_params.hpp"
#include <stdexcept>

namespace netdeclutter {

void DeclutterParams::validate() const {
    if (!(damping > 0.0 && damping < 1.0)) {
        throw std::invalid_argument("damping must be in (0, 1)");
    }
    if (!(vmax > 0.0)) {
        throw std::invalid_argument("vmax must be positive");
    }
    if (!(dt > 0.0)) {
        throw std::invalid_argument("dt must be positive");
    }
    if (!(rest_length > 0.0)) {
        throw std::invalid_argument("rest_length must be positive");
    }
    if (spring_k < 0.0 || repulsion_c < 0.0 || center_k < 0.0) {
        throw std::invalid_argument("force constants must be non-negative");
    }
    if (!(repulsion_eps > 0.0) || !(spring_eps > 0.0)) {
        throw std::invalid_argument("softening constants must be positive");
    }
    if (!(overlap_pad > 0.0)) {
        throw std::invalid_argument("overlap_pad must be positive");
    }
    if (!(clamp_tolerance >= 0.0)) {
        throw std::invalid_argument("clamp_tolerance must be non-negative");
    }
    if (min_steps < 0 || max_steps < 1) {
        throw std::invalid_argument("max_steps must be >= 1 and min_steps >= 0");
    }
    if (diagnostics_interval < 1 || progress_interval < 1 || refresh_interval < 1) {
        throw std::invalid_argument("reporting intervals must be >= 1");
    }
}

}  // namespace netdeclutter
