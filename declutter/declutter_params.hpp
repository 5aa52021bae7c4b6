#ifndef NETDECLUTTER_DECLUTTER_PARAMS_HPP
#define NETDECLUTTER_DECLUTTER_PARAMS_HPP

#include "category_multipliers.hpp"

namespace netdeclutter {

// Tunable physics and termination parameters (unit-square world).
//
// Tuning hints:
//   servers clump in the center -> raise server_repulsion or repulsion_c,
//                                  lower center_k or spring_k
//   clients collapse onto servers -> raise rest_length and/or repulsion_c
//   layout rings the boundary    -> raise center_k slightly, lower repulsion_c
//   jitter/oscillation           -> lower damping, spring_k or vmax
struct DeclutterParams {
    // Springs
    double spring_k = 1.45;             // Stiffness of every edge
    double rest_length = 0.05;          // Equilibrium edge length r0
    double printer_k_boost = 1.2;       // Stiffness factor when a printer is involved
    double printer_r_boost = 0.8;       // Rest length factor when a printer is involved

    // Repulsion
    double repulsion_c = 1.0e-4;        // Base pairwise strength
    double server_repulsion = 6.0;      // Factor when a server is involved
    double overlap_boost = 3.0;         // Factor when icons overlap

    // Centering
    double center_k = 0.15;             // Keep small; too large clumps servers

    // Integration
    double damping = 0.90;              // v <- damping * v + dt * F
    double dt = 0.1;                    // Global force gain
    double vmax = 0.012;                // Speed clamp (world units per step)

    // Termination
    int min_steps = 250;
    int max_steps = 2000;
    double settle_force = 0.010;        // RMS force threshold

    // Numerical softening
    double repulsion_eps = 1.0e-4;      // Added to r^2
    double spring_eps = 1.0e-12;        // Added to r
    double overlap_pad = 0.01;          // Added to the radius sum
    double clamp_tolerance = 1.0e-12;

    // Reporting cadence (in steps)
    int diagnostics_interval = 5;
    int progress_interval = 10;
    int refresh_interval = 2;

    // Mean speed below which the layout counts as settled. Tied to the
    // spring length so "small" scales with the model.
    double settle_velocity() const {
        return rest_length / 25.0;
    }

    CategoryMultiplierTable multipliers() const {
        return CategoryMultiplierTable::from_boosts(printer_k_boost, printer_r_boost,
                                                    server_repulsion);
    }

    // Throws std::invalid_argument on values that make the model ill-posed
    void validate() const;
};

}  // namespace netdeclutter

#endif // NETDECLUTTER_DECLUTTER_PARAMS_HPP
