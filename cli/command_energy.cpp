#include "cli_common.hpp"
#include <declutter/declutter_simulation.hpp>
#include <serialization/json_serialization.hpp>
#include <common/logging.hpp>
#include <iomanip>

namespace netdeclutter::cli {

int command_energy(int argc, char** argv) {
    auto log = netdeclutter::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.help || ctx.input_path.empty()) {
            std::cerr << "Usage: netdeclutter energy <layout.json> [-c <config.json>]\n";
            std::cerr << "Prints the pseudo-energy breakdown of a saved layout.\n";
            return ctx.help ? 0 : 1;
        }

        json::LayoutDocument doc = json::read_layout(ctx.input_path);

        // Parameters the layout was produced with, unless overridden
        DeclutterParams params = doc.config.params;
        if (ctx.config_path.has_value()) {
            params = json::read_config(ctx.config_path.value()).params;
            log->info("Using parameters from: {}", ctx.config_path.value());
        }

        log->info("{}: {} after {} steps", ctx.input_path,
                  to_string(doc.summary.stop_reason), doc.summary.steps);

        DeclutterSimulation simulation(std::move(doc.graph), params);
        DiagnosticsSample sample = simulation.compute_diagnostics();

        std::cout << std::setprecision(6);
        std::cout << "nodes:               " << simulation.graph().node_count() << "\n";
        std::cout << "edges:               " << simulation.graph().edge_count() << "\n";
        std::cout << "spring energy:       " << sample.energy.spring << "\n";
        std::cout << "repulsion energy:    " << sample.energy.repulsion << "\n";
        std::cout << "centering energy:    " << sample.energy.center << "\n";
        std::cout << "kinetic energy:      " << sample.energy.kinetic << "\n";
        std::cout << "total:               " << sample.total() << "\n";
        std::cout << "mean speed:          " << sample.mean_speed << "\n";
        std::cout << "rms force:           " << sample.rms_force << "\n";
        std::cout << "clamp-hit fraction:  " << sample.clamp_hit_fraction << "\n";
        std::cout << "min separation:      " << sample.min_pair_separation << "\n";

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace netdeclutter::cli
