#include "cli_common.hpp"
#include <network/network_builder.hpp>
#include <declutter/declutter_simulation.hpp>
#include <declutter/declutter_solver.hpp>
#include <serialization/json_serialization.hpp>
#include <common/logging.hpp>

namespace netdeclutter::cli {

int command_layout(int argc, char** argv) {
    auto log = netdeclutter::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.help || ctx.output_path.empty()) {
            std::cerr << "Usage: netdeclutter layout -o <layout.json> [options]\n";
            std::cerr << "Options:\n";
            std::cerr << "  --servers N          Number of servers (default: 14, min 4)\n";
            std::cerr << "  --clients N          Number of clients (default: 100, min 6)\n";
            std::cerr << "  --printers N         Number of printers (default: 5)\n";
            std::cerr << "  --seed S             Random seed (default: 42)\n";
            std::cerr << "  --max-steps N        Hard step cap (default: from config or 2000)\n";
            std::cerr << "  --radius R           Icon radius in world units for every node (default: 0)\n";
            std::cerr << "  -c, --config <file>  Config document (see 'params'), or a previous layout\n";
            return ctx.help ? 0 : 1;
        }

        if (ctx.verbose) {
            log->set_level(spdlog::level::debug);
        }

        json::RunConfig config;
        if (ctx.config_path.has_value()) {
            config = json::read_config(ctx.config_path.value());
            log->info("Loaded configuration from: {}", ctx.config_path.value());
        }

        // Override with command-line arguments
        if (ctx.servers) config.build.counts.server_count = *ctx.servers;
        if (ctx.clients) config.build.counts.client_count = *ctx.clients;
        if (ctx.printers) config.build.counts.printer_count = *ctx.printers;
        if (ctx.seed) config.build.random_seed = *ctx.seed;
        if (ctx.max_steps) config.params.max_steps = *ctx.max_steps;
        if (ctx.radius) config.visual_radius = *ctx.radius;

        if (config.visual_radius < 0.0 || config.visual_radius >= 0.5) {
            throw std::runtime_error("visual radius must be in [0, 0.5)");
        }

        DeclutterSimulation simulation(NetworkBuilder::from_config(config.build), config.params);
        simulation.graph().set_all_visual_radii(config.visual_radius);

        EngineCallbacks callbacks;
        callbacks.post_message = [&log](const std::string& text) {
            log->info("{}", text);
        };
        callbacks.post_progress = [&log](const ProgressInfo& progress) {
            if (progress.indeterminate) {
                log->debug("Progress: {}", progress.label);
            } else {
                log->debug("Progress: {:.0f}% {}", progress.fraction * 100.0, progress.label);
            }
        };
        SimulationContext sim_ctx(callbacks);

        SolveResult result = DeclutterSolver::solve(simulation, sim_ctx);

        json::LayoutDocument doc;
        doc.timestamp = json::get_timestamp();
        doc.config = config;
        doc.summary.node_count = simulation.graph().node_count();
        doc.summary.edge_count = simulation.graph().edge_count();
        doc.summary.stop_reason = result.stop_reason;
        doc.summary.steps = result.steps;
        doc.summary.initial_energy = result.initial_energy;
        doc.summary.final_energy = result.final_energy;
        doc.summary.final_sample = simulation.compute_diagnostics();
        doc.graph = simulation.graph();
        doc.diagnostics = simulation.diagnostics().drain();

        json::write_layout(ctx.output_path, doc);

        log->info("Wrote layout to {}", ctx.output_path);
        std::cerr << "Wrote " << ctx.output_path << " ("
                  << simulation.graph().node_count() << " nodes, "
                  << simulation.graph().edge_count() << " edges, "
                  << to_string(result.stop_reason) << " after "
                  << result.steps << " steps)\n";

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace netdeclutter::cli
