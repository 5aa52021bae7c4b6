#include "cli_common.hpp"
#include <declutter/declutter_params.hpp>
#include <network/network_builder.hpp>
#include <serialization/json_serialization.hpp>
#include <common/logging.hpp>

namespace netdeclutter::cli {

int command_params(int argc, char** argv) {
    auto log = netdeclutter::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.help || ctx.output_path.empty()) {
            std::cerr << "Usage: netdeclutter params -o <config.json>\n";
            std::cerr << "Writes the default build configuration and parameters,\n";
            std::cerr << "suitable as a starting point for 'layout -c'.\n";
            return ctx.help ? 0 : 1;
        }

        json::write_json_file(ctx.output_path, json::config_to_json(json::RunConfig{}));

        log->info("Wrote default configuration to {}", ctx.output_path);
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace netdeclutter::cli
