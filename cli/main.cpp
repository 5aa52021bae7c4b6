#include "cli_common.hpp"
#include <string>

namespace {

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " <command> [options]\n";
    std::cerr << "\n";
    std::cerr << "Force-directed decluttering of a random server/client/printer network.\n";
    std::cerr << "\n";
    std::cerr << "Commands:\n";
    std::cerr << "  layout    Build a random network, relax it, write the layout as JSON\n";
    std::cerr << "  params    Write the default configuration as JSON\n";
    std::cerr << "  energy    Print the energy breakdown of a saved layout\n";
    std::cerr << "  help      Show this help message\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  NETDECLUTTER_LOG_LEVEL - Set log level (trace, debug, info, warn, error, off)\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "layout") {
        return netdeclutter::cli::command_layout(argc, argv);
    } else if (command == "params") {
        return netdeclutter::cli::command_params(argc, argv);
    } else if (command == "energy") {
        return netdeclutter::cli::command_energy(argc, argv);
    } else if (command == "help" || command == "--help" || command == "-h") {
        print_usage(argv[0]);
        return 0;
    }

    std::cerr << "Unknown command: " << command << "\n";
    print_usage(argv[0]);
    return 1;
}
