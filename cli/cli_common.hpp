#ifndef NETDECLUTTER_CLI_COMMON_HPP
#define NETDECLUTTER_CLI_COMMON_HPP

#include <cstdint>
#include <string>
#include <optional>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace netdeclutter::cli {

// Common context for all CLI commands
struct CommandContext {
    std::string input_path;
    std::string output_path;
    std::optional<std::string> config_path;
    bool verbose = false;
    bool help = false;

    // Network overrides
    std::optional<int> servers;
    std::optional<int> clients;
    std::optional<int> printers;
    std::optional<uint32_t> seed;

    // Simulation overrides
    std::optional<int> max_steps;
    std::optional<double> radius;
};

namespace detail {

inline const char* require_value(int argc, char** argv, int& i, const std::string& flag) {
    if (i + 1 >= argc) {
        throw std::runtime_error(flag + " requires an argument");
    }
    return argv[++i];
}

inline int parse_int(const std::string& flag, const std::string& text) {
    try {
        size_t used = 0;
        int value = std::stoi(text, &used);
        if (used != text.size()) {
            throw std::invalid_argument(text);
        }
        return value;
    } catch (const std::logic_error&) {
        throw std::runtime_error(flag + " expects an integer, got '" + text + "'");
    }
}

inline double parse_double(const std::string& flag, const std::string& text) {
    try {
        size_t used = 0;
        double value = std::stod(text, &used);
        if (used != text.size()) {
            throw std::invalid_argument(text);
        }
        return value;
    } catch (const std::logic_error&) {
        throw std::runtime_error(flag + " expects a number, got '" + text + "'");
    }
}

}  // namespace detail

// Parse common arguments from command line
// Returns the context and the index of the first unprocessed argument
inline std::pair<CommandContext, int> parse_common_args(int argc, char** argv, int start_idx) {
    CommandContext ctx;
    int i = start_idx;

    // Parse flags and positional arguments
    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-v" || arg == "--verbose") {
            ctx.verbose = true;
        } else if (arg == "-o" || arg == "--output") {
            ctx.output_path = detail::require_value(argc, argv, i, arg);
        } else if (arg == "-c" || arg == "--config") {
            ctx.config_path = detail::require_value(argc, argv, i, arg);
        } else if (arg == "--servers") {
            ctx.servers = detail::parse_int(arg, detail::require_value(argc, argv, i, arg));
        } else if (arg == "--clients") {
            ctx.clients = detail::parse_int(arg, detail::require_value(argc, argv, i, arg));
        } else if (arg == "--printers") {
            ctx.printers = detail::parse_int(arg, detail::require_value(argc, argv, i, arg));
        } else if (arg == "--seed") {
            int seed = detail::parse_int(arg, detail::require_value(argc, argv, i, arg));
            if (seed < 0) {
                throw std::runtime_error("--seed must be non-negative");
            }
            ctx.seed = static_cast<uint32_t>(seed);
        } else if (arg == "--max-steps") {
            ctx.max_steps = detail::parse_int(arg, detail::require_value(argc, argv, i, arg));
        } else if (arg == "--radius") {
            ctx.radius = detail::parse_double(arg, detail::require_value(argc, argv, i, arg));
        } else if (arg == "-h" || arg == "--help") {
            ctx.help = true;
        } else if (arg[0] != '-') {
            // Positional argument (input file)
            if (ctx.input_path.empty()) {
                ctx.input_path = arg;
            } else {
                throw std::runtime_error("Unexpected positional argument: " + arg);
            }
        } else {
            throw std::runtime_error("Unknown option: " + arg);
        }
        ++i;
    }

    return {ctx, i};
}

// Command function declarations
int command_layout(int argc, char** argv);
int command_params(int argc, char** argv);
int command_energy(int argc, char** argv);

}  // namespace netdeclutter::cli

#endif // NETDECLUTTER_CLI_COMMON_HPP
