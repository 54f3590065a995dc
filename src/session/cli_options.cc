#include "session/cli_options.h"

#include <iostream>
#include <stdexcept>
#include <string>

namespace glnt {

void PrintCliUsage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [options] <rig.json>\n\n"
              << "Evaluates every light of the rig over its probe plane and writes the\n"
              << "received light as an image.\n\n"
              << "Options:\n"
              << "  -o, --output FILE   Output image (.ppm, .png, .exr)\n"
              << "  -t, --threads N     Worker threads (0 = all cores)\n"
              << "  -s, --samples N     Samples per pixel in mc mode\n"
              << "  --mode direct|mc    Deterministic evaluation or Monte Carlo sampling\n"
              << "  -h, --help          Show this help message\n";
}

static int ParseInt(const std::string& flag, const char* value) {
    try {
        size_t used = 0;
        int v = std::stoi(value, &used);
        if (used != std::string(value).size()) {
            throw std::invalid_argument(value);
        }
        return v;
    } catch (const std::logic_error&) {
        throw std::runtime_error(flag + " expects an integer, got '" + value + "'");
    }
}

bool ParseCliArgs(int argc, const char* const argv[], CliOptions& opts) {
    if (argc < 2) {
        return false;
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto next_value = [&]() -> const char* {
            if (i + 1 >= argc) {
                throw std::runtime_error(arg + " requires a value");
            }
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            opts.show_help = true;
            return true;
        } else if (arg == "--output" || arg == "-o") {
            opts.outfile = next_value();
        } else if (arg == "--threads" || arg == "-t") {
            opts.threads = ParseInt(arg, next_value());
        } else if (arg == "--samples" || arg == "-s") {
            opts.samples = ParseInt(arg, next_value());
        } else if (arg == "--mode") {
            opts.mode = next_value();
        } else if (arg[0] == '-') {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            return false;
        } else if (opts.rig_file.empty()) {
            opts.rig_file = arg;
        } else {
            std::cerr << "Error: More than one rig file given\n";
            return false;
        }
    }

    if (opts.rig_file.empty()) {
        std::cerr << "Error: No rig file given\n";
        return false;
    }
    return true;
}

void ApplyCliOverrides(const CliOptions& cli, ProbeOptions& probe) {
    if (!cli.outfile.empty()) probe.outfile = cli.outfile;
    if (cli.threads) {
        if (*cli.threads < 0) {
            throw std::runtime_error("--threads must be 0 (all cores) or positive, got " +
                                     std::to_string(*cli.threads));
        }
        probe.num_threads = *cli.threads;
    }
    if (cli.samples) {
        if (*cli.samples <= 0) {
            throw std::runtime_error("--samples must be positive, got " +
                                     std::to_string(*cli.samples));
        }
        probe.samples = *cli.samples;
    }
    if (cli.mode == "direct") {
        probe.mode = ProbeMode::Direct;
    } else if (cli.mode == "mc") {
        probe.mode = ProbeMode::MonteCarlo;
    } else if (!cli.mode.empty()) {
        throw std::runtime_error("Unknown mode '" + cli.mode + "' (expected direct or mc)");
    }
}

}  // namespace glnt
