#ifndef GLNT_SESSION_CLI_OPTIONS_H_
#define GLNT_SESSION_CLI_OPTIONS_H_

#include <optional>
#include <string>

#include "session/probe_options.h"

namespace glnt {

// Command-line values. Unset fields keep what the rig file says.
struct CliOptions {
    std::string rig_file;
    std::string outfile;
    std::string mode;
    std::optional<int> threads;
    std::optional<int> samples;
    bool show_help = false;
};

void PrintCliUsage(const char* program_name);

// Returns false when usage should be printed (no rig file, unknown option).
// Throws std::runtime_error for a flag missing its value or a non-integer value.
bool ParseCliArgs(int argc, const char* const argv[], CliOptions& opts);

// Throws std::runtime_error for negative threads, non-positive samples or an unknown mode
void ApplyCliOverrides(const CliOptions& cli, ProbeOptions& probe);

}  // namespace glnt

#endif  // GLNT_SESSION_CLI_OPTIONS_H_
