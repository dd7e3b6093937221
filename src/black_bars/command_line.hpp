#pragma once

#include <ostream>
#include <string>
#include <vector>

namespace black_bars {

struct CommandLineOptions {
    std::string config_path;  // empty = <exe dir>/BlackBars.toml
    bool show_help = false;
    bool show_version = false;
};

void PrintUsage(std::ostream& out);

// Parses argv[1..]. Returns false (after printing the problem and usage to err) on an unknown
// option or a missing option value.
bool ParseCommandLine(const std::vector<std::string>& args, CommandLineOptions& options, std::ostream& err);

}  // namespace black_bars
