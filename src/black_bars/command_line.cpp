#include "command_line.hpp"

namespace black_bars {

void PrintUsage(std::ostream& out) {
    out << "Black Bars\n";
    out << "Usage: black_bars.exe [options]\n\n";
    out << "Options:\n";
    out << "  -c, --config <path>   Read settings from <path> instead of BlackBars.toml next to the executable\n";
    out << "  -v, --version         Print version and exit\n";
    out << "  -h, --help            Show this help message\n\n";
    out << "Without options, runs until Ctrl+C, restoring the task bar on exit.\n";
}

bool ParseCommandLine(const std::vector<std::string>& args, CommandLineOptions& options, std::ostream& err) {
    options = CommandLineOptions{};

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "-h" || arg == "--help" || arg == "/?" || arg == "-?") {
            options.show_help = true;
        } else if (arg == "-v" || arg == "--version") {
            options.show_version = true;
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= args.size()) {
                err << "Missing value for " << arg << "\n";
                PrintUsage(err);
                return false;
            }
            options.config_path = args[++i];
        } else if (arg.rfind("--config=", 0) == 0) {
            options.config_path = arg.substr(9);
        } else {
            err << "Unknown option: " << arg << "\n";
            PrintUsage(err);
            return false;
        }
    }

    return true;
}

}  // namespace black_bars
