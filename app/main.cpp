#include <iostream>
#include <string>

#include <cli/cli_common.hpp>

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " <command> [options]\n";
    std::cerr << "\n";
    std::cerr << "Discretizes 2D curves into polylines with a bounded deviation.\n";
    std::cerr << "\n";
    std::cerr << "Commands:\n";
    std::cerr << "  approximate <curves.json>     Convert curves to polylines\n";
    std::cerr << "  measure <polylines.json>      Print length, bounding box and centroid\n";
    std::cerr << "\n";
    std::cerr << "Common options:\n";
    std::cerr << "  -o, --output FILE   Output file\n";
    std::cerr << "  -v, --verbose       Debug logging\n";
    std::cerr << "  --help              Show this help message\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  POLYCURVE_LOG_LEVEL - Set log level (trace, debug, info, warn, error, off)\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "--help" || command == "-h") {
        print_usage(argv[0]);
        return 0;
    }
    if (command == "approximate") {
        return polycurve::cli::command_approximate(argc, argv);
    }
    if (command == "measure") {
        return polycurve::cli::command_measure(argc, argv);
    }

    std::cerr << "Unknown command: " << command << "\n\n";
    print_usage(argv[0]);
    return 1;
}
