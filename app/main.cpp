#include <iostream>
#include <string>

#include <cli/cli_common.hpp>
#include <common/logging.hpp>

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " <command> [options]\n";
    std::cerr << "\n";
    std::cerr << "Animates a creature along an endless, procedurally steered 3D curve.\n";
    std::cerr << "\n";
    std::cerr << "Commands:\n";
    std::cerr << "  simulate    Run headless and write per-tick spine samples as JSON\n";
    std::cerr << "  obj         Run headless and export the body tube as OBJ\n";
    std::cerr << "  view        Open the interactive viewer (pointer steers the creature)\n";
    std::cerr << "\n";
    std::cerr << "Common options:\n";
    std::cerr << "  -c, --config FILE   JSON configuration (steering, curve, serpent, preset)\n";
    std::cerr << "  -o, --output FILE   Output file\n";
    std::cerr << "  -v, --verbose       Debug logging\n";
    std::cerr << "  -h, --help          Command help\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  SERPENT_LOG_LEVEL - Set log level (trace, debug, info, warn, error, off)\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];

    if (command == "--help" || command == "-h" || command == "help") {
        print_usage(argv[0]);
        return 0;
    }
    if (command == "simulate") {
        return serpent::cli::command_simulate(argc, argv);
    }
    if (command == "obj") {
        return serpent::cli::command_obj(argc, argv);
    }
    if (command == "view") {
        return serpent::cli::command_view(argc, argv);
    }

    auto log = serpent::logging::get_logger();
    log->error("Unknown command: {}", command);
    print_usage(argv[0]);
    return 1;
}
