#include "cli_common.hpp"
#include <visualizer/visualizer.hpp>

namespace serpent::cli {

int command_view(int argc, char** argv) {
    auto log = serpent::logging::get_logger();

    try {
        CommandContext ctx = parse_common_args(argc, argv, 2);

        if (ctx.help) {
            std::cerr << "Usage: serpent view [-c config.json] [--target x,y,z]\n";
            std::cerr << "Move the pointer over the ground to steer; f toggles free roam.\n";
            return 0;
        }

        if (!visualization_available()) {
            log->error("serpent was built without GLFW/OpenGL; the viewer is unavailable");
            std::cerr << "Error: visualization not available in this build\n";
            return 1;
        }

        RunConfig config = load_run_config(ctx);
        Serpent creature(config.serpent, config.steering, config.curve);
        if (ctx.target) {
            creature.place_target(*ctx.target);
        }

        ViewerResult result = run_viewer(creature);
        if (!result.completed) {
            return 1;
        }

        std::cerr << "Viewer closed after " << result.frames << " frames, distance "
                  << result.distance << "\n";
        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace serpent::cli
