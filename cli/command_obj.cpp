#include "cli_common.hpp"
#include <creature/tube_mesh.hpp>

namespace serpent::cli {

int command_obj(int argc, char** argv) {
    auto log = serpent::logging::get_logger();

    try {
        CommandContext ctx = parse_common_args(argc, argv, 2);

        if (ctx.help || ctx.output_path.empty()) {
            std::cerr << "Usage: serpent obj [-c config.json] -o <output.obj> "
                         "[--ticks N] [--dt S] [--target x,y,z]\n";
            return ctx.help ? 0 : 1;
        }

        RunConfig config = load_run_config(ctx);
        Serpent creature(config.serpent, config.steering, config.curve);
        apply_target(creature, ctx);

        run_headless(creature, ctx);

        // With zero ticks the spine buffers were never filled
        if (ctx.ticks == 0) {
            creature.update(0.0f);
        }

        log->debug("Building tube mesh");
        TubeMesh mesh = build_tube(creature.sampler(), creature.config());
        std::string obj = mesh.to_obj();

        write_file(ctx.output_path, obj);

        log->info("Wrote OBJ to {}", ctx.output_path);
        std::cerr << "Wrote " << ctx.output_path << " ("
                  << mesh.positions.size() << " vertices, "
                  << mesh.quads.size() << " faces, "
                  << obj.size() << " bytes)\n";

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace serpent::cli
