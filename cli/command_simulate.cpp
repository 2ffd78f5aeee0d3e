#include "cli_common.hpp"
#include <serialization/spine_json.hpp>
#include <algorithm>

namespace serpent::cli {

namespace {

void print_simulate_usage() {
    std::cerr << "Usage: serpent simulate [-c config.json] [-o out.json] [options]\n";
    std::cerr << "Options:\n";
    std::cerr << "  --ticks N        Frames to simulate (default: 300)\n";
    std::cerr << "  --dt S           Seconds per frame (default: 1/60)\n";
    std::cerr << "  --target x,y,z   Steer toward a fixed point (default: free roam)\n";
    std::cerr << "  -v, --verbose    Debug logging\n";
    std::cerr << "\n";
    std::cerr << "Without -o the document is written to stdout.\n";
}

}  // namespace

int command_simulate(int argc, char** argv) {
    auto log = serpent::logging::get_logger();

    try {
        CommandContext ctx = parse_common_args(argc, argv, 2);
        if (ctx.help) {
            print_simulate_usage();
            return 0;
        }

        RunConfig config = load_run_config(ctx);
        Serpent creature(config.serpent, config.steering, config.curve);
        apply_target(creature, ctx);

        log->info("Simulating {} ticks of {}s", ctx.ticks, ctx.dt);

        nlohmann::json ticks = nlohmann::json::array();
        size_t max_segments = 0;
        run_headless(creature, ctx, [&](int tick) {
            max_segments = std::max(max_segments, creature.curve().segment_count());
            ticks.push_back(tick_to_json(tick, creature));
        });

        json::SerializedData output;
        output.step = "simulate";
        output.timestamp = json::get_timestamp();
        output.config = config;
        // The resolved seed, so replaying the dump reproduces this run
        output.config["steering"]["random_seed"] = creature.generator().seed();
        output.config["ticks"] = ctx.ticks;
        output.config["dt"] = ctx.dt;
        if (ctx.target) {
            output.config["target"] = *ctx.target;
        }
        output.stats = {
            {"ticks", ctx.ticks},
            {"distance", creature.distance()},
            {"segments", creature.curve().segment_count()},
            {"max_segments", max_segments},
            {"total_length", creature.curve().total_length()},
            {"distance_offset", creature.curve().distance_offset()}
        };
        output.data = {
            {"ticks", ticks},
            {"segments", segments_to_json(creature.curve())}
        };

        if (ctx.output_path.empty()) {
            std::cout << output.to_json().dump(2) << "\n";
        } else {
            json::write_serialized(ctx.output_path, output);
            log->info("Wrote {}", ctx.output_path);
        }

        std::cerr << "Simulated " << ctx.ticks << " ticks: distance "
                  << creature.distance() << ", "
                  << creature.curve().segment_count() << " segments cached\n";

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace serpent::cli
