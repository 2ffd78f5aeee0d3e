#ifndef SERPENT_CLI_COMMON_HPP
#define SERPENT_CLI_COMMON_HPP

#include <creature/serpent.hpp>
#include <serialization/config_json.hpp>
#include <serialization/json_serialization.hpp>
#include <common/logging.hpp>
#include <cmath>
#include <fstream>
#include <functional>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

namespace serpent::cli {

// Common context for all CLI commands
struct CommandContext {
    std::string output_path;
    std::optional<std::string> config_path;
    bool verbose = false;
    bool help = false;

    // Headless run
    int ticks = 300;
    float dt = 1.0f / 60.0f;
    std::optional<Vec3> target;   // fixed target; free roam when absent

    // Set when given on the command line; a replayed dump fills the rest
    bool ticks_given = false;
    bool dt_given = false;
};

// Parse "x,y,z"
inline Vec3 parse_vec3(const std::string& text) {
    std::istringstream in(text);
    Vec3 v;
    char comma1 = 0;
    char comma2 = 0;
    if (!(in >> v.x >> comma1 >> v.y >> comma2 >> v.z) || comma1 != ',' || comma2 != ',') {
        throw std::runtime_error("Expected x,y,z but got: " + text);
    }
    in >> std::ws;
    if (!in.eof() || !v.is_finite()) {
        throw std::runtime_error("Expected x,y,z but got: " + text);
    }
    return v;
}

inline int parse_int(const std::string& text, const std::string& option) {
    size_t used = 0;
    int value = 0;
    try {
        value = std::stoi(text, &used);
    } catch (const std::logic_error&) {
        throw std::runtime_error(option + " expects an integer, got: " + text);
    }
    if (used != text.size()) {
        throw std::runtime_error(option + " expects an integer, got: " + text);
    }
    return value;
}

inline float parse_float(const std::string& text, const std::string& option) {
    size_t used = 0;
    float value = 0.0f;
    try {
        value = std::stof(text, &used);
    } catch (const std::logic_error&) {
        throw std::runtime_error(option + " expects a number, got: " + text);
    }
    if (used != text.size()) {
        throw std::runtime_error(option + " expects a number, got: " + text);
    }
    return value;
}

// Parse common arguments from command line, starting at start_idx
inline CommandContext parse_common_args(int argc, char** argv, int start_idx) {
    CommandContext ctx;
    int i = start_idx;

    auto require_value = [&](const std::string& option) -> std::string {
        if (i + 1 >= argc) {
            throw std::runtime_error(option + " requires an argument");
        }
        i += 2;
        return argv[i - 1];
    };

    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-v" || arg == "--verbose") {
            ctx.verbose = true;
            ++i;
        } else if (arg == "-h" || arg == "--help") {
            ctx.help = true;
            ++i;
        } else if (arg == "-o" || arg == "--output") {
            ctx.output_path = require_value(arg);
        } else if (arg == "-c" || arg == "--config") {
            ctx.config_path = require_value(arg);
        } else if (arg == "--ticks") {
            ctx.ticks = parse_int(require_value(arg), arg);
            ctx.ticks_given = true;
            if (ctx.ticks < 0) {
                throw std::runtime_error("--ticks must be >= 0");
            }
        } else if (arg == "--dt") {
            ctx.dt = parse_float(require_value(arg), arg);
            ctx.dt_given = true;
            if (!std::isfinite(ctx.dt) || ctx.dt < 0.0f) {
                throw std::runtime_error("--dt must be a finite number >= 0");
            }
        } else if (arg == "--target") {
            ctx.target = parse_vec3(require_value(arg));
        } else {
            throw std::runtime_error("Unknown option: " + arg);
        }
    }

    if (ctx.verbose) {
        serpent::logging::get_logger()->set_level(spdlog::level::debug);
    }

    return ctx;
}

// Run settings recorded in a simulate dump, for whatever the command line left unset
inline void apply_recorded_run(const nlohmann::json& recorded, CommandContext& ctx) {
    if (!ctx.ticks_given && recorded.contains("ticks")) {
        ctx.ticks = recorded.at("ticks").get<int>();
        if (ctx.ticks < 0) {
            throw std::runtime_error("Recorded ticks must be >= 0");
        }
    }
    if (!ctx.dt_given && recorded.contains("dt")) {
        ctx.dt = recorded.at("dt").get<float>();
        if (!std::isfinite(ctx.dt) || ctx.dt < 0.0f) {
            throw std::runtime_error("Recorded dt must be a finite number >= 0");
        }
    }
    if (!ctx.target && recorded.contains("target")) {
        ctx.target = recorded.at("target").get<Vec3>();
    }
}

// Defaults, or the validated contents of -c. A previous simulate dump is
// accepted too: its recorded config is replayed, and its ticks, dt and
// target become the defaults for options not given on the command line.
inline RunConfig load_run_config(CommandContext& ctx) {
    if (!ctx.config_path) {
        return RunConfig{};
    }
    auto log = serpent::logging::get_logger();
    log->info("Loading configuration from {}", *ctx.config_path);

    nlohmann::json document = json::read_json_file(*ctx.config_path);
    if (json::SerializedData::is_envelope(document)) {
        json::SerializedData dump = json::SerializedData::from_json(document);
        log->info("Replaying configuration of a '{}' dump (format {})", dump.step, dump.version);
        if (!dump.config.is_object()) {
            throw std::runtime_error("Dump has no config section: " + *ctx.config_path);
        }
        RunConfig config = run_config_from_json(dump.config);
        apply_recorded_run(dump.config, ctx);
        return config;
    }
    return run_config_from_json(document);
}

// Aim the creature as requested on the command line
inline void apply_target(Serpent& creature, const CommandContext& ctx) {
    if (ctx.target) {
        creature.place_target(*ctx.target);
        creature.set_free_roam(false);
    } else {
        creature.set_free_roam(true);
    }
}

// Advance ctx.ticks frames of ctx.dt seconds, calling on_tick after each
inline void run_headless(Serpent& creature, const CommandContext& ctx,
                         const std::function<void(int)>& on_tick = {}) {
    for (int tick = 0; tick < ctx.ticks; ++tick) {
        creature.update(ctx.dt);
        if (on_tick) {
            on_tick(tick);
        }
    }
}

// Write string to file
inline void write_file(const std::string& path, const std::string& content) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << content;
}

// Command function declarations
int command_simulate(int argc, char** argv);
int command_obj(int argc, char** argv);
int command_view(int argc, char** argv);

}  // namespace serpent::cli

#endif // SERPENT_CLI_COMMON_HPP
