#include <gtest/gtest.h>
#include <cli/cli_common.hpp>
#include <string>
#include <vector>

using namespace serpent;

namespace {

// argv-style wrapper around a list of strings
struct Args {
    std::vector<std::string> storage;
    std::vector<char*> argv;

    explicit Args(std::vector<std::string> args) : storage(std::move(args)) {
        for (auto& s : storage) {
            argv.push_back(s.data());
        }
    }

    int argc() { return static_cast<int>(argv.size()); }
    char** data() { return argv.data(); }
};

}  // namespace

TEST(CliArgsTest, Defaults) {
    Args args({"serpent", "simulate"});
    cli::CommandContext ctx = cli::parse_common_args(args.argc(), args.data(), 2);
    EXPECT_EQ(ctx.ticks, 300);
    EXPECT_FLOAT_EQ(ctx.dt, 1.0f / 60.0f);
    EXPECT_FALSE(ctx.target.has_value());
    EXPECT_FALSE(ctx.config_path.has_value());
    EXPECT_TRUE(ctx.output_path.empty());
}

TEST(CliArgsTest, AllOptions) {
    Args args({"serpent", "obj", "-c", "cfg.json", "-o", "out.obj",
               "--ticks", "12", "--dt", "0.5", "--target", "1,2.5,-3"});
    cli::CommandContext ctx = cli::parse_common_args(args.argc(), args.data(), 2);
    EXPECT_EQ(*ctx.config_path, "cfg.json");
    EXPECT_EQ(ctx.output_path, "out.obj");
    EXPECT_EQ(ctx.ticks, 12);
    EXPECT_FLOAT_EQ(ctx.dt, 0.5f);
    ASSERT_TRUE(ctx.target.has_value());
    EXPECT_EQ(*ctx.target, Vec3(1.0f, 2.5f, -3.0f));
}

TEST(CliArgsTest, RejectsBadValues) {
    Args missing({"serpent", "simulate", "--ticks"});
    EXPECT_THROW(cli::parse_common_args(missing.argc(), missing.data(), 2), std::runtime_error);

    Args not_a_number({"serpent", "simulate", "--ticks", "ten"});
    EXPECT_THROW(cli::parse_common_args(not_a_number.argc(), not_a_number.data(), 2),
                 std::runtime_error);

    Args negative({"serpent", "simulate", "--dt", "-1"});
    EXPECT_THROW(cli::parse_common_args(negative.argc(), negative.data(), 2), std::runtime_error);

    Args unknown({"serpent", "simulate", "--fast"});
    EXPECT_THROW(cli::parse_common_args(unknown.argc(), unknown.data(), 2), std::runtime_error);
}

TEST(CliArgsTest, ParseVec3) {
    EXPECT_EQ(cli::parse_vec3("0,0,0"), vec3::zero());
    EXPECT_EQ(cli::parse_vec3(" 4, 5 ,6"), Vec3(4.0f, 5.0f, 6.0f));
    EXPECT_THROW(cli::parse_vec3("1,2"), std::runtime_error);
    EXPECT_THROW(cli::parse_vec3("1;2;3"), std::runtime_error);
    EXPECT_THROW(cli::parse_vec3("1,2,3,4"), std::runtime_error);
}

TEST(CliArgsTest, HeadlessRunAdvancesCreature) {
    Args args({"serpent", "simulate", "--ticks", "30", "--dt", "0.1", "--target", "5,0,5"});
    cli::CommandContext ctx = cli::parse_common_args(args.argc(), args.data(), 2);

    SteeringConfig steering;
    steering.random_seed = 6;
    Serpent creature(SerpentConfig::low(), steering);
    cli::apply_target(creature, ctx);

    int ticks = 0;
    cli::run_headless(creature, ctx, [&](int) { ++ticks; });
    EXPECT_EQ(ticks, 30);
    EXPECT_NEAR(creature.distance(), 12.0f, 1e-3f);
    EXPECT_FALSE(creature.free_roam());
    ASSERT_TRUE(creature.curve().target().has_value());
    EXPECT_EQ(*creature.curve().target(), Vec3(5.0f, 0.0f, 5.0f));
}

TEST(CliArgsTest, LoadsConfigFromPlainFileAndDump) {
    const std::string dir = ::testing::TempDir();
    const std::string plain_path = dir + "serpent_plain_config.json";
    const std::string dump_path = dir + "serpent_dump.json";

    RunConfig config;
    config.serpent = SerpentConfig::low();
    config.steering.random_seed = 7;
    json::write_json_file(plain_path, config);

    json::SerializedData dump;
    dump.step = "simulate";
    dump.config = config;
    dump.config["ticks"] = 5;
    dump.config["dt"] = 0.25f;
    dump.config["target"] = Vec3(3.0f, 0.0f, -2.0f);
    dump.data = nlohmann::json::array();
    json::write_serialized(dump_path, dump);

    cli::CommandContext ctx;
    ctx.config_path = plain_path;
    RunConfig from_plain = cli::load_run_config(ctx);
    EXPECT_FLOAT_EQ(from_plain.serpent.length, 10.0f);
    EXPECT_EQ(from_plain.steering.random_seed, 7u);

    // A plain config leaves the run settings alone
    EXPECT_EQ(ctx.ticks, 300);
    EXPECT_FALSE(ctx.target.has_value());

    ctx.config_path = dump_path;
    RunConfig from_dump = cli::load_run_config(ctx);
    EXPECT_FLOAT_EQ(from_dump.serpent.length, 10.0f);
    EXPECT_EQ(from_dump.serpent.spine_segments, 50);
    EXPECT_EQ(from_dump.steering.random_seed, 7u);

    // The recorded run settings come back with the config
    EXPECT_EQ(ctx.ticks, 5);
    EXPECT_FLOAT_EQ(ctx.dt, 0.25f);
    ASSERT_TRUE(ctx.target.has_value());
    EXPECT_EQ(*ctx.target, Vec3(3.0f, 0.0f, -2.0f));

    // Options given on the command line win over the recorded ones
    std::string dump_arg = dump_path;
    Args args({"serpent", "simulate", "-c", dump_arg, "--ticks", "9", "--target", "1,0,1"});
    cli::CommandContext explicit_ctx = cli::parse_common_args(args.argc(), args.data(), 2);
    cli::load_run_config(explicit_ctx);
    EXPECT_EQ(explicit_ctx.ticks, 9);
    EXPECT_FLOAT_EQ(explicit_ctx.dt, 0.25f);
    EXPECT_EQ(*explicit_ctx.target, Vec3(1.0f, 0.0f, 1.0f));

    ctx.config_path = dir + "serpent_missing_config.json";
    EXPECT_THROW(cli::load_run_config(ctx), std::runtime_error);
}
