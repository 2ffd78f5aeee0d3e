#include <gtest/gtest.h>
#include <serialization/config_json.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/spine_json.hpp>
#include <cmath>
#include <limits>

using namespace serpent;

TEST(ConfigJsonTest, EmptyObjectGivesDefaults) {
    RunConfig config = run_config_from_json(nlohmann::json::object());

    SteeringConfig steering;
    EXPECT_FLOAT_EQ(config.steering.max_turn_rate, steering.max_turn_rate);
    EXPECT_FLOAT_EQ(config.steering.orbit_radius, 8.0f);
    EXPECT_FLOAT_EQ(config.steering.segment_length.min, 4.0f);
    EXPECT_FLOAT_EQ(config.steering.segment_length.max, 8.0f);
    EXPECT_EQ(config.steering.start_direction, vec3::unit_x());
    EXPECT_EQ(config.curve.samples_per_segment, 10);
    EXPECT_FLOAT_EQ(config.serpent.length, 26.0f);
}

TEST(ConfigJsonTest, MissingKeysKeepDefaults) {
    nlohmann::json j = {
        {"steering", {
            {"orbit_radius", 12.0},
            {"segment_length", {{"max", 9.0}}},
            {"start_position", {1.0, 2.0, 3.0}},
            {"random_seed", 7}
        }},
        {"curve", {{"samples_per_segment", 16}}}
    };
    RunConfig config = run_config_from_json(j);

    EXPECT_FLOAT_EQ(config.steering.orbit_radius, 12.0f);
    EXPECT_FLOAT_EQ(config.steering.segment_length.min, 4.0f);
    EXPECT_FLOAT_EQ(config.steering.segment_length.max, 9.0f);
    EXPECT_EQ(config.steering.start_position, Vec3(1.0f, 2.0f, 3.0f));
    EXPECT_EQ(config.steering.random_seed, 7u);
    EXPECT_FLOAT_EQ(config.steering.wander_weight, 0.15f);
    EXPECT_EQ(config.curve.samples_per_segment, 16);
    EXPECT_EQ(config.curve.arc_length_divisions, 200);
}

TEST(ConfigJsonTest, PresetThenOverride) {
    nlohmann::json j = {
        {"preset", "low"},
        {"serpent", {{"speed", 6.0}}}
    };
    RunConfig config = run_config_from_json(j);
    EXPECT_FLOAT_EQ(config.serpent.length, 10.0f);
    EXPECT_EQ(config.serpent.texture_points, 50);
    EXPECT_FLOAT_EQ(config.serpent.speed, 6.0f);
}

TEST(ConfigJsonTest, UnknownPresetIsRejected) {
    nlohmann::json j = {{"preset", "cinematic"}};
    EXPECT_THROW(run_config_from_json(j), std::invalid_argument);
}

TEST(ConfigJsonTest, NonFiniteValuesAreRejected) {
    nlohmann::json j;
    j["steering"]["max_turn_rate"] = std::numeric_limits<double>::infinity();
    EXPECT_THROW(run_config_from_json(j), std::invalid_argument);

    nlohmann::json k;
    k["serpent"]["length"] = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(run_config_from_json(k), std::invalid_argument);
}

TEST(ConfigJsonTest, InvalidValuesAreRejected) {
    nlohmann::json j = {{"curve", {{"samples_per_segment", 0}}}};
    EXPECT_THROW(run_config_from_json(j), std::invalid_argument);

    nlohmann::json k = {{"steering", {{"start_direction", {0.0, 0.0, 0.0}}}}};
    EXPECT_THROW(run_config_from_json(k), std::invalid_argument);
}

TEST(ConfigJsonTest, WrongTypesThrow) {
    nlohmann::json j = {{"steering", {{"orbit_radius", "far"}}}};
    EXPECT_THROW(run_config_from_json(j), nlohmann::json::exception);

    nlohmann::json k = {{"steering", {{"start_position", {1.0, 2.0}}}}};
    EXPECT_THROW(run_config_from_json(k), std::runtime_error);

    EXPECT_THROW(run_config_from_json(nlohmann::json::array()), std::invalid_argument);
}

TEST(ConfigJsonTest, WrittenConfigReadsBack) {
    RunConfig config;
    config.steering.orbit_radius = 5.5f;
    config.steering.start_direction = vec3::unit_z();
    config.serpent = SerpentConfig::medium();
    config.curve.samples_per_segment = 12;

    nlohmann::json j = config;
    RunConfig loaded = run_config_from_json(j);
    EXPECT_FLOAT_EQ(loaded.steering.orbit_radius, 5.5f);
    EXPECT_EQ(loaded.steering.start_direction, vec3::unit_z());
    EXPECT_FLOAT_EQ(loaded.serpent.length, 16.0f);
    EXPECT_EQ(loaded.curve.samples_per_segment, 12);
}

TEST(SerializedDataTest, EnvelopeFields) {
    json::SerializedData data;
    data.step = "simulate";
    data.timestamp = "2026-01-01T00:00:00Z";
    data.stats = {{"ticks", 3}};
    data.data = nlohmann::json::array({1, 2, 3});

    nlohmann::json j = data.to_json();
    EXPECT_EQ(j["version"], json::SERIALIZATION_VERSION);
    EXPECT_EQ(j["step"], "simulate");
    EXPECT_FALSE(j.contains("config"));

    json::SerializedData back = json::SerializedData::from_json(j);
    EXPECT_EQ(back.step, "simulate");
    EXPECT_EQ(back.stats["ticks"], 3);
    EXPECT_EQ(back.data.size(), 3u);

    EXPECT_THROW(json::SerializedData::from_json(nlohmann::json::object()), std::runtime_error);
}

TEST(SpineJsonTest, TickSnapshot) {
    SteeringConfig steering;
    steering.random_seed = 3;
    SerpentConfig serpent_config = SerpentConfig::low();
    Serpent creature(serpent_config, steering);
    creature.place_target(Vec3(10.0f, 0.0f, 0.0f));
    creature.update(0.5f);

    nlohmann::json j = tick_to_json(0, creature);
    EXPECT_EQ(j["tick"], 0);
    EXPECT_FLOAT_EQ(j["distance"].get<float>(), 2.0f);
    EXPECT_EQ(j["target"].get<Vec3>(), Vec3(10.0f, 0.0f, 0.0f));
    EXPECT_EQ(j["spine"]["positions"].size(), 50u);
    EXPECT_EQ(j["spine"]["normals"].size(), 50u);

    nlohmann::json segments = segments_to_json(creature.curve());
    ASSERT_EQ(segments.size(), creature.curve().segment_count());
    ASSERT_EQ(segments[0]["curve"].size(), 4u);
    EXPECT_EQ(segments[0]["curve"][0].get<Vec3>(), creature.curve().segment(0).start());
}
