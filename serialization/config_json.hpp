#ifndef SERPENT_SERIALIZATION_CONFIG_JSON_HPP
#define SERPENT_SERIALIZATION_CONFIG_JSON_HPP

#include <nlohmann/json.hpp>
#include <math/vec3.hpp>
#include <steering/steering_config.hpp>
#include <curve/endless_curve.hpp>
#include <creature/serpent.hpp>
#include <stdexcept>
#include <string>

namespace serpent {

// Vec3 serialization, as [x, y, z]
inline void to_json(nlohmann::json& j, const Vec3& v) {
    j = nlohmann::json::array({v.x, v.y, v.z});
}

inline void from_json(const nlohmann::json& j, Vec3& v) {
    if (!j.is_array() || j.size() != 3) {
        throw std::runtime_error("Vec3 must be an array of exactly 3 numbers");
    }
    v.x = j[0].get<float>();
    v.y = j[1].get<float>();
    v.z = j[2].get<float>();
}

// LengthRange serialization
inline void to_json(nlohmann::json& j, const LengthRange& range) {
    j = {
        {"min", range.min},
        {"max", range.max}
    };
}

inline void from_json(const nlohmann::json& j, LengthRange& range) {
    LengthRange defaults;
    range.min = j.value("min", defaults.min);
    range.max = j.value("max", defaults.max);
}

// SteeringConfig serialization
inline void to_json(nlohmann::json& j, const SteeringConfig& config) {
    j = {
        {"segment_length", config.segment_length},
        {"max_turn_rate", config.max_turn_rate},
        {"orbit_radius", config.orbit_radius},
        {"orbit_weight", config.orbit_weight},
        {"wander_weight", config.wander_weight},
        {"wander_strength", config.wander_strength},
        {"tilt_strength", config.tilt_strength},
        {"coil_amplitude", config.coil_amplitude},
        {"coil_frequency", config.coil_frequency},
        {"noise_step", config.noise_step},
        {"random_seed", config.random_seed},
        {"start_position", config.start_position},
        {"start_direction", config.start_direction}
    };
}

inline void from_json(const nlohmann::json& j, SteeringConfig& config) {
    SteeringConfig defaults;
    config.segment_length = j.value("segment_length", defaults.segment_length);
    config.max_turn_rate = j.value("max_turn_rate", defaults.max_turn_rate);
    config.orbit_radius = j.value("orbit_radius", defaults.orbit_radius);
    config.orbit_weight = j.value("orbit_weight", defaults.orbit_weight);
    config.wander_weight = j.value("wander_weight", defaults.wander_weight);
    config.wander_strength = j.value("wander_strength", defaults.wander_strength);
    config.tilt_strength = j.value("tilt_strength", defaults.tilt_strength);
    config.coil_amplitude = j.value("coil_amplitude", defaults.coil_amplitude);
    config.coil_frequency = j.value("coil_frequency", defaults.coil_frequency);
    config.noise_step = j.value("noise_step", defaults.noise_step);
    config.random_seed = j.value("random_seed", defaults.random_seed);
    config.start_position = j.value("start_position", defaults.start_position);
    config.start_direction = j.value("start_direction", defaults.start_direction);
}

// EndlessCurveConfig serialization
inline void to_json(nlohmann::json& j, const EndlessCurveConfig& config) {
    j = {
        {"samples_per_segment", config.samples_per_segment},
        {"arc_length_divisions", config.arc_length_divisions},
        {"max_segments_per_fill", config.max_segments_per_fill}
    };
}

inline void from_json(const nlohmann::json& j, EndlessCurveConfig& config) {
    EndlessCurveConfig defaults;
    config.samples_per_segment = j.value("samples_per_segment", defaults.samples_per_segment);
    config.arc_length_divisions = j.value("arc_length_divisions", defaults.arc_length_divisions);
    config.max_segments_per_fill = j.value("max_segments_per_fill", defaults.max_segments_per_fill);
}

// SerpentConfig serialization. Keys missing from j keep the values already in
// config, so a preset can be loaded first and then overridden.
inline void to_json(nlohmann::json& j, const SerpentConfig& config) {
    j = {
        {"length", config.length},
        {"speed", config.speed},
        {"spine_segments", config.spine_segments},
        {"radial_segments", config.radial_segments},
        {"texture_points", config.texture_points},
        {"scale_min", config.scale_min},
        {"scale_max", config.scale_max},
        {"target_lerp", config.target_lerp}
    };
}

inline void merge_from_json(const nlohmann::json& j, SerpentConfig& config) {
    config.length = j.value("length", config.length);
    config.speed = j.value("speed", config.speed);
    config.spine_segments = j.value("spine_segments", config.spine_segments);
    config.radial_segments = j.value("radial_segments", config.radial_segments);
    config.texture_points = j.value("texture_points", config.texture_points);
    config.scale_min = j.value("scale_min", config.scale_min);
    config.scale_max = j.value("scale_max", config.scale_max);
    config.target_lerp = j.value("target_lerp", config.target_lerp);
}

inline void from_json(const nlohmann::json& j, SerpentConfig& config) {
    config = SerpentConfig{};
    merge_from_json(j, config);
}

// Everything a run needs, as read from one configuration document:
//   { "preset": "low"|"medium"|"high",
//     "steering": {...}, "curve": {...}, "serpent": {...} }
struct RunConfig {
    SteeringConfig steering;
    EndlessCurveConfig curve;
    SerpentConfig serpent;
};

inline void to_json(nlohmann::json& j, const RunConfig& config) {
    j = {
        {"steering", config.steering},
        {"curve", config.curve},
        {"serpent", config.serpent}
    };
}

// Parse and validate. Throws std::invalid_argument for bad values and
// nlohmann::json::exception for wrong types.
inline RunConfig run_config_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Configuration must be a JSON object");
    }

    RunConfig config;
    if (j.contains("preset")) {
        config.serpent = SerpentConfig::preset(j["preset"].get<std::string>());
    }
    if (j.contains("steering")) {
        config.steering = j["steering"].get<SteeringConfig>();
    }
    if (j.contains("curve")) {
        config.curve = j["curve"].get<EndlessCurveConfig>();
    }
    if (j.contains("serpent")) {
        merge_from_json(j["serpent"], config.serpent);
    }

    config.steering.validate();
    config.curve.validate();
    config.serpent.validate();
    return config;
}

}  // namespace serpent

#endif // SERPENT_SERIALIZATION_CONFIG_JSON_HPP
