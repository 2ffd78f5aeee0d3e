#ifndef SERPENT_SERIALIZATION_SPINE_JSON_HPP
#define SERPENT_SERIALIZATION_SPINE_JSON_HPP

#include <nlohmann/json.hpp>
#include <creature/serpent.hpp>
#include <geometry/cubic_bezier.hpp>
#include "config_json.hpp"

namespace serpent {

// CubicBezier serialization, as its four control points
inline void to_json(nlohmann::json& j, const CubicBezier& bezier) {
    j = nlohmann::json::array({bezier.start(), bezier.control1(), bezier.control2(), bezier.end()});
}

// Decoded spine samples of one tick
inline nlohmann::json spine_to_json(const SpineSampler& sampler) {
    nlohmann::json positions = nlohmann::json::array();
    nlohmann::json normals = nlohmann::json::array();
    for (size_t i = 0; i < sampler.texture_points(); ++i) {
        positions.push_back(sampler.position(i));
        normals.push_back(sampler.normal(i));
    }
    return {
        {"positions", positions},
        {"normals", normals}
    };
}

// Snapshot of the driver state after a tick
inline nlohmann::json tick_to_json(int tick, const Serpent& creature) {
    const EndlessCurve& curve = creature.curve();
    nlohmann::json j;
    j["tick"] = tick;
    j["distance"] = creature.distance();
    if (curve.target()) {
        j["target"] = *curve.target();
    } else {
        j["target"] = nullptr;
    }
    j["segments"] = curve.segment_count();
    j["total_length"] = curve.total_length();
    j["distance_offset"] = curve.distance_offset();
    j["u_start"] = curve.u_start();
    j["u_length"] = curve.u_length();
    j["spine"] = spine_to_json(creature.sampler());
    return j;
}

// The cached segments of a curve
inline nlohmann::json segments_to_json(const EndlessCurve& curve) {
    nlohmann::json j = nlohmann::json::array();
    for (size_t i = 0; i < curve.segment_count(); ++i) {
        nlohmann::json entry = {
            {"curve", curve.segment(i)},
            {"arc_length", curve.segment_length(i)}
        };
        j.push_back(entry);
    }
    return j;
}

}  // namespace serpent

#endif // SERPENT_SERIALIZATION_SPINE_JSON_HPP
