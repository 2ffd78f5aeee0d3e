#ifndef SERPENT_STEERING_CURVE_GENERATOR_HPP
#define SERPENT_STEERING_CURVE_GENERATOR_HPP

#include "steering_config.hpp"
#include <geometry/cubic_bezier.hpp>
#include <math/simplex_noise.hpp>
#include <math/vec3.hpp>
#include <cstdint>
#include <optional>
#include <random>

namespace serpent {

// Mutable steering state, updated once per emitted segment
struct HeadingState {
    Vec3 last_point;
    Vec3 last_direction = vec3::unit_x();  // unit length
    float noise_time = 0.0f;
    float orbit_phase = 0.0f;              // accumulated orbit angle (radians)
    float coil_activation = 0.0f;          // 0..1 ramp
};

// Boids-style curve generator: seek / orbit / wander forces followed by a
// hard turn-rate limit. Each call to next() emits one cubic Bezier segment
// that starts where the previous one ended with a matching tangent.
class CurveGenerator {
public:
    explicit CurveGenerator(const SteeringConfig& config = SteeringConfig{});

    // Emit the next segment, steering toward target when one is given
    CubicBezier next(const std::optional<Vec3>& target = std::nullopt);

    const SteeringConfig& config() const { return config_; }

    // Validates and installs new tunables; takes effect on the next segment.
    // Heading state and noise seed are kept.
    void set_config(const SteeringConfig& config);

    const HeadingState& state() const { return state_; }

    // Seed actually in use; differs from config().random_seed when that is 0
    uint32_t seed() const { return seed_; }

private:
    float pick_length();
    Vec3 desired_direction(const std::optional<Vec3>& target, float length);
    Vec3 wander_direction() const;

    SteeringConfig config_;
    HeadingState state_;
    uint32_t seed_;
    std::mt19937 rng_;
    SimplexNoise2D noise_;
};

// Rotate current toward desired by at most max_rate radians
Vec3 limit_turn_rate(const Vec3& current, const Vec3& desired, float max_rate);

}  // namespace serpent

#endif // SERPENT_STEERING_CURVE_GENERATOR_HPP
