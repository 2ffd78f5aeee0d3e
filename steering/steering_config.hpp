#ifndef SERPENT_STEERING_STEERING_CONFIG_HPP
#define SERPENT_STEERING_STEERING_CONFIG_HPP

#include <math/vec3.hpp>
#include <cmath>
#include <cstdint>
#include <numbers>
#include <stdexcept>
#include <string>

namespace serpent {

// Segment length is drawn uniformly from [min, max]
struct LengthRange {
    float min = 4.0f;
    float max = 8.0f;
};

// Tunables for the boids-style steering generator
struct SteeringConfig {
    LengthRange segment_length;

    // Turn rate limit (radians per segment)
    float max_turn_rate = std::numbers::pi_v<float> / 6.0f;

    // Orbit behavior
    float orbit_radius = 8.0f;

    // Force weights
    float orbit_weight = 1.0f;
    float wander_weight = 0.15f;

    // Wander angles (radians) applied to noise in [-1, 1]
    float wander_strength = std::numbers::pi_v<float> / 24.0f;
    float tilt_strength = std::numbers::pi_v<float> / 48.0f;

    // Coil: vertical oscillation while orbiting
    float coil_amplitude = 3.0f;
    float coil_frequency = 0.25f;   // 4 orbit revolutions per up-down cycle

    // Noise time advanced per segment
    float noise_step = 0.01f;

    // 0 picks a nondeterministic seed
    uint32_t random_seed = 0;

    // Initial heading
    Vec3 start_position = vec3::zero();
    Vec3 start_direction = vec3::unit_x();

    // Throws std::invalid_argument naming the first non-finite field
    void validate() const {
        auto check = [](float value, const char* name) {
            if (!std::isfinite(value)) {
                throw std::invalid_argument(std::string("SteeringConfig: ") + name +
                                            " must be finite");
            }
        };
        check(segment_length.min, "segment_length.min");
        check(segment_length.max, "segment_length.max");
        check(max_turn_rate, "max_turn_rate");
        check(orbit_radius, "orbit_radius");
        check(orbit_weight, "orbit_weight");
        check(wander_weight, "wander_weight");
        check(wander_strength, "wander_strength");
        check(tilt_strength, "tilt_strength");
        check(coil_amplitude, "coil_amplitude");
        check(coil_frequency, "coil_frequency");
        check(noise_step, "noise_step");
        if (!start_position.is_finite()) {
            throw std::invalid_argument("SteeringConfig: start_position must be finite");
        }
        if (!start_direction.is_finite() || start_direction.length_squared() == 0.0f) {
            throw std::invalid_argument(
                "SteeringConfig: start_direction must be finite and non-zero");
        }
    }
};

}  // namespace serpent

#endif // SERPENT_STEERING_STEERING_CONFIG_HPP
