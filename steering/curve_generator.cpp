#include "curve_generator.hpp"
#include <common/logging.hpp>
#include <algorithm>
#include <cmath>
#include <numbers>

namespace serpent {

namespace {

constexpr float kOrbitEnterFactor = 1.5f;
constexpr float kCoilRamp = 0.15f;
constexpr float kRadialCorrection = 0.1f;
constexpr float kTiltNoiseOffset = 100.0f;

const SteeringConfig& validated(const SteeringConfig& config) {
    config.validate();
    return config;
}

uint32_t resolve_seed(uint32_t seed) {
    if (seed != 0) {
        return seed;
    }
    std::random_device rd;
    return rd();
}

}  // namespace

Vec3 limit_turn_rate(const Vec3& current, const Vec3& desired, float max_rate) {
    float angle = current.angle_to(desired);
    if (angle <= max_rate) {
        return desired;
    }

    Vec3 axis = current.cross(desired);
    if (axis.length_squared() < 1e-4f) {
        // Parallel or antiparallel: any axis perpendicular to current
        Vec3 helper = vec3::unit_y();
        if (std::abs(current.y) > 0.9f) {
            helper = vec3::unit_x();
        }
        axis = current.cross(helper).normalized();
    } else {
        axis = axis.normalized();
    }

    return current.rotated(axis, max_rate).normalized();
}

CurveGenerator::CurveGenerator(const SteeringConfig& config)
    : config_(validated(config)),
      seed_(resolve_seed(config.random_seed)),
      rng_(seed_),
      noise_(static_cast<uint32_t>(rng_())) {
    state_.last_point = config_.start_position;
    state_.last_direction = config_.start_direction.normalized();

    auto log = serpent::logging::get_logger();
    log->debug("CurveGenerator: seed={}, noise_seed={}, orbit_radius={}, max_turn_rate={}",
               seed_, noise_.seed(), config_.orbit_radius, config_.max_turn_rate);
}

void CurveGenerator::set_config(const SteeringConfig& config) {
    config.validate();
    config_ = config;
}

float CurveGenerator::pick_length() {
    std::uniform_real_distribution<float> unit(0.0f, 1.0f);
    const LengthRange& range = config_.segment_length;
    return range.min + unit(rng_) * (range.max - range.min);
}

Vec3 CurveGenerator::wander_direction() const {
    const Vec3 up = vec3::unit_y();

    // Horizontal wander about world up
    float wander_angle = noise_.sample(state_.noise_time, 0.0f) * config_.wander_strength;
    Vec3 result = state_.last_direction.rotated(up, wander_angle);

    // Vertical tilt about the local side axis
    float tilt_angle = noise_.sample(state_.noise_time, kTiltNoiseOffset) * config_.tilt_strength;
    Vec3 side = up.cross(result);
    if (side.length_squared() > 0.01f) {
        result = result.rotated(side.normalized(), tilt_angle);
    }

    return result.normalized();
}

Vec3 CurveGenerator::desired_direction(const std::optional<Vec3>& target, float length) {
    Vec3 desired = vec3::zero();

    if (target) {
        Vec3 to_target = *target - state_.last_point;
        float dist = to_target.length();
        Vec3 target_dir = to_target.normalized();
        Vec3 tangent(-target_dir.z, 0.0f, target_dir.x);

        float orbit_boundary = config_.orbit_radius * kOrbitEnterFactor;

        if (dist < orbit_boundary) {
            if (config_.orbit_radius > 0.0f) {
                // Arc fraction of the orbit circle, in radians
                state_.orbit_phase += length / config_.orbit_radius;
            }
            state_.coil_activation = std::min(1.0f, state_.coil_activation + kCoilRamp);
        } else {
            state_.coil_activation = std::max(0.0f, state_.coil_activation - kCoilRamp);
        }

        if (dist > orbit_boundary) {
            desired = target_dir;
        } else {
            float radial_strength = (dist - config_.orbit_radius) * kRadialCorrection;

            // Derivative of the coil height sin(f * phase)
            float coil_y = config_.coil_amplitude * config_.coil_frequency *
                           std::cos(config_.coil_frequency * state_.orbit_phase) *
                           state_.coil_activation;
            Vec3 coil_tangent(tangent.x, coil_y, tangent.z);

            desired = (coil_tangent + target_dir * radial_strength).normalized();
        }
    } else {
        desired = state_.last_direction * config_.orbit_weight;
    }

    Vec3 wander = wander_direction();
    desired += (wander - state_.last_direction) * config_.wander_weight;

    if (desired.length_squared() > 0.001f) {
        return desired.normalized();
    }
    return state_.last_direction;
}

CubicBezier CurveGenerator::next(const std::optional<Vec3>& target) {
    float length = pick_length();
    state_.noise_time += config_.noise_step;

    Vec3 desired = desired_direction(target, length);
    Vec3 last_dir = state_.last_direction;
    Vec3 new_dir = limit_turn_rate(last_dir, desired, config_.max_turn_rate);

    Vec3 start = state_.last_point;
    Vec3 end = start + new_dir * length;

    // Longer handles for sharper turns: 0.33 of length when straight, 0.67 at 90 degrees
    float turn_angle = last_dir.angle_to(new_dir);
    float turn_factor = std::min(1.0f, turn_angle / (std::numbers::pi_v<float> / 2.0f));
    float control_dist = length * (0.33f + 0.34f * turn_factor);

    CubicBezier segment(start,
                        start + last_dir * control_dist,
                        end - new_dir * control_dist,
                        end);

    state_.last_point = end;
    state_.last_direction = new_dir;

    return segment;
}

}  // namespace serpent
