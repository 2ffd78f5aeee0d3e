#ifndef SERPENT_CREATURE_SERPENT_HPP
#define SERPENT_CREATURE_SERPENT_HPP

#include "spine_sampler.hpp"
#include "target_follower.hpp"
#include <curve/endless_curve.hpp>
#include <steering/curve_generator.hpp>
#include <cmath>
#include <optional>
#include <stdexcept>
#include <string>

namespace serpent {

// Shape and motion of the creature that rides the endless curve
struct SerpentConfig {
    float length = 26.0f;        // world length of the visible body
    float speed = 4.0f;          // world distance per second
    int spine_segments = 100;    // tube rings along the body
    int radial_segments = 8;     // vertices around each ring
    int texture_points = 100;    // spine lookup samples
    float scale_min = 0.13f;     // body thickness at the tail
    float scale_max = 0.65f;     // body thickness at the widest point
    float target_lerp = 0.1f;    // pointer target smoothing per tick

    void validate() const {
        if (!std::isfinite(length) || length < 0.0f) {
            throw std::invalid_argument("SerpentConfig: length must be finite and >= 0");
        }
        if (!std::isfinite(speed) || speed < 0.0f) {
            throw std::invalid_argument("SerpentConfig: speed must be finite and >= 0");
        }
        if (spine_segments < 2 || radial_segments < 3 || texture_points < 2) {
            throw std::invalid_argument(
                "SerpentConfig: need spine_segments >= 2, radial_segments >= 3, "
                "texture_points >= 2");
        }
        if (!std::isfinite(scale_min) || !std::isfinite(scale_max) ||
            !std::isfinite(target_lerp)) {
            throw std::invalid_argument("SerpentConfig: scale and lerp values must be finite");
        }
    }

    // Quality tiers
    static SerpentConfig low() {
        return SerpentConfig{
            .length = 10.0f,
            .spine_segments = 50,
            .radial_segments = 6,
            .texture_points = 50,
            .scale_min = 0.05f,
            .scale_max = 0.4f
        };
    }

    static SerpentConfig medium() {
        return SerpentConfig{
            .length = 16.0f,
            .spine_segments = 75,
            .radial_segments = 6,
            .texture_points = 75,
            .scale_min = 0.1f,
            .scale_max = 0.49f
        };
    }

    static SerpentConfig high() {
        return SerpentConfig{};
    }

    // Throws std::invalid_argument for an unknown name
    static SerpentConfig preset(const std::string& name) {
        if (name == "low") return low();
        if (name == "medium") return medium();
        if (name == "high") return high();
        throw std::invalid_argument("Unknown serpent preset: " + name);
    }
};

// Drives one creature: steering generator -> endless curve -> spine buffers.
// Call aim() with the pointer's ground hit (if any), then update() once per frame.
class Serpent {
public:
    Serpent(const SerpentConfig& config,
            const SteeringConfig& steering = SteeringConfig{},
            const EndlessCurveConfig& curve = EndlessCurveConfig{});

    // The curve source refers back into this object
    Serpent(const Serpent&) = delete;
    Serpent& operator=(const Serpent&) = delete;

    void aim(const std::optional<Vec3>& ground_hit) { follower_.update(ground_hit); }

    // Aim along a pointer ray; a ray that misses the ground leaves the target in place
    void aim_ray(const Vec3& origin, const Vec3& direction) {
        follower_.follow_ray(origin, direction);
    }

    // Pin the target at a fixed point until the next aim()
    void place_target(const Vec3& target) { follower_.reset(target); }

    // Ignore the follower and wander freely
    void set_free_roam(bool free_roam) { free_roam_ = free_roam; }
    bool free_roam() const { return free_roam_; }

    // Advance by delta seconds
    void update(float delta);

    // Travelled world distance; unbounded, hence double
    double distance() const { return distance_; }
    const SerpentConfig& config() const { return config_; }

    CurveGenerator& generator() { return generator_; }
    const CurveGenerator& generator() const { return generator_; }
    const EndlessCurve& curve() const { return curve_; }
    const SpineSampler& sampler() const { return sampler_; }
    const TargetFollower& follower() const { return follower_; }

private:
    SerpentConfig config_;
    CurveGenerator generator_;
    EndlessCurve curve_;
    SpineSampler sampler_;
    TargetFollower follower_;
    double distance_ = 0.0;
    bool free_roam_ = false;
};

}  // namespace serpent

#endif // SERPENT_CREATURE_SERPENT_HPP
