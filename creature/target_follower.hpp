#ifndef SERPENT_CREATURE_TARGET_FOLLOWER_HPP
#define SERPENT_CREATURE_TARGET_FOLLOWER_HPP

#include <math/vec3.hpp>
#include <optional>

namespace serpent {

// Intersect a ray with the ground plane y = 0.
// Returns nothing when the ray is parallel to the plane or points away from it.
std::optional<Vec3> intersect_ground(const Vec3& origin, const Vec3& direction);

// Smooths a raw pointer target toward the steering target
class TargetFollower {
public:
    explicit TargetFollower(float lerp_factor = 0.1f, const Vec3& start = vec3::zero())
        : lerp_factor_(lerp_factor), position_(start) {}

    // Move toward the latest hit; without a hit the target holds still
    const Vec3& update(const std::optional<Vec3>& hit);

    // Cast a pointer ray and follow its ground hit
    const Vec3& follow_ray(const Vec3& origin, const Vec3& direction) {
        return update(intersect_ground(origin, direction));
    }

    // Jump straight to a point, no smoothing
    void reset(const Vec3& position) { position_ = position; }

    const Vec3& position() const { return position_; }
    float lerp_factor() const { return lerp_factor_; }

private:
    float lerp_factor_;
    Vec3 position_;
};

}  // namespace serpent

#endif // SERPENT_CREATURE_TARGET_FOLLOWER_HPP
