#include "target_follower.hpp"
#include <cmath>

namespace serpent {

std::optional<Vec3> intersect_ground(const Vec3& origin, const Vec3& direction) {
    if (std::abs(direction.y) < 1e-6f) {
        return std::nullopt;
    }

    float t = -origin.y / direction.y;
    if (t < 0.0f || !std::isfinite(t)) {
        return std::nullopt;
    }

    Vec3 hit = origin + direction * t;
    hit.y = 0.0f;
    return hit;
}

const Vec3& TargetFollower::update(const std::optional<Vec3>& hit) {
    if (hit && hit->is_finite()) {
        position_ = lerp(position_, *hit, lerp_factor_);
    }
    return position_;
}

}  // namespace serpent
