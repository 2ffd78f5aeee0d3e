#include "parallel_transport.hpp"
#include <algorithm>
#include <cmath>

namespace serpent {

namespace {

constexpr float kParallelDot = 0.9999f;
constexpr float kDegenerateAxis = 1e-4f;

// Remove the tangential component and renormalize
Vec3 orthogonalize(const Vec3& normal, const Vec3& tangent) {
    Vec3 n = normal.without_component(tangent);
    if (n.length_squared() < 1e-12f) {
        return arbitrary_perpendicular(tangent);
    }
    return n.normalized();
}

}  // namespace

Vec3 parallel_transport(const Vec3& prev_normal,
                        const Vec3& prev_tangent,
                        const Vec3& new_tangent) {
    float dot = prev_tangent.dot(new_tangent);

    if (dot > kParallelDot) {
        return orthogonalize(prev_normal, new_tangent);
    }

    Vec3 axis = prev_tangent.cross(new_tangent);
    if (axis.length_squared() < kDegenerateAxis) {
        // 180 degree turn: any axis orthogonal to the old tangent will do
        Vec3 helper = vec3::unit_x();
        if (std::abs(prev_tangent.dot(helper)) > 0.9f) {
            helper = vec3::unit_y();
        }
        axis = helper.cross(prev_tangent).normalized();
    } else {
        axis = axis.normalized();
    }

    float angle = std::acos(std::clamp(dot, -1.0f, 1.0f));
    Vec3 rotated = prev_normal.rotated(axis, angle);

    return orthogonalize(rotated, new_tangent);
}

Vec3 arbitrary_perpendicular(const Vec3& v) {
    Vec3 up = vec3::unit_y();
    if (std::abs(v.dot(up)) > 0.9f) {
        up = vec3::unit_x();
    }
    Vec3 p = v.cross(up);
    if (p.length_squared() < 1e-12f) {
        // v is zero (or not finite); any unit vector is perpendicular enough
        return vec3::unit_z();
    }
    return p.normalized();
}

}  // namespace serpent
