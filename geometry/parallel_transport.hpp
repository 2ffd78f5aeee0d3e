#ifndef SERPENT_GEOMETRY_PARALLEL_TRANSPORT_HPP
#define SERPENT_GEOMETRY_PARALLEL_TRANSPORT_HPP

#include <math/vec3.hpp>

namespace serpent {

// Rotation-minimizing frame propagation.
//
// Rotates prev_normal by the rotation that carries prev_tangent onto
// new_tangent, then re-orthogonalizes against new_tangent. When the tangents
// are nearly parallel no rotation is applied and the previous normal is only
// projected back onto the plane of new_tangent. Antiparallel tangents rotate
// about an arbitrary axis orthogonal to prev_tangent.
//
// All tangents are expected to be unit length.
Vec3 parallel_transport(const Vec3& prev_normal,
                        const Vec3& prev_tangent,
                        const Vec3& new_tangent);

// Unit vector perpendicular to v (world up unless v is close to vertical)
Vec3 arbitrary_perpendicular(const Vec3& v);

}  // namespace serpent

#endif // SERPENT_GEOMETRY_PARALLEL_TRANSPORT_HPP
