#ifndef SERPENT_CREATURE_SPINE_SAMPLER_HPP
#define SERPENT_CREATURE_SPINE_SAMPLER_HPP

#include <curve/endless_curve.hpp>
#include <math/vec3.hpp>
#include <cstddef>
#include <vector>

namespace serpent {

// Samples the active window of an EndlessCurve at evenly spaced local u into
// two RGBA float lookup buffers, the layout a vertex stage reads to place the
// tube surface:
//   positions: (x, y, z, 1)
//   normals:   (nx, ny, nz) * 0.5 + 0.5, then 1
class SpineSampler {
public:
    explicit SpineSampler(size_t texture_points);

    void update(const EndlessCurve& curve);

    size_t texture_points() const { return texture_points_; }

    const std::vector<float>& positions() const { return positions_; }
    const std::vector<float>& normals() const { return normals_; }

    // Unpack entry i of the buffers
    Vec3 position(size_t i) const;
    Vec3 normal(size_t i) const;

    // Local u of sample i
    float sample_u(size_t i) const;

    static Vec3 encode_normal(const Vec3& n) {
        return {n.x * 0.5f + 0.5f, n.y * 0.5f + 0.5f, n.z * 0.5f + 0.5f};
    }

    static Vec3 decode_normal(const Vec3& e) {
        return {e.x * 2.0f - 1.0f, e.y * 2.0f - 1.0f, e.z * 2.0f - 1.0f};
    }

private:
    size_t texture_points_;
    std::vector<float> positions_;
    std::vector<float> normals_;
};

}  // namespace serpent

#endif // SERPENT_CREATURE_SPINE_SAMPLER_HPP
