#include "spine_sampler.hpp"
#include <stdexcept>

namespace serpent {

SpineSampler::SpineSampler(size_t texture_points)
    : texture_points_(texture_points),
      positions_(texture_points * 4, 0.0f),
      normals_(texture_points * 4, 0.0f) {
    if (texture_points == 0) {
        throw std::invalid_argument("SpineSampler: texture_points must be > 0");
    }
}

float SpineSampler::sample_u(size_t i) const {
    if (texture_points_ < 2) {
        return 0.0f;
    }
    return static_cast<float>(i) / static_cast<float>(texture_points_ - 1);
}

void SpineSampler::update(const EndlessCurve& curve) {
    for (size_t i = 0; i < texture_points_; ++i) {
        CurveBasis basis = curve.basis_at_local(sample_u(i));
        Vec3 encoded = encode_normal(basis.normal);

        size_t idx = i * 4;
        positions_[idx] = basis.position.x;
        positions_[idx + 1] = basis.position.y;
        positions_[idx + 2] = basis.position.z;
        positions_[idx + 3] = 1.0f;

        normals_[idx] = encoded.x;
        normals_[idx + 1] = encoded.y;
        normals_[idx + 2] = encoded.z;
        normals_[idx + 3] = 1.0f;
    }
}

Vec3 SpineSampler::position(size_t i) const {
    size_t idx = i * 4;
    return {positions_[idx], positions_[idx + 1], positions_[idx + 2]};
}

Vec3 SpineSampler::normal(size_t i) const {
    size_t idx = i * 4;
    return decode_normal({normals_[idx], normals_[idx + 1], normals_[idx + 2]});
}

}  // namespace serpent
