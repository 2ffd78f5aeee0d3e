#ifndef SERPENT_CREATURE_TUBE_MESH_HPP
#define SERPENT_CREATURE_TUBE_MESH_HPP

#include "spine_sampler.hpp"
#include <math/vec3.hpp>
#include <array>
#include <string>
#include <vector>

namespace serpent {

struct SerpentConfig;

// Body thickness at local u: scale_min at both ends, scale_max midway
float body_radius(float u, float scale_min, float scale_max);

// A tube around the sampled spine, one ring per spine segment boundary
struct TubeMesh {
    int rings = 0;
    int radial_segments = 0;
    std::vector<Vec3> positions;   // rings * radial_segments, ring-major
    std::vector<Vec3> normals;     // outward unit normals, same layout
    std::vector<std::array<int, 4>> quads;  // zero-based vertex indices

    // Wavefront OBJ text (v, vn, f with 1-based indices)
    std::string to_obj() const;
};

// Build the body tube. Ring k sits at local u = k / (spine_segments) and uses
// the frame of the nearest spine sample.
TubeMesh build_tube(const SpineSampler& sampler, const SerpentConfig& config);

}  // namespace serpent

#endif // SERPENT_CREATURE_TUBE_MESH_HPP
