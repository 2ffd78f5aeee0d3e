#include "tube_mesh.hpp"
#include "serpent.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <numbers>
#include <sstream>

namespace serpent {

float body_radius(float u, float scale_min, float scale_max) {
    u = std::clamp(u, 0.0f, 1.0f);
    return scale_min + (scale_max - scale_min) * std::sin(std::numbers::pi_v<float> * u);
}

TubeMesh build_tube(const SpineSampler& sampler, const SerpentConfig& config) {
    TubeMesh mesh;
    size_t points = sampler.texture_points();
    if (points < 2) {
        return mesh;
    }

    mesh.rings = config.spine_segments + 1;
    mesh.radial_segments = config.radial_segments;

    const float two_pi = 2.0f * std::numbers::pi_v<float>;

    for (int k = 0; k < mesh.rings; ++k) {
        float u = static_cast<float>(k) / static_cast<float>(config.spine_segments);
        size_t i = static_cast<size_t>(std::lround(u * static_cast<float>(points - 1)));

        Vec3 center = sampler.position(i);
        Vec3 normal = sampler.normal(i).normalized();

        // Tangent from neighbouring samples
        size_t i0 = i > 0 ? i - 1 : i;
        size_t i1 = i + 1 < points ? i + 1 : i;
        Vec3 tangent = (sampler.position(i1) - sampler.position(i0)).normalized();
        Vec3 binormal = tangent.cross(normal).normalized();

        float radius = body_radius(u, config.scale_min, config.scale_max);

        for (int j = 0; j < mesh.radial_segments; ++j) {
            float angle = two_pi * static_cast<float>(j) / static_cast<float>(mesh.radial_segments);
            Vec3 offset = normal * std::cos(angle) + binormal * std::sin(angle);
            mesh.positions.push_back(center + offset * radius);
            mesh.normals.push_back(offset);
        }
    }

    for (int k = 0; k + 1 < mesh.rings; ++k) {
        for (int j = 0; j < mesh.radial_segments; ++j) {
            int next_j = (j + 1) % mesh.radial_segments;
            int a = k * mesh.radial_segments + j;
            int b = k * mesh.radial_segments + next_j;
            int c = (k + 1) * mesh.radial_segments + next_j;
            int d = (k + 1) * mesh.radial_segments + j;
            mesh.quads.push_back({a, b, c, d});
        }
    }

    return mesh;
}

std::string TubeMesh::to_obj() const {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(6);

    ss << "# serpent OBJ export\n";
    ss << "# Rings: " << rings << "\n";
    ss << "# Radial segments: " << radial_segments << "\n\n";

    for (const auto& p : positions) {
        ss << "v " << p.x << " " << p.y << " " << p.z << "\n";
    }
    for (const auto& n : normals) {
        ss << "vn " << n.x << " " << n.y << " " << n.z << "\n";
    }

    if (!quads.empty()) {
        ss << "\n# Body\n";
    }
    for (const auto& q : quads) {
        ss << "f";
        for (int index : q) {
            ss << " " << index + 1 << "//" << index + 1;
        }
        ss << "\n";
    }

    return ss.str();
}

}  // namespace serpent
