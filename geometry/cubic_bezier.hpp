#ifndef SERPENT_GEOMETRY_CUBIC_BEZIER_HPP
#define SERPENT_GEOMETRY_CUBIC_BEZIER_HPP

#include <math/vec3.hpp>
#include <array>
#include <vector>

namespace serpent {

// Cumulative chord lengths sampled at t = i / divisions.
// lengths.front() is always 0 and lengths.back() is the total arc length.
struct ArcLengthTable {
    std::vector<float> lengths;

    float total() const { return lengths.empty() ? 0.0f : lengths.back(); }

    // Map an arc-length fraction in [0, 1] to the curve parameter t.
    // Out-of-range fractions are clamped.
    float parameter_at_fraction(float fraction) const;
};

// A single cubic Bezier curve segment
struct CubicBezier {
    std::array<Vec3, 4> control_points;

    CubicBezier() = default;
    CubicBezier(const Vec3& p0, const Vec3& p1, const Vec3& p2, const Vec3& p3);

    // Position at parameter t in [0, 1]
    Vec3 evaluate(float t) const;

    // First derivative (hodograph) at t
    Vec3 derivative(float t) const;

    // Unit tangent from the analytic derivative.
    // At t == 0 and t == 1 the exact end-handle directions are used so that
    // adjoining C1 segments report bit-identical boundary tangents.
    Vec3 tangent(float t) const;

    // Exact boundary tangents, proportional to (control1 - start) and
    // (end - control2). Fall back to the chord when a handle collapses.
    Vec3 start_tangent() const;
    Vec3 end_tangent() const;

    // Chord-length table with the given number of divisions (at least 1)
    ArcLengthTable arc_length_table(int divisions = 200) const;

    const Vec3& start() const { return control_points[0]; }
    const Vec3& control1() const { return control_points[1]; }
    const Vec3& control2() const { return control_points[2]; }
    const Vec3& end() const { return control_points[3]; }
};

}  // namespace serpent

#endif // SERPENT_GEOMETRY_CUBIC_BEZIER_HPP
