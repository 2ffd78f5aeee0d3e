#include "cubic_bezier.hpp"
#include <algorithm>
#include <cmath>

namespace serpent {

float ArcLengthTable::parameter_at_fraction(float fraction) const {
    if (lengths.size() < 2) {
        return 0.0f;
    }

    fraction = std::clamp(fraction, 0.0f, 1.0f);
    const size_t last = lengths.size() - 1;
    const float target = fraction * lengths.back();

    // Largest index whose cumulative length does not exceed the target
    auto it = std::upper_bound(lengths.begin(), lengths.end(), target);
    size_t i = (it == lengths.begin()) ? 0 : static_cast<size_t>(it - lengths.begin()) - 1;
    if (i >= last) {
        return 1.0f;
    }

    float before = lengths[i];
    float span = lengths[i + 1] - before;
    float local = span > 0.0f ? (target - before) / span : 0.0f;

    return (static_cast<float>(i) + local) / static_cast<float>(last);
}

CubicBezier::CubicBezier(const Vec3& p0, const Vec3& p1, const Vec3& p2, const Vec3& p3)
    : control_points{p0, p1, p2, p3} {}

Vec3 CubicBezier::evaluate(float t) const {
    const auto& p = control_points;
    const float s = 1.0f - t;

    // Bernstein weights
    const float w0 = s * s * s;
    const float w1 = 3.0f * s * s * t;
    const float w2 = 3.0f * s * t * t;
    const float w3 = t * t * t;

    return p[0] * w0 + p[1] * w1 + p[2] * w2 + p[3] * w3;
}

Vec3 CubicBezier::derivative(float t) const {
    const auto& p = control_points;
    const float s = 1.0f - t;

    // Quadratic Bezier over the scaled control-point differences
    const Vec3 h0 = (p[1] - p[0]) * 3.0f;
    const Vec3 h1 = (p[2] - p[1]) * 3.0f;
    const Vec3 h2 = (p[3] - p[2]) * 3.0f;

    return h0 * (s * s) + h1 * (2.0f * s * t) + h2 * (t * t);
}

Vec3 CubicBezier::tangent(float t) const {
    if (t <= 0.0f) {
        return start_tangent();
    }
    if (t >= 1.0f) {
        return end_tangent();
    }

    Vec3 d = derivative(t);
    if (d.length_squared() < 1e-12f) {
        return (control_points[3] - control_points[0]).normalized();
    }
    return d.normalized();
}

Vec3 CubicBezier::start_tangent() const {
    Vec3 d = control_points[1] - control_points[0];
    if (d.length_squared() < 1e-12f) {
        d = control_points[2] - control_points[0];
    }
    if (d.length_squared() < 1e-12f) {
        d = control_points[3] - control_points[0];
    }
    return d.normalized();
}

Vec3 CubicBezier::end_tangent() const {
    Vec3 d = control_points[3] - control_points[2];
    if (d.length_squared() < 1e-12f) {
        d = control_points[3] - control_points[1];
    }
    if (d.length_squared() < 1e-12f) {
        d = control_points[3] - control_points[0];
    }
    return d.normalized();
}

ArcLengthTable CubicBezier::arc_length_table(int divisions) const {
    const int n = std::max(divisions, 1);

    ArcLengthTable table;
    table.lengths.resize(static_cast<size_t>(n) + 1, 0.0f);

    Vec3 previous = start();
    for (int i = 1; i <= n; ++i) {
        const Vec3 point = evaluate(static_cast<float>(i) / static_cast<float>(n));
        table.lengths[static_cast<size_t>(i)] =
            table.lengths[static_cast<size_t>(i) - 1] + previous.distance_to(point);
        previous = point;
    }
    return table;
}

}  // namespace serpent
