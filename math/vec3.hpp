#ifndef SERPENT_MATH_VEC3_HPP
#define SERPENT_MATH_VEC3_HPP

#include <algorithm>
#include <cmath>

namespace serpent {

struct Vec3 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    constexpr Vec3() = default;
    constexpr Vec3(float x_, float y_, float z_) : x(x_), y(y_), z(z_) {}

    // Arithmetic operators
    constexpr Vec3 operator+(const Vec3& other) const {
        return {x + other.x, y + other.y, z + other.z};
    }

    constexpr Vec3 operator-(const Vec3& other) const {
        return {x - other.x, y - other.y, z - other.z};
    }

    constexpr Vec3 operator*(float scalar) const {
        return {x * scalar, y * scalar, z * scalar};
    }

    constexpr Vec3 operator/(float scalar) const {
        return {x / scalar, y / scalar, z / scalar};
    }

    constexpr Vec3 operator-() const {
        return {-x, -y, -z};
    }

    // Compound assignment
    constexpr Vec3& operator+=(const Vec3& other) {
        x += other.x; y += other.y; z += other.z;
        return *this;
    }

    constexpr float dot(const Vec3& other) const {
        return x * other.x + y * other.y + z * other.z;
    }

    constexpr Vec3 cross(const Vec3& other) const {
        return {
            y * other.z - z * other.y,
            z * other.x - x * other.z,
            x * other.y - y * other.x
        };
    }

    constexpr float length_squared() const {
        return x * x + y * y + z * z;
    }

    float length() const {
        return std::sqrt(length_squared());
    }

    // Zero vector stays zero
    Vec3 normalized() const {
        float len = length();
        if (len > 0.0f) {
            return *this / len;
        }
        return {0.0f, 0.0f, 0.0f};
    }

    float distance_to(const Vec3& other) const {
        return (*this - other).length();
    }

    // Angle in radians between two (not necessarily unit) vectors.
    // Returns pi/2 when either vector is zero.
    float angle_to(const Vec3& other) const {
        float denom = std::sqrt(length_squared() * other.length_squared());
        if (denom == 0.0f) {
            return 1.57079632679489662f;
        }
        float c = std::clamp(dot(other) / denom, -1.0f, 1.0f);
        return std::acos(c);
    }

    // Rodrigues rotation about a unit axis
    Vec3 rotated(const Vec3& axis, float angle) const {
        float c = std::cos(angle);
        float s = std::sin(angle);
        return *this * c +
               axis.cross(*this) * s +
               axis * (axis.dot(*this) * (1.0f - c));
    }

    // Component perpendicular to a unit axis
    constexpr Vec3 without_component(const Vec3& unit_axis) const {
        return *this - unit_axis * dot(unit_axis);
    }

    bool is_finite() const {
        return std::isfinite(x) && std::isfinite(y) && std::isfinite(z);
    }

    // Comparison (exact)
    constexpr bool operator==(const Vec3& other) const {
        return x == other.x && y == other.y && z == other.z;
    }
};

// Scalar * Vec3
constexpr Vec3 operator*(float scalar, const Vec3& v) {
    return v * scalar;
}

constexpr Vec3 lerp(const Vec3& a, const Vec3& b, float t) {
    return a * (1.0f - t) + b * t;
}

namespace vec3 {
    constexpr Vec3 zero() { return {0.0f, 0.0f, 0.0f}; }
    constexpr Vec3 unit_x() { return {1.0f, 0.0f, 0.0f}; }
    constexpr Vec3 unit_y() { return {0.0f, 1.0f, 0.0f}; }
    constexpr Vec3 unit_z() { return {0.0f, 0.0f, 1.0f}; }
}

}  // namespace serpent

#endif // SERPENT_MATH_VEC3_HPP
