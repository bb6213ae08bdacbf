// 3D vector used for world positions, facings and velocities.
#pragma once

#include <algorithm>
#include <cmath>

namespace Bulwark {

constexpr float kPi = 3.14159265358979323846f;
constexpr float kDegToRad = kPi / 180.0f;
constexpr float kRadToDeg = 180.0f / kPi;

struct Vec3 {
    float x{0.0f};
    float y{0.0f};
    float z{0.0f};

    Vec3() = default;
    Vec3(float xVal, float yVal, float zVal) : x(xVal), y(yVal), z(zVal) {}

    Vec3 operator+(const Vec3& rhs) const { return {x + rhs.x, y + rhs.y, z + rhs.z}; }
    Vec3 operator-(const Vec3& rhs) const { return {x - rhs.x, y - rhs.y, z - rhs.z}; }
    Vec3 operator-() const { return {-x, -y, -z}; }
    Vec3 operator*(float s) const { return {x * s, y * s, z * s}; }
    Vec3 operator/(float s) const { return {x / s, y / s, z / s}; }
    Vec3& operator+=(const Vec3& rhs) {
        x += rhs.x;
        y += rhs.y;
        z += rhs.z;
        return *this;
    }
    Vec3& operator-=(const Vec3& rhs) {
        x -= rhs.x;
        y -= rhs.y;
        z -= rhs.z;
        return *this;
    }
    Vec3& operator*=(float s) {
        x *= s;
        y *= s;
        z *= s;
        return *this;
    }
    bool operator==(const Vec3& rhs) const { return x == rhs.x && y == rhs.y && z == rhs.z; }
    bool operator!=(const Vec3& rhs) const { return !(*this == rhs); }

    float lengthSquared() const { return x * x + y * y + z * z; }
    float length() const { return std::sqrt(lengthSquared()); }

    Vec3 normalized() const {
        const float len = length();
        if (len <= 1e-6f) return {};
        return {x / len, y / len, z / len};
    }

    // Drops the vertical (y) component; ground-plane direction.
    Vec3 flattened() const { return {x, 0.0f, z}; }

    bool nearlyZero(float epsilon = 1e-6f) const { return lengthSquared() <= epsilon * epsilon; }

    static Vec3 forward() { return {0.0f, 0.0f, 1.0f}; }
    static Vec3 up() { return {0.0f, 1.0f, 0.0f}; }
};

inline Vec3 operator*(float s, const Vec3& v) { return v * s; }

inline float dot(const Vec3& a, const Vec3& b) { return a.x * b.x + a.y * b.y + a.z * b.z; }

inline Vec3 cross(const Vec3& a, const Vec3& b) {
    return {a.y * b.z - a.z * b.y, a.z * b.x - a.x * b.z, a.x * b.y - a.y * b.x};
}

inline float distanceSquared(const Vec3& a, const Vec3& b) { return (a - b).lengthSquared(); }
inline float distance(const Vec3& a, const Vec3& b) { return (a - b).length(); }

// Unsigned angle between two directions in degrees. Zero vectors yield 0.
inline float angleDegrees(const Vec3& a, const Vec3& b) {
    const float denom = std::sqrt(a.lengthSquared() * b.lengthSquared());
    if (denom <= 1e-12f) return 0.0f;
    const float c = std::clamp(dot(a, b) / denom, -1.0f, 1.0f);
    return std::acos(c) * kRadToDeg;
}

// Rotates unit direction `current` toward `target` by at most maxRadians.
inline Vec3 rotateTowards(const Vec3& current, const Vec3& target, float maxRadians) {
    const Vec3 from = current.normalized();
    const Vec3 to = target.normalized();
    if (from.nearlyZero()) return to;
    if (to.nearlyZero()) return from;

    const float c = std::clamp(dot(from, to), -1.0f, 1.0f);
    const float angle = std::acos(c);
    if (angle <= maxRadians || angle <= 1e-6f) return to;
    if (maxRadians <= 0.0f) return from;

    // Rotation axis; opposite vectors turn around the part of `up` perpendicular to `from`.
    Vec3 axis = cross(from, to);
    if (axis.nearlyZero(1e-5f)) {
        axis = Vec3::up() - from * dot(from, Vec3::up());
        if (axis.nearlyZero(1e-5f)) axis = cross(from, Vec3{1.0f, 0.0f, 0.0f});
    }
    axis = axis.normalized();

    // Rodrigues rotation of `from` around `axis`.
    const float s = std::sin(maxRadians);
    const float k = std::cos(maxRadians);
    const Vec3 rotated = from * k + cross(axis, from) * s + axis * (dot(axis, from) * (1.0f - k));
    return rotated.normalized();
}

}  // namespace Bulwark
