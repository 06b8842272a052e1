#pragma once

/// @file math_types.hpp
/// @brief Vector3, Quaternion and Bounds value types for gameplay code.
///
/// Conventions: left-handed, +Y up, +Z forward.  Angles are in degrees
/// at the authoring boundary and radians internally.

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace gpk::game {

inline constexpr float kPi = 3.14159265358979323846f;
inline constexpr float kDegToRad = kPi / 180.0f;

[[nodiscard]] constexpr float Clamp01(float v) noexcept {
    return v < 0.0f ? 0.0f : (v > 1.0f ? 1.0f : v);
}

/// Unclamped linear interpolation.
[[nodiscard]] constexpr float Lerp(float a, float b, float t) noexcept {
    return a + (b - a) * t;
}

/// Three-component floating-point vector.
struct Vector3 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    constexpr Vector3() = default;
    constexpr Vector3(float x, float y, float z) : x(x), y(y), z(z) {}

    constexpr Vector3 operator+(const Vector3& rhs) const noexcept {
        return {x + rhs.x, y + rhs.y, z + rhs.z};
    }
    constexpr Vector3 operator-(const Vector3& rhs) const noexcept {
        return {x - rhs.x, y - rhs.y, z - rhs.z};
    }
    constexpr Vector3 operator-() const noexcept { return {-x, -y, -z}; }
    constexpr Vector3 operator*(float scalar) const noexcept {
        return {x * scalar, y * scalar, z * scalar};
    }
    constexpr Vector3 operator/(float scalar) const noexcept {
        return {x / scalar, y / scalar, z / scalar};
    }

    constexpr Vector3& operator+=(const Vector3& rhs) noexcept {
        x += rhs.x;
        y += rhs.y;
        z += rhs.z;
        return *this;
    }

    constexpr Vector3& operator-=(const Vector3& rhs) noexcept {
        x -= rhs.x;
        y -= rhs.y;
        z -= rhs.z;
        return *this;
    }

    [[nodiscard]] constexpr float Dot(const Vector3& rhs) const noexcept {
        return x * rhs.x + y * rhs.y + z * rhs.z;
    }

    [[nodiscard]] constexpr Vector3 Cross(const Vector3& rhs) const noexcept {
        return {y * rhs.z - z * rhs.y, z * rhs.x - x * rhs.z, x * rhs.y - y * rhs.x};
    }

    [[nodiscard]] constexpr float LengthSquared() const noexcept { return Dot(*this); }

    [[nodiscard]] float Length() const noexcept { return std::sqrt(LengthSquared()); }

    /// Length of the XZ projection.
    [[nodiscard]] float HorizontalLength() const noexcept { return std::sqrt(x * x + z * z); }

    /// Normalized copy, or zero if the length is near zero.
    [[nodiscard]] Vector3 Normalized() const noexcept {
        const float len = Length();
        if (len < 1e-6f) {
            return {};
        }
        return {x / len, y / len, z / len};
    }

    /// Component-wise product.
    [[nodiscard]] constexpr Vector3 Scaled(const Vector3& rhs) const noexcept {
        return {x * rhs.x, y * rhs.y, z * rhs.z};
    }

    [[nodiscard]] static constexpr Vector3 Zero() noexcept { return {}; }
    [[nodiscard]] static constexpr Vector3 One() noexcept { return {1.0f, 1.0f, 1.0f}; }
    [[nodiscard]] static constexpr Vector3 Up() noexcept { return {0.0f, 1.0f, 0.0f}; }
    [[nodiscard]] static constexpr Vector3 Forward() noexcept { return {0.0f, 0.0f, 1.0f}; }

    constexpr auto operator<=>(const Vector3&) const = default;
};

constexpr Vector3 operator*(float scalar, const Vector3& v) noexcept {
    return v * scalar;
}

[[nodiscard]] inline float Distance(const Vector3& a, const Vector3& b) noexcept {
    return (a - b).Length();
}

[[nodiscard]] constexpr Vector3 Lerp(const Vector3& a, const Vector3& b, float t) noexcept {
    return a + (b - a) * t;
}

/// Rotation stored as (w, x, y, z); defaults to identity.
struct Quaternion {
    float w = 1.0f;
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    constexpr Quaternion() = default;
    constexpr Quaternion(float w, float x, float y, float z) : w(w), x(x), y(y), z(z) {}

    [[nodiscard]] static constexpr Quaternion Identity() noexcept { return {}; }

    /// Hamilton product: applying the result rotates by @p rhs, then *this.
    constexpr Quaternion operator*(const Quaternion& rhs) const noexcept {
        return {w * rhs.w - x * rhs.x - y * rhs.y - z * rhs.z,
                w * rhs.x + x * rhs.w + y * rhs.z - z * rhs.y,
                w * rhs.y - x * rhs.z + y * rhs.w + z * rhs.x,
                w * rhs.z + x * rhs.y - y * rhs.x + z * rhs.w};
    }

    [[nodiscard]] constexpr float Dot(const Quaternion& rhs) const noexcept {
        return w * rhs.w + x * rhs.x + y * rhs.y + z * rhs.z;
    }

    [[nodiscard]] Quaternion Normalized() const noexcept {
        const float len = std::sqrt(Dot(*this));
        if (len < 1e-6f) {
            return Identity();
        }
        return {w / len, x / len, y / len, z / len};
    }

    /// Rotate a vector by this (unit) quaternion.
    [[nodiscard]] Vector3 Rotate(const Vector3& v) const noexcept {
        const Vector3 u{x, y, z};
        const Vector3 t = u.Cross(v) * 2.0f;
        return v + t * w + u.Cross(t);
    }

    /// Rotation about @p axis (need not be normalized) by @p radians.
    [[nodiscard]] static Quaternion AngleAxis(float radians, const Vector3& axis) noexcept;

    /// Euler angles in degrees, applied Z, then X, then Y.
    [[nodiscard]] static Quaternion FromEulerDegrees(float xDeg, float yDeg, float zDeg) noexcept;

    /// Rotation whose +Z axis faces @p forward with +Y as close to @p up as
    /// possible.  Identity for a zero forward.
    [[nodiscard]] static Quaternion LookRotation(const Vector3& forward,
                                                 const Vector3& up = Vector3::Up()) noexcept;

    /// Spherical interpolation along the shortest arc; @p t is clamped to [0, 1].
    [[nodiscard]] static Quaternion Slerp(const Quaternion& a, const Quaternion& b,
                                          float t) noexcept;

    constexpr auto operator<=>(const Quaternion&) const = default;
};

inline Quaternion Quaternion::AngleAxis(float radians, const Vector3& axis) noexcept {
    const Vector3 n = axis.Normalized();
    const float half = radians * 0.5f;
    const float s = std::sin(half);
    return {std::cos(half), n.x * s, n.y * s, n.z * s};
}

inline Quaternion Quaternion::FromEulerDegrees(float xDeg, float yDeg, float zDeg) noexcept {
    const auto qx = AngleAxis(xDeg * kDegToRad, {1.0f, 0.0f, 0.0f});
    const auto qy = AngleAxis(yDeg * kDegToRad, {0.0f, 1.0f, 0.0f});
    const auto qz = AngleAxis(zDeg * kDegToRad, {0.0f, 0.0f, 1.0f});
    return (qy * qx * qz).Normalized();
}

inline Quaternion Quaternion::LookRotation(const Vector3& forward, const Vector3& up) noexcept {
    const Vector3 f = forward.Normalized();
    if (f.LengthSquared() < 1e-12f) {
        return Identity();
    }
    Vector3 r = up.Cross(f).Normalized();
    if (r.LengthSquared() < 1e-12f) {
        // forward is parallel to up; any perpendicular right axis will do.
        r = Vector3::Forward().Cross(f).Normalized();
        if (r.LengthSquared() < 1e-12f) {
            r = {1.0f, 0.0f, 0.0f};
        }
    }
    const Vector3 u = f.Cross(r);

    // Basis columns (r, u, f) -> quaternion.
    const float m00 = r.x, m01 = u.x, m02 = f.x;
    const float m10 = r.y, m11 = u.y, m12 = f.y;
    const float m20 = r.z, m21 = u.z, m22 = f.z;
    const float trace = m00 + m11 + m22;

    Quaternion q;
    if (trace > 0.0f) {
        const float s = std::sqrt(trace + 1.0f) * 2.0f;
        q = {0.25f * s, (m21 - m12) / s, (m02 - m20) / s, (m10 - m01) / s};
    } else if (m00 > m11 && m00 > m22) {
        const float s = std::sqrt(1.0f + m00 - m11 - m22) * 2.0f;
        q = {(m21 - m12) / s, 0.25f * s, (m01 + m10) / s, (m02 + m20) / s};
    } else if (m11 > m22) {
        const float s = std::sqrt(1.0f + m11 - m00 - m22) * 2.0f;
        q = {(m02 - m20) / s, (m01 + m10) / s, 0.25f * s, (m12 + m21) / s};
    } else {
        const float s = std::sqrt(1.0f + m22 - m00 - m11) * 2.0f;
        q = {(m10 - m01) / s, (m02 + m20) / s, (m12 + m21) / s, 0.25f * s};
    }
    return q.Normalized();
}

inline Quaternion Quaternion::Slerp(const Quaternion& a, const Quaternion& b, float t) noexcept {
    t = Clamp01(t);
    Quaternion end = b;
    float cosTheta = a.Dot(b);
    if (cosTheta < 0.0f) {
        end = {-b.w, -b.x, -b.y, -b.z};
        cosTheta = -cosTheta;
    }

    if (cosTheta > 0.9995f) {
        return Quaternion{Lerp(a.w, end.w, t), Lerp(a.x, end.x, t), Lerp(a.y, end.y, t),
                          Lerp(a.z, end.z, t)}
            .Normalized();
    }

    const float theta = std::acos(std::min(cosTheta, 1.0f));
    const float sinTheta = std::sin(theta);
    const float wa = std::sin((1.0f - t) * theta) / sinTheta;
    const float wb = std::sin(t * theta) / sinTheta;
    return {wa * a.w + wb * end.w, wa * a.x + wb * end.x, wa * a.y + wb * end.y,
            wa * a.z + wb * end.z};
}

/// Axis-aligned box given by center and half-size.
struct Bounds {
    Vector3 center;
    Vector3 extents;

    constexpr Bounds() = default;
    constexpr Bounds(const Vector3& center, const Vector3& size)
        : center(center), extents(size * 0.5f) {}

    [[nodiscard]] constexpr Vector3 Min() const noexcept { return center - extents; }
    [[nodiscard]] constexpr Vector3 Max() const noexcept { return center + extents; }
    [[nodiscard]] constexpr Vector3 Size() const noexcept { return extents * 2.0f; }

    /// Inclusive on every face.
    [[nodiscard]] constexpr bool Contains(const Vector3& p) const noexcept {
        const auto lo = Min();
        const auto hi = Max();
        return p.x >= lo.x && p.x <= hi.x && p.y >= lo.y && p.y <= hi.y && p.z >= lo.z &&
               p.z <= hi.z;
    }

    /// True when the boxes overlap or touch.
    [[nodiscard]] constexpr bool Intersects(const Bounds& other) const noexcept {
        const auto aLo = Min();
        const auto aHi = Max();
        const auto bLo = other.Min();
        const auto bHi = other.Max();
        return aLo.x <= bHi.x && aHi.x >= bLo.x && aLo.y <= bHi.y && aHi.y >= bLo.y &&
               aLo.z <= bHi.z && aHi.z >= bLo.z;
    }
};

}  // namespace gpk::game
