#pragma once

/// @file math_types.hpp
/// @brief Lightweight math types shared by the AI and navigation layers.
///
/// Vector3, Quaternion, Matrix4 and Color are small value types with the
/// handful of operations the core needs: steering math, joint transforms
/// for effects, and debug line colours. Angles in the public API are in
/// degrees; heading 0 faces +Z and positive headings turn toward +X.

#include <array>
#include <cmath>
#include <cstdint>
#include <numbers>

namespace dai {

inline constexpr float kDegreesToRadians = std::numbers::pi_v<float> / 180.0f;
inline constexpr float kRadiansToDegrees = 180.0f / std::numbers::pi_v<float>;

constexpr float ToRadians(float degrees) noexcept { return degrees * kDegreesToRadians; }
constexpr float ToDegrees(float radians) noexcept { return radians * kRadiansToDegrees; }

/// Wrap an angle in degrees into (-180, 180].
inline float NormalizeDegrees(float degrees) noexcept {
    float wrapped = std::fmod(degrees, 360.0f);
    if (wrapped <= -180.0f) {
        wrapped += 360.0f;
    } else if (wrapped > 180.0f) {
        wrapped -= 360.0f;
    }
    return wrapped;
}

/// Three-component floating-point vector (world units, Y up).
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

    constexpr Vector3& operator+=(const Vector3& rhs) noexcept {
        x += rhs.x;
        y += rhs.y;
        z += rhs.z;
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

    /// Distance to another point.
    [[nodiscard]] float DistanceTo(const Vector3& rhs) const noexcept {
        return (*this - rhs).Length();
    }

    /// Return a normalized copy, or zero vector if length is near zero.
    [[nodiscard]] Vector3 Normalized() const noexcept {
        const float len = Length();
        if (len < 1e-6f) {
            return {};
        }
        return {x / len, y / len, z / len};
    }

    /// Projection onto the horizontal (XZ) plane.
    [[nodiscard]] constexpr Vector3 Flattened() const noexcept { return {x, 0.0f, z}; }

    [[nodiscard]] static constexpr Vector3 Zero() noexcept { return {}; }
    [[nodiscard]] static constexpr Vector3 Up() noexcept { return {0.0f, 1.0f, 0.0f}; }

    constexpr auto operator<=>(const Vector3&) const = default;
};

constexpr Vector3 operator*(float scalar, const Vector3& v) noexcept {
    return v * scalar;
}

/// Rotation quaternion stored as (w, x, y, z); defaults to identity.
struct Quaternion {
    float w = 1.0f;
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    constexpr Quaternion() = default;
    constexpr Quaternion(float w, float x, float y, float z) : w(w), x(x), y(y), z(z) {}

    [[nodiscard]] static constexpr Quaternion Identity() noexcept { return {}; }

    /// Rotation of @p degrees about a unit @p axis (right-handed).
    [[nodiscard]] static Quaternion FromAxisAngle(const Vector3& axis, float degrees) noexcept {
        const float half = ToRadians(degrees) * 0.5f;
        const float s = std::sin(half);
        return {std::cos(half), axis.x * s, axis.y * s, axis.z * s};
    }

    [[nodiscard]] static Quaternion FromAngleX(float degrees) noexcept {
        return FromAxisAngle({1.0f, 0.0f, 0.0f}, degrees);
    }

    /// Yaw rotation; FromAngleY(h) turns +Z into the heading-h forward vector.
    [[nodiscard]] static Quaternion FromAngleY(float degrees) noexcept {
        return FromAxisAngle({0.0f, 1.0f, 0.0f}, degrees);
    }

    constexpr Quaternion operator*(const Quaternion& rhs) const noexcept {
        return {w * rhs.w - x * rhs.x - y * rhs.y - z * rhs.z,
                w * rhs.x + x * rhs.w + y * rhs.z - z * rhs.y,
                w * rhs.y - x * rhs.z + y * rhs.w + z * rhs.x,
                w * rhs.z + x * rhs.y - y * rhs.x + z * rhs.w};
    }

    /// Rotate a vector by this (unit) quaternion.
    [[nodiscard]] constexpr Vector3 Rotate(const Vector3& v) const noexcept {
        const Vector3 u{x, y, z};
        const Vector3 t = u.Cross(v) * 2.0f;
        return v + t * w + u.Cross(t);
    }

    constexpr auto operator<=>(const Quaternion&) const = default;
};

/// 4x4 affine transform, column-major (m[column * 4 + row]).
struct Matrix4 {
    std::array<float, 16> m{1.0f, 0.0f, 0.0f, 0.0f,
                            0.0f, 1.0f, 0.0f, 0.0f,
                            0.0f, 0.0f, 1.0f, 0.0f,
                            0.0f, 0.0f, 0.0f, 1.0f};

    [[nodiscard]] static constexpr Matrix4 Identity() noexcept { return {}; }

    [[nodiscard]] static constexpr Matrix4 FromTranslation(const Vector3& t) noexcept {
        Matrix4 out;
        out.m[12] = t.x;
        out.m[13] = t.y;
        out.m[14] = t.z;
        return out;
    }

    [[nodiscard]] static constexpr Matrix4 FromRotation(const Quaternion& q) noexcept {
        const float xx = q.x * q.x;
        const float yy = q.y * q.y;
        const float zz = q.z * q.z;
        const float xy = q.x * q.y;
        const float xz = q.x * q.z;
        const float yz = q.y * q.z;
        const float wx = q.w * q.x;
        const float wy = q.w * q.y;
        const float wz = q.w * q.z;

        Matrix4 out;
        out.m[0] = 1.0f - 2.0f * (yy + zz);
        out.m[1] = 2.0f * (xy + wz);
        out.m[2] = 2.0f * (xz - wy);
        out.m[4] = 2.0f * (xy - wz);
        out.m[5] = 1.0f - 2.0f * (xx + zz);
        out.m[6] = 2.0f * (yz + wx);
        out.m[8] = 2.0f * (xz + wy);
        out.m[9] = 2.0f * (yz - wx);
        out.m[10] = 1.0f - 2.0f * (xx + yy);
        return out;
    }

    /// Translation along the local X axis; the turret cap slides on it.
    [[nodiscard]] static constexpr Matrix4 TranslateX(float distance) noexcept {
        return FromTranslation({distance, 0.0f, 0.0f});
    }

    /// Rotation about the local X axis in degrees.
    [[nodiscard]] static Matrix4 RotateX(float degrees) noexcept {
        return FromRotation(Quaternion::FromAngleX(degrees));
    }

    [[nodiscard]] constexpr float At(int row, int column) const noexcept {
        return m[static_cast<std::size_t>(column * 4 + row)];
    }

    [[nodiscard]] constexpr Vector3 Translation() const noexcept {
        return {m[12], m[13], m[14]};
    }

    [[nodiscard]] constexpr Vector3 TransformPoint(const Vector3& p) const noexcept {
        return {m[0] * p.x + m[4] * p.y + m[8] * p.z + m[12],
                m[1] * p.x + m[5] * p.y + m[9] * p.z + m[13],
                m[2] * p.x + m[6] * p.y + m[10] * p.z + m[14]};
    }

    /// Element-wise comparison with tolerance.
    [[nodiscard]] bool ApproxEquals(const Matrix4& rhs, float epsilon = 1e-5f) const noexcept {
        for (std::size_t i = 0; i < m.size(); ++i) {
            if (std::fabs(m[i] - rhs.m[i]) > epsilon) {
                return false;
            }
        }
        return true;
    }

    constexpr auto operator<=>(const Matrix4&) const = default;
};

/// RGBA colour with components in [0, 1].
struct Color {
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
    float a = 1.0f;

    constexpr Color() = default;
    constexpr Color(float r, float g, float b, float a = 1.0f) : r(r), g(g), b(b), a(a) {}

    constexpr auto operator<=>(const Color&) const = default;
};

}  // namespace dai
