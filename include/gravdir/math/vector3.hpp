#ifndef GRAVDIR_MATH_VECTOR3_HPP
#define GRAVDIR_MATH_VECTOR3_HPP

#include <cmath>
#include <cstddef>
#include "gravdir/math/scalar.hpp"
#include "gravdir/config/config.h"

namespace gravdir {

struct vector3 {
    scalar x, y, z;

    static constexpr size_t dimension = 3;

    constexpr scalar& operator[](size_t i) noexcept {
        GRAVDIR_ASSERT(i < 3);
        return (&x)[i];
    }

    constexpr scalar operator[](size_t i) const noexcept {
        GRAVDIR_ASSERT(i < 3);
        return (&x)[i];
    }
};

// Zero vector.
inline constexpr vector3 vector3_zero {0, 0, 0};

// Vector with all elements set to 1.
inline constexpr vector3 vector3_one {1, 1, 1};

// Unit vector pointing in the x direction.
inline constexpr vector3 vector3_x {1, 0, 0};

// Unit vector pointing in the y direction.
inline constexpr vector3 vector3_y {0, 1, 0};

// Unit vector pointing in the z direction.
inline constexpr vector3 vector3_z {0, 0, 1};

// Add two vectors.
constexpr vector3 operator+(const vector3 &v, const vector3 &w) noexcept {
    return {v.x + w.x, v.y + w.y, v.z + w.z};
}

// Add a vector into another vector.
constexpr vector3& operator+=(vector3 &v, const vector3 &w) noexcept {
    v.x += w.x;
    v.y += w.y;
    v.z += w.z;
    return v;
}

// Subtract two vectors.
constexpr vector3 operator-(const vector3 &v, const vector3 &w) noexcept {
    return {v.x - w.x, v.y - w.y, v.z - w.z};
}

// Subtract a vector from another vector.
constexpr vector3& operator-=(vector3 &v, const vector3 &w) noexcept {
    v.x -= w.x;
    v.y -= w.y;
    v.z -= w.z;
    return v;
}

// Negation of a vector.
constexpr vector3 operator-(const vector3 &v) noexcept {
    return {-v.x, -v.y, -v.z};
}

// Multiply vector by scalar.
constexpr vector3 operator*(const vector3& v, scalar s) noexcept {
    return {v.x * s, v.y * s, v.z * s};
}

// Multiply scalar by vector.
constexpr vector3 operator*(scalar s, const vector3 &v) noexcept {
    return {s * v.x, s * v.y, s * v.z};
}

// Divide vector by scalar.
constexpr vector3 operator/(const vector3 &v, scalar s) noexcept {
    return {v.x / s, v.y / s, v.z / s};
}

// Scale a vector.
constexpr vector3& operator*=(vector3 &v, scalar s) noexcept {
    v.x *= s;
    v.y *= s;
    v.z *= s;
    return v;
}

// Check if two vectors are equal.
constexpr bool operator==(const vector3 &v, const vector3 &w) noexcept {
    return v.x == w.x && v.y == w.y && v.z == w.z;
}

// Check if two vectors are different.
constexpr bool operator!=(const vector3 &v, const vector3 &w) noexcept {
    return !(v == w);
}

// Dot product between vectors.
constexpr scalar dot(const vector3 &v, const vector3 &w) noexcept {
    return v.x * w.x + v.y * w.y + v.z * w.z;
}

// Cross product between two vectors.
constexpr vector3 cross(const vector3 &v, const vector3 &w) noexcept {
    return {v.y * w.z - v.z * w.y,
            v.z * w.x - v.x * w.z,
            v.x * w.y - v.y * w.x};
}

// Square length of a vector.
constexpr scalar length_sqr(const vector3 &v) noexcept {
    return dot(v, v);
}

// Length of a vector.
inline scalar length(const vector3 &v) noexcept {
    return std::sqrt(length_sqr(v));
}

// Normalized vector (unit length). Asserts if the vector's length is zero.
inline vector3 normalize(const vector3 &v) noexcept {
    auto l = length(v);
    GRAVDIR_ASSERT(l > GRAVDIR_EPSILON);
    return v / l;
}

// True if no element is infinite or NaN.
inline bool is_finite(const vector3 &v) noexcept {
    return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

}

#endif // GRAVDIR_MATH_VECTOR3_HPP
