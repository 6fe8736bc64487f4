#ifndef GRAVDIR_MATH_VECTOR2_HPP
#define GRAVDIR_MATH_VECTOR2_HPP

#include <cmath>
#include <cstddef>
#include "gravdir/math/scalar.hpp"
#include "gravdir/config/config.h"

namespace gravdir {

struct vector2 {
    scalar x, y;

    static constexpr size_t dimension = 2;

    scalar& operator[](size_t i) noexcept {
        GRAVDIR_ASSERT(i < 2);
        return (&x)[i];
    }

    scalar operator[](size_t i) const noexcept {
        GRAVDIR_ASSERT(i < 2);
        return (&x)[i];
    }
};

// Zero vector.
inline constexpr vector2 vector2_zero {0, 0};

// Vector with all elements set to 1.
inline constexpr vector2 vector2_one {1, 1};

// Unit vector pointing in the x direction.
inline constexpr vector2 vector2_x {1, 0};

// Unit vector pointing in the y direction.
inline constexpr vector2 vector2_y {0, 1};

// Add two vectors.
constexpr vector2 operator+(const vector2 &v, const vector2 &w) noexcept {
    return {v.x + w.x, v.y + w.y};
}

// Add a vector into another vector.
constexpr vector2& operator+=(vector2 &v, const vector2 &w) noexcept {
    v.x += w.x;
    v.y += w.y;
    return v;
}

// Subtract two vectors.
constexpr vector2 operator-(const vector2 &v, const vector2 &w) noexcept {
    return {v.x - w.x, v.y - w.y};
}

// Subtract a vector from another vector.
constexpr vector2& operator-=(vector2 &v, const vector2 &w) noexcept {
    v.x -= w.x;
    v.y -= w.y;
    return v;
}

// Negation of a vector.
constexpr vector2 operator-(const vector2 &v) noexcept {
    return {-v.x, -v.y};
}

// Multiply vector by scalar.
constexpr vector2 operator*(const vector2& v, scalar s) noexcept {
    return {v.x * s, v.y * s};
}

// Multiply scalar by vector.
constexpr vector2 operator*(scalar s, const vector2 &v) noexcept {
    return {s * v.x, s * v.y};
}

// Divide vector by scalar.
constexpr vector2 operator/(const vector2 &v, scalar s) noexcept {
    return {v.x / s, v.y / s};
}

// Scale a vector.
constexpr vector2& operator*=(vector2 &v, scalar s) noexcept {
    v.x *= s;
    v.y *= s;
    return v;
}

// Exact component-wise equality. NaN components never compare equal.
constexpr bool operator==(const vector2 &v, const vector2 &w) noexcept {
    return v.x == w.x && v.y == w.y;
}

constexpr bool operator!=(const vector2 &v, const vector2 &w) noexcept {
    return !(v == w);
}

// Dot product between vectors.
constexpr scalar dot(const vector2 &v, const vector2 &w) noexcept {
    return v.x * w.x + v.y * w.y;
}

// Square length of a vector.
constexpr scalar length_sqr(const vector2 &v) noexcept {
    return dot(v, v);
}

// Length of a vector.
inline scalar length(const vector2 &v) noexcept {
    return std::sqrt(length_sqr(v));
}

// Normalized vector (unit length). Asserts if the vector's length is zero.
inline vector2 normalize(const vector2 &v) noexcept {
    auto l = length(v);
    GRAVDIR_ASSERT(l > GRAVDIR_EPSILON);
    return v / l;
}

// True if no element is infinite or NaN.
inline bool is_finite(const vector2 &v) noexcept {
    return std::isfinite(v.x) && std::isfinite(v.y);
}

}

#endif // GRAVDIR_MATH_VECTOR2_HPP
