#ifndef GRAVDIR_MATH_VECTOR2_3_UTIL_HPP
#define GRAVDIR_MATH_VECTOR2_3_UTIL_HPP

#include "gravdir/math/vector2.hpp"
#include "gravdir/math/vector3.hpp"

namespace gravdir {

// Drops the z coordinate.
constexpr vector2 to_vector2_xy(const vector3 &v) noexcept {
    return {v.x, v.y};
}

// Embeds a `vector2` in the xy plane.
constexpr vector3 to_vector3_xy(const vector2 &v) noexcept {
    return {v.x, v.y, 0};
}

}

#endif // GRAVDIR_MATH_VECTOR2_3_UTIL_HPP
