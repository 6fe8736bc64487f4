#ifndef GRAVDIR_MATH_CONSTANTS_HPP
#define GRAVDIR_MATH_CONSTANTS_HPP

#include "gravdir/math/vector.hpp"

namespace gravdir {

inline constexpr auto earth_gravity_magnitude = scalar(9.8);
inline constexpr auto moon_gravity_magnitude = scalar(1.625);

#if defined(GRAVDIR_2D)
inline constexpr vector gravity_earth = vector2_y * -earth_gravity_magnitude;
inline constexpr vector gravity_moon  = vector2_y * -moon_gravity_magnitude;
#else
inline constexpr vector gravity_earth = vector3_y * -earth_gravity_magnitude;
inline constexpr vector gravity_moon  = vector3_y * -moon_gravity_magnitude;
#endif

}

#endif // GRAVDIR_MATH_CONSTANTS_HPP
