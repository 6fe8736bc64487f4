#ifndef GRAVDIR_MATH_VECTOR_HPP
#define GRAVDIR_MATH_VECTOR_HPP

#include "gravdir/build_settings.h"
#include "gravdir/math/vector2.hpp"
#include "gravdir/math/vector3.hpp"

namespace gravdir {

// The vector type of this build. Dimensionality is fixed at configure time.
#if defined(GRAVDIR_2D)
using vector = vector2;
inline constexpr vector vector_zero = vector2_zero;
#else
using vector = vector3;
inline constexpr vector vector_zero = vector3_zero;
#endif

}

#endif // GRAVDIR_MATH_VECTOR_HPP
