#ifndef GRAVDIR_MATH_SCALAR_HPP
#define GRAVDIR_MATH_SCALAR_HPP

#include <float.h>
#include "gravdir/build_settings.h"

namespace gravdir {

#ifdef GRAVDIR_DOUBLE_PRECISION
using scalar = double;
#define GRAVDIR_EPSILON (DBL_EPSILON)
#else
using scalar = float;
#define GRAVDIR_EPSILON (FLT_EPSILON)
#endif

}

#endif // GRAVDIR_MATH_SCALAR_HPP
