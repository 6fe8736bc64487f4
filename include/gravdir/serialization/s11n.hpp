#ifndef GRAVDIR_SERIALIZATION_S11N_HPP
#define GRAVDIR_SERIALIZATION_S11N_HPP

#include "gravdir/build_settings.h"

#ifndef GRAVDIR_SERIALIZATION
#error "gravdir was configured without serialization support (GRAVDIR_SERIALIZATION=OFF)"
#endif

#include "gravdir/serialization/memory_archive.hpp"
#include "gravdir/serialization/math_s11n.hpp"
#include "gravdir/serialization/comp/gravity_direction_s11n.hpp"

#endif // GRAVDIR_SERIALIZATION_S11N_HPP
