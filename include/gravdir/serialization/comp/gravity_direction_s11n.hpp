#ifndef GRAVDIR_SERIALIZATION_COMP_GRAVITY_DIRECTION_S11N_HPP
#define GRAVDIR_SERIALIZATION_COMP_GRAVITY_DIRECTION_S11N_HPP

#include "gravdir/comp/gravity_direction.hpp"
#include "gravdir/serialization/math_s11n.hpp"

namespace gravdir {

template<typename Archive, typename Vector>
void serialize(Archive &archive, basic_gravity_direction<Vector> &g) {
    serialize(archive, g.value());
}

}

#endif // GRAVDIR_SERIALIZATION_COMP_GRAVITY_DIRECTION_S11N_HPP
