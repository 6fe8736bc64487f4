#ifndef GRAVDIR_SERIALIZATION_MATH_S11N_HPP
#define GRAVDIR_SERIALIZATION_MATH_S11N_HPP

#include "gravdir/math/vector2.hpp"
#include "gravdir/math/vector3.hpp"

namespace gravdir {

template<typename Archive>
void serialize(Archive &archive, vector2 &v) {
    archive(v.x, v.y);
}

template<typename Archive>
void serialize(Archive &archive, vector3 &v) {
    archive(v.x, v.y, v.z);
}

}

#endif // GRAVDIR_SERIALIZATION_MATH_S11N_HPP
