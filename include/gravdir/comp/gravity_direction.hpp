#ifndef GRAVDIR_COMP_GRAVITY_DIRECTION_HPP
#define GRAVDIR_COMP_GRAVITY_DIRECTION_HPP

#include <type_traits>
#include "gravdir/math/vector.hpp"

namespace gravdir {

/**
 * @brief Direction and magnitude of the gravitational acceleration acting
 * on an entity.
 *
 * The component is the vector itself and can be used wherever a `Vector` is
 * expected. The value is stored as given, it is not normalized and any
 * floating-point value is accepted, including infinities and NaN.
 *
 * Operations that only make sense for one dimensionality (e.g. `set_z`) are
 * only available in the matching instantiation.
 *
 * @tparam Vector Either `vector2` or `vector3`.
 */
template<typename Vector>
struct basic_gravity_direction : public Vector {
    static_assert(Vector::dimension == 2 || Vector::dimension == 3);

    using vector_type = Vector;

    // Zero vector.
    constexpr basic_gravity_direction() noexcept
        : Vector{}
    {}

    template<typename T, std::enable_if_t<std::is_convertible_v<const T &, Vector>, int> = 0>
    constexpr basic_gravity_direction(const T &v) noexcept
        : Vector(static_cast<const Vector &>(v))
    {}

    template<typename V = Vector, std::enable_if_t<V::dimension == 2, int> = 0>
    constexpr basic_gravity_direction(scalar x, scalar y) noexcept
        : Vector{x, y}
    {}

    template<typename V = Vector, std::enable_if_t<V::dimension == 3, int> = 0>
    constexpr basic_gravity_direction(scalar x, scalar y, scalar z) noexcept
        : Vector{x, y, z}
    {}

    template<typename V = Vector, std::enable_if_t<V::dimension == 2, int> = 0>
    static constexpr basic_gravity_direction from_xy(scalar x, scalar y) noexcept {
        return {x, y};
    }

    template<typename V = Vector, std::enable_if_t<V::dimension == 3, int> = 0>
    static constexpr basic_gravity_direction from_xyz(scalar x, scalar y, scalar z) noexcept {
        return {x, y, z};
    }

    /**
     * @brief Replaces the whole vector.
     * @param v Anything convertible to `Vector`.
     */
    template<typename T>
    constexpr std::enable_if_t<std::is_convertible_v<const T &, Vector>> set(const T &v) noexcept {
        value() = static_cast<const Vector &>(v);
    }

    template<typename V = Vector>
    constexpr std::enable_if_t<V::dimension == 2> set_xy(scalar x, scalar y) noexcept {
        this->x = x;
        this->y = y;
    }

    template<typename V = Vector>
    constexpr std::enable_if_t<V::dimension == 3> set_xyz(scalar x, scalar y, scalar z) noexcept {
        this->x = x;
        this->y = y;
        this->z = z;
    }

    constexpr void set_x(scalar x) noexcept {
        this->x = x;
    }

    constexpr void set_y(scalar y) noexcept {
        this->y = y;
    }

    template<typename V = Vector>
    constexpr std::enable_if_t<V::dimension == 3> set_z(scalar z) noexcept {
        this->z = z;
    }

    constexpr Vector & value() noexcept {
        return *this;
    }

    constexpr const Vector & value() const noexcept {
        return *this;
    }
};

/**
 * @brief Gravity direction component in the dimensionality of this build.
 */
using gravity_direction = basic_gravity_direction<vector>;

using gravity_direction2 = basic_gravity_direction<vector2>;
using gravity_direction3 = basic_gravity_direction<vector3>;

}

#endif // GRAVDIR_COMP_GRAVITY_DIRECTION_HPP
