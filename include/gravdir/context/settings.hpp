#ifndef GRAVDIR_CONTEXT_SETTINGS_HPP
#define GRAVDIR_CONTEXT_SETTINGS_HPP

#include "gravdir/math/vector.hpp"
#include "gravdir/math/constants.hpp"

namespace gravdir {

/**
 * @brief Registry context object created by `gravdir::attach`.
 */
struct settings {
    // Assigned to entities by `assign_gravity_direction`.
    vector default_gravity_direction {gravity_earth};
};

}

#endif // GRAVDIR_CONTEXT_SETTINGS_HPP
