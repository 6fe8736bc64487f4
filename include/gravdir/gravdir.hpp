#ifndef GRAVDIR_GRAVDIR_HPP
#define GRAVDIR_GRAVDIR_HPP

#include "gravdir/build_settings.h"
#include "gravdir/math/scalar.hpp"
#include "gravdir/math/vector2.hpp"
#include "gravdir/math/vector3.hpp"
#include "gravdir/math/vector2_3_util.hpp"
#include "gravdir/math/vector.hpp"
#include "gravdir/math/constants.hpp"
#include "gravdir/comp/gravity_direction.hpp"
#include "gravdir/context/settings.hpp"
#include "gravdir/util/gravity_direction_util.hpp"
#ifdef GRAVDIR_SERIALIZATION
#include "gravdir/serialization/s11n.hpp"
#endif
#include <entt/entity/fwd.hpp>

namespace gravdir {

/**
 * @brief Initialization configuration.
 */
struct init_config {
    vector default_gravity_direction {gravity_earth};
};

/**
 * @brief Attaches gravdir to an EnTT registry.
 * @param registry The registry to be setup.
 * @param config Initial settings.
 */
void attach(entt::registry &registry, const init_config &config = {});

/**
 * @brief Detaches gravdir from an EnTT registry.
 * @remark Existing `gravity_direction` components are kept.
 * @param registry The registry to be freed from gravdir's context.
 */
void detach(entt::registry &registry);

/**
 * @brief Whether `attach` was called on this registry and not yet detached.
 */
bool is_attached(const entt::registry &registry);

}

#endif // GRAVDIR_GRAVDIR_HPP
