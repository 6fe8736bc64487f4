#ifndef GRAVDIR_UTIL_GRAVITY_DIRECTION_UTIL_HPP
#define GRAVDIR_UTIL_GRAVITY_DIRECTION_UTIL_HPP

#include <entt/entity/fwd.hpp>
#include "gravdir/math/vector.hpp"
#include "gravdir/comp/gravity_direction.hpp"

namespace gravdir {

/**
 * @brief Get the default gravity direction.
 * This value is assigned to entities by `assign_gravity_direction`.
 * @param registry Data source. Must have been attached.
 * @return Default gravity direction.
 */
vector get_default_gravity_direction(const entt::registry &registry);

/**
 * @brief Changes the default gravity direction and replaces the gravity
 * direction of every entity that has one.
 * @param registry Data source. Must have been attached.
 * @param direction The new default gravity direction.
 */
void set_default_gravity_direction(entt::registry &registry, const vector &direction);

/**
 * @brief Assigns the default gravity direction to an entity, replacing its
 * current gravity direction if it has one.
 * @param registry Data source. Must have been attached.
 * @param entity The entity.
 * @return The entity's gravity direction.
 */
gravity_direction & assign_gravity_direction(entt::registry &registry, entt::entity entity);

/**
 * @brief Assigns a gravity direction to an entity, replacing its current
 * gravity direction if it has one. The value is stored as given.
 * @param registry Data source.
 * @param entity The entity.
 * @param direction The new gravity direction.
 * @return The entity's gravity direction.
 */
gravity_direction & set_gravity_direction(entt::registry &registry, entt::entity entity,
                                          const vector &direction);

}

#endif // GRAVDIR_UTIL_GRAVITY_DIRECTION_UTIL_HPP
