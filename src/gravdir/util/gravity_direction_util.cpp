#include "gravdir/util/gravity_direction_util.hpp"
#include "gravdir/context/settings.hpp"
#include "gravdir/config/config.h"
#include <entt/entity/registry.hpp>
#include <spdlog/spdlog.h>

namespace gravdir {

static void warn_if_not_finite(const vector &direction, entt::entity entity) {
    if (is_finite(direction)) {
        return;
    }

    spdlog::warn("gravdir: non-finite gravity direction assigned to entity {}",
                 entt::to_integral(entity));
}

vector get_default_gravity_direction(const entt::registry &registry) {
    GRAVDIR_ASSERT(registry.ctx().contains<settings>());
    return registry.ctx().get<settings>().default_gravity_direction;
}

void set_default_gravity_direction(entt::registry &registry, const vector &direction) {
    GRAVDIR_ASSERT(registry.ctx().contains<settings>());
    registry.ctx().get<settings>().default_gravity_direction = direction;

    if (!is_finite(direction)) {
        spdlog::warn("gravdir: non-finite default gravity direction");
    }

    auto view = registry.view<gravity_direction>();

    for (auto entity : view) {
        registry.replace<gravity_direction>(entity, direction);
    }
}

gravity_direction & assign_gravity_direction(entt::registry &registry, entt::entity entity) {
    return set_gravity_direction(registry, entity, get_default_gravity_direction(registry));
}

gravity_direction & set_gravity_direction(entt::registry &registry, entt::entity entity,
                                          const vector &direction) {
    warn_if_not_finite(direction, entity);
    return registry.emplace_or_replace<gravity_direction>(entity, direction);
}

}
