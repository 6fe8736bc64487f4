#include "gravdir/gravdir.hpp"
#include "gravdir/context/settings.hpp"
#include <entt/entity/registry.hpp>
#include <spdlog/spdlog.h>

namespace gravdir {

void attach(entt::registry &registry, const init_config &config) {
    auto &settings = registry.ctx().emplace<gravdir::settings>();
    settings.default_gravity_direction = config.default_gravity_direction;

    spdlog::debug("gravdir: attached to registry ({} dimensions, default gravity direction length {})",
                  vector::dimension, length(settings.default_gravity_direction));
}

void detach(entt::registry &registry) {
    registry.ctx().erase<settings>();
    spdlog::debug("gravdir: detached from registry");
}

bool is_attached(const entt::registry &registry) {
    return registry.ctx().contains<settings>();
}

}
