#include <gravdir/gravdir.hpp>
#include <entt/entt.hpp>
#include <cstdio>

void print_entities(entt::registry& registry) {
    printf("================================\n");

    auto view = registry.view<const gravdir::gravity_direction>();
    view.each([](auto ent, const auto &g) {
        printf("gravity (%d):", entt::to_integral(ent));

        for (size_t i = 0; i < gravdir::vector::dimension; ++i) {
            printf(" %.3f", g[i]);
        }

        printf("\n");
    });
}

int main(int argc, char** argv) {
    entt::registry registry;
    gravdir::attach(registry);

    auto ball = registry.create();
    gravdir::assign_gravity_direction(registry, ball);

    auto balloon = registry.create();
    auto &g = gravdir::set_gravity_direction(registry, balloon, -gravdir::gravity_earth * gravdir::scalar(0.1));
    g.set_x(0.5);
    print_entities(registry);

    gravdir::set_default_gravity_direction(registry, gravdir::gravity_moon);
    print_entities(registry);

    gravdir::detach(registry);

    return 0;
}
