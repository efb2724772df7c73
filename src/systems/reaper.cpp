#include "reaper.hpp"
#include "../components.hpp"
#include "../match_state.hpp"
#include <vector>

using namespace ecs;

void ReaperSystem::Update(World& world, float dt) {
    if (auto* flow = world.try_resource<GameFlow>(); flow && flow->paused) return;

    std::vector<Entity> doomed;

    world.each<Enemy>([&](Entity e, Enemy& en) {
        if (en.alive) return;
        en.death_timer -= dt;
        if (en.death_timer <= 0.0f) doomed.push_back(e);
    });
    world.each<Projectile>([&](Entity e, Projectile& p) {
        if (!p.alive) doomed.push_back(e);
    });
    world.each<Pickup>([&](Entity e, Pickup& p) {
        if (!p.alive) doomed.push_back(e);
    });

    for (auto e : doomed) world.destroy(e);
}
