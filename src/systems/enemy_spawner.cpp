#include "enemy_spawner.hpp"
#include "level.hpp"
#include "../actor_factory.hpp"
#include "../components.hpp"
#include "../events.hpp"
#include "../match_state.hpp"
#include <cmath>
#include <vector>

using namespace ecs;

static constexpr float EDGE_FRACTION = 0.95f;

void EnemySpawnerSystem::reset_for_new_level(EnemySpawners& spawners) {
    spawners.timers = {};
}

void EnemySpawnerSystem::Update(World& world, float dt) {
    if (!gameplay_active(world)) return;
    auto* flow = world.try_resource<GameFlow>();
    if (flow && !flow->spawning_enabled) return;

    auto* spawners = world.try_resource<EnemySpawners>();
    auto* cfg      = world.try_resource<BalanceConfig>();
    auto* progress = world.try_resource<LevelProgress>();
    if (!spawners || !cfg || !progress) return;

    Vec3 target = {0, 0, 0};
    world.each<Player, LocalTransform>([&](Entity, Player&, LocalTransform& t) { target = t.position; });

    std::vector<EnemyType> wave;

    const LevelDef& def = LevelSystem::current_def(*progress, *cfg);
    for (std::size_t i = 0; i < ENEMY_TYPE_COUNT; ++i) {
        const float interval = def.spawn_intervals[i];
        if (interval <= 0.0f) continue;
        spawners->timers[i] += dt;
        if (spawners->timers[i] >= interval) {
            spawners->timers[i] -= interval;
            wave.push_back(static_cast<EnemyType>(i));
        }
    }

    if (const auto* bonus = world.try_resource<Events<BonusSpawnEvent>>()) {
        for (std::size_t n = 0; n < bonus->size(); ++n) wave.push_back(EnemyType::Fizzer);
    }

    std::uniform_real_distribution<float> angle(0.0f, 6.2831853f);
    const float edge = cfg->arena_radius * EDGE_FRACTION;
    for (EnemyType type : wave) {
        const float a = angle(spawners->rng);
        const Vec3 pos = {edge * std::cos(a), edge * std::sin(a), 0};

        float dx = target.x - pos.x;
        float dy = target.y - pos.y;
        const float len = std::sqrt(dx * dx + dy * dy);
        if (len > 0.001f) { dx /= len; dy /= len; }
        const float speed = cfg->enemies[index_of(type)].speed;

        ActorFactory::spawn_enemy(world, *cfg, type, pos, Vec3{dx * speed, dy * speed, 0});
    }
}
