#pragma once
#include <ecs/ecs.hpp>
#include "../actor_types.hpp"
#include <array>
#include <random>

struct EnemySpawners {
    std::array<float, ENEMY_TYPE_COUNT> timers{};
    std::mt19937 rng{7331};
};

// Timed enemy waves from the current LevelDef, plus one Fizzer per
// BonusSpawnEvent. Enemies enter at the arena edge heading straight for the
// player's position at spawn time. Runs in the Encounter phase after
// LifecycleSystem (it consumes this frame's BonusSpawnEvents) and only while
// Playing with spawning enabled.
class EnemySpawnerSystem {
public:
    static void Update(ecs::World& world, float dt);

    static void reset_for_new_level(EnemySpawners& spawners);
};
