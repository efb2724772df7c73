#pragma once
#include <ecs/ecs.hpp>
#include "../actor_types.hpp"
#include "../config.hpp"
#include <array>
#include <random>

// Per-kind spawn bookkeeping, stored as the PickupSpawners World resource.
struct PickupSpawnerState {
    float since_last    = 0.0f;
    float next_interval = 0.0f;
    int   spawned_this_level = 0;
};

struct PickupSpawners {
    std::array<PickupSpawnerState, PICKUP_KIND_COUNT> kinds{};
    std::mt19937 rng{1337};
};

// One spawner per pickup kind: a per-level cap, a random interval in
// [min, max] drawn once per spawn, and (med-packs) a health gate. Runs in the
// Logic phase only while Playing with spawning enabled.
class PickupSpawnerSystem {
public:
    static void Update(ecs::World& world, float dt);

    // Zero the per-level counts and restart every interval.
    static void reset_for_new_level(PickupSpawners& spawners, const PickupConfig& cfg);

    // True when kind `k` may spawn now.
    static bool should_spawn(const PickupSpawnerState& st, const PickupSpawnConfig& cfg,
                             float health_fraction);

    // Uniform point in the spawn disc, retried to keep clear of the player.
    // Falls back to the last candidate when every attempt lands too close.
    static ecs::Vec3 pick_position(std::mt19937& rng, const PickupConfig& cfg,
                                   const ecs::Vec3& player_pos);
};
