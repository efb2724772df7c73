#include "pickup_spawner.hpp"
#include "../actor_factory.hpp"
#include "../components.hpp"
#include "../match_state.hpp"
#include "../math_util.hpp"
#include <algorithm>
#include <cmath>
#include <raylib.h>
#include <vector>

using namespace ecs;

static float roll_interval(std::mt19937& rng, const PickupSpawnConfig& cfg) {
    std::uniform_real_distribution<float> dist(cfg.interval_min, cfg.interval_max);
    return dist(rng);
}

void PickupSpawnerSystem::reset_for_new_level(PickupSpawners& spawners, const PickupConfig& cfg) {
    for (std::size_t i = 0; i < PICKUP_KIND_COUNT; ++i) {
        auto& st = spawners.kinds[i];
        st.since_last         = 0.0f;
        st.spawned_this_level = 0;
        st.next_interval      = roll_interval(spawners.rng, cfg.spawners[i]);
    }
}

bool PickupSpawnerSystem::should_spawn(const PickupSpawnerState& st, const PickupSpawnConfig& cfg,
                                       float health_fraction) {
    if (st.spawned_this_level >= cfg.spawns_per_level) return false;
    if (st.since_last < st.next_interval) return false;
    // A threshold of 1 or more means "no health gate".
    if (cfg.health_threshold < 1.0f && health_fraction >= cfg.health_threshold) return false;
    return true;
}

Vec3 PickupSpawnerSystem::pick_position(std::mt19937& rng, const PickupConfig& cfg,
                                        const Vec3& player_pos) {
    std::uniform_real_distribution<float> unit(0.0f, 1.0f);
    const float two_pi = 6.2831853f;

    Vec3 pos = {0, 0, 0};
    for (int attempt = 0; attempt < std::max(1, cfg.spawn_attempts); ++attempt) {
        const float r     = cfg.spawn_radius * std::sqrt(unit(rng));
        const float theta = unit(rng) * two_pi;
        pos = {r * std::cos(theta), r * std::sin(theta), 0};
        if (engine::math::distance_2d(pos, player_pos) >= cfg.min_player_distance) break;
    }
    return pos;
}

void PickupSpawnerSystem::Update(World& world, float dt) {
    if (!gameplay_active(world)) return;
    if (auto* flow = world.try_resource<GameFlow>(); flow && !flow->spawning_enabled) return;

    auto* spawners = world.try_resource<PickupSpawners>();
    auto* cfg      = world.try_resource<BalanceConfig>();
    if (!spawners || !cfg) return;

    Vec3  player_pos      = {0, 0, 0};
    float health_fraction = 1.0f;
    bool  have_player     = false;
    world.each<Player, LocalTransform>([&](Entity, Player& p, LocalTransform& t) {
        player_pos      = t.position;
        health_fraction = p.max_health > 0
            ? static_cast<float>(p.health) / static_cast<float>(p.max_health) : 1.0f;
        have_player     = p.alive;
    });
    if (!have_player) return;

    std::vector<std::pair<PickupKind, Vec3>> spawns;
    for (std::size_t i = 0; i < PICKUP_KIND_COUNT; ++i) {
        auto& st = spawners->kinds[i];
        const auto& kc = cfg->pickups.spawners[i];
        st.since_last += dt;
        if (!should_spawn(st, kc, health_fraction)) continue;

        st.since_last = 0.0f;
        st.spawned_this_level++;
        st.next_interval = roll_interval(spawners->rng, kc);
        spawns.emplace_back(static_cast<PickupKind>(i),
                            pick_position(spawners->rng, cfg->pickups, player_pos));
    }

    for (const auto& [kind, pos] : spawns) {
        ActorFactory::spawn_pickup(world, *cfg, kind, pos);
        TraceLog(LOG_DEBUG, "PICKUP: spawned %s at (%.1f, %.1f)", pickup_kind_name(kind), pos.x, pos.y);
    }
}
