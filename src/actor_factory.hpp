#pragma once
#include "components.hpp"
#include "config.hpp"
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// ActorFactory — the one place actor entities are assembled.
//
// Every actor gets LocalTransform + CircleCollider + its actor component +
// ArenaTag. Stats come from BalanceConfig so data files and code agree.
// Must not be called from inside a world.each() over the same components.
// ---------------------------------------------------------------------------

class ActorFactory {
public:
    static ecs::Entity spawn_player(ecs::World& world, const BalanceConfig& cfg,
                                    ecs::Vec3 position);

    static ecs::Entity spawn_enemy(ecs::World& world, const BalanceConfig& cfg,
                                   EnemyType type, ecs::Vec3 position,
                                   ecs::Vec3 velocity = {0, 0, 0});

    static ecs::Entity spawn_projectile(ecs::World& world, ProjectileOwner owner,
                                        ecs::Vec3 position, ecs::Vec3 velocity,
                                        int damage, float radius, float lifetime);

    static ecs::Entity spawn_pickup(ecs::World& world, const BalanceConfig& cfg,
                                    PickupKind kind, ecs::Vec3 position);
};
