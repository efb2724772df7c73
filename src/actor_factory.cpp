#include "actor_factory.hpp"
#include <ecs/modules/transform.hpp>

using namespace ecs;

static void add_body(World& world, Entity e, Vec3 position, float radius) {
    world.add(e, LocalTransform{position, Quat{0, 0, 0, 1}, Vec3{1, 1, 1}});
    world.add(e, CircleCollider{radius});
    world.add(e, ArenaTag{});
}

Entity ActorFactory::spawn_player(World& world, const BalanceConfig& cfg, Vec3 position) {
    auto e = world.create();
    add_body(world, e, position, cfg.player.radius);

    Player p;
    p.health                = cfg.player.max_health;
    p.max_health            = cfg.player.max_health;
    p.xp_to_next            = cfg.player.xp_to_first_level;
    p.max_power_level       = cfg.player.max_power_level;
    p.max_speed_level       = cfg.player.max_speed_level;
    p.invulnerable_duration = cfg.player.invulnerable_duration;
    world.add(e, p);
    world.add(e, PlayerInput{});
    world.add(e, Velocity{});
    return e;
}

Entity ActorFactory::spawn_enemy(World& world, const BalanceConfig& cfg, EnemyType type,
                                 Vec3 position, Vec3 velocity) {
    const EnemyStats& stats = cfg.enemies[index_of(type)];

    auto e = world.create();
    add_body(world, e, position, stats.radius);

    Enemy en;
    en.type       = type;
    en.health     = stats.health;
    en.damage     = stats.damage;
    en.xp_value   = stats.xp_value;
    en.fire_timer = stats.fire_interval;
    world.add(e, en);
    world.add(e, Velocity{velocity});

    if (type == EnemyType::UFO) {
        LaserBeam beam;
        beam.length    = cfg.laser_length;
        beam.thickness = cfg.laser_thickness;
        beam.damage    = cfg.laser_damage;
        world.add(e, beam);
    }
    return e;
}

Entity ActorFactory::spawn_projectile(World& world, ProjectileOwner owner, Vec3 position,
                                      Vec3 velocity, int damage, float radius, float lifetime) {
    auto e = world.create();
    add_body(world, e, position, radius);
    world.add(e, Projectile{owner, true, damage, lifetime});
    world.add(e, Velocity{velocity});
    return e;
}

Entity ActorFactory::spawn_pickup(World& world, const BalanceConfig& cfg, PickupKind kind,
                                  Vec3 position) {
    auto e = world.create();
    add_body(world, e, position, cfg.pickups.radius);
    Pickup p;
    p.kind        = kind;
    p.heal_amount = (kind == PickupKind::MedPack) ? cfg.pickups.med_pack_heal : 0;
    world.add(e, p);
    return e;
}
