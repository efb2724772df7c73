#pragma once
#include "actor_types.hpp"
#include <ecs/ecs.hpp>
#include <ecs/modules/transform.hpp>

// ---------------------------------------------------------------------------
// Actor geometry
//
// Every collidable entity carries LocalTransform (position, z = 0) and a
// CircleCollider. The alive flag lives on the actor component itself so that
// a dead actor can stay in the world for its death sequence.
// ---------------------------------------------------------------------------

struct CircleCollider {
    float radius = 0.5f;
};

struct Velocity {
    ecs::Vec3 linear = {0, 0, 0};
};

// ---------------------------------------------------------------------------
// Actors
// ---------------------------------------------------------------------------

struct Player {
    bool  alive      = true;
    int   health     = 130;
    int   max_health = 130;

    int   xp         = 0;
    int   xp_to_next = 10;
    int   level      = 1;

    int   power_level     = 0;
    int   max_power_level = 10;
    int   speed_level     = 0;
    int   max_speed_level = 20;

    bool  shield = false;

    bool  invulnerable_grant    = false;
    float invulnerable_timer    = 0.0f;
    float invulnerable_duration = 7.0f;

    float dash_timer    = 0.0f; // > 0 while dashing (i-frames)
    float dash_cooldown = 0.0f;
    ecs::Vec2 dash_dir  = {0, 1};

    float fire_cooldown = 0.0f;
    ecs::Vec2 aim       = {0, 1};
};

struct Enemy {
    EnemyType type   = EnemyType::DataMite;
    bool  alive      = true;
    int   health     = 1;
    int   damage     = 5;
    int   xp_value   = 1;
    bool  kill_tracked = false; // set once when the death has been accounted for
    float death_timer  = 0.0f;  // remaining corpse time once !alive
    float fire_timer   = 0.0f;
};

enum class ProjectileOwner : uint8_t { Player, Enemy };

struct Projectile {
    ProjectileOwner owner = ProjectileOwner::Player;
    bool  alive    = true;
    int   damage   = 12;
    float lifetime = 2.0f;
};

struct Pickup {
    PickupKind kind  = PickupKind::PowerUp;
    bool  alive      = true;
    int   heal_amount = 0;     // med-pack only
    bool  touching    = false; // player overlapped last frame (rejection feedback edge)
};

// Continuous beam attached to a UFO. Firing state cycles on charge/fire timers.
struct LaserBeam {
    bool      firing    = false;
    ecs::Vec3 direction = {1, 0, 0}; // unit vector, locked when firing starts
    float     length    = 20.0f;
    float     thickness = 0.2f;
    int       damage    = 10;
    float     cycle_timer   = 0.0f;
    float     charge_time   = 4.0f;
    float     fire_time     = 1.5f;
    bool      hit_this_burst = false; // one hit per firing burst
};

// ---------------------------------------------------------------------------
// Gameplay / Input
// ---------------------------------------------------------------------------

struct PlayerInput {
    ecs::Vec2 move_input = {0, 0}; // WASD / left stick
    ecs::Vec2 aim_input  = {0, 0}; // arrows / right stick; zero = keep last aim
    bool fire = false;
    bool dash = false;
};

// Every entity owned by the current match. Removed wholesale on match start.
struct ArenaTag {};

// ---------------------------------------------------------------------------
// View (World resource). Written by CameraSystem, read by the renderer.
// ---------------------------------------------------------------------------

struct MainCamera {
    ecs::Vec2 lerp_target = {0, 0}; // smoothed arena point at screen centre
    float     zoom        = 12.0f;  // pixels per arena unit

    float     trauma      = 0.0f;   // 0..1, shake strength
    float     shake_time  = 0.0f;
    ecs::Vec2 shake_offset = {0, 0}; // arena units, applied at draw time
};
