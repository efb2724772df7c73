#pragma once
#include <ecs/ecs.hpp>
#include "../components.hpp"
#include "../config.hpp"

// Owns the player's rules: damage, healing, pickup acceptance, XP levelling,
// dash and invulnerability timers, and turning PlayerInput into velocity.
// Runs first in the Logic phase.
class PlayerSystem {
public:
    static void Update(ecs::World& world, float dt);

    // Pure rules — no World access. Exposed for CollisionSystem and unit testing.

    // Dash frames or an active invulnerable grant.
    static bool is_invulnerable(const Player& p);

    // Dash frames only. Collision skips contact, shots and lasers while set.
    static bool is_dashing(const Player& p);

    // Returns the health actually lost: 0 when a shield absorbed the hit or
    // an invulnerable grant is held (the shield survives the latter).
    // Health is clamped at zero; reaching zero clears alive.
    static int take_damage(Player& p, int amount);

    static void heal(Player& p, int amount);

    // Return false (pickup stays) when already at the level cap.
    static bool collect_power_up(Player& p);
    static bool collect_speed_up(Player& p);

    // Always consumed. Shield is only granted if not already held;
    // invulnerable refreshes its timer if already active.
    static bool collect_shield(Player& p);
    static bool collect_invulnerable(Player& p);

    static void clear_invulnerable(Player& p);

    // Returns the number of levels gained. Threshold grows by `growth` per level.
    static int add_xp(Player& p, int amount, float growth);

    static void tick_timers(Player& p, float dt);

    static float move_speed(const Player& p, const PlayerConfig& cfg);
    static int   projectile_damage(const Player& p, const PlayerConfig& cfg);
};
