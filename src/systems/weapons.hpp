#pragma once
#include <ecs/ecs.hpp>
#include "../components.hpp"

// Turns fire intent into projectile entities and cycles UFO laser beams.
// Player: fires along Player::aim at the configured interval.
// Enemies: fire straight at the player's current position on their interval.
// Runs in the Logic phase after PlayerSystem.
class WeaponSystem {
public:
    static void Update(ecs::World& world, float dt);

    // Advances one beam's charge/fire cycle. `to_player` is the unit vector
    // from the emitter to the player, locked in when firing starts.
    static void cycle_laser(LaserBeam& beam, float dt, const ecs::Vec3& to_player);
};
