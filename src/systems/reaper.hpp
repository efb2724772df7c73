#pragma once
#include <ecs/ecs.hpp>

// Last Encounter-phase step. Destroys spent projectiles and collected
// pickups, and dead enemies once their corpse timer has run out. Nothing
// earlier in the frame destroys entities, so every scan in the frame sees a
// stable actor set. Paused with the rest of the simulation.
class ReaperSystem {
public:
    static void Update(ecs::World& world, float dt);
};
