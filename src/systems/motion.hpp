#pragma once
#include <ecs/ecs.hpp>

// Straight-line integration of Velocity into LocalTransform, arena bounds,
// and projectile lifetime expiry. Dead actors do not move.
// Keeps running through death animations and level transitions; stops only
// while paused or outside a match.
class MotionSystem {
public:
    static void Update(ecs::World& world, float dt);
};
