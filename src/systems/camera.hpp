#pragma once
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// CameraSystem — follows the player and turns hit events into screen shake.
//
// Runs after the Encounter systems so it sees this frame's PlayerHitEvent and
// StateChangedEvent. Shake never touches gameplay state; it only produces
// MainCamera::shake_offset for the renderer.
// ---------------------------------------------------------------------------

class CameraSystem {
public:
    static void Update(ecs::World& world, float dt);

    // Adds shake, saturating at 1.
    static void add_trauma(float& trauma, float amount);

    // Linear trauma decay per second.
    static constexpr float TRAUMA_DECAY = 1.5f;
    // Arena units of displacement at full trauma.
    static constexpr float MAX_OFFSET = 0.8f;
};
