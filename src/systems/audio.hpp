#pragma once
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// AudioSystem — plays a cue for each presentation event of the frame.
//
// Installed at the end of the Encounter phase, after every emitter has run
// and before next frame's flush. Never writes gameplay state.
// ---------------------------------------------------------------------------

class AudioSystem {
public:
    static void Update(ecs::World& world, float dt);
};
