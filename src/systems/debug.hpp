#pragma once
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// DebugSystem — Render phase, between RenderSystem::Update and Present.
//
// F3 toggles it. While visible it outlines every collision shape in arena
// space (live, dead, or gated by invulnerability / touch state) and draws the
// DebugPanel provider table.
// ---------------------------------------------------------------------------

class DebugSystem {
public:
    static void Update(ecs::World& world, float dt);
};
