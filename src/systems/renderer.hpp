#pragma once
#include <ecs/ecs.hpp>
#include <raylib.h>

// ---------------------------------------------------------------------------
// RenderSystem — Render phase; top-down 2D view of the arena plus HUD.
//
// Update() opens the frame (BeginDrawing) and draws world and HUD. Present()
// closes it, so overlays installed in between (DebugSystem) land on top.
// Reads only; the arena is drawn y-up around MainCamera's smoothed target.
// ---------------------------------------------------------------------------

class RenderSystem {
public:
    static void Update(ecs::World& world);
    static void Present(ecs::World& world);

    // Arena-space camera (y flipped) centred on MainCamera plus shake.
    static Camera2D arena_camera(ecs::World& world);
};
