#pragma once
#include "../debug_panel.hpp"
#include "../pipeline.hpp"
#include "../systems/debug.hpp"
#include <ecs/ecs.hpp>
#include <raylib.h>
#include <string>

// ---------------------------------------------------------------------------
// DebugModule
//
// create() makes the DebugPanel resource with Engine rows (FPS, frame time,
// entity count). Call it BEFORE installing game modules so they can add
// their own rows. install() adds DebugSystem to the Render phase, between
// RenderModule::install and RenderModule::install_present.
// ---------------------------------------------------------------------------

struct DebugModule {
    static void create(ecs::World& world) {
        DebugPanel panel;
        panel.watch("Engine", "FPS", []() {
            return std::to_string(GetFPS());
        });
        panel.watch("Engine", "Frame Time", []() {
            return DebugPanel::fixed(GetFrameTime() * 1000.0f, 1, " ms");
        });
        panel.watch("Engine", "Entities", [&world]() {
            return std::to_string(world.count());
        });
        world.set_resource(std::move(panel));
    }

    static void install(ecs::World& /*world*/, ecs::Pipeline& pipeline) {
        pipeline.add_render([](ecs::World& w, float dt) { DebugSystem::Update(w, dt); });
    }
};
