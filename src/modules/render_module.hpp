#pragma once
#include "../pipeline.hpp"
#include "../systems/renderer.hpp"
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// RenderModule
//
// install() adds RenderSystem (opens the frame, draws arena and HUD) to the
// Render phase. install_present() closes the frame and must be the last
// Render-phase install, after any overlay such as DebugModule.
// ---------------------------------------------------------------------------

struct RenderModule {
    static void install(ecs::World& /*world*/, ecs::Pipeline& pipeline) {
        pipeline.add_render([](ecs::World& w, float) { RenderSystem::Update(w); });
    }

    static void install_present(ecs::World& /*world*/, ecs::Pipeline& pipeline) {
        pipeline.add_render([](ecs::World& w, float) { RenderSystem::Present(w); });
    }
};
