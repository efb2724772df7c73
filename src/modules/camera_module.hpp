#pragma once
#include "../components.hpp"
#include "../debug_panel.hpp"
#include "../pipeline.hpp"
#include "../systems/camera.hpp"
#include <ecs/ecs.hpp>
#include <string>

// ---------------------------------------------------------------------------
// CameraModule
//
// Creates MainCamera and appends CameraSystem to the Encounter phase, after
// the systems that emit PlayerHitEvent / StateChangedEvent.
// ---------------------------------------------------------------------------

struct CameraModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        world.set_resource(MainCamera{});
        pipeline.add_encounter([](ecs::World& w, float dt) { CameraSystem::Update(w, dt); });

        if (auto* panel = world.try_resource<DebugPanel>()) {
            panel->watch("Camera", "Trauma", [&world]() {
                auto* cam = world.try_resource<MainCamera>();
                return cam ? DebugPanel::fixed(cam->trauma, 2) : std::string("-");
            });
        }
    }
};
