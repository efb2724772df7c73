#pragma once
#include "../events.hpp"
#include "../pipeline.hpp"
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// EventBusModule
//
// Creates the EventRegistry world resource and installs the per-frame flush
// as the first Pre-Update step. Install it before any module that registers
// queues. Queues themselves are registered by the module whose systems emit
// them.
// ---------------------------------------------------------------------------

struct EventBusModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        if (!world.try_resource<EventRegistry>()) world.set_resource(EventRegistry{});
        pipeline.add_pre_update([](ecs::World& w, float) {
            w.resource<EventRegistry>().flush_all();
        });
    }
};
