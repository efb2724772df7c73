#pragma once
#include "../input_state.hpp"
#include "../pipeline.hpp"
#include "../systems/input_gather.hpp"
#include "../systems/player_input.hpp"
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// InputModule
//
// Adds InputGatherSystem and PlayerInputSystem to the Pre-Update phase,
// after the EventBus flush. InputGather writes the InputRecord that
// PlayerInput maps onto PlayerInput / MatchInput.
// ---------------------------------------------------------------------------

struct InputModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        world.set_resource(InputRecord{});
        pipeline.add_pre_update([](ecs::World& w, float) { InputGatherSystem::Update(w); });
        pipeline.add_pre_update([](ecs::World& w, float) { PlayerInputSystem::Update(w); });
    }
};
