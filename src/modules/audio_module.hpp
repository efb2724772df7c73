#pragma once
#include "../audio_resource.hpp"
#include "../pipeline.hpp"
#include "../systems/audio.hpp"
#include <ecs/ecs.hpp>
#include <raylib.h>

// ---------------------------------------------------------------------------
// AudioModule
//
// Initialises raylib's audio device, loads the AudioResource and appends
// AudioSystem to the Encounter phase. Install after CombatModule and
// ProgressionModule so every cue-bearing event of the frame is visible.
//
// shutdown() unloads sounds and closes the device; call before CloseWindow().
// ---------------------------------------------------------------------------

struct AudioModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        InitAudioDevice();
        AudioResource audio;
        audio.load();
        world.set_resource(std::move(audio));
        pipeline.add_encounter([](ecs::World& w, float dt) { AudioSystem::Update(w, dt); });
    }

    static void shutdown(ecs::World& world) {
        world.resource<AudioResource>().unload();
        CloseAudioDevice();
    }
};
