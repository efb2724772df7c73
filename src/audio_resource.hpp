#pragma once
#include "actor_types.hpp"
#include <raylib.h>
#include <array>
#include <string>

// ---------------------------------------------------------------------------
// AudioResource — owns every Sound handle used for event cues.
//
// Stored as a World resource. Loaded once at startup (after InitAudioDevice),
// unloaded at shutdown (before CloseAudioDevice).
//
// LoadSound() returns a zeroed Sound on a missing file and PlaySound() on a
// zeroed Sound is a no-op, so missing clips only mean silence.
// ---------------------------------------------------------------------------

struct AudioResource {
    Sound snd_shoot;
    Sound snd_enemy_shoot;
    Sound snd_player_hit;
    Sound snd_shield_hit;
    Sound snd_pickup;
    Sound snd_reject;       // "already at max"
    Sound snd_multiplier_up;
    Sound snd_multiplier_lost;
    Sound snd_level_complete;
    Sound snd_game_over;
    Sound snd_victory;

    // Indexed by index_of(EnemyType).
    std::array<Sound, ENEMY_TYPE_COUNT> snd_enemy_death{};

    void load() {
        snd_shoot           = LoadSound("resources/sounds/shoot.wav");
        snd_enemy_shoot     = LoadSound("resources/sounds/enemy_shoot.wav");
        snd_player_hit      = LoadSound("resources/sounds/player_hit.wav");
        snd_shield_hit      = LoadSound("resources/sounds/shield_hit.wav");
        snd_pickup          = LoadSound("resources/sounds/pickup.wav");
        snd_reject          = LoadSound("resources/sounds/reject.wav");
        snd_multiplier_up   = LoadSound("resources/sounds/multiplier_up.wav");
        snd_multiplier_lost = LoadSound("resources/sounds/multiplier_lost.wav");
        snd_level_complete  = LoadSound("resources/sounds/level_complete.wav");
        snd_game_over       = LoadSound("resources/sounds/game_over.wav");
        snd_victory         = LoadSound("resources/sounds/victory.wav");

        for (int i = 0; i < ENEMY_TYPE_COUNT; i++) {
            const std::string path = std::string("resources/sounds/death_") +
                                     enemy_type_name(static_cast<EnemyType>(i)) + ".wav";
            snd_enemy_death[i] = LoadSound(path.c_str());
        }
    }

    void unload() {
        UnloadSound(snd_shoot);
        UnloadSound(snd_enemy_shoot);
        UnloadSound(snd_player_hit);
        UnloadSound(snd_shield_hit);
        UnloadSound(snd_pickup);
        UnloadSound(snd_reject);
        UnloadSound(snd_multiplier_up);
        UnloadSound(snd_multiplier_lost);
        UnloadSound(snd_level_complete);
        UnloadSound(snd_game_over);
        UnloadSound(snd_victory);
        for (auto& s : snd_enemy_death) UnloadSound(s);
    }
};
