#include "audio.hpp"
#include "../audio_resource.hpp"
#include "../events.hpp"
#include <raylib.h>

template<typename T, typename Fn>
static void on_each(ecs::World& world, Fn&& fn) {
    if (const auto* evts = world.try_resource<Events<T>>()) {
        for (const auto& ev : evts->read()) fn(ev);
    }
}

void AudioSystem::Update(ecs::World& world, float /*dt*/) {
    auto* audio = world.try_resource<AudioResource>();
    if (!audio) return;

    // One shot sound per owner per frame; rapid fire would otherwise stack.
    bool player_shot = false, enemy_shot = false;
    on_each<ShotFiredEvent>(world, [&](const ShotFiredEvent& ev) {
        (ev.owner == ProjectileOwner::Player ? player_shot : enemy_shot) = true;
    });
    if (player_shot) PlaySound(audio->snd_shoot);
    if (enemy_shot)  PlaySound(audio->snd_enemy_shoot);

    on_each<PlayerHitEvent>(world, [&](const PlayerHitEvent& ev) {
        PlaySound(ev.shield_absorbed ? audio->snd_shield_hit : audio->snd_player_hit);
    });

    on_each<EnemyKilledEvent>(world, [&](const EnemyKilledEvent& ev) {
        PlaySound(audio->snd_enemy_death[index_of(ev.type)]);
    });
    on_each<EnemyDestroyedEvent>(world, [&](const EnemyDestroyedEvent& ev) {
        if (ev.cause == RemovalCause::Cleanup) return;
        PlaySound(audio->snd_enemy_death[index_of(ev.type)]);
    });

    on_each<PickupCollectedEvent>(world, [&](const PickupCollectedEvent&) { PlaySound(audio->snd_pickup); });
    on_each<PickupRejectedEvent>(world,  [&](const PickupRejectedEvent&)  { PlaySound(audio->snd_reject); });

    on_each<MultiplierEvent>(world, [&](const MultiplierEvent& ev) {
        if (ev.change == MultiplierChange::Increased) PlaySound(audio->snd_multiplier_up);
        if (ev.change == MultiplierChange::Lost)      PlaySound(audio->snd_multiplier_lost);
    });

    on_each<LevelCompleteEvent>(world, [&](const LevelCompleteEvent&) { PlaySound(audio->snd_level_complete); });

    on_each<StateChangedEvent>(world, [&](const StateChangedEvent& ev) {
        if (ev.to == GameState::DeathAnimation) PlaySound(audio->snd_game_over);
    });
    on_each<GameOverEvent>(world, [&](const GameOverEvent& ev) {
        if (ev.victory) PlaySound(audio->snd_victory);
    });
}
