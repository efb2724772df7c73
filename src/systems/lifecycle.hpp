#pragma once
#include <ecs/ecs.hpp>
#include "../match_state.hpp"

// ---------------------------------------------------------------------------
// LifecycleSystem — owns GameFlow: the match state machine.
//
//   StartScreen → Playing ⇄ { DeathAnimation → GameOver,
//                             LevelTransition[Clearing → Displaying → Complete] }
//
// Update() runs in the Encounter phase after scoring and level bookkeeping,
// so a transition always sees this frame's kills and damage. All timing is
// accumulated dt; while paused nothing advances. Starting a transition that
// is already running is a silent no-op.
//
// Emits: StateChangedEvent, LevelCompleteEvent, LevelStartedEvent,
// GameOverEvent, EnemyDestroyedEvent (clearing / cleanup removals).
// ---------------------------------------------------------------------------

class LifecycleSystem {
public:
    static void Update(ecs::World& world, float dt);

    // From StartScreen or GameOver: wipe the arena, reset stats, scoring,
    // level progress and spawners, spawn the player, enter Playing.
    static bool start_match(ecs::World& world);

    // Playing → DeathAnimation. No-op (false) from any other state.
    static bool start_death_animation(ecs::World& world);

    // Playing → LevelTransition.Clearing. Schedules a staggered forced death
    // for every alive enemy and stops spawning. No-op (false) otherwise.
    static bool start_level_transition(ecs::World& world);

    // Complete → Playing on the next level: remove leftover enemies,
    // projectiles and uncollected invulnerable pickups, advance the level,
    // reset pickup spawners, drop the invulnerable grant, resume spawning.
    static void complete_transition(ecs::World& world);

    static void set_paused(ecs::World& world, bool paused);

    // Fires every pending clearing kill due at `elapsed` (all of them when
    // `flush_all`). Already-dead or removed enemies are skipped.
    static int fire_pending_kills(ecs::World& world, float elapsed, bool flush_all);
};
