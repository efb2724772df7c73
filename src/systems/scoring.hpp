#pragma once
#include <ecs/ecs.hpp>
#include "../config.hpp"
#include "../match_state.hpp"

// ---------------------------------------------------------------------------
// ScoringSystem — Encounter phase, directly after CollisionSystem.
//
// Sole writer of MultiplierState and GameStats during play. Per frame, in
// order: advance the scoring clock, tick the combo timer, apply damage resets
// (PlayerHitEvent), apply inactivity decay, then score this frame's kills
// (KillCredit). Runs only while Playing.
//
// Emits: EnemyKilledEvent, MultiplierEvent, ComboEvent, BonusSpawnEvent.
// ---------------------------------------------------------------------------

class ScoringSystem {
public:
    static void Update(ecs::World& world, float dt);

    struct KillResult {
        int  points     = 0;
        int  multiplier = 1;
        bool increased  = false;
        bool milestone  = false; // newly raised to a bonus-spawn multiplier
    };

    // Pure state transitions — exposed for unit testing.

    // Chain: a previous kill within the chain window raises the multiplier by
    // one (capped). Missing the window leaves it unchanged.
    static KillResult register_kill(MultiplierState& s, GameStats& stats,
                                    const ScoringConfig& cfg, EnemyType type,
                                    int base_points, float now);

    // Returns true if the multiplier was reset to 1 by inactivity.
    static bool apply_decay(MultiplierState& s, const ScoringConfig& cfg, float now);

    static void tick_combo(MultiplierState& s, float dt);

    // Returns the multiplier held before the reset.
    static int reset_on_damage(MultiplierState& s);

    // Match / level start. Keeps the clock running.
    static void reset(MultiplierState& s);
};
