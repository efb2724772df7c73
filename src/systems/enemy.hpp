#pragma once
#include "../components.hpp"

// Enemy damage and kill-eligibility rules. Pure functions over the Enemy
// component; no World access.
//
// An enemy is kill-eligible once it is dead and its death has not yet been
// accounted for. mark_kill_tracked() consumes that eligibility for good, so a
// corpse that lingers through a death sequence is never scored twice.
class EnemySystem {
public:
    // Health is reduced by `amount`; at zero the enemy dies and its corpse
    // timer starts. Damage to a dead enemy is ignored.
    static void take_damage(Enemy& e, int amount, float death_duration);

    static bool should_track_kill(const Enemy& e);
    static void mark_kill_tracked(Enemy& e);

    // Unscored removal (player collision, level clear). Consumes kill
    // eligibility. Returns false (no-op) if the enemy was already dead.
    static bool force_kill(Enemy& e, float death_duration);
};
