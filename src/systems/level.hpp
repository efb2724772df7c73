#pragma once
#include <ecs/ecs.hpp>
#include "../config.hpp"
#include "../match_state.hpp"

// Level objectives and advancement over the LevelProgress resource.
// Update() ticks the level timer (timed levels only) while Playing; an
// expired timer completes the level just like met objectives.
class LevelSystem {
public:
    static void Update(ecs::World& world, float dt);

    // Resets progress for `level` (1-based, clamped to the table).
    static void begin_level(LevelProgress& progress, const BalanceConfig& cfg, int level);

    static const LevelDef& current_def(const LevelProgress& progress, const BalanceConfig& cfg);

    // Ignored once objectives are complete.
    static void register_kill(LevelProgress& progress, EnemyType type);

    // Latches: once true it stays true until the next begin_level().
    // Never true for a level with no kill objectives (timer-only level).
    static bool check_objectives_complete(LevelProgress& progress, const LevelDef& def);

    // Returns false (no change) on the final level.
    static bool advance_level(LevelProgress& progress, const BalanceConfig& cfg);

    static bool is_final_level(const LevelProgress& progress);
    static bool is_game_complete(const LevelProgress& progress);

    // Total kills counted toward objectives / total required, as 0-100.
    static float completion_percent(const LevelProgress& progress, const LevelDef& def);
};
