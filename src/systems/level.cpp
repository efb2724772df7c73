#include "level.hpp"
#include <algorithm>
#include <raylib.h>

using namespace ecs;

void LevelSystem::begin_level(LevelProgress& progress, const BalanceConfig& cfg, int level) {
    const int total = std::max(1, static_cast<int>(cfg.levels.size()));
    progress.total_levels        = total;
    progress.current_level       = std::clamp(level, 1, total);
    progress.kills               = {};
    progress.objectives_complete = false;

    const LevelDef& def = current_def(progress, cfg);
    progress.level_timer = GameTimer(def.duration);
    if (def.duration > 0.0f) progress.level_timer.start();
}

const LevelDef& LevelSystem::current_def(const LevelProgress& progress, const BalanceConfig& cfg) {
    const auto i = static_cast<std::size_t>(std::max(0, progress.current_level - 1));
    return cfg.levels[std::min(i, cfg.levels.size() - 1)];
}

void LevelSystem::register_kill(LevelProgress& progress, EnemyType type) {
    if (progress.objectives_complete) return;
    progress.kills[index_of(type)]++;
}

bool LevelSystem::check_objectives_complete(LevelProgress& progress, const LevelDef& def) {
    if (progress.objectives_complete) return true;

    // A level without kill objectives ends only on its timer.
    int required = 0;
    for (std::size_t i = 0; i < ENEMY_TYPE_COUNT; ++i) {
        if (progress.kills[i] < def.objectives[i]) return false;
        required += def.objectives[i];
    }
    if (required == 0) return false;
    progress.objectives_complete = true;
    return true;
}

bool LevelSystem::advance_level(LevelProgress& progress, const BalanceConfig& cfg) {
    if (is_final_level(progress)) return false;
    begin_level(progress, cfg, progress.current_level + 1);
    return true;
}

bool LevelSystem::is_final_level(const LevelProgress& progress) {
    return progress.current_level >= progress.total_levels;
}

bool LevelSystem::is_game_complete(const LevelProgress& progress) {
    return is_final_level(progress) && progress.objectives_complete;
}

float LevelSystem::completion_percent(const LevelProgress& progress, const LevelDef& def) {
    int required = 0;
    int counted  = 0;
    for (std::size_t i = 0; i < ENEMY_TYPE_COUNT; ++i) {
        required += def.objectives[i];
        counted  += std::min(progress.kills[i], def.objectives[i]);
    }
    if (required == 0) return progress.objectives_complete ? 100.0f : 0.0f;
    return 100.0f * static_cast<float>(counted) / static_cast<float>(required);
}

void LevelSystem::Update(World& world, float dt) {
    if (!gameplay_active(world)) return;
    auto* progress = world.try_resource<LevelProgress>();
    if (!progress) return;

    auto& timer = progress->level_timer;
    if (!timer.running() || progress->objectives_complete) return;

    timer.update(dt);
    if (timer.is_expired()) {
        progress->objectives_complete = true;
        TraceLog(LOG_INFO, "LEVEL: %d time limit reached", progress->current_level);
    }
}
