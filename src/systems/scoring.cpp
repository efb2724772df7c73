#include "scoring.hpp"
#include "level.hpp"
#include "player.hpp"
#include "../components.hpp"
#include "../events.hpp"
#include <algorithm>
#include <raylib.h>

using namespace ecs;

ScoringSystem::KillResult ScoringSystem::register_kill(MultiplierState& s, GameStats& stats,
                                                       const ScoringConfig& cfg, EnemyType type,
                                                       int base_points, float now) {
    KillResult r;
    const int previous = s.multiplier;

    if (s.has_last_kill && (now - s.last_kill_time) <= cfg.kill_chain_window) {
        s.multiplier = std::min(s.multiplier + 1, cfg.max_multiplier);
    }
    r.increased  = s.multiplier > previous;
    r.multiplier = s.multiplier;
    r.points     = base_points * s.multiplier;
    if (r.increased) {
        const auto& m = cfg.bonus_spawn_multipliers;
        r.milestone = std::find(m.begin(), m.end(), s.multiplier) != m.end();
    }

    stats.score += r.points;
    stats.highest_multiplier = std::max(stats.highest_multiplier, s.multiplier);
    stats.enemies_killed++;
    stats.kills_by_type[index_of(type)]++;

    s.decay_timer    = cfg.decay_time;
    s.last_kill_time = now;
    s.has_last_kill  = true;
    s.combo_count++;
    s.combo_timer    = cfg.combo_duration;
    stats.highest_combo = std::max(stats.highest_combo, s.combo_count);
    return r;
}

bool ScoringSystem::apply_decay(MultiplierState& s, const ScoringConfig& cfg, float now) {
    if (!s.has_last_kill || s.multiplier <= 1) return false;
    if (now - s.last_kill_time <= cfg.decay_time) return false;
    s.multiplier = 1;
    return true;
}

void ScoringSystem::tick_combo(MultiplierState& s, float dt) {
    s.decay_timer = std::max(0.0f, s.decay_timer - dt);
    if (s.combo_count == 0) return;
    s.combo_timer -= dt;
    if (s.combo_timer <= 0.0f) {
        s.combo_timer = 0.0f;
        s.combo_count = 0;
    }
}

int ScoringSystem::reset_on_damage(MultiplierState& s) {
    const int previous = s.multiplier;
    s.multiplier  = 1;
    s.combo_count = 0;
    s.combo_timer = 0.0f;
    return previous;
}

void ScoringSystem::reset(MultiplierState& s) {
    const float clock = s.clock;
    s = MultiplierState{};
    s.clock = clock;
}

void ScoringSystem::Update(World& world, float dt) {
    if (!gameplay_active(world)) return;
    auto* s     = world.try_resource<MultiplierState>();
    auto* stats = world.try_resource<GameStats>();
    auto* cfg   = world.try_resource<BalanceConfig>();
    if (!s || !stats || !cfg) return;

    // 1. Clock + combo fuse
    s->clock += dt;
    tick_combo(*s, dt);

    // 2. Player damage resets, whatever the timers say
    if (const auto* hits = world.try_resource<Events<PlayerHitEvent>>()) {
        for (const auto& hit : hits->read()) {
            stats->damage_taken += hit.health_lost;
            const int previous = reset_on_damage(*s);
            if (previous >= cfg->scoring.lost_threshold) {
                emit(world, MultiplierEvent{1, previous, MultiplierChange::Lost});
            } else if (previous > 1) {
                emit(world, MultiplierEvent{1, previous, MultiplierChange::Reset});
            }
        }
    }

    // 3. Inactivity decay
    {
        const int previous = s->multiplier;
        if (apply_decay(*s, cfg->scoring, s->clock)) {
            emit(world, MultiplierEvent{1, previous, MultiplierChange::Expired});
        }
    }

    // 4. Kills recognised by CollisionSystem this frame
    const auto* credits = world.try_resource<Events<KillCredit>>();
    if (!credits || credits->empty()) return;

    Player* player = nullptr;
    world.each<Player>([&](Entity, Player& p) { player = &p; });
    auto* progress = world.try_resource<LevelProgress>();

    for (const auto& kill : credits->read()) {
        const int previous = s->multiplier;
        const int base = cfg->enemies[index_of(kill.type)].base_points;
        const KillResult r = register_kill(*s, *stats, cfg->scoring, kill.type, base, s->clock);

        if (player) PlayerSystem::add_xp(*player, kill.xp_value, cfg->player.xp_growth);
        stats->total_xp += kill.xp_value;
        if (progress) LevelSystem::register_kill(*progress, kill.type);

        TraceLog(LOG_DEBUG, "SCORE: %s +%d (x%d)", enemy_type_name(kill.type), r.points, r.multiplier);
        emit(world, EnemyKilledEvent{kill.entity, kill.type, kill.position, r.points, r.multiplier});
        if (r.increased) emit(world, MultiplierEvent{r.multiplier, previous, MultiplierChange::Increased});
        if (s->combo_count >= 2) emit(world, ComboEvent{s->combo_count});
        if (r.milestone) emit(world, BonusSpawnEvent{r.multiplier});
    }
}
