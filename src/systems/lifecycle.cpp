#include "lifecycle.hpp"
#include "enemy.hpp"
#include "enemy_spawner.hpp"
#include "level.hpp"
#include "pickup_spawner.hpp"
#include "player.hpp"
#include "scoring.hpp"
#include "../actor_factory.hpp"
#include "../components.hpp"
#include "../config.hpp"
#include "../events.hpp"
#include <algorithm>
#include <raylib.h>
#include <vector>

using namespace ecs;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static void change_state(World& world, GameFlow& flow, GameState to, TransitionPhase phase) {
    const GameState from = flow.state;
    flow.state = to;
    flow.phase = phase;
    TraceLog(LOG_INFO, "FLOW: %s -> %s (%s)", game_state_name(from), game_state_name(to),
             transition_phase_name(phase));
    emit(world, StateChangedEvent{from, to, phase});
}

static float death_duration_of(World& world, EnemyType type) {
    auto* cfg = world.try_resource<BalanceConfig>();
    const EnemyTable& table = cfg ? cfg->enemies : default_enemy_table();
    return table[index_of(type)].death_duration;
}

static void destroy_all(World& world, std::vector<Entity>& doomed) {
    for (auto e : doomed) world.destroy(e);
    world.deferred().flush(world);
    doomed.clear();
}

// ---------------------------------------------------------------------------
// Transitions
// ---------------------------------------------------------------------------

bool LifecycleSystem::start_match(World& world) {
    auto* flow     = world.try_resource<GameFlow>();
    auto* cfg      = world.try_resource<BalanceConfig>();
    auto* stats    = world.try_resource<GameStats>();
    auto* mult     = world.try_resource<MultiplierState>();
    auto* progress = world.try_resource<LevelProgress>();
    if (!flow || !cfg || !stats || !mult || !progress) return false;
    if (flow->state != GameState::StartScreen && flow->state != GameState::GameOver) return false;

    std::vector<Entity> doomed;
    world.each<ArenaTag>([&](Entity e, ArenaTag&) { doomed.push_back(e); });
    destroy_all(world, doomed);

    *stats = GameStats{};
    ScoringSystem::reset(*mult);
    LevelSystem::begin_level(*progress, *cfg, 1);
    stats->level = progress->current_level;

    if (auto* ps = world.try_resource<PickupSpawners>()) PickupSpawnerSystem::reset_for_new_level(*ps, cfg->pickups);
    if (auto* es = world.try_resource<EnemySpawners>()) EnemySpawnerSystem::reset_for_new_level(*es);

    flow->paused           = false;
    flow->victory          = false;
    flow->spawning_enabled = true;
    flow->pending_kills.clear();
    flow->death_timer = GameTimer{};
    flow->phase_timer = GameTimer{};

    ActorFactory::spawn_player(world, *cfg, Vec3{0, 0, 0});

    TraceLog(LOG_INFO, "FLOW: match started, level 1 '%s'",
             LevelSystem::current_def(*progress, *cfg).name.c_str());
    change_state(world, *flow, GameState::Playing, TransitionPhase::None);
    emit(world, LevelStartedEvent{progress->current_level});
    return true;
}

bool LifecycleSystem::start_death_animation(World& world) {
    auto* flow = world.try_resource<GameFlow>();
    if (!flow || flow->state != GameState::Playing) return false;

    float duration = 2.0f;
    if (auto* cfg = world.try_resource<BalanceConfig>()) duration = cfg->lifecycle.death_animation_duration;

    flow->spawning_enabled = false;
    flow->death_timer = GameTimer(duration);
    flow->death_timer.start();
    change_state(world, *flow, GameState::DeathAnimation, TransitionPhase::None);
    return true;
}

bool LifecycleSystem::start_level_transition(World& world) {
    auto* flow = world.try_resource<GameFlow>();
    if (!flow || flow->state != GameState::Playing) return false;

    LifecycleConfig lc;
    if (auto* cfg = world.try_resource<BalanceConfig>()) lc = cfg->lifecycle;

    flow->spawning_enabled = false;
    flow->phase_timer = GameTimer(lc.clearing_duration);
    flow->phase_timer.start();

    flow->pending_kills.clear();
    std::uniform_real_distribution<float> stagger(0.0f, std::max(lc.max_clear_stagger, 0.0f));
    world.each<Enemy>([&](Entity e, Enemy& en) {
        if (!en.alive) return;
        const float at = lc.max_clear_stagger > 0.0f ? stagger(flow->rng) : 0.0f;
        flow->pending_kills.push_back({e, at});
    });

    int level = 1;
    if (auto* progress = world.try_resource<LevelProgress>()) level = progress->current_level;

    TraceLog(LOG_INFO, "FLOW: level %d objectives met, clearing %d enemies",
             level, static_cast<int>(flow->pending_kills.size()));
    change_state(world, *flow, GameState::LevelTransition, TransitionPhase::Clearing);
    emit(world, LevelCompleteEvent{level});
    return true;
}

int LifecycleSystem::fire_pending_kills(World& world, float elapsed, bool flush_all) {
    auto* flow = world.try_resource<GameFlow>();
    if (!flow) return 0;

    int killed = 0;
    auto& pending = flow->pending_kills;
    auto due = std::stable_partition(pending.begin(), pending.end(), [&](const PendingKill& k) {
        return !flush_all && k.fire_at > elapsed;
    });
    for (auto it = due; it != pending.end(); ++it) {
        auto* en = world.try_get<Enemy>(it->entity);
        if (!en) continue;
        if (!EnemySystem::force_kill(*en, death_duration_of(world, en->type))) continue;

        Vec3 pos = {0, 0, 0};
        if (auto* t = world.try_get<LocalTransform>(it->entity)) pos = t->position;
        emit(world, EnemyDestroyedEvent{it->entity, en->type, pos, RemovalCause::LevelClear});
        killed++;
    }
    pending.erase(due, pending.end());
    return killed;
}

void LifecycleSystem::complete_transition(World& world) {
    auto* flow     = world.try_resource<GameFlow>();
    auto* cfg      = world.try_resource<BalanceConfig>();
    auto* progress = world.try_resource<LevelProgress>();
    if (!flow || !cfg || !progress) return;

    // Leftovers: anything still alive here escaped the staggered clearing.
    std::vector<Entity> doomed;
    int survivors = 0;
    world.each<Enemy>([&](Entity e, Enemy& en) {
        if (en.alive) {
            survivors++;
            Vec3 pos = {0, 0, 0};
            if (auto* t = world.try_get<LocalTransform>(e)) pos = t->position;
            emit(world, EnemyDestroyedEvent{e, en.type, pos, RemovalCause::Cleanup});
        }
        doomed.push_back(e);
    });
    if (survivors > 0) {
        TraceLog(LOG_WARNING, "FLOW: force-removing %d enemies that survived clearing", survivors);
    }
    world.each<Projectile>([&](Entity e, Projectile&) { doomed.push_back(e); });
    // Other pickups carry over; an uncollected invulnerable one does not.
    world.each<Pickup>([&](Entity e, Pickup& p) {
        if (p.kind == PickupKind::Invulnerable) doomed.push_back(e);
    });
    destroy_all(world, doomed);
    flow->pending_kills.clear();

    LevelSystem::advance_level(*progress, *cfg);
    if (auto* stats = world.try_resource<GameStats>()) stats->level = progress->current_level;
    if (auto* mult = world.try_resource<MultiplierState>()) ScoringSystem::reset(*mult);
    if (auto* ps = world.try_resource<PickupSpawners>()) PickupSpawnerSystem::reset_for_new_level(*ps, cfg->pickups);
    if (auto* es = world.try_resource<EnemySpawners>()) EnemySpawnerSystem::reset_for_new_level(*es);

    // Invulnerability is scoped to the level it was collected in.
    world.each<Player>([](Entity, Player& p) { PlayerSystem::clear_invulnerable(p); });

    flow->spawning_enabled = true;
    TraceLog(LOG_INFO, "FLOW: level %d '%s' begins", progress->current_level,
             LevelSystem::current_def(*progress, *cfg).name.c_str());
    change_state(world, *flow, GameState::Playing, TransitionPhase::None);
    emit(world, LevelStartedEvent{progress->current_level});
}

void LifecycleSystem::set_paused(World& world, bool paused) {
    auto* flow = world.try_resource<GameFlow>();
    if (!flow || flow->paused == paused) return;
    flow->paused = paused;
    TraceLog(LOG_INFO, "FLOW: %s", paused ? "paused" : "resumed");
}

// ---------------------------------------------------------------------------
// Per-frame
// ---------------------------------------------------------------------------

static void update_transition(World& world, GameFlow& flow, float dt) {
    flow.phase_timer.update(dt);

    switch (flow.phase) {
        case TransitionPhase::Clearing: {
            LifecycleSystem::fire_pending_kills(world, flow.phase_timer.elapsed(), false);
            if (!flow.phase_timer.is_expired()) return;

            LifecycleSystem::fire_pending_kills(world, flow.phase_timer.elapsed(), true);

            auto* progress = world.try_resource<LevelProgress>();
            if (progress && LevelSystem::is_game_complete(*progress)) {
                flow.victory = true;
                int score = 0;
                if (auto* stats = world.try_resource<GameStats>()) score = stats->score;
                change_state(world, flow, GameState::GameOver, TransitionPhase::None);
                emit(world, GameOverEvent{true, score});
                return;
            }

            float display = 3.0f;
            if (auto* cfg = world.try_resource<BalanceConfig>()) display = cfg->lifecycle.display_duration;
            flow.phase_timer = GameTimer(display);
            flow.phase_timer.start();
            change_state(world, flow, GameState::LevelTransition, TransitionPhase::Displaying);
            return;
        }
        case TransitionPhase::Displaying:
            if (!flow.phase_timer.is_expired()) return;
            change_state(world, flow, GameState::LevelTransition, TransitionPhase::Complete);
            LifecycleSystem::complete_transition(world);
            return;
        case TransitionPhase::Complete:
            LifecycleSystem::complete_transition(world);
            return;
        case TransitionPhase::None:
            return;
    }
}

void LifecycleSystem::Update(World& world, float dt) {
    auto* flow = world.try_resource<GameFlow>();
    if (!flow) return;

    if (const auto* input = world.try_resource<MatchInput>()) {
        const bool in_match = flow->state == GameState::Playing ||
                              flow->state == GameState::DeathAnimation ||
                              flow->state == GameState::LevelTransition;
        if (input->confirm && !in_match) {
            start_match(world);
            return;
        }
        if (input->pause && in_match) set_paused(world, !flow->paused);
    }
    if (flow->paused) return;

    switch (flow->state) {
        case GameState::Playing: {
            if (auto* stats = world.try_resource<GameStats>()) stats->survived_time += dt;

            bool player_dead = false;
            world.each<Player>([&](Entity, Player& p) { if (!p.alive) player_dead = true; });
            if (player_dead) {
                start_death_animation(world);
                return;
            }

            auto* cfg      = world.try_resource<BalanceConfig>();
            auto* progress = world.try_resource<LevelProgress>();
            if (cfg && progress &&
                LevelSystem::check_objectives_complete(*progress, LevelSystem::current_def(*progress, *cfg))) {
                start_level_transition(world);
            }
            return;
        }
        case GameState::DeathAnimation:
            flow->death_timer.update(dt);
            if (flow->death_timer.is_expired()) {
                int score = 0;
                if (auto* stats = world.try_resource<GameStats>()) score = stats->score;
                change_state(world, *flow, GameState::GameOver, TransitionPhase::None);
                emit(world, GameOverEvent{false, score});
            }
            return;
        case GameState::LevelTransition:
            update_transition(world, *flow, dt);
            return;
        case GameState::StartScreen:
        case GameState::GameOver:
            return;
    }
}
