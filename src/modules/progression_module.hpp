#pragma once
#include "../components.hpp"
#include "../config.hpp"
#include "../debug_panel.hpp"
#include "../events.hpp"
#include "../match_state.hpp"
#include "../pipeline.hpp"
#include "../systems/enemy_spawner.hpp"
#include "../systems/level.hpp"
#include "../systems/lifecycle.hpp"
#include "../systems/pickup_spawner.hpp"
#include "../systems/reaper.hpp"
#include <ecs/ecs.hpp>
#include <string>

// ---------------------------------------------------------------------------
// ProgressionModule
//
// Match lifecycle, level objectives, spawning and corpse removal. Creates
// GameFlow, LevelProgress, the spawner resources and MatchInput, with every
// PRNG seeded from BalanceConfig::rng_seed.
//
// Ordering summary (after CombatModule):
//   logic:     PickupSpawner
//   encounter: Level → Lifecycle → EnemySpawner → Reaper
// ---------------------------------------------------------------------------

struct ProgressionModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        if (!world.try_resource<BalanceConfig>()) world.set_resource(BalanceConfig{});
        const BalanceConfig cfg = world.resource<BalanceConfig>();
        const auto seed = static_cast<std::mt19937::result_type>(cfg.rng_seed);

        GameFlow flow;
        flow.rng.seed(seed);
        world.set_resource(std::move(flow));

        LevelProgress progress;
        LevelSystem::begin_level(progress, cfg, 1);
        world.set_resource(std::move(progress));

        PickupSpawners pickups;
        pickups.rng.seed(seed + 1);
        PickupSpawnerSystem::reset_for_new_level(pickups, cfg.pickups);
        world.set_resource(std::move(pickups));

        EnemySpawners enemies;
        enemies.rng.seed(seed + 2);
        EnemySpawnerSystem::reset_for_new_level(enemies);
        world.set_resource(std::move(enemies));

        world.set_resource(MatchInput{});

        auto& reg = world.resource<EventRegistry>();
        reg.register_queue<EnemyDestroyedEvent>(world);
        reg.register_queue<StateChangedEvent>(world);
        reg.register_queue<LevelCompleteEvent>(world);
        reg.register_queue<LevelStartedEvent>(world);
        reg.register_queue<GameOverEvent>(world);

        pipeline.add_logic([](ecs::World& w, float dt) { PickupSpawnerSystem::Update(w, dt); });

        pipeline.add_encounter([](ecs::World& w, float dt) { LevelSystem::Update(w, dt); });
        pipeline.add_encounter([](ecs::World& w, float dt) { LifecycleSystem::Update(w, dt); });
        pipeline.add_encounter([](ecs::World& w, float dt) { EnemySpawnerSystem::Update(w, dt); });
        pipeline.add_encounter([](ecs::World& w, float dt) { ReaperSystem::Update(w, dt); });

        if (auto* panel = world.try_resource<DebugPanel>()) {
            panel->watch("Match", "State", [&world]() {
                auto* f = world.try_resource<GameFlow>();
                if (!f) return std::string("-");
                std::string r = game_state_name(f->state);
                if (f->phase != TransitionPhase::None) r += std::string(".") + transition_phase_name(f->phase);
                if (f->paused) r += " (paused)";
                return r;
            });
            panel->watch("Match", "Level", [&world]() {
                auto* p = world.try_resource<LevelProgress>();
                auto* c = world.try_resource<BalanceConfig>();
                if (!p || !c) return std::string("-");
                return std::to_string(p->current_level) + " (" +
                       DebugPanel::fixed(LevelSystem::completion_percent(*p, LevelSystem::current_def(*p, *c)), 0, "%)");
            });
            panel->watch("Match", "Pending Clears", [&world]() {
                auto* f = world.try_resource<GameFlow>();
                return f ? std::to_string(f->pending_kills.size()) : std::string("-");
            });
        }
    }
};
